#include "grid/balance_tracker.hpp"
#include "grid/config.hpp"
#include "grid/exchange.hpp"
#include "grid/ladder_engine.hpp"
#include "grid/state_store.hpp"
#include "nonkyc/http_client.hpp"
#include "nonkyc/rate_limiter.hpp"
#include "nonkyc/rest_client.hpp"
#include "nonkyc/stream_client.hpp"
#include "nonkyc/ws_client.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_stop_signal{false};

void on_signal(int) {
    g_stop_signal = true;
}

std::string trim(std::string value) {
    const auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
    value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
    return value;
}

void load_env_file(const std::string& path) {
    std::ifstream env_file(path);
    if (!env_file.is_open()) {
        return;
    }

    std::string line;
    while (std::getline(env_file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        const auto pos = line.find('=');
        if (pos == std::string::npos) {
            continue;
        }

        auto key = trim(line.substr(0, pos));
        auto value = trim(line.substr(pos + 1));

        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }

        // Variables already exported in the shell win over the file.
        if (!key.empty()) {
            setenv(key.c_str(), value.c_str(), 0);
        }
    }
}

nonkyc::Credentials load_credentials_from_env() {
    const char* api_key = std::getenv("NONKYC_API_KEY");
    const char* api_secret = std::getenv("NONKYC_API_SECRET");
    return nonkyc::Credentials{api_key ? api_key : "", api_secret ? api_secret : ""};
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <config.json>" << std::endl;
        return 2;
    }

    load_env_file(".env");

    grid::BotConfig config;
    try {
        config = grid::load_config_file(argv[1]);
    } catch (const nonkyc::ConfigurationError& ex) {
        std::cerr << "[Config] " << ex.what() << std::endl;
        return 2;
    }

    const auto credentials = load_credentials_from_env();
    if (credentials.empty() && config.ladder.mode != grid::RunMode::Monitor) {
        std::cerr << "[Config] NONKYC_API_KEY and NONKYC_API_SECRET must be set" << std::endl;
        return 2;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    nonkyc::HttpClientOptions http_options;
    http_options.timeout_ms = config.client.timeout_ms;
    auto transport = std::make_shared<nonkyc::HttpClient>(http_options);
    auto limiter = std::make_shared<nonkyc::RateLimiter>(config.client.rate_limit_capacity,
                                                         config.client.rate_limit_refill_per_second);
    auto rest = std::make_shared<nonkyc::RestClient>(credentials, transport, limiter, config.client.rest);

    if (config.client.use_server_time) {
        try {
            rest->sync_server_time();
        } catch (const nonkyc::ApiError& ex) {
            std::cerr << "[REST] Server time sync failed, using local clock: " << ex.what() << std::endl;
        }
    }

    auto exchange = std::make_shared<grid::NonkycExchange>(rest);
    auto balances = std::make_shared<grid::BalanceTracker>();
    auto store = std::make_shared<grid::StateStore>(config.ladder.state_path);
    const auto stream_settings = config.stream;
    const auto symbol = config.ladder.symbol;

    grid::LadderEngine engine{std::move(config), exchange, balances, store};
    try {
        engine.start();
    } catch (const nonkyc::ConfigurationError& ex) {
        std::cerr << "[Config] Refusing to start: " << ex.what() << std::endl;
        return 2;
    } catch (const grid::RebalanceError& ex) {
        std::cerr << "[Ladder] Startup rebalance failed. Manual balancing required. " << ex.what() << std::endl;
        return 1;
    } catch (const nonkyc::ApiError& ex) {
        std::cerr << "[Ladder] Startup failed (" << nonkyc::to_string(ex.kind()) << "): " << ex.what() << std::endl;
        return 1;
    }

    std::unique_ptr<nonkyc::StreamClient> stream;
    if (stream_settings.enabled) {
        nonkyc::StreamClientConfig stream_config;
        stream_config.reconnect_base = std::chrono::milliseconds(stream_settings.reconnect_base_ms);
        stream_config.reconnect_max = std::chrono::milliseconds(stream_settings.reconnect_max_ms);
        stream_config.max_consecutive_failures = stream_settings.max_consecutive_failures;

        auto ws = std::make_shared<nonkyc::WsClient>(stream_settings.url);
        stream = std::make_unique<nonkyc::StreamClient>(ws, credentials, stream_config);
        stream->on("report", [&engine](const nlohmann::json& message) { engine.on_stream_report(message); });
        stream->set_fatal_callback([&engine](const std::string& reason) { engine.report_fatal(reason); });
        stream->subscribe_reports();
        if (stream_settings.orderbook_depth > 0) {
            stream->subscribe_orderbook(symbol, stream_settings.orderbook_depth);
        }
        stream->start();
    }

    std::atomic<bool> finished{false};
    std::thread signal_watcher([&] {
        while (!finished) {
            if (g_stop_signal) {
                std::cout << "[Main] Stop requested" << std::endl;
                engine.request_stop();
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    });

    engine.run();

    finished = true;
    signal_watcher.join();
    if (stream) {
        stream->stop();
    }

    if (engine.is_fatal()) {
        std::cerr << "[Main] Exiting after fatal error: " << engine.last_error() << std::endl;
        return 1;
    }
    return 0;
}
