#include "nonkyc/http_client.hpp"
#include "nonkyc/util.hpp"

#include <cctype>
#include <memory>
#include <utility>

namespace nonkyc {
namespace {

using EasyHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

size_t write_callback(char* data, size_t size, size_t count, void* target) {
    const auto bytes = size * count;
    static_cast<std::string*>(target)->append(data, bytes);
    return bytes;
}

std::string trim_copy(const std::string& value) {
    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(begin, end - begin);
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* headers = static_cast<std::map<std::string, std::string>*>(userp);
    const std::string line(buffer, size * nitems);
    const auto colon = line.find(':');
    if (colon != std::string::npos) {
        headers->insert_or_assign(to_lower_copy(trim_copy(line.substr(0, colon))),
                                  trim_copy(line.substr(colon + 1)));
    }
    return size * nitems;
}

} // namespace

std::string HttpResponse::header(const std::string& name) const {
    const auto it = headers.find(to_lower_copy(name));
    return it == headers.end() ? std::string{} : it->second;
}

HttpClient::HttpClient(HttpClientOptions options)
    : options_(options),
      global_initialized_(false) {
    if (const CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT); code != CURLE_OK) {
        throw HttpError(std::string("curl_global_init failed: ") + curl_easy_strerror(code));
    }
    global_initialized_ = true;
}

HttpClient::~HttpClient() {
    if (global_initialized_) {
        curl_global_cleanup();
    }
}

RequestTimings HttpClient::collect_timings(CURL* handle) const {
    const auto elapsed_ms = [handle](CURLINFO info) {
        double seconds = 0.0;
        return curl_easy_getinfo(handle, info, &seconds) == CURLE_OK ? seconds * 1000.0 : 0.0;
    };

    RequestTimings timings;
    timings.connect_ms = elapsed_ms(CURLINFO_CONNECT_TIME);
    timings.app_connect_ms = elapsed_ms(CURLINFO_APPCONNECT_TIME);
    timings.start_transfer_ms = elapsed_ms(CURLINFO_STARTTRANSFER_TIME);
    timings.total_ms = elapsed_ms(CURLINFO_TOTAL_TIME);
    return timings;
}

HttpResponse HttpClient::request(
    const std::string& method,
    const std::string& url,
    const HttpHeaders& headers,
    const std::string& body) {
    const EasyHandle easy(curl_easy_init(), &curl_easy_cleanup);
    if (!easy) {
        throw HttpError("curl_easy_init returned no handle");
    }
    CURL* handle = easy.get();

    HttpResponse response;
    curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, method.c_str());
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(handle, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, options_.timeout_ms);
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS, options_.connect_timeout_ms);
    curl_easy_setopt(handle, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(handle, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(handle, CURLOPT_TCP_KEEPINTVL, 15L);
    curl_easy_setopt(handle, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);

    HeaderList header_list(nullptr, &curl_slist_free_all);
    for (const auto& [name, value] : headers) {
        const auto line = name + ": " + value;
        curl_slist* appended = curl_slist_append(header_list.get(), line.c_str());
        if (!appended) {
            throw HttpError("curl_slist_append failed for header " + name);
        }
        header_list.release();
        header_list.reset(appended);
    }
    if (header_list) {
        curl_easy_setopt(handle, CURLOPT_HTTPHEADER, header_list.get());
    }

    if (!body.empty()) {
        curl_easy_setopt(handle, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    }

    const CURLcode code = curl_easy_perform(handle);
    if (code != CURLE_OK) {
        throw HttpError(method + ' ' + url + " failed: " + curl_easy_strerror(code),
                        code == CURLE_OPERATION_TIMEDOUT);
    }

    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.status_code);
    response.timings = collect_timings(handle);
    return response;
}

} // namespace nonkyc
