#include "nonkyc/errors.hpp"

namespace nonkyc {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Authentication:
            return "authentication";
        case ErrorKind::RateLimit:
            return "rate_limit";
        case ErrorKind::Transient:
            return "transient";
        case ErrorKind::Validation:
            return "validation";
        case ErrorKind::Configuration:
            return "configuration";
    }
    return "unknown";
}

} // namespace nonkyc
