#include "Errors.hpp"

namespace HookCache {

FetchError::FetchError(dpp::snowflake id, const std::string& reason)
    : std::runtime_error("Failed to fetch webhook " + std::to_string(id) + ": " + reason), id_(id) {}

HttpError::HttpError(long status_code, const std::string& message, double retry_after)
    : std::runtime_error("HTTP " + std::to_string(status_code) + ": " + message),
      status_code_(status_code), retry_after_(retry_after) {}

ExecError::ExecError(Kind kind, const std::string& message, long status_code,
                     double retry_after, std::exception_ptr cause)
    : std::runtime_error(message), kind_(kind), status_code_(status_code),
      retry_after_(retry_after), cause_(std::move(cause)) {}

ExecError ExecError::MissingToken(dpp::snowflake id) {
    return ExecError(Kind::MissingToken, "No token available to execute webhook " + std::to_string(id));
}

const char* ToString(ExecError::Kind kind) {
    switch (kind) {
        case ExecError::Kind::MissingToken: return "MissingToken";
        case ExecError::Kind::Fetch:        return "Fetch";
        case ExecError::Kind::Send:         return "Send";
    }
    return "Unknown";
}

}
