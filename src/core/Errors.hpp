#pragma once
#include <exception>
#include <stdexcept>
#include <string>
#include <dpp/dpp.h>

namespace HookCache {

    // The fetch capability failed; the store was left untouched.
    class FetchError : public std::runtime_error {
    public:
        FetchError(dpp::snowflake id, const std::string& reason);
        dpp::snowflake id() const { return id_; }
    private:
        dpp::snowflake id_;
    };

    // Non-2xx response from the Discord REST API.
    class HttpError : public std::runtime_error {
    public:
        HttpError(long status_code, const std::string& message, double retry_after = 0.0);
        long status_code() const { return status_code_; }
        // Seconds to wait before retrying, as reported by a 429 response.
        double retry_after() const { return retry_after_; }
    private:
        long status_code_;
        double retry_after_;
    };

    class ExecError : public std::runtime_error {
    public:
        enum class Kind { MissingToken, Fetch, Send };

        ExecError(Kind kind, const std::string& message, long status_code = 0,
                  double retry_after = 0.0, std::exception_ptr cause = nullptr);

        static ExecError MissingToken(dpp::snowflake id);

        Kind kind() const { return kind_; }
        long status_code() const { return status_code_; }
        // Copied from a rate-limited send; the caller decides whether to wait and retry.
        double retry_after() const { return retry_after_; }
        // The FetchError or sender exception this error wraps, if any.
        std::exception_ptr cause() const { return cause_; }

    private:
        Kind kind_;
        long status_code_;
        double retry_after_;
        std::exception_ptr cause_;
    };

    const char* ToString(ExecError::Kind kind);

}
