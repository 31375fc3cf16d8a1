#include "WebhookSender.hpp"
#include "../core/Errors.hpp"
#include "../utils/Logger.hpp"
#include <charconv>
#include <cstdint>
#include <curl/curl.h>
#include <memory>
#include <stdexcept>

namespace {

size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    const size_t chunk = size * nmemb;
    auto* buffer = static_cast<std::string*>(userp);
    if (!buffer) return 0;
    try {
        buffer->append(static_cast<char*>(contents), chunk);
    } catch (const std::bad_alloc&) {
        return 0; // aborts the transfer
    }
    return chunk;
}

// RFC 3986 unreserved characters pass through, everything else is %XX.
std::string EncodePathSegment(const std::string& s) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(char(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

struct CurlHandleDeleter {
    void operator()(CURL* h) const { curl_easy_cleanup(h); }
};

struct CurlListDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

} // anonymous namespace

namespace HookCache {

WebhookSender::WebhookSender(std::string api_base_url, long timeout_ms, std::string user_agent)
    : api_base_url_(std::move(api_base_url)), timeout_ms_(timeout_ms), user_agent_(std::move(user_agent)) {}

std::string WebhookSender::BuildUrl(const std::string& api_base_url, dpp::snowflake id, const std::string& token,
                                    const std::optional<dpp::snowflake>& thread_id) {
    std::string url = api_base_url + "/webhooks/" + std::to_string(id) + "/" + EncodePathSegment(token) + "?wait=true";
    if (thread_id) {
        url += "&thread_id=" + std::to_string(*thread_id);
    }
    return url;
}

nlohmann::json WebhookSender::BuildBody(const WebhookMessage& message) {
    nlohmann::json body;
    body["content"] = message.content;
    if (message.username) body["username"] = *message.username;
    if (message.avatar_url) body["avatar_url"] = *message.avatar_url;
    if (message.tts) body["tts"] = true;
    // Relayed text must not ping anyone
    body["allowed_mentions"] = {{"parse", nlohmann::json::array()}};
    return body;
}

ExecuteOutcome WebhookSender::ParseResponse(long status_code, const std::string& body) {
    nlohmann::json data = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);

    if (status_code < 200 || status_code >= 300) {
        std::string message = "request failed";
        double retry_after = 0.0;
        if (data.is_object()) {
            message = data.value("message", message);
            retry_after = data.value("retry_after", 0.0);
        }
        throw HttpError(status_code, message, retry_after);
    }

    ExecuteOutcome outcome;
    outcome.status_code = status_code;
    // The message is already posted; an unreadable id leaves message_id at 0.
    if (data.is_object() && data.contains("id") && data["id"].is_string()) {
        const std::string id = data["id"].get<std::string>();
        uint64_t value = 0;
        auto [end, ec] = std::from_chars(id.data(), id.data() + id.size(), value);
        if (ec == std::errc() && end == id.data() + id.size()) {
            outcome.message_id = dpp::snowflake(value);
        } else {
            Logger::Log(LogLevel::Warn, "Unreadable message id in webhook response: " + id);
        }
    }
    return outcome;
}

ExecuteOutcome WebhookSender::Send(dpp::snowflake id, const std::string& token, const WebhookMessage& message) {
    std::unique_ptr<CURL, CurlHandleDeleter> curl(curl_easy_init());
    if (!curl) {
        throw std::runtime_error("Failed to create cURL easy handle");
    }

    const std::string url = BuildUrl(api_base_url_, id, token, message.thread_id);
    const std::string payload = BuildBody(message).dump();
    std::string response;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    std::unique_ptr<curl_slist, CurlListDeleter> headers(curl_slist_append(nullptr, "Content-Type: application/json"));

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        std::string error = error_buffer;
        if (error.empty()) error = curl_easy_strerror(rc);
        throw std::runtime_error("Webhook " + std::to_string(id) + " transport error: " + error);
    }

    long status_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status_code);
    Logger::Log(LogLevel::Debug, "POST webhook " + std::to_string(id) + " -> HTTP " + std::to_string(status_code));
    return ParseResponse(status_code, response);
}

}
