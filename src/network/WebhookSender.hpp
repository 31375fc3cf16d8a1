#pragma once
#include <string>
#include <optional>
#include <nlohmann/json.hpp>
#include "../interfaces/IWebhookSender.hpp"

namespace HookCache {

// Executes webhooks with a plain HTTPS POST through libcurl. Only the webhook token
// authenticates the call, so no bot session is needed. One easy handle per call;
// curl_global_init must have run before the first Send.
class WebhookSender : public IWebhookSender {
public:
    WebhookSender(std::string api_base_url, long timeout_ms, std::string user_agent);

    WebhookSender(const WebhookSender&) = delete;
    WebhookSender& operator=(const WebhookSender&) = delete;

    // Throws HttpError on non-2xx responses and std::runtime_error on transport failures.
    ExecuteOutcome Send(dpp::snowflake id, const std::string& token, const WebhookMessage& message) override;

    static std::string BuildUrl(const std::string& api_base_url, dpp::snowflake id, const std::string& token,
                                const std::optional<dpp::snowflake>& thread_id);
    static nlohmann::json BuildBody(const WebhookMessage& message);
    static ExecuteOutcome ParseResponse(long status_code, const std::string& body);

private:
    std::string api_base_url_;
    long timeout_ms_;
    std::string user_agent_;
};

}
