#pragma once
#include <string>
#include <optional>
#include <dpp/dpp.h>

namespace HookCache {

struct WebhookMessage {
    std::string content;
    std::optional<std::string> username;
    std::optional<std::string> avatar_url;
    std::optional<dpp::snowflake> thread_id; // post into a thread of the webhook's channel
    bool tts = false;
};

struct ExecuteOutcome {
    long status_code = 0;
    dpp::snowflake message_id; // zero when the API did not return the message
};

// Performs the actual execution (HTTP call) of a webhook. Throws on failure.
class IWebhookSender {
public:
    virtual ~IWebhookSender() = default;
    virtual ExecuteOutcome Send(dpp::snowflake id, const std::string& token, const WebhookMessage& message) = 0;
};

}
