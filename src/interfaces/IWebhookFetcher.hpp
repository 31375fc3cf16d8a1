#pragma once
#include <vector>
#include <string>
#include "../model/Webhook.hpp"

namespace HookCache {

// Direct query to the platform for one webhook. Throws on failure.
class IWebhookFetcher {
public:
    virtual ~IWebhookFetcher() = default;
    virtual WebhookRecord Fetch(dpp::snowflake id) = 0;
};

// Channel-level webhook management. Throws on failure.
class IWebhookDirectory {
public:
    virtual ~IWebhookDirectory() = default;
    virtual std::vector<WebhookRecord> ListChannel(dpp::snowflake channel_id) = 0;
    virtual WebhookRecord Create(dpp::snowflake channel_id, const std::string& name) = 0;
};

}
