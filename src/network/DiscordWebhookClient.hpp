#pragma once
#include <dpp/dpp.h>
#include "../interfaces/IWebhookFetcher.hpp"

namespace HookCache {

// Blocking adapter over the D++ REST calls for webhook metadata. Each call waits for
// the cluster's callback up to `timeout_ms` and throws std::runtime_error on timeout
// or API error. Requires a bot token with MANAGE_WEBHOOKS in the channels involved.
class DiscordWebhookClient : public IWebhookFetcher, public IWebhookDirectory {
public:
    DiscordWebhookClient(dpp::cluster& bot, long timeout_ms);

    DiscordWebhookClient(const DiscordWebhookClient&) = delete;
    DiscordWebhookClient& operator=(const DiscordWebhookClient&) = delete;

    WebhookRecord Fetch(dpp::snowflake id) override;
    std::vector<WebhookRecord> ListChannel(dpp::snowflake channel_id) override;
    WebhookRecord Create(dpp::snowflake channel_id, const std::string& name) override;

private:
    template <typename Result, typename Call>
    Result Await(const std::string& what, Call&& call);

    dpp::cluster& bot_;
    long timeout_ms_;
};

}
