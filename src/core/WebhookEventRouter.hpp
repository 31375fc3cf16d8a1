#pragma once
#include <dpp/dpp.h>
#include "../cache/WebhookStore.hpp"
#include "../interfaces/IWebhookFetcher.hpp"
#include "../utils/ThreadPool.hpp"

namespace HookCache {
    // Keeps the store consistent with gateway events.
    //
    // WEBHOOKS_UPDATE only names the channel whose webhooks changed, so the channel is
    // listed again and the cached set replaced. Channel and guild deletions evict every
    // webhook that belonged to them.
    class WebhookEventRouter {
    public:
        WebhookEventRouter(WebhookStore& store, IWebhookDirectory& directory, ThreadPool& pool);

        void Attach(dpp::cluster& bot);

        void OnWebhooksUpdate(dpp::snowflake channel_id);
        void OnChannelDelete(dpp::snowflake channel_id);
        void OnGuildDelete(dpp::snowflake guild_id);

        // Returns false when the channel was not cached or the listing failed.
        bool ValidateChannel(dpp::snowflake channel_id);

    private:
        WebhookStore& store_;
        IWebhookDirectory& directory_;
        ThreadPool& pool_;
    };
}
