#include "WebhookEventRouter.hpp"
#include "../utils/Logger.hpp"

namespace HookCache {

WebhookEventRouter::WebhookEventRouter(WebhookStore& store, IWebhookDirectory& directory, ThreadPool& pool)
    : store_(store), directory_(directory), pool_(pool) {}

void WebhookEventRouter::Attach(dpp::cluster& bot) {
    bot.on_webhooks_update([this](const dpp::webhooks_update_t& event) {
        OnWebhooksUpdate(event.webhook_channel.id);
    });

    bot.on_channel_delete([this](const dpp::channel_delete_t& event) {
        OnChannelDelete(event.deleted.id);
    });

    bot.on_guild_delete([this](const dpp::guild_delete_t& event) {
        OnGuildDelete(event.deleted.id);
    });
}

void WebhookEventRouter::OnWebhooksUpdate(dpp::snowflake channel_id) {
    if (!store_.HasChannel(channel_id)) return;
    // Listing is a blocking REST call; keep it off the gateway thread.
    pool_.enqueue([this, channel_id]() {
        ValidateChannel(channel_id);
    });
}

void WebhookEventRouter::OnChannelDelete(dpp::snowflake channel_id) {
    size_t removed = store_.RemoveChannel(channel_id);
    if (removed > 0) {
        Logger::Log(LogLevel::Info, "Channel " + std::to_string(channel_id) + " deleted, evicted " + std::to_string(removed) + " webhook(s)");
    }
}

void WebhookEventRouter::OnGuildDelete(dpp::snowflake guild_id) {
    size_t removed = store_.RemoveGuild(guild_id);
    if (removed > 0) {
        Logger::Log(LogLevel::Info, "Guild " + std::to_string(guild_id) + " gone, evicted " + std::to_string(removed) + " webhook(s)");
    }
}

bool WebhookEventRouter::ValidateChannel(dpp::snowflake channel_id) {
    if (!store_.HasChannel(channel_id)) return false;

    // Events applied while the listing is in flight win over it.
    uint64_t ticket = store_.BeginChannelListing(channel_id);
    std::vector<WebhookRecord> listed;
    try {
        listed = directory_.ListChannel(channel_id);
    } catch (const std::exception& e) {
        store_.CancelChannelListing(ticket);
        Logger::Log(LogLevel::Error, "Could not validate webhooks of channel " + std::to_string(channel_id) + ": " + e.what());
        return false;
    }

    store_.ReplaceChannel(ticket, listed);
    Logger::Log(LogLevel::Debug, "Validated channel " + std::to_string(channel_id) + ": " + std::to_string(listed.size()) + " webhook(s) listed");
    return true;
}

}
