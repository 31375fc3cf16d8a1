#include "Webhook.hpp"

namespace HookCache {

bool operator==(const WebhookRecord& a, const WebhookRecord& b) {
    return a.id == b.id
        && a.channel_id == b.channel_id
        && a.guild_id == b.guild_id
        && a.name == b.name
        && a.avatar == b.avatar
        && a.token == b.token
        && a.application_owned == b.application_owned;
}

bool WebhookPatch::Empty() const {
    return channel_id.IsUnset() && guild_id.IsUnset() && name.IsUnset()
        && avatar.IsUnset() && token.IsUnset() && application_owned.IsUnset();
}

void ApplyPatch(WebhookRecord& record, const WebhookPatch& patch) {
    patch.channel_id.ApplyTo(record.channel_id);
    patch.guild_id.ApplyTo(record.guild_id);
    patch.name.ApplyTo(record.name);
    patch.avatar.ApplyTo(record.avatar);
    patch.token.ApplyTo(record.token);
    patch.application_owned.ApplyTo(record.application_owned);
}

WebhookRecord FromDppWebhook(const dpp::webhook& wh) {
    WebhookRecord record;
    record.id = wh.id;
    record.channel_id = wh.channel_id;
    if (!wh.guild_id.empty()) {
        record.guild_id = wh.guild_id;
    }
    record.name = wh.name;

    std::string avatar = wh.avatar.to_string();
    if (!avatar.empty()) {
        record.avatar = std::move(avatar);
    }
    if (!wh.token.empty()) {
        record.token = wh.token;
    }
    record.application_owned = !wh.application_id.empty();
    return record;
}

WebhookEvent WebhookEvent::Created(WebhookRecord record) {
    WebhookEvent ev;
    ev.kind = Kind::Created;
    ev.id = record.id;
    ev.record = std::move(record);
    return ev;
}

WebhookEvent WebhookEvent::Updated(dpp::snowflake id, WebhookPatch patch) {
    WebhookEvent ev;
    ev.kind = Kind::Updated;
    ev.id = id;
    ev.patch = std::move(patch);
    return ev;
}

WebhookEvent WebhookEvent::Deleted(dpp::snowflake id) {
    WebhookEvent ev;
    ev.kind = Kind::Deleted;
    ev.id = id;
    return ev;
}

}
