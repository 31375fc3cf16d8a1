#pragma once
#include <string>
#include <optional>
#include <utility>
#include <dpp/dpp.h>

namespace HookCache {

    // Cached view of a Discord webhook. Everything but `id` may change through update events.
    struct WebhookRecord {
        dpp::snowflake id;
        dpp::snowflake channel_id;
        std::optional<dpp::snowflake> guild_id; // channel-only webhooks have none
        std::string name;
        std::optional<std::string> avatar;
        std::optional<std::string> token;       // only for incoming webhooks we may see
        bool application_owned = false;

        bool HasToken() const { return token.has_value() && !token->empty(); }
    };

    bool operator==(const WebhookRecord& a, const WebhookRecord& b);

    // One field of a partial update: leave alone, set to a value, or clear.
    template <typename T>
    class FieldPatch {
    public:
        enum class State { Unset, Set, Cleared };

        FieldPatch() = default;

        static FieldPatch Of(T value) {
            FieldPatch p;
            p.state_ = State::Set;
            p.value_ = std::move(value);
            return p;
        }

        static FieldPatch Clear() {
            FieldPatch p;
            p.state_ = State::Cleared;
            return p;
        }

        bool IsUnset() const { return state_ == State::Unset; }

        // Non-optional target: Cleared resets it to T{}.
        void ApplyTo(T& target) const {
            if (state_ == State::Set) target = *value_;
            else if (state_ == State::Cleared) target = T{};
        }

        void ApplyTo(std::optional<T>& target) const {
            if (state_ == State::Set) target = *value_;
            else if (state_ == State::Cleared) target.reset();
        }

    private:
        State state_ = State::Unset;
        std::optional<T> value_;
    };

    struct WebhookPatch {
        FieldPatch<dpp::snowflake> channel_id;
        FieldPatch<dpp::snowflake> guild_id;
        FieldPatch<std::string> name;
        FieldPatch<std::string> avatar;
        FieldPatch<std::string> token;
        FieldPatch<bool> application_owned;

        bool Empty() const;
    };

    // Merge `patch` into `record`; fields left Unset keep their cached value.
    void ApplyPatch(WebhookRecord& record, const WebhookPatch& patch);

    // Translate a webhook object returned by the Discord API into a cache record.
    WebhookRecord FromDppWebhook(const dpp::webhook& wh);

    struct WebhookEvent {
        enum class Kind { Created, Updated, Deleted };

        Kind kind = Kind::Created;
        dpp::snowflake id;
        WebhookRecord record;   // Created
        WebhookPatch patch;     // Updated

        static WebhookEvent Created(WebhookRecord record);
        static WebhookEvent Updated(dpp::snowflake id, WebhookPatch patch);
        static WebhookEvent Deleted(dpp::snowflake id);
    };

}
