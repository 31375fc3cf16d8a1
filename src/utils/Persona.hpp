#pragma once
#include <string>
#include <optional>
#include <dpp/dpp.h>
#include "../interfaces/IWebhookSender.hpp"

namespace HookCache {

// Display name and avatar a webhook message is posted under.
struct Persona {
    std::string name;
    std::optional<std::string> avatar_url;

    bool operator==(const Persona& other) const {
        return name == other.name && avatar_url == other.avatar_url;
    }
};

std::string UserAvatarUrl(const std::string& hash, dpp::snowflake user_id);
std::string MemberAvatarUrl(const std::string& hash, dpp::snowflake user_id, dpp::snowflake guild_id);

// Nickname over username; guild avatar (needs guild_id) over user avatar.
// Empty strings count as absent.
Persona ResolvePersona(const std::string& username,
                       const std::string& nickname,
                       dpp::snowflake user_id,
                       const std::string& user_avatar,
                       const std::string& member_avatar,
                       std::optional<dpp::snowflake> guild_id);

// Persona of a message author as delivered in a gateway message event.
Persona PersonaOf(const dpp::user& author, const dpp::guild_member& member, dpp::snowflake guild_id);

void ApplyPersona(WebhookMessage& message, const Persona& persona);

}
