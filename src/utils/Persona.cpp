#include "Persona.hpp"

namespace HookCache {

namespace {
const std::string kCdnBase = "https://cdn.discordapp.com";
}

std::string UserAvatarUrl(const std::string& hash, dpp::snowflake user_id) {
    return kCdnBase + "/avatars/" + std::to_string(user_id) + "/" + hash + ".png";
}

std::string MemberAvatarUrl(const std::string& hash, dpp::snowflake user_id, dpp::snowflake guild_id) {
    return kCdnBase + "/guilds/" + std::to_string(guild_id) + "/users/" + std::to_string(user_id) + "/avatars/" + hash + ".png";
}

Persona ResolvePersona(const std::string& username,
                       const std::string& nickname,
                       dpp::snowflake user_id,
                       const std::string& user_avatar,
                       const std::string& member_avatar,
                       std::optional<dpp::snowflake> guild_id) {
    Persona persona;
    persona.name = nickname.empty() ? username : nickname;

    if (!member_avatar.empty() && guild_id) {
        persona.avatar_url = MemberAvatarUrl(member_avatar, user_id, *guild_id);
    } else if (!user_avatar.empty()) {
        persona.avatar_url = UserAvatarUrl(user_avatar, user_id);
    }
    return persona;
}

Persona PersonaOf(const dpp::user& author, const dpp::guild_member& member, dpp::snowflake guild_id) {
    std::optional<dpp::snowflake> guild;
    if (!guild_id.empty()) guild = guild_id;
    return ResolvePersona(author.username, member.get_nickname(), author.id,
                          author.avatar.to_string(), member.avatar.to_string(), guild);
}

void ApplyPersona(WebhookMessage& message, const Persona& persona) {
    message.username = persona.name;
    message.avatar_url = persona.avatar_url;
}

}
