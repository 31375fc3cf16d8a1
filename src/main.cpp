#include <dpp/dpp.h>
#include <algorithm>
#include <cstdlib>
#include <curl/curl.h>
#include <filesystem>
#include <thread>
#include "../config/Config.hpp"
#include "cache/WebhookStore.hpp"
#include "core/WebhookExecutor.hpp"
#include "core/WebhookEventRouter.hpp"
#include "network/DiscordWebhookClient.hpp"
#include "network/WebhookSender.hpp"
#include "utils/Logger.hpp"
#include "utils/Persona.hpp"
#include "utils/ThreadPool.hpp"

using HookCache::Logger;
using HookCache::LogLevel;

int main(int argc, char* argv[]) {
    if (argc == 0 || argv[0] == nullptr) {
        Logger::Log(LogLevel::Error, "Cannot determine executable path.");
        return 1;
    }
    std::filesystem::path exe_dir = std::filesystem::path(argv[0]).parent_path();
    const std::string config_path = (exe_dir / "config" / "config.json").string();

    curl_global_init(CURL_GLOBAL_ALL);

    try {
        HookCache::Config::GetInstance().Load(config_path);
        Logger::Log(LogLevel::Info, "Configuration loaded from: " + config_path);
    } catch (const nlohmann::json::exception& e) {
        Logger::Log(LogLevel::Error, "Malformed config " + config_path + ": " + e.what());
        curl_global_cleanup();
        return 1;
    } catch (const std::runtime_error& e) {
        std::string error_message = e.what();
        if (error_message.find("Could not open config file") == std::string::npos) {
            Logger::Log(LogLevel::Error, "Failed to load config: " + error_message);
            curl_global_cleanup();
            return 1;
        }
        Logger::Log(LogLevel::Warn, "config.json not found. Creating a default one at: " + config_path);
        try {
            HookCache::Config::GetInstance().CreateDefault(config_path);
            Logger::Log(LogLevel::Info, "Default config.json created. Set your bot token and restart.");
            curl_global_cleanup();
            return 0;
        } catch (const std::exception& create_e) {
            Logger::Log(LogLevel::Error, "Failed to create default config: " + std::string(create_e.what()));
            curl_global_cleanup();
            return 1;
        }
    }
    const auto& config = HookCache::Config::GetInstance();
    Logger::Init(exe_dir.string(), Logger::FromString(config.log_level));

    if (config.bot_token == "YOUR_BOT_TOKEN_HERE" || config.bot_token.empty()) {
        Logger::Log(LogLevel::Error, "Please set your bot_token in " + config_path);
        curl_global_cleanup();
        return 1;
    }

    const unsigned int hardware_cores = std::max(1u, std::thread::hardware_concurrency());
    unsigned int worker_threads = config.max_concurrency > 0
        ? static_cast<unsigned int>(config.max_concurrency)
        : std::max(1u, hardware_cores / 2);
    Logger::Log(LogLevel::Info, "Worker threads: " + std::to_string(worker_threads));

    dpp::cluster bot(config.bot_token, dpp::i_default_intents | dpp::i_message_content);
    bot.on_log([](const dpp::log_t& event) {
        LogLevel level = LogLevel::Debug;
        switch (event.severity) {
            case dpp::ll_info:    level = LogLevel::Info; break;
            case dpp::ll_warning: level = LogLevel::Warn; break;
            case dpp::ll_error:
            case dpp::ll_critical: level = LogLevel::Error; break;
            default:              level = LogLevel::Debug; break;
        }
        Logger::Log(level, "[DPP] " + event.message);
    });

    HookCache::ThreadPool thread_pool(worker_threads);
    HookCache::WebhookStore store(static_cast<size_t>(config.store_shards));
    HookCache::DiscordWebhookClient discord(bot, config.fetch_timeout_ms);
    HookCache::WebhookSender sender(config.api_base_url, config.http_timeout_ms, config.http_user_agent);
    HookCache::WebhookExecutor executor(store, thread_pool);
    HookCache::WebhookEventRouter router(store, discord, thread_pool);
    router.Attach(bot);

    // "<prefix>text" is reposted through the channel's webhook under the author's name and avatar.
    bot.on_message_create([&](const dpp::message_create_t& event) {
        const auto& msg = event.msg;
        if (msg.author.is_bot() || msg.webhook_id) return;
        if (msg.content.rfind(config.relay_prefix, 0) != 0) return;

        HookCache::WebhookMessage out;
        out.content = msg.content.substr(config.relay_prefix.size());
        if (out.content.empty()) return;
        HookCache::ApplyPersona(out, HookCache::PersonaOf(msg.author, msg.member, msg.guild_id));

        const dpp::snowflake channel_id = msg.channel_id;
        thread_pool.enqueue([&executor, &discord, &sender, &config, channel_id, out]() {
            try {
                executor.ExecuteInChannel(channel_id, config.relay_webhook_name, out, discord, sender);
            } catch (const HookCache::ExecError& e) {
                Logger::Log(LogLevel::Error, std::string("Relay failed [") + HookCache::ToString(e.kind()) + "]: " + e.what());
            }
        });
    });

    bot.on_ready([&bot](const dpp::ready_t&) {
        Logger::Log(LogLevel::Info, "Bot is ready! Logged in as " + bot.me.username);
    });

    try {
        bot.start(dpp::st_wait);
    } catch (const dpp::exception& e) {
        Logger::Log(LogLevel::Error, "DPP Exception: " + std::string(e.what()));
        thread_pool.Shutdown();
        curl_global_cleanup();
        return 1;
    }
    // Drain queued relays while the executor and clients are still alive
    thread_pool.Shutdown();

    auto stats = store.Stats();
    Logger::Log(LogLevel::Info, "Webhook cache: " + std::to_string(store.Size()) + " entries, "
        + std::to_string(stats.hits) + " hits, " + std::to_string(stats.fetches) + " fetches");
    curl_global_cleanup();
    return 0;
}
