#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace HookCache {
    struct Config {
        std::string bot_token = "YOUR_BOT_TOKEN_HERE";
        std::string log_level = "info";
        int store_shards = 16;
        long fetch_timeout_ms = 5000;
        long http_timeout_ms = 4000;
        std::string http_user_agent = "HookCacheBot/1.0";
        std::string api_base_url = "https://discord.com/api/v10";
        int max_concurrency = 0; // 0: half of the hardware threads
        std::string relay_webhook_name = "HookCache Relay";
        std::string relay_prefix = "!relay ";

        static Config& GetInstance() {
            static Config instance;
            return instance;
        }

        void Load(const std::string& path);
        void CreateDefault(const std::string& path);

        // Parse from an already loaded document; unknown keys are ignored.
        void FromJson(const nlohmann::json& data);
        nlohmann::json ToJson() const;
        // Throws std::runtime_error on out-of-range values.
        void Validate() const;
    };
}
