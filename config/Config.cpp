#include "Config.hpp"
#include "../src/utils/Logger.hpp"
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <filesystem>

namespace HookCache {

void Config::FromJson(const nlohmann::json& data) {
    bot_token = data.value("bot_token", bot_token);
    log_level = data.value("log_level", log_level);
    store_shards = data.value("store_shards", store_shards);
    fetch_timeout_ms = data.value("fetch_timeout_ms", fetch_timeout_ms);
    http_timeout_ms = data.value("http_timeout_ms", http_timeout_ms);
    http_user_agent = data.value("http_user_agent", http_user_agent);
    api_base_url = data.value("api_base_url", api_base_url);
    max_concurrency = data.value("max_concurrency", max_concurrency);
    relay_webhook_name = data.value("relay_webhook_name", relay_webhook_name);
    relay_prefix = data.value("relay_prefix", relay_prefix);

    while (!api_base_url.empty() && api_base_url.back() == '/') {
        api_base_url.pop_back();
    }
}

nlohmann::json Config::ToJson() const {
    nlohmann::json data;
    data["bot_token"] = bot_token;
    data["log_level"] = log_level;
    data["store_shards"] = store_shards;
    data["fetch_timeout_ms"] = fetch_timeout_ms;
    data["http_timeout_ms"] = http_timeout_ms;
    data["http_user_agent"] = http_user_agent;
    data["api_base_url"] = api_base_url;
    data["max_concurrency"] = max_concurrency;
    data["relay_webhook_name"] = relay_webhook_name;
    data["relay_prefix"] = relay_prefix;
    return data;
}

void Config::Validate() const {
    if (store_shards <= 0) {
        throw std::runtime_error("store_shards must be positive, got " + std::to_string(store_shards));
    }
    if (fetch_timeout_ms <= 0) {
        throw std::runtime_error("fetch_timeout_ms must be positive, got " + std::to_string(fetch_timeout_ms));
    }
    if (http_timeout_ms <= 0) {
        throw std::runtime_error("http_timeout_ms must be positive, got " + std::to_string(http_timeout_ms));
    }
    if (max_concurrency < 0) {
        throw std::runtime_error("max_concurrency must not be negative, got " + std::to_string(max_concurrency));
    }
    if (api_base_url.rfind("http://", 0) != 0 && api_base_url.rfind("https://", 0) != 0) {
        throw std::runtime_error("api_base_url must be an http(s) URL: " + api_base_url);
    }
}

void Config::Load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Could not open config file: " + path);
    }
    nlohmann::json data = nlohmann::json::parse(f);
    FromJson(data);
    Validate();

    // Write back missing keys so existing config.json reflects newly added options.
    // Unknown keys are preserved.
    bool changed = false;
    const nlohmann::json current = ToJson();
    for (const auto& item : current.items()) {
        if (!data.contains(item.key())) {
            data[item.key()] = item.value();
            changed = true;
        }
    }
    if (!changed) return;

    std::filesystem::path p(path);
    std::filesystem::path bak = p;
    bak += ".bak";
    std::error_code ec;
    std::filesystem::copy_file(p, bak, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        Logger::Log(LogLevel::Warn, "Could not back up " + path + ": " + ec.message());
        return;
    }

    std::ofstream o(path, std::ios::trunc);
    o << std::setw(4) << data << std::endl;
    if (!o.good()) {
        Logger::Log(LogLevel::Warn, "Could not write new config keys to " + path);
    }
}

void Config::CreateDefault(const std::string& path_str) {
    std::filesystem::path path(path_str);

    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    Config defaultConfig;
    std::ofstream o(path);
    if (!o.is_open()) {
        throw std::runtime_error("Could not open config file for writing: " + path_str);
    }
    o << std::setw(4) << defaultConfig.ToJson() << std::endl;
    if (!o.good()) {
        throw std::runtime_error("Failed to write to config file: " + path_str);
    }
}

}
