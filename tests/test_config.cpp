#include <catch2/catch_all.hpp>
#include <filesystem>
#include <fstream>
#include "../config/Config.hpp"

using namespace HookCache;

namespace {
std::filesystem::path TempConfigPath(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / "hookcache_tests";
    std::filesystem::create_directories(dir);
    auto path = dir / name;
    std::filesystem::remove(path);
    std::filesystem::remove(path.string() + ".bak");
    return path;
}
}

TEST_CASE("Config reads known keys and keeps defaults for the rest") {
    Config cfg;
    cfg.FromJson(nlohmann::json{{"store_shards", 4}, {"api_base_url", "https://example.test/api/"}, {"unknown", 1}});
    CHECK(cfg.store_shards == 4);
    CHECK(cfg.api_base_url == "https://example.test/api");
    CHECK(cfg.fetch_timeout_ms == 5000);
    CHECK(cfg.relay_prefix == "!relay ");
    CHECK_NOTHROW(cfg.Validate());
}

TEST_CASE("Config validation rejects bad values") {
    Config cfg;
    SECTION("no shards") { cfg.store_shards = 0; }
    SECTION("negative timeout") { cfg.http_timeout_ms = -1; }
    SECTION("bad base url") { cfg.api_base_url = "discord.com/api"; }
    CHECK_THROWS_AS(cfg.Validate(), std::runtime_error);
}

TEST_CASE("Config::Load writes back missing keys") {
    auto path = TempConfigPath("partial.json");
    {
        std::ofstream o(path);
        o << R"({"bot_token": "abc", "custom": true})";
    }

    Config cfg;
    cfg.Load(path.string());
    CHECK(cfg.bot_token == "abc");

    std::ifstream in(path);
    auto written = nlohmann::json::parse(in);
    CHECK(written["bot_token"] == "abc");
    CHECK(written["custom"] == true);
    CHECK(written.contains("store_shards"));
    CHECK(written.contains("relay_webhook_name"));
    CHECK(std::filesystem::exists(path.string() + ".bak"));
}

TEST_CASE("Config::Load fails on a missing file") {
    Config cfg;
    auto path = TempConfigPath("missing.json");
    CHECK_THROWS_WITH(cfg.Load(path.string()), Catch::Matchers::ContainsSubstring("Could not open config file"));
}

TEST_CASE("Config::CreateDefault round-trips through Load") {
    auto path = TempConfigPath("default.json");
    Config writer;
    writer.CreateDefault(path.string());
    REQUIRE(std::filesystem::exists(path));

    Config reader;
    reader.store_shards = 99;
    reader.Load(path.string());
    CHECK(reader.store_shards == 16);
    CHECK(reader.bot_token == "YOUR_BOT_TOKEN_HERE");
    // Nothing was missing, so no backup is made
    CHECK_FALSE(std::filesystem::exists(path.string() + ".bak"));
}
