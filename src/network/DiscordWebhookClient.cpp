#include "DiscordWebhookClient.hpp"
#include "../utils/Logger.hpp"
#include <future>
#include <memory>
#include <stdexcept>

namespace HookCache {

DiscordWebhookClient::DiscordWebhookClient(dpp::cluster& bot, long timeout_ms)
    : bot_(bot), timeout_ms_(timeout_ms > 0 ? timeout_ms : 5000) {}

// Issues one REST call through `call(callback)` and blocks until the callback delivers
// a `Result` or the timeout expires. The promise is shared with the callback so a late
// reply after a timeout has somewhere to go.
template <typename Result, typename Call>
Result DiscordWebhookClient::Await(const std::string& what, Call&& call) {
    auto pp = std::make_shared<std::promise<Result>>();
    auto fut = pp->get_future();

    call([pp, what](const dpp::confirmation_callback_t& cc) {
        if (cc.is_error()) {
            const auto err = cc.get_error();
            pp->set_exception(std::make_exception_ptr(std::runtime_error(
                what + " failed (HTTP " + std::to_string(cc.http_info.status) + "): " + err.message)));
            return;
        }
        try {
            pp->set_value(std::get<Result>(cc.value));
        } catch (const std::bad_variant_access&) {
            pp->set_exception(std::make_exception_ptr(std::runtime_error(what + " returned an unexpected payload")));
        }
    });

    if (fut.wait_for(std::chrono::milliseconds(timeout_ms_)) != std::future_status::ready) {
        throw std::runtime_error(what + " timed out after " + std::to_string(timeout_ms_) + " ms");
    }
    return fut.get();
}

WebhookRecord DiscordWebhookClient::Fetch(dpp::snowflake id) {
    Logger::Log(LogLevel::Debug, "GET webhook " + std::to_string(id));
    auto wh = Await<dpp::webhook>("get_webhook " + std::to_string(id), [&](dpp::command_completion_event_t cb) {
        bot_.get_webhook(id, std::move(cb));
    });
    return FromDppWebhook(wh);
}

std::vector<WebhookRecord> DiscordWebhookClient::ListChannel(dpp::snowflake channel_id) {
    Logger::Log(LogLevel::Debug, "GET webhooks of channel " + std::to_string(channel_id));
    auto map = Await<dpp::webhook_map>("get_channel_webhooks " + std::to_string(channel_id), [&](dpp::command_completion_event_t cb) {
        bot_.get_channel_webhooks(channel_id, std::move(cb));
    });

    std::vector<WebhookRecord> records;
    records.reserve(map.size());
    for (const auto& [id, wh] : map) {
        records.push_back(FromDppWebhook(wh));
    }
    return records;
}

WebhookRecord DiscordWebhookClient::Create(dpp::snowflake channel_id, const std::string& name) {
    dpp::webhook request;
    request.channel_id = channel_id;
    request.name = name;

    auto wh = Await<dpp::webhook>("create_webhook in " + std::to_string(channel_id), [&](dpp::command_completion_event_t cb) {
        bot_.create_webhook(request, std::move(cb));
    });
    return FromDppWebhook(wh);
}

}
