#include "WebhookExecutor.hpp"
#include "../utils/Logger.hpp"

namespace HookCache {

WebhookExecutor::WebhookExecutor(WebhookStore& store, ThreadPool& pool)
    : store_(store), pool_(pool) {}

ExecuteOutcome WebhookExecutor::Execute(dpp::snowflake id,
                                        const std::optional<std::string>& token_hint,
                                        const WebhookMessage& message,
                                        IWebhookFetcher& fetcher,
                                        IWebhookSender& sender) {
    WebhookRecord record;
    try {
        record = store_.GetOrFetch(id, fetcher);
    } catch (const FetchError& e) {
        throw ExecError(ExecError::Kind::Fetch, e.what(), 0, 0.0, std::current_exception());
    }

    std::string token;
    if (token_hint && !token_hint->empty()) {
        token = *token_hint;
    } else if (record.HasToken()) {
        token = *record.token;
    } else {
        throw ExecError::MissingToken(id);
    }
    return SendWith(record, token, message, sender);
}

std::future<ExecuteOutcome> WebhookExecutor::ExecuteAsync(dpp::snowflake id,
                                                          std::optional<std::string> token_hint,
                                                          WebhookMessage message,
                                                          IWebhookFetcher& fetcher,
                                                          IWebhookSender& sender) {
    return pool_.enqueue([this, id, token_hint = std::move(token_hint), message = std::move(message), &fetcher, &sender]() {
        return Execute(id, token_hint, message, fetcher, sender);
    });
}

ExecuteOutcome WebhookExecutor::SendWith(const WebhookRecord& record, const std::string& token,
                                         const WebhookMessage& message, IWebhookSender& sender) {
    try {
        auto outcome = sender.Send(record.id, token, message);
        Logger::Log(LogLevel::Debug, "Executed webhook " + std::to_string(record.id) + " (HTTP " + std::to_string(outcome.status_code) + ")");
        return outcome;
    } catch (const HttpError& e) {
        Logger::Log(LogLevel::Warn, "Executing webhook " + std::to_string(record.id) + " failed: " + e.what());
        throw ExecError(ExecError::Kind::Send, e.what(), e.status_code(), e.retry_after(), std::current_exception());
    } catch (const std::exception& e) {
        Logger::Log(LogLevel::Warn, "Executing webhook " + std::to_string(record.id) + " failed: " + e.what());
        throw ExecError(ExecError::Kind::Send, e.what(), 0, 0.0, std::current_exception());
    }
}

std::mutex& WebhookExecutor::ChannelLock(dpp::snowflake channel_id) {
    uint64_t v = channel_id;
    return channel_locks_[(v ^ (v >> 22)) % channel_locks_.size()];
}

WebhookRecord WebhookExecutor::ResolveChannel(dpp::snowflake channel_id, const std::string& name, IWebhookDirectory& directory) {
    if (auto cached = store_.FindByChannel(channel_id)) {
        return *cached;
    }

    std::lock_guard<std::mutex> lock(ChannelLock(channel_id));
    // Another thread may have resolved it while we waited for the lock
    if (auto cached = store_.FindByChannel(channel_id)) {
        return *cached;
    }

    try {
        for (const auto& record : directory.ListChannel(channel_id)) {
            if (record.HasToken()) {
                Logger::Log(LogLevel::Debug, "Using existing webhook " + std::to_string(record.id) + " for channel " + std::to_string(channel_id));
                store_.Insert(record);
                return record;
            }
        }

        WebhookRecord created = directory.Create(channel_id, name);
        Logger::Log(LogLevel::Info, "Created webhook " + std::to_string(created.id) + " in channel " + std::to_string(channel_id));
        store_.Insert(created);
        return created;
    } catch (const std::exception& e) {
        throw ExecError(ExecError::Kind::Fetch, "Could not resolve a webhook for channel " + std::to_string(channel_id) + ": " + e.what(),
                        0, 0.0, std::current_exception());
    }
}

ExecuteOutcome WebhookExecutor::ExecuteInChannel(dpp::snowflake channel_id,
                                                 const std::string& name,
                                                 const WebhookMessage& message,
                                                 IWebhookDirectory& directory,
                                                 IWebhookSender& sender) {
    WebhookRecord record = ResolveChannel(channel_id, name, directory);
    if (!record.HasToken()) {
        throw ExecError::MissingToken(record.id);
    }
    return SendWith(record, *record.token, message, sender);
}

}
