#pragma once
#include <array>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include "../cache/WebhookStore.hpp"
#include "../interfaces/IWebhookFetcher.hpp"
#include "../interfaces/IWebhookSender.hpp"
#include "../utils/ThreadPool.hpp"
#include "Errors.hpp"

namespace HookCache {
    // Resolves webhooks through the store and executes them through a sender.
    // Safe to call from any number of threads; no retries are attempted.
    class WebhookExecutor {
    public:
        WebhookExecutor(WebhookStore& store, ThreadPool& pool);

        // Token precedence: a non-empty token_hint, then the cached token.
        // Throws ExecError (MissingToken, Fetch or Send).
        ExecuteOutcome Execute(dpp::snowflake id,
                               const std::optional<std::string>& token_hint,
                               const WebhookMessage& message,
                               IWebhookFetcher& fetcher,
                               IWebhookSender& sender);

        // Runs Execute on the pool. fetcher and sender must outlive the returned future.
        std::future<ExecuteOutcome> ExecuteAsync(dpp::snowflake id,
                                                 std::optional<std::string> token_hint,
                                                 WebhookMessage message,
                                                 IWebhookFetcher& fetcher,
                                                 IWebhookSender& sender);

        // Cached executable webhook of the channel, else the first listed one with a token,
        // else a newly created one. At most one resolution per channel runs at a time.
        // Throws ExecError(Fetch) when listing or creating fails.
        WebhookRecord ResolveChannel(dpp::snowflake channel_id, const std::string& name, IWebhookDirectory& directory);

        ExecuteOutcome ExecuteInChannel(dpp::snowflake channel_id,
                                        const std::string& name,
                                        const WebhookMessage& message,
                                        IWebhookDirectory& directory,
                                        IWebhookSender& sender);

    private:
        ExecuteOutcome SendWith(const WebhookRecord& record, const std::string& token,
                                const WebhookMessage& message, IWebhookSender& sender);
        std::mutex& ChannelLock(dpp::snowflake channel_id);

        WebhookStore& store_;
        ThreadPool& pool_;
        std::array<std::mutex, 32> channel_locks_;
    };
}
