#pragma once
#include <atomic>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "../model/Webhook.hpp"
#include "../interfaces/IWebhookFetcher.hpp"

namespace HookCache {

    struct StoreStats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t fetches = 0;
        uint64_t fetch_failures = 0;
        uint64_t update_misses = 0;
    };

    // Process-wide webhook cache keyed by webhook id.
    //
    // Entries are spread over independently locked shards. Reads take a shared lock on
    // one shard; mutations take that shard's exclusive lock. Fetches triggered by
    // GetOrFetch run outside any lock, and racing callers for the same id wait on the
    // first caller's result instead of fetching again.
    //
    // Entries live until a delete event or an explicit removal. Events for one id must be
    // applied in the order they were received.
    class WebhookStore {
    public:
        explicit WebhookStore(size_t shard_count = 16);

        WebhookStore(const WebhookStore&) = delete;
        WebhookStore& operator=(const WebhookStore&) = delete;

        std::optional<WebhookRecord> Get(dpp::snowflake id) const;

        // Throws FetchError when the fetch fails. Every caller waiting on the same fetch
        // gets the same record or the same error.
        WebhookRecord GetOrFetch(dpp::snowflake id, IWebhookFetcher& fetcher);

        void Insert(const WebhookRecord& record);
        // Returns false (and counts an update miss) when the id is not cached.
        bool Update(dpp::snowflake id, const WebhookPatch& patch);
        std::optional<WebhookRecord> Remove(dpp::snowflake id);
        void Clear();

        void Apply(const WebhookEvent& event);

        // A cached webhook of the channel that can be executed (has a token).
        std::optional<WebhookRecord> FindByChannel(dpp::snowflake channel_id) const;
        bool HasChannel(dpp::snowflake channel_id) const;
        size_t RemoveChannel(dpp::snowflake channel_id);
        size_t RemoveGuild(dpp::snowflake guild_id);

        // Call before requesting a channel listing, and hand the ticket to ReplaceChannel
        // (or CancelChannelListing if the request fails).
        uint64_t BeginChannelListing(dpp::snowflake channel_id);
        void CancelChannelListing(uint64_t ticket);
        // Make the cached webhooks of a channel match the listing. Ids written or removed
        // since BeginChannelListing keep their current state. Nothing is applied when the
        // channel or its guild was evicted in the meantime.
        void ReplaceChannel(uint64_t ticket, const std::vector<WebhookRecord>& records);

        size_t Size() const;
        StoreStats Stats() const;

    private:
        struct PendingFetch {
            std::promise<WebhookRecord> promise;
            std::shared_future<WebhookRecord> future;
            bool superseded = false; // an event touched the id while the fetch was in flight
        };

        struct Shard {
            mutable std::shared_mutex mutex;
            std::unordered_map<dpp::snowflake, WebhookRecord> records;
            std::unordered_map<dpp::snowflake, std::shared_ptr<PendingFetch>> in_flight;
        };

        struct ChannelListing {
            dpp::snowflake channel_id;
            std::unordered_set<dpp::snowflake> touched;
            std::unordered_set<dpp::snowflake> removed_guilds;
            bool channel_removed = false;
        };

        size_t ShardIndex(dpp::snowflake id) const;
        Shard& ShardFor(dpp::snowflake id);
        const Shard& ShardFor(dpp::snowflake id) const;
        // Caller holds the shard's exclusive lock.
        static void SupersedeUnlocked(Shard& shard, dpp::snowflake id);
        // Record a write to `id` in every open channel listing. Caller holds the id's shard lock.
        void NoteTouched(dpp::snowflake id);
        // Caller holds listings_mutex_.
        void NoteTouchedLocked(dpp::snowflake id, uint64_t except_ticket);

        WebhookRecord FetchAndFill(dpp::snowflake id, IWebhookFetcher& fetcher, Shard& shard, std::shared_ptr<PendingFetch> pending);

        std::vector<std::unique_ptr<Shard>> shards_;

        // Lock order: shard mutex, then listings_mutex_.
        std::mutex listings_mutex_;
        std::unordered_map<uint64_t, ChannelListing> listings_;
        uint64_t next_ticket_ = 1;
        std::atomic<size_t> open_listings_{0};

        std::atomic<uint64_t> hits_{0};
        std::atomic<uint64_t> misses_{0};
        std::atomic<uint64_t> fetches_{0};
        std::atomic<uint64_t> fetch_failures_{0};
        std::atomic<uint64_t> update_misses_{0};
    };
}
