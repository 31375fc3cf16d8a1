#include "WebhookStore.hpp"
#include "../core/Errors.hpp"
#include "../utils/Logger.hpp"
#include <stdexcept>

namespace HookCache {

WebhookStore::WebhookStore(size_t shard_count) {
    if (shard_count == 0) {
        throw std::invalid_argument("WebhookStore needs at least one shard");
    }
    shards_.reserve(shard_count);
    for (size_t i = 0; i < shard_count; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

size_t WebhookStore::ShardIndex(dpp::snowflake id) const {
    uint64_t v = id;
    // Low snowflake bits are worker/increment counters; fold the timestamp in as well.
    v ^= v >> 22;
    return static_cast<size_t>(v % shards_.size());
}

WebhookStore::Shard& WebhookStore::ShardFor(dpp::snowflake id) {
    return *shards_[ShardIndex(id)];
}

const WebhookStore::Shard& WebhookStore::ShardFor(dpp::snowflake id) const {
    return const_cast<WebhookStore*>(this)->ShardFor(id);
}

void WebhookStore::SupersedeUnlocked(Shard& shard, dpp::snowflake id) {
    auto it = shard.in_flight.find(id);
    if (it != shard.in_flight.end()) {
        it->second->superseded = true;
    }
}

void WebhookStore::NoteTouched(dpp::snowflake id) {
    if (open_listings_.load() == 0) return;
    std::lock_guard<std::mutex> lock(listings_mutex_);
    NoteTouchedLocked(id, 0);
}

void WebhookStore::NoteTouchedLocked(dpp::snowflake id, uint64_t except_ticket) {
    for (auto& [ticket, listing] : listings_) {
        if (ticket != except_ticket) {
            listing.touched.insert(id);
        }
    }
}

std::optional<WebhookRecord> WebhookStore::Get(dpp::snowflake id) const {
    const Shard& shard = ShardFor(id);
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.records.find(id);
    if (it == shard.records.end()) {
        return std::nullopt;
    }
    return it->second;
}

WebhookRecord WebhookStore::GetOrFetch(dpp::snowflake id, IWebhookFetcher& fetcher) {
    Shard& shard = ShardFor(id);
    {
        std::shared_lock<std::shared_mutex> lock(shard.mutex);
        auto it = shard.records.find(id);
        if (it != shard.records.end()) {
            hits_++;
            return it->second;
        }
    }

    std::shared_ptr<PendingFetch> pending;
    std::shared_future<WebhookRecord> waiting;
    {
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        // Filled between the two locks
        auto it = shard.records.find(id);
        if (it != shard.records.end()) {
            hits_++;
            return it->second;
        }
        misses_++;

        auto inflight = shard.in_flight.find(id);
        if (inflight != shard.in_flight.end()) {
            waiting = inflight->second->future;
        } else {
            pending = std::make_shared<PendingFetch>();
            pending->future = pending->promise.get_future().share();
            shard.in_flight.emplace(id, pending);
        }
    }

    if (!pending) {
        Logger::Log(LogLevel::Debug, "Waiting on in-flight fetch for webhook " + std::to_string(id));
        return waiting.get();
    }
    return FetchAndFill(id, fetcher, shard, std::move(pending));
}

WebhookRecord WebhookStore::FetchAndFill(dpp::snowflake id, IWebhookFetcher& fetcher, Shard& shard, std::shared_ptr<PendingFetch> pending) {
    auto fail = [&](const FetchError& error) {
        fetch_failures_++;
        {
            std::unique_lock<std::shared_mutex> lock(shard.mutex);
            shard.in_flight.erase(id);
        }
        pending->promise.set_exception(std::make_exception_ptr(error));
        Logger::Log(LogLevel::Warn, error.what());
    };

    fetches_++;
    Logger::Log(LogLevel::Debug, "Cache miss. Fetching webhook " + std::to_string(id));

    WebhookRecord record;
    try {
        record = fetcher.Fetch(id);
    } catch (const std::exception& e) {
        FetchError error(id, e.what());
        fail(error);
        throw error;
    } catch (...) {
        FetchError error(id, "unknown error");
        fail(error);
        throw error;
    }

    if (record.id != id) {
        FetchError error(id, "fetch returned webhook " + std::to_string(record.id));
        fail(error);
        throw error;
    }

    {
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        if (!pending->superseded) {
            shard.records[id] = record;
        } else {
            Logger::Log(LogLevel::Debug, "Webhook " + std::to_string(id) + " changed during fetch, keeping the newer state");
        }
        shard.in_flight.erase(id);
    }
    pending->promise.set_value(record);
    return record;
}

void WebhookStore::Insert(const WebhookRecord& record) {
    Shard& shard = ShardFor(record.id);
    std::unique_lock<std::shared_mutex> lock(shard.mutex);
    SupersedeUnlocked(shard, record.id);
    shard.records[record.id] = record;
    NoteTouched(record.id);
}

bool WebhookStore::Update(dpp::snowflake id, const WebhookPatch& patch) {
    Shard& shard = ShardFor(id);
    std::unique_lock<std::shared_mutex> lock(shard.mutex);
    SupersedeUnlocked(shard, id);
    NoteTouched(id);
    auto it = shard.records.find(id);
    if (it == shard.records.end()) {
        update_misses_++;
        return false;
    }
    ApplyPatch(it->second, patch);
    return true;
}

std::optional<WebhookRecord> WebhookStore::Remove(dpp::snowflake id) {
    Shard& shard = ShardFor(id);
    std::unique_lock<std::shared_mutex> lock(shard.mutex);
    SupersedeUnlocked(shard, id);
    NoteTouched(id);
    auto it = shard.records.find(id);
    if (it == shard.records.end()) {
        return std::nullopt;
    }
    WebhookRecord removed = std::move(it->second);
    shard.records.erase(it);
    return removed;
}

void WebhookStore::Clear() {
    {
        std::lock_guard<std::mutex> lock(listings_mutex_);
        for (auto& [ticket, listing] : listings_) {
            listing.channel_removed = true;
        }
    }
    for (auto& shard : shards_) {
        std::unique_lock<std::shared_mutex> lock(shard->mutex);
        shard->records.clear();
        for (auto& [id, pending] : shard->in_flight) {
            pending->superseded = true;
        }
    }
}

void WebhookStore::Apply(const WebhookEvent& event) {
    switch (event.kind) {
        case WebhookEvent::Kind::Created:
            Insert(event.record);
            break;
        case WebhookEvent::Kind::Updated:
            if (!Update(event.id, event.patch)) {
                Logger::Log(LogLevel::Debug, "Update for uncached webhook " + std::to_string(event.id) + " ignored");
            }
            break;
        case WebhookEvent::Kind::Deleted:
            Remove(event.id);
            break;
    }
}

std::optional<WebhookRecord> WebhookStore::FindByChannel(dpp::snowflake channel_id) const {
    for (const auto& shard : shards_) {
        std::shared_lock<std::shared_mutex> lock(shard->mutex);
        for (const auto& [id, record] : shard->records) {
            if (record.channel_id == channel_id && record.HasToken()) {
                return record;
            }
        }
    }
    return std::nullopt;
}

bool WebhookStore::HasChannel(dpp::snowflake channel_id) const {
    for (const auto& shard : shards_) {
        std::shared_lock<std::shared_mutex> lock(shard->mutex);
        for (const auto& [id, record] : shard->records) {
            if (record.channel_id == channel_id) return true;
        }
    }
    return false;
}

size_t WebhookStore::RemoveChannel(dpp::snowflake channel_id) {
    {
        std::lock_guard<std::mutex> lock(listings_mutex_);
        for (auto& [ticket, listing] : listings_) {
            if (listing.channel_id == channel_id) listing.channel_removed = true;
        }
    }
    size_t removed = 0;
    for (auto& shard : shards_) {
        std::unique_lock<std::shared_mutex> lock(shard->mutex);
        for (auto it = shard->records.begin(); it != shard->records.end();) {
            if (it->second.channel_id == channel_id) {
                SupersedeUnlocked(*shard, it->first);
                NoteTouched(it->first);
                it = shard->records.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    return removed;
}

size_t WebhookStore::RemoveGuild(dpp::snowflake guild_id) {
    {
        std::lock_guard<std::mutex> lock(listings_mutex_);
        for (auto& [ticket, listing] : listings_) {
            listing.removed_guilds.insert(guild_id);
        }
    }
    size_t removed = 0;
    for (auto& shard : shards_) {
        std::unique_lock<std::shared_mutex> lock(shard->mutex);
        for (auto it = shard->records.begin(); it != shard->records.end();) {
            if (it->second.guild_id == guild_id) {
                SupersedeUnlocked(*shard, it->first);
                NoteTouched(it->first);
                it = shard->records.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    return removed;
}

uint64_t WebhookStore::BeginChannelListing(dpp::snowflake channel_id) {
    std::lock_guard<std::mutex> lock(listings_mutex_);
    uint64_t ticket = next_ticket_++;
    listings_[ticket].channel_id = channel_id;
    open_listings_++;
    return ticket;
}

void WebhookStore::CancelChannelListing(uint64_t ticket) {
    std::lock_guard<std::mutex> lock(listings_mutex_);
    if (listings_.erase(ticket) > 0) {
        open_listings_--;
    }
}

void WebhookStore::ReplaceChannel(uint64_t ticket, const std::vector<WebhookRecord>& records) {
    dpp::snowflake channel_id;
    {
        std::lock_guard<std::mutex> lock(listings_mutex_);
        auto it = listings_.find(ticket);
        if (it == listings_.end()) {
            throw std::invalid_argument("unknown channel listing ticket " + std::to_string(ticket));
        }
        channel_id = it->second.channel_id;
    }

    // Listed records of the channel, bucketed by the shard they belong to.
    std::vector<std::vector<const WebhookRecord*>> listed(shards_.size());
    std::unordered_set<dpp::snowflake> listed_ids;
    std::unordered_set<dpp::snowflake> listed_guilds;
    for (const auto& record : records) {
        if (record.channel_id != channel_id) continue;
        listed[ShardIndex(record.id)].push_back(&record);
        listed_ids.insert(record.id);
        if (record.guild_id) listed_guilds.insert(*record.guild_id);
    }

    size_t kept = 0;
    size_t dropped = 0;
    bool stale = false;
    for (size_t i = 0; i < shards_.size() && !stale; ++i) {
        Shard& shard = *shards_[i];
        std::unique_lock<std::shared_mutex> shard_lock(shard.mutex);
        std::lock_guard<std::mutex> lock(listings_mutex_);
        const ChannelListing& listing = listings_.at(ticket);

        // The channel (or its guild) went away after the listing was requested.
        if (listing.channel_removed) {
            stale = true;
            break;
        }
        for (dpp::snowflake guild_id : listed_guilds) {
            if (listing.removed_guilds.count(guild_id) > 0) stale = true;
        }
        if (stale) break;

        for (auto it = shard.records.begin(); it != shard.records.end();) {
            if (it->second.channel_id == channel_id && listed_ids.count(it->first) == 0 && listing.touched.count(it->first) == 0) {
                SupersedeUnlocked(shard, it->first);
                NoteTouchedLocked(it->first, ticket);
                it = shard.records.erase(it);
                ++dropped;
            } else {
                ++it;
            }
        }
        for (const WebhookRecord* record : listed[i]) {
            if (listing.touched.count(record->id) > 0) continue;
            SupersedeUnlocked(shard, record->id);
            NoteTouchedLocked(record->id, ticket);
            shard.records[record->id] = *record;
            ++kept;
        }
    }

    CancelChannelListing(ticket);
    if (stale) {
        Logger::Log(LogLevel::Debug, "Channel " + std::to_string(channel_id) + " was evicted during listing, listing discarded");
    } else if (dropped > 0) {
        Logger::Log(LogLevel::Debug, "Channel " + std::to_string(channel_id) + ": dropped " + std::to_string(dropped) + " stale webhook(s), kept " + std::to_string(kept));
    }
}

size_t WebhookStore::Size() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        std::shared_lock<std::shared_mutex> lock(shard->mutex);
        total += shard->records.size();
    }
    return total;
}

StoreStats WebhookStore::Stats() const {
    StoreStats stats;
    stats.hits = hits_.load();
    stats.misses = misses_.load();
    stats.fetches = fetches_.load();
    stats.fetch_failures = fetch_failures_.load();
    stats.update_misses = update_misses_.load();
    return stats;
}

}
