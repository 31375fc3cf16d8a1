#pragma once
#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <stdexcept>
#include <vector>
#include "interfaces/IWebhookFetcher.hpp"
#include "interfaces/IWebhookSender.hpp"
#include "core/Errors.hpp"

namespace HookCache {

inline WebhookRecord MakeRecord(uint64_t id, const std::string& name, uint64_t channel_id = 100,
                                std::optional<std::string> token = std::nullopt,
                                std::optional<uint64_t> guild_id = 10) {
    WebhookRecord r;
    r.id = dpp::snowflake(id);
    r.channel_id = dpp::snowflake(channel_id);
    if (guild_id) r.guild_id = dpp::snowflake(*guild_id);
    r.name = name;
    r.token = std::move(token);
    return r;
}

class MockFetcher : public IWebhookFetcher {
public:
    std::map<uint64_t, WebhookRecord> records;
    std::string error; // non-empty: every fetch throws this
    std::atomic<int> call_count{0};

    // When gated, Fetch blocks until Release() is called.
    bool gated = false;

    WebhookRecord Fetch(dpp::snowflake id) override {
        call_count++;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            entered_++;
            cv_.notify_all();
            cv_.wait(lock, [this] { return !gated || released_; });
        }
        if (!error.empty()) throw std::runtime_error(error);
        auto it = records.find(static_cast<uint64_t>(id));
        if (it == records.end()) throw std::runtime_error("Unknown Webhook");
        return it->second;
    }

    void WaitUntilEntered(int n = 1) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this, n] { return entered_ >= n; });
    }

    void Release() {
        std::lock_guard<std::mutex> lock(mutex_);
        released_ = true;
        cv_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    int entered_ = 0;
    bool released_ = false;
};

class MockDirectory : public IWebhookDirectory {
public:
    std::vector<WebhookRecord> listing;
    std::string error;
    uint64_t next_id = 9000;
    std::atomic<int> list_calls{0};
    std::atomic<int> create_calls{0};

    // When gated, ListChannel takes its snapshot and then blocks until Release() is called.
    bool gated = false;

    std::vector<WebhookRecord> ListChannel(dpp::snowflake channel_id) override {
        list_calls++;
        if (!error.empty()) throw std::runtime_error(error);
        std::vector<WebhookRecord> out;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            for (const auto& r : listing) {
                if (r.channel_id == channel_id) out.push_back(r);
            }
            entered_++;
            cv_.notify_all();
            cv_.wait(lock, [this] { return !gated || released_; });
        }
        return out;
    }

    void WaitUntilEntered() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return entered_ > 0; });
    }

    void Release() {
        std::lock_guard<std::mutex> lock(mutex_);
        released_ = true;
        cv_.notify_all();
    }

    WebhookRecord Create(dpp::snowflake channel_id, const std::string& name) override {
        create_calls++;
        if (!error.empty()) throw std::runtime_error(error);
        std::lock_guard<std::mutex> lock(mutex_);
        auto created = MakeRecord(next_id++, name, static_cast<uint64_t>(channel_id), std::string("created-token"));
        listing.push_back(created);
        return created;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    int entered_ = 0;
    bool released_ = false;
};

class MockSender : public IWebhookSender {
public:
    struct Call {
        dpp::snowflake id;
        std::string token;
        WebhookMessage message;
    };

    std::vector<Call> calls;
    long fail_status = 0; // non-zero: throw HttpError with this status

    ExecuteOutcome Send(dpp::snowflake id, const std::string& token, const WebhookMessage& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        calls.push_back({id, token, message});
        if (fail_status != 0) throw HttpError(fail_status, "You are being rate limited.", 1.5);
        ExecuteOutcome outcome;
        outcome.status_code = 200;
        outcome.message_id = dpp::snowflake(5000 + calls.size());
        return outcome;
    }

    size_t CallCount() {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls.size();
    }

private:
    std::mutex mutex_;
};

} // namespace HookCache
