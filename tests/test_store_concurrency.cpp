#include <catch2/catch_all.hpp>
#include <future>
#include <thread>
#include <vector>
#include "cache/WebhookStore.hpp"
#include "core/WebhookEventRouter.hpp"
#include "mock_webhook_clients.hpp"

using namespace HookCache;

namespace {

// Starts `n` GetOrFetch calls for `id` on their own threads.
std::vector<std::future<WebhookRecord>> LaunchFetches(WebhookStore& store, MockFetcher& fetcher, uint64_t id, int n) {
    std::vector<std::future<WebhookRecord>> results;
    for (int i = 0; i < n; ++i) {
        results.push_back(std::async(std::launch::async, [&store, &fetcher, id] {
            return store.GetOrFetch(dpp::snowflake(id), fetcher);
        }));
    }
    return results;
}

// Every caller counts a miss before it starts or joins the in-flight fetch.
void WaitForMisses(const WebhookStore& store, uint64_t n) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (store.Stats().misses < n && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

}

TEST_CASE("Concurrent GetOrFetch for one id fetches once") {
    WebhookStore store;
    MockFetcher fetcher;
    fetcher.gated = true;
    fetcher.records[1] = MakeRecord(1, "Shared", 100, std::string("T"));

    auto results = LaunchFetches(store, fetcher, 1, 8);
    fetcher.WaitUntilEntered();
    WaitForMisses(store, 8);
    fetcher.Release();

    for (auto& f : results) {
        auto record = f.get();
        CHECK(record.name == "Shared");
        CHECK(record.token == std::optional<std::string>("T"));
    }
    CHECK(fetcher.call_count == 1);
    CHECK(store.Stats().fetches == 1);
}

TEST_CASE("Concurrent GetOrFetch waiters share the failure") {
    WebhookStore store;
    MockFetcher fetcher;
    fetcher.gated = true;
    fetcher.error = "timed out";

    auto results = LaunchFetches(store, fetcher, 2, 6);
    fetcher.WaitUntilEntered();
    WaitForMisses(store, 6);
    fetcher.Release();

    for (auto& f : results) {
        CHECK_THROWS_AS(f.get(), FetchError);
    }
    CHECK(fetcher.call_count == 1);
    CHECK_FALSE(store.Get(dpp::snowflake(2)).has_value());
}

TEST_CASE("Get is not blocked by an in-flight fetch") {
    WebhookStore store(1); // same shard for every id
    MockFetcher fetcher;
    fetcher.gated = true;
    fetcher.records[1] = MakeRecord(1, "Slow");
    store.Insert(MakeRecord(2, "Ready"));

    auto pending = LaunchFetches(store, fetcher, 1, 1);
    fetcher.WaitUntilEntered();

    auto other = store.Get(dpp::snowflake(2));
    REQUIRE(other.has_value());
    CHECK(other->name == "Ready");
    CHECK_FALSE(store.Get(dpp::snowflake(1)).has_value());

    // Mutations of other ids proceed as well
    store.Insert(MakeRecord(3, "Also"));
    CHECK(store.Get(dpp::snowflake(3)).has_value());

    fetcher.Release();
    CHECK(pending[0].get().name == "Slow");
    CHECK(store.Get(dpp::snowflake(1)).has_value());
}

TEST_CASE("Fetches for different ids run independently") {
    WebhookStore store;
    MockFetcher slow;
    slow.gated = true;
    slow.records[1] = MakeRecord(1, "Slow");
    MockFetcher fast;
    fast.records[2] = MakeRecord(2, "Fast");

    auto pending = LaunchFetches(store, slow, 1, 1);
    slow.WaitUntilEntered();

    CHECK(store.GetOrFetch(dpp::snowflake(2), fast).name == "Fast");

    slow.Release();
    CHECK(pending[0].get().name == "Slow");
}

TEST_CASE("A delete during a fetch is not undone by the fetch result") {
    WebhookStore store;
    MockFetcher fetcher;
    fetcher.gated = true;
    fetcher.records[4] = MakeRecord(4, "Stale");

    auto pending = LaunchFetches(store, fetcher, 4, 1);
    fetcher.WaitUntilEntered();
    store.Apply(WebhookEvent::Deleted(dpp::snowflake(4)));
    fetcher.Release();

    // The caller still gets what it asked for, the cache keeps the delete.
    CHECK(pending[0].get().name == "Stale");
    CHECK_FALSE(store.Get(dpp::snowflake(4)).has_value());
}

TEST_CASE("A create during a fetch wins over the fetch result") {
    WebhookStore store;
    MockFetcher fetcher;
    fetcher.gated = true;
    fetcher.records[5] = MakeRecord(5, "Fetched");

    auto pending = LaunchFetches(store, fetcher, 5, 1);
    fetcher.WaitUntilEntered();
    store.Apply(WebhookEvent::Created(MakeRecord(5, "FromEvent")));
    fetcher.Release();

    pending[0].get();
    auto cached = store.Get(dpp::snowflake(5));
    REQUIRE(cached.has_value());
    CHECK(cached->name == "FromEvent");
}

TEST_CASE("Parallel events on distinct ids all land") {
    WebhookStore store(8);
    constexpr int kThreads = 8;
    constexpr int kPerThread = 200;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&store, t] {
            for (int i = 0; i < kPerThread; ++i) {
                uint64_t id = static_cast<uint64_t>(t * kPerThread + i + 1);
                store.Apply(WebhookEvent::Created(MakeRecord(id, "n")));
                WebhookPatch patch;
                patch.name = FieldPatch<std::string>::Of("m" + std::to_string(id));
                store.Apply(WebhookEvent::Updated(dpp::snowflake(id), patch));
                if (i % 2 == 0) store.Apply(WebhookEvent::Deleted(dpp::snowflake(id)));
            }
        });
    }
    for (auto& th : threads) th.join();

    CHECK(store.Size() == static_cast<size_t>(kThreads * kPerThread / 2));
    auto kept = store.Get(dpp::snowflake(2));
    REQUIRE(kept.has_value());
    CHECK(kept->name == "m2");
}

TEST_CASE("Channel deleted while its listing is in flight stays evicted") {
    WebhookStore store;
    ThreadPool pool(1);
    MockDirectory directory;
    directory.gated = true;
    WebhookEventRouter router(store, directory, pool);

    store.Insert(MakeRecord(2, "b", 100, std::string("t2")));
    directory.listing.push_back(MakeRecord(2, "b", 100, std::string("t2")));

    auto validated = std::async(std::launch::async, [&router] {
        return router.ValidateChannel(dpp::snowflake(100));
    });
    directory.WaitUntilEntered();
    router.OnChannelDelete(dpp::snowflake(100));
    directory.Release();

    CHECK(validated.get());
    CHECK_FALSE(store.Get(dpp::snowflake(2)).has_value());
    CHECK(store.Size() == 0);
}

TEST_CASE("Update applied while a listing is in flight is not reverted") {
    WebhookStore store;
    ThreadPool pool(1);
    MockDirectory directory;
    directory.gated = true;
    WebhookEventRouter router(store, directory, pool);

    store.Insert(MakeRecord(3, "c", 100, std::string("t3")));
    directory.listing.push_back(MakeRecord(3, "c", 100, std::string("t3")));

    auto validated = std::async(std::launch::async, [&router] {
        return router.ValidateChannel(dpp::snowflake(100));
    });
    directory.WaitUntilEntered();
    WebhookPatch patch;
    patch.name = FieldPatch<std::string>::Of("renamed");
    store.Apply(WebhookEvent::Updated(dpp::snowflake(3), patch));
    directory.Release();

    CHECK(validated.get());
    auto cached = store.Get(dpp::snowflake(3));
    REQUIRE(cached.has_value());
    CHECK(cached->name == "renamed");
}
