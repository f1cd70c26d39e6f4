#include "test_util.hpp"
#include "catalog.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <map>
#include <string>
#include <thread>
#include <vector>

using namespace catalog;

namespace {

// Counts thumbnail generation calls; everything else is inert.
class CountingStore : public assets::AssetStore {
public:
    std::map<std::string, std::vector<uint8_t>> thumbnails;
    std::atomic<int> generate_calls{0};
    std::atomic<bool> fail{false};
    std::chrono::milliseconds delay{0};

    std::vector<assets::AssetRecord> list_assets() override { return {}; }
    std::optional<assets::AssetRecord> find(const std::string&) override { return std::nullopt; }
    std::optional<uint64_t> size_of(const std::string&) override { return std::nullopt; }

    std::optional<std::vector<uint8_t>> make_thumbnail(const std::string& id) override {
        ++generate_calls;
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        if (fail) throw assets::AssetStoreError("disk gone");
        auto it = thumbnails.find(id);
        if (it == thumbnails.end()) return std::nullopt;
        return it->second;
    }

    std::unique_ptr<transfer::PayloadSource> open_original(const std::string&, assets::Component) override {
        return nullptr;
    }
};

Bytes bytes_of(std::size_t n, uint8_t fill = 0xAB) {
    return Bytes(n, fill);
}

} // namespace

static void test_entry_limit() {
    std::fprintf(stderr, "-- test_entry_limit\n");

    CatalogCache cache(3, 1024 * 1024);
    cache.put("a", bytes_of(10));
    cache.put("b", bytes_of(10));
    cache.put("c", bytes_of(10));

    // Touch "a" so "b" is the least recently used
    CHECK(cache.get("a") != nullptr);
    cache.put("d", bytes_of(10));

    CHECK(cache.contains("a"));
    CHECK(!cache.contains("b"));
    CHECK(cache.contains("c"));
    CHECK(cache.contains("d"));

    CacheStats stats = cache.stats();
    CHECK_EQ(stats.entries, 3u);
    CHECK_EQ(stats.bytes, 30u);
    CHECK_EQ(stats.evictions, 1u);
    CHECK_EQ(stats.insertions, 4u);
}

static void test_byte_limit() {
    std::fprintf(stderr, "-- test_byte_limit\n");

    CatalogCache cache(100, 1000);
    cache.put("a", bytes_of(400));
    cache.put("b", bytes_of(400));
    cache.put("c", bytes_of(400)); // 1200 > 1000: evicts "a"

    CHECK(!cache.contains("a"));
    CHECK(cache.contains("b"));
    CHECK(cache.contains("c"));
    CHECK_EQ(cache.stats().bytes, 800u);

    // A single value over the byte ceiling is returned but not kept
    BytesPtr huge = cache.put("huge", bytes_of(2000));
    CHECK(huge != nullptr);
    CHECK_EQ(huge->size(), 2000u);
    CHECK(!cache.contains("huge"));
    CHECK(cache.contains("b"));
}

static void test_replace_and_invalidate() {
    std::fprintf(stderr, "-- test_replace_and_invalidate\n");

    CatalogCache cache(10, 1000);
    cache.put("a", bytes_of(100, 1));
    cache.put("a", bytes_of(50, 2));
    CHECK_EQ(cache.stats().entries, 1u);
    CHECK_EQ(cache.stats().bytes, 50u);
    CHECK_EQ((*cache.get("a"))[0], 2);

    CHECK(cache.invalidate("a"));
    CHECK(!cache.invalidate("a"));
    CHECK(cache.get("a") == nullptr);
    CHECK_EQ(cache.stats().bytes, 0u);

    cache.put("x", bytes_of(10));
    cache.put("y", bytes_of(10));
    cache.clear();
    CHECK_EQ(cache.stats().entries, 0u);
    CHECK_EQ(cache.stats().bytes, 0u);
    CHECK(!cache.contains("x"));
}

static void test_hit_miss_counters() {
    std::fprintf(stderr, "-- test_hit_miss_counters\n");

    CatalogCache cache;
    CHECK_EQ(cache.max_entries(), 500u);
    CHECK_EQ(cache.max_bytes(), 50ull * 1024 * 1024);

    CHECK(cache.get("nope") == nullptr);
    cache.put("yes", bytes_of(1));
    CHECK(cache.get("yes") != nullptr);
    CHECK(cache.get("yes") != nullptr);

    CacheStats stats = cache.stats();
    CHECK_EQ(stats.misses, 1u);
    CHECK_EQ(stats.hits, 2u);
}

static void test_provider_generates_once() {
    std::fprintf(stderr, "-- test_provider_generates_once\n");

    CatalogCache cache;
    CountingStore store;
    store.thumbnails["id-1"] = bytes_of(64, 7);
    ThumbnailProvider provider(cache, store);

    BytesPtr first = provider.get("id-1");
    CHECK(first != nullptr);
    CHECK_EQ(store.generate_calls.load(), 1);
    CHECK_EQ(cache.stats().insertions, 1u);

    BytesPtr second = provider.get("id-1");
    CHECK(second != nullptr);
    CHECK(*second == *first);
    CHECK_EQ(store.generate_calls.load(), 1);
    CHECK_EQ(cache.stats().insertions, 1u);
}

static void test_provider_not_found() {
    std::fprintf(stderr, "-- test_provider_not_found\n");

    CatalogCache cache;
    CountingStore store;
    ThumbnailProvider provider(cache, store);

    CHECK(provider.get("ghost") == nullptr);
    CHECK_EQ(store.generate_calls.load(), 1);
    CHECK_EQ(cache.stats().insertions, 0u);
    CHECK(!cache.contains("ghost"));

    store.fail = true;
    bool threw = false;
    try {
        provider.get("ghost");
    } catch (assets::AssetStoreError&) {
        threw = true;
    }
    CHECK(threw);
}

static void test_provider_concurrent_misses() {
    std::fprintf(stderr, "-- test_provider_concurrent_misses\n");

    CatalogCache cache;
    CountingStore store;
    store.thumbnails["id-1"] = bytes_of(64, 7);
    store.delay = std::chrono::milliseconds(200);
    ThumbnailProvider provider(cache, store);

    BytesPtr results[3];
    std::vector<std::thread> threads;
    for (int i = 0; i < 3; ++i) {
        threads.emplace_back([&provider, &results, i]() { results[i] = provider.get("id-1"); });
    }
    for (auto& t : threads) t.join();

    CHECK_EQ(store.generate_calls.load(), 1);
    CHECK_EQ(cache.stats().insertions, 1u);
    for (const auto& r : results) {
        CHECK(r != nullptr);
        CHECK(r == results[0]);
    }
}

static void test_provider_concurrent_failure() {
    std::fprintf(stderr, "-- test_provider_concurrent_failure\n");

    CatalogCache cache;
    CountingStore store;
    store.fail = true;
    store.delay = std::chrono::milliseconds(200);
    ThumbnailProvider provider(cache, store);

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 2; ++i) {
        threads.emplace_back([&provider, &failures]() {
            try {
                provider.get("id-1");
            } catch (assets::AssetStoreError&) {
                ++failures;
            }
        });
    }
    for (auto& t : threads) t.join();

    CHECK_EQ(failures.load(), 2);
    CHECK_EQ(store.generate_calls.load(), 1);

    // A failed generation is not remembered
    store.fail = false;
    store.delay = std::chrono::milliseconds(0);
    store.thumbnails["id-1"] = bytes_of(16, 1);
    CHECK(provider.get("id-1") != nullptr);
    CHECK_EQ(store.generate_calls.load(), 2);
}

int main() {
    test_entry_limit();
    test_byte_limit();
    test_replace_and_invalidate();
    test_hit_miss_counters();
    test_provider_generates_once();
    test_provider_not_found();
    test_provider_concurrent_misses();
    test_provider_concurrent_failure();
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
