#pragma once

#include <string>
#include <cstdint>
#include <future>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>
#include "asset_store.hpp"

namespace catalog {

using Bytes = std::vector<uint8_t>;
using BytesPtr = std::shared_ptr<const Bytes>;

constexpr std::size_t DEFAULT_MAX_ENTRIES = 500;
constexpr uint64_t DEFAULT_MAX_BYTES = 50ull * 1024 * 1024;

struct CacheStats {
    std::size_t entries = 0;
    uint64_t bytes = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t insertions = 0;
    uint64_t evictions = 0;
};

// LRU cache of encoded thumbnails keyed by asset id, bounded by both entry
// count and total bytes. Thread-safe.
class CatalogCache {
public:
    explicit CatalogCache(std::size_t max_entries = DEFAULT_MAX_ENTRIES,
                          uint64_t max_bytes = DEFAULT_MAX_BYTES);

    // nullptr on miss. A hit becomes the most recently used entry.
    BytesPtr get(const std::string& id);

    // Inserts or replaces, then evicts least recently used entries until both
    // limits hold. A value larger than max_bytes on its own is not cached.
    BytesPtr put(const std::string& id, Bytes bytes);

    bool invalidate(const std::string& id);
    void clear();

    bool contains(const std::string& id) const;
    CacheStats stats() const;

    std::size_t max_entries() const { return max_entries_; }
    uint64_t max_bytes() const { return max_bytes_; }

private:
    struct Entry {
        std::string id;
        BytesPtr bytes;
    };

    const std::size_t max_entries_;
    const uint64_t max_bytes_;

    mutable std::mutex mutex_;
    std::list<Entry> lru_; // front is most recently used
    std::unordered_map<std::string, std::list<Entry>::iterator> index_;
    CacheStats stats_;

    void evict_locked();
};

// Cache in front of the store's thumbnail generator. Concurrent misses for
// the same id share one generation: the first caller runs it, the others
// wait for its result (or its exception).
class ThumbnailProvider {
public:
    ThumbnailProvider(CatalogCache& cache, assets::AssetStore& store);

    // nullptr when the store has no thumbnail for `id`.
    // Propagates assets::AssetStoreError.
    BytesPtr get(const std::string& id);

private:
    CatalogCache& cache_;
    assets::AssetStore& store_;

    std::mutex mutex_;
    std::map<std::string, std::shared_future<BytesPtr>> pending_;

    void finish(const std::string& id);
};

} // namespace catalog
