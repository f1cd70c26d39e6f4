#include "catalog.hpp"
#include <iostream>
#include <exception>

namespace catalog {

CatalogCache::CatalogCache(std::size_t max_entries, uint64_t max_bytes)
    : max_entries_(max_entries), max_bytes_(max_bytes) {}

BytesPtr CatalogCache::get(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(id);
    if (it == index_.end()) {
        ++stats_.misses;
        return nullptr;
    }
    lru_.splice(lru_.begin(), lru_, it->second);
    ++stats_.hits;
    return it->second->bytes;
}

BytesPtr CatalogCache::put(const std::string& id, Bytes bytes) {
    auto value = std::make_shared<const Bytes>(std::move(bytes));

    std::lock_guard<std::mutex> lock(mutex_);
    auto existing = index_.find(id);
    if (existing != index_.end()) {
        stats_.bytes -= existing->second->bytes->size();
        lru_.erase(existing->second);
        index_.erase(existing);
    }

    if (value->size() > max_bytes_ || max_entries_ == 0) {
        std::cerr << "[Catalog] Thumbnail for " << id << " exceeds cache limits, not cached\n";
        stats_.entries = lru_.size();
        return value;
    }

    lru_.push_front(Entry{id, value});
    index_[id] = lru_.begin();
    stats_.bytes += value->size();
    ++stats_.insertions;

    evict_locked();
    stats_.entries = lru_.size();
    return value;
}

void CatalogCache::evict_locked() {
    while (!lru_.empty() && (lru_.size() > max_entries_ || stats_.bytes > max_bytes_)) {
        const Entry& victim = lru_.back();
        stats_.bytes -= victim.bytes->size();
        index_.erase(victim.id);
        lru_.pop_back();
        ++stats_.evictions;
    }
}

bool CatalogCache::invalidate(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(id);
    if (it == index_.end()) return false;

    stats_.bytes -= it->second->bytes->size();
    lru_.erase(it->second);
    index_.erase(it);
    stats_.entries = lru_.size();
    return true;
}

void CatalogCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lru_.clear();
    index_.clear();
    stats_.bytes = 0;
    stats_.entries = 0;
}

bool CatalogCache::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.count(id) > 0;
}

CacheStats CatalogCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

// ─── ThumbnailProvider ──────────────────────────────────────────────────────

ThumbnailProvider::ThumbnailProvider(CatalogCache& cache, assets::AssetStore& store)
    : cache_(cache), store_(store) {}

BytesPtr ThumbnailProvider::get(const std::string& id) {
    if (auto cached = cache_.get(id)) {
        return cached;
    }

    std::promise<BytesPtr> promise;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it != pending_.end()) {
            std::shared_future<BytesPtr> generation = it->second;
            lock.unlock();
            return generation.get();
        }
        // Another caller may have finished between our lookup and the lock
        if (cache_.contains(id)) {
            if (auto cached = cache_.get(id)) {
                return cached;
            }
        }
        pending_.emplace(id, promise.get_future().share());
    }

    BytesPtr result;
    try {
        auto generated = store_.make_thumbnail(id);
        if (generated) {
            result = cache_.put(id, std::move(*generated));
        }
        promise.set_value(result);
    } catch (std::exception&) {
        promise.set_exception(std::current_exception());
        finish(id);
        throw;
    }
    finish(id);
    return result;
}

void ThumbnailProvider::finish(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.erase(id);
}

} // namespace catalog
