#pragma once

#include <string>
#include <map>
#include <list>
#include <utility>
#include <cstdint>
#include <core/constants.hpp>
#include "content_block.hpp"

struct CacheStats {
    size_t entries = 0;
    size_t capacity = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
};

// Bounded LRU map (fingerprint, width) -> RenderedContent.
class RenderCache {
public:
    explicit RenderCache(size_t capacity = DEFAULT_CACHE_SIZE);

    // Hit marks the entry most recently used. Pointer is valid until the
    // next mutating call.
    const RenderedContent* get(uint64_t fingerprint, size_t width);

    // As above, but an entry rendered under another format counts as a miss.
    const RenderedContent* get(uint64_t fingerprint, size_t width, const std::string& format_id);

    void put(uint64_t fingerprint, size_t width, const std::string& format_id,
             RenderedContent content);

    // Drop every width rendered for this fingerprint.
    void invalidate(uint64_t fingerprint);

    // Drops every entry and resets the hit/miss counters.
    void clear();

    CacheStats stats() const;
    size_t size() const { return entries_.size(); }
    size_t capacity() const { return capacity_; }
    bool contains(uint64_t fingerprint, size_t width) const {
        return entries_.count({fingerprint, width}) > 0;
    }

private:
    using Key = std::pair<uint64_t, size_t>;

    struct Entry {
        RenderedContent content;
        std::string format_id;
        std::list<Key>::iterator lru_pos;
    };

    size_t capacity_;
    std::map<Key, Entry> entries_;
    std::list<Key> lru_;                    // front = least recently used
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;

    void touch(Entry& entry);
};
