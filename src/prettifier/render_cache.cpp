#include "render_cache.hpp"
#include <core/log.hpp>

RenderCache::RenderCache(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

const RenderedContent* RenderCache::get(uint64_t fingerprint, size_t width) {
    auto it = entries_.find({fingerprint, width});
    if (it == entries_.end()) {
        misses_++;
        return nullptr;
    }
    hits_++;
    touch(it->second);
    return &it->second.content;
}

const RenderedContent* RenderCache::get(uint64_t fingerprint, size_t width,
                                        const std::string& format_id) {
    auto it = entries_.find({fingerprint, width});
    if (it == entries_.end() || it->second.format_id != format_id) {
        misses_++;
        return nullptr;
    }
    hits_++;
    touch(it->second);
    return &it->second.content;
}

void RenderCache::put(uint64_t fingerprint, size_t width, const std::string& format_id,
                      RenderedContent content) {
    Key key{fingerprint, width};
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        it->second.content = std::move(content);
        it->second.format_id = format_id;
        touch(it->second);
        return;
    }

    while (entries_.size() >= capacity_ && !lru_.empty()) {
        Key oldest = lru_.front();
        lru_.pop_front();
        entries_.erase(oldest);
        prettify_log(fmt::format("cache: evicted fp={:016x} width={}", oldest.first, oldest.second));
    }

    lru_.push_back(key);
    Entry entry{std::move(content), format_id, std::prev(lru_.end())};
    entries_.emplace(key, std::move(entry));
}

void RenderCache::invalidate(uint64_t fingerprint) {
    auto it = entries_.lower_bound({fingerprint, 0});
    while (it != entries_.end() && it->first.first == fingerprint) {
        lru_.erase(it->second.lru_pos);
        it = entries_.erase(it);
    }
}

void RenderCache::clear() {
    entries_.clear();
    lru_.clear();
    hits_ = 0;
    misses_ = 0;
}

CacheStats RenderCache::stats() const {
    return {entries_.size(), capacity_, hits_, misses_};
}

void RenderCache::touch(Entry& entry) {
    lru_.splice(lru_.end(), lru_, entry.lru_pos);
}
