#include "size_cache.hpp"
#include "../util/logger.hpp"

#include <vector>

namespace streamfetch::stream {

std::shared_ptr<size_cache::entry> size_cache::get_entry(const key& k) {
    // First try with shared lock for reading
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(k);
        if (it != entries_.end()) {
            return it->second;
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& slot = entries_[k];
    if (!slot) {
        slot = std::make_shared<entry>();
    }
    return slot;
}

std::uint64_t size_cache::get_or_compute(kind k, const std::string& url,
                                         const std::function<std::uint64_t()>& compute) {
    auto item = get_entry(key{k, url});

    std::lock_guard<std::mutex> lock(item->mutex);
    if (item->value) {
        LOG_TRACE("size cache hit for {}: {}", url, *item->value);
        return *item->value;
    }

    item->value = compute();
    return *item->value;
}

std::optional<std::uint64_t> size_cache::find(kind k, const std::string& url) const {
    std::shared_ptr<entry> item;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(key{k, url});
        if (it == entries_.end()) {
            return std::nullopt;
        }
        item = it->second;
    }

    std::lock_guard<std::mutex> lock(item->mutex);
    return item->value;
}

size_t size_cache::size() const {
    std::vector<std::shared_ptr<entry>> items;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        items.reserve(entries_.size());
        for (const auto& [k, item] : entries_) {
            items.push_back(item);
        }
    }

    // entries being computed are locked, wait for them outside the table lock
    size_t stored = 0;
    for (const auto& item : items) {
        std::lock_guard<std::mutex> lock(item->mutex);
        if (item->value) {
            ++stored;
        }
    }
    return stored;
}

void size_cache::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_.clear();
}

}
