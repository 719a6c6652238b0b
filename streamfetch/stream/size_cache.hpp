#ifndef STREAMFETCH_STREAM_SIZE_CACHE_HPP
#define STREAMFETCH_STREAM_SIZE_CACHE_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>

namespace streamfetch::stream {

/**
 * Memoized resource sizes keyed by exact URL. Each size is computed at most
 * once: concurrent callers asking for the same URL wait for the first
 * computation instead of running their own. Failed computations are not
 * stored.
 */
class size_cache {
public:
    enum class kind {
        content_length,     // single HEAD request
        segmented           // segment 0 plus one HEAD per segment
    };

    size_cache() = default;

    size_cache(const size_cache&) = delete;
    size_cache& operator=(const size_cache&) = delete;

    /**
     * Return the stored size or compute and store it. The compute function
     * runs with the URL entry locked, other URLs are not blocked.
     */
    std::uint64_t get_or_compute(kind k, const std::string& url,
                                 const std::function<std::uint64_t()>& compute);

    std::optional<std::uint64_t> find(kind k, const std::string& url) const;

    // number of stored sizes
    size_t size() const;

    // forget all stored sizes
    void clear();

private:
    struct entry {
        std::mutex mutex;
        std::optional<std::uint64_t> value;
    };

    using key = std::pair<kind, std::string>;

    std::shared_ptr<entry> get_entry(const key& k);

    mutable std::shared_mutex mutex_;
    std::map<key, std::shared_ptr<entry>> entries_;
};

}

#endif
