#include "range_window.hpp"
#include "../http/common/errors.hpp"
#include "../util/logger.hpp"

#include <algorithm>
#include <charconv>

namespace streamfetch::stream {

    std::string range_window::to_header() const {
        return "bytes=" + std::to_string(start) + "-" + std::to_string(stop);
    }

    range_window next_window(std::uint64_t downloaded, std::uint64_t total_size, std::uint64_t window_size) {
        return range_window{downloaded, std::min(downloaded + window_size, total_size) - 1};
    }

    std::optional<std::uint64_t> parse_range_total(std::string_view content_range) {
        auto slash = content_range.rfind('/');
        if (slash == std::string_view::npos) {
            return std::nullopt;
        }

        auto total = content_range.substr(slash + 1);
        while (!total.empty() && (total.back() == ' ' || total.back() == '\t')) {
            total.remove_suffix(1);
        }
        if (total.empty()) {
            return std::nullopt;
        }

        std::uint64_t value = 0;
        auto [ptr, ec] = std::from_chars(total.data(), total.data() + total.size(), value);
        if (ec != std::errc() || ptr != total.data() + total.size()) {
            return std::nullopt;
        }
        return value;
    }

    std::optional<std::uint64_t> find_range_total(const http::headers& headers) {
        std::string value;
        try {
            value = headers.require_header(http::header::content_range);
        } catch (const header_not_found& e) {
            LOG_WARNING("response has no {} header", e.name());
            return std::nullopt;
        }
        auto total = parse_range_total(value);
        if (!total) {
            LOG_WARNING("cannot read total size from Content-Range: '{}'", value);
        }
        return total;
    }

}
