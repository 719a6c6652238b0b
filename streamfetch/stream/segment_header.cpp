#include "segment_header.hpp"
#include "../http/common/errors.hpp"
#include "../util/logger.hpp"

#include <charconv>

namespace streamfetch::stream {

    namespace {
        constexpr std::string_view line_separator = "\r\n";

        bool is_digit(char c) {
            return c >= '0' && c <= '9';
        }
    }

    std::optional<std::uint64_t> find_segment_count(std::string_view line) {
        auto position = line.find(segment_count_marker);
        while (position != std::string_view::npos) {
            auto digits = line.substr(position + segment_count_marker.size());
            size_t length = 0;
            while (length < digits.size() && is_digit(digits[length])) {
                ++length;
            }

            if (length > 0) {
                std::uint64_t value = 0;
                auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + length, value);
                if (ec == std::errc()) {
                    return value;
                }
            }

            position = line.find(segment_count_marker, position + 1);
        }
        return std::nullopt;
    }

    std::uint64_t parse_segment_count(std::string_view segment_data) {
        size_t start = 0;
        while (start <= segment_data.size()) {
            auto end = segment_data.find(line_separator, start);
            auto line = segment_data.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);

            if (auto count = find_segment_count(line)) {
                LOG_DEBUG("segment count: {}", *count);
                return *count;
            }

            if (end == std::string_view::npos) {
                break;
            }
            start = end + line_separator.size();
        }

        LOG_ERROR("no '{}' marker in {} bytes of segment 0", segment_count_marker, segment_data.size());
        throw segment_header_not_found();
    }

}
