#ifndef STREAMFETCH_STREAM_ENDPOINT_HPP
#define STREAMFETCH_STREAM_ENDPOINT_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../http/util/url.hpp"

namespace streamfetch::stream {

    /**
     * Immutable (base, query parameters) view of a URL. The base keeps scheme,
     * authority and path untouched; parameters keep their order, duplicates,
     * empty values and keys written without '='.
     */
    class endpoint {
    public:
        // throws invalid_url if the URL is not an absolute http(s) URL
        explicit endpoint(const std::string& url);

        const std::string& base() const { return base_; }
        const http::util::url::query_parameters& parameters() const { return parameters_; }

        // first value of a parameter
        std::optional<std::string> parameter(std::string_view name) const;

        /**
         * Copy with the parameter set to value: the first occurrence is replaced
         * in place and later duplicates are dropped, a missing parameter is
         * appended.
         */
        endpoint with_parameter(std::string_view name, const std::string& value) const;

        // copy addressing the given segment
        endpoint with_sequence(std::uint64_t sequence_number) const;

        std::string to_url() const;

    private:
        endpoint() = default;

        std::string base_;
        http::util::url::query_parameters parameters_;
        // parallel to parameters_, true for keys written without '='
        std::vector<bool> bare_;
    };

}

#endif
