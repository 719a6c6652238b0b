#include "endpoint.hpp"
#include "stream_types.hpp"
#include "../http/common/errors.hpp"

#include <algorithm>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>

namespace streamfetch::stream {

    endpoint::endpoint(const std::string& url) {
        if (!http::util::url::is_http_url(url)) {
            throw invalid_url(url);
        }

        auto components = http::util::url::split(url);
        if (!components) {
            throw invalid_url(url);
        }

        // keep the original spelling of scheme, authority and path
        auto base_end = url.find_first_of("?#");
        base_ = url.substr(0, base_end);
        if (components->query.empty()) {
            return;
        }

        std::vector<std::string> pairs;
        boost::algorithm::split(pairs, components->query, boost::algorithm::is_any_of("&"));
        for (const auto& pair : pairs) {
            auto parsed = http::util::url::parse_query(pair);
            if (parsed.empty()) {
                continue;
            }
            parameters_.push_back(std::move(parsed.front()));
            bare_.push_back(pair.find('=') == std::string::npos);
        }
    }

    std::optional<std::string> endpoint::parameter(std::string_view name) const {
        for (const auto& [key, value] : parameters_) {
            if (key == name) {
                return value;
            }
        }
        return std::nullopt;
    }

    endpoint endpoint::with_parameter(std::string_view name, const std::string& value) const {
        endpoint result;
        result.base_ = base_;
        result.parameters_.reserve(parameters_.size() + 1);
        result.bare_.reserve(parameters_.size() + 1);

        bool replaced = false;
        for (size_t i = 0; i < parameters_.size(); ++i) {
            const auto& parameter = parameters_[i];
            if (parameter.first != name) {
                result.parameters_.push_back(parameter);
                result.bare_.push_back(bare_[i]);
            } else if (!replaced) {
                result.parameters_.emplace_back(parameter.first, value);
                result.bare_.push_back(false);
                replaced = true;
            }
        }

        if (!replaced) {
            result.parameters_.emplace_back(std::string(name), value);
            result.bare_.push_back(false);
        }
        return result;
    }

    endpoint endpoint::with_sequence(std::uint64_t sequence_number) const {
        return with_parameter(sequence_parameter, std::to_string(sequence_number));
    }

    std::string endpoint::to_url() const {
        if (parameters_.empty()) {
            return base_;
        }
        std::string query;
        for (size_t i = 0; i < parameters_.size(); ++i) {
            const auto& [key, value] = parameters_[i];
            if (i > 0) query += '&';
            query += http::util::url::url_encode(key);
            if (!bare_[i] || !value.empty()) {
                query += '=';
                query += http::util::url::url_encode(value);
            }
        }
        return base_ + "?" + query;
    }

}
