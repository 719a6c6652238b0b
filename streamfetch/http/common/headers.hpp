#ifndef STREAMFETCH_HTTP_HEADERS_HPP
#define STREAMFETCH_HTTP_HEADERS_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace streamfetch::http {

    namespace header {
        constexpr std::string_view accept_language  = "Accept-Language";
        constexpr std::string_view connection       = "Connection";
        constexpr std::string_view content_length   = "Content-Length";
        constexpr std::string_view content_range    = "Content-Range";
        constexpr std::string_view content_type     = "Content-Type";
        constexpr std::string_view host             = "Host";
        constexpr std::string_view location         = "Location";
        constexpr std::string_view range            = "Range";
        constexpr std::string_view transfer_encoding = "Transfer-Encoding";
        constexpr std::string_view user_agent       = "User-Agent";
    }

    class headers {
    public:
        using http_header = std::pair<std::string, std::string>;

        headers() = default;
        virtual ~headers() = default;

        // parse-time header processing (tracks framing related headers)
        void process_header(std::string key, std::string value);

        void add_header(std::string key, std::string value);
        void set_header(std::string key, std::string value);
        bool remove_header(std::string_view key);

        bool has_header(std::string_view key) const;

        // returns an empty string if the header is not present
        const std::string& get_header(std::string_view key) const;

        // returns the header value or throws header_not_found
        const std::string& require_header(std::string_view key) const;

        const std::vector<http_header>& get_headers() const;
        std::vector<http_header>& get_headers();

        // all headers with lowercase keys (last value wins on duplicates)
        std::map<std::string, std::string> lowercase_headers() const;

        // framing information
        std::optional<std::uint64_t> get_content_length() const;
        bool chunked() const;

        void set_http_version_major(uint8_t http_version_major);
        void set_http_version_minor(uint8_t http_version_minor);
        int get_http_version_major() const;
        int get_http_version_minor() const;

        virtual void log(const char* scope) const;

    protected:
        static bool is_header(std::string_view key, std::string_view header);

        std::vector<http_header> headers_;
        std::optional<std::uint64_t> content_length_;
        bool chunked_ = false;
        uint8_t http_version_major_ = 1;
        uint8_t http_version_minor_ = 1;
    };

}

#endif
