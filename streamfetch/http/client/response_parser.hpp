#ifndef STREAMFETCH_HTTP_RESPONSE_PARSER_HPP
#define STREAMFETCH_HTTP_RESPONSE_PARSER_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <boost/logic/tribool.hpp>

namespace streamfetch::http {

    class http_response;

    /// Incremental parser for the status line and headers of a response.
    class response_parser {
    public:
        /// Specify the maximum size of the response head
        static constexpr size_t MAX_HEADERS_SIZE = 8*1024;     // 8KB

        response_parser() = default;

        /// Start parsing a new response head into the given response.
        void reset(http_response& response);

        /// Parse some data. The tribool return value is true when the response
        /// head has been parsed, false if the data is invalid, indeterminate when
        /// more data is required. begin is advanced past the consumed input, so
        /// on completion it points to the first byte of the body.
        boost::tribool parse(const char*& begin, const char* end);

    private:
        /// Handle the next character of input.
        boost::tribool consume(char input);

        /// Check if a byte is an HTTP character.
        static bool is_char(int c);

        /// Check if a byte is an HTTP control character.
        static bool is_ctl(int c);

        /// Check if a byte is defined as an HTTP special character.
        static bool is_tspecial(int c);

        /// Check if a byte is a digit.
        static bool is_digit(int c);

        http_response* resp_ = nullptr;

        std::string name_;
        std::string value_;
        unsigned status_code_ = 0;
        unsigned version_major_ = 0;
        unsigned version_minor_ = 0;
        size_t headers_size_ = 0;

        /// The current state of the parser.
        enum state {
            http_version_h,
            http_version_t_1,
            http_version_t_2,
            http_version_p,
            http_version_slash,
            http_version_major_start,
            http_version_major,
            http_version_minor_start,
            http_version_minor,
            status_code,
            reason_phrase,
            expecting_newline_1,
            header_line_start,
            header_lws,
            header_name,
            space_before_header_value,
            header_value,
            expecting_newline_2,
            expecting_newline_3
        } state_ = http_version_h;
    };

    /// Incremental decoder for Transfer-Encoding: chunked bodies.
    class chunked_decoder {
    public:
        chunked_decoder() = default;

        void reset();

        /// Decode raw input into out, appending at most max_size bytes of
        /// content. Returns true once the last chunk and its trailers have
        /// been consumed, false on malformed input, indeterminate when more
        /// input (or a new call, if max_size was reached) is required.
        boost::tribool decode(const char*& begin, const char* end, std::string& out, size_t max_size);

    private:
        static int hex_value(char c);

        std::uint64_t chunk_remaining_ = 0;
        size_t size_digits_ = 0;

        enum state {
            chunk_size,
            chunk_extension,
            chunk_size_expecting_n,
            chunk_data,
            chunk_data_expecting_r,
            chunk_data_expecting_n,
            trailer_line_start,
            trailer_line,
            trailer_expecting_n,
            final_expecting_n,
            done
        } state_ = chunk_size;
    };

}

#endif
