#include "response_parser.hpp"
#include "../common/http_response.hpp"

#include <algorithm>
#include <boost/algorithm/string/trim.hpp>

namespace streamfetch::http {

    void response_parser::reset(http_response& response) {
        resp_ = &response;
        name_.clear();
        value_.clear();
        status_code_ = 0;
        version_major_ = 0;
        version_minor_ = 0;
        headers_size_ = 0;
        state_ = http_version_h;
    }

    boost::tribool response_parser::parse(const char*& begin, const char* end) {
        while (begin != end) {
            boost::tribool result = consume(*begin++);
            if (result || !result) {
                return result;
            }
        }
        return boost::indeterminate;
    }

    boost::tribool response_parser::consume(char input) {
        if (++headers_size_ > MAX_HEADERS_SIZE) {
            return false;
        }

        int c = static_cast<unsigned char>(input);

        switch (state_) {
            case http_version_h:
                if (c == 'H') {
                    state_ = http_version_t_1;
                    return boost::indeterminate;
                }
                return false;
            case http_version_t_1:
                if (c == 'T') {
                    state_ = http_version_t_2;
                    return boost::indeterminate;
                }
                return false;
            case http_version_t_2:
                if (c == 'T') {
                    state_ = http_version_p;
                    return boost::indeterminate;
                }
                return false;
            case http_version_p:
                if (c == 'P') {
                    state_ = http_version_slash;
                    return boost::indeterminate;
                }
                return false;
            case http_version_slash:
                if (c == '/') {
                    state_ = http_version_major_start;
                    return boost::indeterminate;
                }
                return false;
            case http_version_major_start:
                if (is_digit(c)) {
                    version_major_ = c - '0';
                    state_ = http_version_major;
                    return boost::indeterminate;
                }
                return false;
            case http_version_major:
                if (c == '.') {
                    state_ = http_version_minor_start;
                    return boost::indeterminate;
                } else if (is_digit(c) && version_major_ < 10) {
                    version_major_ = version_major_ * 10 + c - '0';
                    return boost::indeterminate;
                }
                return false;
            case http_version_minor_start:
                if (is_digit(c)) {
                    version_minor_ = c - '0';
                    state_ = http_version_minor;
                    return boost::indeterminate;
                }
                return false;
            case http_version_minor:
                if (c == ' ') {
                    resp_->set_http_version_major(static_cast<uint8_t>(version_major_));
                    resp_->set_http_version_minor(static_cast<uint8_t>(version_minor_));
                    state_ = status_code;
                    return boost::indeterminate;
                } else if (is_digit(c) && version_minor_ < 10) {
                    version_minor_ = version_minor_ * 10 + c - '0';
                    return boost::indeterminate;
                }
                return false;
            case status_code:
                if (is_digit(c) && status_code_ < 100) {
                    status_code_ = status_code_ * 10 + c - '0';
                    return boost::indeterminate;
                } else if (status_code_ >= 100 && (c == ' ' || c == '\r')) {
                    resp_->set_status(static_cast<int>(status_code_));
                    state_ = c == ' ' ? reason_phrase : expecting_newline_1;
                    return boost::indeterminate;
                }
                return false;
            case reason_phrase:
                if (c == '\r') {
                    resp_->set_reason_phrase(value_);
                    value_.clear();
                    state_ = expecting_newline_1;
                    return boost::indeterminate;
                } else if (is_ctl(c) && c != '\t') {
                    return false;
                }
                value_.push_back(input);
                return boost::indeterminate;
            case expecting_newline_1:
                if (c == '\n') {
                    state_ = header_line_start;
                    return boost::indeterminate;
                }
                return false;
            case header_line_start:
                if (c == '\r') {
                    state_ = expecting_newline_3;
                    return boost::indeterminate;
                } else if (!name_.empty() && (c == ' ' || c == '\t')) {
                    // obsolete line folding, continues the previous value
                    state_ = header_lws;
                    return boost::indeterminate;
                } else if (!is_char(c) || is_ctl(c) || is_tspecial(c)) {
                    return false;
                }
                if (!name_.empty()) {
                    boost::algorithm::trim_right(value_);
                    resp_->process_header(std::move(name_), std::move(value_));
                    name_.clear();
                    value_.clear();
                }
                name_.push_back(input);
                state_ = header_name;
                return boost::indeterminate;
            case header_lws:
                if (c == '\r') {
                    state_ = expecting_newline_2;
                    return boost::indeterminate;
                } else if (c == ' ' || c == '\t') {
                    return boost::indeterminate;
                } else if (is_ctl(c)) {
                    return false;
                }
                value_.push_back(' ');
                value_.push_back(input);
                state_ = header_value;
                return boost::indeterminate;
            case header_name:
                if (c == ':') {
                    state_ = space_before_header_value;
                    return boost::indeterminate;
                } else if (!is_char(c) || is_ctl(c) || is_tspecial(c)) {
                    return false;
                }
                name_.push_back(input);
                return boost::indeterminate;
            case space_before_header_value:
                if (c == ' ' || c == '\t') {
                    return boost::indeterminate;
                } else if (c == '\r') {
                    state_ = expecting_newline_2;
                    return boost::indeterminate;
                } else if (is_ctl(c)) {
                    return false;
                }
                value_.push_back(input);
                state_ = header_value;
                return boost::indeterminate;
            case header_value:
                if (c == '\r') {
                    state_ = expecting_newline_2;
                    return boost::indeterminate;
                } else if (is_ctl(c) && c != '\t') {
                    return false;
                }
                value_.push_back(input);
                return boost::indeterminate;
            case expecting_newline_2:
                if (c == '\n') {
                    state_ = header_line_start;
                    return boost::indeterminate;
                }
                return false;
            case expecting_newline_3:
                if (c == '\n') {
                    if (!name_.empty()) {
                        boost::algorithm::trim_right(value_);
                        resp_->process_header(std::move(name_), std::move(value_));
                        name_.clear();
                        value_.clear();
                    }
                    return true;
                }
                return false;
        }
        return false;
    }

    bool response_parser::is_char(int c) {
        return c >= 0 && c <= 127;
    }

    bool response_parser::is_ctl(int c) {
        return (c >= 0 && c <= 31) || (c == 127);
    }

    bool response_parser::is_tspecial(int c) {
        switch (c) {
            case '(': case ')': case '<': case '>': case '@':
            case ',': case ';': case ':': case '\\': case '"':
            case '/': case '[': case ']': case '?': case '=':
            case '{': case '}': case ' ': case '\t':
                return true;
            default:
                return false;
        }
    }

    bool response_parser::is_digit(int c) {
        return c >= '0' && c <= '9';
    }

    void chunked_decoder::reset() {
        chunk_remaining_ = 0;
        size_digits_ = 0;
        state_ = chunk_size;
    }

    boost::tribool chunked_decoder::decode(const char*& begin, const char* end, std::string& out, size_t max_size) {
        size_t appended = 0;

        while (begin != end) {
            if (state_ == done) {
                return true;
            }

            if (state_ == chunk_data) {
                if (appended == max_size) {
                    return boost::indeterminate;
                }
                size_t available = static_cast<size_t>(end - begin);
                size_t to_copy = static_cast<size_t>(std::min<std::uint64_t>(
                    chunk_remaining_, std::min(available, max_size - appended)));
                out.append(begin, to_copy);
                begin += to_copy;
                appended += to_copy;
                chunk_remaining_ -= to_copy;
                if (chunk_remaining_ == 0) {
                    state_ = chunk_data_expecting_r;
                }
                continue;
            }

            char c = *begin++;

            switch (state_) {
                case chunk_size: {
                    int value = hex_value(c);
                    if (value >= 0) {
                        // 15 hex digits keep the size inside 64 bits
                        if (++size_digits_ > 15) return false;
                        chunk_remaining_ = (chunk_remaining_ << 4) | static_cast<std::uint64_t>(value);
                    } else if (size_digits_ > 0 && (c == ';' || c == ' ' || c == '\t')) {
                        state_ = chunk_extension;
                    } else if (size_digits_ > 0 && c == '\r') {
                        state_ = chunk_size_expecting_n;
                    } else {
                        return false;
                    }
                    break;
                }
                case chunk_extension:
                    if (c == '\r') {
                        state_ = chunk_size_expecting_n;
                    }
                    break;
                case chunk_size_expecting_n:
                    if (c != '\n') return false;
                    state_ = chunk_remaining_ == 0 ? trailer_line_start : chunk_data;
                    break;
                case chunk_data_expecting_r:
                    if (c != '\r') return false;
                    state_ = chunk_data_expecting_n;
                    break;
                case chunk_data_expecting_n:
                    if (c != '\n') return false;
                    size_digits_ = 0;
                    state_ = chunk_size;
                    break;
                case trailer_line_start:
                    state_ = c == '\r' ? final_expecting_n : trailer_line;
                    break;
                case trailer_line:
                    if (c == '\r') {
                        state_ = trailer_expecting_n;
                    }
                    break;
                case trailer_expecting_n:
                    if (c != '\n') return false;
                    state_ = trailer_line_start;
                    break;
                case final_expecting_n:
                    if (c != '\n') return false;
                    state_ = done;
                    return true;
                case chunk_data:
                case done:
                    break;
            }
        }

        if (state_ == done) {
            return true;
        }
        return boost::indeterminate;
    }

    int chunked_decoder::hex_value(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

}
