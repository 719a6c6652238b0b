#include "http_request.hpp"
#include "errors.hpp"
#include "../../util/logger.hpp"

namespace streamfetch::http{

    namespace misc_strings {
        constexpr std::string_view name_value_separator = ": ";
        constexpr std::string_view crlf = "\r\n";
        constexpr std::string_view http_version = " HTTP/1.1";
    }

    std::string_view get_method_string(method m){
        switch(m){
            case method::GET:
                return "GET";
            case method::HEAD:
                return "HEAD";
            case method::POST:
                return "POST";
            case method::PUT:
                return "PUT";
            case method::DELETE:
                return "DELETE";
            case method::PATCH:
                return "PATCH";
            case method::OPTIONS:
                return "OPTIONS";
        }
        return "GET";
    }

    http_request::http_request(method m, const std::string& url) : method_(m){
        set_url(url);
    }

    void http_request::set_method(method m){
        method_ = m;
    }

    method http_request::get_method() const{
        return method_;
    }

    void http_request::set_url(const std::string& url){
        auto components = util::url::split(url);
        if(!components){
            throw invalid_url(url);
        }
        url_ = url;
        components_ = std::move(*components);
    }

    const std::string& http_request::get_url() const{
        return url_;
    }

    const util::url::components& http_request::get_components() const{
        return components_;
    }

    const std::string& http_request::get_host() const{
        return components_.host;
    }

    std::string http_request::get_port() const{
        return components_.effective_port();
    }

    bool http_request::is_secure() const{
        return components_.secure();
    }

    void http_request::set_content(std::string content){
        content_ = std::move(content);
    }

    const std::string& http_request::get_content() const{
        return content_;
    }

    std::string http_request::to_string() const{
        std::string out;
        out.reserve(256 + content_.size());
        out += get_method_string(method_);
        out += ' ';
        out += components_.target();
        out += misc_strings::http_version;
        out += misc_strings::crlf;
        for(const auto& [key, value] : headers_){
            out += key;
            out += misc_strings::name_value_separator;
            out += value;
            out += misc_strings::crlf;
        }
        out += misc_strings::crlf;
        out += content_;
        return out;
    }

    void http_request::log(const char* scope) const{
        LOG_DEBUG("[{}] {} {}", scope, get_method_string(method_), url_);
        headers::log(scope);
    }

}
