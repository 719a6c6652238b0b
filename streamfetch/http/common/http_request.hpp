#ifndef STREAMFETCH_HTTP_REQUEST_HPP
#define STREAMFETCH_HTTP_REQUEST_HPP

#include <string>
#include <string_view>
#include "headers.hpp"
#include "../util/url.hpp"

namespace streamfetch::http {

    enum class method {
        GET,
        HEAD,
        POST,
        PUT,
        DELETE,
        PATCH,
        OPTIONS
    };

    std::string_view get_method_string(method m);

    class http_request : public headers {
    public:
        http_request() = default;
        http_request(method m, const std::string& url);
        ~http_request() override = default;

        void set_method(method m);
        method get_method() const;

        // throws invalid_url if the URL cannot be split into its components
        void set_url(const std::string& url);
        const std::string& get_url() const;
        const util::url::components& get_components() const;

        const std::string& get_host() const;
        std::string get_port() const;
        bool is_secure() const;

        void set_content(std::string content);
        const std::string& get_content() const;

        // request line, headers and content as sent on the wire
        std::string to_string() const;

        void log(const char* scope) const override;

    private:
        method method_ = method::GET;
        std::string url_;
        util::url::components components_;
        std::string content_;
    };

}

#endif
