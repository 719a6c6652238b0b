#include "headers.hpp"
#include "errors.hpp"
#include "../../util/logger.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

namespace streamfetch::http{

    void headers::process_header(std::string key, std::string value){
        if(is_header(key, header::content_length)){
            try{
                content_length_ = boost::lexical_cast<std::uint64_t>(boost::algorithm::trim_copy(value));
            }catch(const boost::bad_lexical_cast &)
            {
                LOG_WARNING("invalid Content-Length value: '{}'", value);
                content_length_.reset();
            }
        }else if(is_header(key, header::transfer_encoding)){
            // chunked must be the last applied coding
            auto coding = boost::algorithm::trim_copy(value);
            chunked_ = boost::iends_with(coding, "chunked");
        }

        headers_.emplace_back(std::move(key), std::move(value));
    }

    void headers::add_header(std::string key, std::string value){
        if(key.empty()) return;
        headers_.emplace_back(std::move(key), std::move(value));
    }

    void headers::set_header(std::string key, std::string value){
        for(auto & header : headers_)
        {
            if(is_header(header.first, key)){
                header.second = std::move(value);
                return;
            }
        }
        add_header(std::move(key), std::move(value));
    }

    bool headers::remove_header(std::string_view key)
    {
        for(auto it=headers_.begin(); it!=headers_.end(); ++it){
            if(is_header(it->first, key)){
                headers_.erase(it);
                return true;
            }
        }
        return false;
    }

    bool headers::has_header(std::string_view key) const{
        for(const auto & header : headers_)
        {
            if(is_header(header.first, key)){
                return true;
            }
        }
        return false;
    }

    const std::string& headers::get_header(std::string_view key) const
    {
        for(const auto & header : headers_)
        {
            if(is_header(header.first, key)){
                return header.second;
            }
        }
        static const std::string empty;
        return empty;
    }

    const std::string& headers::require_header(std::string_view key) const
    {
        for(const auto & header : headers_)
        {
            if(is_header(header.first, key)){
                return header.second;
            }
        }
        throw header_not_found(boost::algorithm::to_lower_copy(std::string(key)));
    }

    const std::vector<headers::http_header>& headers::get_headers() const{
        return headers_;
    }

    std::vector<headers::http_header>& headers::get_headers(){
        return headers_;
    }

    std::map<std::string, std::string> headers::lowercase_headers() const{
        std::map<std::string, std::string> result;
        for(const auto& [key, value] : headers_){
            result[boost::algorithm::to_lower_copy(key)] = value;
        }
        return result;
    }

    std::optional<std::uint64_t> headers::get_content_length() const{
        return content_length_;
    }

    bool headers::chunked() const{
        return chunked_;
    }

    void headers::set_http_version_major(uint8_t http_version_major) {
        http_version_major_ = http_version_major;
    }

    void headers::set_http_version_minor(uint8_t http_version_minor) {
        http_version_minor_ = http_version_minor;
    }

    int headers::get_http_version_major() const {
        return http_version_major_;
    }

    int headers::get_http_version_minor() const {
        return http_version_minor_;
    }

    void headers::log(const char* scope) const{
        LOG_TRACE("[{}] Headers:", scope);
        for(const auto& t: headers_){
            LOG_TRACE("  {}: {}", t.first, t.second);
        }
    }

    bool headers::is_header(std::string_view key, std::string_view header){
        return boost::iequals(key, header);
    }
}
