#include "http_response.hpp"
#include "../../util/logger.hpp"

namespace streamfetch::http{

    void http_response::set_status(int status_code){
        status_ = status_code;
    }

    void http_response::set_reason_phrase(std::string reason){
        reason_phrase_ = std::move(reason);
    }

    int http_response::get_status_code() const{
        return status_;
    }

    const std::string& http_response::get_reason_phrase() const{
        return reason_phrase_;
    }

    bool http_response::is_ok() const{
        return status_ >= 200 && status_ < 300;
    }

    bool http_response::is_error() const{
        return status_ >= 400;
    }

    bool http_response::is_redirect_response() const{
        switch(static_cast<status>(status_)){
            case status::moved_permanently:
            case status::found:
            case status::see_other:
            case status::temporary_redirect:
            case status::permanent_redirect:
                return true;
            default:
                return false;
        }
    }

    std::string http_response::read_all(std::size_t chunk_size){
        std::string content;
        while(true){
            auto chunk = read(chunk_size);
            if(chunk.empty()) break;
            content += chunk;
        }
        return content;
    }

    void http_response::log(const char* scope) const{
        LOG_DEBUG("[{}] HTTP/{}.{} {} {}", scope, get_http_version_major(), get_http_version_minor(),
                  status_, reason_phrase_);
        headers::log(scope);
    }

}
