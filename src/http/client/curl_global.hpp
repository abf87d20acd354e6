#ifndef HTTP_CONNECTOR_CURL_GLOBAL_HPP
#define HTTP_CONNECTOR_CURL_GLOBAL_HPP

#include <string>

namespace http::client {

    // Reference-counted by libcurl. CurlPool holds one for the life of the process,
    // so applications only need their own to bound init and cleanup explicitly.
    class CurlGlobal {
       public:
        CurlGlobal();

        ~CurlGlobal();
        CurlGlobal(const CurlGlobal&) = delete;
        CurlGlobal& operator=(const CurlGlobal&) = delete;
        CurlGlobal(CurlGlobal&&) = delete;
        CurlGlobal& operator=(CurlGlobal&&) = delete;

        static std::string version();
    };

}  // namespace http::client

#endif
