#ifndef HTTP_CONNECTOR_CLIENT_INTERFACE_HPP
#define HTTP_CONNECTOR_CLIENT_INTERFACE_HPP

#include "../model/model.hpp"

namespace http::client {
    // One network exchange for one fully-built request. No retries.
    // Implementations must be safe to call from several threads at once.
    // Transport-level failures are reported as http::http_error::NetworkError.
    class IHttpClient {
       public:
        IHttpClient() = default;
        virtual ~IHttpClient() = default;
        IHttpClient(const IHttpClient&) = delete;
        virtual IHttpClient& operator=(const IHttpClient&) = delete;
        IHttpClient(IHttpClient&&) = delete;
        virtual IHttpClient& operator=(IHttpClient&&) = delete;

        virtual http::model::Response perform(const http::model::Request& req) = 0;
    };
}  // namespace http::client

#endif
