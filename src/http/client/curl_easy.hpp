#ifndef HTTP_CONNECTOR_CURL_EASY_HPP
#define HTTP_CONNECTOR_CURL_EASY_HPP

#include <curl/curl.h>

#include <array>
#include <chrono>
#include <string>

#include "../model/model.hpp"

namespace http::client {
    const size_t ERROR_BUFFER_SIZE = CURL_ERROR_SIZE;

    struct TransportOptions {
        std::chrono::milliseconds connect_timeout_{10'000};
        std::chrono::milliseconds timeout_{30'000};
        std::string user_agent_ = "http-connector/1.0";
        bool verbose_ = false;
    };

    // One libcurl easy handle. Not thread-safe: CurlPool hands each handle to one
    // thread at a time. Connections, DNS and TLS sessions live in the share handle.
    class CurlEasy {
       public:
        CurlEasy(CURLSH* share, const TransportOptions& options);

        ~CurlEasy();
        CurlEasy(const CurlEasy&) = delete;
        CurlEasy& operator=(const CurlEasy&) = delete;
        CurlEasy(CurlEasy&&) = delete;
        CurlEasy& operator=(CurlEasy&&) = delete;

        http::model::Response perform(const http::model::Request& req);

        static bool is_transient(CURLcode rc);

       private:
        template <typename T>
        void setopt(int option, T value);  // defined in .cpp with CURLoption

        void set_defaults_once(CURLSH* share, const TransportOptions& options);
        void set_headers(const http::model::Headers& hs);
        void set_method_and_body(const http::model::Request& req);
        void prepare_for_new_request(std::string& body);
        void perform_throw(const http::model::Request& req, const std::string& url);
        http::model::Response make_response(std::string& incoming_body);
        static size_t header_cb(char* buffer, size_t size, size_t n_items, void* userdata);

        http::model::Headers last_response_headers_;
        std::array<char, ERROR_BUFFER_SIZE> error_buf_{};
        curl_slist* headers_{};

        CURL* handle_{};
    };
}  // namespace http::client

#endif
