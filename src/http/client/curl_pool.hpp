#ifndef HTTP_CONNECTOR_CURL_POOL_HPP
#define HTTP_CONNECTOR_CURL_POOL_HPP

#include <curl/curl.h>

#include <array>
#include <memory>
#include <mutex>
#include <vector>

#include "../model/model.hpp"
#include "curl_easy.hpp"
#include "interface.hpp"

namespace http::client {

    // Thread-safe IHttpClient. Easy handles are leased one per in-flight request and
    // returned to an idle list afterwards, and each keeps its own connection cache.
    // All handles are attached to one share handle holding DNS entries and TLS
    // sessions. The connection cache is never shared, since libcurl does not
    // support that across threads.
    class CurlPool : public IHttpClient {
       public:
        explicit CurlPool(TransportOptions options = {});

        ~CurlPool() override;
        CurlPool(const CurlPool&) = delete;
        CurlPool& operator=(const CurlPool&) = delete;
        CurlPool(CurlPool&&) = delete;
        CurlPool& operator=(CurlPool&&) = delete;

        http::model::Response perform(const http::model::Request& req) override;

        [[nodiscard]] size_t idle_handles() const;

       private:
        class Lease {
           public:
            Lease(CurlPool& pool, std::unique_ptr<CurlEasy> handle) : pool_(pool), handle_(std::move(handle)) {}
            ~Lease() { pool_.release(std::move(handle_)); }
            Lease(const Lease&) = delete;
            Lease& operator=(const Lease&) = delete;
            Lease(Lease&&) = delete;
            Lease& operator=(Lease&&) = delete;

            CurlEasy* operator->() const { return handle_.get(); }

           private:
            CurlPool& pool_;
            std::unique_ptr<CurlEasy> handle_;
        };

        std::unique_ptr<CurlEasy> acquire();
        void release(std::unique_ptr<CurlEasy> handle);

        static void lock_cb(CURL* handle, curl_lock_data data, curl_lock_access access, void* userptr);
        static void unlock_cb(CURL* handle, curl_lock_data data, void* userptr);

        TransportOptions options_;
        CURLSH* share_{};
        std::array<std::mutex, CURL_LOCK_DATA_LAST> share_locks_;

        mutable std::mutex idle_mutex_;
        std::vector<std::unique_ptr<CurlEasy>> idle_;
    };

}  // namespace http::client

#endif
