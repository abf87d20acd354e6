#include "curl_pool.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

#include "curl_global.hpp"

namespace http::client {

    namespace {
        void share_setopt(CURLSH* share, CURLSHoption option, long value) {
            const auto rc = curl_share_setopt(share, option, value);
            if (rc != CURLSHE_OK) {
                throw std::runtime_error(std::string("curl_share_setopt failed: ") + curl_share_strerror(rc));
            }
        }

        // libcurl's global state must exist before the first share or easy handle.
        CURLSH* init_share() {
            static const CurlGlobal global;
            return curl_share_init();
        }
    }  // namespace

    CurlPool::CurlPool(TransportOptions options) : options_(std::move(options)), share_(init_share()) {
        if (share_ == nullptr) {
            throw std::runtime_error("Failed to create CURL share handle");
        }

        try {
            if (curl_share_setopt(share_, CURLSHOPT_LOCKFUNC, &CurlPool::lock_cb) != CURLSHE_OK ||
                curl_share_setopt(share_, CURLSHOPT_UNLOCKFUNC, &CurlPool::unlock_cb) != CURLSHE_OK ||
                curl_share_setopt(share_, CURLSHOPT_USERDATA, static_cast<void*>(this)) != CURLSHE_OK) {
                throw std::runtime_error("Failed to install CURL share lock callbacks");
            }

            share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
            share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
        } catch (const std::exception&) {
            curl_share_cleanup(share_);
            throw;
        }
    }

    CurlPool::~CurlPool() {
        // Easy handles must be detached from the share before it is cleaned up.
        {
            std::lock_guard<std::mutex> lock(idle_mutex_);
            idle_.clear();
        }

        if (share_ != nullptr) {
            curl_share_cleanup(share_);
        }
    }

    void CurlPool::lock_cb(CURL* /*handle*/, curl_lock_data data, curl_lock_access /*access*/, void* userptr) {
        auto* self = static_cast<CurlPool*>(userptr);
        self->share_locks_.at(static_cast<size_t>(data)).lock();
    }

    void CurlPool::unlock_cb(CURL* /*handle*/, curl_lock_data data, void* userptr) {
        auto* self = static_cast<CurlPool*>(userptr);
        self->share_locks_.at(static_cast<size_t>(data)).unlock();
    }

    std::unique_ptr<CurlEasy> CurlPool::acquire() {
        {
            std::lock_guard<std::mutex> lock(idle_mutex_);
            if (!idle_.empty()) {
                auto handle = std::move(idle_.back());
                idle_.pop_back();
                return handle;
            }
        }

        return std::make_unique<CurlEasy>(share_, options_);
    }

    void CurlPool::release(std::unique_ptr<CurlEasy> handle) {
        if (handle == nullptr) {
            return;
        }
        std::lock_guard<std::mutex> lock(idle_mutex_);
        idle_.push_back(std::move(handle));
    }

    http::model::Response CurlPool::perform(const http::model::Request& req) {
        const Lease lease(*this, acquire());
        return lease->perform(req);
    }

    size_t CurlPool::idle_handles() const {
        std::lock_guard<std::mutex> lock(idle_mutex_);
        return idle_.size();
    }

}  // namespace http::client
