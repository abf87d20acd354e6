#include "transport.hpp"

#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <mutex>
#include <stop_token>
#include <string>

#include "../../utils/constants.hpp"
#include "../error/http_error.hpp"

using namespace std::chrono;

namespace http::transport {

    struct RetryHeaders {
        static constexpr const char* RETRY_AFTER = "retry-after";
    };

    void interruptible_sleep(milliseconds delay, std::stop_token stop) {
        if (delay <= milliseconds::zero() || stop.stop_requested()) {
            return;
        }

        std::mutex mutex;
        std::condition_variable_any cv;
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait_for(lock, stop, delay, [] { return false; });
    }

    Transport::Transport(std::unique_ptr<http::client::IHttpClient> client, http::retry::RetryPolicy policy, Sleeper sleeper)
        : client_(std::move(client)), policy_(std::move(policy)), sleeper_(std::move(sleeper)) {
        if (client_ == nullptr) {
            throw http::http_error::ConfigurationError("Transport requires an HTTP client");
        }
        if (sleeper_ == nullptr) {
            sleeper_ = interruptible_sleep;
        }
    }

    http::model::Response Transport::execute(const http::model::Request& req, std::stop_token stop) const {
        const std::string_view method = http::model::method_name(req.method_);

        for (size_t attempt = 1;; ++attempt) {
            milliseconds delay{0};

            try {
                http::model::Response resp = client_->perform(req);
                resp.attempts_ = attempt;

                if (policy_.classify(resp.status_) != http::retry::Outcome::Retryable || !policy_.should_retry(attempt, req.method_)) {
                    return resp;
                }

                delay = next_delay(&resp, attempt);
                HC_LOG_WARN(logger_, method << " " << req.url_ << " returned retryable status " << resp.status_ << " (attempt " << attempt
                                            << "), retrying in " << delay.count() << "ms");
            } catch (http::http_error::NetworkError& e) {
                e.attempts_ = attempt;

                if (!e.transient_ || !policy_.should_retry(attempt, req.method_)) {
                    HC_LOG_ERROR(logger_, method << " " << req.url_ << " failed after " << attempt << " attempt(s): " << e.what());
                    throw;
                }

                delay = next_delay(nullptr, attempt);
                HC_LOG_WARN(logger_, method << " " << req.url_ << " network error (attempt " << attempt << "): " << e.what() << ", retrying in "
                                            << delay.count() << "ms");
            }

            sleeper_(delay, stop);

            if (stop.stop_requested()) {
                HC_LOG_DEBUG(logger_, method << " " << req.url_ << " cancelled after " << attempt << " attempt(s)");
                throw http::http_error::RequestCancelled(req.method_, req.url_, attempt);
            }
        }
    }

    milliseconds Transport::next_delay(const http::model::Response* resp, size_t retry_index) const {
        if (resp != nullptr && policy_.honours_retry_after(resp->status_)) {
            if (auto retry_after = parse_retry_after(*resp)) {
                return *retry_after;
            }
        }
        return round<milliseconds>(policy_.compute_backoff(retry_index));
    }

    // Only the delta-seconds form is understood; HTTP-dates fall back to backoff.
    std::optional<milliseconds> Transport::parse_retry_after(const http::model::Response& resp) {
        const auto value = resp.header(RetryHeaders::RETRY_AFTER);
        if (!value || value->empty()) {
            return std::nullopt;
        }

        char* end = nullptr;
        errno = 0;
        const long s = std::strtol(value->c_str(), &end, constants::BASE_10);
        if (end == value->c_str() || *end != '\0') {
            return std::nullopt;
        }

        if (s < 0) {
            return milliseconds{0};
        }
        if (errno == ERANGE || s > RetryAfterLimits::MAX_DELAY.count()) {
            return duration_cast<milliseconds>(RetryAfterLimits::MAX_DELAY);
        }
        return duration_cast<milliseconds>(seconds{s});
    }
}  // namespace http::transport
