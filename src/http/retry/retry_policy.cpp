#include "retry_policy.hpp"

#include <cmath>
#include <set>
#include <string>

#include "../../utils/constants.hpp"
#include "../error/http_error.hpp"

namespace http::retry {

    struct RetryAfterStatus {
        static constexpr long PAYLOAD_TOO_LARGE = 413;
        static constexpr long TOO_MANY_REQUESTS = 429;
        static constexpr long SERVICE_UNAVAILABLE = 503;
    };

    std::set<long> RetryPolicy::default_statuses() {
        return {
            408,  // Request Timeout
            429,  // Too Many Requests
            500,  // Internal Server Error
            502,  // Bad Gateway
            503,  // Service Unavailable
            504,  // Gateway Timeout
        };
    }

    std::set<model::Method> RetryPolicy::default_methods() {
        return {model::Method::GET, model::Method::POST, model::Method::PUT, model::Method::PATCH, model::Method::DELETE};
    }

    RetryPolicy::RetryPolicy() : RetryPolicy(DEFAULT_MAX_RETRIES, DEFAULT_BACKOFF_FACTOR) {}

    RetryPolicy::RetryPolicy(size_t max_retries, double backoff_factor, std::set<long> retryable_statuses, std::set<model::Method> retryable_methods,
                             bool respect_retry_after)
        : max_retries_(max_retries),
          backoff_factor_(backoff_factor),
          retryable_statuses_(std::move(retryable_statuses)),
          retryable_methods_(std::move(retryable_methods)),
          respect_retry_after_(respect_retry_after) {
        if (!std::isfinite(backoff_factor_) || backoff_factor_ < 0.0) {
            throw http::http_error::ConfigurationError("backoff_factor must be a finite value >= 0, got " + std::to_string(backoff_factor_));
        }

        for (const long status : retryable_statuses_) {
            if (status < constants::HTTP_STATUS_MIN || status > constants::HTTP_STATUS_MAX) {
                throw http::http_error::ConfigurationError("retryable status out of range: " + std::to_string(status));
            }
        }
    }

    Outcome RetryPolicy::classify(long status_code) const {
        if (status_code < constants::HTTP_CLIENT_ERROR_LOWER_BOUNDARY) {
            return Outcome::Success;
        }
        if (retryable_statuses_.contains(status_code)) {
            return Outcome::Retryable;
        }
        return Outcome::Fatal;
    }

    bool RetryPolicy::should_retry(size_t attempt_index, model::Method method) const {
        return attempt_index <= max_retries_ && retryable_methods_.contains(method);
    }

    Seconds RetryPolicy::compute_backoff(size_t attempt_index) const {
        if (attempt_index == 0) {
            return Seconds{0.0};
        }
        return Seconds{backoff_factor_ * std::pow(2.0, static_cast<double>(attempt_index - 1))};
    }

    bool RetryPolicy::honours_retry_after(long status_code) const {
        return respect_retry_after_ && (status_code == RetryAfterStatus::PAYLOAD_TOO_LARGE || status_code == RetryAfterStatus::TOO_MANY_REQUESTS ||
                                        status_code == RetryAfterStatus::SERVICE_UNAVAILABLE);
    }
}  // namespace http::retry
