#ifndef HTTP_CONNECTOR_RETRY_POLICY_HPP
#define HTTP_CONNECTOR_RETRY_POLICY_HPP

#include <chrono>
#include <set>

#include "../model/model.hpp"

namespace http::retry {
    const size_t DEFAULT_MAX_RETRIES = 3;
    const double DEFAULT_BACKOFF_FACTOR = 0.3;

    enum class Outcome { Success, Retryable, Fatal };

    using Seconds = std::chrono::duration<double>;

    // Immutable once constructed; safe to share across threads by reference.
    class RetryPolicy {
       public:
        static std::set<long> default_statuses();
        static std::set<model::Method> default_methods();

        RetryPolicy();
        RetryPolicy(size_t max_retries, double backoff_factor, std::set<long> retryable_statuses = default_statuses(),
                    std::set<model::Method> retryable_methods = default_methods(), bool respect_retry_after = true);

        [[nodiscard]] Outcome classify(long status_code) const;

        // attempt_index is the retry about to be made: 1 for the first retry.
        [[nodiscard]] bool should_retry(size_t attempt_index, model::Method method) const;

        // backoff_factor * 2^(attempt_index - 1); zero for attempt 0.
        [[nodiscard]] Seconds compute_backoff(size_t attempt_index) const;

        // Retry-After only applies to statuses where servers send it to pace clients.
        [[nodiscard]] bool honours_retry_after(long status_code) const;

        [[nodiscard]] size_t max_retries() const { return max_retries_; }
        [[nodiscard]] double backoff_factor() const { return backoff_factor_; }
        [[nodiscard]] const std::set<long>& retryable_statuses() const { return retryable_statuses_; }
        [[nodiscard]] const std::set<model::Method>& retryable_methods() const { return retryable_methods_; }
        [[nodiscard]] bool respect_retry_after() const { return respect_retry_after_; }

       private:
        size_t max_retries_;
        double backoff_factor_;
        std::set<long> retryable_statuses_;
        std::set<model::Method> retryable_methods_;
        bool respect_retry_after_;
    };
}  // namespace http::retry

#endif
