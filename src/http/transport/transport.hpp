#ifndef HTTP_CONNECTOR_TRANSPORT_HPP
#define HTTP_CONNECTOR_TRANSPORT_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>

#include "../../utils/logger.hpp"
#include "../client/interface.hpp"
#include "../model/model.hpp"
#include "../retry/retry_policy.hpp"

namespace http::transport {
    // Blocks for the given delay or until the token is stopped, whichever is first.
    using Sleeper = std::function<void(std::chrono::milliseconds, std::stop_token)>;

    void interruptible_sleep(std::chrono::milliseconds delay, std::stop_token stop);

    struct RetryAfterLimits {
        // Longer server-requested waits are clamped to this.
        static constexpr std::chrono::seconds MAX_DELAY{300};
    };

    class Transport {
       public:
        Transport(std::unique_ptr<http::client::IHttpClient> client, http::retry::RetryPolicy policy, Sleeper sleeper = interruptible_sleep);

        ~Transport() = default;
        Transport(const Transport&) = delete;
        Transport& operator=(const Transport&) = delete;
        Transport(Transport&&) = delete;
        Transport& operator=(Transport&&) = delete;

        // Runs the request, retrying retryable statuses and transient network errors
        // per the policy. Returns the final response (possibly still retryable) or
        // throws NetworkError / RequestCancelled.
        http::model::Response execute(const http::model::Request& req, std::stop_token stop = {}) const;

        [[nodiscard]] const http::retry::RetryPolicy& policy() const { return policy_; }
        void set_log_level(logging::Level lvl) { logger_.set_level(lvl); }

       private:
        [[nodiscard]] std::chrono::milliseconds next_delay(const http::model::Response* resp, size_t retry_index) const;
        static std::optional<std::chrono::milliseconds> parse_retry_after(const http::model::Response& resp);

        std::unique_ptr<http::client::IHttpClient> client_;
        const http::retry::RetryPolicy policy_;
        Sleeper sleeper_;
        logging::Logger logger_{"Transport"};
    };
}  // namespace http::transport

#endif
