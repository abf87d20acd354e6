#ifndef HTTP_CONNECTOR_CONNECTOR_HPP
#define HTTP_CONNECTOR_CONNECTOR_HPP

#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "../../utils/logger.hpp"
#include "../client/curl_easy.hpp"
#include "../client/interface.hpp"
#include "../model/model.hpp"
#include "../retry/retry_policy.hpp"
#include "../transport/transport.hpp"

namespace http::connector {
    class ParallelDispatcher;

    using Bodies = std::vector<std::optional<std::string>>;

    struct ConnectorOptions {
        std::string base_url_;
        http::model::Headers default_headers_;
        std::optional<std::string> auth_token_;
        http::retry::RetryPolicy retry_policy_;
        http::client::TransportOptions transport_;
        size_t max_workers_ = 0;  // 0 selects concurrency::ThreadPool::default_thread_count()
        logging::Level log_level_ = logging::Level::Warn;
    };

    // Strips trailing slashes; throws ConfigurationError unless the URL is
    // http:// or https:// with a non-empty host.
    std::string normalize_base_url(std::string_view base_url);

    class Connector {
       public:
        // Talks to the network through a libcurl connection pool.
        explicit Connector(ConnectorOptions options);
        Connector(ConnectorOptions options, std::unique_ptr<http::client::IHttpClient> client,
                  http::transport::Sleeper sleeper = http::transport::interruptible_sleep);

        ~Connector();
        Connector(const Connector&) = delete;
        Connector& operator=(const Connector&) = delete;
        Connector(Connector&&) = delete;
        Connector& operator=(Connector&&) = delete;

        http::model::Response request(http::model::Method method, std::string_view endpoint, const http::model::Params& params = {},
                                      const std::optional<std::string>& body = std::nullopt, const http::model::Headers& headers = {}) const;
        http::model::Response request(const http::model::RequestSpec& spec, std::stop_token stop = {}) const;

        http::model::Response get(std::string_view endpoint, const http::model::Params& params = {}, const std::optional<std::string>& body = std::nullopt,
                                  const http::model::Headers& headers = {}) const;
        http::model::Response post(std::string_view endpoint, const http::model::Params& params = {}, const std::optional<std::string>& body = std::nullopt,
                                   const http::model::Headers& headers = {}) const;
        http::model::Response put(std::string_view endpoint, const http::model::Params& params = {}, const std::optional<std::string>& body = std::nullopt,
                                  const http::model::Headers& headers = {}) const;
        http::model::Response patch(std::string_view endpoint, const http::model::Params& params = {}, const std::optional<std::string>& body = std::nullopt,
                                    const http::model::Headers& headers = {}) const;
        http::model::Response delete_(std::string_view endpoint, const http::model::Params& params = {},
                                      const std::optional<std::string>& body = std::nullopt, const http::model::Headers& headers = {}) const;

        // Fans the endpoints out over the worker pool. Responses come back in
        // completion order; the first failure is rethrown as BatchError. An empty
        // override list means "no override" for every endpoint.
        std::vector<http::model::Response> request_many(http::model::Method method, const std::vector<std::string>& endpoints,
                                                        const std::vector<http::model::Headers>& headers_list = {},
                                                        const std::vector<http::model::Params>& params_list = {}, const Bodies& body_list = {}) const;

        std::vector<http::model::Response> get_many(const std::vector<std::string>& endpoints, const std::vector<http::model::Headers>& headers_list = {},
                                                    const std::vector<http::model::Params>& params_list = {}) const;
        std::vector<http::model::Response> post_many(const std::vector<std::string>& endpoints, const std::vector<http::model::Headers>& headers_list = {},
                                                     const Bodies& body_list = {}) const;
        std::vector<http::model::Response> put_many(const std::vector<std::string>& endpoints, const std::vector<http::model::Headers>& headers_list = {},
                                                    const Bodies& body_list = {}) const;
        std::vector<http::model::Response> patch_many(const std::vector<std::string>& endpoints, const std::vector<http::model::Headers>& headers_list = {},
                                                      const Bodies& body_list = {}) const;
        std::vector<http::model::Response> delete_many(const std::vector<std::string>& endpoints, const std::vector<http::model::Headers>& headers_list = {},
                                                       const Bodies& body_list = {}) const;

        // Built-in defaults < default_headers_ < per_call < Authorization from the token.
        [[nodiscard]] http::model::Headers build_headers(const http::model::Headers& per_call = {}) const;
        [[nodiscard]] std::string build_url(std::string_view endpoint) const;
        [[nodiscard]] http::model::Request build_request(const http::model::RequestSpec& spec) const;

        [[nodiscard]] const std::string& base_url() const { return base_url_; }
        [[nodiscard]] const http::model::Headers& default_headers() const { return default_headers_; }
        [[nodiscard]] bool has_auth_token() const { return auth_token_.has_value(); }
        [[nodiscard]] const http::retry::RetryPolicy& retry_policy() const { return transport_->policy(); }

       private:
        [[nodiscard]] const ParallelDispatcher& parallel() const;

        std::string base_url_;
        http::model::Headers default_headers_;
        std::optional<std::string> auth_token_;
        size_t max_workers_;
        logging::Level log_level_;
        logging::Logger logger_{"Connector"};

        std::unique_ptr<http::transport::Transport> transport_;

        // Declared after transport_ so worker threads are joined before it goes away.
        mutable std::once_flag parallel_once_;
        mutable std::unique_ptr<ParallelDispatcher> parallel_;
    };

    class ConnectorBuilder {
       public:
        ConnectorBuilder& with_base_url(std::string base_url);
        ConnectorBuilder& with_default_headers(http::model::Headers headers);
        ConnectorBuilder& with_header(std::string name, std::string value);
        ConnectorBuilder& with_auth_token(std::string token);
        ConnectorBuilder& with_retry_policy(http::retry::RetryPolicy policy);
        ConnectorBuilder& with_transport_options(http::client::TransportOptions transport);
        ConnectorBuilder& with_max_workers(size_t max_workers);
        ConnectorBuilder& with_log_level(logging::Level level);
        ConnectorBuilder& with_http_client(std::unique_ptr<http::client::IHttpClient> client);
        ConnectorBuilder& with_sleeper(http::transport::Sleeper sleeper);
        ConnectorBuilder& validate();
        std::unique_ptr<Connector> build();

       private:
        ConnectorOptions options_;
        std::unique_ptr<http::client::IHttpClient> client_;
        http::transport::Sleeper sleeper_ = http::transport::interruptible_sleep;
    };
}  // namespace http::connector

#endif
