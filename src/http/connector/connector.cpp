#include "connector.hpp"

#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"
#include "../client/curl_pool.hpp"
#include "../error/http_error.hpp"
#include "parallel_dispatcher.hpp"

namespace http::connector {

    namespace {
        struct UrlSchemes {
            static constexpr std::string_view HTTP = "http://";
            static constexpr std::string_view HTTPS = "https://";
        };

        const char* const MASKED_VALUE = "***";

        std::string describe_headers(const http::model::Headers& headers) {
            std::ostringstream out;
            out << "{";
            bool first = true;
            for (const auto& [name, value] : headers) {
                const bool secret = string_utils::to_lower(name) == string_utils::to_lower(constants::AUTHORIZATION);
                out << (first ? "" : ", ") << name << ": " << (secret ? MASKED_VALUE : value);
                first = false;
            }
            out << "}";
            return out.str();
        }
    }  // namespace

    std::string normalize_base_url(std::string_view base_url) {
        const std::string trimmed = string_utils::trim(std::string(base_url));
        if (trimmed.empty()) {
            throw http::http_error::ConfigurationError("base_url must not be empty");
        }

        const std::string lower = string_utils::to_lower(trimmed);
        size_t scheme_len = 0;
        if (lower.starts_with(UrlSchemes::HTTPS)) {
            scheme_len = UrlSchemes::HTTPS.size();
        } else if (lower.starts_with(UrlSchemes::HTTP)) {
            scheme_len = UrlSchemes::HTTP.size();
        } else {
            throw http::http_error::ConfigurationError("base_url must be an absolute http:// or https:// URL, got '" + trimmed + "'");
        }

        std::string normalized = string_utils::rstrip(trimmed, '/');
        if (normalized.size() <= scheme_len || normalized[scheme_len] == '/') {
            throw http::http_error::ConfigurationError("base_url has no host: '" + trimmed + "'");
        }

        return normalized;
    }

    //
    // Connector implementation
    //

    Connector::Connector(ConnectorOptions options)
        : Connector(options, std::make_unique<http::client::CurlPool>(options.transport_), http::transport::interruptible_sleep) {}

    Connector::Connector(ConnectorOptions options, std::unique_ptr<http::client::IHttpClient> client, http::transport::Sleeper sleeper)
        : base_url_(normalize_base_url(options.base_url_)),
          default_headers_(std::move(options.default_headers_)),
          auth_token_(std::move(options.auth_token_)),
          max_workers_(options.max_workers_),
          log_level_(options.log_level_),
          logger_("Connector", options.log_level_),
          transport_(std::make_unique<http::transport::Transport>(std::move(client), std::move(options.retry_policy_), std::move(sleeper))) {
        transport_->set_log_level(log_level_);
        // An empty token means no Authorization header at all.
        if (auth_token_ && auth_token_->empty()) {
            auth_token_.reset();
        }

        HC_LOG_INFO(logger_, "Initializing Connector with base_url: " << base_url_);

        const auto& policy = transport_->policy();
        std::ostringstream statuses;
        for (const long status : policy.retryable_statuses()) {
            statuses << status << " ";
        }
        HC_LOG_DEBUG(logger_, "Retry configuration: max_retries=" << policy.max_retries() << ", backoff_factor=" << policy.backoff_factor()
                                                                  << ", retryable_statuses=[ " << statuses.str() << "]");
    }

    Connector::~Connector() = default;

    http::model::Headers Connector::build_headers(const http::model::Headers& per_call) const {
        std::vector<http::model::Headers> sources;
        sources.push_back(http::model::Headers{{constants::CONTENT_TYPE, constants::APPLICATION_JSON}, {constants::ACCEPT, constants::APPLICATION_JSON}});
        sources.push_back(default_headers_);
        sources.push_back(per_call);
        if (auth_token_) {
            sources.push_back(http::model::Headers{{constants::AUTHORIZATION, std::string(constants::BEARER_PREFIX) + *auth_token_}});
        }

        http::model::Headers merged = http::model::merge_headers(sources);
        HC_LOG_DEBUG(logger_, "Generated headers: " << describe_headers(merged));
        return merged;
    }

    std::string Connector::build_url(std::string_view endpoint) const { return string_utils::join_url(base_url_, endpoint); }

    http::model::Request Connector::build_request(const http::model::RequestSpec& spec) const {
        return http::model::Request{
            .method_ = spec.method_,
            .url_ = build_url(spec.endpoint_),
            .headers_ = build_headers(spec.headers_),
            .params_ = spec.params_,
            .body_ = spec.body_,
        };
    }

    http::model::Response Connector::request(http::model::Method method, std::string_view endpoint, const http::model::Params& params,
                                             const std::optional<std::string>& body, const http::model::Headers& headers) const {
        return request(http::model::RequestSpec{
            .method_ = method,
            .endpoint_ = std::string(endpoint),
            .params_ = params,
            .body_ = body,
            .headers_ = headers,
        });
    }

    http::model::Response Connector::request(const http::model::RequestSpec& spec, std::stop_token stop) const {
        const http::model::Request req = build_request(spec);
        const std::string_view method = http::model::method_name(req.method_);

        HC_LOG_INFO(logger_, "Making " << method << " request to: " << req.url_);
        if (!req.params_.empty()) {
            HC_LOG_DEBUG(logger_, "Request parameters: " << string_utils::build_query(req.params_));
        }
        if (req.body_) {
            HC_LOG_DEBUG(logger_, "Request payload: " << *req.body_);
        }

        http::model::Response resp;
        try {
            resp = transport_->execute(req, stop);
        } catch (const http::http_error::NetworkError& e) {
            HC_LOG_ERROR(logger_, "Request to " << req.url_ << " failed after " << e.attempts_ << " attempt(s): " << e.what());
            throw;
        }

        HC_LOG_INFO(logger_, "Request to " << req.url_ << " returned response status code: " << resp.status_);
        HC_LOG_DEBUG(logger_, "Response headers: " << describe_headers(resp.headers_));

        switch (transport_->policy().classify(resp.status_)) {
            case http::retry::Outcome::Success:
                return resp;
            case http::retry::Outcome::Retryable:
                // Transport already used up the retries; the caller decides.
                HC_LOG_WARN(logger_, "Request to " << req.url_ << " failed with retryable status code " << resp.status_ << " after " << resp.attempts_
                                                   << " attempt(s): " << resp.body_.substr(0, http::http_error::ERROR_MESSAGE_LENGTH));
                return resp;
            case http::retry::Outcome::Fatal:
                break;
        }

        HC_LOG_ERROR(logger_, "Request to " << req.url_ << " failed with non-retryable status code " << resp.status_ << ": "
                                            << resp.body_.substr(0, http::http_error::ERROR_MESSAGE_LENGTH));
        throw http::http_error::HttpError(resp.status_, req.method_, req.url_, resp.body_, resp.attempts_,
                                          "HTTP " + std::to_string(resp.status_) + " for " + std::string(method) + " " + req.url_);
    }

    http::model::Response Connector::get(std::string_view endpoint, const http::model::Params& params, const std::optional<std::string>& body,
                                         const http::model::Headers& headers) const {
        return request(http::model::Method::GET, endpoint, params, body, headers);
    }

    http::model::Response Connector::post(std::string_view endpoint, const http::model::Params& params, const std::optional<std::string>& body,
                                          const http::model::Headers& headers) const {
        return request(http::model::Method::POST, endpoint, params, body, headers);
    }

    http::model::Response Connector::put(std::string_view endpoint, const http::model::Params& params, const std::optional<std::string>& body,
                                         const http::model::Headers& headers) const {
        return request(http::model::Method::PUT, endpoint, params, body, headers);
    }

    http::model::Response Connector::patch(std::string_view endpoint, const http::model::Params& params, const std::optional<std::string>& body,
                                           const http::model::Headers& headers) const {
        return request(http::model::Method::PATCH, endpoint, params, body, headers);
    }

    http::model::Response Connector::delete_(std::string_view endpoint, const http::model::Params& params, const std::optional<std::string>& body,
                                             const http::model::Headers& headers) const {
        return request(http::model::Method::DELETE, endpoint, params, body, headers);
    }

    const ParallelDispatcher& Connector::parallel() const {
        std::call_once(parallel_once_, [this]() { parallel_ = std::make_unique<ParallelDispatcher>(*this, max_workers_, log_level_); });
        return *parallel_;
    }

    std::vector<http::model::Response> Connector::request_many(http::model::Method method, const std::vector<std::string>& endpoints,
                                                               const std::vector<http::model::Headers>& headers_list,
                                                               const std::vector<http::model::Params>& params_list, const Bodies& body_list) const {
        if (endpoints.empty()) {
            return {};
        }
        return parallel().request_many(method, endpoints, headers_list, params_list, body_list);
    }

    std::vector<http::model::Response> Connector::get_many(const std::vector<std::string>& endpoints, const std::vector<http::model::Headers>& headers_list,
                                                           const std::vector<http::model::Params>& params_list) const {
        return request_many(http::model::Method::GET, endpoints, headers_list, params_list);
    }

    std::vector<http::model::Response> Connector::post_many(const std::vector<std::string>& endpoints, const std::vector<http::model::Headers>& headers_list,
                                                            const Bodies& body_list) const {
        return request_many(http::model::Method::POST, endpoints, headers_list, {}, body_list);
    }

    std::vector<http::model::Response> Connector::put_many(const std::vector<std::string>& endpoints, const std::vector<http::model::Headers>& headers_list,
                                                           const Bodies& body_list) const {
        return request_many(http::model::Method::PUT, endpoints, headers_list, {}, body_list);
    }

    std::vector<http::model::Response> Connector::patch_many(const std::vector<std::string>& endpoints, const std::vector<http::model::Headers>& headers_list,
                                                             const Bodies& body_list) const {
        return request_many(http::model::Method::PATCH, endpoints, headers_list, {}, body_list);
    }

    std::vector<http::model::Response> Connector::delete_many(const std::vector<std::string>& endpoints, const std::vector<http::model::Headers>& headers_list,
                                                              const Bodies& body_list) const {
        return request_many(http::model::Method::DELETE, endpoints, headers_list, {}, body_list);
    }

    //
    // ConnectorBuilder implementation
    //

    ConnectorBuilder& ConnectorBuilder::with_base_url(std::string base_url) {
        options_.base_url_ = std::move(base_url);
        return *this;
    }

    ConnectorBuilder& ConnectorBuilder::with_default_headers(http::model::Headers headers) {
        options_.default_headers_ = std::move(headers);
        return *this;
    }

    ConnectorBuilder& ConnectorBuilder::with_header(std::string name, std::string value) {
        options_.default_headers_.insert_or_assign(std::move(name), std::move(value));
        return *this;
    }

    ConnectorBuilder& ConnectorBuilder::with_auth_token(std::string token) {
        options_.auth_token_ = std::move(token);
        return *this;
    }

    ConnectorBuilder& ConnectorBuilder::with_retry_policy(http::retry::RetryPolicy policy) {
        options_.retry_policy_ = std::move(policy);
        return *this;
    }

    ConnectorBuilder& ConnectorBuilder::with_transport_options(http::client::TransportOptions transport) {
        options_.transport_ = std::move(transport);
        return *this;
    }

    ConnectorBuilder& ConnectorBuilder::with_max_workers(size_t max_workers) {
        options_.max_workers_ = max_workers;
        return *this;
    }

    ConnectorBuilder& ConnectorBuilder::with_log_level(logging::Level level) {
        options_.log_level_ = level;
        return *this;
    }

    ConnectorBuilder& ConnectorBuilder::with_http_client(std::unique_ptr<http::client::IHttpClient> client) {
        client_ = std::move(client);
        return *this;
    }

    ConnectorBuilder& ConnectorBuilder::with_sleeper(http::transport::Sleeper sleeper) {
        sleeper_ = std::move(sleeper);
        return *this;
    }

    ConnectorBuilder& ConnectorBuilder::validate() {
        static_cast<void>(normalize_base_url(options_.base_url_));
        if (options_.transport_.timeout_.count() < 0 || options_.transport_.connect_timeout_.count() < 0) {
            throw http::http_error::ConfigurationError("Timeouts must not be negative");
        }
        if (options_.auth_token_ && options_.auth_token_->empty()) {
            throw http::http_error::ConfigurationError("auth_token must not be empty when set");
        }
        return *this;
    }

    std::unique_ptr<Connector> ConnectorBuilder::build() {
        if (client_ == nullptr) {
            return std::make_unique<Connector>(std::move(options_));
        }
        return std::make_unique<Connector>(std::move(options_), std::move(client_), std::move(sleeper_));
    }

}  // namespace http::connector
