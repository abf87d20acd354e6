#ifndef HTTP_CONNECTOR_HTTP_ERROR_HPP
#define HTTP_CONNECTOR_HTTP_ERROR_HPP

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>

#include "../model/model.hpp"

namespace http::http_error {
    const long ERROR_MESSAGE_LENGTH = 512;

    struct ConfigurationError : public std::runtime_error {
        explicit ConfigurationError(const std::string &msg);
    };

    // Non-retryable HTTP status (>= 400, not in the retryable set).
    struct HttpError : public std::runtime_error {
        long status_;
        model::Method method_;
        std::string url_;
        std::string body_;
        std::string body_preview_;
        size_t attempts_;
        explicit HttpError(long s, model::Method m, std::string u, std::string body, size_t attempts, const std::string &msg);
    };

    struct NetworkError : public std::runtime_error {
        model::Method method_;
        std::string url_;
        int curl_code_;
        bool transient_;
        size_t attempts_ = 1;
        explicit NetworkError(model::Method m, std::string u, int curl_code, bool transient, const std::string &msg);
    };

    struct RequestCancelled : public std::runtime_error {
        model::Method method_;
        std::string url_;
        size_t attempts_;
        explicit RequestCancelled(model::Method m, std::string u, size_t attempts);
    };

    // First failure of a parallel batch. The failing exception is kept in cause_.
    struct BatchError : public std::runtime_error {
        size_t index_;
        std::string endpoint_;
        model::Method method_;
        std::exception_ptr cause_;
        std::optional<long> status_;
        explicit BatchError(size_t index, std::string endpoint, model::Method m, std::exception_ptr cause);

        [[noreturn]] void rethrow_cause() const;
    };
}  // namespace http::http_error

#endif
