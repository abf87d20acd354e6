#include "http_error.hpp"

#include <exception>
#include <stdexcept>
#include <string>

namespace http::http_error {
    namespace {
        std::string describe(const std::exception_ptr &cause) {
            try {
                std::rethrow_exception(cause);
            } catch (const std::exception &e) {
                return e.what();
            } catch (...) {
                return "unknown error";
            }
        }

        std::optional<long> status_of(const std::exception_ptr &cause) {
            try {
                std::rethrow_exception(cause);
            } catch (const HttpError &e) {
                return e.status_;
            } catch (...) {
                return std::nullopt;
            }
        }
    }  // namespace

    ConfigurationError::ConfigurationError(const std::string &msg) : std::runtime_error(msg) {}

    HttpError::HttpError(long s, model::Method m, std::string u,
                         std::string body,        // NOLINT(bugprone-easily-swappable-parameters)
                         size_t attempts, const std::string &msg)
        : std::runtime_error(msg),
          status_(s),
          method_(m),
          url_(std::move(u)),
          body_(std::move(body)),
          body_preview_(body_.substr(0, ERROR_MESSAGE_LENGTH)),
          attempts_(attempts) {}

    NetworkError::NetworkError(model::Method m, std::string u, int curl_code, bool transient, const std::string &msg)
        : std::runtime_error(msg), method_(m), url_(std::move(u)), curl_code_(curl_code), transient_(transient) {}

    RequestCancelled::RequestCancelled(model::Method m, std::string u, size_t attempts)
        : std::runtime_error(std::string(model::method_name(m)) + " " + u + " cancelled after " + std::to_string(attempts) + " attempt(s)"),
          method_(m),
          url_(std::move(u)),
          attempts_(attempts) {}

    BatchError::BatchError(size_t index, std::string endpoint, model::Method m, std::exception_ptr cause)
        : std::runtime_error("Batch " + std::string(model::method_name(m)) + " request #" + std::to_string(index) + " to " + endpoint +
                             " failed: " + describe(cause)),
          index_(index),
          endpoint_(std::move(endpoint)),
          method_(m),
          cause_(std::move(cause)),
          status_(status_of(cause_)) {}

    void BatchError::rethrow_cause() const { std::rethrow_exception(cause_); }
};  // namespace http::http_error
