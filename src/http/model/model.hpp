#ifndef HTTP_CONNECTOR_MODEL_HPP
#define HTTP_CONNECTOR_MODEL_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace http::model {
    // Header names compare case-insensitively, as HTTP defines them.
    struct CaseInsensitiveLess {
        bool operator()(const std::string& a, const std::string& b) const;
    };

    // Ordered so that merged header sets and query strings are deterministic.
    using Headers = std::map<std::string, std::string, CaseInsensitiveLess>;
    using Params = std::map<std::string, std::string>;

    enum class Method { GET, POST, PUT, PATCH, DELETE };

    inline constexpr std::string_view method_name(Method m) {
        switch (m) {
            case Method::GET:
                return "GET";
            case Method::POST:
                return "POST";
            case Method::PUT:
                return "PUT";
            case Method::PATCH:
                return "PATCH";
            case Method::DELETE:
                return "DELETE";
        }
        return "GET";
    }

    struct RequestSpec {
        Method method_ = Method::GET;
        std::string endpoint_;
        Params params_;
        std::optional<std::string> body_;
        Headers headers_;
    };

    struct Request {
        Method method_ = Method::GET;
        std::string url_;
        Headers headers_;
        Params params_;
        std::optional<std::string> body_;
    };

    struct Response {
        long status_ = 0;
        size_t attempts_ = 0;

        // Names are lower-cased on receipt.
        Headers headers_;
        std::string body_;
        std::string effective_url_;

        [[nodiscard]] std::optional<std::string> header(std::string_view name) const;
    };

    // Later sources win on key collision, whatever the case of the name; the
    // winning source's spelling is kept.
    Headers merge_headers(const std::vector<Headers>& sources);

    // url_ with params_ appended as a percent-encoded query string.
    std::string full_url(const Request& req);
}  // namespace http::model

#endif
