#include "curl_easy.hpp"

#include <curl/curl.h>

#include <stdexcept>
#include <string>

#include "../../utils/string_utils.hpp"
#include "../error/http_error.hpp"
#include "../model/model.hpp"

namespace http::client {

    struct CurlDefaults {
        static constexpr long FOLLOW_LOCATION = 1L;
        static constexpr long MAX_REDIRECTS = 10L;
        static constexpr long NO_PROGRESS = 1L;
        static constexpr long NO_SIGNAL = 1L;
        static constexpr long TCP_KEEPALIVE = 1L;
        static constexpr long TCP_KEEPIDLE = 120L;
        static constexpr long TCP_KEEPINTVL = 60L;
        static constexpr long POST = 1L;
        static constexpr long HTTP_GET = 1L;
        static constexpr const char* CUSTOM_REQUEST = nullptr;
        static constexpr const char* HTTP_STATUS_LINE_PREFIX = "HTTP/";
    };

    using WriteCallback = size_t (*)(const char*, size_t, size_t, void*);
    using HeaderCallback = size_t (*)(char*, size_t, size_t, void*);

    CurlEasy::CurlEasy(CURLSH* share, const TransportOptions& options) : handle_(curl_easy_init()) {
        if (handle_ == nullptr) {
            throw std::runtime_error("Failed to create CURL easy handle");
        }

        error_buf_[0] = '\0';

        set_defaults_once(share, options);
    }

    CurlEasy::~CurlEasy() {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
        }

        if (handle_ != nullptr) {
            curl_easy_cleanup(handle_);
        }
    }

    bool CurlEasy::is_transient(CURLcode rc) {
        switch (rc) {
            case CURLE_COULDNT_RESOLVE_HOST:
            case CURLE_COULDNT_RESOLVE_PROXY:
            case CURLE_COULDNT_CONNECT:
            case CURLE_OPERATION_TIMEDOUT:
            case CURLE_SEND_ERROR:
            case CURLE_RECV_ERROR:
            case CURLE_GOT_NOTHING:
            case CURLE_PARTIAL_FILE:
            case CURLE_SSL_CONNECT_ERROR:
            case CURLE_HTTP2:
            case CURLE_HTTP2_STREAM:
                return true;
            default:
                return false;
        }
    }

    void CurlEasy::set_defaults_once(CURLSH* share, const TransportOptions& options) {
        setopt(CURLOPT_ERRORBUFFER, error_buf_.data());
        setopt(CURLOPT_FOLLOWLOCATION, CurlDefaults::FOLLOW_LOCATION);
        setopt(CURLOPT_MAXREDIRS, CurlDefaults::MAX_REDIRECTS);
        setopt(CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options.connect_timeout_.count()));
        setopt(CURLOPT_TIMEOUT_MS, static_cast<long>(options.timeout_.count()));
        setopt(CURLOPT_NOPROGRESS, CurlDefaults::NO_PROGRESS);
        setopt(CURLOPT_USERAGENT, options.user_agent_.c_str());
        setopt(CURLOPT_NOSIGNAL, CurlDefaults::NO_SIGNAL);  // safe in multithreaded apps
        setopt(CURLOPT_TCP_KEEPALIVE, CurlDefaults::TCP_KEEPALIVE);
        setopt(CURLOPT_TCP_KEEPIDLE, CurlDefaults::TCP_KEEPIDLE);
        setopt(CURLOPT_TCP_KEEPINTVL, CurlDefaults::TCP_KEEPINTVL);
        setopt(CURLOPT_VERBOSE, options.verbose_ ? 1L : 0L);

        if (share != nullptr) {
            setopt(CURLOPT_SHARE, share);
        }
    }

    void CurlEasy::set_headers(const http::model::Headers& hs) {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
            headers_ = nullptr;
        }
        for (const auto& [name, value] : hs) {
            // "Name;" is libcurl's spelling for a header with an empty value.
            const std::string line = value.empty() ? name + ";" : name + ": " + value;
            curl_slist* next = curl_slist_append(headers_, line.c_str());
            if (next == nullptr) {
                throw std::runtime_error("curl_slist_append failed");
            }
            headers_ = next;
        }
        setopt(CURLOPT_HTTPHEADER, headers_);
    }

    void CurlEasy::set_method_and_body(const http::model::Request& req) {
        const std::string_view name = http::model::method_name(req.method_);

        // Clear whatever verb the previous request on this handle used.
        setopt(CURLOPT_HTTPGET, CurlDefaults::HTTP_GET);
        setopt(CURLOPT_CUSTOMREQUEST, CurlDefaults::CUSTOM_REQUEST);

        if (req.body_.has_value()) {
            setopt(CURLOPT_POST, CurlDefaults::POST);
            setopt(CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(req.body_->size()));
            setopt(CURLOPT_POSTFIELDS, req.body_->c_str());
            if (req.method_ != http::model::Method::POST) {
                setopt(CURLOPT_CUSTOMREQUEST, name.data());
            }
            return;
        }

        if (req.method_ == http::model::Method::POST) {
            setopt(CURLOPT_POST, CurlDefaults::POST);
            setopt(CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(0));
            setopt(CURLOPT_POSTFIELDS, "");
        } else if (req.method_ != http::model::Method::GET) {
            setopt(CURLOPT_CUSTOMREQUEST, name.data());
        }
    }

    void CurlEasy::prepare_for_new_request(std::string& body) {
        // Clear per-request scratch
        last_response_headers_.clear();
        error_buf_[0] = '\0';
        body.clear();

        setopt(CURLOPT_WRITEFUNCTION, static_cast<WriteCallback>(&::string_utils::write_to_string));
        setopt(CURLOPT_WRITEDATA, static_cast<void*>(&body));
        setopt(CURLOPT_HEADERFUNCTION, static_cast<HeaderCallback>(&CurlEasy::header_cb));
        setopt(CURLOPT_HEADERDATA, static_cast<void*>(this));
    }

    size_t CurlEasy::header_cb(char* buffer, size_t size, size_t n_items, void* userdata) {
        auto* self = static_cast<CurlEasy*>(userdata);
        const size_t bytes = size * n_items;

        // A new status line starts a new header block (redirects, 100-continue).
        if (::string_utils::ieq_prefix(buffer, bytes, CurlDefaults::HTTP_STATUS_LINE_PREFIX)) {
            self->last_response_headers_.clear();
            return bytes;
        }

        const std::string_view line(buffer, bytes);
        const auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            return bytes;
        }

        std::string name = ::string_utils::to_lower(::string_utils::trim(std::string(line.substr(0, colon))));
        std::string value = ::string_utils::trim(std::string(line.substr(colon + 1)));
        self->last_response_headers_.insert_or_assign(std::move(name), std::move(value));

        return bytes;
    }

    http::model::Response CurlEasy::perform(const http::model::Request& req) {
        const std::string url = http::model::full_url(req);

        setopt(CURLOPT_URL, url.c_str());
        set_headers(req.headers_);
        set_method_and_body(req);

        std::string body;
        prepare_for_new_request(body);

        perform_throw(req, url);
        return make_response(body);
    }

    template <typename T>
    void CurlEasy::setopt(int option, T value) {
        const auto rc = curl_easy_setopt(handle_, static_cast<CURLoption>(option), value);

        if (rc != CURLE_OK) {
            throw std::runtime_error(std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc));
        }
    }
    // explicit instantiations for used types (optional but can help some compilers)
    template void CurlEasy::setopt<long>(int, long);
    template void CurlEasy::setopt<const char*>(int, const char*);
    template void CurlEasy::setopt<char*>(int, char*);
    template void CurlEasy::setopt<void*>(int, void*);
    template void CurlEasy::setopt<curl_slist*>(int, curl_slist*);
    template void CurlEasy::setopt<WriteCallback>(int, WriteCallback);
    template void CurlEasy::setopt<HeaderCallback>(int, HeaderCallback);

    void CurlEasy::perform_throw(const http::model::Request& req, const std::string& url) {
        const auto rc = curl_easy_perform(handle_);

        if (rc == CURLE_OK) {
            return;
        }

        std::string err = "curl_easy_perform failed: ";

        if (error_buf_[0] != '\0') {
            err += error_buf_.data();
        } else {
            err += curl_easy_strerror(rc);
        }

        throw http::http_error::NetworkError(req.method_, url, static_cast<int>(rc), is_transient(rc), err);
    }

    http::model::Response CurlEasy::make_response(std::string& incoming_body) {
        long code = 0;
        char* eff = nullptr;
        curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &code);
        curl_easy_getinfo(handle_, CURLINFO_EFFECTIVE_URL, &eff);

        http::model::Response r;
        r.status_ = code;
        r.body_ = std::move(incoming_body);
        r.effective_url_ = eff != nullptr ? eff : std::string{};
        r.headers_ = std::move(last_response_headers_);
        last_response_headers_.clear();
        return r;
    }

}  // namespace http::client
