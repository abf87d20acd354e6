#include "curl_global.hpp"

#include <curl/curl.h>

#include <stdexcept>
#include <string>

namespace http::client {

    // CURLE_HTTP2_STREAM, used to classify transient failures, arrived in 7.49.0.
    const unsigned int MIN_CURL_VERSION = 0x073100;

    CurlGlobal::CurlGlobal() {
        const auto rc = curl_global_init(CURL_GLOBAL_ALL);
        if (rc != CURLE_OK) {
            throw std::runtime_error(std::string("Failed to initialize libcurl: ") + curl_easy_strerror(rc));
        }

        const curl_version_info_data* info = curl_version_info(CURLVERSION_NOW);
        if (info == nullptr || info->version_num < MIN_CURL_VERSION) {
            curl_global_cleanup();
            throw std::runtime_error("libcurl >= 7.49.0 is required");
        }
    }

    CurlGlobal::~CurlGlobal() { curl_global_cleanup(); }

    std::string CurlGlobal::version() { return curl_version(); }

}  // namespace http::client
