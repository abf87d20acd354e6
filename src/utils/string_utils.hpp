#ifndef HTTP_CONNECTOR_STRING_UTILS_HPP
#define HTTP_CONNECTOR_STRING_UTILS_HPP

#include <map>
#include <string>
#include <string_view>

namespace string_utils {
    size_t write_to_string(const char* ptr, size_t size, size_t nmemb, void* userdata);

    bool ieq_prefix(const char* buf, size_t n, const char* key);

    std::string trim(std::string s);

    std::string to_lower(std::string_view sv);

    std::string rstrip(std::string_view sv, char c);

    std::string lstrip(std::string_view sv, char c);

    // RFC 3986 unreserved characters pass through; everything else is %XX.
    std::string percent_encode(std::string_view sv);

    std::string build_query(const std::map<std::string, std::string>& params);

    // Exactly one '/' between base and path.
    std::string join_url(std::string_view base, std::string_view path);

    std::string json_escape(std::string_view sv);
}  // namespace string_utils

#endif
