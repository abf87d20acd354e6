#ifndef HTTP_CONNECTOR_CONSTANTS_HPP
#define HTTP_CONNECTOR_CONSTANTS_HPP

namespace constants {
    inline constexpr int BASE_10 = 10;
    inline constexpr unsigned char ASCII_CONTROL_LIMIT = 0x20;
    inline constexpr long HTTP_CLIENT_ERROR_LOWER_BOUNDARY = 400;
    inline constexpr long HTTP_STATUS_MIN = 100;
    inline constexpr long HTTP_STATUS_MAX = 599;
    inline constexpr unsigned int MAX_DEFAULT_WORKERS = 32;
    inline constexpr unsigned int EXTRA_DEFAULT_WORKERS = 4;
    inline constexpr const char* CONTENT_TYPE = "Content-Type";
    inline constexpr const char* ACCEPT = "Accept";
    inline constexpr const char* AUTHORIZATION = "Authorization";
    inline constexpr const char* APPLICATION_JSON = "application/json";
    inline constexpr const char* BEARER_PREFIX = "Bearer ";

}  // namespace constants

#endif
