#include "string_utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <map>
#include <string>

#include "constants.hpp"

namespace string_utils {
    size_t write_to_string(const char *ptr, size_t size, size_t nmemb, void *userdata) {
        auto *body = static_cast<std::string *>(userdata);
        const size_t total = size * nmemb;
        body->append(ptr, total);
        return total;
    }

    bool ieq_prefix(const char *buf, size_t n, const char *key) {
        for (size_t i = 0; key[i] != '\0' && i < n; ++i) {
            if (std::tolower(static_cast<unsigned char>(buf[i])) != std::tolower(static_cast<unsigned char>(key[i]))) {
                return false;
            }
            if (key[i + 1] == '\0') {
                return true;
            }
        }
        return false;
    }

    std::string trim(std::string s) {
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) == 0; }));
        s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c) == 0; }).base(), s.end());
        return s;
    }

    std::string to_lower(std::string_view sv) {
        std::string out(sv);
        std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    std::string rstrip(std::string_view sv, char c) {
        const auto last = sv.find_last_not_of(c);
        if (last == std::string_view::npos) {
            return {};
        }
        return std::string(sv.substr(0, last + 1));
    }

    std::string lstrip(std::string_view sv, char c) {
        const auto first = sv.find_first_not_of(c);
        if (first == std::string_view::npos) {
            return {};
        }
        return std::string(sv.substr(first));
    }

    std::string percent_encode(std::string_view sv) {
        static constexpr std::array<char, 16> HEX = {'0', '1', '2', '3', '4', '5', '6', '7', '8', '9', 'A', 'B', 'C', 'D', 'E', 'F'};

        std::string out;
        out.reserve(sv.size());
        for (const char ch : sv) {
            const auto c = static_cast<unsigned char>(ch);
            if (std::isalnum(c) != 0 || c == '-' || c == '_' || c == '.' || c == '~') {
                out.push_back(ch);
            } else {
                out.push_back('%');
                out.push_back(HEX[c >> 4U]);
                out.push_back(HEX[c & 0x0FU]);
            }
        }
        return out;
    }

    std::string build_query(const std::map<std::string, std::string> &params) {
        std::string out;
        for (const auto &[key, value] : params) {
            if (!out.empty()) {
                out.push_back('&');
            }
            out += percent_encode(key);
            out.push_back('=');
            out += percent_encode(value);
        }
        return out;
    }

    std::string join_url(std::string_view base, std::string_view path) { return rstrip(base, '/') + "/" + lstrip(path, '/'); }

    std::string json_escape(std::string_view sv) {
        std::string out;
        out.reserve(sv.size() + 2);
        for (const char ch : sv) {
            switch (ch) {
                case '"':
                    out += "\\\"";
                    break;
                case '\\':
                    out += "\\\\";
                    break;
                case '\n':
                    out += "\\n";
                    break;
                case '\r':
                    out += "\\r";
                    break;
                case '\t':
                    out += "\\t";
                    break;
                default:
                    if (static_cast<unsigned char>(ch) < constants::ASCII_CONTROL_LIMIT) {
                        static constexpr const char *HEX = "0123456789abcdef";
                        const auto c = static_cast<unsigned char>(ch);
                        out += "\\u00";
                        out.push_back(HEX[c >> 4U]);
                        out.push_back(HEX[c & 0x0FU]);
                    } else {
                        out.push_back(ch);
                    }
            }
        }
        return out;
    }
}  // namespace string_utils
