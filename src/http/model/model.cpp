#include "model.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

#include "../../utils/string_utils.hpp"

namespace http::model {
    bool CaseInsensitiveLess::operator()(const std::string& a, const std::string& b) const {
        return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(), [](unsigned char x, unsigned char y) {
            return std::tolower(x) < std::tolower(y);
        });
    }

    std::optional<std::string> Response::header(std::string_view name) const {
        auto it = headers_.find(std::string(name));
        if (it == headers_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    Headers merge_headers(const std::vector<Headers>& sources) {
        Headers merged;
        for (const auto& source : sources) {
            for (const auto& [key, value] : source) {
                merged.erase(key);
                merged.emplace(key, value);
            }
        }
        return merged;
    }

    std::string full_url(const Request& req) {
        if (req.params_.empty()) {
            return req.url_;
        }
        const char separator = req.url_.find('?') == std::string::npos ? '?' : '&';
        return req.url_ + separator + string_utils::build_query(req.params_);
    }
}  // namespace http::model
