#include "model_registry.hpp"

#include <simdjson.h>

#include <charconv>
#include <initializer_list>
#include <map>
#include <string>
#include <utility>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"
#include "../error/http_error.hpp"

using namespace simdjson;

namespace http::registry {

    struct RegistryEndpoints {
        static constexpr const char* CREATE_VERSION = "model-versions/create";
        static constexpr const char* SEARCH_VERSIONS = "model-versions/search";
        static constexpr const char* SET_TAG = "model-versions/set-tag";
        static constexpr const char* ALIAS = "registered-models/alias";
        static constexpr const char* DELETE_VERSION = "model-versions/delete";
        static constexpr const char* UPDATE_VERSION = "model-versions/update";
    };

    struct RegistryAliases {
        static constexpr const char* PRODUCTION = "production";
        static constexpr const char* STAGING = "staging";
    };

    const long HTTP_NOT_FOUND = 404;

    namespace {
        std::string json_object(std::initializer_list<std::pair<const char*, std::string>> fields) {
            std::string out = "{";
            for (const auto& [key, value] : fields) {
                if (out.size() > 1) {
                    out += ",";
                }
                out += "\"" + std::string(key) + "\":\"" + string_utils::json_escape(value) + "\"";
            }
            out += "}";
            return out;
        }

        // Protobuf JSON may render int64 values as strings.
        long long to_int64(ondemand::value value) {
            if (value.type().value() == ondemand::json_type::string) {
                const std::string_view text = value.get_string().value();
                long long out = 0;
                const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
                if (ec != std::errc() || end != text.data() + text.size()) {
                    throw simdjson::simdjson_error(simdjson::NUMBER_ERROR);
                }
                return out;
            }
            return value.get_int64().value();
        }

        std::string to_string(ondemand::value value) {
            if (value.type().value() == ondemand::json_type::number) {
                return std::to_string(value.get_int64().value());
            }
            return std::string(value.get_string().value());
        }

        ModelVersion parse_model_version(ondemand::object obj) {
            ModelVersion v{};
            for (auto field : obj) {
                const std::string_view key = field.unescaped_key().value();
                ondemand::value value = field.value().value();

                if (key == "version") {
                    v.version_ = to_string(value);
                } else if (key == "run_id") {
                    v.run_id_ = to_string(value);
                } else if (key == "status") {
                    v.status_ = to_string(value);
                } else if (key == "description") {
                    v.description_ = to_string(value);
                } else if (key == "creation_timestamp") {
                    v.creation_timestamp_ = to_int64(value);
                } else if (key == "aliases") {
                    for (auto alias : value.get_array()) {
                        v.aliases_.emplace_back(alias.get_string().value());
                    }
                }
            }
            return v;
        }

        [[noreturn]] void throw_parse_error(const http::model::Response& resp, http::model::Method method, const std::string& url,
                                            const simdjson::simdjson_error& e) {
            throw http::http_error::HttpError(resp.status_, method, url, resp.body_, resp.attempts_, "Failed to parse JSON response: " + std::string(e.what()));
        }
    }  // namespace

    ModelRegistry::ModelRegistry(std::shared_ptr<const http::connector::Connector> connector, std::string model_name, logging::Level log_level)
        : connector_(std::move(connector)), model_name_(std::move(model_name)), logger_("ModelRegistry", log_level) {
        if (connector_ == nullptr) {
            throw http::http_error::ConfigurationError("ModelRegistry requires a connector");
        }
        if (model_name_.empty()) {
            throw http::http_error::ConfigurationError("model_name must not be empty");
        }
    }

    http::model::Response ModelRegistry::call(http::model::Method method, const std::string& endpoint, const http::model::Params& params,
                                              const std::optional<std::string>& body) const {
        http::model::Response resp = connector_->request(method, endpoint, params, body);

        // Retryable statuses come back from the connector unraised once retries run out.
        if (resp.status_ >= constants::HTTP_CLIENT_ERROR_LOWER_BOUNDARY) {
            throw http::http_error::HttpError(resp.status_, method, connector_->build_url(endpoint), resp.body_, resp.attempts_,
                                              "Registry request failed with status " + std::to_string(resp.status_));
        }
        return resp;
    }

    std::string ModelRegistry::register_model(const std::string& run_id, const std::optional<std::string>& alias,
                                              const std::optional<std::string>& description, const std::map<std::string, std::string>& tags) const {
        const std::string source = "runs:/" + run_id + "/model";
        const http::model::Response resp =
            call(http::model::Method::POST, RegistryEndpoints::CREATE_VERSION, {}, json_object({{"name", model_name_}, {"source", source}, {"run_id", run_id}}));

        std::string version;
        try {
            ondemand::parser parser;
            padded_string json(resp.body_);
            ondemand::document doc = parser.iterate(json);
            version = parse_model_version(doc["model_version"].get_object().value()).version_;
        } catch (const simdjson::simdjson_error& e) {
            throw_parse_error(resp, http::model::Method::POST, connector_->build_url(RegistryEndpoints::CREATE_VERSION), e);
        }
        if (version.empty()) {
            throw http::http_error::HttpError(resp.status_, http::model::Method::POST, connector_->build_url(RegistryEndpoints::CREATE_VERSION), resp.body_,
                                              resp.attempts_, "Registry response carries no model version");
        }
        HC_LOG_INFO(logger_, "Registered model version " << version << " from " << source);

        if (description) {
            update_description(version, *description);
        }
        for (const auto& [key, value] : tags) {
            call(http::model::Method::POST, RegistryEndpoints::SET_TAG, {},
                 json_object({{"name", model_name_}, {"version", version}, {"key", key}, {"value", value}}));
        }
        if (alias) {
            set_alias(version, *alias);
        }
        return version;
    }

    std::vector<ModelVersion> ModelRegistry::list_versions() const {
        std::vector<ModelVersion> versions;
        std::string page_token;

        do {
            http::model::Params params = {{"filter", "name='" + model_name_ + "'"}};
            if (!page_token.empty()) {
                params.emplace("page_token", page_token);
            }

            const http::model::Response resp = call(http::model::Method::GET, RegistryEndpoints::SEARCH_VERSIONS, params, std::nullopt);
            page_token.clear();

            try {
                ondemand::parser parser;
                padded_string json(resp.body_);
                ondemand::document doc = parser.iterate(json);

                for (auto field : doc.get_object()) {
                    const std::string_view key = field.unescaped_key().value();
                    if (key == "model_versions") {
                        for (auto mv : field.value().get_array()) {
                            versions.push_back(parse_model_version(mv.get_object().value()));
                        }
                    } else if (key == "next_page_token") {
                        page_token = std::string(field.value().get_string().value());
                    }
                }
            } catch (const simdjson::simdjson_error& e) {
                throw_parse_error(resp, http::model::Method::GET, connector_->build_url(RegistryEndpoints::SEARCH_VERSIONS), e);
            }
        } while (!page_token.empty());

        HC_LOG_DEBUG(logger_, "Found " << versions.size() << " versions");
        return versions;
    }

    std::optional<ModelVersion> ModelRegistry::get_version_by_alias(const std::string& alias) const {
        http::model::Response resp;
        try {
            resp = call(http::model::Method::GET, RegistryEndpoints::ALIAS, {{"name", model_name_}, {"alias", alias}}, std::nullopt);
        } catch (const http::http_error::HttpError& e) {
            if (e.status_ != HTTP_NOT_FOUND) {
                throw;
            }
            HC_LOG_ERROR(logger_, "Alias '" << alias << "' not found: " << e.body_preview_);
            return std::nullopt;
        }

        try {
            ondemand::parser parser;
            padded_string json(resp.body_);
            ondemand::document doc = parser.iterate(json);
            return parse_model_version(doc["model_version"].get_object().value());
        } catch (const simdjson::simdjson_error& e) {
            throw_parse_error(resp, http::model::Method::GET, connector_->build_url(RegistryEndpoints::ALIAS), e);
        }
    }

    void ModelRegistry::set_alias(const std::string& version, const std::string& alias) const {
        call(http::model::Method::POST, RegistryEndpoints::ALIAS, {}, json_object({{"name", model_name_}, {"alias", alias}, {"version", version}}));
        HC_LOG_INFO(logger_, "Set alias '" << alias << "' to version " << version);
    }

    void ModelRegistry::delete_alias(const std::string& alias) const {
        call(http::model::Method::DELETE, RegistryEndpoints::ALIAS, {}, json_object({{"name", model_name_}, {"alias", alias}}));
        HC_LOG_INFO(logger_, "Deleted alias: " << alias);
    }

    void ModelRegistry::promote_to_production(const std::string& version) const {
        set_alias(version, RegistryAliases::PRODUCTION);
        HC_LOG_INFO(logger_, "Promoted version " << version << " to production");
    }

    void ModelRegistry::promote_to_staging(const std::string& version) const {
        set_alias(version, RegistryAliases::STAGING);
        HC_LOG_INFO(logger_, "Promoted version " << version << " to staging");
    }

    void ModelRegistry::delete_version(const std::string& version) const {
        call(http::model::Method::DELETE, RegistryEndpoints::DELETE_VERSION, {}, json_object({{"name", model_name_}, {"version", version}}));
        HC_LOG_INFO(logger_, "Deleted version " << version);
    }

    void ModelRegistry::update_description(const std::string& version, const std::string& description) const {
        call(http::model::Method::PATCH, RegistryEndpoints::UPDATE_VERSION, {},
             json_object({{"name", model_name_}, {"version", version}, {"description", description}}));
        HC_LOG_INFO(logger_, "Updated description for version " << version);
    }

}  // namespace http::registry
