#ifndef HTTP_CONNECTOR_MODEL_REGISTRY_HPP
#define HTTP_CONNECTOR_MODEL_REGISTRY_HPP

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../../utils/logger.hpp"
#include "../connector/connector.hpp"
#include "../model/model.hpp"

namespace http::registry {

    struct ModelVersion {
        std::string version_;
        std::string run_id_;
        std::string status_;
        std::string description_;
        long long creation_timestamp_{};
        std::vector<std::string> aliases_{};
    };

    // Registry operations for one registered model over the MLflow REST API.
    // The connector's base URL is expected to point at ".../api/2.0/mlflow".
    class ModelRegistry {
       public:
        ModelRegistry(std::shared_ptr<const http::connector::Connector> connector, std::string model_name, logging::Level log_level = logging::Level::Warn);

        // Registers the model logged by run_id ("runs:/<run_id>/model") as a new
        // version, then applies the description, tags and alias in that order.
        // Returns the new version number.
        std::string register_model(const std::string& run_id, const std::optional<std::string>& alias = std::nullopt,
                                   const std::optional<std::string>& description = std::nullopt,
                                   const std::map<std::string, std::string>& tags = {}) const;

        [[nodiscard]] std::vector<ModelVersion> list_versions() const;

        // std::nullopt when the service reports the alias as unknown (404).
        [[nodiscard]] std::optional<ModelVersion> get_version_by_alias(const std::string& alias) const;

        void set_alias(const std::string& version, const std::string& alias) const;
        void delete_alias(const std::string& alias) const;
        void promote_to_production(const std::string& version) const;
        void promote_to_staging(const std::string& version) const;
        void delete_version(const std::string& version) const;
        void update_description(const std::string& version, const std::string& description) const;

        [[nodiscard]] const std::string& model_name() const { return model_name_; }

       private:
        http::model::Response call(http::model::Method method, const std::string& endpoint, const http::model::Params& params,
                                   const std::optional<std::string>& body) const;

        std::shared_ptr<const http::connector::Connector> connector_;
        std::string model_name_;
        logging::Logger logger_;
    };

}  // namespace http::registry

#endif
