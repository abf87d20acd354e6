/// @file test_model_registry.cpp
/// Registry client against canned MLflow responses.

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "../src/http/connector/connector.hpp"
#include "../src/http/error/http_error.hpp"
#include "../src/http/registry/model_registry.hpp"
#include "fakes.hpp"

using http::model::Method;
using http::registry::ModelRegistry;

namespace {
    const char* const BASE_URL = "http://mlflow.local/api/2.0/mlflow";

    struct Fixture {
        fakes::HandlerClient* client_;
        std::shared_ptr<const http::connector::Connector> connector_;
        std::unique_ptr<ModelRegistry> registry_;

        explicit Fixture(fakes::HandlerClient::Handler handler) {
            auto client = std::make_unique<fakes::HandlerClient>(std::move(handler));
            client_ = client.get();
            connector_ = std::make_shared<http::connector::Connector>(
                http::connector::ConnectorOptions{.base_url_ = BASE_URL, .retry_policy_ = http::retry::RetryPolicy(0, 0.0)}, std::move(client),
                fakes::no_sleep);
            registry_ = std::make_unique<ModelRegistry>(connector_, "churn");
        }

        http::model::Request last() const { return client_->requests().back(); }
    };

    http::model::Response ok(std::string body = "{}") { return fakes::status(200, std::move(body)); }
}  // namespace

// ============================================================================
// Construction
// ============================================================================

TEST(ModelRegistry, RequiresConnectorAndName) {
    EXPECT_THROW(ModelRegistry(nullptr, "m"), http::http_error::ConfigurationError);

    Fixture f([](const http::model::Request&) { return ok(); });
    EXPECT_THROW(ModelRegistry(f.connector_, ""), http::http_error::ConfigurationError);
    EXPECT_EQ(f.registry_->model_name(), "churn");
}

// ============================================================================
// Reads
// ============================================================================

TEST(ModelRegistry, ListVersionsFollowsPageTokens) {
    Fixture f([](const http::model::Request& req) {
        if (req.params_.count("page_token") == 0) {
            return ok(R"({"model_versions":[{"name":"churn","version":"1","run_id":"r1","status":"READY",
                          "creation_timestamp":1700000000000,"aliases":["staging"]}],
                          "next_page_token":"p2"})");
        }
        return ok(R"({"model_versions":[{"name":"churn","version":"2","run_id":"r2","status":"PENDING_REGISTRATION",
                      "creation_timestamp":"1700000001000","description":"retrained","tags":[{"key":"k","value":"v"}]}]})");
    });

    const auto versions = f.registry_->list_versions();
    ASSERT_EQ(versions.size(), 2U);

    EXPECT_EQ(versions[0].version_, "1");
    EXPECT_EQ(versions[0].run_id_, "r1");
    EXPECT_EQ(versions[0].status_, "READY");
    EXPECT_EQ(versions[0].creation_timestamp_, 1700000000000LL);
    EXPECT_EQ(versions[0].aliases_, (std::vector<std::string>{"staging"}));

    EXPECT_EQ(versions[1].version_, "2");
    EXPECT_EQ(versions[1].creation_timestamp_, 1700000001000LL);
    EXPECT_EQ(versions[1].description_, "retrained");
    EXPECT_TRUE(versions[1].aliases_.empty());

    const auto requests = f.client_->requests();
    ASSERT_EQ(requests.size(), 2U);
    EXPECT_EQ(requests[0].url_, std::string(BASE_URL) + "/model-versions/search");
    EXPECT_EQ(requests[0].params_.at("filter"), "name='churn'");
    EXPECT_EQ(requests[1].params_.at("page_token"), "p2");
}

TEST(ModelRegistry, ListVersionsOfUnknownModelIsEmpty) {
    Fixture f([](const http::model::Request&) { return ok("{}"); });
    EXPECT_TRUE(f.registry_->list_versions().empty());
}

TEST(ModelRegistry, VersionByAlias) {
    Fixture f([](const http::model::Request&) {
        return ok(R"({"model_version":{"name":"churn","version":7,"run_id":"abc","status":"READY","aliases":["production","champion"]}})");
    });

    const auto version = f.registry_->get_version_by_alias("production");
    ASSERT_TRUE(version.has_value());
    EXPECT_EQ(version->version_, "7");
    EXPECT_EQ(version->run_id_, "abc");
    EXPECT_EQ(version->aliases_.size(), 2U);

    const auto req = f.last();
    EXPECT_EQ(req.method_, Method::GET);
    EXPECT_EQ(req.url_, std::string(BASE_URL) + "/registered-models/alias");
    EXPECT_EQ(req.params_.at("name"), "churn");
    EXPECT_EQ(req.params_.at("alias"), "production");
}

TEST(ModelRegistry, UnknownAliasIsNullopt) {
    Fixture f([](const http::model::Request&) { return fakes::status(404, R"({"error_code":"RESOURCE_DOES_NOT_EXIST"})"); });
    EXPECT_FALSE(f.registry_->get_version_by_alias("shadow").has_value());
}

TEST(ModelRegistry, OtherErrorsPropagate) {
    Fixture forbidden([](const http::model::Request&) { return fakes::status(403, "denied"); });
    EXPECT_THROW(static_cast<void>(forbidden.registry_->get_version_by_alias("production")), http::http_error::HttpError);

    // Retryable statuses come back unraised from the connector and are raised here.
    Fixture unavailable([](const http::model::Request&) { return fakes::status(503, "later"); });
    try {
        static_cast<void>(unavailable.registry_->list_versions());
        FAIL() << "expected HttpError";
    } catch (const http::http_error::HttpError& e) {
        EXPECT_EQ(e.status_, 503);
        EXPECT_EQ(e.body_, "later");
    }
}

TEST(ModelRegistry, MalformedJsonRaisesHttpError) {
    Fixture f([](const http::model::Request&) { return ok("<html>Bad Gateway</html>"); });
    try {
        static_cast<void>(f.registry_->list_versions());
        FAIL() << "expected HttpError";
    } catch (const http::http_error::HttpError& e) {
        EXPECT_EQ(e.status_, 200);
        EXPECT_EQ(std::string(e.what()).rfind("Failed to parse JSON response", 0), 0U);
    }
}

TEST(ModelRegistry, NonNumericTimestampRaisesHttpError) {
    Fixture f([](const http::model::Request&) {
        return ok(R"({"model_versions":[{"name":"churn","version":"1","creation_timestamp":"yesterday"}]})");
    });
    EXPECT_THROW(static_cast<void>(f.registry_->list_versions()), http::http_error::HttpError);

    Fixture overflow([](const http::model::Request&) {
        return ok(R"({"model_versions":[{"name":"churn","version":"1","creation_timestamp":"99999999999999999999"}]})");
    });
    EXPECT_THROW(static_cast<void>(overflow.registry_->list_versions()), http::http_error::HttpError);
}

// ============================================================================
// Writes
// ============================================================================

TEST(ModelRegistry, RegisterModelCreatesVersionThenDescribesTagsAndAliases) {
    Fixture f([](const http::model::Request& req) {
        if (req.url_ == std::string(BASE_URL) + "/model-versions/create") {
            return ok(R"({"model_version":{"name":"churn","version":"9","run_id":"r42","status":"PENDING_REGISTRATION"}})");
        }
        return ok();
    });

    const std::string version = f.registry_->register_model("r42", "candidate", "weekly retrain", {{"owner", "ml"}, {"stage", "qa"}});
    EXPECT_EQ(version, "9");

    const auto requests = f.client_->requests();
    ASSERT_EQ(requests.size(), 5U);

    EXPECT_EQ(requests[0].method_, Method::POST);
    EXPECT_EQ(requests[0].url_, std::string(BASE_URL) + "/model-versions/create");
    EXPECT_EQ(requests[0].body_.value(), R"({"name":"churn","source":"runs:/r42/model","run_id":"r42"})");

    EXPECT_EQ(requests[1].method_, Method::PATCH);
    EXPECT_EQ(requests[1].body_.value(), R"({"name":"churn","version":"9","description":"weekly retrain"})");

    EXPECT_EQ(requests[2].url_, std::string(BASE_URL) + "/model-versions/set-tag");
    EXPECT_EQ(requests[2].body_.value(), R"({"name":"churn","version":"9","key":"owner","value":"ml"})");
    EXPECT_EQ(requests[3].body_.value(), R"({"name":"churn","version":"9","key":"stage","value":"qa"})");

    EXPECT_EQ(requests[4].url_, std::string(BASE_URL) + "/registered-models/alias");
    EXPECT_EQ(requests[4].body_.value(), R"({"name":"churn","alias":"candidate","version":"9"})");
}

TEST(ModelRegistry, RegisterModelWithoutExtrasMakesOneCall) {
    Fixture f([](const http::model::Request&) { return ok(R"({"model_version":{"version":3}})"); });
    EXPECT_EQ(f.registry_->register_model("r1"), "3");
    EXPECT_EQ(f.client_->requests().size(), 1U);
}

TEST(ModelRegistry, RegisterModelFailuresPropagate) {
    Fixture rejected([](const http::model::Request&) { return fakes::status(400, R"({"error_code":"INVALID_PARAMETER_VALUE"})"); });
    EXPECT_THROW(static_cast<void>(rejected.registry_->register_model("r1", "production")), http::http_error::HttpError);
    EXPECT_EQ(rejected.client_->requests().size(), 1U);

    Fixture versionless([](const http::model::Request&) { return ok(R"({"model_version":{"name":"churn"}})"); });
    EXPECT_THROW(static_cast<void>(versionless.registry_->register_model("r1")), http::http_error::HttpError);
}

TEST(ModelRegistry, SetAliasPostsJsonBody) {
    Fixture f([](const http::model::Request&) { return ok(); });
    f.registry_->set_alias("3", "candidate");

    const auto req = f.last();
    EXPECT_EQ(req.method_, Method::POST);
    EXPECT_EQ(req.url_, std::string(BASE_URL) + "/registered-models/alias");
    EXPECT_EQ(req.body_.value(), R"({"name":"churn","alias":"candidate","version":"3"})");
    EXPECT_EQ(req.headers_.at("Content-Type"), "application/json");
}

TEST(ModelRegistry, PromotionsUseWellKnownAliases) {
    Fixture f([](const http::model::Request&) { return ok(); });
    f.registry_->promote_to_production("4");
    EXPECT_EQ(f.last().body_.value(), R"({"name":"churn","alias":"production","version":"4"})");

    f.registry_->promote_to_staging("5");
    EXPECT_EQ(f.last().body_.value(), R"({"name":"churn","alias":"staging","version":"5"})");
}

TEST(ModelRegistry, DeletesSendJsonBodies) {
    Fixture f([](const http::model::Request&) { return ok(); });

    f.registry_->delete_alias("staging");
    auto req = f.last();
    EXPECT_EQ(req.method_, Method::DELETE);
    EXPECT_EQ(req.url_, std::string(BASE_URL) + "/registered-models/alias");
    EXPECT_EQ(req.body_.value(), R"({"name":"churn","alias":"staging"})");

    f.registry_->delete_version("2");
    req = f.last();
    EXPECT_EQ(req.method_, Method::DELETE);
    EXPECT_EQ(req.url_, std::string(BASE_URL) + "/model-versions/delete");
    EXPECT_EQ(req.body_.value(), R"({"name":"churn","version":"2"})");
}

TEST(ModelRegistry, UpdateDescriptionEscapesText) {
    Fixture f([](const http::model::Request&) { return ok(); });
    f.registry_->update_description("1", "line \"one\"\nline two");

    const auto req = f.last();
    EXPECT_EQ(req.method_, Method::PATCH);
    EXPECT_EQ(req.url_, std::string(BASE_URL) + "/model-versions/update");
    EXPECT_EQ(req.body_.value(), R"({"name":"churn","version":"1","description":"line \"one\"\nline two"})");
}
