// EN: Unit tests for ConfigManager (YAML loading, typed values, validation, environment overrides)
// FR: Tests unitaires pour ConfigManager (chargement YAML, valeurs typées, validation, surcharges d'environnement)

#include <gtest/gtest.h>
#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace CDO;

namespace {

const std::string kEngineYaml = R"(
engine:
  thread_pool_size: 8
  max_concurrent_jobs: 0
  cancel_superseded_runs: true
  poll_interval_ms: 20
executor:
  working_directory: "/tmp/work"
release:
  endpoint: memory
  on_existing: fail
  timeout_ms: 30000
  upload_hosts: [uploads.example.com, backup.example.com]
  version: "010"
logging:
  level: info
  ratio: 0.75
)";

} // namespace

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setConsoleOutput(false);
        config_ = &ConfigManager::getInstance();
        config_->reset();
    }

    void TearDown() override {
        config_->reset();
        unsetenv("CDO_ENGINE_MAX_CONCURRENT_JOBS");
        unsetenv("CDO_RELEASE_ENDPOINT");
        unsetenv("CDO_TEST_HOST");
        unsetenv("CDOIGNORED");
    }

    ConfigManager* config_{nullptr};
};

TEST_F(ConfigManagerTest, LoadsTypedValuesFromYaml) {
    ASSERT_TRUE(config_->loadFromString(kEngineYaml));

    EXPECT_EQ(config_->get("engine", "thread_pool_size").as<int>(), 8);
    EXPECT_TRUE(config_->get("engine", "cancel_superseded_runs").as<bool>());
    EXPECT_EQ(config_->get("release", "endpoint").as<std::string>(), "memory");
    EXPECT_DOUBLE_EQ(config_->get("logging", "ratio").as<double>(), 0.75);

    auto hosts = config_->get("release", "upload_hosts").as<std::vector<std::string>>();
    ASSERT_EQ(hosts.size(), 2u);
    EXPECT_EQ(hosts[1], "backup.example.com");
}

// EN: A quoted scalar keeps its text even if it looks numeric
// FR: Un scalaire entre guillemets garde son texte même s'il ressemble à un nombre
TEST_F(ConfigManagerTest, QuotedScalarsStayStrings) {
    ASSERT_TRUE(config_->loadFromString(kEngineYaml));

    auto version = config_->get("release", "version");
    EXPECT_FALSE(version.tryAs<int>().has_value());
    EXPECT_EQ(version.as<std::string>(), "010");
    EXPECT_EQ(config_->get("executor", "working_directory").as<std::string>(), "/tmp/work");
}

TEST_F(ConfigManagerTest, MissingKeysFallBackToDefaults) {
    ASSERT_TRUE(config_->loadFromString(kEngineYaml));

    EXPECT_FALSE(config_->get("engine", "unknown").isValid());
    EXPECT_EQ(config_->get("engine", "unknown").asOrDefault<int>(42), 42);
    EXPECT_EQ(config_->get("nosection", "key").asOrDefault<std::string>("x"), "x");
    // EN: Type mismatch also falls back
    // FR: Un type incorrect retombe aussi sur le défaut
    EXPECT_EQ(config_->get("release", "endpoint").asOrDefault<int>(7), 7);
    EXPECT_THROW(config_->get("release", "endpoint").as<int>(), std::runtime_error);
}

TEST_F(ConfigManagerTest, RejectsInvalidDocuments) {
    EXPECT_FALSE(config_->loadFromString("- just\n- a list\n"));
    EXPECT_FALSE(config_->loadFromString("engine: [unclosed"));
    EXPECT_FALSE(config_->loadFromFile("/nonexistent/cdo.yml"));
}

TEST_F(ConfigManagerTest, LoadsFromFile) {
    const auto path = std::filesystem::temp_directory_path() / "cdo_config_manager_test.yml";
    {
        std::ofstream file(path);
        file << kEngineYaml;
    }

    EXPECT_TRUE(config_->loadFromFile(path.string()));
    EXPECT_EQ(config_->get("release", "timeout_ms").as<int>(), 30000);
    std::filesystem::remove(path);
}

TEST_F(ConfigManagerTest, EnvironmentOverridesUseSectionAndKey) {
    ASSERT_TRUE(config_->loadFromString(kEngineYaml));
    setenv("CDO_ENGINE_MAX_CONCURRENT_JOBS", "4", 1);
    setenv("CDO_RELEASE_ENDPOINT", "https://api.example.com/repos/o/r", 1);
    setenv("CDOIGNORED", "1", 1);

    size_t applied = config_->loadEnvironmentOverrides("CDO_");

    EXPECT_GE(applied, 2u);
    EXPECT_EQ(config_->get("engine", "max_concurrent_jobs").as<int>(), 4);
    EXPECT_EQ(config_->get("release", "endpoint").as<std::string>(), "https://api.example.com/repos/o/r");
}

TEST_F(ConfigManagerTest, ExpandsEnvironmentVariablesInStrings) {
    setenv("CDO_TEST_HOST", "releases.internal", 1);

    EXPECT_EQ(ConfigManager::expandVariables("https://${CDO_TEST_HOST}/api"), "https://releases.internal/api");
    EXPECT_EQ(ConfigManager::expandVariables("${CDO_UNSET_VARIABLE_XYZ}"), "${CDO_UNSET_VARIABLE_XYZ}");
    EXPECT_EQ(ConfigManager::expandVariables("plain"), "plain");
}

TEST_F(ConfigManagerTest, ValidationRulesReportEveryViolation) {
    ASSERT_TRUE(config_->loadFromString(kEngineYaml));
    config_->set("engine", "thread_pool_size", ConfigValue(0));

    std::vector<ConfigManager::ValidationRule> rules;
    ConfigManager::ValidationRule pool;
    pool.key = "engine.thread_pool_size";
    pool.type = "int";
    pool.min_value = 1;
    rules.push_back(pool);

    ConfigManager::ValidationRule policy;
    policy.key = "release.on_existing";
    policy.type = "string";
    policy.allowed_values = {"fail", "update"};
    rules.push_back(policy);

    ConfigManager::ValidationRule required;
    required.key = "executor.shell";
    required.type = "string";
    required.required = true;
    rules.push_back(required);

    config_->addValidationRules(rules);

    std::vector<std::string> errors;
    EXPECT_FALSE(config_->validate(errors));
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_NE(errors[0].find("engine.thread_pool_size"), std::string::npos);
    EXPECT_NE(errors[1].find("executor.shell"), std::string::npos);

    config_->set("engine", "thread_pool_size", ConfigValue(4));
    config_->set("executor", "shell", ConfigValue("/bin/sh"));
    EXPECT_TRUE(config_->validate(errors));
}

TEST_F(ConfigManagerTest, SetHasRemoveAndDump) {
    CONFIG_SET("engine", "max_run_history", 50);
    EXPECT_TRUE(config_->has("engine", "max_run_history"));
    EXPECT_EQ(CONFIG_GET("engine", "max_run_history").as<int>(), 50);

    std::string dump = config_->dump();
    EXPECT_NE(dump.find("[engine]"), std::string::npos);
    EXPECT_NE(dump.find("max_run_history = 50"), std::string::npos);

    config_->remove("engine", "max_run_history");
    EXPECT_FALSE(config_->has("engine", "max_run_history"));
}

TEST(ConfigValueTest, ParseScalarDetectsTypes) {
    EXPECT_TRUE(ConfigManager::parseScalar("true").as<bool>());
    EXPECT_EQ(ConfigManager::parseScalar("-12").as<int>(), -12);
    EXPECT_DOUBLE_EQ(ConfigManager::parseScalar("2.5").as<double>(), 2.5);
    EXPECT_EQ(ConfigManager::parseScalar("v1.2.3").as<std::string>(), "v1.2.3");
    EXPECT_EQ(ConfigManager::parseScalar("99999999999999999999").as<std::string>(), "99999999999999999999");
}
