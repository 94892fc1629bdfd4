#include <gtest/gtest.h>
#include "flowdebug/config/configuration.hpp"
#include <filesystem>
#include <fstream>

namespace flowdebug::test {

class ConfigurationTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_config_path = std::filesystem::temp_directory_path() / "flowdebug_test_config.json";

        test_config_content = R"({
            "debugger": {
                "default_mode": "step",
                "max_log_entries": 250,
                "pause_timeout_ms": 1500,
                "mirror_to_logger": false
            },
            "metrics": {
                "sample_resources": false,
                "export_sample_limit": 20
            },
            "logging": {
                "level": "debug",
                "file": "flowdebug.log",
                "console": true
            }
        })";

        std::ofstream config_file(test_config_path);
        config_file << test_config_content;
        config_file.close();
    }

    void TearDown() override {
        if (std::filesystem::exists(test_config_path)) {
            std::filesystem::remove(test_config_path);
        }
    }

    std::filesystem::path test_config_path;
    std::string test_config_content;
};

TEST_F(ConfigurationTest, DefaultsMatchDocumentedValues) {
    Configuration config;

    auto debugger = config.getDebuggerConfig();
    EXPECT_EQ(debugger.default_mode, "debug");
    EXPECT_EQ(debugger.max_log_entries, 1000);
    EXPECT_EQ(debugger.pause_timeout_ms, 0);
    EXPECT_TRUE(debugger.mirror_to_logger);

    auto metrics = config.getMetricsConfig();
    EXPECT_TRUE(metrics.sample_resources);
    EXPECT_EQ(metrics.export_sample_limit, 100);

    auto logging = config.getLoggingConfig();
    EXPECT_EQ(logging.level, "info");
    EXPECT_TRUE(logging.file.empty());
    EXPECT_TRUE(logging.console);

    std::vector<std::string> errors;
    EXPECT_TRUE(config.validate(errors));
    EXPECT_TRUE(errors.empty());
}

TEST_F(ConfigurationTest, LoadValidConfiguration) {
    Configuration config;
    auto result = config.loadFromFile(test_config_path.string());
    ASSERT_TRUE(result.has_value()) << result.error().to_string();

    auto debugger = config.getDebuggerConfig();
    EXPECT_EQ(debugger.default_mode, "step");
    EXPECT_EQ(debugger.max_log_entries, 250);
    EXPECT_EQ(debugger.pause_timeout_ms, 1500);
    EXPECT_FALSE(debugger.mirror_to_logger);

    auto metrics = config.getMetricsConfig();
    EXPECT_FALSE(metrics.sample_resources);
    EXPECT_EQ(metrics.export_sample_limit, 20);

    auto logging = config.getLoggingConfig();
    EXPECT_EQ(logging.level, "debug");
    EXPECT_EQ(logging.file, "flowdebug.log");
}

TEST_F(ConfigurationTest, PartialFileKeepsDefaults) {
    Configuration config;
    ASSERT_TRUE(config.loadFromString(R"({"debugger": {"max_log_entries": 10}})").has_value());

    auto debugger = config.getDebuggerConfig();
    EXPECT_EQ(debugger.max_log_entries, 10);
    EXPECT_EQ(debugger.default_mode, "debug");
    EXPECT_EQ(config.getMetricsConfig().export_sample_limit, 100);
}

TEST_F(ConfigurationTest, GettersWithDefaults) {
    Configuration config;

    EXPECT_EQ(config.getValue<std::string>("missing", "key", "fallback"), "fallback");
    EXPECT_EQ(config.getValue<int64_t>("debugger", "missing", 42), 42);
    EXPECT_FALSE(config.hasSection("missing"));
    EXPECT_TRUE(config.hasSection("debugger"));
    EXPECT_TRUE(config.hasKey("debugger", "default_mode"));
    EXPECT_FALSE(config.hasKey("debugger", "missing"));
}

TEST_F(ConfigurationTest, ValueConversion) {
    Configuration config;
    config.setValue("custom", "flag", std::string("yes"));
    config.setValue("custom", "count", std::string("17"));
    config.setValue("custom", "ratio", int64_t{3});

    EXPECT_TRUE(config.getValue<bool>("custom", "flag"));
    EXPECT_EQ(config.getValue<int64_t>("custom", "count"), 17);
    EXPECT_DOUBLE_EQ(config.getValue<double>("custom", "ratio"), 3.0);
    EXPECT_EQ(config.getValue<std::string>("custom", "ratio"), "3");
}

TEST_F(ConfigurationTest, SectionManagement) {
    Configuration config;
    config.setSection("extra", {{"enabled", true}});
    EXPECT_TRUE(config.hasSection("extra"));

    auto names = config.getSectionNames();
    EXPECT_EQ(names, (std::vector<std::string>{"debugger", "extra", "logging", "metrics"}));

    config.removeSection("extra");
    EXPECT_FALSE(config.hasSection("extra"));
    EXPECT_TRUE(config.getSection("extra").empty());
}

TEST_F(ConfigurationTest, InvalidJsonIsRejected) {
    Configuration config;
    auto result = config.loadFromString("{ not json");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::CONFIG_INVALID_FORMAT);

    auto non_object = config.loadFromString(R"({"debugger": 5})");
    ASSERT_FALSE(non_object.has_value());
    EXPECT_EQ(non_object.error().code(), ErrorCode::CONFIG_INVALID_FORMAT);
}

TEST_F(ConfigurationTest, NestedValuesAreRejectedWithoutPartialApply) {
    Configuration config;
    auto result = config.loadFromString(
        R"({"debugger": {"max_log_entries": 5}, "metrics": {"export_sample_limit": [1, 2]}})");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::CONFIG_INVALID_VALUE);
    EXPECT_EQ(config.getDebuggerConfig().max_log_entries, 1000);
}

TEST_F(ConfigurationTest, MissingFileIsReported) {
    Configuration config;
    auto result = config.loadFromFile("/nonexistent/flowdebug.json");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::CONFIG_FILE_NOT_FOUND);
}

TEST_F(ConfigurationTest, ValidationCatchesBadValues) {
    Configuration config;
    ASSERT_TRUE(config.loadFromString(R"({
        "debugger": {"default_mode": "turbo", "max_log_entries": 0, "pause_timeout_ms": -5},
        "metrics": {"export_sample_limit": 0},
        "logging": {"level": "verbose", "console": false, "file": ""}
    })").has_value());

    std::vector<std::string> errors;
    EXPECT_FALSE(config.validate(errors));
    EXPECT_EQ(errors.size(), 6u);
}

TEST_F(ConfigurationTest, SaveAndReload) {
    Configuration config;
    auto debugger = config.getDebuggerConfig();
    debugger.default_mode = "normal";
    debugger.pause_timeout_ms = 250;
    config.setDebuggerConfig(debugger);

    auto saved_path = std::filesystem::temp_directory_path() / "flowdebug_saved_config.json";
    ASSERT_TRUE(config.saveToFile(saved_path.string()).has_value());

    Configuration reloaded;
    ASSERT_TRUE(reloaded.loadFromFile(saved_path.string()).has_value());
    EXPECT_EQ(reloaded.getDebuggerConfig().default_mode, "normal");
    EXPECT_EQ(reloaded.getDebuggerConfig().pause_timeout_ms, 250);

    std::filesystem::remove(saved_path);
}

}  // namespace flowdebug::test
