#include <gtest/gtest.h>

#include "infra/config.h"
#include "support/fakes.h"

#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace ermes::core;
using namespace ermes::infra;
using ermes::test_support::RecordingLogger;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

const char* kOverrideVars[] = {
    "ERMES_API_BASE_URL",          "ERMES_TEMP_DIR_PREFIX",      "ERMES_LOG_LEVEL",
    "ERMES_TOKEN_LIFETIME_MINUTES", "ERMES_TOKEN_BUFFER_MINUTES", "ERMES_POLL_INTERVAL_SECONDS",
    "ERMES_ERROR_SLEEP_SECONDS",   "ERMES_CHUNK_SIZE",
};

}  // namespace

class ConfigTest : public ::testing::Test {
protected:
    fs::path path = fs::temp_directory_path() /
                    ("ermes_config_" + std::to_string(::getpid()) + ".yaml");

    void SetUp() override {
        for (const char* name : kOverrideVars) {
            ::unsetenv(name);
        }
    }

    void TearDown() override {
        for (const char* name : kOverrideVars) {
            ::unsetenv(name);
        }
        std::error_code ec;
        fs::remove(path, ec);
    }

    void write(const std::string& yaml) {
        std::ofstream out(path);
        out << yaml;
    }
};

// ============ Defaults ============

TEST_F(ConfigTest, DefaultsMatchTheService) {
    ClientConfig config;
    EXPECT_EQ(config.token.lifetime, 6000min);
    EXPECT_EQ(config.token.expiration_buffer, 5min);
    EXPECT_EQ(config.token.validation_timeout, 10s);
    EXPECT_EQ(config.polling.interval, 1s);
    EXPECT_EQ(config.polling.error_sleep, 5s);
    EXPECT_EQ(config.transfer.chunk_size, 8192u);
    EXPECT_EQ(config.transfer.upload_timeout, 6000s);
    EXPECT_EQ(config.transfer.max_upload_bytes, 1073741824ull);
    EXPECT_EQ(config.registry.interval, 30s);
}

TEST_F(ConfigTest, UrlExpandsJobId) {
    ClientConfig config;
    config.base_url = "https://ermes.example.org/api";
    EXPECT_EQ(config.url(config.endpoints.jobs_detail, "42"),
              "https://ermes.example.org/api/jobs/42");
    EXPECT_EQ(config.url(config.endpoints.login), "https://ermes.example.org/api/auth/login");
    EXPECT_EQ(ApiEndpoints::expand("/a/{job_id}/b/{job_id}", "x"), "/a/x/b/x");
    EXPECT_EQ(ApiEndpoints::expand("/jobs/", "x"), "/jobs/");
}

// ============ YAML file ============

TEST_F(ConfigTest, LoadsYamlOverDefaults) {
    write(R"(
api:
  base_url: "http://localhost:8000"
  endpoints:
    retrieve: "/download/{job_id}"
token:
  lifetime_minutes: 60
  expiration_buffer_minutes: 2
polling:
  interval_seconds: 0.5
processing:
  chunk_size: 4096
  temp_dir_prefix: "my_prefix_"
  max_upload_mb: 10
logging:
  level: debug
)");
    auto logger = std::make_shared<RecordingLogger>();

    auto config = load_config_file(path.string(), logger);

    ASSERT_TRUE(config.is_ok()) << config.error().internal_message;
    const auto& c = config.value();
    EXPECT_EQ(c.base_url, "http://localhost:8000");
    EXPECT_EQ(c.endpoints.retrieve, "/download/{job_id}");
    EXPECT_EQ(c.endpoints.login, "/auth/login");
    EXPECT_EQ(c.token.lifetime, 60min);
    EXPECT_EQ(c.token.expiration_buffer, 2min);
    EXPECT_EQ(c.polling.interval, 500ms);
    EXPECT_EQ(c.polling.error_sleep, 5s);
    EXPECT_EQ(c.transfer.chunk_size, 4096u);
    EXPECT_EQ(c.transfer.temp_dir_prefix, "my_prefix_");
    EXPECT_EQ(c.transfer.max_upload_bytes, 10ull * 1024 * 1024);
    EXPECT_EQ(c.log_level, "debug");
    EXPECT_TRUE(logger->has_event("loaded"));
}

TEST_F(ConfigTest, MissingFileIsError) {
    auto config = load_config_file("/nonexistent/ermes.yaml");
    ASSERT_TRUE(config.is_err());
    EXPECT_NE(config.error().internal_message.find("Config file not found"), std::string::npos);
}

TEST_F(ConfigTest, MalformedYamlIsError) {
    write("api: [unterminated\n");
    auto config = load_config_file(path.string());
    ASSERT_TRUE(config.is_err());
    EXPECT_NE(config.error().internal_message.find("Error loading YAML file"), std::string::npos);
}

TEST_F(ConfigTest, WrongTypeNamesTheKey) {
    write("token:\n  lifetime_minutes: forever\n");
    auto config = load_config_file(path.string());
    ASSERT_TRUE(config.is_err());
    EXPECT_NE(config.error().internal_message.find("token.lifetime_minutes"), std::string::npos);
}

// ============ Environment ============

TEST_F(ConfigTest, EnvironmentOverridesFileValues) {
    ::setenv("ERMES_API_BASE_URL", "http://override", 1);
    ::setenv("ERMES_POLL_INTERVAL_SECONDS", "2.5", 1);
    ::setenv("ERMES_CHUNK_SIZE", "1024", 1);
    ClientConfig config;
    config.base_url = "http://file";

    apply_env_overrides(config);

    EXPECT_EQ(config.base_url, "http://override");
    EXPECT_EQ(config.polling.interval, 2500ms);
    EXPECT_EQ(config.transfer.chunk_size, 1024u);
}

TEST_F(ConfigTest, InvalidOverrideIsIgnoredWithWarning) {
    ::setenv("ERMES_TOKEN_LIFETIME_MINUTES", "soon", 1);
    ::setenv("ERMES_ERROR_SLEEP_SECONDS", "-3", 1);
    auto logger = std::make_shared<RecordingLogger>();
    ClientConfig config;

    apply_env_overrides(config, logger);

    EXPECT_EQ(config.token.lifetime, 6000min);
    EXPECT_EQ(config.polling.error_sleep, 5s);
    int warnings = 0;
    for (const auto& entry : logger->entries()) {
        if (entry.event == "invalid_override") {
            ++warnings;
        }
    }
    EXPECT_EQ(warnings, 2);
}

// ============ Validation ============

TEST_F(ConfigTest, ValidateRejectsUnusableSettings) {
    ClientConfig config;
    EXPECT_TRUE(validate_config(config).is_err());  // no base url

    config.base_url = "http://api";
    EXPECT_TRUE(validate_config(config).is_ok());

    auto buffer = config;
    buffer.token.expiration_buffer = buffer.token.lifetime;
    EXPECT_TRUE(validate_config(buffer).is_err());

    auto chunk = config;
    chunk.transfer.chunk_size = 0;
    EXPECT_TRUE(validate_config(chunk).is_err());

    auto poll = config;
    poll.polling.interval = 0ms;
    EXPECT_TRUE(validate_config(poll).is_err());
}
