#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>
#include "AnalystConfig.hpp"
#include "text_utils.hpp"

using namespace data_analyst;
namespace fs = std::filesystem;

namespace {

class EnvGuard {
public:
    EnvGuard(const char* name, const char* value) : name_(name) {
        ::setenv(name, value, 1);
    }
    ~EnvGuard() { ::unsetenv(name_.c_str()); }

private:
    std::string name_;
};

} // namespace

TEST(AnalystConfigTest, DefaultsAreSensible) {
    AnalystConfig cfg;
    EXPECT_EQ(cfg.interpreter, "python3");
    EXPECT_EQ(cfg.execution_timeout, std::chrono::seconds(170));
    EXPECT_EQ(cfg.temperature, 0.0);
    EXPECT_EQ(cfg.max_retries, 3);
    EXPECT_TRUE(cfg.api_key.empty());
}

TEST(AnalystConfigTest, JsonOverridesOnlyTheKeysItNames) {
    AnalystConfig cfg;
    apply_config_json(cfg, nlohmann::json{
        {"model", "mixtral-8x7b"},
        {"execution_timeout_seconds", 30},
        {"request_timeout_ms", 5000},
        {"max_stdout_bytes", 2048},
        {"memory_limit_mb", 512},
        {"something_unknown", true}
    });

    EXPECT_EQ(cfg.model, "mixtral-8x7b");
    EXPECT_EQ(cfg.execution_timeout, std::chrono::seconds(30));
    EXPECT_EQ(cfg.request_timeout, std::chrono::milliseconds(5000));
    EXPECT_EQ(cfg.max_stdout_bytes, 2048u);
    EXPECT_EQ(cfg.memory_limit_mb, 512);
    EXPECT_EQ(cfg.interpreter, "python3");
}

TEST(AnalystConfigTest, EnvironmentSuppliesCredentialAndTimeout) {
    AnalystConfig cfg;
    cfg.api_key_env = "ANALYST_CONFIG_TEST_KEY";
    EnvGuard key("ANALYST_CONFIG_TEST_KEY", "gsk-from-env");
    EnvGuard timeout("ANALYST_EXECUTION_TIMEOUT", "45");

    apply_config_env(cfg);
    EXPECT_EQ(cfg.api_key, "gsk-from-env");
    EXPECT_EQ(cfg.execution_timeout, std::chrono::seconds(45));
}

TEST(AnalystConfigTest, GarbageTimeoutInEnvironmentIsRejected) {
    AnalystConfig cfg;
    EnvGuard timeout("ANALYST_EXECUTION_TIMEOUT", "10s");
    EXPECT_THROW(apply_config_env(cfg), std::runtime_error);
}

TEST(AnalystConfigTest, MissingCredentialFailsValidation) {
    AnalystConfig cfg;
    EXPECT_THROW(validate_config(cfg), std::runtime_error);
    cfg.api_key = "gsk-present";
    EXPECT_NO_THROW(validate_config(cfg));
}

TEST(AnalystConfigTest, NonPositiveLimitsFailValidation) {
    AnalystConfig cfg;
    cfg.api_key = "gsk-present";

    AnalystConfig zero_timeout = cfg;
    zero_timeout.execution_timeout = std::chrono::milliseconds(0);
    EXPECT_THROW(validate_config(zero_timeout), std::runtime_error);

    AnalystConfig negative_retries = cfg;
    negative_retries.max_retries = -1;
    EXPECT_THROW(validate_config(negative_retries), std::runtime_error);

    AnalystConfig too_many_retries = cfg;
    too_many_retries.max_retries = 63;
    EXPECT_THROW(validate_config(too_many_retries), std::runtime_error);
    too_many_retries.max_retries = 10;
    EXPECT_NO_THROW(validate_config(too_many_retries));

    AnalystConfig no_workers = cfg;
    no_workers.worker_threads = 0;
    EXPECT_THROW(validate_config(no_workers), std::runtime_error);
}

TEST(AnalystConfigTest, LoadsExplicitFile) {
    fs::path file = fs::temp_directory_path() / ("analyst-config-" + std::to_string(::getpid()) + ".json");
    {
        std::ofstream out(file);
        out << R"({"api_key": "gsk-file", "http_port": 9100, "interpreter": "/usr/bin/python3"})";
    }
    ::unsetenv("GROQ_API_KEY");
    ::unsetenv("ANALYST_EXECUTION_TIMEOUT");

    AnalystConfig cfg = load_analyst_config(file.string());
    EXPECT_EQ(cfg.api_key, "gsk-file");
    EXPECT_EQ(cfg.http_port, 9100);
    EXPECT_EQ(cfg.interpreter, "/usr/bin/python3");
    fs::remove(file);
}

TEST(AnalystConfigTest, BrokenOrMissingExplicitFileIsAnError) {
    fs::path file = fs::temp_directory_path() / ("analyst-broken-" + std::to_string(::getpid()) + ".json");
    {
        std::ofstream out(file);
        out << "{ not json";
    }
    EXPECT_THROW(load_analyst_config(file.string()), std::runtime_error);
    fs::remove(file);

    EXPECT_THROW(load_analyst_config("/nonexistent/analyst.json"), std::runtime_error);
}

TEST(TextUtilsTest, TailExcerptKeepsTheEndAndMarksTheCut) {
    std::string text(100, 'a');
    text += "KeyError";
    std::string excerpt = tail_excerpt(text, 20);
    EXPECT_EQ(excerpt, "...[88 bytes truncated]\naaaaaaaaaaaaKeyError");
    EXPECT_EQ(tail_excerpt("short", 20), "short");
}

TEST(TextUtilsTest, Utf8CutsNeverSplitACodePoint) {
    std::string s = "ab\xC3\xA9";   // "abé"
    EXPECT_EQ(utf8_safe_substr(s, 3), "ab");
    EXPECT_EQ(utf8_safe_tail(s, 1), "");
    EXPECT_EQ(utf8_safe_tail(s, 2), "\xC3\xA9");
}
