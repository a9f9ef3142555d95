#pragma once
#include <chrono>
#include <string>
#include <nlohmann/json.hpp>

namespace data_analyst {

// Process-wide settings. Built once in main, then only ever read.
struct AnalystConfig {
    // --- Code generation provider ---
    std::string api_key;
    std::string api_key_env = "GROQ_API_KEY";
    std::string base_url = "https://api.groq.com/openai/v1";
    std::string model = "llama3-70b-8192";
    double temperature = 0.0;
    int max_response_tokens = 4096;
    size_t max_response_bytes = 1024 * 1024;
    std::chrono::milliseconds request_timeout{60000};
    int max_retries = 3;                         // attempts after the first one
    std::chrono::milliseconds initial_backoff{1000};

    // --- Sandbox ---
    std::string interpreter = "python3";
    std::string scratch_root = "/tmp";
    std::chrono::milliseconds execution_timeout{170000};
    size_t max_stdout_bytes = 4 * 1024 * 1024;
    size_t max_stderr_bytes = 256 * 1024;
    size_t max_diagnostic_bytes = 2000;
    long memory_limit_mb = 0;                    // 0 = no RLIMIT_AS
    long cpu_limit_seconds = 0;                  // 0 = no RLIMIT_CPU

    // --- Service surfaces ---
    std::string listen_host = "0.0.0.0";
    int http_port = 8000;
    int grpc_port = 50051;
    int worker_threads = 8;
};

// Applies every recognised key of `j` on top of `cfg`. Unknown keys are ignored.
void apply_config_json(AnalystConfig& cfg, const nlohmann::json& j);

// Environment overrides: credential and ANALYST_EXECUTION_TIMEOUT (seconds).
void apply_config_env(AnalystConfig& cfg);

// Throws std::runtime_error naming the first offending setting.
void validate_config(const AnalystConfig& cfg);

/**
 * Defaults -> JSON file -> environment -> validation.
 * With an empty `explicit_path` the file is looked up as analyst.json in the
 * usual spots next to the binary; a missing file is fine, a broken one is not.
 */
AnalystConfig load_analyst_config(const std::string& explicit_path = "");

} // namespace data_analyst
