#include "AnalystConfig.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <vector>
#include <spdlog/spdlog.h>

namespace data_analyst {

using json = nlohmann::json;

namespace {

// Backoff doubles per retry; beyond this the wait is hours and the shift overflows.
constexpr int kMaxRetriesCeiling = 10;

std::chrono::milliseconds ms_value(const json& j, const char* key, std::chrono::milliseconds fallback) {
    if (!j.contains(key)) return fallback;
    return std::chrono::milliseconds(j.at(key).get<long long>());
}

} // namespace

void apply_config_json(AnalystConfig& cfg, const json& j) {
    cfg.api_key = j.value("api_key", cfg.api_key);
    cfg.api_key_env = j.value("api_key_env", cfg.api_key_env);
    cfg.base_url = j.value("base_url", cfg.base_url);
    cfg.model = j.value("model", cfg.model);
    cfg.temperature = j.value("temperature", cfg.temperature);
    cfg.max_response_tokens = j.value("max_response_tokens", cfg.max_response_tokens);
    cfg.max_response_bytes = j.value("max_response_bytes", cfg.max_response_bytes);
    cfg.request_timeout = ms_value(j, "request_timeout_ms", cfg.request_timeout);
    cfg.max_retries = j.value("max_retries", cfg.max_retries);
    cfg.initial_backoff = ms_value(j, "initial_backoff_ms", cfg.initial_backoff);

    cfg.interpreter = j.value("interpreter", cfg.interpreter);
    cfg.scratch_root = j.value("scratch_root", cfg.scratch_root);
    if (j.contains("execution_timeout_seconds")) {
        cfg.execution_timeout = std::chrono::seconds(j.at("execution_timeout_seconds").get<long long>());
    }
    cfg.max_stdout_bytes = j.value("max_stdout_bytes", cfg.max_stdout_bytes);
    cfg.max_stderr_bytes = j.value("max_stderr_bytes", cfg.max_stderr_bytes);
    cfg.max_diagnostic_bytes = j.value("max_diagnostic_bytes", cfg.max_diagnostic_bytes);
    cfg.memory_limit_mb = j.value("memory_limit_mb", cfg.memory_limit_mb);
    cfg.cpu_limit_seconds = j.value("cpu_limit_seconds", cfg.cpu_limit_seconds);

    cfg.listen_host = j.value("listen_host", cfg.listen_host);
    cfg.http_port = j.value("http_port", cfg.http_port);
    cfg.grpc_port = j.value("grpc_port", cfg.grpc_port);
    cfg.worker_threads = j.value("worker_threads", cfg.worker_threads);
}

void apply_config_env(AnalystConfig& cfg) {
    if (const char* key = std::getenv(cfg.api_key_env.c_str())) {
        if (*key) cfg.api_key = key;
    }

    if (const char* raw = std::getenv("ANALYST_EXECUTION_TIMEOUT")) {
        try {
            size_t used = 0;
            long long seconds = std::stoll(raw, &used);
            if (used != std::string(raw).size()) throw std::invalid_argument("trailing characters");
            cfg.execution_timeout = std::chrono::seconds(seconds);
        } catch (const std::exception&) {
            throw std::runtime_error(std::string("ANALYST_EXECUTION_TIMEOUT is not a whole number of seconds: ") + raw);
        }
    }
}

void validate_config(const AnalystConfig& cfg) {
    if (cfg.api_key.empty()) {
        throw std::runtime_error("missing credential: set " + cfg.api_key_env + " or api_key in analyst.json");
    }
    if (cfg.base_url.empty()) throw std::runtime_error("base_url is empty");
    if (cfg.model.empty()) throw std::runtime_error("model is empty");
    if (cfg.interpreter.empty()) throw std::runtime_error("interpreter is empty");
    if (cfg.execution_timeout.count() <= 0) throw std::runtime_error("execution timeout must be positive");
    if (cfg.request_timeout.count() <= 0) throw std::runtime_error("request timeout must be positive");
    if (cfg.max_retries < 0 || cfg.max_retries > kMaxRetriesCeiling) {
        throw std::runtime_error("max_retries must be between 0 and " + std::to_string(kMaxRetriesCeiling));
    }
    if (cfg.max_response_tokens <= 0) throw std::runtime_error("max_response_tokens must be positive");
    if (cfg.max_response_bytes == 0) throw std::runtime_error("max_response_bytes must be positive");
    if (cfg.max_stdout_bytes == 0 || cfg.max_stderr_bytes == 0) {
        throw std::runtime_error("output ceilings must be positive");
    }
    if (cfg.worker_threads <= 0) throw std::runtime_error("worker_threads must be positive");
}

AnalystConfig load_analyst_config(const std::string& explicit_path) {
    AnalystConfig cfg;

    std::vector<std::string> search_paths;
    if (!explicit_path.empty()) {
        search_paths.push_back(explicit_path);
    } else {
        search_paths = {
            "analyst.json",          // working directory
            "../analyst.json",       // build/
            "../../analyst.json"     // build/Release/
        };
    }

    std::ifstream f;
    std::string found_path;
    for (const auto& path : search_paths) {
        f.open(path);
        if (f.is_open()) {
            found_path = path;
            break;
        }
    }

    if (found_path.empty()) {
        if (!explicit_path.empty()) {
            throw std::runtime_error("config file not readable: " + explicit_path);
        }
        spdlog::info("⚙️  No analyst.json found, using built-in defaults");
    } else {
        try {
            apply_config_json(cfg, json::parse(f));
        } catch (const json::exception& e) {
            throw std::runtime_error("invalid config " + found_path + ": " + e.what());
        }
        spdlog::info("⚙️  Config loaded from {}", found_path);
    }

    apply_config_env(cfg);
    validate_config(cfg);

    spdlog::info("⚙️  Model {} via {} | sandbox '{}' timeout {}s",
                 cfg.model, cfg.base_url, cfg.interpreter,
                 std::chrono::duration_cast<std::chrono::seconds>(cfg.execution_timeout).count());
    return cfg;
}

} // namespace data_analyst
