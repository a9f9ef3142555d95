#include "code_generation_client.hpp"
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "analysis/AnalysisError.hpp"
#include "text_utils.hpp"

namespace data_analyst {

using json = nlohmann::json;

namespace {

const char* kFence = "```";

bool starts_with_fence(const std::string& line) {
    size_t p = line.find_first_not_of(" \t");
    return p != std::string::npos && line.compare(p, 3, kFence) == 0;
}

std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> out;
    size_t i = 0;
    while (i <= s.size()) {
        size_t nl = s.find('\n', i);
        std::string line = s.substr(i, nl == std::string::npos ? std::string::npos : nl - i);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        out.push_back(std::move(line));
        if (nl == std::string::npos) break;
        i = nl + 1;
    }
    return out;
}

bool is_python_tag(const std::string& info) {
    std::string tag = to_lower(trim(info));
    size_t space = tag.find_first_of(" \t");
    if (space != std::string::npos) tag = tag.substr(0, space);
    return tag.empty() || tag == "python" || tag == "py" || tag == "python3";
}

[[noreturn]] void fail(const std::string& message, const std::string& diagnostic = "") {
    throw AnalysisError(ErrorKind::GenerationFailed, message, diagnostic);
}

} // namespace

std::string extract_single_code_block(const std::string& response) {
    std::vector<std::string> lines = split_lines(response);

    int blocks = 0;
    bool in_block = false;
    std::string info;
    std::string body;

    for (const std::string& line : lines) {
        if (!in_block) {
            if (!starts_with_fence(line)) continue;
            if (++blocks > 1) fail("model response contains more than one code block");
            info = line.substr(line.find(kFence) + 3);
            in_block = true;
            continue;
        }

        if (trim(line) == kFence) {
            in_block = false;
            continue;
        }
        if (starts_with_fence(line)) {
            fail("model response contains a nested or unbalanced code fence");
        }
        body += line;
        body += '\n';
    }

    if (in_block) fail("model response has an unterminated code block");
    if (blocks == 0) fail("model response contains no fenced code block");
    if (!is_python_tag(info)) fail("code block is not Python: '" + trim(info) + "'");
    if (trim(body).empty()) fail("code block is empty");
    if (body.find('\0') != std::string::npos) fail("code block contains NUL bytes");

    return body;
}

CodeGenerationClient::CodeGenerationClient(const AnalystConfig& config,
                                           std::shared_ptr<ICompletionTransport> transport)
    : config_(config),
      transport_(std::move(transport)),
      sleep_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }) {}

bool CodeGenerationClient::is_transient_status(long status_code) {
    // 0: no HTTP response (DNS, connect, TLS, timeout)
    return status_code == 0 || status_code == 429 || status_code >= 500;
}

std::string CodeGenerationClient::build_payload(const GenerationPrompt& prompt) const {
    json payload = {
        {"model", config_.model},
        {"messages", json::array({
            {{"role", "system"}, {"content", prompt.system_instructions}},
            {{"role", "user"}, {"content", prompt.user_content}}
        })},
        {"temperature", config_.temperature},
        {"max_tokens", config_.max_response_tokens}
    };
    return payload.dump(-1, ' ', false, json::error_handler_t::replace);
}

TransportReply CodeGenerationClient::post_with_retry(const std::string& payload,
                                                     const std::string& session_id) const {
    TransportReply r;
    const int attempts = config_.max_retries + 1;

    for (int i = 0; i < attempts; ++i) {
        r = transport_->post(payload);
        if (r.status_code >= 200 && r.status_code < 300) return r;

        if (!is_transient_status(r.status_code)) {
            spdlog::error("[{}] ❌ Provider rejected request [{}]", session_id, r.status_code);
            fail("code generation request rejected with HTTP " + std::to_string(r.status_code),
                 utf8_safe_substr(r.body, config_.max_diagnostic_bytes));
        }

        if (i + 1 == attempts) break;

        auto backoff = config_.initial_backoff * (1LL << i);
        spdlog::warn("[{}] ⚠️ Provider {} ({}). Backing off {}ms (Attempt {}/{})...",
                     session_id,
                     r.status_code,
                     r.status_code == 0 ? r.transport_error : (r.status_code == 429 ? "Quota" : "Overload"),
                     backoff.count(), i + 1, attempts);
        sleep_(backoff);
    }

    if (r.status_code == 0) {
        fail("code generation provider unreachable after " + std::to_string(attempts) + " attempts",
             r.transport_error);
    }
    fail("code generation provider unavailable after " + std::to_string(attempts) +
         " attempts (HTTP " + std::to_string(r.status_code) + ")",
         utf8_safe_substr(r.body, config_.max_diagnostic_bytes));
}

std::string CodeGenerationClient::extract_message_content(const TransportReply& reply) const {
    if (reply.body.size() > config_.max_response_bytes) {
        fail("model response exceeds " + std::to_string(config_.max_response_bytes) + " bytes");
    }

    json j;
    try {
        j = json::parse(reply.body);
    } catch (const json::parse_error& e) {
        fail(std::string("provider response is not JSON: ") + e.what());
    }

    if (!j.contains("choices") || !j["choices"].is_array() || j["choices"].empty()) {
        fail("provider response has no choices");
    }
    const json& choice = j["choices"][0];
    if (!choice.contains("message") || !choice["message"].contains("content") ||
        !choice["message"]["content"].is_string()) {
        fail("provider response has no message content");
    }
    if (choice.contains("finish_reason") && choice["finish_reason"] == "length") {
        fail("model response was cut off at the token ceiling");
    }
    return choice["message"]["content"].get<std::string>();
}

GeneratedProgram CodeGenerationClient::generate(const GenerationPrompt& prompt,
                                                const std::string& session_id) const {
    auto start = std::chrono::steady_clock::now();

    TransportReply reply = post_with_retry(build_payload(prompt), session_id);
    std::string content = extract_message_content(reply);

    GeneratedProgram program;
    program.source_text = extract_single_code_block(content);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    spdlog::info("[{}] 🧠 Script generated ({} bytes, {}ms)", session_id,
                 program.source_text.size(), elapsed.count());
    spdlog::debug("[{}] Generated script:\n{}", session_id, program.source_text);
    return program;
}

} // namespace data_analyst
