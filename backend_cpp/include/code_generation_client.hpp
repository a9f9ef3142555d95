#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include "AnalystConfig.hpp"
#include "analysis/AnalysisTypes.hpp"
#include "transport/CompletionTransport.hpp"

namespace data_analyst {

/**
 * Strict single-match parser over ``` fences.
 * Returns the body of the only fenced block in `response`. Throws
 * AnalysisError(GenerationFailed) on zero blocks, more than one block, an
 * unterminated fence, a non-Python language tag, or a blank/binary body.
 */
std::string extract_single_code_block(const std::string& response);

class CodeGenerationClient {
public:
    using SleepFn = std::function<void(std::chrono::milliseconds)>;

    CodeGenerationClient(const AnalystConfig& config, std::shared_ptr<ICompletionTransport> transport);

    // Throws AnalysisError(GenerationFailed).
    GeneratedProgram generate(const GenerationPrompt& prompt, const std::string& session_id = "-") const;

    // Tests swap the backoff sleep for a recorder.
    void set_sleep_function(SleepFn fn) { sleep_ = std::move(fn); }

    static bool is_transient_status(long status_code);

private:
    std::string build_payload(const GenerationPrompt& prompt) const;
    TransportReply post_with_retry(const std::string& payload, const std::string& session_id) const;
    std::string extract_message_content(const TransportReply& reply) const;

    AnalystConfig config_;
    std::shared_ptr<ICompletionTransport> transport_;
    SleepFn sleep_;
};

} // namespace data_analyst
