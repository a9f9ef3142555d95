#pragma once
#include <functional>
#include <memory>
#include <string>
#include "AnalystConfig.hpp"
#include "analysis/AnalysisResponse.hpp"
#include "code_generation_client.hpp"
#include "prompt_builder.hpp"
#include "result_validator.hpp"
#include "sandbox/SandboxExecutor.hpp"

namespace data_analyst {

// phase is one of PROMPT, GENERATE, EXECUTE, VALIDATE
using PhaseObserver = std::function<void(const std::string& phase, const std::string& detail)>;

std::string new_session_id();

/**
 * PromptBuilder -> CodeGenerationClient -> SandboxExecutor -> ResultValidator.
 * Stateless between calls; safe to share across request threads.
 */
class AnalysisPipeline {
public:
    AnalysisPipeline(const AnalystConfig& config, std::shared_ptr<CodeGenerationClient> generator);

    // Never throws: every failure comes back as a structured response.
    AnalysisResponse run(const AnalysisRequest& request,
                         const CancellationToken* cancel = nullptr,
                         const PhaseObserver& observer = nullptr) const;

private:
    AnalysisResponse run_stages(const AnalysisRequest& request,
                                const CancellationToken* cancel,
                                const PhaseObserver& observer,
                                const std::string& session_id) const;

    PromptBuilder prompt_builder_;
    std::shared_ptr<CodeGenerationClient> generator_;
    SandboxExecutor executor_;
    ResultValidator validator_;
};

} // namespace data_analyst
