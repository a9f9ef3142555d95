#include "analysis_pipeline.hpp"
#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>
#include <spdlog/spdlog.h>

namespace data_analyst {

std::string new_session_id() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream os;
    os << std::hex << std::setw(16) << std::setfill('0') << rng();
    return os.str();
}

AnalysisPipeline::AnalysisPipeline(const AnalystConfig& config,
                                   std::shared_ptr<CodeGenerationClient> generator)
    : generator_(std::move(generator)),
      executor_(config),
      validator_(config.max_diagnostic_bytes) {}

AnalysisResponse AnalysisPipeline::run_stages(const AnalysisRequest& request,
                                              const CancellationToken* cancel,
                                              const PhaseObserver& observer,
                                              const std::string& session_id) const {
    auto notify = [&](const char* phase, const std::string& detail) {
        if (observer) observer(phase, detail);
    };

    notify("PROMPT", "Building generation prompt");
    GenerationPrompt prompt = prompt_builder_.build(request);
    spdlog::info("[{}] 📝 Prompt ready: {} files, shape {}", session_id,
                 request.attached_files.size(), to_string(request.expected_shape));

    notify("GENERATE", "Requesting script from model");
    GeneratedProgram program = generator_->generate(prompt, session_id);

    if (cancel && cancel->is_cancelled()) {
        spdlog::warn("[{}] 🛑 Caller went away before execution", session_id);
        return AnalysisResponse::failure(AnalysisFailure{
            ErrorKind::ExecutionFailed, "request was cancelled before execution", "", ExitStatus::TimedOut});
    }

    notify("EXECUTE", "Running script in sandbox");
    ExecutionResult result = executor_.execute(program, request.attached_files, cancel, session_id);

    notify("VALIDATE", std::string("Checking output (") + to_string(result.exit_status) + ")");
    return validator_.validate(result, request.expected_shape);
}

AnalysisResponse AnalysisPipeline::run(const AnalysisRequest& request,
                                       const CancellationToken* cancel,
                                       const PhaseObserver& observer) const {
    const std::string session_id = new_session_id();
    auto start = std::chrono::steady_clock::now();
    spdlog::info("[{}] 🎯 Analysis started", session_id);

    AnalysisResponse response = AnalysisResponse::failure(AnalysisFailure{});
    try {
        response = run_stages(request, cancel, observer, session_id);
    } catch (const AnalysisError& e) {
        spdlog::warn("[{}] ⚠️ {}: {}", session_id, to_string(e.kind()), e.what());
        response = AnalysisResponse::failure(e);
    } catch (const std::exception& e) {
        spdlog::error("[{}] 💥 Unexpected failure: {}", session_id, e.what());
        response = AnalysisResponse::failure(AnalysisFailure{
            ErrorKind::Internal, "internal error while processing the request", "", std::nullopt});
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    if (response.ok()) {
        spdlog::info("[{}] ✅ Analysis complete in {}ms", session_id, duration);
    } else {
        spdlog::warn("[{}] ❌ Analysis failed in {}ms: {} - {}", session_id, duration,
                     to_string(response.error().kind), response.error().message);
    }
    return response;
}

} // namespace data_analyst
