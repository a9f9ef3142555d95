#pragma once
#include <atomic>
#include <functional>
#include <string>
#include <vector>
#include "AnalystConfig.hpp"
#include "analysis/AnalysisTypes.hpp"

namespace data_analyst {

// Trips when cancel() is called or when the optional check reports the
// caller is gone (e.g. grpc::ServerContext::IsCancelled).
class CancellationToken {
public:
    CancellationToken() = default;
    explicit CancellationToken(std::function<bool()> caller_gone) : caller_gone_(std::move(caller_gone)) {}

    void cancel() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load() || (caller_gone_ && caller_gone_()); }

private:
    std::atomic<bool> cancelled_{false};
    std::function<bool()> caller_gone_;
};

/**
 * Runs one generated program, once, as a child process:
 *  - cwd is a fresh scratch dir holding only the attached files
 *  - stdin is /dev/null, stdout/stderr go to bounded buffers
 *  - own process group, killed as a whole at the deadline or on cancel
 *  - credential variable stripped from the environment
 * The scratch dir is gone by the time execute() returns.
 */
class SandboxExecutor {
public:
    explicit SandboxExecutor(const AnalystConfig& config);

    ExecutionResult execute(const GeneratedProgram& program,
                            const std::vector<AttachedFile>& files,
                            const CancellationToken* cancel = nullptr,
                            const std::string& session_id = "-") const;

    // PATH lookup done in the parent so the child only needs execve.
    static std::string resolve_interpreter(const std::string& interpreter);

private:
    std::vector<std::string> child_environment() const;

    AnalystConfig config_;
};

} // namespace data_analyst
