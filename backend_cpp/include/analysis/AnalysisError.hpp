#pragma once
#include <stdexcept>
#include <string>

namespace data_analyst {

enum class ErrorKind {
    InvalidRequest,
    GenerationFailed,
    ExecutionFailed,
    MalformedOutput,
    Internal
};

const char* to_string(ErrorKind kind);

/**
 * Thrown by a pipeline stage to short-circuit the request.
 * `diagnostic` is an already-bounded excerpt safe to show to the caller.
 */
class AnalysisError : public std::runtime_error {
public:
    AnalysisError(ErrorKind kind, const std::string& message, std::string diagnostic = "")
        : std::runtime_error(message), kind_(kind), diagnostic_(std::move(diagnostic)) {}

    ErrorKind kind() const { return kind_; }
    const std::string& diagnostic() const { return diagnostic_; }

private:
    ErrorKind kind_;
    std::string diagnostic_;
};

} // namespace data_analyst
