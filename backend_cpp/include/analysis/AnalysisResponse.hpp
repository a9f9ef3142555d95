#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "analysis/AnalysisError.hpp"
#include "analysis/AnalysisTypes.hpp"

namespace data_analyst {

struct AnalysisFailure {
    ErrorKind kind = ErrorKind::Internal;
    std::string message;
    std::string diagnostic;
    std::optional<ExitStatus> exit_status; // set for ExecutionFailed only
};

// Either the validated answer or a structured failure. Never both.
class AnalysisResponse {
public:
    static AnalysisResponse success(nlohmann::ordered_json payload);
    static AnalysisResponse failure(AnalysisFailure failure);
    static AnalysisResponse failure(const AnalysisError& error);

    bool ok() const { return !failure_.has_value(); }
    const nlohmann::ordered_json& payload() const { return payload_; }
    const AnalysisFailure& error() const { return *failure_; }

    // Status code the service surfaces should answer with.
    int http_status() const;

    // Success: the payload itself. Failure: {"error", "message", ...}.
    nlohmann::ordered_json to_json() const;
    std::string to_body() const;

private:
    AnalysisResponse() = default;

    nlohmann::ordered_json payload_;
    std::optional<AnalysisFailure> failure_;
};

} // namespace data_analyst
