#pragma once
#include "AnalystConfig.hpp"
#include "analysis/AnalysisResponse.hpp"
#include "analysis/AnalysisTypes.hpp"

namespace data_analyst {

// Turns a finished run into the caller-facing response. Never repairs the
// program's output: anything off-contract is MalformedOutput.
class ResultValidator {
public:
    explicit ResultValidator(size_t max_diagnostic_bytes = AnalystConfig{}.max_diagnostic_bytes)
        : max_diagnostic_bytes_(max_diagnostic_bytes) {}

    AnalysisResponse validate(const ExecutionResult& result, OutputShape expected) const;

    // The single-line JSON rule plus shape check. Throws AnalysisError(MalformedOutput).
    nlohmann::ordered_json parse_output(const std::string& stdout_data, OutputShape expected) const;

private:
    AnalysisResponse execution_failed(const ExecutionResult& result) const;

    size_t max_diagnostic_bytes_;
};

} // namespace data_analyst
