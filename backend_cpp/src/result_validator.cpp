#include "result_validator.hpp"
#include "analysis/AnalysisError.hpp"
#include "text_utils.hpp"

namespace data_analyst {

using ordered_json = nlohmann::ordered_json;

AnalysisResponse ResultValidator::execution_failed(const ExecutionResult& result) const {
    AnalysisFailure f;
    f.kind = ErrorKind::ExecutionFailed;
    f.exit_status = result.exit_status;
    f.diagnostic = tail_excerpt(result.stderr_data, max_diagnostic_bytes_);

    switch (result.exit_status) {
        case ExitStatus::TimedOut:
            f.message = result.cancelled
                ? "script execution was cancelled"
                : "script execution timed out after " + std::to_string(result.wall_time.count()) + "ms";
            break;
        case ExitStatus::LaunchFailed:
            f.message = "script could not be started";
            break;
        default:
            if (result.term_signal != 0) {
                f.message = "script was killed by signal " + std::to_string(result.term_signal);
            } else {
                f.message = "script exited with status " + std::to_string(result.exit_code);
            }
            break;
    }
    return AnalysisResponse::failure(std::move(f));
}

ordered_json ResultValidator::parse_output(const std::string& stdout_data, OutputShape expected) const {
    std::string text = trim(stdout_data);
    if (text.empty()) {
        throw AnalysisError(ErrorKind::MalformedOutput, "script printed nothing to stdout");
    }
    if (text.find('\n') != std::string::npos || text.find('\r') != std::string::npos) {
        throw AnalysisError(ErrorKind::MalformedOutput, "script printed more than one line to stdout",
                            utf8_safe_substr(text, max_diagnostic_bytes_));
    }

    ordered_json value;
    try {
        value = ordered_json::parse(text);
    } catch (const ordered_json::exception& e) {
        // parse_error for bad syntax, out_of_range for numbers like 1e400
        throw AnalysisError(ErrorKind::MalformedOutput,
                            std::string("script output is not valid JSON: ") + e.what(),
                            utf8_safe_substr(text, max_diagnostic_bytes_));
    }

    bool shape_ok = (expected == OutputShape::Array) ? value.is_array() : value.is_object();
    if (!shape_ok) {
        throw AnalysisError(ErrorKind::MalformedOutput,
                            std::string("expected a JSON ") + to_string(expected) +
                            " but got " + value.type_name());
    }
    return value;
}

AnalysisResponse ResultValidator::validate(const ExecutionResult& result, OutputShape expected) const {
    if (result.exit_status != ExitStatus::Success) {
        return execution_failed(result);
    }

    if (result.stdout_truncated) {
        return AnalysisResponse::failure(AnalysisFailure{
            ErrorKind::MalformedOutput,
            "script output exceeded the stdout ceiling of " + std::to_string(result.stdout_data.size()) + " bytes",
            "", std::nullopt});
    }

    try {
        return AnalysisResponse::success(parse_output(result.stdout_data, expected));
    } catch (const AnalysisError& e) {
        return AnalysisResponse::failure(e);
    }
}

} // namespace data_analyst
