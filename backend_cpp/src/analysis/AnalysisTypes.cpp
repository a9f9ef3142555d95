#include "analysis/AnalysisTypes.hpp"
#include "analysis/AnalysisError.hpp"
#include "text_utils.hpp"

namespace data_analyst {

const char* to_string(OutputShape shape) {
    switch (shape) {
        case OutputShape::Array:  return "array";
        case OutputShape::Object: return "object";
    }
    return "object";
}

const char* to_string(ExitStatus status) {
    switch (status) {
        case ExitStatus::Success:      return "Success";
        case ExitStatus::NonZeroExit:  return "NonZeroExit";
        case ExitStatus::TimedOut:     return "TimedOut";
        case ExitStatus::LaunchFailed: return "LaunchFailed";
    }
    return "LaunchFailed";
}

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidRequest:   return "InvalidRequest";
        case ErrorKind::GenerationFailed: return "GenerationFailed";
        case ErrorKind::ExecutionFailed:  return "ExecutionFailed";
        case ErrorKind::MalformedOutput:  return "MalformedOutput";
        case ErrorKind::Internal:         return "Internal";
    }
    return "Internal";
}

bool parse_output_shape(const std::string& text, OutputShape& out) {
    std::string v = to_lower(trim(text));
    if (v == "array") {
        out = OutputShape::Array;
        return true;
    }
    if (v == "object") {
        out = OutputShape::Object;
        return true;
    }
    return false;
}

} // namespace data_analyst
