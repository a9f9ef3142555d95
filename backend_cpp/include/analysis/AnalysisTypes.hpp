#pragma once
#include <chrono>
#include <string>
#include <vector>

namespace data_analyst {

enum class OutputShape {
    Array,
    Object
};

struct AttachedFile {
    std::string name;        // plain file name, written as-is into the working dir
    std::string content;     // raw bytes
    std::string media_type;  // declared by the uploader, may be empty
};

struct AnalysisRequest {
    std::string task_text;
    std::vector<AttachedFile> attached_files;
    OutputShape expected_shape = OutputShape::Object;
};

struct GenerationPrompt {
    std::string system_instructions;
    std::string user_content;
};

struct GeneratedProgram {
    std::string source_text;
    std::string language = "python";
};

enum class ExitStatus {
    Success,
    NonZeroExit,
    TimedOut,
    LaunchFailed
};

struct ExecutionResult {
    std::string stdout_data;
    std::string stderr_data;
    ExitStatus exit_status = ExitStatus::LaunchFailed;
    std::chrono::milliseconds wall_time{0};

    int exit_code = -1;      // valid when the child exited normally
    int term_signal = 0;     // valid when the child died by a signal
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    bool cancelled = false;  // killed because the caller went away
};

const char* to_string(OutputShape shape);
const char* to_string(ExitStatus status);

// Accepts "array" / "object" in any case. Returns false on anything else.
bool parse_output_shape(const std::string& text, OutputShape& out);

} // namespace data_analyst
