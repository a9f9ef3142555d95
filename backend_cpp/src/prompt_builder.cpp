#include "prompt_builder.hpp"
#include <unordered_set>
#include "analysis/AnalysisError.hpp"
#include "text_utils.hpp"

namespace data_analyst {

namespace {

const char* kDefaultMediaType = "application/octet-stream";

bool has_control_bytes(const std::string& text) {
    for (char c : text) {
        unsigned char u = static_cast<unsigned char>(c);
        if (u < 0x20 || u == 0x7F) return true;
    }
    return false;
}

bool is_plain_file_name(const std::string& name) {
    if (name.empty() || name == "." || name == "..") return false;
    if (has_control_bytes(name)) return false;
    for (char c : name) {
        if (c == '/' || c == '\\') return false;
    }
    return true;
}

} // namespace

void validate_request(const AnalysisRequest& request) {
    if (trim(request.task_text).empty()) {
        throw AnalysisError(ErrorKind::InvalidRequest, "task text is empty");
    }

    std::unordered_set<std::string> seen;
    for (const auto& file : request.attached_files) {
        if (!is_plain_file_name(file.name)) {
            throw AnalysisError(ErrorKind::InvalidRequest,
                                "attached file name is not a plain file name: '" + file.name + "'");
        }
        // One manifest line per file: a newline here would forge extra entries.
        if (has_control_bytes(file.media_type)) {
            throw AnalysisError(ErrorKind::InvalidRequest,
                                "media type of '" + file.name + "' contains control characters");
        }
        if (!seen.insert(file.name).second) {
            throw AnalysisError(ErrorKind::InvalidRequest,
                                "attached file name appears twice: '" + file.name + "'");
        }
    }
}

std::string PromptBuilder::build_manifest(const AnalysisRequest& request) {
    std::string manifest;
    for (const auto& file : request.attached_files) {
        manifest += "- " + file.name + " (" +
                    (file.media_type.empty() ? kDefaultMediaType : file.media_type) + ")\n";
    }
    return manifest;
}

std::string PromptBuilder::system_instructions(OutputShape shape) {
    const std::string shape_name = (shape == OutputShape::Array) ? "JSON array" : "JSON object";

    return
        "### ROLE\n"
        "You are an expert data analyst. You answer the user's task by writing ONE self-contained "
        "Python 3 script. The script is executed once, unattended, and only its standard output is kept.\n\n"

        "### INPUT FILES\n"
        "- The script runs with the current working directory set to a folder holding exactly the files "
        "listed under AVAILABLE FILES, under those exact names.\n"
        "- Read ONLY those files, by their bare names (e.g. pd.read_csv('data.csv')).\n"
        "- Do not read or write anywhere else on the filesystem.\n\n"

        "### ENVIRONMENT\n"
        "- Pre-installed: pandas, numpy, scikit-learn, matplotlib, seaborn, requests, beautifulsoup4, "
        "lxml, duckdb, pyarrow.\n"
        "- Do NOT include installation commands.\n"
        "- Do NOT make network calls unless the task explicitly requires retrieving data from the web.\n\n"

        "### OUTPUT CONTRACT (STRICT)\n"
        "- The script must write exactly ONE line to standard output: the final answer as a " + shape_name + ".\n"
        "- Print nothing else to standard output: no logs, no progress, no intermediate results. "
        "Diagnostics may go to standard error.\n"
        "- The top-level value MUST be a " + shape_name + ".\n"
        "- If a plot is requested, render it with matplotlib/seaborn into an in-memory buffer "
        "(io.BytesIO), encode it as a base64 data URI (data:image/png;base64,...) under 100000 bytes "
        "(lower dpi or use format='webp' if needed) and put the string inside the JSON answer.\n"
        "- Finish by printing the answer, e.g. import json; print(json.dumps(answer))\n\n"

        "### RESPONSE FORMAT\n"
        "Reply with exactly one fenced code block:\n"
        "```python\n"
        "<the complete script>\n"
        "```\n"
        "Do not emit any other code block.\n";
}

GenerationPrompt PromptBuilder::build(const AnalysisRequest& request) const {
    validate_request(request);

    GenerationPrompt prompt;
    prompt.system_instructions = system_instructions(request.expected_shape);

    std::string user;
    user += "### TASK\n";
    user += "---\n";
    user += request.task_text;
    if (request.task_text.empty() || request.task_text.back() != '\n') user += "\n";
    user += "---\n";

    // An empty manifest section only invites the model to invent file names.
    if (!request.attached_files.empty()) {
        user += "\n### AVAILABLE FILES\n";
        user += build_manifest(request);
    }

    user += "\n### EXPECTED OUTPUT\n";
    user += std::string("One line of JSON whose top-level value is a ") + to_string(request.expected_shape) + ".\n";

    prompt.user_content = std::move(user);
    return prompt;
}

} // namespace data_analyst
