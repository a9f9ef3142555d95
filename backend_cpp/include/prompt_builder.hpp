#pragma once
#include <string>
#include "analysis/AnalysisTypes.hpp"

namespace data_analyst {

// Throws AnalysisError(InvalidRequest) on blank task text or an unsafe,
// duplicate or empty file name.
void validate_request(const AnalysisRequest& request);

class PromptBuilder {
public:
    // Pure: the same request always yields the same prompt.
    GenerationPrompt build(const AnalysisRequest& request) const;

    // "- name (media/type)" per file, in upload order. Empty for no files.
    static std::string build_manifest(const AnalysisRequest& request);

private:
    static std::string system_instructions(OutputShape shape);
};

} // namespace data_analyst
