#include "analysis/AnalysisResponse.hpp"

namespace data_analyst {

using ordered_json = nlohmann::ordered_json;

AnalysisResponse AnalysisResponse::success(ordered_json payload) {
    AnalysisResponse r;
    r.payload_ = std::move(payload);
    return r;
}

AnalysisResponse AnalysisResponse::failure(AnalysisFailure failure) {
    AnalysisResponse r;
    r.failure_ = std::move(failure);
    return r;
}

AnalysisResponse AnalysisResponse::failure(const AnalysisError& error) {
    return failure(AnalysisFailure{error.kind(), error.what(), error.diagnostic(), std::nullopt});
}

int AnalysisResponse::http_status() const {
    if (ok()) return 200;
    switch (failure_->kind) {
        case ErrorKind::InvalidRequest:   return 400;
        case ErrorKind::GenerationFailed: return 502;
        case ErrorKind::ExecutionFailed:
            return failure_->exit_status == ExitStatus::TimedOut ? 504 : 500;
        case ErrorKind::MalformedOutput:  return 500;
        case ErrorKind::Internal:         return 500;
    }
    return 500;
}

ordered_json AnalysisResponse::to_json() const {
    if (ok()) return payload_;

    ordered_json body = {
        {"error", to_string(failure_->kind)},
        {"message", failure_->message}
    };
    if (failure_->exit_status) {
        body["exit_status"] = to_string(*failure_->exit_status);
    }
    if (!failure_->diagnostic.empty()) {
        body["diagnostic"] = failure_->diagnostic;
    }
    return body;
}

std::string AnalysisResponse::to_body() const {
    // stderr excerpts are arbitrary bytes; never let a bad sequence throw here
    return to_json().dump(-1, ' ', false, ordered_json::error_handler_t::replace);
}

} // namespace data_analyst
