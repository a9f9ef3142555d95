#include "transport/CompletionTransport.hpp"
#include <cpr/cpr.h>

namespace data_analyst {

CprCompletionTransport::CprCompletionTransport(const AnalystConfig& config)
    : api_key_(config.api_key),
      timeout_(config.request_timeout) {
    std::string base = config.base_url;
    while (!base.empty() && base.back() == '/') base.pop_back();
    url_ = base + "/chat/completions";
}

TransportReply CprCompletionTransport::post(const std::string& payload_json) {
    cpr::Response r = cpr::Post(cpr::Url{url_},
                                cpr::Header{
                                    {"Authorization", "Bearer " + api_key_},
                                    {"Content-Type", "application/json"}
                                },
                                cpr::Body{payload_json},
                                cpr::Timeout{timeout_});

    TransportReply reply;
    if (r.error.code != cpr::ErrorCode::OK) {
        reply.status_code = 0;
        reply.transport_error = r.error.message.empty() ? "transport error" : r.error.message;
        return reply;
    }
    reply.status_code = r.status_code;
    reply.body = std::move(r.text);
    return reply;
}

} // namespace data_analyst
