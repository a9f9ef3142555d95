#pragma once
#include <string>
#include "AnalystConfig.hpp"

namespace data_analyst {

struct TransportReply {
    long status_code = 0;          // 0 when no HTTP response arrived at all
    std::string body;
    std::string transport_error;   // set when status_code == 0
};

// One POST of a chat-completions payload. Implementations never throw for
// HTTP-level failures; they report them through the reply.
class ICompletionTransport {
public:
    virtual ~ICompletionTransport() = default;
    virtual TransportReply post(const std::string& payload_json) = 0;
};

// OpenAI-compatible {base_url}/chat/completions over cpr.
class CprCompletionTransport : public ICompletionTransport {
public:
    explicit CprCompletionTransport(const AnalystConfig& config);
    TransportReply post(const std::string& payload_json) override;

private:
    std::string url_;
    std::string api_key_;
    std::chrono::milliseconds timeout_;
};

} // namespace data_analyst
