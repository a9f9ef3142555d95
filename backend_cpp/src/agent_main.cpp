#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>
#include <cstring>
#include <memory>

#include "analyst.pb.h"
#include "analyst.grpc.pb.h"
#include "AnalystConfig.hpp"
#include "analysis_pipeline.hpp"
#include "code_generation_client.hpp"
#include "transport/CompletionTransport.hpp"

using grpc::Server;
using grpc::ServerBuilder;

namespace {

data_analyst::AnalysisRequest to_request(const data_analyst::rpc::AnalysisTask& task) {
    data_analyst::AnalysisRequest request;
    request.task_text = task.task_text();
    for (const auto& f : task.files()) {
        request.attached_files.push_back({f.name(), f.content(), f.media_type()});
    }
    return request;
}

} // namespace

class AnalystServiceImpl final : public ::data_analyst::rpc::AnalystService::Service {
    std::shared_ptr<data_analyst::AnalysisPipeline> pipeline;

public:
    explicit AnalystServiceImpl(std::shared_ptr<data_analyst::AnalysisPipeline> p) : pipeline(p) {}

    grpc::Status Analyze(grpc::ServerContext* context,
                         const ::data_analyst::rpc::AnalysisTask* task,
                         grpc::ServerWriter<::data_analyst::rpc::AnalysisEvent>* writer) override {
        auto notify = [writer](const std::string& phase, const std::string& payload, int status = 0) {
            ::data_analyst::rpc::AnalysisEvent ev;
            ev.set_phase(phase);
            ev.set_payload(payload);
            ev.set_http_status(status);
            writer->Write(ev);
        };

        notify("STARTUP", "Analyst Service Connected.");

        data_analyst::AnalysisRequest request = to_request(*task);
        switch (task->output_shape()) {
            case ::data_analyst::rpc::OUTPUT_SHAPE_ARRAY:
                request.expected_shape = data_analyst::OutputShape::Array;
                break;
            case ::data_analyst::rpc::OUTPUT_SHAPE_OBJECT:
                request.expected_shape = data_analyst::OutputShape::Object;
                break;
            default: {
                auto rejected = data_analyst::AnalysisResponse::failure(data_analyst::AnalysisError(
                    data_analyst::ErrorKind::InvalidRequest, "output_shape must be ARRAY or OBJECT"));
                notify("ERROR", rejected.to_body(), rejected.http_status());
                return grpc::Status::OK;
            }
        }

        // Client disconnect or deadline kills the sandboxed script.
        data_analyst::CancellationToken cancel([context] { return context->IsCancelled(); });

        auto response = pipeline->run(request, &cancel,
            [&notify](const std::string& phase, const std::string& detail) { notify(phase, detail); });

        notify(response.ok() ? "FINAL" : "ERROR", response.to_body(), response.http_status());
        return grpc::Status::OK;
    }
};

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    std::string config_path;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            spdlog::error("Usage: {} [--config <analyst.json>]", argv[0]);
            return 2;
        }
    }

    // 1. Configuration, read once
    data_analyst::AnalystConfig config;
    try {
        config = data_analyst::load_analyst_config(config_path);
    } catch (const std::exception& e) {
        spdlog::critical("🚨 Configuration error: {}", e.what());
        return 1;
    }

    // 2. Core services
    auto transport = std::make_shared<data_analyst::CprCompletionTransport>(config);
    auto generator = std::make_shared<data_analyst::CodeGenerationClient>(config, transport);
    auto pipeline = std::make_shared<data_analyst::AnalysisPipeline>(config, generator);
    AnalystServiceImpl service(pipeline);

    // 3. Start gRPC Server
    std::string server_address = config.listen_host + ":" + std::to_string(config.grpc_port);
    ServerBuilder builder;
    builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
    builder.RegisterService(&service);
    std::unique_ptr<Server> server(builder.BuildAndStart());
    if (!server) {
        spdlog::critical("🚨 Could not start gRPC service on {}", server_address);
        return 1;
    }

    spdlog::info("🚀 Analyst gRPC Service ignited on {}", server_address);
    server->Wait();
    return 0;
}
