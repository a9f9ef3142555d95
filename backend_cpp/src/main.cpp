#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <cstring>
#include <memory>

#include "AnalystConfig.hpp"
#include "analysis_pipeline.hpp"
#include "code_generation_client.hpp"
#include "transport/CompletionTransport.hpp"

using json = nlohmann::json;

namespace {

const char* kQuestionsFile = "questions.txt";

} // namespace

class DataAnalystServer {
public:
    explicit DataAnalystServer(const data_analyst::AnalystConfig& config)
        : config_(config)
    {
        auto transport = std::make_shared<data_analyst::CprCompletionTransport>(config_);
        auto generator = std::make_shared<data_analyst::CodeGenerationClient>(config_, transport);
        pipeline_ = std::make_shared<data_analyst::AnalysisPipeline>(config_, generator);

        int workers = config_.worker_threads;
        server_.new_task_queue = [workers] { return new httplib::ThreadPool(workers); };
        setup_routes();
    }

    bool run() {
        spdlog::info("🚀 Data Analyst Agent listening on {}:{} ({} workers)",
                     config_.listen_host, config_.http_port, config_.worker_threads);
        return server_.listen(config_.listen_host, config_.http_port);
    }

private:
    data_analyst::AnalystConfig config_;
    httplib::Server server_;
    std::shared_ptr<data_analyst::AnalysisPipeline> pipeline_;

    void setup_routes() {
        server_.Get("/", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(json{{"status", "ok"}}.dump(), "application/json");
        });

        server_.Post("/api/", [this](const httplib::Request& req, httplib::Response& res) {
            this->handle_analyze(req, res);
        });
    }

    static void reply(httplib::Response& res, const data_analyst::AnalysisResponse& response) {
        res.status = response.http_status();
        res.set_content(response.to_body(), "application/json");
    }

    static data_analyst::AnalysisResponse bad_request(const std::string& message) {
        return data_analyst::AnalysisResponse::failure(
            data_analyst::AnalysisError(data_analyst::ErrorKind::InvalidRequest, message));
    }

    void handle_analyze(const httplib::Request& req, httplib::Response& res) {
        try {
            if (!req.is_multipart_form_data()) {
                reply(res, bad_request("expected multipart/form-data"));
                return;
            }

            data_analyst::AnalysisRequest request;
            std::string shape_text = req.get_param_value("output_shape");
            bool has_questions = false;

            for (const auto& [field, part] : req.files) {
                if (part.filename.empty()) {
                    if (field == "output_shape") shape_text = part.content;
                    continue;
                }
                if (part.filename == kQuestionsFile) {
                    request.task_text = part.content;
                    has_questions = true;
                }
                // questions.txt is attached too: the script may re-read it
                request.attached_files.push_back({part.filename, part.content, part.content_type});
            }

            if (!has_questions) {
                reply(res, bad_request("questions.txt is missing"));
                return;
            }
            if (!data_analyst::parse_output_shape(shape_text, request.expected_shape)) {
                reply(res, bad_request("output_shape must be 'array' or 'object'"));
                return;
            }

            spdlog::info("📥 Analysis request: {} files, {} bytes of task text",
                         request.attached_files.size(), request.task_text.size());

            // A client that hangs up kills its sandboxed script.
            data_analyst::CancellationToken cancel([&req] {
                return req.is_connection_closed && req.is_connection_closed();
            });
            reply(res, pipeline_->run(request, &cancel));
        } catch (const std::exception& e) {
            spdlog::error("❌ Request handling error: {}", e.what());
            reply(res, data_analyst::AnalysisResponse::failure(data_analyst::AnalysisFailure{
                data_analyst::ErrorKind::Internal, "internal error while processing the request", "",
                std::nullopt}));
        }
    }
};

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    std::string config_path;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            spdlog::set_level(spdlog::level::debug);
        } else {
            spdlog::error("Usage: {} [--config <analyst.json>] [--verbose]", argv[0]);
            return 2;
        }
    }

    data_analyst::AnalystConfig config;
    try {
        config = data_analyst::load_analyst_config(config_path);
    } catch (const std::exception& e) {
        spdlog::critical("🚨 Configuration error: {}", e.what());
        return 1;
    }

    DataAnalystServer server(config);
    if (!server.run()) {
        spdlog::critical("🚨 Could not bind {}:{}", config.listen_host, config.http_port);
        return 1;
    }
    return 0;
}
