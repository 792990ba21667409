#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <grpcpp/grpcpp.h>
#include <memory>
#include <signal.h>

#include "utils/Scrubber.hpp"
#include "model/Errors.hpp"
#include "config/ServiceConfig.hpp"
#include "collab/LanguageModelClient.hpp"
#include "telemetry/TelemetryLog.hpp"
#include "review/ReviewEngine.hpp"
#include "service/ReviewService.hpp"

using json = nlohmann::json;

std::unique_ptr<httplib::Server> global_server_ptr;

void signal_handler(int signum) {
    spdlog::info("🛑 Interrupt signal ({}) received. Shutting down...", signum);
    if (global_server_ptr) {
        global_server_ptr->stop();
    }
}

namespace {

void send_json(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
}

void send_error(httplib::Response& res, int status, const std::string& message) {
    send_json(res, status, {{"success", false}, {"error", message}});
}

// Scrubbed, lenient parse. Returns discarded on anything that is not an object.
json parse_body(const httplib::Request& req) {
    json body = json::parse(pyguard::scrub_json_string(req.body), nullptr, false);
    if (!body.is_object()) return json(json::value_t::discarded);
    return body;
}

std::optional<std::string> require_source(const json& body) {
    if (!body.contains("source") || !body["source"].is_string()) return std::nullopt;
    return body["source"].get<std::string>();
}

}

class PyGuardServer {
public:
    explicit PyGuardServer(const pyguard::ServiceConfig& config) : config_(config) {
        telemetry_ = std::make_shared<pyguard::TelemetryLog>();

        auto client = std::make_shared<pyguard::collab::LanguageModelClient>(config.collaborator);
        engine_ = std::make_shared<pyguard::review::ReviewEngine>(config, client, telemetry_);

        server_ = std::make_unique<httplib::Server>();
        setup_routes();
    }

    void run() {
        start_grpc();

        spdlog::info("🚀 REST Server listening on port {}", config_.rest_port);
        global_server_ptr = std::move(server_);
        global_server_ptr->listen("0.0.0.0", config_.rest_port);

        if (grpc_server_) grpc_server_->Shutdown();
        spdlog::info("👋 Servers stopped");
    }

private:
    pyguard::ServiceConfig config_;
    std::shared_ptr<pyguard::TelemetryLog> telemetry_;
    std::shared_ptr<pyguard::review::ReviewEngine> engine_;
    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<pyguard::service::ReviewServiceImpl> grpc_service_;
    std::unique_ptr<grpc::Server> grpc_server_;

    // gRPC serves from its own completion threads; Shutdown() happens after REST stops.
    void start_grpc() {
        std::string address = "0.0.0.0:" + std::to_string(config_.grpc_port);
        grpc_service_ = std::make_unique<pyguard::service::ReviewServiceImpl>(engine_);

        grpc::ServerBuilder builder;
        builder.AddListeningPort(address, grpc::InsecureServerCredentials());
        builder.RegisterService(grpc_service_.get());
        grpc_server_ = builder.BuildAndStart();
        if (!grpc_server_) {
            spdlog::error("❌ gRPC server failed to start on {}", address);
            return;
        }
        spdlog::info("📡 gRPC ReviewService listening on {}", address);
    }

    void setup_routes() {
        server_->Post("/api/analyze", [this](const httplib::Request& req, httplib::Response& res) {
            json body = parse_body(req);
            if (body.is_discarded()) return send_error(res, 400, "body must be a JSON object");
            auto source = require_source(body);
            if (!source) return send_error(res, 400, "'source' must be a string");

            try {
                auto options = engine_->options_from_json(body.value("options", json()));
                auto session = engine_->submit_analysis(*source, options);
                send_json(res, 200, session.summary_json());
            } catch (const pyguard::ConfigError& e) {
                send_error(res, 400, e.what());
            } catch (const pyguard::InfrastructureError& e) {
                spdlog::error("❌ Sandbox infrastructure failure: {}", e.what());
                send_error(res, 503, e.what());
            }
        });

        server_->Post("/api/execute", [this](const httplib::Request& req, httplib::Response& res) {
            json body = parse_body(req);
            if (body.is_discarded()) return send_error(res, 400, "body must be a JSON object");
            auto source = require_source(body);
            if (!source) return send_error(res, 400, "'source' must be a string");

            try {
                std::optional<std::string> entry;
                if (body.contains("entry_point") && body["entry_point"].is_string()) {
                    entry = body["entry_point"].get<std::string>();
                    if (entry->empty()) entry.reset();
                }
                auto limits = pyguard::ResourceLimits::from_json(body.value("limits", json()), config_.limits);
                auto result = engine_->execute(pyguard::SourceFragment(*source, entry), limits);
                send_json(res, 200, result.to_json());
            } catch (const pyguard::ConfigError& e) {
                send_error(res, 400, e.what());
            } catch (const pyguard::InfrastructureError& e) {
                spdlog::error("❌ Sandbox infrastructure failure: {}", e.what());
                send_error(res, 503, e.what());
            }
        });

        server_->Post("/api/lint", [this](const httplib::Request& req, httplib::Response& res) {
            json body = parse_body(req);
            if (body.is_discarded()) return send_error(res, 400, "body must be a JSON object");
            auto source = require_source(body);
            if (!source) return send_error(res, 400, "'source' must be a string");
            send_json(res, 200, engine_->lint(*source).to_json());
        });

        server_->Get("/api/admin/telemetry", [this](const httplib::Request&, httplib::Response& res) {
            send_json(res, 200, telemetry_->to_json());
        });

        server_->Get("/api/hello", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(R"({"status": "nominal"})", "application/json");
        });

        server_->set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                spdlog::error("💥 {} {} failed: {}", req.method, req.path, e.what());
                send_error(res, 500, e.what());
            }
        });
    }
};

pyguard::ServiceConfig load_config(int argc, char** argv) {
    std::optional<std::string> path;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) path = argv[++i];
    }
    if (!path) path = pyguard::ServiceConfig::locate();
    if (!path) {
        spdlog::warn("⚠️ pyguard.json not found, using defaults");
        return pyguard::ServiceConfig();
    }
    return pyguard::ServiceConfig::load(*path);
}

int main(int argc, char** argv) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    // A fragment closing its pipe early must not take the service down.
    signal(SIGPIPE, SIG_IGN);

    pyguard::ServiceConfig config;
    try {
        config = load_config(argc, argv);
    } catch (const pyguard::ConfigError& e) {
        spdlog::critical("❌ Invalid configuration: {}", e.what());
        return 2;
    }
    spdlog::set_level(spdlog::level::from_str(config.log_level));

    PyGuardServer app(config);
    app.run(); // This blocks

    return 0;
}
