#include "service/ReviewService.hpp"
#include "model/Errors.hpp"
#include "utils/Scrubber.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <thread>

namespace pyguard::service {

using json = nlohmann::json;

namespace {

AnalysisEvent make_event(const std::string& phase, const std::string& payload) {
    AnalysisEvent ev;
    ev.set_phase(phase);
    ev.set_payload(payload);
    return ev;
}

}

grpc::Status ReviewServiceImpl::SubmitAnalysis(grpc::ServerContext* context,
                                               const AnalysisRequest* request,
                                               grpc::ServerWriter<AnalysisEvent>* writer) {
    writer->Write(make_event("STARTUP", "Review service connected."));

    review::AnalysisOptions options;
    try {
        json raw;
        if (!request->options_json().empty()) {
            raw = json::parse(scrub_json_string(request->options_json()), nullptr, false);
            if (raw.is_discarded()) {
                return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "options_json is not valid JSON");
            }
        }
        options = engine_->options_from_json(raw);
    } catch (const ConfigError& e) {
        spdlog::warn("⚠️ gRPC SubmitAnalysis rejected: {}", e.what());
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, e.what());
    }

    // The client may hang up mid-session; stop the loop when it does.
    CancellationToken cancel;
    std::atomic<bool> finished{false};
    std::thread watcher([&]() {
        while (!finished.load()) {
            if (context->IsCancelled()) {
                spdlog::info("🛑 gRPC client went away, cancelling session");
                cancel.cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    auto sink = [writer](const std::string& phase, const std::string& payload) {
        writer->Write(make_event(phase, payload));
    };

    grpc::Status status = grpc::Status::OK;
    try {
        review::AnalysisSession session = engine_->submit_analysis(request->source(), options, sink, &cancel);
        writer->Write(make_event("SUMMARY",
            session.summary_json().dump(-1, ' ', false, json::error_handler_t::replace)));
        if (cancel.is_cancelled()) status = grpc::Status(grpc::StatusCode::CANCELLED, "client cancelled");
    } catch (const InfrastructureError& e) {
        spdlog::error("❌ Sandbox infrastructure failure: {}", e.what());
        status = grpc::Status(grpc::StatusCode::UNAVAILABLE, e.what());
    } catch (const std::exception& e) {
        spdlog::error("💥 SubmitAnalysis failed: {}", e.what());
        status = grpc::Status(grpc::StatusCode::INTERNAL, e.what());
    }

    finished = true;
    watcher.join();
    return status;
}

}
