#pragma once
#include <atomic>
#include <memory>
#include <string>
#include "analysis/StaticAnalyzer.hpp"
#include "collab/Collaborator.hpp"
#include "config/ServiceConfig.hpp"
#include "review/AnalysisSession.hpp"
#include "review/CorrectionLoop.hpp"
#include "sandbox/SandboxExecutor.hpp"
#include "telemetry/TelemetryLog.hpp"

namespace pyguard::review {

// Entry point shared by the REST and gRPC surfaces. Requests share no mutable
// state beyond the thread-safe telemetry ring; each gets its own session.
class ReviewEngine {
public:
    ReviewEngine(ServiceConfig config,
                 std::shared_ptr<collab::Collaborator> collaborator,
                 std::shared_ptr<TelemetryLog> telemetry);

    // Always completes with a session unless the sandbox itself cannot be set
    // up (InfrastructureError). `cancel` may be cancelled from another thread.
    AnalysisSession submit_analysis(const std::string& source_text,
                                    const AnalysisOptions& options,
                                    const ProgressSink& sink = nullptr,
                                    const CancellationToken* cancel = nullptr);

    ExecutionResult execute(const SourceFragment& source, const ResourceLimits& limits) const;
    analysis::StaticReport lint(const std::string& source_text) const;

    AnalysisOptions options_from_json(const nlohmann::json& j) const {
        return AnalysisOptions::from_json(j, config_);
    }

    const ServiceConfig& config() const { return config_; }
    const sandbox::SandboxExecutor& executor() const { return executor_; }
    std::shared_ptr<TelemetryLog> telemetry() const { return telemetry_; }

private:
    const ServiceConfig config_;
    sandbox::SandboxExecutor executor_;
    std::shared_ptr<collab::Collaborator> collaborator_;
    std::shared_ptr<TelemetryLog> telemetry_;
    CorrectionLoop loop_;
    std::atomic<uint64_t> session_counter_{0};

    std::string next_session_id();
};

}
