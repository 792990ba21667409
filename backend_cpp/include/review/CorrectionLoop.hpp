#pragma once
#include <functional>
#include <memory>
#include <string>
#include "analysis/StaticAnalyzer.hpp"
#include "collab/Collaborator.hpp"
#include "config/ServiceConfig.hpp"
#include "review/AnalysisSession.hpp"
#include "sandbox/SandboxExecutor.hpp"
#include "telemetry/TelemetryLog.hpp"

namespace pyguard::review {

// Receives (phase, payload) for every state transition. Payload is JSON text.
using ProgressSink = std::function<void(const std::string&, const std::string&)>;

/**
 * Analyze -> ask for a fix -> validate the fix, bounded by max_iterations.
 * Every collaborator request consumes one attempt, whatever its outcome.
 * Candidates go through the same analyzer + sandbox path as user input.
 * Only InfrastructureError escapes run().
 */
class CorrectionLoop {
public:
    CorrectionLoop(const sandbox::SandboxExecutor& executor,
                   std::shared_ptr<collab::Collaborator> collaborator,
                   CollaboratorSettings settings,
                   std::shared_ptr<TelemetryLog> telemetry = nullptr);

    void run(AnalysisSession& session, const ProgressSink& sink = nullptr);

    // Analyzer findings, then (only for parsable code) one sandbox run, aggregated.
    Evaluation evaluate(const FragmentPtr& fragment, const ResourceLimits& limits,
                        analysis::StaticAnalyzer& analyzer) const;

private:
    const sandbox::SandboxExecutor& executor_;
    std::shared_ptr<collab::Collaborator> collaborator_;
    CollaboratorSettings settings_;
    std::shared_ptr<TelemetryLog> telemetry_;

    collab::CollaboratorResponse await_candidates(AnalysisSession& session, const Evaluation& current) const;
    bool back_off(AnalysisSession& session, int streak, const collab::CollaboratorError& error) const;

    void notify(AnalysisSession& session, const ProgressSink& sink, LoopState state,
                const std::string& detail, const nlohmann::json& payload = nlohmann::json::object()) const;
};

}
