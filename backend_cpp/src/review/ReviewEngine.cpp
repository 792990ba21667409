#include "review/ReviewEngine.hpp"
#include <spdlog/spdlog.h>
#include <thread>

namespace pyguard::review {

ReviewEngine::ReviewEngine(ServiceConfig config,
                           std::shared_ptr<collab::Collaborator> collaborator,
                           std::shared_ptr<TelemetryLog> telemetry)
    : config_(std::move(config)),
      executor_(config_.interpreter, config_.require_filesystem_isolation),
      collaborator_(std::move(collaborator)),
      telemetry_(std::move(telemetry)),
      loop_(executor_, collaborator_, config_.collaborator, telemetry_) {}

std::string ReviewEngine::next_session_id() {
    auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "session_" + std::to_string(now) + "_" + std::to_string(++session_counter_);
}

AnalysisSession ReviewEngine::submit_analysis(const std::string& source_text,
                                              const AnalysisOptions& options,
                                              const ProgressSink& sink,
                                              const CancellationToken* cancel) {
    AnalysisSession session(next_session_id(), SourceFragment(source_text), options);
    spdlog::info("🔍 [{}] Analysis started ({} bytes, max {} iterations, auto_correct={})",
                 session.id(), source_text.size(), options.max_iterations, options.auto_correct);

    // Forward an external cancel into the session token for the duration of the run.
    std::atomic<bool> finished{false};
    std::thread relay;
    if (cancel) {
        CancellationToken external = *cancel;
        CancellationToken inner = session.cancellation();
        relay = std::thread([external, inner, &finished]() {
            while (!finished.load()) {
                if (external.wait_for(std::chrono::milliseconds(50))) {
                    inner.cancel();
                    return;
                }
            }
        });
    }

    auto start = std::chrono::steady_clock::now();
    try {
        loop_.run(session, sink);
    } catch (...) {
        finished = true;
        if (relay.joinable()) relay.join();
        throw;
    }
    finished = true;
    if (relay.joinable()) relay.join();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    spdlog::info("🏁 [{}] {} with {} finding(s) after {} ms",
                 session.id(), loop_state_to_string(session.state()), session.final_findings().size(), elapsed.count());
    return session;
}

ExecutionResult ReviewEngine::execute(const SourceFragment& source, const ResourceLimits& limits) const {
    return executor_.execute(source, limits);
}

analysis::StaticReport ReviewEngine::lint(const std::string& source_text) const {
    analysis::StaticAnalyzer analyzer;
    return analyzer.inspect(SourceFragment(source_text));
}

}
