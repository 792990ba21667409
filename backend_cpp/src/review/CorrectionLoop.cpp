#include "review/CorrectionLoop.hpp"
#include "analysis/FindingAggregator.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace pyguard::review {

using json = nlohmann::json;
using Clock = std::chrono::steady_clock;

namespace {

// Bounds validation work when a collaborator returns a long list.
const size_t MAX_CANDIDATES_PER_ATTEMPT = 3;
const std::chrono::milliseconds MAX_RETRY_AFTER{60000};
const std::chrono::milliseconds COLLABORATOR_POLL{50};
// How long a cancelled call may take to wind down before it is abandoned.
const std::chrono::milliseconds ABANDON_GRACE{200};

// Shared with the worker thread, which may outlive an abandoned call.
struct PendingCall {
    std::mutex mutex;
    std::condition_variable ready;
    bool done = false;
    collab::CollaboratorResponse response;
};

double ms_since(Clock::time_point start) {
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

long long epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

json evaluation_payload(const Evaluation& ev) {
    json j = {
        {"version", ev.fragment->version()},
        {"finding_count", ev.findings.size()},
        {"findings", findings_to_json(ev.findings)}
    };
    j["status"] = ev.execution ? json(execution_status_to_string(ev.execution->status)) : json(nullptr);
    return j;
}

// Fewer findings first, then the healthier execution.
bool better_than(const Evaluation& a, const Evaluation& b) {
    if (a.findings.size() != b.findings.size()) return a.findings.size() < b.findings.size();
    return a.anomaly_rank() < b.anomaly_rank();
}

}

CorrectionLoop::CorrectionLoop(const sandbox::SandboxExecutor& executor,
                               std::shared_ptr<collab::Collaborator> collaborator,
                               CollaboratorSettings settings,
                               std::shared_ptr<TelemetryLog> telemetry)
    : executor_(executor),
      collaborator_(std::move(collaborator)),
      settings_(std::move(settings)),
      telemetry_(std::move(telemetry)) {}

void CorrectionLoop::notify(AnalysisSession& session, const ProgressSink& sink, LoopState state,
                            const std::string& detail, const json& payload) const {
    session.transition(state, detail);
    const PhaseRecord& phase = session.phases().back();

    if (telemetry_) telemetry_->add_trace({session.id(), loop_state_to_string(state), detail, phase.elapsed_ms});
    spdlog::debug("🔁 [{}] {}: {}", session.id(), loop_state_to_string(state), detail);

    if (sink) {
        json body = payload.is_object() ? payload : json::object();
        body["detail"] = detail;
        sink(loop_state_to_string(state), body.dump(-1, ' ', false, json::error_handler_t::replace));
    }
}

Evaluation CorrectionLoop::evaluate(const FragmentPtr& fragment, const ResourceLimits& limits,
                                    analysis::StaticAnalyzer& analyzer) const {
    Evaluation ev;
    ev.fragment = fragment;

    analysis::StaticReport report = analyzer.inspect(*fragment);
    if (!report.syntax_valid) {
        // Unparsable code is never executed.
        ev.findings = std::move(report.findings);
        return ev;
    }

    ExecutionResult result = executor_.execute(*fragment, limits);
    ev.findings = analysis::FindingAggregator::aggregate(report.findings, result);
    ev.execution = std::move(result);
    return ev;
}

collab::CollaboratorResponse CorrectionLoop::await_candidates(AnalysisSession& session, const Evaluation& current) const {
    collab::CorrectionRequest request{*current.fragment, current.findings, session.options().conversation_context};
    CancellationToken token;
    auto collaborator = collaborator_;
    const auto start = Clock::now();
    const auto deadline = start + settings_.timeout;

    auto call = std::make_shared<PendingCall>();
    std::thread([call, collaborator, request, token]() {
        collab::CollaboratorResponse response;
        try {
            response = collaborator->request_correction(request, token);
        } catch (const std::exception& e) {
            spdlog::error("💥 Collaborator {} threw: {}", collaborator->name(), e.what());
            response = collab::CollaboratorResponse::fail(collab::CollaboratorErrorKind::UNAVAILABLE, e.what());
        }
        std::lock_guard<std::mutex> lock(call->mutex);
        call->response = std::move(response);
        call->done = true;
        call->ready.notify_all();
    }).detach();

    bool timed_out = false;
    bool cancelled = false;
    std::unique_lock<std::mutex> lock(call->mutex);
    while (!call->ready.wait_for(lock, COLLABORATOR_POLL, [&call] { return call->done; })) {
        if (session.cancellation().is_cancelled()) {
            cancelled = true;
            break;
        }
        if (Clock::now() >= deadline) {
            timed_out = true;
            break;
        }
    }
    if (!call->done) {
        token.cancel();
        if (!call->ready.wait_for(lock, ABANDON_GRACE, [&call] { return call->done; })) {
            spdlog::warn("⏳ Collaborator {} ignored cancellation, abandoning the call after {:.0f} ms",
                         collaborator_->name(), ms_since(start));
        }
    }

    collab::CollaboratorResponse response;
    if (timed_out) {
        response = collab::CollaboratorResponse::fail(collab::CollaboratorErrorKind::TIMEOUT,
            "no answer within " + std::to_string(settings_.timeout.count()) + " ms");
    } else if (cancelled) {
        response = collab::CollaboratorResponse::fail(collab::CollaboratorErrorKind::CANCELLED, "session cancelled");
    } else {
        response = call->response;
    }
    lock.unlock();

    if (response.success && response.candidates.empty()) {
        response = collab::CollaboratorResponse::fail(collab::CollaboratorErrorKind::MALFORMED_RESPONSE, "no candidates");
    }

    if (telemetry_) {
        CollaboratorInteraction log;
        log.timestamp = epoch_ms();
        log.session_id = session.id();
        log.collaborator = collaborator_->name();
        log.fragment_version = current.fragment->version();
        log.finding_count = current.findings.size();
        log.outcome = response.success ? "candidates" : collab::collaborator_error_to_string(response.error->kind);
        log.candidate_count = response.candidates.size();
        log.duration_ms = ms_since(start);
        telemetry_->add_interaction(log);
    }
    return response;
}

bool CorrectionLoop::back_off(AnalysisSession& session, int streak, const collab::CollaboratorError& error) const {
    std::chrono::milliseconds delay(settings_.base_backoff.count() << std::min(streak - 1, 16));
    delay = std::min(delay, settings_.max_backoff);
    if (error.retry_after) delay = std::max(delay, std::min(*error.retry_after, MAX_RETRY_AFTER));

    spdlog::info("⏳ [{}] Rate limited, backing off {} ms", session.id(), delay.count());
    return !session.cancellation().wait_for(delay);
}

void CorrectionLoop::run(AnalysisSession& session, const ProgressSink& sink) {
    analysis::StaticAnalyzer analyzer;
    const AnalysisOptions& opts = session.options();

    notify(session, sink, LoopState::ANALYZING, "analyzing submitted fragment");
    Evaluation current = evaluate(session.original(), opts.execution_limits, analyzer);
    session.record(current);
    session.set_initial(current);

    if (current.findings.empty()) {
        notify(session, sink, LoopState::ACCEPTED, "no findings", evaluation_payload(current));
        return;
    }
    if (!opts.auto_correct) {
        notify(session, sink, LoopState::REPORTED, "auto-correct disabled", evaluation_payload(current));
        return;
    }
    if (!collaborator_ || opts.max_iterations == 0) {
        notify(session, sink, LoopState::EXHAUSTED, "no correction attempts allowed", evaluation_payload(current));
        return;
    }

    int rate_limit_streak = 0;
    for (int attempt = 1; attempt <= opts.max_iterations; attempt++) {
        if (session.cancellation().is_cancelled()) break;

        const auto started = Clock::now();
        IterationRecord record;
        record.attempt = attempt;
        record.base_version = current.fragment->version();
        record.base_finding_count = current.findings.size();

        notify(session, sink, LoopState::AWAITING_CANDIDATE,
               "attempt " + std::to_string(attempt) + "/" + std::to_string(opts.max_iterations),
               {{"attempt", attempt}, {"version", current.fragment->version()}});

        collab::CollaboratorResponse response = await_candidates(session, current);

        if (!response.success) {
            const collab::CollaboratorError error = *response.error;
            record.outcome = "collaborator-error";
            record.error = error;
            record.duration_ms = ms_since(started);
            session.add_iteration(std::move(record));
            notify(session, sink, LoopState::REJECTED,
                   "collaborator error: " + collab::collaborator_error_to_string(error.kind), error.to_json());

            if (error.kind == collab::CollaboratorErrorKind::RATE_LIMITED) {
                rate_limit_streak++;
                if (attempt < opts.max_iterations && !back_off(session, rate_limit_streak, error)) break;
            } else {
                rate_limit_streak = 0;
            }
            continue;
        }
        rate_limit_streak = 0;

        if (response.review && session.set_review(current.fragment->version(), *response.review)) {
            spdlog::info("📝 [{}] Collaborator scored v{} at {}/10", session.id(),
                         current.fragment->version(), response.review->score);
            if (telemetry_) telemetry_->add_review(response.review->score);
        }

        if (response.candidates.size() > MAX_CANDIDATES_PER_ATTEMPT) {
            response.candidates.resize(MAX_CANDIDATES_PER_ATTEMPT);
        }
        notify(session, sink, LoopState::VALIDATING_CANDIDATE,
               "validating " + std::to_string(response.candidates.size()) + " candidate(s)",
               {{"count", response.candidates.size()}});

        std::vector<Evaluation> evaluated;
        std::optional<size_t> chosen;
        for (const auto& candidate : response.candidates) {
            FragmentPtr fragment = session.add_fragment(
                current.fragment->derive(candidate.source.text(), session.next_version()));
            Evaluation ev = evaluate(fragment, opts.execution_limits, analyzer);
            session.record(ev);

            CandidateRecord cr;
            cr.version = fragment->version();
            cr.rationale = candidate.rationale;
            cr.originating_finding_ids = candidate.originating_finding_ids;
            cr.finding_count = ev.findings.size();
            if (ev.execution) cr.status = ev.execution->status;

            if (ev.execution && ev.execution->status == ExecutionStatus::SANDBOX_VIOLATION) {
                cr.verdict = "sandbox violation";
                spdlog::critical("🚨 SECURITY: [{}] candidate v{} from {} violated the sandbox and was discarded",
                                 session.id(), cr.version, collaborator_->name());
            } else if (ev.findings.size() >= current.findings.size()) {
                cr.verdict = "not an improvement";
            } else {
                cr.verdict = "improvement";
                if (!chosen || better_than(ev, evaluated[*chosen])) chosen = evaluated.size();
            }
            record.candidates.push_back(std::move(cr));
            evaluated.push_back(std::move(ev));
        }

        record.duration_ms = ms_since(started);
        if (!chosen) {
            record.outcome = "rejected";
            session.add_iteration(std::move(record));
            notify(session, sink, LoopState::REJECTED,
                   "no candidate improved on v" + std::to_string(current.fragment->version()));
            continue;
        }

        record.outcome = "promoted";
        record.candidates[*chosen].promoted = true;
        record.candidates[*chosen].verdict = "promoted";
        current = std::move(evaluated[*chosen]);
        session.promote(current);
        session.add_iteration(std::move(record));

        spdlog::info("✨ [{}] Promoted v{} ({} findings left)", session.id(), current.fragment->version(), current.findings.size());
        if (current.findings.empty()) {
            notify(session, sink, LoopState::ACCEPTED, "candidate resolved every finding", evaluation_payload(current));
            return;
        }
        notify(session, sink, LoopState::ANALYZING,
               "promoted v" + std::to_string(current.fragment->version()), evaluation_payload(current));
    }

    bool cancelled = session.cancellation().is_cancelled();
    notify(session, sink, LoopState::EXHAUSTED,
           cancelled ? "cancelled" : "iteration budget spent", evaluation_payload(session.best()));
}

}
