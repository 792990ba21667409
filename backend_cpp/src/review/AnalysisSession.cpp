#include "review/AnalysisSession.hpp"
#include "model/Errors.hpp"

namespace pyguard::review {

using json = nlohmann::json;

AnalysisOptions AnalysisOptions::from_json(const json& j, const ServiceConfig& config) {
    AnalysisOptions opts;
    opts.max_iterations = config.max_iterations;
    opts.execution_limits = config.limits;
    if (j.is_null()) return opts;
    if (!j.is_object()) throw ConfigError("options must be a JSON object");

    try {
        opts.max_iterations = j.value("max_iterations", opts.max_iterations);
        opts.auto_correct = j.value("auto_correct", opts.auto_correct);
        opts.conversation_context = j.value("conversation_context", std::string());
        if (j.contains("entry_point") && !j["entry_point"].is_null()) {
            opts.entry_point = j["entry_point"].get<std::string>();
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid options: ") + e.what());
    }
    if (opts.max_iterations < 0 || opts.max_iterations > 20) {
        throw ConfigError("max_iterations must be within [0, 20]");
    }
    if (opts.entry_point && opts.entry_point->empty()) opts.entry_point.reset();

    opts.execution_limits = ResourceLimits::from_json(
        j.contains("execution_limits") ? j["execution_limits"] : json(), config.limits);
    return opts;
}

json AnalysisOptions::to_json() const {
    return {
        {"max_iterations", max_iterations},
        {"execution_limits", execution_limits.to_json()},
        {"auto_correct", auto_correct},
        {"entry_point", entry_point ? json(*entry_point) : json(nullptr)}
    };
}

json CandidateRecord::to_json() const {
    return {
        {"version", version},
        {"rationale", rationale},
        {"originating_finding_ids", originating_finding_ids},
        {"finding_count", finding_count},
        {"status", status ? json(execution_status_to_string(*status)) : json(nullptr)},
        {"promoted", promoted},
        {"verdict", verdict}
    };
}

json IterationRecord::to_json() const {
    json cands = json::array();
    for (const auto& c : candidates) cands.push_back(c.to_json());
    return {
        {"attempt", attempt},
        {"base_version", base_version},
        {"base_finding_count", base_finding_count},
        {"outcome", outcome},
        {"error", error ? error->to_json() : json(nullptr)},
        {"candidates", cands},
        {"duration_ms", duration_ms}
    };
}

AnalysisSession::AnalysisSession(std::string id, SourceFragment original, AnalysisOptions options)
    : id_(std::move(id)), options_(std::move(options)), started_(std::chrono::steady_clock::now()) {
    SourceFragment v0(original.text(), options_.entry_point ? options_.entry_point : original.entry_point(), 0);
    fragments_.push_back(std::make_shared<const SourceFragment>(std::move(v0)));
    initial_.fragment = fragments_.front();
    best_.fragment = fragments_.front();
}

FragmentPtr AnalysisSession::add_fragment(SourceFragment fragment) {
    fragments_.push_back(std::make_shared<const SourceFragment>(std::move(fragment)));
    return fragments_.back();
}

void AnalysisSession::record(const Evaluation& evaluation) {
    if (evaluation.execution) executions_.push_back(*evaluation.execution);
}

void AnalysisSession::set_initial(const Evaluation& evaluation) {
    initial_ = evaluation;
    best_ = evaluation;
}

void AnalysisSession::promote(const Evaluation& evaluation) {
    if (evaluation.findings.size() < best_.findings.size()) best_ = evaluation;
}

void AnalysisSession::transition(LoopState state, std::string detail) {
    state_ = state;
    double elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_).count();
    phases_.push_back({state, std::move(detail), elapsed});
}

bool AnalysisSession::set_review(uint32_t version, collab::QualityReview review) {
    if (review_) return false;
    review_ = std::move(review);
    review_version_ = version;
    return true;
}

json AnalysisSession::summary_json() const {
    json phases = json::array();
    for (const auto& p : phases_) {
        phases.push_back({{"state", loop_state_to_string(p.state)}, {"detail", p.detail}, {"elapsed_ms", p.elapsed_ms}});
    }
    json iterations = json::array();
    for (const auto& it : iterations_) iterations.push_back(it.to_json());
    json executions = json::array();
    for (const auto& e : executions_) executions.push_back(e.to_json());
    json fragments = json::array();
    for (const auto& f : fragments_) fragments.push_back(f->to_json());
    json review = nullptr;
    if (review_) {
        review = review_->to_json();
        review["fragment_version"] = review_version_;
    }

    return {
        {"session_id", id_},
        {"state", loop_state_to_string(state_)},
        {"options", options_.to_json()},
        {"best_fragment", best_.fragment->to_json()},
        {"findings", findings_to_json(best_.findings)},
        {"initial_finding_count", initial_.findings.size()},
        {"review", review},
        {"iterations", iterations},
        {"executions", executions},
        {"fragments", fragments},
        {"phases", phases}
    };
}

}
