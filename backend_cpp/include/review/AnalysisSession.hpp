#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>
#include "model/ReviewTypes.hpp"
#include "collab/Collaborator.hpp"
#include "config/ServiceConfig.hpp"
#include "utils/CancellationToken.hpp"

namespace pyguard::review {

enum class LoopState {
    ANALYZING,
    AWAITING_CANDIDATE,
    VALIDATING_CANDIDATE,
    ACCEPTED,
    REJECTED,
    EXHAUSTED,
    REPORTED   // auto_correct disabled: findings reported, no correction attempted
};

inline std::string loop_state_to_string(LoopState s) {
    switch (s) {
        case LoopState::ANALYZING: return "Analyzing";
        case LoopState::AWAITING_CANDIDATE: return "AwaitingCandidate";
        case LoopState::VALIDATING_CANDIDATE: return "ValidatingCandidate";
        case LoopState::ACCEPTED: return "Accepted";
        case LoopState::REJECTED: return "Rejected";
        case LoopState::EXHAUSTED: return "Exhausted";
        case LoopState::REPORTED: return "Reported";
    }
    return "Exhausted";
}

inline bool is_terminal(LoopState s) {
    return s == LoopState::ACCEPTED || s == LoopState::EXHAUSTED || s == LoopState::REPORTED;
}

struct AnalysisOptions {
    int max_iterations = 3;
    ResourceLimits execution_limits;
    bool auto_correct = true;
    std::string conversation_context;
    std::optional<std::string> entry_point;

    // Missing keys fall back to the service configuration. Throws ConfigError.
    static AnalysisOptions from_json(const nlohmann::json& j, const ServiceConfig& config);
    nlohmann::json to_json() const;
};

// Static findings plus (when the fragment parsed) one execution, aggregated.
struct Evaluation {
    FragmentPtr fragment;
    std::vector<Finding> findings;
    std::optional<ExecutionResult> execution;

    // Candidates that never ran rank below every executed status.
    int anomaly_rank() const { return execution ? status_anomaly_rank(execution->status) : 3; }
};

struct CandidateRecord {
    uint32_t version = 0;
    std::string rationale;
    std::vector<std::string> originating_finding_ids;
    size_t finding_count = 0;
    std::optional<ExecutionStatus> status;
    bool promoted = false;
    std::string verdict;

    nlohmann::json to_json() const;
};

struct IterationRecord {
    int attempt = 0;
    uint32_t base_version = 0;
    size_t base_finding_count = 0;
    std::string outcome;  // "promoted", "rejected", "collaborator-error"
    std::optional<collab::CollaboratorError> error;
    std::vector<CandidateRecord> candidates;
    double duration_ms = 0.0;

    nlohmann::json to_json() const;
};

struct PhaseRecord {
    LoopState state;
    std::string detail;
    double elapsed_ms;
};

/**
 * Everything one analysis request produced. Fragments are kept as immutable
 * versions (v0 is the submission); every execution is tied to one version.
 * Owned by the caller for the duration of the request only.
 */
class AnalysisSession {
public:
    AnalysisSession(std::string id, SourceFragment original, AnalysisOptions options);

    const std::string& id() const { return id_; }
    const AnalysisOptions& options() const { return options_; }
    const FragmentPtr& original() const { return fragments_.front(); }
    const std::vector<FragmentPtr>& fragments() const { return fragments_; }
    const std::vector<ExecutionResult>& executions() const { return executions_; }
    const std::vector<IterationRecord>& iterations() const { return iterations_; }
    const std::vector<PhaseRecord>& phases() const { return phases_; }

    LoopState state() const { return state_; }
    const Evaluation& initial() const { return initial_; }
    const Evaluation& best() const { return best_; }
    const std::vector<Finding>& final_findings() const { return best_.findings; }

    // Shared with whoever may abort the request (e.g. a dropped client).
    const CancellationToken& cancellation() const { return cancellation_; }

    uint32_t next_version() { return next_version_++; }

    FragmentPtr add_fragment(SourceFragment fragment);
    void record(const Evaluation& evaluation);
    void set_initial(const Evaluation& evaluation);
    void promote(const Evaluation& evaluation);
    void add_iteration(IterationRecord record) { iterations_.push_back(std::move(record)); }
    void transition(LoopState state, std::string detail);

    // Only the first review is kept: it grades the earliest fragment the collaborator saw.
    bool set_review(uint32_t version, collab::QualityReview review);
    const std::optional<collab::QualityReview>& review() const { return review_; }

    nlohmann::json summary_json() const;

private:
    std::string id_;
    AnalysisOptions options_;
    CancellationToken cancellation_;
    std::chrono::steady_clock::time_point started_;

    LoopState state_ = LoopState::ANALYZING;
    uint32_t next_version_ = 1;
    std::vector<FragmentPtr> fragments_;
    std::vector<ExecutionResult> executions_;
    std::vector<IterationRecord> iterations_;
    std::vector<PhaseRecord> phases_;
    Evaluation initial_;
    Evaluation best_;
    std::optional<collab::QualityReview> review_;
    uint32_t review_version_ = 0;
};

}
