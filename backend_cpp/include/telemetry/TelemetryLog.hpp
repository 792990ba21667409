#pragma once
#include <deque>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

namespace pyguard {

struct SessionTrace {
    std::string session_id;
    std::string state;
    std::string detail;
    double duration_ms = 0.0;
};

struct CollaboratorInteraction {
    long long timestamp = 0;     // ms since epoch
    std::string session_id;
    std::string collaborator;
    uint32_t fragment_version = 0;
    size_t finding_count = 0;
    std::string outcome;         // "candidates" or an error kind
    size_t candidate_count = 0;
    double duration_ms = 0.0;
};

// Bounded in-memory record of recent sessions for the admin endpoint.
// Thread-safe. Nothing is written to disk.
class TelemetryLog {
public:
    explicit TelemetryLog(size_t max_traces = 200, size_t max_interactions = 50)
        : max_traces_(max_traces), max_interactions_(max_interactions) {}

    void add_trace(const SessionTrace& trace) {
        std::lock_guard<std::mutex> lock(mtx_);
        traces_.push_back(trace);
        if (traces_.size() > max_traces_) traces_.pop_front();
    }

    void add_interaction(const CollaboratorInteraction& log) {
        std::lock_guard<std::mutex> lock(mtx_);
        interactions_.push_back(log);
        if (interactions_.size() > max_interactions_) interactions_.pop_front();
    }

    // Running tally of collaborator quality scores, one per reviewed session.
    void add_review(int score) {
        std::lock_guard<std::mutex> lock(mtx_);
        review_count_++;
        review_score_sum_ += score;
    }

    nlohmann::json get_reviews_json() const {
        std::lock_guard<std::mutex> lock(mtx_);
        nlohmann::json average = nullptr;
        if (review_count_ > 0) average = static_cast<double>(review_score_sum_) / review_count_;
        return {{"count", review_count_}, {"average_score", average}};
    }

    nlohmann::json get_traces_json() const {
        std::lock_guard<std::mutex> lock(mtx_);
        nlohmann::json j = nlohmann::json::array();
        for (const auto& t : traces_) {
            j.push_back({
                {"session_id", t.session_id},
                {"state", t.state},
                {"detail", t.detail},
                {"duration", t.duration_ms}
            });
        }
        return j;
    }

    // Newest first.
    nlohmann::json get_interactions_json() const {
        std::lock_guard<std::mutex> lock(mtx_);
        nlohmann::json j_list = nlohmann::json::array();
        for (auto it = interactions_.rbegin(); it != interactions_.rend(); ++it) {
            j_list.push_back({
                {"timestamp", it->timestamp},
                {"session_id", it->session_id},
                {"collaborator", it->collaborator},
                {"fragment_version", it->fragment_version},
                {"finding_count", it->finding_count},
                {"outcome", it->outcome},
                {"candidate_count", it->candidate_count},
                {"duration_ms", it->duration_ms}
            });
        }
        return j_list;
    }

    nlohmann::json to_json() const {
        return {
            {"traces", get_traces_json()},
            {"interactions", get_interactions_json()},
            {"reviews", get_reviews_json()}
        };
    }

private:
    size_t max_traces_;
    size_t max_interactions_;
    std::deque<SessionTrace> traces_;
    std::deque<CollaboratorInteraction> interactions_;
    size_t review_count_ = 0;
    long long review_score_sum_ = 0;
    mutable std::mutex mtx_;
};

}
