#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <nlohmann/json.hpp>
#include "model/ReviewTypes.hpp"
#include "utils/CancellationToken.hpp"

namespace pyguard::collab {

enum class CollaboratorErrorKind {
    TIMEOUT,
    RATE_LIMITED,
    UNAVAILABLE,
    MALFORMED_RESPONSE,
    CANCELLED,
    NOT_CONFIGURED
};

inline std::string collaborator_error_to_string(CollaboratorErrorKind k) {
    switch (k) {
        case CollaboratorErrorKind::TIMEOUT: return "Timeout";
        case CollaboratorErrorKind::RATE_LIMITED: return "RateLimited";
        case CollaboratorErrorKind::UNAVAILABLE: return "Unavailable";
        case CollaboratorErrorKind::MALFORMED_RESPONSE: return "MalformedResponse";
        case CollaboratorErrorKind::CANCELLED: return "Cancelled";
        case CollaboratorErrorKind::NOT_CONFIGURED: return "NotConfigured";
    }
    return "Unavailable";
}

struct CollaboratorError {
    CollaboratorErrorKind kind = CollaboratorErrorKind::UNAVAILABLE;
    std::string message;
    std::optional<std::chrono::milliseconds> retry_after; // RATE_LIMITED only

    nlohmann::json to_json() const {
        nlohmann::json j = {{"kind", collaborator_error_to_string(kind)}, {"message", message}};
        if (retry_after) j["retry_after_ms"] = retry_after->count();
        return j;
    }
};

struct CorrectionRequest {
    SourceFragment source;
    std::vector<Finding> findings;
    std::string conversation_context;
};

const int MIN_QUALITY_SCORE = 1;
const int MAX_QUALITY_SCORE = 10;

// The collaborator's overall opinion of the fragment it was shown.
struct QualityReview {
    int score = MIN_QUALITY_SCORE;
    std::vector<std::string> positive_aspects;
    std::vector<std::string> suggestions;
    std::string summary;

    nlohmann::json to_json() const {
        return {
            {"score", score},
            {"positive_aspects", positive_aspects},
            {"suggestions", suggestions},
            {"summary", summary}
        };
    }
};

// Either candidates or an error, never both. A review only rides along with candidates.
struct CollaboratorResponse {
    bool success = false;
    std::vector<CorrectionCandidate> candidates;
    std::optional<CollaboratorError> error;
    std::optional<QualityReview> review;

    static CollaboratorResponse ok(std::vector<CorrectionCandidate> candidates) {
        CollaboratorResponse r;
        r.success = true;
        r.candidates = std::move(candidates);
        return r;
    }

    static CollaboratorResponse fail(CollaboratorErrorKind kind, std::string message,
                                     std::optional<std::chrono::milliseconds> retry_after = std::nullopt) {
        CollaboratorResponse r;
        r.error = CollaboratorError{kind, std::move(message), retry_after};
        return r;
    }
};

/**
 * Remote fixer for a fragment. Implementations are slow and fallible.
 * They should return promptly once `token` is cancelled; a call that does
 * not is abandoned on a worker thread and its answer dropped. They must not
 * retry internally, and report failures as values rather than exceptions.
 * Returned code is untrusted.
 */
class Collaborator {
public:
    virtual ~Collaborator() = default;

    virtual CollaboratorResponse request_correction(const CorrectionRequest& request,
                                                    const CancellationToken& token) = 0;

    virtual std::string name() const = 0;
};

}
