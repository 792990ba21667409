#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "collab/Collaborator.hpp"

namespace pyguard::collab {

// Pulls the first JSON object out of model text: a ```json fence, any fence, or a bare {...}.
// Returns a discarded value when nothing parses.
nlohmann::json extract_json(const std::string& raw);

// Score is clamped to 1-10 and rounded. nullopt without a numeric score.
std::optional<QualityReview> parse_review(const nlohmann::json& j);

// Turns model text into candidates derived from `base`.
// Empty or unusable replies become MALFORMED_RESPONSE.
CollaboratorResponse parse_candidates(const std::string& raw, const SourceFragment& base);

// Instruction text sent to the model for one request.
std::string build_correction_prompt(const CorrectionRequest& request);

}
