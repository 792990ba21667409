#include "collab/ResponseParser.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace pyguard::collab {

using json = nlohmann::json;

namespace {

// Body of the first ``` fence whose info string starts with `lang` (any fence when empty).
std::optional<std::string> fenced_block(const std::string& raw, const std::string& lang) {
    size_t pos = 0;
    while ((pos = raw.find("```", pos)) != std::string::npos) {
        size_t info_end = raw.find('\n', pos + 3);
        if (info_end == std::string::npos) return std::nullopt;
        std::string info = raw.substr(pos + 3, info_end - pos - 3);
        size_t close = raw.find("```", info_end + 1);
        if (close == std::string::npos) return std::nullopt;

        if (lang.empty() || info.rfind(lang, 0) == 0) {
            return raw.substr(info_end + 1, close - info_end - 1);
        }
        pos = close + 3;
    }
    return std::nullopt;
}

json parse_object(const std::string& text) {
    size_t start = text.find('{');
    size_t end = text.rfind('}');
    if (start == std::string::npos || end == std::string::npos || end < start) return json(json::value_t::discarded);
    return json::parse(text.substr(start, end - start + 1), nullptr, false);
}

std::vector<std::string> finding_ids(const json& item) {
    std::vector<std::string> ids;
    if (!item.contains("finding_ids") || !item["finding_ids"].is_array()) return ids;
    for (const auto& id : item["finding_ids"]) {
        if (id.is_string()) ids.push_back(id.get<std::string>());
    }
    return ids;
}

std::vector<std::string> string_list(const json& item, const char* key) {
    std::vector<std::string> out;
    if (!item.contains(key) || !item[key].is_array()) return out;
    for (const auto& entry : item[key]) {
        if (entry.is_string() && !entry.get<std::string>().empty()) out.push_back(entry.get<std::string>());
    }
    return out;
}

}

std::optional<QualityReview> parse_review(const json& j) {
    if (!j.is_object() || !j.contains("score") || !j["score"].is_number()) return std::nullopt;
    double raw_score = j["score"].get<double>();
    if (!std::isfinite(raw_score)) return std::nullopt;

    QualityReview review;
    review.score = static_cast<int>(std::lround(
        std::clamp(raw_score, double(MIN_QUALITY_SCORE), double(MAX_QUALITY_SCORE))));
    review.positive_aspects = string_list(j, "positive_aspects");
    review.suggestions = string_list(j, "suggestions");
    if (j.contains("summary") && j["summary"].is_string()) review.summary = j["summary"].get<std::string>();
    return review;
}

json extract_json(const std::string& raw) {
    if (auto block = fenced_block(raw, "json")) {
        json j = parse_object(*block);
        if (!j.is_discarded()) return j;
    }
    return parse_object(raw);
}

CollaboratorResponse parse_candidates(const std::string& raw, const SourceFragment& base) {
    if (raw.find_first_not_of(" \r\n\t") == std::string::npos) {
        return CollaboratorResponse::fail(CollaboratorErrorKind::MALFORMED_RESPONSE, "empty reply");
    }

    std::vector<CorrectionCandidate> candidates;
    std::optional<QualityReview> review;
    json j = extract_json(raw);

    if (!j.is_discarded() && j.is_object()) {
        json items = json::array();
        if (j.contains("candidates") && j["candidates"].is_array()) items = j["candidates"];
        else if (j.contains("code")) items.push_back(j);

        for (const auto& item : items) {
            if (!item.is_object() || !item.contains("code") || !item["code"].is_string()) continue;
            std::string code = item["code"].get<std::string>();
            if (code.find_first_not_of(" \r\n\t") == std::string::npos) continue;

            std::string rationale = item.contains("rationale") && item["rationale"].is_string()
                                        ? item["rationale"].get<std::string>() : "";
            candidates.push_back({base.derive(std::move(code), 0), std::move(rationale), finding_ids(item)});
        }
        if (j.contains("review")) review = parse_review(j["review"]);
    } else if (auto block = fenced_block(raw, "python")) {
        // Some models ignore the format and reply with a bare code block.
        candidates.push_back({base.derive(*block, 0), "", {}});
    }

    if (candidates.empty()) {
        return CollaboratorResponse::fail(CollaboratorErrorKind::MALFORMED_RESPONSE,
                                          "reply contained no usable candidate");
    }
    CollaboratorResponse response = CollaboratorResponse::ok(std::move(candidates));
    response.review = std::move(review);
    return response;
}

std::string build_correction_prompt(const CorrectionRequest& request) {
    std::ostringstream prompt;
    prompt << "You are reviewing a Python snippet. Fix the problems listed below without changing "
              "the snippet's intent.\n";
    if (!request.conversation_context.empty()) {
        prompt << "\nContext from the user:\n" << request.conversation_context << "\n";
    }
    prompt << "\nSnippet:\n```python\n" << request.source.text() << "\n```\n\nFindings:\n";
    for (const auto& f : request.findings) {
        prompt << "- [" << f.id << "] " << finding_kind_to_string(f.kind) << " " << f.code;
        if (f.location) prompt << " at line " << f.location->line;
        prompt << ": " << f.message << "\n";
    }
    prompt << "\nReply with JSON only, in this shape:\n"
              "{\"candidates\": [{\"code\": \"<full corrected snippet>\", \"rationale\": \"<one sentence>\", "
              "\"finding_ids\": [\"<ids addressed>\"]}], "
              "\"review\": {\"score\": <overall quality of the original snippet, 1-10>, "
              "\"positive_aspects\": [\"<what is done well>\"], \"suggestions\": [\"<general improvements>\"], "
              "\"summary\": \"<one sentence>\"}}\n";
    return prompt.str();
}

}
