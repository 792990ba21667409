#include "collab/LanguageModelClient.hpp"
#include "collab/ResponseParser.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>

namespace pyguard::collab {

using json = nlohmann::json;

namespace {

const char* const GEMINI_BASE_URL = "https://generativelanguage.googleapis.com/v1beta/";
const char* const OPENAI_URL = "https://api.openai.com/v1/chat/completions";

std::optional<std::chrono::milliseconds> parse_retry_after(const cpr::Response& r) {
    auto it = r.header.find("Retry-After");
    if (it == r.header.end()) return std::nullopt;
    char* end = nullptr;
    long seconds = std::strtol(it->second.c_str(), &end, 10);
    if (end == it->second.c_str() || seconds < 0) return std::nullopt;
    return std::chrono::milliseconds(seconds * 1000);
}

// Maps transport and HTTP failures. Empty when the response is a usable 200.
std::optional<CollaboratorError> classify(const cpr::Response& r, const CancellationToken& token) {
    if (token.is_cancelled()) {
        return CollaboratorError{CollaboratorErrorKind::CANCELLED, "request cancelled", std::nullopt};
    }
    if (r.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) {
        return CollaboratorError{CollaboratorErrorKind::TIMEOUT, r.error.message, std::nullopt};
    }
    if (r.error.code != cpr::ErrorCode::OK) {
        return CollaboratorError{CollaboratorErrorKind::UNAVAILABLE,
                                 r.error.message.empty() ? "transport failure" : r.error.message, std::nullopt};
    }
    if (r.status_code == 429) {
        return CollaboratorError{CollaboratorErrorKind::RATE_LIMITED, "HTTP 429", parse_retry_after(r)};
    }
    if (r.status_code >= 500 || r.status_code == 0) {
        return CollaboratorError{CollaboratorErrorKind::UNAVAILABLE, "HTTP " + std::to_string(r.status_code), std::nullopt};
    }
    if (r.status_code != 200) {
        return CollaboratorError{CollaboratorErrorKind::MALFORMED_RESPONSE,
                                 "HTTP " + std::to_string(r.status_code) + ": " + r.text.substr(0, 200), std::nullopt};
    }
    return std::nullopt;
}

cpr::ProgressCallback abort_on_cancel(const CancellationToken& token) {
    return cpr::ProgressCallback([token](cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t,
                                         cpr::cpr_pf_arg_t, intptr_t) -> bool {
        return !token.is_cancelled();
    });
}

ProviderReply malformed(const std::string& what) {
    return {false, "", CollaboratorError{CollaboratorErrorKind::MALFORMED_RESPONSE, what, std::nullopt}};
}

}

LanguageModelClient::LanguageModelClient(CollaboratorSettings settings) : settings_(std::move(settings)) {
    const char* key = settings_.api_key_env.empty() ? nullptr : std::getenv(settings_.api_key_env.c_str());
    if (key) api_key_ = key;

    if (api_key_.empty()) {
        spdlog::warn("⚠️ Collaborator {}: ${} is not set, corrections are disabled", name(), settings_.api_key_env);
    } else {
        spdlog::info("🤖 Collaborator ready: {}", name());
    }
}

CollaboratorResponse LanguageModelClient::request_correction(const CorrectionRequest& request,
                                                             const CancellationToken& token) {
    if (api_key_.empty()) {
        return CollaboratorResponse::fail(CollaboratorErrorKind::NOT_CONFIGURED,
                                          "no API key in $" + settings_.api_key_env);
    }
    if (token.is_cancelled()) {
        return CollaboratorResponse::fail(CollaboratorErrorKind::CANCELLED, "request cancelled");
    }

    std::string prompt = build_correction_prompt(request);
    auto start = std::chrono::steady_clock::now();
    ProviderReply reply = settings_.provider == "openai" ? call_openai(prompt, token) : call_gemini(prompt, token);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    if (!reply.success) {
        spdlog::warn("⚠️ Collaborator {} failed after {} ms: {} ({})", name(), elapsed.count(),
                     collaborator_error_to_string(reply.error->kind), reply.error->message);
        CollaboratorResponse r;
        r.error = reply.error;
        return r;
    }

    spdlog::debug("🤖 Collaborator {} replied in {} ms ({} chars)", name(), elapsed.count(), reply.text.size());
    return parse_candidates(reply.text, request.source);
}

ProviderReply LanguageModelClient::call_gemini(const std::string& prompt, const CancellationToken& token) const {
    std::string base = settings_.endpoint.empty() ? GEMINI_BASE_URL : settings_.endpoint;
    std::string model_path = settings_.model.rfind("models/", 0) == 0 ? settings_.model : "models/" + settings_.model;

    cpr::Response r = cpr::Post(
        cpr::Url{base + model_path + ":generateContent"},
        cpr::Parameters{{"key", api_key_}},
        cpr::Body{json{
            {"contents", {{ {"parts", {{{"text", prompt}}}} }}},
            {"generationConfig", {{"temperature", 0.2}, {"responseMimeType", "application/json"}}}
        }.dump()},
        cpr::Header{{"Content-Type", "application/json"}},
        cpr::VerifySsl{settings_.verify_ssl},
        cpr::Timeout{settings_.timeout},
        abort_on_cancel(token));

    if (auto error = classify(r, token)) return {false, "", error};

    json body = json::parse(r.text, nullptr, false);
    if (body.is_discarded()) return malformed("response body is not JSON");
    try {
        const auto& candidates = body.at("candidates");
        if (!candidates.is_array() || candidates.empty()) return malformed("no candidates in response");
        return {true, candidates.at(0).at("content").at("parts").at(0).at("text").get<std::string>(), std::nullopt};
    } catch (const json::exception& e) {
        return malformed(std::string("unexpected response shape: ") + e.what());
    }
}

ProviderReply LanguageModelClient::call_openai(const std::string& prompt, const CancellationToken& token) const {
    std::string url = settings_.endpoint.empty() ? OPENAI_URL : settings_.endpoint;

    cpr::Response r = cpr::Post(
        cpr::Url{url},
        cpr::Body{json{
            {"model", settings_.model},
            {"temperature", 0.2},
            {"messages", {
                {{"role", "system"}, {"content", "You fix Python code and answer with JSON only."}},
                {{"role", "user"}, {"content", prompt}}
            }}
        }.dump()},
        cpr::Header{{"Content-Type", "application/json"}, {"Authorization", "Bearer " + api_key_}},
        cpr::VerifySsl{settings_.verify_ssl},
        cpr::Timeout{settings_.timeout},
        abort_on_cancel(token));

    if (auto error = classify(r, token)) return {false, "", error};

    json body = json::parse(r.text, nullptr, false);
    if (body.is_discarded()) return malformed("response body is not JSON");
    try {
        const auto& choices = body.at("choices");
        if (!choices.is_array() || choices.empty()) return malformed("no choices in response");
        return {true, choices.at(0).at("message").at("content").get<std::string>(), std::nullopt};
    } catch (const json::exception& e) {
        return malformed(std::string("unexpected response shape: ") + e.what());
    }
}

}
