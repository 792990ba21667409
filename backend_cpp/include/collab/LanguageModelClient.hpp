#pragma once
#include <string>
#include <optional>
#include "collab/Collaborator.hpp"
#include "config/ServiceConfig.hpp"

namespace pyguard::collab {

struct ProviderReply {
    bool success = false;
    std::string text;
    std::optional<CollaboratorError> error;
};

// HTTP adapter for a hosted model (Gemini generateContent or OpenAI chat completions).
// One attempt per call; the correction loop owns retries and backoff.
class LanguageModelClient : public Collaborator {
public:
    // The API key is read from the environment variable named in `settings`.
    explicit LanguageModelClient(CollaboratorSettings settings);

    CollaboratorResponse request_correction(const CorrectionRequest& request,
                                            const CancellationToken& token) override;

    std::string name() const override { return settings_.provider + ":" + settings_.model; }

    bool configured() const { return !api_key_.empty(); }

private:
    CollaboratorSettings settings_;
    std::string api_key_;

    ProviderReply call_gemini(const std::string& prompt, const CancellationToken& token) const;
    ProviderReply call_openai(const std::string& prompt, const CancellationToken& token) const;
};

}
