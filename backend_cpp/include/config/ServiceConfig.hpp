#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <nlohmann/json.hpp>
#include "model/ReviewTypes.hpp"

namespace pyguard {

struct CollaboratorSettings {
    std::string provider = "gemini";          // "gemini" | "openai"
    std::string endpoint;                     // Empty: provider default
    std::string model = "gemini-2.0-flash";
    std::string api_key_env = "GEMINI_API_KEY";
    std::chrono::milliseconds timeout{30000};
    std::chrono::milliseconds base_backoff{500};
    std::chrono::milliseconds max_backoff{8000};
    bool verify_ssl = true;
};

// Immutable after load; passed by const reference to whoever needs it.
struct ServiceConfig {
    int rest_port = 5002;
    int grpc_port = 50051;
    std::string interpreter = "python3";
    bool require_filesystem_isolation = true;   // Refuse to execute without Landlock
    std::string log_level = "info";
    int max_iterations = 3;
    ResourceLimits limits;
    CollaboratorSettings collaborator;

    // Throws ConfigError.
    static ServiceConfig from_json(const nlohmann::json& j);
    static ServiceConfig load(const std::string& path);

    // First existing file from the default search list.
    static std::optional<std::string> locate();
    static const std::vector<std::string>& search_paths();

    // Secrets never appear here (only the variable name).
    nlohmann::json to_json() const;
};

}
