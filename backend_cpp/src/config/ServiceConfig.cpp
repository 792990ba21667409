#include "config/ServiceConfig.hpp"
#include "model/Errors.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>

namespace pyguard {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

void check_port(int port, const char* key) {
    if (port <= 0 || port > 65535) throw ConfigError(std::string(key) + " must be a TCP port");
}

CollaboratorSettings collaborator_from_json(const json& j) {
    CollaboratorSettings c;
    if (j.is_null()) return c;
    if (!j.is_object()) throw ConfigError("collaborator must be a JSON object");

    c.provider = j.value("provider", c.provider);
    if (c.provider != "gemini" && c.provider != "openai") {
        throw ConfigError("collaborator.provider must be \"gemini\" or \"openai\"");
    }
    if (c.provider == "openai") {
        c.model = "gpt-4o-mini";
        c.api_key_env = "OPENAI_API_KEY";
    }

    c.endpoint = j.value("endpoint", c.endpoint);
    c.model = j.value("model", c.model);
    c.api_key_env = j.value("api_key_env", c.api_key_env);
    c.verify_ssl = j.value("verify_ssl", c.verify_ssl);
    c.timeout = std::chrono::milliseconds(j.value("timeout_ms", static_cast<long long>(c.timeout.count())));
    c.base_backoff = std::chrono::milliseconds(j.value("base_backoff_ms", static_cast<long long>(c.base_backoff.count())));
    c.max_backoff = std::chrono::milliseconds(j.value("max_backoff_ms", static_cast<long long>(c.max_backoff.count())));

    if (c.timeout.count() <= 0) throw ConfigError("collaborator.timeout_ms must be positive");
    if (c.base_backoff.count() < 0 || c.max_backoff < c.base_backoff) {
        throw ConfigError("collaborator backoff must satisfy 0 <= base_backoff_ms <= max_backoff_ms");
    }
    return c;
}

}

const std::vector<std::string>& ServiceConfig::search_paths() {
    static const std::vector<std::string> paths = {
        "pyguard.json", "../pyguard.json", "build/pyguard.json", "../../pyguard.json", "/etc/pyguard/pyguard.json"
    };
    return paths;
}

std::optional<std::string> ServiceConfig::locate() {
    for (const auto& path : search_paths()) {
        std::error_code ec;
        if (fs::is_regular_file(path, ec)) return path;
    }
    return std::nullopt;
}

ServiceConfig ServiceConfig::from_json(const json& j) {
    if (!j.is_object()) throw ConfigError("configuration root must be a JSON object");

    ServiceConfig cfg;
    try {
        cfg.rest_port = j.value("rest_port", cfg.rest_port);
        cfg.grpc_port = j.value("grpc_port", cfg.grpc_port);
        cfg.interpreter = j.value("interpreter", cfg.interpreter);
        cfg.require_filesystem_isolation = j.value("require_filesystem_isolation", cfg.require_filesystem_isolation);
        cfg.log_level = j.value("log_level", cfg.log_level);
        cfg.max_iterations = j.value("max_iterations", cfg.max_iterations);
        cfg.collaborator = collaborator_from_json(j.contains("collaborator") ? j["collaborator"] : json());
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid configuration: ") + e.what());
    }
    cfg.limits = ResourceLimits::from_json(j.contains("limits") ? j["limits"] : json());

    check_port(cfg.rest_port, "rest_port");
    check_port(cfg.grpc_port, "grpc_port");
    if (cfg.interpreter.empty()) throw ConfigError("interpreter must not be empty");
    if (cfg.max_iterations < 0 || cfg.max_iterations > 20) {
        throw ConfigError("max_iterations must be within [0, 20]");
    }
    return cfg;
}

ServiceConfig ServiceConfig::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) throw ConfigError("cannot open configuration file " + path);

    json j = json::parse(f, nullptr, false);
    if (j.is_discarded()) throw ConfigError("configuration file " + path + " is not valid JSON");

    ServiceConfig cfg = from_json(j);
    spdlog::info("⚙️ Configuration loaded from {}", path);
    return cfg;
}

json ServiceConfig::to_json() const {
    return {
        {"rest_port", rest_port},
        {"grpc_port", grpc_port},
        {"interpreter", interpreter},
        {"require_filesystem_isolation", require_filesystem_isolation},
        {"log_level", log_level},
        {"max_iterations", max_iterations},
        {"limits", limits.to_json()},
        {"collaborator", {
            {"provider", collaborator.provider},
            {"endpoint", collaborator.endpoint},
            {"model", collaborator.model},
            {"api_key_env", collaborator.api_key_env},
            {"timeout_ms", collaborator.timeout.count()},
            {"base_backoff_ms", collaborator.base_backoff.count()},
            {"max_backoff_ms", collaborator.max_backoff.count()},
            {"verify_ssl", collaborator.verify_ssl}
        }}
    };
}

}
