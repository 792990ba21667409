#include "model/ReviewTypes.hpp"
#include "model/Errors.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace pyguard {

using json = nlohmann::json;

namespace {

// FNV-1a: stable across runs, unlike std::hash.
uint64_t fingerprint(const std::string& s) {
    uint64_t h = 1469598103934665603ull;
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ull;
    }
    return h;
}

json location_to_json(const std::optional<SourceLocation>& loc) {
    if (!loc) return nullptr;
    json j = {{"line", loc->line}};
    if (loc->column > 0) j["column"] = loc->column;
    return j;
}

}

json SourceFragment::to_json() const {
    json j = {
        {"version", version_},
        {"text", text_}
    };
    j["entry_point"] = entry_point_ ? json(*entry_point_) : json(nullptr);
    j["parent_version"] = parent_version_ ? json(*parent_version_) : json(nullptr);
    return j;
}

Finding make_finding(FindingKind kind,
                     std::string code,
                     std::optional<SourceLocation> location,
                     std::string message,
                     Severity severity) {
    Finding f;
    f.kind = kind;
    f.code = std::move(code);
    f.location = location;
    f.message = std::move(message);
    f.severity = severity;

    std::ostringstream key;
    key << finding_kind_to_string(kind) << '|' << f.code << '|';
    if (location) key << location->line << ':' << location->column;
    key << '|' << f.message;

    std::ostringstream id;
    id << 'F' << std::hex << std::setw(12) << std::setfill('0')
       << (fingerprint(key.str()) & 0xffffffffffffull);
    f.id = id.str();
    return f;
}

json Finding::to_json() const {
    return {
        {"id", id},
        {"kind", finding_kind_to_string(kind)},
        {"code", code},
        {"location", location_to_json(location)},
        {"message", message},
        {"severity", severity_to_string(severity)}
    };
}

json findings_to_json(const std::vector<Finding>& findings) {
    json arr = json::array();
    for (const auto& f : findings) arr.push_back(f.to_json());
    return arr;
}

json ExceptionTrace::to_json() const {
    json frames_json = json::array();
    for (const auto& fr : frames) {
        frames_json.push_back({{"line", fr.line}, {"function", fr.function}});
    }
    return {
        {"type", type},
        {"message", message},
        {"line", line ? json(*line) : json(nullptr)},
        {"frames", frames_json},
        {"formatted", formatted}
    };
}

void ResourceLimits::validate() const {
    if (max_wall_time.count() <= 0 || max_wall_time > std::chrono::minutes(5)) {
        throw ConfigError("max_wall_time must be within (0, 300] seconds");
    }
    if (max_memory < 32ull * 1024 * 1024) {
        throw ConfigError("max_memory must be at least 32 MiB");
    }
    if (max_output_bytes == 0) {
        throw ConfigError("max_output_bytes must be positive");
    }
}

json ResourceLimits::to_json() const {
    return {
        {"max_wall_time", max_wall_time.count() / 1000.0},
        {"max_memory", max_memory},
        {"max_output_bytes", max_output_bytes},
        {"network_allowed", network_allowed},
        {"filesystem_allowed", filesystem_allowed}
    };
}

ResourceLimits ResourceLimits::from_json(const json& j, const ResourceLimits& defaults) {
    ResourceLimits out = defaults;
    if (j.is_null()) return out;
    if (!j.is_object()) throw ConfigError("limits must be a JSON object");

    try {
        if (j.contains("max_wall_time")) {
            double seconds = j.at("max_wall_time").get<double>();
            if (!std::isfinite(seconds) || seconds <= 0) {
                throw ConfigError("max_wall_time must be a positive number of seconds");
            }
            out.max_wall_time = std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
        }
        if (j.contains("max_memory")) out.max_memory = j.at("max_memory").get<uint64_t>();
        if (j.contains("max_output_bytes")) out.max_output_bytes = j.at("max_output_bytes").get<size_t>();
        if (j.contains("network_allowed")) out.network_allowed = j.at("network_allowed").get<bool>();
        if (j.contains("filesystem_allowed")) out.filesystem_allowed = j.at("filesystem_allowed").get<bool>();
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid limits: ") + e.what());
    }

    out.validate();
    return out;
}

json ExecutionResult::to_json() const {
    json j = {
        {"status", execution_status_to_string(status)},
        {"stdout", stdout_data},
        {"stderr", stderr_data},
        {"exception_trace", exception_trace ? exception_trace->to_json() : json(nullptr)},
        {"wall_time_ms", wall_time.count()},
        {"peak_memory", peak_memory},
        {"stdout_truncated", stdout_truncated},
        {"stderr_truncated", stderr_truncated},
        {"fragment_version", fragment_version}
    };
    j["exit_code"] = exit_code ? json(*exit_code) : json(nullptr);
    j["signal"] = term_signal ? json(*term_signal) : json(nullptr);
    if (!violation.empty()) j["violation"] = violation;
    if (!limit.empty()) j["limit"] = limit;
    return j;
}

json CorrectionCandidate::to_json() const {
    return {
        {"source", source.text()},
        {"rationale", rationale},
        {"originating_finding_ids", originating_finding_ids}
    };
}

}
