#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <unistd.h>
#include "config/ServiceConfig.hpp"
#include "model/Errors.hpp"
#include "review/AnalysisSession.hpp"

using namespace pyguard;
using json = nlohmann::json;

TEST(ServiceConfigTest, EmptyObjectGivesDefaults) {
    ServiceConfig cfg = ServiceConfig::from_json(json::object());
    EXPECT_EQ(cfg.rest_port, 5002);
    EXPECT_EQ(cfg.grpc_port, 50051);
    EXPECT_EQ(cfg.interpreter, "python3");
    EXPECT_TRUE(cfg.require_filesystem_isolation);
    EXPECT_EQ(cfg.max_iterations, 3);
    EXPECT_EQ(cfg.limits.max_wall_time, std::chrono::milliseconds(5000));
    EXPECT_EQ(cfg.limits.max_memory, 256ull * 1024 * 1024);
    EXPECT_EQ(cfg.limits.max_output_bytes, 64u * 1024);
    EXPECT_FALSE(cfg.limits.network_allowed);
    EXPECT_FALSE(cfg.limits.filesystem_allowed);
    EXPECT_EQ(cfg.collaborator.provider, "gemini");
    EXPECT_EQ(cfg.collaborator.api_key_env, "GEMINI_API_KEY");
}

TEST(ServiceConfigTest, OpenAiProviderSwitchesDefaults) {
    ServiceConfig cfg = ServiceConfig::from_json({{"collaborator", {{"provider", "openai"}}}});
    EXPECT_EQ(cfg.collaborator.model, "gpt-4o-mini");
    EXPECT_EQ(cfg.collaborator.api_key_env, "OPENAI_API_KEY");
}

TEST(ServiceConfigTest, LimitsAreParsedInSeconds) {
    ServiceConfig cfg = ServiceConfig::from_json({{"limits", {{"max_wall_time", 1.5}, {"filesystem_allowed", true}}}});
    EXPECT_EQ(cfg.limits.max_wall_time, std::chrono::milliseconds(1500));
    EXPECT_TRUE(cfg.limits.filesystem_allowed);
    EXPECT_EQ(cfg.limits.max_memory, 256ull * 1024 * 1024);
}

TEST(ServiceConfigTest, FilesystemIsolationCanBeRelaxed) {
    ServiceConfig cfg = ServiceConfig::from_json({{"require_filesystem_isolation", false}});
    EXPECT_FALSE(cfg.require_filesystem_isolation);
    EXPECT_FALSE(cfg.to_json()["require_filesystem_isolation"].get<bool>());
}

TEST(ServiceConfigTest, InvalidValuesThrowConfigError) {
    EXPECT_THROW(ServiceConfig::from_json(json::array()), ConfigError);
    EXPECT_THROW(ServiceConfig::from_json({{"rest_port", 70000}}), ConfigError);
    EXPECT_THROW(ServiceConfig::from_json({{"max_iterations", -1}}), ConfigError);
    EXPECT_THROW(ServiceConfig::from_json({{"interpreter", ""}}), ConfigError);
    EXPECT_THROW(ServiceConfig::from_json({{"limits", {{"max_wall_time", 0}}}}), ConfigError);
    EXPECT_THROW(ServiceConfig::from_json({{"limits", {{"max_wall_time", 301}}}}), ConfigError);
    EXPECT_THROW(ServiceConfig::from_json({{"limits", {{"max_memory", 1024}}}}), ConfigError);
    EXPECT_THROW(ServiceConfig::from_json({{"limits", {{"max_output_bytes", 0}}}}), ConfigError);
    EXPECT_THROW(ServiceConfig::from_json({{"collaborator", {{"provider", "local"}}}}), ConfigError);
    EXPECT_THROW(ServiceConfig::from_json({{"rest_port", "not a number"}}), ConfigError);
}

TEST(ServiceConfigTest, LoadReadsFileAndRejectsBadJson) {
    auto dir = std::filesystem::temp_directory_path() / ("pyguard-config-" + std::to_string(::getpid()));
    std::filesystem::create_directories(dir);

    auto good = dir / "pyguard.json";
    std::ofstream(good) << R"({"rest_port": 6000, "max_iterations": 5})";
    ServiceConfig cfg = ServiceConfig::load(good.string());
    EXPECT_EQ(cfg.rest_port, 6000);
    EXPECT_EQ(cfg.max_iterations, 5);

    auto bad = dir / "broken.json";
    std::ofstream(bad) << "{ rest_port: ";
    EXPECT_THROW(ServiceConfig::load(bad.string()), ConfigError);
    EXPECT_THROW(ServiceConfig::load((dir / "missing.json").string()), ConfigError);

    std::filesystem::remove_all(dir);
}

TEST(ServiceConfigTest, ToJsonNeverCarriesSecrets) {
    ServiceConfig cfg;
    json j = cfg.to_json();
    EXPECT_EQ(j["collaborator"]["api_key_env"], "GEMINI_API_KEY");
    EXPECT_FALSE(j["collaborator"].contains("api_key"));
}

TEST(AnalysisOptionsTest, RequestOverridesServiceDefaults) {
    ServiceConfig cfg;
    auto opts = review::AnalysisOptions::from_json(
        {{"max_iterations", 1}, {"auto_correct", false}, {"entry_point", "main"},
         {"execution_limits", {{"max_wall_time", 2}}}}, cfg);
    EXPECT_EQ(opts.max_iterations, 1);
    EXPECT_FALSE(opts.auto_correct);
    ASSERT_TRUE(opts.entry_point.has_value());
    EXPECT_EQ(*opts.entry_point, "main");
    EXPECT_EQ(opts.execution_limits.max_wall_time, std::chrono::milliseconds(2000));
    EXPECT_EQ(opts.execution_limits.max_memory, cfg.limits.max_memory);
}

TEST(AnalysisOptionsTest, NullUsesServiceDefaults) {
    ServiceConfig cfg;
    cfg.max_iterations = 7;
    auto opts = review::AnalysisOptions::from_json(json(), cfg);
    EXPECT_EQ(opts.max_iterations, 7);
    EXPECT_TRUE(opts.auto_correct);
    EXPECT_FALSE(opts.entry_point.has_value());
}

TEST(AnalysisOptionsTest, OutOfRangeIterationsRejected) {
    ServiceConfig cfg;
    EXPECT_THROW(review::AnalysisOptions::from_json({{"max_iterations", 21}}, cfg), ConfigError);
    EXPECT_THROW(review::AnalysisOptions::from_json({{"execution_limits", {{"max_memory", 10}}}}, cfg), ConfigError);
}
