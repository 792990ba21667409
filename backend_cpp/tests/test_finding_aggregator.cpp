#include <gtest/gtest.h>
#include "analysis/FindingAggregator.hpp"

using namespace pyguard;
using namespace pyguard::analysis;

namespace {

ExecutionResult failed_with(const std::string& type, const std::string& message, int line) {
    ExecutionResult r;
    r.status = ExecutionStatus::RUNTIME_ERROR;
    r.exit_code = 1;
    ExceptionTrace trace;
    trace.type = type;
    trace.message = message;
    trace.line = line;
    trace.frames.push_back({line, "<module>"});
    r.exception_trace = trace;
    return r;
}

}

TEST(FindingAggregatorTest, SuccessAddsNothing) {
    ExecutionResult ok;
    EXPECT_FALSE(FindingAggregator::runtime_finding(ok).has_value());

    std::vector<Finding> statics = {
        make_finding(FindingKind::LINT, "unused-import", SourceLocation{1, 8}, "'os' imported but unused", Severity::WARNING)
    };
    auto merged = FindingAggregator::aggregate(statics, ok);
    ASSERT_EQ(merged.size(), 1u);
    EXPECT_EQ(merged[0].id, statics[0].id);
}

TEST(FindingAggregatorTest, ExceptionBecomesRuntimeFindingAtTraceLine) {
    auto merged = FindingAggregator::aggregate({}, failed_with("ZeroDivisionError", "division by zero", 3));
    ASSERT_EQ(merged.size(), 1u);
    EXPECT_EQ(merged[0].kind, FindingKind::RUNTIME);
    EXPECT_EQ(merged[0].code, "runtime-error");
    EXPECT_EQ(merged[0].message, "ZeroDivisionError: division by zero");
    ASSERT_TRUE(merged[0].location.has_value());
    EXPECT_EQ(merged[0].location->line, 3);
}

TEST(FindingAggregatorTest, TimeoutHasNoLocation) {
    ExecutionResult r;
    r.status = ExecutionStatus::TIMEOUT;
    r.wall_time = std::chrono::milliseconds(1000);
    auto f = FindingAggregator::runtime_finding(r);
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(f->code, "timeout");
    EXPECT_FALSE(f->location.has_value());
    EXPECT_NE(f->message.find("infinite loop"), std::string::npos);
}

TEST(FindingAggregatorTest, TimeoutIdIsStableAcrossRuns) {
    ExecutionResult a;
    a.status = ExecutionStatus::TIMEOUT;
    a.wall_time = std::chrono::milliseconds(1004);
    ExecutionResult b = a;
    b.wall_time = std::chrono::milliseconds(1030);
    EXPECT_EQ(FindingAggregator::runtime_finding(a)->id, FindingAggregator::runtime_finding(b)->id);
}

TEST(FindingAggregatorTest, ViolationIsCritical) {
    ExecutionResult r;
    r.status = ExecutionStatus::SANDBOX_VIOLATION;
    r.violation = "open: /etc/passwd";
    auto f = FindingAggregator::runtime_finding(r);
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(f->code, "sandbox-violation");
    EXPECT_EQ(f->severity, Severity::CRITICAL);
    EXPECT_EQ(f->message, "sandbox violation: open: /etc/passwd");
}

TEST(FindingAggregatorTest, ResourceLimitNamesTheLimit) {
    ExecutionResult r;
    r.status = ExecutionStatus::RESOURCE_LIMIT_EXCEEDED;
    r.limit = "output";
    auto f = FindingAggregator::runtime_finding(r);
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(f->message, "resource limit exceeded (output)");
}

TEST(FindingAggregatorTest, SignalWithoutTraceIsDescribed) {
    ExecutionResult r;
    r.status = ExecutionStatus::RUNTIME_ERROR;
    r.term_signal = 11;
    auto f = FindingAggregator::runtime_finding(r);
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(f->message, "process terminated by signal 11");
}

TEST(FindingAggregatorTest, StaticUndefinedNameExplainsNameError) {
    std::vector<Finding> statics = {
        make_finding(FindingKind::LOGICAL, "undefined-name", SourceLocation{2, 7}, "undefined name 'totl'", Severity::ERROR)
    };
    auto merged = FindingAggregator::aggregate(statics, failed_with("NameError", "name 'totl' is not defined", 2));
    ASSERT_EQ(merged.size(), 1u);
    EXPECT_EQ(merged[0].code, "undefined-name");
}

TEST(FindingAggregatorTest, UnrelatedRuntimeErrorOnSameLineIsKept) {
    std::vector<Finding> statics = {
        make_finding(FindingKind::LINT, "shadowed-builtin", SourceLocation{2, 1}, "'list' shadows a built-in", Severity::WARNING)
    };
    auto merged = FindingAggregator::aggregate(statics, failed_with("IndexError", "list index out of range", 2));
    ASSERT_EQ(merged.size(), 2u);
    EXPECT_EQ(merged[0].code, "shadowed-builtin");
    EXPECT_EQ(merged[1].code, "runtime-error");
}

TEST(FindingAggregatorTest, DuplicateStaticFindingsCollapse) {
    Finding f = make_finding(FindingKind::LINT, "unused-import", SourceLocation{1, 8}, "'os' imported but unused", Severity::WARNING);
    auto merged = FindingAggregator::aggregate({f, f}, ExecutionResult{});
    EXPECT_EQ(merged.size(), 1u);
}
