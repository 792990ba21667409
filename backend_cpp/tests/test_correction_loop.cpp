#include <gtest/gtest.h>
#include <atomic>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include "review/CorrectionLoop.hpp"

using namespace pyguard;
using namespace pyguard::review;
using collab::CollaboratorErrorKind;
using collab::CollaboratorResponse;

namespace {

// Plays back one scripted reply per request. Runs out into Unavailable.
class ScriptedCollaborator : public collab::Collaborator {
public:
    using Step = std::function<CollaboratorResponse(const collab::CorrectionRequest&, const CancellationToken&)>;

    void then(Step step) {
        std::lock_guard<std::mutex> lock(mtx_);
        steps_.push_back(std::move(step));
    }

    void then_code(std::vector<std::string> codes) {
        then([codes](const collab::CorrectionRequest&, const CancellationToken&) {
            std::vector<CorrectionCandidate> out;
            for (const auto& c : codes) out.push_back({SourceFragment(c), "scripted", {}});
            return CollaboratorResponse::ok(std::move(out));
        });
    }

    void then_error(CollaboratorErrorKind kind,
                    std::optional<std::chrono::milliseconds> retry_after = std::nullopt) {
        then([kind, retry_after](const collab::CorrectionRequest&, const CancellationToken&) {
            return CollaboratorResponse::fail(kind, "scripted failure", retry_after);
        });
    }

    CollaboratorResponse request_correction(const collab::CorrectionRequest& request,
                                            const CancellationToken& token) override {
        calls++;
        Step step;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (steps_.empty()) {
                return CollaboratorResponse::fail(CollaboratorErrorKind::UNAVAILABLE, "script exhausted");
            }
            step = std::move(steps_.front());
            steps_.pop_front();
        }
        last_request_findings = request.findings.size();
        return step(request, token);
    }

    std::string name() const override { return "scripted"; }

    std::atomic<int> calls{0};
    std::atomic<size_t> last_request_findings{0};

private:
    std::mutex mtx_;
    std::deque<Step> steps_;
};

}

class CorrectionLoopTest : public ::testing::Test {
protected:
    sandbox::SandboxExecutor executor;
    std::shared_ptr<ScriptedCollaborator> collaborator = std::make_shared<ScriptedCollaborator>();
    std::shared_ptr<TelemetryLog> telemetry = std::make_shared<TelemetryLog>();
    CollaboratorSettings settings;
    AnalysisOptions options;

    void SetUp() override {
        if (!executor.available()) GTEST_SKIP() << "python3 >= 3.8 not available";
        settings.timeout = std::chrono::milliseconds(2000);
        settings.base_backoff = std::chrono::milliseconds(10);
        settings.max_backoff = std::chrono::milliseconds(50);
        options.max_iterations = 3;
    }

    AnalysisSession run(const std::string& code, const ProgressSink& sink = nullptr) {
        AnalysisSession session("test-session", SourceFragment(code), options);
        CorrectionLoop loop(executor, collaborator, settings, telemetry);
        loop.run(session, sink);
        return session;
    }
};

TEST_F(CorrectionLoopTest, CleanFragmentIsAcceptedWithoutCollaborator) {
    auto session = run("print('fine')\n");
    EXPECT_EQ(session.state(), LoopState::ACCEPTED);
    EXPECT_TRUE(session.final_findings().empty());
    EXPECT_EQ(collaborator->calls.load(), 0);
    ASSERT_EQ(session.executions().size(), 1u);
    EXPECT_EQ(session.executions()[0].status, ExecutionStatus::SUCCESS);
}

TEST_F(CorrectionLoopTest, DivisionByZeroFixedAndAccepted) {
    collaborator->then_code({"print(1)\n"});
    auto session = run("print(1/0)\n");

    EXPECT_EQ(session.state(), LoopState::ACCEPTED);
    EXPECT_EQ(session.best().fragment->text(), "print(1)\n");
    EXPECT_EQ(session.best().fragment->version(), 1u);
    EXPECT_EQ(session.best().fragment->parent_version().value_or(99), 0u);
    EXPECT_TRUE(session.final_findings().empty());
    EXPECT_EQ(session.initial().findings.size(), 1u);
    EXPECT_EQ(collaborator->calls.load(), 1);
    EXPECT_EQ(collaborator->last_request_findings.load(), 1u);

    ASSERT_EQ(session.iterations().size(), 1u);
    EXPECT_EQ(session.iterations()[0].outcome, "promoted");
    ASSERT_EQ(session.executions().size(), 2u);
    EXPECT_EQ(session.executions()[0].fragment_version, 0u);
    EXPECT_EQ(session.executions()[1].fragment_version, 1u);

    // The submission itself is never modified.
    EXPECT_EQ(session.original()->text(), "print(1/0)\n");
}

TEST_F(CorrectionLoopTest, UnreachableCollaboratorExhaustsWithOriginal) {
    options.max_iterations = 2;
    collaborator->then_error(CollaboratorErrorKind::UNAVAILABLE);
    collaborator->then_error(CollaboratorErrorKind::UNAVAILABLE);
    auto session = run("print(1/0)\n");

    EXPECT_EQ(session.state(), LoopState::EXHAUSTED);
    EXPECT_EQ(session.best().fragment->version(), 0u);
    EXPECT_EQ(session.best().fragment->text(), "print(1/0)\n");
    EXPECT_FALSE(session.final_findings().empty());
    EXPECT_EQ(collaborator->calls.load(), 2);
    ASSERT_EQ(session.iterations().size(), 2u);
    EXPECT_EQ(session.iterations()[0].outcome, "collaborator-error");
    EXPECT_EQ(session.iterations()[0].error->kind, CollaboratorErrorKind::UNAVAILABLE);
}

TEST_F(CorrectionLoopTest, NonImprovingCandidateIsRejected) {
    options.max_iterations = 1;
    collaborator->then_code({"print(2/0)\n"});
    auto session = run("print(1/0)\n");

    EXPECT_EQ(session.state(), LoopState::EXHAUSTED);
    EXPECT_EQ(session.best().fragment->version(), 0u);
    ASSERT_EQ(session.iterations().size(), 1u);
    EXPECT_EQ(session.iterations()[0].outcome, "rejected");
    ASSERT_EQ(session.iterations()[0].candidates.size(), 1u);
    EXPECT_EQ(session.iterations()[0].candidates[0].verdict, "not an improvement");
    // Both the submission and the candidate ran.
    EXPECT_EQ(session.executions().size(), 2u);
}

TEST_F(CorrectionLoopTest, TieGoesToHealthierExecution) {
    options.max_iterations = 1;
    // Submission: unused import + ZeroDivisionError. Both candidates fix one finding.
    collaborator->then_code({"print(1/0)\n", "import os\nprint(1)\n"});
    auto session = run("import os\nprint(1/0)\n");

    EXPECT_EQ(session.initial().findings.size(), 2u);
    EXPECT_EQ(session.best().fragment->text(), "import os\nprint(1)\n");
    EXPECT_EQ(session.final_findings().size(), 1u);
    ASSERT_EQ(session.iterations().size(), 1u);
    const auto& cands = session.iterations()[0].candidates;
    ASSERT_EQ(cands.size(), 2u);
    EXPECT_FALSE(cands[0].promoted);
    EXPECT_TRUE(cands[1].promoted);
    EXPECT_NE(cands[0].version, cands[1].version);
    EXPECT_EQ(session.state(), LoopState::EXHAUSTED);
}

TEST_F(CorrectionLoopTest, AutoCorrectDisabledReportsOnly) {
    options.auto_correct = false;
    collaborator->then_code({"print(1)\n"});
    auto session = run("print(1/0)\n");

    EXPECT_EQ(session.state(), LoopState::REPORTED);
    EXPECT_EQ(collaborator->calls.load(), 0);
    ASSERT_EQ(session.final_findings().size(), 1u);
    EXPECT_EQ(session.final_findings()[0].code, "runtime-error");
}

TEST_F(CorrectionLoopTest, SyntaxErrorIsNeverExecuted) {
    options.auto_correct = false;
    auto session = run("def broken(:\n    pass\n");

    EXPECT_EQ(session.state(), LoopState::REPORTED);
    EXPECT_TRUE(session.executions().empty());
    ASSERT_EQ(session.final_findings().size(), 1u);
    EXPECT_EQ(session.final_findings()[0].kind, FindingKind::SYNTAX);
}

TEST_F(CorrectionLoopTest, SlowCollaboratorTimesOut) {
    settings.timeout = std::chrono::milliseconds(200);
    options.max_iterations = 1;
    collaborator->then([](const collab::CorrectionRequest&, const CancellationToken& token) {
        token.wait_for(std::chrono::seconds(10));
        return CollaboratorResponse::fail(CollaboratorErrorKind::CANCELLED, "gave up");
    });

    auto start = std::chrono::steady_clock::now();
    auto session = run("print(1/0)\n");
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(session.state(), LoopState::EXHAUSTED);
    ASSERT_EQ(session.iterations().size(), 1u);
    ASSERT_TRUE(session.iterations()[0].error.has_value());
    EXPECT_EQ(session.iterations()[0].error->kind, CollaboratorErrorKind::TIMEOUT);
    EXPECT_LT(elapsed, std::chrono::seconds(2));
}

TEST_F(CorrectionLoopTest, CollaboratorIgnoringCancellationIsAbandoned) {
    settings.timeout = std::chrono::milliseconds(200);
    options.max_iterations = 1;
    collaborator->then([](const collab::CorrectionRequest&, const CancellationToken&) {
        std::this_thread::sleep_for(std::chrono::seconds(3));
        std::vector<CorrectionCandidate> late;
        late.push_back({SourceFragment("print(1)\n"), "late", {}});
        return CollaboratorResponse::ok(std::move(late));
    });

    auto start = std::chrono::steady_clock::now();
    auto session = run("print(1/0)\n");
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, std::chrono::milliseconds(2000));
    EXPECT_EQ(session.state(), LoopState::EXHAUSTED);
    EXPECT_EQ(session.best().fragment->version(), 0u);
    ASSERT_EQ(session.iterations().size(), 1u);
    ASSERT_TRUE(session.iterations()[0].error.has_value());
    EXPECT_EQ(session.iterations()[0].error->kind, CollaboratorErrorKind::TIMEOUT);
}

TEST_F(CorrectionLoopTest, ViolatingCandidateIsRejected) {
    options.max_iterations = 1;
    collaborator->then_code({"print(open('/etc/passwd').read())\n"});
    auto session = run("print(1/0)\n");

    EXPECT_EQ(session.state(), LoopState::EXHAUSTED);
    EXPECT_EQ(session.best().fragment->version(), 0u);
    ASSERT_EQ(session.iterations().size(), 1u);
    ASSERT_EQ(session.iterations()[0].candidates.size(), 1u);
    EXPECT_EQ(session.iterations()[0].candidates[0].verdict, "sandbox violation");
    EXPECT_EQ(session.iterations()[0].candidates[0].status.value_or(ExecutionStatus::SUCCESS),
              ExecutionStatus::SANDBOX_VIOLATION);
}

TEST_F(CorrectionLoopTest, RateLimitBacksOffThenRecovers) {
    collaborator->then_error(CollaboratorErrorKind::RATE_LIMITED, std::chrono::milliseconds(20));
    collaborator->then_code({"print(1)\n"});
    auto session = run("print(1/0)\n");

    EXPECT_EQ(session.state(), LoopState::ACCEPTED);
    EXPECT_EQ(collaborator->calls.load(), 2);
    ASSERT_EQ(session.iterations().size(), 2u);
    EXPECT_EQ(session.iterations()[0].error->kind, CollaboratorErrorKind::RATE_LIMITED);
}

TEST_F(CorrectionLoopTest, CancelledSessionStopsBeforeAsking) {
    AnalysisSession session("cancelled", SourceFragment("print(1/0)\n"), options);
    session.cancellation().cancel();
    CorrectionLoop loop(executor, collaborator, settings, telemetry);
    loop.run(session);

    EXPECT_EQ(session.state(), LoopState::EXHAUSTED);
    EXPECT_EQ(collaborator->calls.load(), 0);
    EXPECT_EQ(session.phases().back().detail, "cancelled");
}

TEST_F(CorrectionLoopTest, ProgressSinkSeesEveryTransition) {
    collaborator->then_code({"print(1)\n"});
    std::vector<std::string> phases;
    auto session = run("print(1/0)\n", [&phases](const std::string& phase, const std::string& payload) {
        phases.push_back(phase);
        EXPECT_FALSE(nlohmann::json::parse(payload, nullptr, false).is_discarded());
    });

    std::vector<std::string> expected = {"Analyzing", "AwaitingCandidate", "ValidatingCandidate", "Accepted"};
    EXPECT_EQ(phases, expected);
    EXPECT_EQ(session.phases().size(), expected.size());
}

TEST_F(CorrectionLoopTest, CollaboratorInteractionsAreLogged) {
    collaborator->then_error(CollaboratorErrorKind::MALFORMED_RESPONSE);
    options.max_iterations = 1;
    run("print(1/0)\n");

    auto interactions = telemetry->get_interactions_json();
    ASSERT_EQ(interactions.size(), 1u);
    EXPECT_EQ(interactions[0]["outcome"], "MalformedResponse");
    EXPECT_EQ(interactions[0]["collaborator"], "scripted");
}

TEST_F(CorrectionLoopTest, ZeroIterationsNeverAsks) {
    options.max_iterations = 0;
    auto session = run("print(1/0)\n");
    EXPECT_EQ(session.state(), LoopState::EXHAUSTED);
    EXPECT_EQ(collaborator->calls.load(), 0);
}

TEST_F(CorrectionLoopTest, FirstQualityReviewReachesSummaryAndTelemetry) {
    options.max_iterations = 2;
    auto reviewed = [](int score, const std::string& code) {
        return [score, code](const collab::CorrectionRequest&, const CancellationToken&) {
            std::vector<CorrectionCandidate> out;
            out.push_back({SourceFragment(code), "scripted", {}});
            CollaboratorResponse response = CollaboratorResponse::ok(std::move(out));
            collab::QualityReview review;
            review.score = score;
            review.suggestions = {"check the divisor"};
            response.review = review;
            return response;
        };
    };
    collaborator->then(reviewed(3, "print(2/0)\n"));
    collaborator->then(reviewed(9, "print(1)\n"));
    auto session = run("print(1/0)\n");

    EXPECT_EQ(session.state(), LoopState::ACCEPTED);
    ASSERT_TRUE(session.review().has_value());
    EXPECT_EQ(session.review()->score, 3);

    auto summary = session.summary_json();
    EXPECT_EQ(summary["review"]["score"], 3);
    EXPECT_EQ(summary["review"]["fragment_version"], 0);
    EXPECT_EQ(summary["review"]["suggestions"][0], "check the divisor");

    auto reviews = telemetry->to_json()["reviews"];
    EXPECT_EQ(reviews["count"], 1);
    EXPECT_DOUBLE_EQ(reviews["average_score"].get<double>(), 3.0);
}

TEST_F(CorrectionLoopTest, SessionWithoutReviewHasNullReview) {
    collaborator->then_code({"print(1)\n"});
    auto session = run("print(1/0)\n");
    EXPECT_TRUE(session.summary_json()["review"].is_null());
    EXPECT_TRUE(telemetry->get_reviews_json()["average_score"].is_null());
}
