#include <gtest/gtest.h>

#include "optimlib/core/aggregator.hpp"
#include "optimlib/core/errors.hpp"
#include "optimlib/core/multistart.hpp"
#include "optimlib/core/problem.hpp"
#include "optimlib/strategy/local_convex.hpp"
#include "optimlib/strategy/nelder_mead.hpp"

using namespace optimlib;
using namespace optimlib::core;

namespace {

    std::shared_ptr<const strategy::IStrategy> Local()
    {
        return std::make_shared<strategy::LocalConvex>();
    }

    TRunResult Outcome(int index, double value, bool feasible, double violation)
    {
        TRunResult r;
        r.run_index = index;
        r.candidate.x = { static_cast<double>(index) };
        r.candidate.value = value;
        r.candidate.feasible = feasible;
        r.candidate.violation = violation;
        return r;
    }

    int CountStarts(const progress::ProgressChannel& channel)
    {
        int n = 0;
        for (const auto& e : channel.events())
            if (std::holds_alternative<progress::TStartEvent>(e)) n++;
        return n;
    }

    class IntThrowingObserver : public progress::IProgressObserver {
    public:
        std::string name() const override { return "int-throwing"; }
        void onStep(const progress::TStepEvent&) override { throw 42; }
    };

} // namespace

TEST(MultiStartTest, RunsEverySeedAndKeepsOrder)
{
    ParabolaModel model(3.0);
    progress::ProgressChannel channel;
    MultiStartOrchestrator orchestrator(Local(), channel);

    std::vector<std::vector<double>> seeds = { { -5.0 }, { 0.0 }, { 10.0 } };
    auto runs = orchestrator.runAll(&model, seeds, {}, {}, TTermination{});

    ASSERT_EQ(runs.size(), 3u);
    for (int i = 0; i < 3; i++) {
        EXPECT_EQ(runs[i].run_index, i);
        EXPECT_EQ(runs[i].seed, seeds[i]);
        EXPECT_TRUE(runs[i].completed);
        EXPECT_NEAR(runs[i].candidate.x[0], 3.0, 1e-4);
    }

    const TRunResult& best = MultiStartOrchestrator::SelectBest(runs);
    EXPECT_NEAR(best.candidate.value, 0.0, 1e-6);

    EXPECT_EQ(CountStarts(channel), 3);
    std::set<int> seen;
    for (const auto& rec : channel.history()) seen.insert(rec.run_index);
    EXPECT_EQ(seen, (std::set<int>{ 0, 1, 2 }));
}

TEST(MultiStartTest, ParallelRunsMatchSequentialRuns)
{
    PolyResidualModel model({ 1.0, 0.0, -2.0 });
    std::vector<std::vector<double>> seeds = { { -3.0 }, { -0.5 }, { 0.5 }, { 3.0 } };

    progress::ProgressChannel seqChannel;
    auto seq = MultiStartOrchestrator(Local(), seqChannel).runAll(&model, seeds, {}, {}, TTermination{});

    TRunData parallel;
    parallel.parallel = true;
    progress::ProgressChannel parChannel;
    auto par = MultiStartOrchestrator(Local(), parChannel, parallel).runAll(&model, seeds, {}, {}, TTermination{});

    ASSERT_EQ(seq.size(), par.size());
    for (std::size_t i = 0; i < seq.size(); i++) {
        EXPECT_EQ(par[i].run_index, static_cast<int>(i));
        EXPECT_EQ(seq[i].candidate.x, par[i].candidate.x);
    }
    EXPECT_EQ(seqChannel.history().size(), parChannel.history().size());
}

TEST(MultiStartTest, FailingRunDoesNotAbortTheBatch)
{
    FunctionModel model([](const std::vector<double>& x) {
        if (x[0] > 50.0) throw std::runtime_error("out of calibrated range");
        return (x[0] - 1.0) * (x[0] - 1.0);
    });

    progress::ProgressChannel channel;
    MultiStartOrchestrator orchestrator(Local(), channel);
    auto runs = orchestrator.runAll(&model, { { 100.0 }, { 0.0 } }, {}, {}, TTermination{});

    ASSERT_EQ(runs.size(), 2u);
    EXPECT_FALSE(runs[0].completed);
    EXPECT_EQ(runs[0].termination.reason, StopReason::FAILED);
    EXPECT_FALSE(runs[0].candidate.feasible);
    EXPECT_NE(runs[0].error.find("out of calibrated range"), std::string::npos);

    EXPECT_TRUE(runs[1].completed);
    EXPECT_EQ(MultiStartOrchestrator::SelectBest(runs).run_index, 1);
    EXPECT_EQ(CountStarts(channel), 2);
}

TEST(MultiStartTest, EveryRunFailingIsEvaluationError)
{
    FunctionModel model([](const std::vector<double>&) -> double { throw std::runtime_error("offline"); });

    progress::ProgressChannel channel;
    MultiStartOrchestrator orchestrator(Local(), channel);
    EXPECT_THROW(orchestrator.runAll(&model, { { 0.0 }, { 1.0 } }, {}, {}, TTermination{}), EvaluationError);
}

TEST(MultiStartTest, BadSeedFailsBeforeAnyEvaluation)
{
    int calls = 0;
    FunctionModel model([&calls](const std::vector<double>& x) {
        calls++;
        return x[0] * x[0];
    });

    progress::ProgressChannel channel;
    MultiStartOrchestrator orchestrator(Local(), channel);

    EXPECT_THROW(orchestrator.runAll(&model, { { 0.0 }, { 0.0, 1.0 } }, {}, {}, TTermination{}), ConfigurationError);
    EXPECT_THROW(orchestrator.runAll(&model, {}, {}, {}, TTermination{}), ConfigurationError);

    TTermination bad;
    bad.max_evals = 0;
    EXPECT_THROW(orchestrator.runAll(&model, { { 0.0 } }, {}, {}, bad), ConfigurationError);

    EXPECT_EQ(calls, 0);
    EXPECT_TRUE(channel.events().empty());
}

TEST(MultiStartTest, ConfigurationErrorInsideARunStillEndsIt)
{
    FunctionModel model([](const std::vector<double>& x) { return x[0] * x[0]; });
    strategy::TLocalConvexParams params;
    params.gradient = "analytic";

    progress::ProgressChannel channel;
    MultiStartOrchestrator orchestrator(std::make_shared<strategy::LocalConvex>(params), channel);
    EXPECT_THROW(orchestrator.runAll(&model, { { 1.0 }, { 2.0 } }, {}, {}, TTermination{}), ConfigurationError);

    auto events = channel.events();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<progress::TStartEvent>(events[0]));
    const auto* end = std::get_if<progress::TEndEvent>(&events[1]);
    ASSERT_NE(end, nullptr);
    EXPECT_EQ(end->run_index, 0);
    EXPECT_EQ(end->reason, StopReason::FAILED);
    EXPECT_FALSE(end->best.feasible);
}

TEST(MultiStartTest, ObserverThrowingANonExceptionDoesNotAbortTheBatch)
{
    ParabolaModel model(3.0);
    TRunData parallel;
    parallel.parallel = true;

    progress::ProgressChannel channel;
    channel.subscribe(std::make_shared<IntThrowingObserver>());
    MultiStartOrchestrator orchestrator(Local(), channel, parallel);

    std::vector<TRunResult> runs;
    ASSERT_NO_THROW(runs = orchestrator.runAll(&model, { { 0.0 }, { 6.0 } }, {}, {}, TTermination{}));
    ASSERT_EQ(runs.size(), 2u);
    for (const auto& r : runs) {
        EXPECT_TRUE(r.completed);
        EXPECT_NEAR(r.candidate.x[0], 3.0, 1e-4);
    }
}

TEST(MultiStartTest, CancelledBeforeTheFirstIteration)
{
    ParabolaModel model(3.0);
    std::atomic<bool> cancel(true);

    progress::ProgressChannel channel;
    MultiStartOrchestrator orchestrator(std::make_shared<strategy::NelderMead>(), channel, {}, nullptr, &cancel);
    auto runs = orchestrator.runAll(&model, { { 0.0 }, { 1.0 } }, {}, {}, TTermination{});

    for (const auto& r : runs) {
        EXPECT_EQ(r.termination.reason, StopReason::CANCELLED);
        EXPECT_EQ(r.termination.metrics.at("iters"), 0.0);
    }
}

TEST(SelectBestTest, FeasibleBeatsLowerInfeasible)
{
    std::vector<TRunResult> runs = { Outcome(0, -10.0, false, 0.5), Outcome(1, 4.0, true, 0.0),
                                     Outcome(2, 2.0, true, 0.0) };
    EXPECT_EQ(MultiStartOrchestrator::SelectBest(runs).run_index, 2);
}

TEST(SelectBestTest, LowestViolationWhenNothingIsFeasible)
{
    std::vector<TRunResult> runs = { Outcome(0, 1.0, false, 0.5), Outcome(1, 9.0, false, 0.1),
                                     Outcome(2, 0.0, false, std::numeric_limits<double>::infinity()) };
    EXPECT_EQ(MultiStartOrchestrator::SelectBest(runs).run_index, 1);
}

TEST(SelectBestTest, InfeasibleTieOnViolationIgnoresValue)
{
    std::vector<TRunResult> runs = { Outcome(0, 8.0, false, 0.3), Outcome(1, -8.0, false, 0.3) };
    EXPECT_EQ(MultiStartOrchestrator::SelectBest(runs).run_index, 0);
}

TEST(SelectBestTest, TiesGoToTheLowestIndexAndNanNeverWins)
{
    std::vector<TRunResult> ties = { Outcome(0, 1.0, true, 0.0), Outcome(1, 1.0, true, 0.0) };
    EXPECT_EQ(MultiStartOrchestrator::SelectBest(ties).run_index, 0);

    std::vector<TRunResult> nan = { Outcome(0, std::numeric_limits<double>::quiet_NaN(), true, 0.0),
                                    Outcome(1, 5.0, true, 0.0) };
    EXPECT_EQ(MultiStartOrchestrator::SelectBest(nan).run_index, 1);
}

// -----------------------------------------------------------------------------
// ResultAggregator
// -----------------------------------------------------------------------------

TEST(ResultAggregatorTest, WritesEveryKey)
{
    ParabolaModel model(3.0);
    progress::ProgressChannel channel;
    auto local = Local();
    MultiStartOrchestrator orchestrator(local, channel);

    TBounds bounds = { { -10.0, 10.0 } };
    auto runs = orchestrator.runAll(&model, { { -5.0 }, { 8.0 } }, bounds, {}, TTermination{});
    const TRunResult& best = MultiStartOrchestrator::SelectBest(runs);

    MemoryStore store;
    ResultAggregator(store).write(local->name(), local->params(), bounds, TTermination{},
                                  channel.history(), runs, best);

    EXPECT_EQ(store.get(keys::STRATEGY).as<std::string>(), "LocalConvex");

    YAML::Node params = store.get(keys::PARAMS);
    EXPECT_EQ(params["bounds"].size(), 1u);
    EXPECT_EQ(params["termination"]["max_evals"].as<int>(), 200);
    EXPECT_EQ(params["strategy_params"]["memory"].as<int>(), 10);

    EXPECT_EQ(store.get(keys::HISTORY).size(), channel.history().size());

    YAML::Node stored = store.get(keys::RUNS);
    ASSERT_EQ(stored.size(), 2u);
    EXPECT_EQ(stored[1]["meta"]["run_index"].as<int>(), 1);
    EXPECT_EQ(stored[1]["meta"]["seed"][0].as<double>(), 8.0);

    YAML::Node bestNode = store.get(keys::BEST_CANDIDATE);
    EXPECT_NEAR(bestNode["x"][0].as<double>(), 3.0, 1e-4);
    EXPECT_EQ(bestNode["meta"]["strategy"].as<std::string>(), "LocalConvex");

    EXPECT_EQ(store.get(keys::TERMINATION)["reason"].as<std::string>(), ToString(best.termination.reason));
}

TEST(ResultAggregatorTest, MissingKeyThrows)
{
    MemoryStore store;
    EXPECT_FALSE(store.contains(keys::RUNS));
    EXPECT_THROW(store.get(keys::RUNS), std::out_of_range);
}
