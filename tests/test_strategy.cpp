#include <gtest/gtest.h>

#include "optimlib/core/errors.hpp"
#include "optimlib/core/problem.hpp"
#include "optimlib/strategy/backend.hpp"
#include "optimlib/strategy/factory.hpp"
#include "optimlib/strategy/local_convex.hpp"
#include "optimlib/strategy/nelder_mead.hpp"

using namespace optimlib::core;
using namespace optimlib::strategy;

namespace {

    struct Recorder
    {
        std::vector<THistoryRecord> steps;

        StepCallback callback()
        {
            return [this](const THistoryRecord& r) { steps.push_back(r); };
        }
    };

    // Plant that can only be driven on the half line x >= 0
    class HalfLinePlant : public IController {
    public:
        void reset(std::optional<unsigned int>) override {}
        double apply(const std::vector<double>& x) override { return (x[0] - 3.0) * (x[0] - 3.0); }
        bool safe(const std::vector<double>& x) const override { return x[0] >= 0.0; }
    };

    TTermination Budget(int maxEvals, double ftolAbs, double xtolAbs)
    {
        TTermination t;
        t.max_evals = maxEvals;
        t.ftol_abs = ftolAbs;
        t.ftol_rel = 0.0;
        t.xtol_abs = xtolAbs;
        return t;
    }

} // namespace

// -----------------------------------------------------------------------------
// LocalConvex
// -----------------------------------------------------------------------------

TEST(LocalConvexTest, QuadraticConverges)
{
    ParabolaModel model(3.0);
    Recorder rec;

    TRunResult r = LocalConvex().run(&model, { 0.0 }, {}, {}, TTermination{}, rec.callback());

    EXPECT_NEAR(r.candidate.x[0], 3.0, 1e-4);
    EXPECT_NEAR(r.candidate.value, 0.0, 1e-6);
    EXPECT_TRUE(r.candidate.feasible);
    EXPECT_NE(r.termination.reason, StopReason::FAILED);
    EXPECT_EQ(r.candidate.meta.at("mode"), "bounded");
    EXPECT_EQ(r.candidate.meta.at("gradient"), "analytic");

    ASSERT_FALSE(rec.steps.empty());
    EXPECT_EQ(rec.steps.front().iter, 0);
    for (std::size_t i = 1; i < rec.steps.size(); i++)
        EXPECT_EQ(rec.steps[i].iter, rec.steps[i - 1].iter + 1);
}

TEST(LocalConvexTest, BoundsAreRespected)
{
    ParabolaModel model(3.0);
    TBounds bounds = { { -1.0, 2.0 } };

    TRunResult r = LocalConvex().run(&model, { 0.0 }, bounds, {}, TTermination{}, nullptr);
    EXPECT_NEAR(r.candidate.x[0], 2.0, 1e-6);
    EXPECT_LE(r.candidate.x[0], 2.0);
}

TEST(LocalConvexTest, FiniteDifferenceOnTwoDimensions)
{
    FunctionModel model([](const std::vector<double>& x) {
        return (x[0] - 1.0) * (x[0] - 1.0) + 10.0 * (x[1] + 2.0) * (x[1] + 2.0);
    });

    TRunResult r = LocalConvex().run(&model, { 0.0, 0.0 }, {}, {}, Budget(2000, 1e-12, 1e-12), nullptr);
    EXPECT_NEAR(r.candidate.x[0], 1.0, 1e-4);
    EXPECT_NEAR(r.candidate.x[1], -2.0, 1e-4);
    EXPECT_EQ(r.candidate.meta.at("gradient"), "finite-difference");
}

TEST(LocalConvexTest, InequalityConstraintIsSatisfied)
{
    ParabolaModel model(3.0);
    Constraints cons;
    cons.ineq.push_back([](const std::vector<double>& x) { return std::vector<double>{ x[0] }; });

    TRunResult r = LocalConvex().run(&model, { 5.0 }, {}, cons, Budget(2000, 1e-12, 1e-12), nullptr);

    EXPECT_TRUE(r.candidate.feasible);
    EXPECT_LE(r.candidate.x[0], 1e-8);
    EXPECT_NEAR(r.candidate.x[0], 0.0, 1e-4);
    EXPECT_EQ(r.candidate.meta.at("mode"), "constrained");
}

TEST(LocalConvexTest, ControllerOnlyRunStartingAtTheSafeEdge)
{
    HalfLinePlant plant;
    TRunSettings settings;
    settings.controller = &plant;

    TRunResult r = LocalConvex().run(nullptr, { 1e-9 }, {}, {}, Budget(2000, 1e-12, 1e-12), nullptr, settings);

    EXPECT_NE(r.termination.reason, StopReason::FAILED);
    EXPECT_TRUE(r.candidate.feasible);
    EXPECT_NEAR(r.candidate.x[0], 3.0, 1e-4);
    EXPECT_EQ(r.candidate.meta.at("gradient"), "finite-difference");
}

TEST(LocalConvexTest, CancellationReachesInnerIterationsInConstrainedMode)
{
    std::atomic<bool> cancel(false);
    int calls = 0;
    int callsAtCancel = -1;

    // sum (x_i - 1)^2 with its analytic gradient
    FunctionModel model(
        [&](const std::vector<double>& x) {
            calls++;
            if (calls == 3) {
                cancel.store(true);
                callsAtCancel = calls;
            }
            double f = 0.0;
            for (double v : x) f += (v - 1.0) * (v - 1.0);
            return f;
        },
        [](const std::vector<double>& x) {
            std::vector<double> g(x.size());
            for (std::size_t i = 0; i < x.size(); i++) g[i] = 2.0 * (x[i] - 1.0);
            return g;
        });

    Constraints cons;
    cons.ineq.push_back([](const std::vector<double>& x) {
        double sum = 0.0;
        for (double v : x) sum += v;
        return std::vector<double>{ sum - 1.0 };
    });

    TLocalConvexParams params;
    params.max_linesearch = 5;
    TRunSettings settings;
    settings.cancel = &cancel;
    Recorder rec;

    TRunResult r = LocalConvex(params).run(&model, std::vector<double>(5, 0.0), {}, cons,
                                           Budget(1000, 1e-12, 1e-12), rec.callback(), settings);

    EXPECT_EQ(r.candidate.meta.at("mode"), "constrained");
    EXPECT_EQ(r.termination.reason, StopReason::CANCELLED);
    ASSERT_EQ(callsAtCancel, 3);
    EXPECT_LE(calls - callsAtCancel, params.max_linesearch);
    // the interrupted outer iteration is not reported
    EXPECT_EQ(rec.steps.size(), 1u);
}

TEST(LocalConvexTest, SingleEvaluationBudget)
{
    ParabolaModel model(3.0);
    Recorder rec;

    TRunResult r = LocalConvex().run(&model, { 0.0 }, {}, {}, Budget(1, 1e-9, 1e-9), rec.callback());

    EXPECT_EQ(r.termination.reason, StopReason::BUDGET);
    EXPECT_DOUBLE_EQ(r.termination.metrics.at("evals"), 1.0);
    EXPECT_EQ(rec.steps.size(), 1u);
    EXPECT_DOUBLE_EQ(r.candidate.x[0], 0.0);
}

TEST(LocalConvexTest, IdenticalInputsGiveIdenticalRuns)
{
    PolyResidualModel model({ 1.0, 0.0, -2.0 });
    Recorder a;
    Recorder b;

    TRunResult ra = LocalConvex().run(&model, { 0.7 }, {}, {}, TTermination{}, a.callback());
    TRunResult rb = LocalConvex().run(&model, { 0.7 }, {}, {}, TTermination{}, b.callback());

    EXPECT_EQ(ra.candidate.x, rb.candidate.x);
    EXPECT_EQ(ra.termination.reason, rb.termination.reason);
    ASSERT_EQ(a.steps.size(), b.steps.size());
    for (std::size_t i = 0; i < a.steps.size(); i++) {
        EXPECT_EQ(a.steps[i].x, b.steps[i].x);
        EXPECT_EQ(a.steps[i].f, b.steps[i].f);
    }
}

TEST(LocalConvexTest, UnavailableBackendIsSoftFailure)
{
    ParabolaModel model(3.0);
    TLocalConvexParams params;
    params.backend = "nlopt";
    Recorder rec;

    TRunResult r;
    ASSERT_NO_THROW(r = LocalConvex(params).run(&model, { 0.0 }, {}, {}, TTermination{}, rec.callback()));

    EXPECT_EQ(r.termination.reason, StopReason::FAILED);
    EXPECT_EQ(r.candidate.meta.at("skipped"), "true");
    EXPECT_FALSE(r.candidate.feasible);
    EXPECT_DOUBLE_EQ(r.termination.metrics.at("evals"), 0.0);
    EXPECT_TRUE(rec.steps.empty());
}

TEST(LocalConvexTest, AnalyticGradientWithoutModelGradient)
{
    FunctionModel model([](const std::vector<double>& x) { return x[0] * x[0]; });
    TLocalConvexParams params;
    params.gradient = "analytic";

    EXPECT_THROW(LocalConvex(params).run(&model, { 1.0 }, {}, {}, TTermination{}, nullptr), ConfigurationError);
}

TEST(LocalConvexTest, StartOutsideBoundsOrWrongDimension)
{
    ParabolaModel model(3.0);
    TBounds bounds = { { 0.0, 1.0 } };

    EXPECT_THROW(LocalConvex().run(&model, { 0.0, 1.0 }, {}, {}, TTermination{}, nullptr), ConfigurationError);
    EXPECT_THROW(LocalConvex().run(&model, { 0.0 }, { { 1.0, 0.0 } }, {}, TTermination{}, nullptr), ConfigurationError);
    EXPECT_NO_THROW(LocalConvex().run(&model, { 0.5 }, bounds, {}, TTermination{}, nullptr));
}

TEST(LocalConvexTest, ParamsAreValidated)
{
    EXPECT_THROW(LocalConvex::ParseParams(YAML::Load("{memory: 5, unknown: 1}")), ConfigurationError);
    EXPECT_THROW(LocalConvex::ParseParams(YAML::Load("{memory: many}")), ConfigurationError);

    TLocalConvexParams bad;
    bad.memory = 0;
    EXPECT_THROW(LocalConvex{ bad }, ConfigurationError);

    TLocalConvexParams fd = LocalConvex::ParseParams(YAML::Load("{gradient: fd, memory: 4}"));
    LocalConvex s(fd);
    EXPECT_EQ(s.settings().gradient, "finite-difference");
    EXPECT_EQ(s.params()["memory"].as<int>(), 4);
}

// -----------------------------------------------------------------------------
// NelderMead
// -----------------------------------------------------------------------------

TEST(NelderMeadTest, FindsPolynomialRoot)
{
    PolyResidualModel model({ 1.0, 0.0, -2.0 });

    TRunResult r = NelderMead().run(&model, { 0.1 }, {}, {}, Budget(500, 1e-12, 1e-12), nullptr);

    EXPECT_NEAR(std::abs(r.candidate.x[0]), std::sqrt(2.0), 1e-3);
    EXPECT_EQ(r.candidate.meta.at("gradient"), "none");
    EXPECT_EQ(r.candidate.meta.at("mode"), "simplex");
}

TEST(NelderMeadTest, NeverCallsTheGradient)
{
    int gradientCalls = 0;
    FunctionModel model([](const std::vector<double>& x) { return (x[0] - 1.0) * (x[0] - 1.0) + x[1] * x[1]; },
                        [&gradientCalls](const std::vector<double>& x) {
                            gradientCalls++;
                            return std::vector<double>{ 2.0 * (x[0] - 1.0), 2.0 * x[1] };
                        });

    TRunResult r = NelderMead().run(&model, { 0.0, 0.5 }, {}, {}, Budget(1000, 1e-14, 1e-10), nullptr);
    EXPECT_EQ(gradientCalls, 0);
    EXPECT_NEAR(r.candidate.x[0], 1.0, 1e-3);
    EXPECT_NEAR(r.candidate.x[1], 0.0, 1e-3);
}

TEST(NelderMeadTest, TrialPointsStayInsideBounds)
{
    ParabolaModel model(3.0);
    TBounds bounds = { { -1.0, 1.0 } };
    Recorder rec;

    TRunResult r = NelderMead().run(&model, { 0.5 }, bounds, {}, Budget(300, 1e-12, 1e-12), rec.callback());
    for (const auto& s : rec.steps) {
        EXPECT_GE(s.x[0], -1.0);
        EXPECT_LE(s.x[0], 1.0);
    }
    EXPECT_NEAR(r.candidate.x[0], 1.0, 1e-3);
}

TEST(NelderMeadTest, ParamsAreValidated)
{
    EXPECT_THROW(NelderMead::ParseParams(YAML::Load("{alpha: 1.0, beta: 2.0}")), ConfigurationError);

    TNelderMeadParams bad;
    bad.initial_step = 0.0;
    EXPECT_THROW(NelderMead{ bad }, ConfigurationError);
}

// -----------------------------------------------------------------------------
// Factory and registry
// -----------------------------------------------------------------------------

TEST(StrategyFactoryTest, ResolvesAliases)
{
    EXPECT_EQ(ResolveStrategyName("local"), "LocalConvex");
    EXPECT_EQ(ResolveStrategyName("LBFGSB"), "LocalConvex");
    EXPECT_EQ(ResolveStrategyName("LocalConvex"), "LocalConvex");
    EXPECT_EQ(ResolveStrategyName("nelder-mead"), "NelderMead");
    EXPECT_EQ(ResolveStrategyName("opt.strategy:nelder_mead"), "NelderMead");
    EXPECT_EQ(ResolveStrategyName(" opt.strategy: local "), "LocalConvex");
}

TEST(StrategyFactoryTest, UnknownStrategyIsConfigurationError)
{
    EXPECT_THROW(ResolveStrategyName("genetic"), ConfigurationError);
    EXPECT_THROW(MakeStrategy("opt.strategy:cmaes"), ConfigurationError);
}

TEST(StrategyFactoryTest, BuildsWithParams)
{
    auto s = MakeStrategy("nelder", YAML::Load("{initial_step: 0.1}"));
    ASSERT_NE(s, nullptr);
    EXPECT_EQ(s->name(), "NelderMead");
    EXPECT_DOUBLE_EQ(s->params()["initial_step"].as<double>(), 0.1);

    EXPECT_THROW(MakeStrategy("local", YAML::Load("{initial_step: 0.1}")), ConfigurationError);
}

TEST(BackendRegistryTest, BuiltinsAreRegistered)
{
    auto& registry = BackendRegistry::instance();
    EXPECT_NE(registry.find("lbfgsb"), nullptr);
    EXPECT_NE(registry.find("auglag"), nullptr);
    EXPECT_NE(registry.find("simplex"), nullptr);
    EXPECT_EQ(registry.find("nlopt"), nullptr);
}
