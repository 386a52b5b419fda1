#include "optimlib/strategy/strategy.hpp"
#include "optimlib/core/errors.hpp"
#include "optimlib/core/method.hpp"

namespace optimlib::strategy {

    using namespace optimlib::core;

    TRunResult IStrategy::run(const IModel* model, const std::vector<double>& x0, const TBounds& bounds,
                              const Constraints& constraints, const TTermination& termination,
                              const StepCallback& onStep, const TRunSettings& settings) const
    {
        ValidateStart(x0, bounds, model ? model->getDimension() : 0);
        ValidateTermination(termination);

        // malformed constraints surface here, before the objective is touched
        try {
            ConstraintEvaluator().evaluate(x0, constraints);
        } catch (const ConfigurationError&) {
            throw;
        } catch (const std::exception& e) {
            throw ConfigurationError(std::string("constraint failed at x0: ") + e.what());
        }

        TPlan p = plan(model, constraints);

        std::vector<double> start = x0;
        ClipToBounds(start, bounds);

        auto backend = BackendRegistry::instance().find(p.backend);
        if (!backend) return skipped(p, x0, start, termination, settings);

        TSearchSetup setup;
        setup.runIndex = settings.runIndex;
        setup.cancel = settings.cancel;
        setup.controller = settings.controller;
        setup.gradient = p.gradient;
        setup.meta = { { "strategy", name() },
                       { "mode", p.mode },
                       { "gradient", ToString(p.gradient) },
                       { "backend", p.backend } };
        setup.logEvery = settings.logEvery;
        setup.debug = settings.debug;
        setup.decimals = settings.decimals;

        SearchContext ctx(model, bounds, constraints, termination, onStep, std::move(setup));
        ctx.start(start);
        if (!ctx.stopped()) backend->minimize(ctx, p.options);

        return ctx.finish(x0);
    }

    TRunResult IStrategy::skipped(const TPlan& plan, const std::vector<double>& x0, const std::vector<double>& start,
                                  const TTermination& termination, const TRunSettings& settings) const
    {
        #pragma omp critical(optimlib_log)
        std::cerr << "[optimize] run=" << settings.runIndex << " solver backend '" << plan.backend
                  << "' is not available, run skipped" << std::endl;

        TRunResult r;
        r.seed = x0;
        r.run_index = settings.runIndex;

        r.candidate.x = start;
        r.candidate.value = std::numeric_limits<double>::quiet_NaN();
        r.candidate.feasible = false;
        r.candidate.violation = std::numeric_limits<double>::infinity();
        r.candidate.meta = { { "strategy", name() },
                             { "mode", plan.mode },
                             { "backend", plan.backend },
                             { "skipped", "true" } };

        r.termination.reason = StopReason::FAILED;
        r.termination.metrics = { { "skipped", 1.0 }, { "evals", 0.0 }, { "iters", 0.0 } };
        r.termination.budget = { { "max_evals", termination.max_evals }, { "evals", 0 }, { "iters", 0 } };
        return r;
    }

} // namespace optimlib::strategy
