#include "optimlib/core/multistart.hpp"
#include "optimlib/core/errors.hpp"
#include "optimlib/core/method.hpp"

namespace optimlib {

    using namespace optimlib::core;

    static progress::TEndEvent EndOf(int runIndex, const TRunResult& result)
    {
        progress::TEndEvent end;
        end.run_index = runIndex;
        end.reason = result.termination.reason;
        end.best = result.candidate;
        end.timestamp = get_time_in_seconds();
        return end;
    }

    MultiStartOrchestrator::MultiStartOrchestrator(std::shared_ptr<const strategy::IStrategy> strategy,
                                                   progress::ProgressChannel& channel,
                                                   TRunData runData,
                                                   IController* controller,
                                                   const std::atomic<bool>* cancel)
        : strategy_(std::move(strategy)),
          channel_(channel),
          runData_(runData),
          controller_(controller),
          cancel_(cancel)
    {
        if (!strategy_) throw ConfigurationError("multi-start needs a strategy");
    }

    TRunResult MultiStartOrchestrator::runOne(const IModel* model, const std::vector<double>& seed, int runIndex,
                                              int totalRuns, const TBounds& bounds, const Constraints& constraints,
                                              const TTermination& termination)
    {
        progress::TStartEvent start;
        start.run_index = runIndex;
        start.total_runs = totalRuns;
        start.x0 = seed;
        start.bounds = bounds;
        start.timestamp = get_time_in_seconds();
        channel_.publish(start);

        strategy::TRunSettings settings;
        settings.runIndex = runIndex;
        settings.cancel = cancel_;
        settings.controller = controller_;
        settings.logEvery = runData_.logEvery;
        settings.debug = runData_.debug;
        settings.decimals = runData_.decimals;

        TRunResult result;
        try {
            if (controller_) controller_->reset(runData_.seed + static_cast<unsigned int>(runIndex));

            result = strategy_->run(model, seed, bounds, constraints, termination,
                                    [this](const THistoryRecord& rec) { channel_.publish(rec); },
                                    settings);
        } catch (const ConfigurationError& e) {
            // observers still see the run closed before the batch aborts
            TRunResult failed;
            failed.run_index = runIndex;
            failed.seed = seed;
            failed.completed = false;
            failed.error = e.what();
            failed.candidate.x = seed;
            failed.candidate.value = std::numeric_limits<double>::quiet_NaN();
            failed.candidate.feasible = false;
            failed.candidate.violation = std::numeric_limits<double>::infinity();
            failed.termination.reason = StopReason::FAILED;
            channel_.publish(EndOf(runIndex, failed));
            throw;
        } catch (const std::exception& e) {
            #pragma omp critical(optimlib_log)
            std::cerr << "[optimize] run=" << runIndex << " aborted: " << e.what() << std::endl;

            result = TRunResult();
            result.seed = seed;
            result.run_index = runIndex;
            result.completed = false;
            result.error = e.what();
            result.candidate.x = seed;
            result.candidate.value = std::numeric_limits<double>::quiet_NaN();
            result.candidate.feasible = false;
            result.candidate.violation = std::numeric_limits<double>::infinity();
            result.candidate.meta = { { "strategy", strategy_->name() }, { "error", e.what() } };
            result.termination.reason = StopReason::FAILED;
            result.termination.metrics = { { "error", 1.0 } };
            result.termination.budget = { { "max_evals", termination.max_evals } };
        }

        channel_.publish(EndOf(runIndex, result));
        return result;
    }

    std::vector<TRunResult> MultiStartOrchestrator::runAll(const IModel* model,
                                                           const std::vector<std::vector<double>>& seeds,
                                                           const TBounds& bounds,
                                                           const Constraints& constraints,
                                                           const TTermination& termination)
    {
        if (seeds.empty()) throw ConfigurationError("at least one start point is required");

        // fail fast: every seed is checked before the first evaluation
        const int dimension = model ? model->getDimension() : 0;
        ConstraintEvaluator probe;
        for (const auto& seed : seeds) {
            ValidateStart(seed, bounds, dimension);
            if (seed.size() != seeds.front().size())
                throw ConfigurationError("multi-start seeds have different dimensions");
            try {
                probe.evaluate(seed, constraints);
            } catch (const ConfigurationError&) {
                throw;
            } catch (const std::exception& e) {
                throw ConfigurationError(std::string("constraint failed at seed: ") + e.what());
            }
        }
        ValidateTermination(termination);

        const int total = static_cast<int>(seeds.size());
        const bool parallel = runData_.parallel && !controller_ && total > 1;

        if (runData_.parallel && controller_ && runData_.debug)
            std::cout << "[optimize] controller attached, runs execute sequentially" << std::endl;

        std::vector<TRunResult> results(total);
        std::exception_ptr configError;
        std::atomic<bool> aborted(false);

        #pragma omp parallel for schedule(dynamic, 1) if (parallel)
        for (int i = 0; i < total; i++) {
            if (aborted.load()) continue;
            try {
                results[i] = runOne(model, seeds[i], i, total, bounds, constraints, termination);
            } catch (const ConfigurationError&) {
                #pragma omp critical(optimlib_multistart_error)
                {
                    if (!configError) configError = std::current_exception();
                }
                aborted.store(true);
            }
        }

        if (configError) std::rethrow_exception(configError);

        bool anyCompleted = std::any_of(results.begin(), results.end(),
                                        [](const TRunResult& r) { return r.completed; });
        if (!anyCompleted)
            throw EvaluationError("every run failed, first error: " + results.front().error);

        return results;
    }

    static bool BetterRun(const TRunResult& a, const TRunResult& b)
    {
        const TCandidate& x = a.candidate;
        const TCandidate& y = b.candidate;

        if (x.feasible != y.feasible) return x.feasible;
        if (!x.feasible) return x.violation < y.violation;

        if (std::isnan(y.value)) return !std::isnan(x.value);
        return x.value < y.value;
    }

    const TRunResult& MultiStartOrchestrator::SelectBest(const std::vector<TRunResult>& runs)
    {
        if (runs.empty()) throw std::invalid_argument("SelectBest needs at least one run");

        // runs are ordered by run_index, so strict improvement keeps the lowest index on ties
        const TRunResult* best = &runs.front();
        for (const auto& r : runs) {
            if (BetterRun(r, *best)) best = &r;
        }
        return *best;
    }

} // namespace optimlib
