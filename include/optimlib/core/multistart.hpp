#pragma once

#include "optimlib/core/data.hpp"
#include "optimlib/strategy/strategy.hpp"
#include "optimlib/progress/channel.hpp"

namespace optimlib {

    /**
     * @brief Runs one strategy from several seeds and picks the best outcome.
     *
     * Seeds share the model, bounds, constraints and termination spec but
     * own their termination state; events are namespaced by run_index.
     * Runs go through an OpenMP loop when runData.parallel is set and no
     * controller is attached (a controller is a single physical resource).
     *
     * A run that raises EvaluationError is kept as an incomplete, infeasible
     * result and the batch continues; runAll throws only on configuration
     * errors or when every run raised.
     */
    class MultiStartOrchestrator {
    public:
        MultiStartOrchestrator(std::shared_ptr<const strategy::IStrategy> strategy,
                               progress::ProgressChannel& channel,
                               core::TRunData runData = {},
                               core::IController* controller = nullptr,
                               const std::atomic<bool>* cancel = nullptr);

        // Results ordered by run_index
        std::vector<core::TRunResult> runAll(const core::IModel* model,
                                             const std::vector<std::vector<double>>& seeds,
                                             const core::TBounds& bounds,
                                             const core::Constraints& constraints,
                                             const core::TTermination& termination);

        /**
         * Method: SelectBest
         * Description: feasible runs first, lowest value among them; without
         * a feasible run, lowest violation. Ties go to the lowest run_index.
         */
        static const core::TRunResult& SelectBest(const std::vector<core::TRunResult>& runs);

    private:
        core::TRunResult runOne(const core::IModel* model, const std::vector<double>& seed, int runIndex, int totalRuns,
                                const core::TBounds& bounds, const core::Constraints& constraints,
                                const core::TTermination& termination);

        std::shared_ptr<const strategy::IStrategy> strategy_;
        progress::ProgressChannel& channel_;
        core::TRunData runData_;
        core::IController* controller_;
        const std::atomic<bool>* cancel_;
    };

} // namespace optimlib
