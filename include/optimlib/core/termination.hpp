#pragma once

#include "optimlib/core/data.hpp"

namespace optimlib::core {

    /**
     * @brief Running metrics accumulator of one run and its stop policy.
     *
     * Owned by exactly one run. The first reason that fires is kept; at any
     * single check the reasons are tried in priority order:
     * budget (max_evals, max_iters, max_time_s) > ftol > xtol > cancelled >
     * solver-reported (converged / failed).
     *
     * Function and step deltas are measured once per iteration, between the
     * iterate and a reference point (by default the previous iterate), and a
     * convergence test must hold for stall_window consecutive iterations.
     */
    class TerminationEvaluator {
    public:
        explicit TerminationEvaluator(const TTermination& spec);

        // Initial point of the run (iteration 0)
        void recordStart(const TCandidate& start);

        // Called after every objective evaluation
        std::optional<TTerminationResult> recordEvaluation();

        // Called at the end of every iteration
        std::optional<TTerminationResult> recordIteration(const TCandidate& current,
                                                          const TCandidate* reference = nullptr);

        // Called at the top of every iteration with the external stop flag
        std::optional<TTerminationResult> checkCancellation(bool cancelled);

        // Solver-side verdict, kept only when nothing else fired first
        void reportSolver(StopReason reason, const std::map<std::string, double>& extra = {});

        std::optional<TTerminationResult> shouldStop() const;

        TTerminationResult result() const;

        long evaluations() const { return evals_; }
        int iterations() const { return iters_; }
        const TTermination& spec() const { return spec_; }

    private:
        bool budgetExhausted() const;
        void stop(StopReason reason);

        TTermination spec_;
        double startTime_;

        long evals_ = 0;
        int iters_ = 0;

        std::optional<TCandidate> previous_;
        double fDelta_ = std::numeric_limits<double>::quiet_NaN();
        double xDelta_ = std::numeric_limits<double>::quiet_NaN();
        int fStall_ = 0;
        int xStall_ = 0;

        std::optional<StopReason> reason_;
        std::map<std::string, double> solverMetrics_;
    };

} // namespace optimlib::core
