#pragma once

#include "optimlib/core/imodel.hpp"
#include "optimlib/core/constraints.hpp"
#include "optimlib/core/termination.hpp"

namespace optimlib::core {

    // Where the derivatives of the objective come from
    enum class GradientSource { ANALYTIC, FINITE_DIFFERENCE, NONE };

    const char* ToString(GradientSource source);

    using StepCallback = std::function<void(const THistoryRecord&)>;

    //--------------------------------------------------------------------------
    // Struct: TSearchSetup
    // Description: Everything a run needs besides the model and constraints
    //--------------------------------------------------------------------------
    struct TSearchSetup
    {
        int runIndex = 0;
        const std::atomic<bool>* cancel = nullptr;  // external stop flag, read between iterations
        IController* controller = nullptr;
        GradientSource gradient = GradientSource::NONE;
        TMeta meta;                                 // copied into every candidate
        int logEvery = 0;
        int debug = 0;
        int decimals = 6;
    };

    /**
     * @brief Evaluation protocol of one run, shared by every solver backend.
     *
     * Owns the run's TerminationEvaluator and best-so-far candidate. Backends
     * call evaluate() for real trial points, gradient() for derivatives, and
     * bracket each iteration with beginIteration()/completeIteration().
     * A backend must test canEvaluate() before every evaluation and give up
     * as soon as it returns false.
     */
    class SearchContext {
    public:
        SearchContext(const IModel* model, const TBounds& bounds, const Constraints& constraints,
                      const TTermination& termination, StepCallback onStep, TSearchSetup setup);

        // Evaluates x0 and emits it as step 0
        const TCandidate& start(const std::vector<double>& x0);

        // One counted objective evaluation with feasibility and best tracking
        TCandidate evaluate(const std::vector<double>& x, TConstraintValues* values = nullptr);

        // Constraint components only, not counted against the budget
        TConstraintValues constraintValues(const std::vector<double>& x) const;

        /**
         * Gradient of the objective at x. Finite-difference probes are
         * counted evaluations; returns false when the budget ran out while
         * probing.
         */
        bool gradient(const std::vector<double>& x, double fx, double fdStep, std::vector<double>& g);

        // Top of an iteration: false when the run must stop (budget or cancel)
        bool beginIteration();

        // End of an iteration; reference defaults to the previous iterate
        void completeIteration(const TCandidate& current, const TCandidate* reference = nullptr);

        void reportSolver(StopReason reason, const std::map<std::string, double>& extra = {});

        bool canEvaluate() const { return !termination_.shouldStop().has_value(); }
        bool stopped() const { return !canEvaluate(); }

        // True once beginIteration() has seen the external stop flag
        bool cancelled() const
        {
            auto r = termination_.shouldStop();
            return r.has_value() && r->reason == StopReason::CANCELLED;
        }

        TRunResult finish(const std::vector<double>& seed) const;

        const TBounds& bounds() const { return bounds_; }
        const Constraints& constraints() const { return constraints_; }
        const TCandidate& best() const { return best_; }
        const TCandidate& startCandidate() const { return start_; }
        GradientSource gradientSource() const { return setup_.gradient; }
        int iteration() const { return iter_; }
        int runIndex() const { return setup_.runIndex; }
        long evaluations() const { return termination_.evaluations(); }

    private:
        double objectiveAt(const std::vector<double>& x, bool& safe);
        void emit(const TCandidate& c);
        void log(const std::string& line) const;

        const IModel* model_;
        const TBounds& bounds_;
        const Constraints& constraints_;
        ConstraintEvaluator constraintEval_;
        TerminationEvaluator termination_;
        StepCallback onStep_;
        TSearchSetup setup_;

        TCandidate start_;
        TCandidate best_;
        bool hasBest_ = false;

        TCandidate bestStep_;
        bool hasStep_ = false;
        int iter_ = 0;
    };

} // namespace optimlib::core
