#pragma once

#include "optimlib/strategy/backend.hpp"

namespace optimlib::strategy {

    /**
     * @brief Smooth function seen by the projected L-BFGS routine.
     *
     * value() and gradient() may consume the evaluation budget; once
     * stopped() is true the routine returns without evaluating again.
     */
    class ISmoothObjective {
    public:
        virtual ~ISmoothObjective() = default;

        virtual double value(const std::vector<double>& x) = 0;
        virtual bool gradient(const std::vector<double>& x, double fx, std::vector<double>& g) = 0;
        virtual bool stopped() const = 0;

        virtual bool beginIteration() { return !stopped(); }
        virtual void endIteration(const std::vector<double>& x, double fx) { (void)x; (void)fx; }
    };

    //--------------------------------------------------------------------------
    // Struct: TLbfgsOptions
    //--------------------------------------------------------------------------
    struct TLbfgsOptions
    {
        int memory = 10;                // stored (s, y) pairs
        double gtol = 1e-8;             // projected gradient infinity norm
        int maxLinesearch = 30;         // backtracking steps per iteration
        int maxIters = 0;               // 0 = until stopped or converged
    };

    enum class LbfgsStatus { CONVERGED, LINESEARCH_FAILED, MAX_ITERS, STOPPED };

    struct TLbfgsOutcome
    {
        LbfgsStatus status = LbfgsStatus::STOPPED;
        std::vector<double> x;
        double f = 0.0;
        int iters = 0;
        double pgNorm = 0.0;            // projected gradient norm at x
    };

    /**
     * Method: MinimizeProjectedLbfgs
     * Description: limited-memory BFGS with gradient projection on the box
     * bounds and Armijo backtracking along the projected path. x0 must lie
     * inside the bounds and fx0 be its value.
     */
    TLbfgsOutcome MinimizeProjectedLbfgs(ISmoothObjective& fn, const std::vector<double>& x0, double fx0,
                                         const core::TBounds& bounds, const TLbfgsOptions& options);

    TLbfgsOptions LbfgsOptionsFrom(const TBackendOptions& options);

    // Bounded mode: one projected L-BFGS iteration per step
    class LbfgsbBackend : public ISolverBackend {
    public:
        std::string name() const override { return "lbfgsb"; }
        void minimize(core::SearchContext& ctx, const TBackendOptions& options) const override;
    };

} // namespace optimlib::strategy
