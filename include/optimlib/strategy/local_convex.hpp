#pragma once

#include "optimlib/strategy/strategy.hpp"

namespace optimlib::strategy {

    //--------------------------------------------------------------------------
    // Struct: TLocalConvexParams
    //--------------------------------------------------------------------------
    struct TLocalConvexParams
    {
        int memory = 10;                            // L-BFGS pairs
        double gtol = 1e-8;                         // projected gradient tolerance
        int max_linesearch = 30;                    // backtracking steps
        std::string gradient = "auto";              // auto | analytic | finite-difference
        double fd_step = 1.49e-8;                   // relative finite-difference step
        double mu0 = 10.0;                          // initial penalty (constrained mode)
        double mu_growth = 10.0;                    // penalty growth factor
        int max_outer = 50;                         // augmented Lagrangian iterations
        int inner_max_iters = 100;                  // L-BFGS iterations per outer iteration
        std::string backend = "lbfgsb";             // bounded mode
        std::string constrained_backend = "auglag"; // constrained mode
    };

    /**
     * Strategy: LocalConvex
     * Description: gradient-based local search. Without constraints it runs
     * a bounded quasi-Newton search; any inequality or equality constraint
     * switches it to an augmented Lagrangian mode.
     *
     * Gradient policy: "auto" uses the model gradient when the model has one
     * and central finite differences otherwise; "analytic" on a model
     * without gradient is a ConfigurationError. The source used is recorded
     * in every candidate's meta["gradient"].
     */
    class LocalConvex : public IStrategy {
    public:
        explicit LocalConvex(TLocalConvexParams params = {});

        // Throws ConfigurationError on unknown keys and bad values
        static TLocalConvexParams ParseParams(const YAML::Node& node);

        std::string name() const override { return "LocalConvex"; }
        YAML::Node params() const override;

        const TLocalConvexParams& settings() const { return params_; }

    protected:
        TPlan plan(const core::IModel* model, const core::Constraints& constraints) const override;

    private:
        TLocalConvexParams params_;
    };

} // namespace optimlib::strategy
