#pragma once

#include "optimlib/core/data.hpp"
#include <yaml-cpp/yaml.h>

namespace optimlib::core {

    // Vector-valued constraint function, read componentwise
    using ConstraintFn = std::function<std::vector<double>(const std::vector<double>&)>;

    //--------------------------------------------------------------------------
    // Struct: Constraints
    // Description: ineq[i](x) <= 0 and eq[j](x) = 0, componentwise
    //--------------------------------------------------------------------------
    struct Constraints
    {
        std::vector<ConstraintFn> ineq;
        std::vector<ConstraintFn> eq;

        bool empty() const { return ineq.empty() && eq.empty(); }
    };

    //--------------------------------------------------------------------------
    // Struct: TConstraintValues
    // Description: every component of every constraint at one point
    //--------------------------------------------------------------------------
    struct TConstraintValues
    {
        std::vector<double> ineq;
        std::vector<double> eq;
    };

    /**
     * @brief Feasibility and violation of a point.
     *
     * The violation is the maximum over all components of max(0, g_k) and
     * |h_k|; a point is feasible when that maximum does not exceed the
     * tolerance. Without constraints every point is feasible with violation 0.
     * A constraint returning no component or a non-finite component is a
     * ConfigurationError.
     */
    class ConstraintEvaluator {
    public:
        explicit ConstraintEvaluator(double tolerance = OPTIMLIB_FEASIBILITY_TOL);

        std::pair<bool, double> evaluate(const std::vector<double>& x, const Constraints& constraints) const;

        TConstraintValues values(const std::vector<double>& x, const Constraints& constraints) const;

        static double Violation(const TConstraintValues& values);

        double tolerance() const { return tolerance_; }

    private:
        double tolerance_;
    };

    /**
     * Method: ParseBounds
     * Description: [[lo, hi], ...] from YAML; a null limit is unbounded on
     * that side. Null or absent node gives empty bounds.
     */
    TBounds ParseBounds(const YAML::Node& node);

    /**
     * Method: BuildLinearConstraints
     * Description: converts YAML blocks {type: linear, a: [...], b: v} into
     * g(x) = a.x - b (ineq) and h(x) = a.x - b (eq). A "bounds" entry of the
     * block is copied to liftedBounds when given.
     */
    Constraints BuildLinearConstraints(const YAML::Node& spec, TBounds* liftedBounds = nullptr);

} // namespace optimlib::core
