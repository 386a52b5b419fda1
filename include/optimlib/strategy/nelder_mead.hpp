#pragma once

#include "optimlib/strategy/strategy.hpp"

namespace optimlib::strategy {

    //--------------------------------------------------------------------------
    // Struct: TNelderMeadParams
    //--------------------------------------------------------------------------
    struct TNelderMeadParams
    {
        double initial_step = 0.05;     // relative size of the initial simplex
        double alpha = 1.0;             // reflection
        double gamma = 2.0;             // expansion
        double rho = 0.5;               // contraction
        double sigma = 0.5;             // shrink
        std::string backend = "simplex";
    };

    /**
     * Strategy: NelderMead
     * Description: gradient-free simplex search. The model gradient is never
     * used; bounds are enforced by clipping every trial point.
     */
    class NelderMead : public IStrategy {
    public:
        explicit NelderMead(TNelderMeadParams params = {});

        static TNelderMeadParams ParseParams(const YAML::Node& node);

        std::string name() const override { return "NelderMead"; }
        YAML::Node params() const override;

        const TNelderMeadParams& settings() const { return params_; }

    protected:
        TPlan plan(const core::IModel* model, const core::Constraints& constraints) const override;

    private:
        TNelderMeadParams params_;
    };

} // namespace optimlib::strategy
