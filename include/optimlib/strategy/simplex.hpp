#pragma once

#include "optimlib/strategy/backend.hpp"

namespace optimlib::strategy {

    /**
     * Backend: SimplexBackend
     * Description: Nelder-Mead downhill simplex. Trial points are clipped to
     * the bounds and vertices are ranked by BetterCandidate, so feasibility
     * dominates the objective value. One step per simplex update; the step
     * reference is the worst vertex, so the function and step deltas measure
     * the spread of the simplex.
     */
    class SimplexBackend : public ISolverBackend {
    public:
        std::string name() const override { return "simplex"; }
        void minimize(core::SearchContext& ctx, const TBackendOptions& options) const override;
    };

} // namespace optimlib::strategy
