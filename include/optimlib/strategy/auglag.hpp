#pragma once

#include "optimlib/strategy/backend.hpp"

namespace optimlib::strategy {

    /**
     * Backend: AugLagBackend
     * Description: constrained mode. Powell-Hestenes-Rockafellar augmented
     * Lagrangian; every outer iteration minimizes the augmented function with
     * the bounded L-BFGS routine, then updates the multipliers and the
     * penalty. One step is emitted per outer iteration.
     */
    class AugLagBackend : public ISolverBackend {
    public:
        std::string name() const override { return "auglag"; }
        void minimize(core::SearchContext& ctx, const TBackendOptions& options) const override;
    };

} // namespace optimlib::strategy
