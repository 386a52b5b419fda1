#pragma once

#include "optimlib/strategy/backend.hpp"
#include <yaml-cpp/yaml.h>

namespace optimlib::strategy {

    //--------------------------------------------------------------------------
    // Struct: TRunSettings
    // Description: Per-run knobs supplied by the orchestrator
    //--------------------------------------------------------------------------
    struct TRunSettings
    {
        int runIndex = 0;
        const std::atomic<bool>* cancel = nullptr;  // checked at the top of each iteration
        core::IController* controller = nullptr;
        int logEvery = 0;
        int debug = 0;
        int decimals = 6;
    };

    //--------------------------------------------------------------------------
    // Struct: TPlan
    // Description: How a strategy will attack one problem
    //--------------------------------------------------------------------------
    struct TPlan
    {
        std::string backend;                                    // registry name
        std::string mode;                                       // bounded, constrained, simplex
        core::GradientSource gradient = core::GradientSource::NONE;
        TBackendOptions options;
    };

    /**
     * @brief Polymorphic search procedure.
     *
     * run() validates the problem (dimensions, bounds, termination and the
     * constraint shapes at x0) before the first objective evaluation, picks a
     * backend through plan(), and drives it. on_step is called inline once
     * per iteration, plus once for the start point. A backend missing from
     * the registry yields a "failed" result flagged "skipped", never an
     * exception.
     */
    class IStrategy {
    public:
        virtual ~IStrategy() = default;

        virtual std::string name() const = 0;

        // Typed parameters, echoed to the output store
        virtual YAML::Node params() const = 0;

        core::TRunResult run(const core::IModel* model, const std::vector<double>& x0,
                             const core::TBounds& bounds, const core::Constraints& constraints,
                             const core::TTermination& termination, const core::StepCallback& onStep,
                             const TRunSettings& settings = {}) const;

    protected:
        virtual TPlan plan(const core::IModel* model, const core::Constraints& constraints) const = 0;

    private:
        core::TRunResult skipped(const TPlan& plan, const std::vector<double>& x0, const std::vector<double>& start,
                                 const core::TTermination& termination, const TRunSettings& settings) const;
    };

} // namespace optimlib::strategy
