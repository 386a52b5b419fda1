#pragma once

#include "optimlib/core/data.hpp"
#include <variant>

namespace optimlib::progress {

    //--------------------------------------------------------------------------
    // Struct: TStartEvent
    //--------------------------------------------------------------------------
    struct TStartEvent
    {
        int run_index = 0;
        int total_runs = 1;
        std::vector<double> x0;
        core::TBounds bounds;
        double timestamp = 0.0;
    };

    // A step event is the history record itself
    using TStepEvent = core::THistoryRecord;

    //--------------------------------------------------------------------------
    // Struct: TEndEvent
    //--------------------------------------------------------------------------
    struct TEndEvent
    {
        int run_index = 0;
        core::StopReason reason = core::StopReason::FAILED;
        core::TCandidate best;
        double timestamp = 0.0;
    };

    using TProgressEvent = std::variant<TStartEvent, TStepEvent, TEndEvent>;

    //--------------------------------------------------------------------------
    // Struct: TThrottle
    // Description: delivery thresholds of step events to one observer.
    // A threshold is active when throttle_s > 0 or update_every > 1; with no
    // active threshold every step is delivered.
    //--------------------------------------------------------------------------
    struct TThrottle
    {
        double throttle_s = 0.0;    // minimum seconds between two deliveries
        int update_every = 1;       // minimum steps between two deliveries
    };

} // namespace optimlib::progress
