#pragma once

#include "optimlib/core/common.hpp"

namespace optimlib::core {

    using TBounds = std::vector<std::pair<double, double>>;   // (low, high) per coordinate, empty = unbounded
    using TMeta = std::map<std::string, std::string>;

    //--------------------------------------------------------------------------
    // Struct: TCandidate
    // Description: A point of the search space with its evaluation
    //--------------------------------------------------------------------------
    struct TCandidate
    {
        std::vector<double> x;                                  // decision vector
        double value = std::numeric_limits<double>::infinity(); // objective function value
        bool feasible = true;                                   // violation <= tolerance (and controller safe)
        double violation = 0.0;                                 // aggregated constraint violation, >= 0
        TMeta meta;                                             // strategy, mode, gradient source...

        TCandidate() = default;
    };

    //--------------------------------------------------------------------------
    // Struct: TTermination
    // Description: Stop criteria of a single run
    //--------------------------------------------------------------------------
    struct TTermination
    {
        int max_evals = 200;                    // objective evaluation budget
        double ftol_abs = 1e-9;                 // absolute change of f between iterations
        double ftol_rel = 1e-9;                 // relative change of f between iterations
        double xtol_abs = 1e-9;                 // euclidean step length between iterations
        std::optional<int> max_iters;           // iteration budget
        int stall_window = 2;                   // consecutive iterations a convergence test must hold
        std::optional<double> max_time_s;       // wall clock budget
    };

    //--------------------------------------------------------------------------
    // Enum: StopReason
    // Description: Why a run stopped, in decreasing priority
    //--------------------------------------------------------------------------
    enum class StopReason { BUDGET, FTOL, XTOL, CANCELLED, CONVERGED, FAILED };

    const char* ToString(StopReason reason);

    //--------------------------------------------------------------------------
    // Struct: TTerminationResult
    //--------------------------------------------------------------------------
    struct TTerminationResult
    {
        StopReason reason = StopReason::FAILED;
        std::map<std::string, double> metrics;  // evals, iters, f_delta, x_delta, elapsed_s, skipped...
        std::map<std::string, long> budget;     // consumed vs allotted
    };

    //--------------------------------------------------------------------------
    // Struct: TRunResult
    // Description: Outcome of one start point of a multi-start batch
    //--------------------------------------------------------------------------
    struct TRunResult
    {
        TCandidate candidate;                   // best candidate of the run
        TTerminationResult termination;
        std::vector<double> seed;               // x0 of the run
        int run_index = 0;
        bool completed = true;                  // false when the run raised an EvaluationError
        std::string error;                      // message of that error
    };

    //--------------------------------------------------------------------------
    // Struct: THistoryRecord
    // Description: Payload of one step event, kept verbatim in the history
    //--------------------------------------------------------------------------
    struct THistoryRecord
    {
        int run_index = 0;
        int iter = 0;
        std::vector<double> x;
        double f = 0.0;
        bool feasible = true;
        double violation = 0.0;
        double timestamp = 0.0;                 // seconds, monotonic clock
        bool is_best = false;                   // improved the best candidate of the run
    };

    //--------------------------------------------------------------------------
    // Struct: TRunData
    // Description: Invocation-wide execution knobs
    //--------------------------------------------------------------------------
    struct TRunData
    {
        int debug = 0;                          // print progress lines on screen
        int logEvery = 0;                       // log one line every N iterations (0 = off)
        int decimals = 6;                       // precision of logged numbers
        bool parallel = false;                  // run multi-start seeds in an OpenMP loop
        unsigned int seed = 0;                  // forwarded to controller reset
    };

} // namespace optimlib::core
