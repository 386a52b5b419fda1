#include "optimlib/core/termination.hpp"
#include "optimlib/core/method.hpp"

namespace optimlib::core {

    const char* ToString(StopReason reason)
    {
        switch (reason) {
            case StopReason::BUDGET:    return "budget";
            case StopReason::FTOL:      return "ftol";
            case StopReason::XTOL:      return "xtol";
            case StopReason::CANCELLED: return "cancelled";
            case StopReason::CONVERGED: return "converged";
            case StopReason::FAILED:    return "failed";
        }
        return "failed";
    }

    TerminationEvaluator::TerminationEvaluator(const TTermination& spec)
        : spec_(spec), startTime_(get_time_in_seconds())
    {
        ValidateTermination(spec_);
    }

    void TerminationEvaluator::stop(StopReason reason)
    {
        if (!reason_) reason_ = reason;
    }

    bool TerminationEvaluator::budgetExhausted() const
    {
        if (evals_ >= spec_.max_evals) return true;
        if (spec_.max_iters && iters_ >= *spec_.max_iters) return true;
        if (spec_.max_time_s && (get_time_in_seconds() - startTime_) >= *spec_.max_time_s) return true;
        return false;
    }

    void TerminationEvaluator::recordStart(const TCandidate& start)
    {
        previous_ = start;
        if (budgetExhausted()) stop(StopReason::BUDGET);
    }

    std::optional<TTerminationResult> TerminationEvaluator::recordEvaluation()
    {
        evals_++;
        if (budgetExhausted()) stop(StopReason::BUDGET);
        return shouldStop();
    }

    std::optional<TTerminationResult> TerminationEvaluator::recordIteration(const TCandidate& current,
                                                                             const TCandidate* reference)
    {
        iters_++;

        const TCandidate* ref = reference ? reference : (previous_ ? &*previous_ : nullptr);
        if (ref) {
            fDelta_ = std::abs(current.value - ref->value);
            xDelta_ = Distance(current.x, ref->x);

            bool fSmall = fDelta_ < spec_.ftol_abs ||
                          (spec_.ftol_rel > 0 && fDelta_ < spec_.ftol_rel * std::abs(current.value));
            bool xSmall = xDelta_ < spec_.xtol_abs;

            fStall_ = fSmall ? fStall_ + 1 : 0;
            xStall_ = xSmall ? xStall_ + 1 : 0;
        }
        previous_ = current;

        if (budgetExhausted()) stop(StopReason::BUDGET);
        if (fStall_ >= spec_.stall_window) stop(StopReason::FTOL);
        if (xStall_ >= spec_.stall_window) stop(StopReason::XTOL);

        return shouldStop();
    }

    std::optional<TTerminationResult> TerminationEvaluator::checkCancellation(bool cancelled)
    {
        if (budgetExhausted()) stop(StopReason::BUDGET);
        if (cancelled) stop(StopReason::CANCELLED);
        return shouldStop();
    }

    void TerminationEvaluator::reportSolver(StopReason reason, const std::map<std::string, double>& extra)
    {
        for (const auto& [k, v] : extra) solverMetrics_[k] = v;
        stop(reason);
    }

    std::optional<TTerminationResult> TerminationEvaluator::shouldStop() const
    {
        if (!reason_) return std::nullopt;
        return result();
    }

    TTerminationResult TerminationEvaluator::result() const
    {
        TTerminationResult r;
        // a strategy that returns without a verdict ran out of work
        r.reason = reason_.value_or(StopReason::CONVERGED);

        r.metrics["evals"] = static_cast<double>(evals_);
        r.metrics["iters"] = static_cast<double>(iters_);
        r.metrics["elapsed_s"] = get_time_in_seconds() - startTime_;
        if (!std::isnan(fDelta_)) r.metrics["f_delta"] = fDelta_;
        if (!std::isnan(xDelta_)) r.metrics["x_delta"] = xDelta_;
        for (const auto& [k, v] : solverMetrics_) r.metrics[k] = v;

        r.budget["max_evals"] = spec_.max_evals;
        r.budget["evals"] = evals_;
        r.budget["iters"] = iters_;
        if (spec_.max_iters) r.budget["max_iters"] = *spec_.max_iters;

        return r;
    }

} // namespace optimlib::core
