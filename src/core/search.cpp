#include "optimlib/core/search.hpp"
#include "optimlib/core/errors.hpp"
#include "optimlib/core/method.hpp"

namespace optimlib::core {

    const char* ToString(GradientSource source)
    {
        switch (source) {
            case GradientSource::ANALYTIC:          return "analytic";
            case GradientSource::FINITE_DIFFERENCE: return "finite-difference";
            case GradientSource::NONE:              return "none";
        }
        return "none";
    }

    SearchContext::SearchContext(const IModel* model, const TBounds& bounds, const Constraints& constraints,
                                 const TTermination& termination, StepCallback onStep, TSearchSetup setup)
        : model_(model),
          bounds_(bounds),
          constraints_(constraints),
          termination_(termination),
          onStep_(std::move(onStep)),
          setup_(std::move(setup))
    {
        if (!model_ && !setup_.controller)
            throw ConfigurationError("a run needs a model or a controller");
        if (setup_.gradient == GradientSource::ANALYTIC && (!model_ || !model_->asGradient()))
            throw ConfigurationError("analytic gradient requested but the model provides none");
    }

    double SearchContext::objectiveAt(const std::vector<double>& x, bool& safe)
    {
        double value = 0.0;
        safe = true;

        try {
            if (setup_.controller) {
                safe = setup_.controller->safe(x);

                // unsafe parameters are never applied to the controller
                if (!safe && !model_) return std::numeric_limits<double>::infinity();

                double observation = safe ? setup_.controller->apply(x) : 0.0;
                value = model_ ? model_->objective(x) : observation;
            } else {
                value = model_->objective(x);
            }
        } catch (const ConfigurationError&) {
            throw;
        } catch (const EvaluationError&) {
            throw;
        } catch (const std::exception& e) {
            throw EvaluationError("objective raised at " + FormatVector(x, setup_.decimals) + ": " + e.what());
        }

        if (!std::isfinite(value))
            throw EvaluationError("objective is not finite at " + FormatVector(x, setup_.decimals));

        return value;
    }

    TConstraintValues SearchContext::constraintValues(const std::vector<double>& x) const
    {
        if (constraints_.empty()) return {};

        try {
            return constraintEval_.values(x, constraints_);
        } catch (const ConfigurationError&) {
            throw;
        } catch (const EvaluationError&) {
            throw;
        } catch (const std::exception& e) {
            throw EvaluationError("constraint raised at " + FormatVector(x, setup_.decimals) + ": " + e.what());
        }
    }

    TCandidate SearchContext::evaluate(const std::vector<double>& x, TConstraintValues* values)
    {
        TCandidate c;
        c.x = x;
        c.meta = setup_.meta;

        bool safe = true;
        c.value = objectiveAt(x, safe);

        TConstraintValues cv = constraintValues(x);
        c.violation = ConstraintEvaluator::Violation(cv);
        c.feasible = safe && c.violation <= constraintEval_.tolerance();
        if (values) *values = std::move(cv);

        if (!hasBest_ || BetterCandidate(c, best_)) {
            best_ = c;
            hasBest_ = true;
        }

        termination_.recordEvaluation();
        return c;
    }

    bool SearchContext::gradient(const std::vector<double>& x, double fx, double fdStep, std::vector<double>& g)
    {
        const std::size_t n = x.size();

        if (setup_.gradient == GradientSource::ANALYTIC) {
            try {
                g = model_->asGradient()->gradient(x);
            } catch (const std::exception& e) {
                throw EvaluationError("gradient raised at " + FormatVector(x, setup_.decimals) + ": " + e.what());
            }
            if (g.size() != n) {
                throw EvaluationError("gradient has " + std::to_string(g.size()) +
                                      " components for a point of dimension " + std::to_string(n));
            }
            for (double v : g) {
                if (!std::isfinite(v))
                    throw EvaluationError("gradient is not finite at " + FormatVector(x, setup_.decimals));
            }
            return true;
        }

        // central differences, one-sided against an active bound or an unsafe probe
        g.assign(n, 0.0);
        std::vector<double> xp = x;
        bool safe = true;

        for (std::size_t i = 0; i < n; i++) {
            double h = fdStep * std::max(1.0, std::abs(x[i]));
            double up = x[i] + h;
            double lo = x[i] - h;
            if (!bounds_.empty()) {
                up = std::min(up, bounds_[i].second);
                lo = std::max(lo, bounds_[i].first);
            }

            double fUp = fx;
            double fLo = fx;
            if (up > x[i]) {
                if (!canEvaluate()) return false;
                xp[i] = up;
                fUp = objectiveAt(xp, safe);
                termination_.recordEvaluation();
                if (!safe) {
                    up = x[i];
                    fUp = fx;
                }
            }
            if (lo < x[i]) {
                if (!canEvaluate()) return false;
                xp[i] = lo;
                fLo = objectiveAt(xp, safe);
                termination_.recordEvaluation();
                if (!safe) {
                    lo = x[i];
                    fLo = fx;
                }
            }
            xp[i] = x[i];

            g[i] = (up > lo) ? (fUp - fLo) / (up - lo) : 0.0;
        }

        return true;
    }

    const TCandidate& SearchContext::start(const std::vector<double>& x0)
    {
        start_ = evaluate(x0);
        termination_.recordStart(start_);

        if (setup_.debug) {
            std::ostringstream ss;
            ss << std::setprecision(setup_.decimals)
               << "run=" << setup_.runIndex << " start x0=" << FormatVector(x0, setup_.decimals)
               << " f=" << start_.value << " gradient=" << ToString(setup_.gradient);
            log(ss.str());
        }

        emit(start_);
        return start_;
    }

    bool SearchContext::beginIteration()
    {
        bool cancelled = setup_.cancel && setup_.cancel->load();
        return !termination_.checkCancellation(cancelled).has_value();
    }

    void SearchContext::completeIteration(const TCandidate& current, const TCandidate* reference)
    {
        iter_++;
        emit(current);
        termination_.recordIteration(current, reference);

        if (setup_.logEvery > 0 && iter_ % setup_.logEvery == 0) {
            std::ostringstream ss;
            ss << std::setprecision(setup_.decimals)
               << "run=" << setup_.runIndex << " iter=" << iter_
               << " x=" << FormatVector(current.x, setup_.decimals)
               << " f=" << current.value << " feas=" << current.feasible
               << " viol=" << current.violation;
            log(ss.str());
        }
    }

    void SearchContext::reportSolver(StopReason reason, const std::map<std::string, double>& extra)
    {
        termination_.reportSolver(reason, extra);
    }

    void SearchContext::emit(const TCandidate& c)
    {
        THistoryRecord rec;
        rec.run_index = setup_.runIndex;
        rec.iter = iter_;
        rec.x = c.x;
        rec.f = c.value;
        rec.feasible = c.feasible;
        rec.violation = c.violation;
        rec.timestamp = get_time_in_seconds();
        rec.is_best = !hasStep_ || BetterCandidate(c, bestStep_);

        if (rec.is_best) {
            bestStep_ = c;
            hasStep_ = true;
        }

        if (onStep_) onStep_(rec);
    }

    TRunResult SearchContext::finish(const std::vector<double>& seed) const
    {
        TRunResult r;
        r.candidate = best_;
        r.termination = termination_.result();
        r.seed = seed;
        r.run_index = setup_.runIndex;

        if (setup_.debug) {
            std::ostringstream ss;
            ss << std::setprecision(setup_.decimals)
               << "run=" << setup_.runIndex << " done reason=" << ToString(r.termination.reason)
               << " best_x=" << FormatVector(best_.x, setup_.decimals) << " best_f=" << best_.value;
            log(ss.str());
        }
        return r;
    }

    void SearchContext::log(const std::string& line) const
    {
        #pragma omp critical(optimlib_log)
        std::cout << "[optimize] " << line << std::endl;
    }

} // namespace optimlib::core
