#include "optimlib/strategy/auglag.hpp"
#include "optimlib/strategy/lbfgsb.hpp"
#include "optimlib/core/errors.hpp"
#include "optimlib/core/method.hpp"

namespace optimlib::strategy {

    using namespace optimlib::core;

    namespace {

        const double MU_MAX = 1e12;

        /**
         * L(x) = f(x) + 1/(2 mu) sum_k (max(0, lambda_k + mu g_k)^2 - lambda_k^2)
         *             + sum_j (nu_j h_j + mu/2 h_j^2)
         * Objective derivatives come from the context; constraint
         * derivatives are central differences, which cost no evaluations.
         */
        class AugmentedObjective : public ISmoothObjective {
        public:
            AugmentedObjective(SearchContext& ctx, double fdStep) : ctx_(ctx), fdStep_(fdStep) {}

            void reset(const TCandidate& at, const TConstraintValues& values,
                       const std::vector<double>& lambda, const std::vector<double>& nu, double mu)
            {
                last_ = accepted_ = at;
                lastValues_ = acceptedValues_ = values;
                lambda_ = lambda;
                nu_ = nu;
                mu_ = mu;
            }

            double augmented(double f, const TConstraintValues& cv) const
            {
                checkShape(cv);

                double L = f;
                for (std::size_t k = 0; k < cv.ineq.size(); k++) {
                    double t = std::max(0.0, lambda_[k] + mu_ * cv.ineq[k]);
                    L += (t * t - lambda_[k] * lambda_[k]) / (2.0 * mu_);
                }
                for (std::size_t j = 0; j < cv.eq.size(); j++)
                    L += nu_[j] * cv.eq[j] + 0.5 * mu_ * cv.eq[j] * cv.eq[j];
                return L;
            }

            double value(const std::vector<double>& x) override
            {
                last_ = ctx_.evaluate(x, &lastValues_);
                return augmented(last_.value, lastValues_);
            }

            bool gradient(const std::vector<double>& x, double, std::vector<double>& g) override
            {
                if (x != last_.x && x != accepted_.x) {
                    if (!ctx_.canEvaluate()) return false;
                    value(x);
                }
                const bool atLast = (x == last_.x);
                const double f = atLast ? last_.value : accepted_.value;
                const TConstraintValues cv = atLast ? lastValues_ : acceptedValues_;

                if (!ctx_.gradient(x, f, fdStep_, g)) return false;

                std::vector<double> wIneq(cv.ineq.size());
                std::vector<double> wEq(cv.eq.size());
                for (std::size_t k = 0; k < wIneq.size(); k++) wIneq[k] = std::max(0.0, lambda_[k] + mu_ * cv.ineq[k]);
                for (std::size_t j = 0; j < wEq.size(); j++) wEq[j] = nu_[j] + mu_ * cv.eq[j];

                std::vector<double> xp = x;
                for (std::size_t i = 0; i < x.size(); i++) {
                    double h = fdStep_ * std::max(1.0, std::abs(x[i]));

                    xp[i] = x[i] + h;
                    TConstraintValues up = ctx_.constraintValues(xp);
                    xp[i] = x[i] - h;
                    TConstraintValues lo = ctx_.constraintValues(xp);
                    xp[i] = x[i];

                    checkShape(up);
                    checkShape(lo);

                    for (std::size_t k = 0; k < wIneq.size(); k++)
                        if (wIneq[k] != 0.0) g[i] += wIneq[k] * (up.ineq[k] - lo.ineq[k]) / (2.0 * h);
                    for (std::size_t j = 0; j < wEq.size(); j++)
                        g[i] += wEq[j] * (up.eq[j] - lo.eq[j]) / (2.0 * h);
                }
                return true;
            }

            bool stopped() const override { return ctx_.stopped(); }

            // inner iterations honour budget and cancellation but emit no step
            bool beginIteration() override { return ctx_.beginIteration(); }

            void endIteration(const std::vector<double>&, double) override
            {
                accepted_ = last_;
                acceptedValues_ = lastValues_;
            }

            const TCandidate& accepted() const { return accepted_; }
            const TConstraintValues& acceptedValues() const { return acceptedValues_; }

        private:
            void checkShape(const TConstraintValues& cv) const
            {
                if (cv.ineq.size() != lambda_.size() || cv.eq.size() != nu_.size())
                    throw EvaluationError("a constraint changed its number of components during the run");
            }

            SearchContext& ctx_;
            double fdStep_;

            TCandidate last_;
            TConstraintValues lastValues_;
            TCandidate accepted_;
            TConstraintValues acceptedValues_;

            std::vector<double> lambda_;
            std::vector<double> nu_;
            double mu_ = 10.0;
        };

    } // namespace

    void AugLagBackend::minimize(SearchContext& ctx, const TBackendOptions& options) const
    {
        const double fdStep = OptionOr(options, "fd_step", 1.49e-8);
        const double growth = OptionOr(options, "mu_growth", 10.0);
        const int maxOuter = static_cast<int>(OptionOr(options, "max_outer", 50));
        double mu = OptionOr(options, "mu0", 10.0);

        TLbfgsOptions inner = LbfgsOptionsFrom(options);
        inner.maxIters = static_cast<int>(OptionOr(options, "inner_max_iters", 100));

        TCandidate current = ctx.startCandidate();
        TConstraintValues values = ctx.constraintValues(current.x);
        std::vector<double> lambda(values.ineq.size(), 0.0);
        std::vector<double> nu(values.eq.size(), 0.0);

        AugmentedObjective fn(ctx, fdStep);
        double prevViolation = current.violation;

        for (int outer = 1; outer <= maxOuter; outer++) {
            if (!ctx.beginIteration()) return;

            fn.reset(current, values, lambda, nu, mu);
            TLbfgsOutcome out = MinimizeProjectedLbfgs(fn, current.x, fn.augmented(current.value, values),
                                                       ctx.bounds(), inner);
            // an interrupted outer iteration is not reported
            if (ctx.cancelled()) return;

            current = fn.accepted();
            values = fn.acceptedValues();

            // first-order multiplier update
            for (std::size_t k = 0; k < lambda.size(); k++) lambda[k] = std::max(0.0, lambda[k] + mu * values.ineq[k]);
            for (std::size_t j = 0; j < nu.size(); j++) nu[j] += mu * values.eq[j];

            if (current.violation > 0.25 * prevViolation) mu = std::min(mu * growth, MU_MAX);
            prevViolation = current.violation;

            ctx.completeIteration(current);
            if (ctx.stopped()) return;

            // a feasible point the inner solver could not move away from
            if (current.feasible && out.status == LbfgsStatus::CONVERGED && out.iters == 0) {
                ctx.reportSolver(StopReason::CONVERGED, { { "outer_iters", static_cast<double>(outer) }, { "mu", mu } });
                return;
            }
        }

        ctx.reportSolver(ctx.best().feasible ? StopReason::CONVERGED : StopReason::FAILED,
                         { { "max_outer_reached", 1.0 }, { "mu", mu } });
    }

} // namespace optimlib::strategy
