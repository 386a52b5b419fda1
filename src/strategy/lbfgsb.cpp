#include "optimlib/strategy/lbfgsb.hpp"
#include "optimlib/core/method.hpp"
#include <deque>

namespace optimlib::strategy {

    using namespace optimlib::core;

    namespace {

        const double ARMIJO_C1 = 1e-4;
        const double CURVATURE_EPS = 1e-10;

        struct TPair
        {
            std::vector<double> s;
            std::vector<double> y;
            double rho;
        };

        // coordinates held at a bound by a gradient pointing outwards
        std::vector<bool> ActiveSet(const std::vector<double>& x, const std::vector<double>& g, const TBounds& bounds)
        {
            std::vector<bool> active(x.size(), false);
            if (bounds.empty()) return active;

            for (std::size_t i = 0; i < x.size(); i++) {
                if (x[i] <= bounds[i].first && g[i] > 0.0) active[i] = true;
                else if (x[i] >= bounds[i].second && g[i] < 0.0) active[i] = true;
            }
            return active;
        }

        double InfNorm(const std::vector<double>& v)
        {
            double m = 0.0;
            for (double e : v) m = std::max(m, std::abs(e));
            return m;
        }

        // H * q with the two-loop recursion over the stored pairs
        std::vector<double> TwoLoop(const std::deque<TPair>& memory, std::vector<double> q)
        {
            const int m = static_cast<int>(memory.size());
            std::vector<double> alpha(m, 0.0);

            for (int k = m - 1; k >= 0; k--) {
                alpha[k] = memory[k].rho * Dot(memory[k].s, q);
                for (std::size_t i = 0; i < q.size(); i++) q[i] -= alpha[k] * memory[k].y[i];
            }

            if (m > 0) {
                const TPair& last = memory.back();
                double gamma = Dot(last.s, last.y) / Dot(last.y, last.y);
                for (double& e : q) e *= gamma;
            }

            for (int k = 0; k < m; k++) {
                double beta = memory[k].rho * Dot(memory[k].y, q);
                for (std::size_t i = 0; i < q.size(); i++) q[i] += memory[k].s[i] * (alpha[k] - beta);
            }
            return q;
        }

    } // namespace

    TLbfgsOutcome MinimizeProjectedLbfgs(ISmoothObjective& fn, const std::vector<double>& x0, double fx0,
                                         const TBounds& bounds, const TLbfgsOptions& options)
    {
        TLbfgsOutcome out;
        out.x = x0;
        out.f = fx0;

        const std::size_t n = x0.size();
        std::vector<double> g;
        if (fn.stopped() || !fn.gradient(out.x, out.f, g)) return out;

        std::deque<TPair> memory;
        std::vector<double> xt(n);

        while (true) {
            std::vector<bool> active = ActiveSet(out.x, g, bounds);
            std::vector<double> pg = g;
            for (std::size_t i = 0; i < n; i++) if (active[i]) pg[i] = 0.0;

            out.pgNorm = InfNorm(pg);
            if (out.pgNorm < options.gtol) {
                out.status = LbfgsStatus::CONVERGED;
                return out;
            }
            if (options.maxIters > 0 && out.iters >= options.maxIters) {
                out.status = LbfgsStatus::MAX_ITERS;
                return out;
            }
            if (!fn.beginIteration()) {
                out.status = LbfgsStatus::STOPPED;
                return out;
            }

            // quasi-Newton direction on the free variables
            std::vector<double> d = TwoLoop(memory, pg);
            for (std::size_t i = 0; i < n; i++) d[i] = active[i] ? 0.0 : -d[i];

            if (!(Dot(d, pg) < 0.0)) {
                memory.clear();
                for (std::size_t i = 0; i < n; i++) d[i] = -pg[i];
            }

            double t = memory.empty() ? std::min(1.0, 1.0 / out.pgNorm) : 1.0;
            double ft = out.f;
            bool accepted = false;

            for (int k = 0; k < options.maxLinesearch; k++) {
                if (fn.stopped()) {
                    out.status = LbfgsStatus::STOPPED;
                    return out;
                }

                for (std::size_t i = 0; i < n; i++) xt[i] = out.x[i] + t * d[i];
                ClipToBounds(xt, bounds);

                double decrease = 0.0;
                for (std::size_t i = 0; i < n; i++) decrease += g[i] * (xt[i] - out.x[i]);

                ft = fn.value(xt);
                if (ft <= out.f + ARMIJO_C1 * decrease) {
                    accepted = true;
                    break;
                }
                t *= 0.5;
            }

            if (!accepted) {
                if (!memory.empty()) {
                    // retry the iteration along the projected steepest descent
                    memory.clear();
                    continue;
                }
                out.status = LbfgsStatus::LINESEARCH_FAILED;
                return out;
            }

            std::vector<double> s(n);
            for (std::size_t i = 0; i < n; i++) s[i] = xt[i] - out.x[i];

            out.x = xt;
            out.f = ft;
            out.iters++;
            fn.endIteration(out.x, out.f);

            std::vector<double> gNew;
            if (fn.stopped() || !fn.gradient(out.x, out.f, gNew)) {
                out.status = LbfgsStatus::STOPPED;
                return out;
            }

            std::vector<double> y(n);
            for (std::size_t i = 0; i < n; i++) y[i] = gNew[i] - g[i];

            double sy = Dot(s, y);
            if (sy > CURVATURE_EPS) {
                memory.push_back({ std::move(s), std::move(y), 1.0 / sy });
                if (static_cast<int>(memory.size()) > options.memory) memory.pop_front();
            }
            g = std::move(gNew);
        }
    }

    TLbfgsOptions LbfgsOptionsFrom(const TBackendOptions& options)
    {
        TLbfgsOptions o;
        o.memory = static_cast<int>(OptionOr(options, "memory", o.memory));
        o.gtol = OptionOr(options, "gtol", o.gtol);
        o.maxLinesearch = static_cast<int>(OptionOr(options, "max_linesearch", o.maxLinesearch));
        return o;
    }

    //-------------------------------------------------------------------------
    // Bounded mode
    //-------------------------------------------------------------------------

    namespace {

        class BoundedObjective : public ISmoothObjective {
        public:
            BoundedObjective(SearchContext& ctx, double fdStep)
                : ctx_(ctx), fdStep_(fdStep), last_(ctx.startCandidate()) {}

            double value(const std::vector<double>& x) override
            {
                last_ = ctx_.evaluate(x);
                return last_.value;
            }

            bool gradient(const std::vector<double>& x, double fx, std::vector<double>& g) override
            {
                return ctx_.gradient(x, fx, fdStep_, g);
            }

            bool stopped() const override { return ctx_.stopped(); }
            bool beginIteration() override { return ctx_.beginIteration(); }

            // the accepted trial is always the last evaluated point
            void endIteration(const std::vector<double>&, double) override { ctx_.completeIteration(last_); }

        private:
            SearchContext& ctx_;
            double fdStep_;
            TCandidate last_;
        };

    } // namespace

    void LbfgsbBackend::minimize(SearchContext& ctx, const TBackendOptions& options) const
    {
        BoundedObjective fn(ctx, OptionOr(options, "fd_step", 1.49e-8));
        const TCandidate& start = ctx.startCandidate();

        TLbfgsOutcome out = MinimizeProjectedLbfgs(fn, start.x, start.value, ctx.bounds(), LbfgsOptionsFrom(options));

        switch (out.status) {
            case LbfgsStatus::CONVERGED:
                ctx.reportSolver(StopReason::CONVERGED, { { "pg_norm", out.pgNorm } });
                break;
            case LbfgsStatus::LINESEARCH_FAILED:
                ctx.reportSolver(StopReason::FAILED, { { "linesearch_failed", 1.0 }, { "pg_norm", out.pgNorm } });
                break;
            case LbfgsStatus::MAX_ITERS:
            case LbfgsStatus::STOPPED:
                break;
        }
    }

} // namespace optimlib::strategy
