#include "optimlib/strategy/simplex.hpp"
#include "optimlib/core/method.hpp"

namespace optimlib::strategy {

    using namespace optimlib::core;

    // a + coef * (b - a), clipped to the bounds
    static std::vector<double> Along(const std::vector<double>& a, const std::vector<double>& b, double coef,
                                     const TBounds& bounds)
    {
        std::vector<double> x(a.size());
        for (std::size_t i = 0; i < a.size(); i++) x[i] = a[i] + coef * (b[i] - a[i]);
        ClipToBounds(x, bounds);
        return x;
    }

    void SimplexBackend::minimize(SearchContext& ctx, const TBackendOptions& options) const
    {
        const double step = OptionOr(options, "initial_step", 0.05);
        const double zeroStep = OptionOr(options, "zero_step", 0.00025);
        const double alpha = OptionOr(options, "alpha", 1.0);
        const double gamma = OptionOr(options, "gamma", 2.0);
        const double rho = OptionOr(options, "rho", 0.5);
        const double sigma = OptionOr(options, "sigma", 0.5);

        const TBounds& bounds = ctx.bounds();
        const TCandidate& start = ctx.startCandidate();
        const std::size_t n = start.x.size();

        // initial simplex: x0 plus one relative perturbation per coordinate
        std::vector<TCandidate> simplex;
        simplex.push_back(start);
        for (std::size_t i = 0; i < n; i++) {
            if (!ctx.canEvaluate()) return;

            std::vector<double> v = start.x;
            double h = (v[i] != 0.0) ? step * v[i] : zeroStep;
            v[i] = start.x[i] + h;
            ClipToBounds(v, bounds);
            if (v[i] == start.x[i]) {
                v[i] = start.x[i] - h;
                ClipToBounds(v, bounds);
            }
            simplex.push_back(ctx.evaluate(v));
        }

        auto order = [&simplex]() { std::stable_sort(simplex.begin(), simplex.end(), BetterCandidate); };

        while (true) {
            order();
            if (!ctx.beginIteration()) return;

            std::vector<double> centroid(n, 0.0);
            for (std::size_t k = 0; k < n; k++)
                for (std::size_t i = 0; i < n; i++) centroid[i] += simplex[k].x[i] / static_cast<double>(n);

            const TCandidate worst = simplex[n];

            if (!ctx.canEvaluate()) return;
            TCandidate r = ctx.evaluate(Along(centroid, worst.x, -alpha, bounds));

            if (BetterCandidate(r, simplex[0])) {
                if (!ctx.canEvaluate()) return;
                TCandidate e = ctx.evaluate(Along(centroid, r.x, gamma, bounds));
                simplex[n] = BetterCandidate(e, r) ? e : r;
            } else if (BetterCandidate(r, simplex[n - 1])) {
                simplex[n] = r;
            } else {
                const bool outside = BetterCandidate(r, worst);

                if (!ctx.canEvaluate()) return;
                TCandidate c = ctx.evaluate(outside ? Along(centroid, r.x, rho, bounds)
                                                    : Along(centroid, worst.x, rho, bounds));

                const bool accept = outside ? !BetterCandidate(r, c) : BetterCandidate(c, worst);
                if (accept) {
                    simplex[n] = c;
                } else {
                    // shrink towards the best vertex
                    for (std::size_t k = 1; k <= n; k++) {
                        if (!ctx.canEvaluate()) return;
                        simplex[k] = ctx.evaluate(Along(simplex[0].x, simplex[k].x, sigma, bounds));
                    }
                }
            }

            order();
            ctx.completeIteration(simplex[0], &simplex[n]);
            if (ctx.stopped()) return;
        }
    }

} // namespace optimlib::strategy
