#include "optimlib/strategy/local_convex.hpp"
#include "optimlib/core/errors.hpp"
#include "optimlib/core/method.hpp"

namespace optimlib::strategy {

    using namespace optimlib::core;

    static std::string NormalizeGradient(const std::string& value)
    {
        const std::string v = NormalizeName(value);
        if (v == "auto" || v == "analytic") return v;
        if (v == "finite-difference" || v == "finite_difference" || v == "fd" || v == "numeric")
            return "finite-difference";
        throw ConfigurationError("LocalConvex: gradient must be auto, analytic or finite-difference, got '" + value + "'");
    }

    LocalConvex::LocalConvex(TLocalConvexParams params)
        : params_(std::move(params))
    {
        params_.gradient = NormalizeGradient(params_.gradient);

        if (params_.memory < 1) throw ConfigurationError("LocalConvex: memory must be >= 1");
        if (!(params_.gtol > 0)) throw ConfigurationError("LocalConvex: gtol must be positive");
        if (params_.max_linesearch < 1) throw ConfigurationError("LocalConvex: max_linesearch must be >= 1");
        if (!(params_.fd_step > 0)) throw ConfigurationError("LocalConvex: fd_step must be positive");
        if (!(params_.mu0 > 0)) throw ConfigurationError("LocalConvex: mu0 must be positive");
        if (!(params_.mu_growth >= 1)) throw ConfigurationError("LocalConvex: mu_growth must be >= 1");
        if (params_.max_outer < 1) throw ConfigurationError("LocalConvex: max_outer must be >= 1");
        if (params_.inner_max_iters < 1) throw ConfigurationError("LocalConvex: inner_max_iters must be >= 1");
        if (params_.backend.empty() || params_.constrained_backend.empty())
            throw ConfigurationError("LocalConvex: backend names must not be empty");
    }

    TLocalConvexParams LocalConvex::ParseParams(const YAML::Node& node)
    {
        TLocalConvexParams p;
        if (!node || node.IsNull()) return p;
        if (!node.IsMap()) throw ConfigurationError("LocalConvex: strategy_params must be a mapping");

        std::string key;
        try {
            for (const auto& kv : node) {
                key = kv.first.as<std::string>();

                if (key == "memory")                    p.memory = kv.second.as<int>();
                else if (key == "gtol")                 p.gtol = kv.second.as<double>();
                else if (key == "max_linesearch")       p.max_linesearch = kv.second.as<int>();
                else if (key == "gradient")             p.gradient = kv.second.as<std::string>();
                else if (key == "fd_step")              p.fd_step = kv.second.as<double>();
                else if (key == "mu0")                  p.mu0 = kv.second.as<double>();
                else if (key == "mu_growth")            p.mu_growth = kv.second.as<double>();
                else if (key == "max_outer")            p.max_outer = kv.second.as<int>();
                else if (key == "inner_max_iters")      p.inner_max_iters = kv.second.as<int>();
                else if (key == "backend")              p.backend = kv.second.as<std::string>();
                else if (key == "constrained_backend")  p.constrained_backend = kv.second.as<std::string>();
                else throw ConfigurationError("LocalConvex: unknown parameter '" + key + "'");
            }
        } catch (const YAML::Exception& e) {
            throw ConfigurationError("LocalConvex: bad value for '" + key + "': " + e.what());
        }
        return p;
    }

    YAML::Node LocalConvex::params() const
    {
        YAML::Node n;
        n["memory"] = params_.memory;
        n["gtol"] = params_.gtol;
        n["max_linesearch"] = params_.max_linesearch;
        n["gradient"] = params_.gradient;
        n["fd_step"] = params_.fd_step;
        n["mu0"] = params_.mu0;
        n["mu_growth"] = params_.mu_growth;
        n["max_outer"] = params_.max_outer;
        n["inner_max_iters"] = params_.inner_max_iters;
        n["backend"] = params_.backend;
        n["constrained_backend"] = params_.constrained_backend;
        return n;
    }

    TPlan LocalConvex::plan(const IModel* model, const Constraints& constraints) const
    {
        const bool hasGradient = model && model->asGradient();

        TPlan p;
        if (params_.gradient == "analytic") {
            if (!hasGradient)
                throw ConfigurationError("LocalConvex: gradient=analytic but the model provides no gradient");
            p.gradient = GradientSource::ANALYTIC;
        } else if (params_.gradient == "finite-difference") {
            p.gradient = GradientSource::FINITE_DIFFERENCE;
        } else {
            p.gradient = hasGradient ? GradientSource::ANALYTIC : GradientSource::FINITE_DIFFERENCE;
        }

        if (constraints.empty()) {
            p.mode = "bounded";
            p.backend = params_.backend;
        } else {
            p.mode = "constrained";
            p.backend = params_.constrained_backend;
        }

        p.options = { { "memory", params_.memory },
                      { "gtol", params_.gtol },
                      { "max_linesearch", params_.max_linesearch },
                      { "fd_step", params_.fd_step },
                      { "mu0", params_.mu0 },
                      { "mu_growth", params_.mu_growth },
                      { "max_outer", params_.max_outer },
                      { "inner_max_iters", params_.inner_max_iters } };
        return p;
    }

} // namespace optimlib::strategy
