#include "optimlib/strategy/nelder_mead.hpp"
#include "optimlib/core/errors.hpp"

namespace optimlib::strategy {

    using namespace optimlib::core;

    NelderMead::NelderMead(TNelderMeadParams params)
        : params_(std::move(params))
    {
        if (!(params_.initial_step > 0)) throw ConfigurationError("NelderMead: initial_step must be positive");
        if (!(params_.alpha > 0)) throw ConfigurationError("NelderMead: alpha must be positive");
        if (!(params_.gamma > 1)) throw ConfigurationError("NelderMead: gamma must be > 1");
        if (!(params_.rho > 0 && params_.rho < 1)) throw ConfigurationError("NelderMead: rho must be in (0, 1)");
        if (!(params_.sigma > 0 && params_.sigma < 1)) throw ConfigurationError("NelderMead: sigma must be in (0, 1)");
        if (params_.backend.empty()) throw ConfigurationError("NelderMead: backend name must not be empty");
    }

    TNelderMeadParams NelderMead::ParseParams(const YAML::Node& node)
    {
        TNelderMeadParams p;
        if (!node || node.IsNull()) return p;
        if (!node.IsMap()) throw ConfigurationError("NelderMead: strategy_params must be a mapping");

        std::string key;
        try {
            for (const auto& kv : node) {
                key = kv.first.as<std::string>();

                if (key == "initial_step")  p.initial_step = kv.second.as<double>();
                else if (key == "alpha")    p.alpha = kv.second.as<double>();
                else if (key == "gamma")    p.gamma = kv.second.as<double>();
                else if (key == "rho")      p.rho = kv.second.as<double>();
                else if (key == "sigma")    p.sigma = kv.second.as<double>();
                else if (key == "backend")  p.backend = kv.second.as<std::string>();
                else throw ConfigurationError("NelderMead: unknown parameter '" + key + "'");
            }
        } catch (const YAML::Exception& e) {
            throw ConfigurationError("NelderMead: bad value for '" + key + "': " + e.what());
        }
        return p;
    }

    YAML::Node NelderMead::params() const
    {
        YAML::Node n;
        n["initial_step"] = params_.initial_step;
        n["alpha"] = params_.alpha;
        n["gamma"] = params_.gamma;
        n["rho"] = params_.rho;
        n["sigma"] = params_.sigma;
        n["backend"] = params_.backend;
        return n;
    }

    TPlan NelderMead::plan(const IModel*, const Constraints&) const
    {
        TPlan p;
        p.mode = "simplex";
        p.backend = params_.backend;
        p.gradient = GradientSource::NONE;
        p.options = { { "initial_step", params_.initial_step },
                      { "alpha", params_.alpha },
                      { "gamma", params_.gamma },
                      { "rho", params_.rho },
                      { "sigma", params_.sigma } };
        return p;
    }

} // namespace optimlib::strategy
