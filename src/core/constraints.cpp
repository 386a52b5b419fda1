#include "optimlib/core/constraints.hpp"
#include "optimlib/core/errors.hpp"
#include "optimlib/core/method.hpp"

namespace optimlib::core {

    ConstraintEvaluator::ConstraintEvaluator(double tolerance)
        : tolerance_(tolerance)
    {
        if (!(tolerance_ >= 0.0))
            throw ConfigurationError("feasibility tolerance must be non-negative");
    }

    static void CollectComponents(const std::vector<ConstraintFn>& fns, const std::vector<double>& x,
                                  const char* kind, std::vector<double>& out)
    {
        for (std::size_t i = 0; i < fns.size(); i++) {
            if (!fns[i])
                throw ConfigurationError(std::string(kind) + " constraint " + std::to_string(i) + " is empty");

            std::vector<double> r = fns[i](x);
            if (r.empty()) {
                throw ConfigurationError(std::string(kind) + " constraint " + std::to_string(i) +
                                         " returned no component at " + FormatVector(x));
            }
            for (double v : r) {
                if (!std::isfinite(v)) {
                    throw ConfigurationError(std::string(kind) + " constraint " + std::to_string(i) +
                                             " returned a non-numeric value at " + FormatVector(x));
                }
                out.push_back(v);
            }
        }
    }

    TConstraintValues ConstraintEvaluator::values(const std::vector<double>& x, const Constraints& constraints) const
    {
        TConstraintValues v;
        CollectComponents(constraints.ineq, x, "inequality", v.ineq);
        CollectComponents(constraints.eq, x, "equality", v.eq);
        return v;
    }

    double ConstraintEvaluator::Violation(const TConstraintValues& values)
    {
        double viol = 0.0;
        for (double g : values.ineq) viol = std::max(viol, g);
        for (double h : values.eq)   viol = std::max(viol, std::abs(h));
        return viol;
    }

    std::pair<bool, double> ConstraintEvaluator::evaluate(const std::vector<double>& x, const Constraints& constraints) const
    {
        if (constraints.empty()) return { true, 0.0 };

        double viol = Violation(values(x, constraints));
        return { viol <= tolerance_, viol };
    }

    // -------------------------------------------------------------------------
    // Linear constraints builder
    // -------------------------------------------------------------------------

    static ConstraintFn MakeLinear(const YAML::Node& c, const char* kind)
    {
        if (!c.IsMap())
            throw ConfigurationError(std::string(kind) + " constraint spec must be a mapping");

        std::string type = c["type"] ? NormalizeName(c["type"].as<std::string>()) : "linear";
        if (type != "linear")
            throw ConfigurationError(std::string("unsupported ") + kind + " type: " + type);

        if (!c["a"])
            throw ConfigurationError(std::string(kind) + " constraint missing 'a' coefficient list");

        std::vector<double> a = c["a"].as<std::vector<double>>();
        double b = c["b"] ? c["b"].as<double>() : 0.0;

        return [a, b](const std::vector<double>& x) -> std::vector<double> {
            if (x.size() != a.size()) {
                throw ConfigurationError("linear constraint has " + std::to_string(a.size()) +
                                         " coefficients for a point of dimension " + std::to_string(x.size()));
            }
            return { Dot(a, x) - b };
        };
    }

    TBounds ParseBounds(const YAML::Node& node)
    {
        TBounds bounds;
        if (!node || node.IsNull()) return bounds;
        if (!node.IsSequence())
            throw ConfigurationError("bounds must be a list of [low, high] pairs");

        try {
            for (const auto& pair : node) {
                if (!pair.IsSequence() || pair.size() != 2)
                    throw ConfigurationError("each bounds entry must be a [low, high] pair");

                double lo = pair[0].IsNull() ? -std::numeric_limits<double>::infinity() : pair[0].as<double>();
                double hi = pair[1].IsNull() ? std::numeric_limits<double>::infinity() : pair[1].as<double>();
                bounds.emplace_back(lo, hi);
            }
        } catch (const YAML::Exception& e) {
            throw ConfigurationError(std::string("bounds: ") + e.what());
        }
        return bounds;
    }

    Constraints BuildLinearConstraints(const YAML::Node& spec, TBounds* liftedBounds)
    {
        Constraints cons;
        if (!spec || spec.IsNull()) return cons;

        try {
            if (!spec.IsMap())
                throw ConfigurationError("constraints block must be a mapping");

            for (const auto& kv : spec) {
                const std::string key = kv.first.as<std::string>();
                if (key != "bounds" && key != "ineq" && key != "eq" && key != "options")
                    throw ConfigurationError("unknown key in constraints block: " + key);
            }

            if (spec["ineq"]) {
                for (const auto& c : spec["ineq"]) cons.ineq.push_back(MakeLinear(c, "inequality"));
            }
            if (spec["eq"]) {
                for (const auto& c : spec["eq"]) cons.eq.push_back(MakeLinear(c, "equality"));
            }
            if (liftedBounds && spec["bounds"] && !spec["bounds"].IsNull())
                *liftedBounds = ParseBounds(spec["bounds"]);
        } catch (const YAML::Exception& e) {
            throw ConfigurationError(std::string("constraints: ") + e.what());
        }

        return cons;
    }

} // namespace optimlib::core
