#include "optimlib/strategy/factory.hpp"
#include "optimlib/strategy/local_convex.hpp"
#include "optimlib/strategy/nelder_mead.hpp"
#include "optimlib/core/errors.hpp"
#include "optimlib/core/method.hpp"

namespace optimlib::strategy {

    using namespace optimlib::core;

    namespace {

        const std::string STRATEGY_PREFIX = "opt.strategy:";

        using Creator = std::function<std::shared_ptr<IStrategy>(const YAML::Node&)>;

        const std::map<std::string, std::string>& Aliases()
        {
            static const std::map<std::string, std::string> aliases = {
                { "local",        "LocalConvex" },
                { "local-convex", "LocalConvex" },
                { "local_convex", "LocalConvex" },
                { "localconvex",  "LocalConvex" },
                { "lbfgsb",       "LocalConvex" },
                { "slsqp",        "LocalConvex" },
                { "nelder",       "NelderMead" },
                { "nelder-mead",  "NelderMead" },
                { "nelder_mead",  "NelderMead" },
                { "neldermead",   "NelderMead" },
            };
            return aliases;
        }

        const std::map<std::string, Creator>& Creators()
        {
            static const std::map<std::string, Creator> creators = {
                { "LocalConvex", [](const YAML::Node& p) -> std::shared_ptr<IStrategy> {
                      return std::make_shared<LocalConvex>(LocalConvex::ParseParams(p));
                  } },
                { "NelderMead", [](const YAML::Node& p) -> std::shared_ptr<IStrategy> {
                      return std::make_shared<NelderMead>(NelderMead::ParseParams(p));
                  } },
            };
            return creators;
        }

    } // namespace

    std::string ResolveStrategyName(const std::string& name)
    {
        std::string key = NormalizeName(name);
        if (key.rfind(STRATEGY_PREFIX, 0) == 0)
            key = NormalizeName(key.substr(STRATEGY_PREFIX.size()));

        auto it = Aliases().find(key);
        if (it == Aliases().end())
            throw ConfigurationError("unknown strategy '" + name + "'");
        return it->second;
    }

    std::shared_ptr<IStrategy> MakeStrategy(const std::string& name, const YAML::Node& params)
    {
        return Creators().at(ResolveStrategyName(name))(params);
    }

    std::vector<std::string> StrategyAliases()
    {
        std::vector<std::string> out;
        for (const auto& [alias, canonical] : Aliases()) out.push_back(alias);
        return out;
    }

} // namespace optimlib::strategy
