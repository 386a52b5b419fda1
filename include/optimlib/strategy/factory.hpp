#pragma once

#include "optimlib/strategy/strategy.hpp"

namespace optimlib::strategy {

    /**
     * Method: ResolveStrategyName
     * Description: maps an alias ("local", "lbfgsb", "nelder-mead", ...) or a
     * resolver string "opt.strategy:<alias>" to the canonical strategy name.
     * Unknown names throw ConfigurationError.
     */
    std::string ResolveStrategyName(const std::string& name);

    /**
     * Method: MakeStrategy
     * Description: builds a strategy with its keyword parameters, validated
     * against the strategy's typed parameter struct.
     */
    std::shared_ptr<IStrategy> MakeStrategy(const std::string& name, const YAML::Node& params = YAML::Node());

    std::vector<std::string> StrategyAliases();

} // namespace optimlib::strategy
