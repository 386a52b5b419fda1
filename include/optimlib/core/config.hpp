#pragma once

#include "optimlib/core/constraints.hpp"
#include "optimlib/progress/observers.hpp"
#include <yaml-cpp/yaml.h>

namespace optimlib {

    //--------------------------------------------------------------------------
    // Struct: TModelSpec
    //--------------------------------------------------------------------------
    struct TModelSpec
    {
        std::string name;
        YAML::Node params;
    };

    //--------------------------------------------------------------------------
    // Struct: TOptimizerConfig
    // Description: Typed form of the "optimizer:" YAML block, validated once
    //--------------------------------------------------------------------------
    struct TOptimizerConfig
    {
        std::string strategy = "LocalConvex";           // canonical strategy name
        YAML::Node strategyParams;                      // validated by the strategy factory
        std::optional<TModelSpec> model;                // absent when a controller provides the value
        std::vector<std::vector<double>> seeds;         // x0, or every multi_start seed
        core::TBounds bounds;
        core::TTermination termination;
        core::Constraints constraints;
        std::string controller = "null";
        std::vector<progress::TObserverSpec> progress;
        progress::TThrottle progressDefaults;           // progress_throttle_s, progress_update_every
        core::TRunData runData;
    };

    // "opt.termination:max_evals=100,ftol_abs=1e-6" (prefix optional)
    core::TTermination ParseTerminationRef(const std::string& ref);

    // Mapping or resolver string
    core::TTermination ParseTermination(const YAML::Node& node);

    // Accepts a document with a top-level "optimizer" key or the block itself
    TOptimizerConfig LoadConfig(const YAML::Node& root);

    TOptimizerConfig LoadConfigFile(const std::string& path);

} // namespace optimlib
