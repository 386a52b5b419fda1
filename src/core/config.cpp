#include "optimlib/core/config.hpp"
#include "optimlib/core/errors.hpp"
#include "optimlib/core/method.hpp"
#include "optimlib/core/problem.hpp"
#include "optimlib/strategy/factory.hpp"

namespace optimlib {

    using namespace optimlib::core;

    static const std::string TERMINATION_PREFIX = "opt.termination:";

    TTermination ParseTerminationRef(const std::string& ref)
    {
        std::string body = NormalizeName(ref);
        if (body.rfind(TERMINATION_PREFIX, 0) == 0)
            body = body.substr(TERMINATION_PREFIX.size());
        else if (body.rfind("opt.", 0) == 0)
            throw ConfigurationError("unsupported resolver string for termination: '" + ref + "'");

        YAML::Node map(YAML::NodeType::Map);
        std::stringstream ss(body);
        std::string item;
        while (std::getline(ss, item, ',')) {
            item = NormalizeName(item);
            if (item.empty()) continue;

            auto eq = item.find('=');
            if (eq == std::string::npos)
                throw ConfigurationError("termination entry '" + item + "' is not key=value");

            std::string key = NormalizeName(item.substr(0, eq));
            std::string value = NormalizeName(item.substr(eq + 1));
            if (key.empty() || value.empty())
                throw ConfigurationError("termination entry '" + item + "' is not key=value");

            if (value == "null" || value == "none") map[key] = YAML::Node(YAML::NodeType::Null);
            else map[key] = value;
        }
        return ParseTermination(map);
    }

    TTermination ParseTermination(const YAML::Node& node)
    {
        if (!node || node.IsNull()) return {};
        if (node.IsScalar()) return ParseTerminationRef(node.as<std::string>());
        if (!node.IsMap())
            throw ConfigurationError("termination must be a mapping or an opt.termination string");

        TTermination t;
        std::string key;
        try {
            for (const auto& kv : node) {
                key = kv.first.as<std::string>();
                const YAML::Node& v = kv.second;

                if (key == "max_evals")         t.max_evals = v.as<int>();
                else if (key == "ftol_abs")     t.ftol_abs = v.as<double>();
                else if (key == "ftol_rel")     t.ftol_rel = v.as<double>();
                else if (key == "xtol_abs")     t.xtol_abs = v.as<double>();
                else if (key == "stall_window") t.stall_window = v.as<int>();
                else if (key == "max_iters")
                    t.max_iters = v.IsNull() ? std::nullopt : std::optional<int>(v.as<int>());
                else if (key == "max_time_s")
                    t.max_time_s = v.IsNull() ? std::nullopt : std::optional<double>(v.as<double>());
                else
                    throw ConfigurationError("unknown termination key '" + key + "'");
            }
        } catch (const YAML::Exception& e) {
            throw ConfigurationError("termination." + key + ": " + e.what());
        }

        ValidateTermination(t);
        return t;
    }

    static std::vector<double> ParseVector(const YAML::Node& node, const std::string& what)
    {
        if (!node.IsSequence()) throw ConfigurationError(what + " must be a list of numbers");
        return node.as<std::vector<double>>();
    }

    static std::string ControllerType(const YAML::Node& node)
    {
        if (!node || node.IsNull()) return "null";
        if (node.IsScalar()) return node.as<std::string>();
        if (!node.IsMap()) throw ConfigurationError("controller must be a type name or a mapping");

        for (const auto& kv : node) {
            const std::string key = kv.first.as<std::string>();
            if (key != "type" && key != "params")
                throw ConfigurationError("unknown key in controller block: " + key);
        }
        const YAML::Node type = node["type"];
        return (!type || type.IsNull()) ? "null" : type.as<std::string>();
    }

    TOptimizerConfig LoadConfig(const YAML::Node& root)
    {
        const YAML::Node block = (root && root["optimizer"]) ? root["optimizer"] : root;
        if (!block || !block.IsMap())
            throw ConfigurationError("missing 'optimizer' mapping");

        static const std::vector<std::string> known = {
            "strategy", "strategy_params", "model", "x0", "multi_start", "bounds", "termination",
            "constraints", "controller", "progress", "progress_throttle_s", "progress_update_every",
            "parallel", "seed", "log_every", "decimals", "debug"
        };

        TOptimizerConfig cfg;
        std::string key;
        try {
            for (const auto& kv : block) {
                key = kv.first.as<std::string>();
                if (std::find(known.begin(), known.end(), key) == known.end())
                    throw ConfigurationError("unknown key 'optimizer." + key + "'");
            }

            // Strategy
            key = "strategy";
            if (block["strategy"]) cfg.strategy = strategy::ResolveStrategyName(block["strategy"].as<std::string>());
            cfg.strategyParams = block["strategy_params"] ? YAML::Clone(block["strategy_params"]) : YAML::Node();
            key = "strategy_params";
            strategy::MakeStrategy(cfg.strategy, cfg.strategyParams);     // rejects unknown or invalid parameters

            // Model
            key = "model";
            if (const YAML::Node m = block["model"]; m && !m.IsNull()) {
                TModelSpec spec;
                if (m.IsScalar()) {
                    spec.name = m.as<std::string>();
                } else {
                    if (!m.IsMap() || !m["name"]) throw ConfigurationError("model needs a 'name'");
                    spec.name = m["name"].as<std::string>();
                    spec.params = m["params"] ? YAML::Clone(m["params"]) : YAML::Node();
                }
                createModel(spec.name, spec.params);    // validates name and parameters
                cfg.model = spec;
            }

            // Seeds
            key = "x0";
            if (block["multi_start"] && !block["multi_start"].IsNull()) {
                key = "multi_start";
                if (!block["multi_start"].IsSequence()) throw ConfigurationError("multi_start must be a list of points");
                for (const auto& seed : block["multi_start"]) cfg.seeds.push_back(ParseVector(seed, "multi_start entry"));
            } else if (block["x0"]) {
                cfg.seeds.push_back(ParseVector(block["x0"], "x0"));
            }
            if (cfg.seeds.empty()) throw ConfigurationError("x0 or multi_start is required");

            // Bounds and constraints
            key = "bounds";
            cfg.bounds = ParseBounds(block["bounds"]);

            key = "constraints";
            TBounds lifted;
            cfg.constraints = BuildLinearConstraints(block["constraints"], &lifted);
            if (cfg.bounds.empty()) cfg.bounds = lifted;

            key = "termination";
            cfg.termination = ParseTermination(block["termination"]);

            key = "controller";
            cfg.controller = ControllerType(block["controller"]);
            createController(cfg.controller);

            if (!cfg.model && NormalizeName(cfg.controller) == "null")
                throw ConfigurationError("a model is required when no controller is configured");

            // Progress
            key = "progress";
            cfg.progress = progress::ParseObserverSpecs(block["progress"]);
            if (block["progress_throttle_s"]) cfg.progressDefaults.throttle_s = block["progress_throttle_s"].as<double>();
            if (block["progress_update_every"]) cfg.progressDefaults.update_every = block["progress_update_every"].as<int>();
            if (cfg.progressDefaults.throttle_s < 0 || cfg.progressDefaults.update_every < 1)
                throw ConfigurationError("progress_throttle_s must be >= 0 and progress_update_every >= 1");

            // Execution knobs
            key = "run";
            if (block["parallel"]) cfg.runData.parallel = block["parallel"].as<bool>();
            if (block["seed"]) cfg.runData.seed = block["seed"].as<unsigned int>();
            if (block["log_every"]) cfg.runData.logEvery = block["log_every"].as<int>();
            if (block["decimals"]) cfg.runData.decimals = block["decimals"].as<int>();
            if (block["debug"]) cfg.runData.debug = block["debug"].as<bool>() ? 1 : 0;
            if (cfg.runData.logEvery < 0 || cfg.runData.decimals < 1)
                throw ConfigurationError("log_every must be >= 0 and decimals >= 1");

        } catch (const YAML::Exception& e) {
            throw ConfigurationError("optimizer." + key + ": " + e.what());
        }

        // dimension checks that do not need the model instance
        for (const auto& seed : cfg.seeds) ValidateStart(seed, cfg.bounds, 0);

        return cfg;
    }

    TOptimizerConfig LoadConfigFile(const std::string& path)
    {
        YAML::Node root;
        try {
            root = YAML::LoadFile(path);
        } catch (const YAML::BadFile&) {
            throw ConfigurationError("cannot open configuration file " + path);
        } catch (const YAML::ParserException& e) {
            throw ConfigurationError("YAML syntax error in " + path + ": " + e.what());
        }
        return LoadConfig(root);
    }

} // namespace optimlib
