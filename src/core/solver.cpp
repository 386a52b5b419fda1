#include "optimlib/core/solver.hpp"
#include "optimlib/core/errors.hpp"
#include "optimlib/core/method.hpp"
#include "optimlib/core/multistart.hpp"
#include "optimlib/core/problem.hpp"
#include "optimlib/strategy/factory.hpp"
#include "optimlib/utils/io.hpp"

#include <CLI/CLI.hpp>

namespace optimlib {

    using namespace optimlib::core;

    static bool IsNullController(const std::string& type)
    {
        const std::string key = NormalizeName(type);
        return key.empty() || key == "null" || key == "none" || key == "~";
    }

    TRunResult Optimize(const TOptimizerConfig& cfg, IOutputStore& store, const std::atomic<bool>* cancel)
    {
        std::shared_ptr<IModel> model;
        if (cfg.model) model = createModel(cfg.model->name, cfg.model->params);

        // the null controller is not attached, it would only serialize the runs
        std::shared_ptr<IController> controller = createController(cfg.controller);
        IController* attached = IsNullController(cfg.controller) ? nullptr : controller.get();
        if (!model && !attached)
            throw ConfigurationError("a model is required when no controller is configured");

        std::shared_ptr<strategy::IStrategy> method = strategy::MakeStrategy(cfg.strategy, cfg.strategyParams);

        progress::ProgressChannel channel(cfg.progressDefaults);
        progress::SubscribeObservers(channel, cfg.progress, cfg.runData.decimals);

        if (cfg.runData.debug) {
            std::cout << "[optimize] strategy=" << method->name()
                      << " runs=" << cfg.seeds.size()
                      << " max_evals=" << cfg.termination.max_evals << std::endl;
        }

        MultiStartOrchestrator orchestrator(method, channel, cfg.runData, attached, cancel);

        std::vector<TRunResult> runs;
        try {
            runs = orchestrator.runAll(model.get(), cfg.seeds, cfg.bounds, cfg.constraints, cfg.termination);
        } catch (const std::exception&) {
            channel.close();
            throw;
        }
        channel.close();

        const TRunResult& best = MultiStartOrchestrator::SelectBest(runs);

        ResultAggregator(store).write(method->name(), method->params(), cfg.bounds, cfg.termination,
                                      channel.history(), runs, best);
        return best;
    }

    int OptimizerSolver::init(int argc, char* argv[])
    {
        CLI::App app{"optimlib - continuous optimization driver"};

        std::optional<unsigned int> seed;
        std::string strategyName;
        bool parallel = false;
        bool debug = false;

        app.add_option("-c,--config", configPath_, "Path to the YAML configuration file")->required()->check(CLI::ExistingFile);
        app.add_option("-o,--output", outputPath_, "Write the result keys to this YAML file");
        app.add_option("-s,--seed", seed, "Seed forwarded to the controller reset");
        app.add_option("--strategy", strategyName, "Strategy name or alias (overrides the file)");
        app.add_flag("--parallel", parallel, "Run multi-start seeds in parallel");
        app.add_flag("--debug", debug, "Print progress lines");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return app.exit(e);
        }

        try {
            config_ = LoadConfigFile(configPath_);
            if (!strategyName.empty()) config_.strategy = strategy::ResolveStrategyName(strategyName);
            if (seed) config_.runData.seed = *seed;
            if (parallel) config_.runData.parallel = true;
            if (debug) config_.runData.debug = 1;
            return 0;
        } catch (const ConfigurationError& e) {
            std::cerr << "[config] " << e.what() << std::endl;
            return 2;
        }
    }

    int OptimizerSolver::run(const std::atomic<bool>* cancel)
    {
        const double start = get_time_in_seconds();
        try {
            Optimize(config_, store_, cancel);
        } catch (const ConfigurationError& e) {
            std::cerr << "[config] " << e.what() << std::endl;
            return 2;
        } catch (const EvaluationError& e) {
            std::cerr << "[optimize] " << e.what() << std::endl;
            return 3;
        }
        const double elapsed = get_time_in_seconds() - start;

        utils::WriteSummaryScreen(store_, elapsed, config_.runData.decimals);
        if (!outputPath_.empty()) {
            if (!utils::WriteOutputYaml(store_, outputPath_)) {
                std::cerr << "[optimize] cannot write " << outputPath_ << std::endl;
                return 1;
            }
        }
        return 0;
    }

} // namespace optimlib
