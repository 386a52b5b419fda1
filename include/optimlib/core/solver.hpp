#pragma once

#include "optimlib/core/aggregator.hpp"
#include "optimlib/core/config.hpp"

namespace optimlib {

    /**
     * Method: Optimize
     * Description: runs one optimizer invocation described by cfg and writes
     * the optimizer.* keys into store. Returns the best run.
     * Throws ConfigurationError before any evaluation for an invalid problem,
     * EvaluationError when every run failed.
     */
    core::TRunResult Optimize(const TOptimizerConfig& cfg, IOutputStore& store,
                              const std::atomic<bool>* cancel = nullptr);

    /**
     * @brief Command line front end: CLI11 arguments, YAML config, one invocation.
     */
    class OptimizerSolver {
    public:
        OptimizerSolver() = default;

        // Parses the command line and the configuration file; returns the exit code
        int init(int argc, char* argv[]);

        // Runs the invocation and writes the results; returns the exit code
        int run(const std::atomic<bool>* cancel = nullptr);

        const TOptimizerConfig& config() const { return config_; }
        const MemoryStore& store() const { return store_; }

    private:
        std::string configPath_;
        std::string outputPath_;
        TOptimizerConfig config_;
        MemoryStore store_;
    };

} // namespace optimlib
