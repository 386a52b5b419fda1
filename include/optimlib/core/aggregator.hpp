#pragma once

#include "optimlib/core/data.hpp"
#include <yaml-cpp/yaml.h>

namespace optimlib {

    // External key/value store the results are written into
    class IOutputStore {
        public:
            virtual ~IOutputStore() = default;

            virtual void set(const std::string& key, const YAML::Node& value) = 0;

            // Throws std::out_of_range for a missing key
            virtual YAML::Node get(const std::string& key) const = 0;

            virtual bool contains(const std::string& key) const = 0;
            virtual std::vector<std::string> keys() const = 0;
        };

    class MemoryStore : public IOutputStore {
        public:
            void set(const std::string& key, const YAML::Node& value) override;
            YAML::Node get(const std::string& key) const override;
            bool contains(const std::string& key) const override;
            std::vector<std::string> keys() const override;

        private:
            mutable std::mutex mtx_;
            std::map<std::string, YAML::Node> values_;
        };

    //--------------------------------------------------------------------------
    // Output keys
    //--------------------------------------------------------------------------
    namespace keys {
        inline const std::string STRATEGY       = "optimizer.strategy";
        inline const std::string PARAMS         = "optimizer.params";
        inline const std::string HISTORY        = "optimizer.history";
        inline const std::string RUNS           = "optimizer.runs";
        inline const std::string BEST_CANDIDATE = "optimizer.best_candidate";
        inline const std::string TERMINATION    = "optimizer.termination";
    }

    // -----------------------------------------------------------------------------
    // YAML shapes of the data model
    // -----------------------------------------------------------------------------
    YAML::Node ToYaml(const core::TCandidate& candidate);
    YAML::Node ToYaml(const core::TTerminationResult& termination);
    YAML::Node ToYaml(const core::THistoryRecord& record);
    YAML::Node ToYaml(const core::TTermination& spec);
    YAML::Node BoundsToYaml(const core::TBounds& bounds);

    /**
     * @brief Structural assembly of one invocation into the output store.
     *
     * runs must be ordered by run_index and best must be one of them; the
     * termination written is the one of the best run.
     */
    class ResultAggregator {
    public:
        explicit ResultAggregator(IOutputStore& store) : store_(store) {}

        void write(const std::string& strategyName,
                   const YAML::Node& strategyParams,
                   const core::TBounds& bounds,
                   const core::TTermination& termination,
                   const std::vector<core::THistoryRecord>& history,
                   const std::vector<core::TRunResult>& runs,
                   const core::TRunResult& best);

    private:
        IOutputStore& store_;
    };

} // namespace optimlib
