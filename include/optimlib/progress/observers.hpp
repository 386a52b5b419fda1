#pragma once

#include "optimlib/progress/channel.hpp"
#include <yaml-cpp/yaml.h>

namespace optimlib::progress {

    //----------------- OBSERVERS SHIPPED WITH THE LIBRARY -----------------------

    /**
     * Observer: ConsoleObserver
     * Description: one "[progress]" line per delivered event
     */
    class ConsoleObserver : public IProgressObserver {
    public:
        explicit ConsoleObserver(std::ostream& out = std::cout, int decimals = 6, bool showBest = false)
            : out_(out), decimals_(decimals), showBest_(showBest) {}

        std::string name() const override { return "console"; }

        void onStart(const TStartEvent& e) override;
        void onStep(const TStepEvent& e) override;
        void onBest(const TStepEvent& e) override;
        void onEnd(const TEndEvent& e) override;

    private:
        std::ostream& out_;
        int decimals_;
        bool showBest_;
    };

    /**
     * Observer: TraceObserver
     * Description: best-so-far trace of each run, written as
     * <out_dir>/<file_prefix>_run<k>.csv when the run ends, plus all runs in
     * <out_dir>/<file_prefix>_final.csv on close
     */
    class TraceObserver : public IProgressObserver {
    public:
        TraceObserver(std::string outDir, std::string filePrefix);

        std::string name() const override { return "trace"; }

        void onStart(const TStartEvent& e) override;
        void onStep(const TStepEvent& e) override;
        void onEnd(const TEndEvent& e) override;
        void close() override;

        // Files written so far
        const std::vector<std::string>& written() const { return written_; }

    private:
        struct TPoint
        {
            int iter;
            double f;
            double bestF;
        };

        void writeCsv(const std::string& path, const std::map<int, std::vector<TPoint>>& runs);
        std::string pathFor(const std::string& suffix) const;

        std::string outDir_;
        std::string filePrefix_;
        std::map<int, std::vector<TPoint>> runs_;
        std::vector<std::string> written_;
    };

    //-------------------------- REGISTRY --------------------------------------

    // Builds an observer from its descriptor options (type and throttle keys removed)
    using ObserverFactory = std::function<std::shared_ptr<IProgressObserver>(const YAML::Node& options, int decimals)>;

    class ObserverRegistry {
    public:
        static ObserverRegistry& instance() {
            static ObserverRegistry instance;
            return instance;
        }

        ObserverRegistry(const ObserverRegistry&) = delete;
        ObserverRegistry& operator=(const ObserverRegistry&) = delete;

        void add(const std::string& type, ObserverFactory factory);

        // Throws ConfigurationError for an unknown type
        std::shared_ptr<IProgressObserver> create(const std::string& type, const YAML::Node& options, int decimals) const;

        std::vector<std::string> types() const;

    private:
        ObserverRegistry();

        mutable std::mutex mtx_;
        std::map<std::string, ObserverFactory> factories_;
    };

    //--------------------------------------------------------------------------
    // Struct: TObserverSpec
    // Description: one entry of the "progress" list
    //--------------------------------------------------------------------------
    struct TObserverSpec
    {
        std::string type;
        std::optional<double> throttle_s;   // falls back to progress_throttle_s
        std::optional<int> update_every;    // falls back to progress_update_every
        YAML::Node options;
    };

    std::vector<TObserverSpec> ParseObserverSpecs(const YAML::Node& list);

    // Creates every observer and subscribes it with its resolved throttle
    void SubscribeObservers(ProgressChannel& channel, const std::vector<TObserverSpec>& specs, int decimals);

} // namespace optimlib::progress
