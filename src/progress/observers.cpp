#include "optimlib/progress/observers.hpp"
#include "optimlib/core/errors.hpp"
#include "optimlib/core/method.hpp"
#include <filesystem>

namespace optimlib::progress {

    using optimlib::core::ConfigurationError;
    using optimlib::core::FormatVector;

    // -------------------------------------------------------------------------
    // ConsoleObserver
    // -------------------------------------------------------------------------

    void ConsoleObserver::onStart(const TStartEvent& e)
    {
        out_ << "[progress] run=" << e.run_index << "/" << e.total_runs
             << " start x0=" << FormatVector(e.x0, decimals_) << std::endl;
    }

    // formatted locally so the precision never leaks into the shared stream
    void ConsoleObserver::onStep(const TStepEvent& e)
    {
        std::ostringstream ss;
        ss << std::setprecision(decimals_)
           << "[progress] run=" << e.run_index << " iter=" << e.iter
           << " f=" << e.f << " x=" << FormatVector(e.x, decimals_)
           << " feas=" << (e.feasible ? "true" : "false") << " viol=" << e.violation
           << (e.is_best ? " *" : "");
        out_ << ss.str() << std::endl;
    }

    void ConsoleObserver::onBest(const TStepEvent& e)
    {
        if (!showBest_) return;
        std::ostringstream ss;
        ss << std::setprecision(decimals_)
           << "[progress] run=" << e.run_index << " new best at iter=" << e.iter << " f=" << e.f;
        out_ << ss.str() << std::endl;
    }

    void ConsoleObserver::onEnd(const TEndEvent& e)
    {
        std::ostringstream ss;
        ss << std::setprecision(decimals_)
           << "[progress] run=" << e.run_index << " end reason=" << core::ToString(e.reason)
           << " best_f=" << e.best.value << " best_x=" << FormatVector(e.best.x, decimals_);
        out_ << ss.str() << std::endl;
    }

    // -------------------------------------------------------------------------
    // TraceObserver
    // -------------------------------------------------------------------------

    TraceObserver::TraceObserver(std::string outDir, std::string filePrefix)
        : outDir_(std::move(outDir)), filePrefix_(std::move(filePrefix))
    {
        if (filePrefix_.empty()) throw ConfigurationError("trace observer needs a non-empty file_prefix");
    }

    std::string TraceObserver::pathFor(const std::string& suffix) const
    {
        return (std::filesystem::path(outDir_) / (filePrefix_ + "_" + suffix + ".csv")).string();
    }

    void TraceObserver::onStart(const TStartEvent& e)
    {
        runs_[e.run_index].clear();
    }

    void TraceObserver::onStep(const TStepEvent& e)
    {
        auto& points = runs_[e.run_index];
        double bestF = points.empty() ? e.f : std::min(points.back().bestF, e.f);
        points.push_back({ e.iter, e.f, bestF });
    }

    void TraceObserver::onEnd(const TEndEvent& e)
    {
        auto it = runs_.find(e.run_index);
        if (it == runs_.end()) return;
        writeCsv(pathFor("run" + std::to_string(e.run_index)), { { it->first, it->second } });
    }

    void TraceObserver::close()
    {
        if (!runs_.empty()) writeCsv(pathFor("final"), runs_);
    }

    void TraceObserver::writeCsv(const std::string& path, const std::map<int, std::vector<TPoint>>& runs)
    {
        if (!outDir_.empty()) std::filesystem::create_directories(outDir_);

        std::ofstream file(path);
        if (!file.is_open()) throw std::runtime_error("cannot open trace file " + path);

        file << "run_index,iter,f,best_f\n";
        file << std::setprecision(17);
        for (const auto& [run, points] : runs) {
            for (const auto& p : points)
                file << run << "," << p.iter << "," << p.f << "," << p.bestF << "\n";
        }
        written_.push_back(path);
    }

    // -------------------------------------------------------------------------
    // Registry
    // -------------------------------------------------------------------------

    static void RejectUnknown(const YAML::Node& options, const std::string& type, const std::vector<std::string>& known)
    {
        if (!options) return;
        for (const auto& kv : options) {
            const std::string key = kv.first.as<std::string>();
            if (std::find(known.begin(), known.end(), key) == known.end())
                throw ConfigurationError("unknown option '" + key + "' for observer " + type);
        }
    }

    ObserverRegistry::ObserverRegistry()
    {
        factories_["console"] = [](const YAML::Node& o, int decimals) -> std::shared_ptr<IProgressObserver> {
            RejectUnknown(o, "console", { "stream", "decimals", "show_best" });

            std::string stream = o["stream"] ? core::NormalizeName(o["stream"].as<std::string>()) : "stdout";
            if (stream != "stdout" && stream != "stderr")
                throw ConfigurationError("console observer stream must be stdout or stderr");

            int d = o["decimals"] ? o["decimals"].as<int>() : decimals;
            bool showBest = o["show_best"] ? o["show_best"].as<bool>() : false;
            return std::make_shared<ConsoleObserver>(stream == "stderr" ? std::cerr : std::cout, d, showBest);
        };

        factories_["trace"] = [](const YAML::Node& o, int) -> std::shared_ptr<IProgressObserver> {
            RejectUnknown(o, "trace", { "out_dir", "file_prefix" });

            std::string outDir = o["out_dir"] ? o["out_dir"].as<std::string>() : ".";
            std::string prefix = o["file_prefix"] ? o["file_prefix"].as<std::string>() : "trace";
            return std::make_shared<TraceObserver>(outDir, prefix);
        };
    }

    void ObserverRegistry::add(const std::string& type, ObserverFactory factory)
    {
        std::lock_guard<std::mutex> lock(mtx_);
        factories_[core::NormalizeName(type)] = std::move(factory);
    }

    std::shared_ptr<IProgressObserver> ObserverRegistry::create(const std::string& type, const YAML::Node& options,
                                                                int decimals) const
    {
        ObserverFactory factory;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            auto it = factories_.find(core::NormalizeName(type));
            if (it == factories_.end())
                throw ConfigurationError("unknown progress observer type '" + type + "'");
            factory = it->second;
        }

        try {
            return factory(options, decimals);
        } catch (const YAML::Exception& e) {
            throw ConfigurationError("observer " + type + ": " + e.what());
        }
    }

    std::vector<std::string> ObserverRegistry::types() const
    {
        std::lock_guard<std::mutex> lock(mtx_);
        std::vector<std::string> out;
        for (const auto& [type, factory] : factories_) out.push_back(type);
        return out;
    }

    // -------------------------------------------------------------------------
    // Descriptors
    // -------------------------------------------------------------------------

    std::vector<TObserverSpec> ParseObserverSpecs(const YAML::Node& list)
    {
        std::vector<TObserverSpec> specs;
        if (!list || list.IsNull()) return specs;
        if (!list.IsSequence()) throw ConfigurationError("progress must be a list of observer descriptors");

        try {
            for (const auto& item : list) {
                TObserverSpec spec;

                // a bare string names the type
                if (item.IsScalar()) {
                    spec.type = item.as<std::string>();
                    specs.push_back(spec);
                    continue;
                }
                if (!item.IsMap() || !item["type"])
                    throw ConfigurationError("each progress descriptor needs a 'type'");

                spec.options = YAML::Node(YAML::NodeType::Map);
                for (const auto& kv : item) {
                    const std::string key = kv.first.as<std::string>();
                    if (key == "type")              spec.type = kv.second.as<std::string>();
                    else if (key == "throttle_s")   spec.throttle_s = kv.second.as<double>();
                    else if (key == "update_every") spec.update_every = kv.second.as<int>();
                    else                            spec.options[key] = kv.second;
                }
                specs.push_back(spec);
            }
        } catch (const YAML::Exception& e) {
            throw ConfigurationError(std::string("progress: ") + e.what());
        }
        return specs;
    }

    void SubscribeObservers(ProgressChannel& channel, const std::vector<TObserverSpec>& specs, int decimals)
    {
        for (const auto& spec : specs) {
            TThrottle t = channel.defaults();
            if (spec.throttle_s) t.throttle_s = *spec.throttle_s;
            if (spec.update_every) t.update_every = *spec.update_every;

            channel.subscribe(ObserverRegistry::instance().create(spec.type, spec.options, decimals), t);
        }
    }

} // namespace optimlib::progress
