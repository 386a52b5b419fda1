#include "optimlib/core/aggregator.hpp"

namespace optimlib {

    using namespace optimlib::core;

    // -------------------------------------------------------------------------
    // MemoryStore
    // -------------------------------------------------------------------------

    void MemoryStore::set(const std::string& key, const YAML::Node& value)
    {
        std::lock_guard<std::mutex> lock(mtx_);
        values_[key] = YAML::Clone(value);
    }

    YAML::Node MemoryStore::get(const std::string& key) const
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = values_.find(key);
        if (it == values_.end()) throw std::out_of_range("no value stored under " + key);
        return it->second;
    }

    bool MemoryStore::contains(const std::string& key) const
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return values_.count(key) > 0;
    }

    std::vector<std::string> MemoryStore::keys() const
    {
        std::lock_guard<std::mutex> lock(mtx_);
        std::vector<std::string> out;
        for (const auto& [k, v] : values_) out.push_back(k);
        return out;
    }

    // -------------------------------------------------------------------------
    // YAML shapes
    // -------------------------------------------------------------------------

    static YAML::Node Sequence(const std::vector<double>& v)
    {
        YAML::Node n(YAML::NodeType::Sequence);
        for (double e : v) n.push_back(e);
        n.SetStyle(YAML::EmitterStyle::Flow);
        return n;
    }

    YAML::Node ToYaml(const TCandidate& candidate)
    {
        YAML::Node n;
        n["x"] = Sequence(candidate.x);
        n["value"] = candidate.value;
        n["feasible"] = candidate.feasible;

        YAML::Node meta(YAML::NodeType::Map);
        for (const auto& [k, v] : candidate.meta) meta[k] = v;
        n["meta"] = meta;
        return n;
    }

    YAML::Node ToYaml(const TTerminationResult& termination)
    {
        YAML::Node n;
        n["reason"] = ToString(termination.reason);

        YAML::Node metrics(YAML::NodeType::Map);
        for (const auto& [k, v] : termination.metrics) metrics[k] = v;
        n["metrics"] = metrics;

        YAML::Node budget(YAML::NodeType::Map);
        for (const auto& [k, v] : termination.budget) budget[k] = v;
        n["budget"] = budget;
        return n;
    }

    YAML::Node ToYaml(const THistoryRecord& record)
    {
        YAML::Node n;
        n["run_index"] = record.run_index;
        n["iter"] = record.iter;
        n["x"] = Sequence(record.x);
        n["f"] = record.f;
        n["feasible"] = record.feasible;
        n["violation"] = record.violation;
        n["timestamp"] = record.timestamp;
        n["is_best"] = record.is_best;
        return n;
    }

    YAML::Node ToYaml(const TTermination& spec)
    {
        YAML::Node n;
        n["max_evals"] = spec.max_evals;
        n["ftol_abs"] = spec.ftol_abs;
        n["ftol_rel"] = spec.ftol_rel;
        n["xtol_abs"] = spec.xtol_abs;
        if (spec.max_iters) n["max_iters"] = *spec.max_iters;
        n["stall_window"] = spec.stall_window;
        if (spec.max_time_s) n["max_time_s"] = *spec.max_time_s;
        return n;
    }

    YAML::Node BoundsToYaml(const TBounds& bounds)
    {
        if (bounds.empty()) return YAML::Node(YAML::NodeType::Null);

        YAML::Node n(YAML::NodeType::Sequence);
        for (const auto& [lo, hi] : bounds) n.push_back(Sequence({ lo, hi }));
        return n;
    }

    // -------------------------------------------------------------------------
    // ResultAggregator
    // -------------------------------------------------------------------------

    void ResultAggregator::write(const std::string& strategyName,
                                 const YAML::Node& strategyParams,
                                 const TBounds& bounds,
                                 const TTermination& termination,
                                 const std::vector<THistoryRecord>& history,
                                 const std::vector<TRunResult>& runs,
                                 const TRunResult& best)
    {
        YAML::Node params;
        params["bounds"] = BoundsToYaml(bounds);
        params["termination"] = ToYaml(termination);
        params["strategy_params"] = strategyParams ? YAML::Clone(strategyParams) : YAML::Node(YAML::NodeType::Map);

        YAML::Node hist(YAML::NodeType::Sequence);
        for (const auto& rec : history) hist.push_back(ToYaml(rec));

        YAML::Node runList(YAML::NodeType::Sequence);
        for (const auto& run : runs) {
            YAML::Node r = ToYaml(run.candidate);
            r["meta"]["run_index"] = run.run_index;
            r["meta"]["reason"] = ToString(run.termination.reason);
            r["meta"]["seed"] = Sequence(run.seed);
            if (!run.completed) r["meta"]["error"] = run.error;
            runList.push_back(r);
        }

        store_.set(keys::STRATEGY, YAML::Node(strategyName));
        store_.set(keys::PARAMS, params);
        store_.set(keys::HISTORY, hist);
        store_.set(keys::RUNS, runList);
        store_.set(keys::BEST_CANDIDATE, ToYaml(best.candidate));
        store_.set(keys::TERMINATION, ToYaml(best.termination));
    }

} // namespace optimlib
