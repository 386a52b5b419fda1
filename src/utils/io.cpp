#include "optimlib/utils/io.hpp"

#include <cstdio>

namespace optimlib::utils {

    static void PrintVector(const YAML::Node& x, int decimals)
    {
        for (const auto& v : x)
            printf("%.*lf ", decimals, v.as<double>());
    }

    void WriteSummaryScreen(const IOutputStore& store, double timeTotal, int decimals)
    {
        const YAML::Node best = store.get(keys::BEST_CANDIDATE);
        const YAML::Node termination = store.get(keys::TERMINATION);
        const YAML::Node runs = store.get(keys::RUNS);

        printf("\n\nStrategy: %s", store.get(keys::STRATEGY).as<std::string>().c_str());
        printf("\nRuns: %d", static_cast<int>(runs.size()));
        printf("\nsol: ");
        PrintVector(best["x"], decimals);

        printf("\nf: %.*lf", decimals, best["value"].as<double>());
        printf("\nfeasible: %s", best["feasible"].as<bool>() ? "yes" : "no");
        printf("\nreason: %s", termination["reason"].as<std::string>().c_str());
        printf("\nTotal time: %.3f\n", timeTotal);

        // per-run outcomes
        printf("\nRuns:\n");
        for (const auto& r : runs) {
            const YAML::Node meta = r["meta"];
            printf("%d: %.*lf [%s]%s\n", meta["run_index"].as<int>(), decimals, r["value"].as<double>(),
                   meta["reason"].as<std::string>().c_str(), r["feasible"].as<bool>() ? "" : " infeasible");
        }
    }

    bool WriteOutputYaml(const IOutputStore& store, const std::string& path)
    {
        YAML::Emitter out;
        out << YAML::BeginMap;
        for (const auto& key : store.keys())
            out << YAML::Key << key << YAML::Value << store.get(key);
        out << YAML::EndMap;

        if (!out.good()) {
            std::cerr << "[optimize] YAML emitter error: " << out.GetLastError() << std::endl;
            return false;
        }

        std::ofstream file(path);
        if (!file.is_open()) return false;
        file << out.c_str() << "\n";
        return file.good();
    }

} // namespace optimlib::utils
