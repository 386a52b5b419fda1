#pragma once

#include "optimlib/core/aggregator.hpp"

namespace optimlib::utils {

    /**
     * Outputs the best candidate and the per-run outcomes to the screen.
     */
    void WriteSummaryScreen(const IOutputStore& store, double timeTotal, int decimals);

    /**
     * Outputs every optimizer.* key of the store in a YAML file.
     * Returns false when the file cannot be written.
     */
    bool WriteOutputYaml(const IOutputStore& store, const std::string& path);

} // namespace optimlib::utils
