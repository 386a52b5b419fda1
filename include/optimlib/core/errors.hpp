#pragma once

#include <stdexcept>
#include <string>

namespace optimlib::core {

    /**
     * @brief Invalid setup detected before any evaluation: unknown strategy,
     * malformed bounds or constraints, mismatched dimensions, bad YAML.
     */
    class ConfigurationError : public std::runtime_error {
    public:
        explicit ConfigurationError(const std::string& what)
            : std::runtime_error("configuration error: " + what) {}
    };

    /**
     * @brief The objective, gradient, constraint or controller raised or
     * returned something that is not a finite number. Fatal for one run only.
     */
    class EvaluationError : public std::runtime_error {
    public:
        explicit EvaluationError(const std::string& what)
            : std::runtime_error("evaluation error: " + what) {}
    };

} // namespace optimlib::core
