#pragma once

#include "optimlib/core/search.hpp"

namespace optimlib::strategy {

    // Numeric knobs handed from a strategy to its backend
    using TBackendOptions = std::map<std::string, double>;

    double OptionOr(const TBackendOptions& options, const std::string& key, double fallback);

    /**
     * @brief Black-box numerical procedure driven through a SearchContext.
     *
     * The context has already evaluated the start point when minimize() is
     * called; the backend iterates until the context stops it or its own
     * convergence test holds, and reports the latter with reportSolver().
     */
    class ISolverBackend {
    public:
        virtual ~ISolverBackend() = default;

        virtual std::string name() const = 0;
        virtual void minimize(core::SearchContext& ctx, const TBackendOptions& options) const = 0;
    };

    /**
     * @brief Startup-populated registry of solver backends.
     *
     * Strategies resolve their backend here at run time; a name missing from
     * the registry makes the run a soft failure instead of an exception.
     */
    class BackendRegistry {
    public:
        static BackendRegistry& instance() {
            static BackendRegistry instance;
            return instance;
        }

        BackendRegistry(const BackendRegistry&) = delete;
        BackendRegistry& operator=(const BackendRegistry&) = delete;

        void add(std::shared_ptr<const ISolverBackend> backend);

        // nullptr when no backend of that name was registered
        std::shared_ptr<const ISolverBackend> find(const std::string& name) const;

        std::vector<std::string> names() const;

    private:
        BackendRegistry();

        mutable std::mutex mtx_;
        std::map<std::string, std::shared_ptr<const ISolverBackend>> backends_;
    };

} // namespace optimlib::strategy
