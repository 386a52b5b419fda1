#include "optimlib/strategy/backend.hpp"
#include "optimlib/strategy/lbfgsb.hpp"
#include "optimlib/strategy/auglag.hpp"
#include "optimlib/strategy/simplex.hpp"

namespace optimlib::strategy {

    double OptionOr(const TBackendOptions& options, const std::string& key, double fallback)
    {
        auto it = options.find(key);
        return it == options.end() ? fallback : it->second;
    }

    BackendRegistry::BackendRegistry()
    {
        add(std::make_shared<LbfgsbBackend>());
        add(std::make_shared<AugLagBackend>());
        add(std::make_shared<SimplexBackend>());
    }

    void BackendRegistry::add(std::shared_ptr<const ISolverBackend> backend)
    {
        std::lock_guard<std::mutex> lock(mtx_);
        backends_[backend->name()] = std::move(backend);
    }

    std::shared_ptr<const ISolverBackend> BackendRegistry::find(const std::string& name) const
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = backends_.find(name);
        return it == backends_.end() ? nullptr : it->second;
    }

    std::vector<std::string> BackendRegistry::names() const
    {
        std::lock_guard<std::mutex> lock(mtx_);
        std::vector<std::string> out;
        for (const auto& [name, backend] : backends_) out.push_back(name);
        return out;
    }

} // namespace optimlib::strategy
