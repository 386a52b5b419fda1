#include "optimlib/core/method.hpp"
#include "optimlib/core/errors.hpp"

namespace optimlib::core {

    // -----------------------------------------------------------------------------
    // General Utilities
    // -----------------------------------------------------------------------------

    double get_time_in_seconds() {
        #if defined(_WIN32) || defined(_WIN64)
            LARGE_INTEGER frequency;
            LARGE_INTEGER timeCur;
            QueryPerformanceFrequency(&frequency);
            QueryPerformanceCounter(&timeCur);
            return static_cast<double>(timeCur.QuadPart) / frequency.QuadPart;
        #else
            struct timespec timeCur;
            clock_gettime(CLOCK_MONOTONIC, &timeCur);
            return timeCur.tv_sec + timeCur.tv_nsec / 1e9;
        #endif
    }

    std::string NormalizeName(const std::string& name)
    {
        auto first = name.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) return "";
        auto last = name.find_last_not_of(" \t\r\n");

        std::string out = name.substr(first, last - first + 1);
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    std::string FormatVector(const std::vector<double>& x, int decimals)
    {
        std::ostringstream ss;
        ss << std::setprecision(decimals) << "[";
        for (std::size_t i = 0; i < x.size(); i++) {
            if (i) ss << ", ";
            ss << x[i];
        }
        ss << "]";
        return ss.str();
    }

    // -----------------------------------------------------------------------------
    // Candidate ordering
    // -----------------------------------------------------------------------------

    bool BetterCandidate(const TCandidate& lhs, const TCandidate& rhs)
    {
        if (lhs.feasible != rhs.feasible)
            return lhs.feasible;

        if (!lhs.feasible && lhs.violation != rhs.violation)
            return lhs.violation < rhs.violation;

        // NaN values never win
        if (std::isnan(rhs.value)) return !std::isnan(lhs.value);
        return lhs.value < rhs.value;
    }

    // -----------------------------------------------------------------------------
    // Vector helpers
    // -----------------------------------------------------------------------------

    double Dot(const std::vector<double>& a, const std::vector<double>& b)
    {
        return std::inner_product(a.begin(), a.end(), b.begin(), 0.0);
    }

    double Norm2(const std::vector<double>& v)
    {
        return std::sqrt(Dot(v, v));
    }

    double Distance(const std::vector<double>& a, const std::vector<double>& b)
    {
        double sum = 0.0;
        for (std::size_t i = 0; i < a.size() && i < b.size(); i++) {
            double d = a[i] - b[i];
            sum += d * d;
        }
        return std::sqrt(sum);
    }

    void ClipToBounds(std::vector<double>& x, const TBounds& bounds)
    {
        if (bounds.empty()) return;
        for (std::size_t i = 0; i < x.size(); i++)
            x[i] = std::clamp(x[i], bounds[i].first, bounds[i].second);
    }

    // -----------------------------------------------------------------------------
    // Validation
    // -----------------------------------------------------------------------------

    void ValidateBounds(const TBounds& bounds, std::size_t n)
    {
        if (bounds.empty()) return;

        if (bounds.size() != n) {
            throw ConfigurationError("bounds have " + std::to_string(bounds.size()) +
                                     " pairs but the problem has dimension " + std::to_string(n));
        }

        for (std::size_t i = 0; i < bounds.size(); i++) {
            const auto& [lo, hi] = bounds[i];
            if (std::isnan(lo) || std::isnan(hi) || lo > hi) {
                throw ConfigurationError("invalid bounds at index " + std::to_string(i) +
                                         ": low must not exceed high");
            }
        }
    }

    void ValidateStart(const std::vector<double>& x0, const TBounds& bounds, int modelDimension)
    {
        if (x0.empty())
            throw ConfigurationError("start point x0 is empty");

        if (modelDimension > 0 && static_cast<int>(x0.size()) != modelDimension) {
            throw ConfigurationError("start point has dimension " + std::to_string(x0.size()) +
                                     " but the model expects " + std::to_string(modelDimension));
        }

        for (double v : x0) {
            if (!std::isfinite(v))
                throw ConfigurationError("start point " + FormatVector(x0) + " is not finite");
        }

        ValidateBounds(bounds, x0.size());
    }

    void ValidateTermination(const TTermination& termination)
    {
        if (termination.max_evals < 1)
            throw ConfigurationError("termination.max_evals must be >= 1");
        if (termination.max_iters && *termination.max_iters < 0)
            throw ConfigurationError("termination.max_iters must be >= 0");
        if (termination.stall_window < 1)
            throw ConfigurationError("termination.stall_window must be >= 1");
        if (termination.ftol_abs < 0 || termination.ftol_rel < 0 || termination.xtol_abs < 0)
            throw ConfigurationError("termination tolerances must be non-negative");
        if (termination.max_time_s && *termination.max_time_s <= 0)
            throw ConfigurationError("termination.max_time_s must be positive");
    }

} // namespace optimlib::core
