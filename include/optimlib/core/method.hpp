#pragma once

#include "optimlib/core/data.hpp"

namespace optimlib::core {

    // -----------------------------------------------------------------------------
    // General Utilities
    // -----------------------------------------------------------------------------
    double get_time_in_seconds();

    std::string NormalizeName(const std::string& name);

    std::string FormatVector(const std::vector<double>& x, int decimals = 6);

    // -----------------------------------------------------------------------------
    // Candidate ordering
    // -----------------------------------------------------------------------------

    /**
     * Method: BetterCandidate
     * Description: strict ordering shared by the strategies and the multi-start
     * selection. Feasible beats infeasible; two feasible candidates compare by
     * value; two infeasible ones by violation, then by value.
     */
    bool BetterCandidate(const TCandidate& lhs, const TCandidate& rhs);

    // -----------------------------------------------------------------------------
    // Vector helpers
    // -----------------------------------------------------------------------------
    double Norm2(const std::vector<double>& v);
    double Distance(const std::vector<double>& a, const std::vector<double>& b);
    double Dot(const std::vector<double>& a, const std::vector<double>& b);

    void ClipToBounds(std::vector<double>& x, const TBounds& bounds);

    // -----------------------------------------------------------------------------
    // Validation (throws ConfigurationError)
    // -----------------------------------------------------------------------------
    void ValidateBounds(const TBounds& bounds, std::size_t n);
    void ValidateStart(const std::vector<double>& x0, const TBounds& bounds, int modelDimension);
    void ValidateTermination(const TTermination& termination);

} // namespace optimlib::core
