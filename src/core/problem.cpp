#include "optimlib/core/problem.hpp"
#include "optimlib/core/errors.hpp"
#include "optimlib/core/method.hpp"

//-------------------------- IMPLEMENTATION --------------------------
namespace optimlib::core {

    double ParabolaModel::objective(const std::vector<double>& x) const
    {
        double e = x[0] - xStar_;
        return e * e;
    }

    std::vector<double> ParabolaModel::gradient(const std::vector<double>& x) const
    {
        return { 2.0 * (x[0] - xStar_) };
    }

    PolyResidualModel::PolyResidualModel(std::vector<double> coeffs)
        : coeffs_(std::move(coeffs))
    {
        if (coeffs_.empty())
            throw ConfigurationError("poly_residual needs at least one coefficient");

        // derivative coefficients, highest degree first
        const int n = static_cast<int>(coeffs_.size()) - 1;
        for (int i = 0; i < n; i++)
            dcoeffs_.push_back(coeffs_[i] * (n - i));
    }

    double PolyResidualModel::Horner(const std::vector<double>& coeffs, double x)
    {
        double v = 0.0;
        for (double c : coeffs)
            v = v * x + c;
        return v;
    }

    double PolyResidualModel::objective(const std::vector<double>& x) const
    {
        double p = Horner(coeffs_, x[0]);
        return p * p;
    }

    std::vector<double> PolyResidualModel::gradient(const std::vector<double>& x) const
    {
        double p = Horner(coeffs_, x[0]);
        double dp = dcoeffs_.empty() ? 0.0 : Horner(dcoeffs_, x[0]);
        return { 2.0 * p * dp };
    }

    std::shared_ptr<IModel> createModel(const std::string& name, const YAML::Node& params)
    {
        const std::string key = NormalizeName(name);

        try {
            if (key == "parabola" || key == "quadratic") {
                double xStar = 3.0;
                if (params) {
                    for (const auto& kv : params) {
                        const std::string p = kv.first.as<std::string>();
                        if (p == "x_star") xStar = kv.second.as<double>();
                        else throw ConfigurationError("unknown parameter '" + p + "' for model " + key);
                    }
                }
                return std::make_shared<ParabolaModel>(xStar);
            }

            if (key == "poly_residual" || key == "poly" || key == "polynomial") {
                if (!params || !params["coeffs"])
                    throw ConfigurationError("model " + key + " requires 'coeffs'");
                for (const auto& kv : params) {
                    const std::string p = kv.first.as<std::string>();
                    if (p != "coeffs")
                        throw ConfigurationError("unknown parameter '" + p + "' for model " + key);
                }
                return std::make_shared<PolyResidualModel>(params["coeffs"].as<std::vector<double>>());
            }
        } catch (const YAML::Exception& e) {
            throw ConfigurationError("model " + key + ": " + e.what());
        }

        throw ConfigurationError("unknown model name: " + name);
    }

    std::shared_ptr<IController> createController(const std::string& type)
    {
        const std::string key = NormalizeName(type);
        if (key.empty() || key == "null" || key == "none" || key == "~")
            return std::make_shared<NullController>();

        throw ConfigurationError("unknown controller type: " + type);
    }

}
