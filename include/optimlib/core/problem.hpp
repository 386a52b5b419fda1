#pragma once

#include "optimlib/core/imodel.hpp"
#include <yaml-cpp/yaml.h>

namespace optimlib::core {

    //----------------- MODELS SHIPPED WITH THE LIBRARY -----------------------

    /**
     * Model: ParabolaModel
     * Description: f(x) = (x0 - x_star)^2 with analytic gradient
     */
    class ParabolaModel : public IModel, public IGradientModel {
    public:
        explicit ParabolaModel(double xStar = 3.0) : xStar_(xStar) {}

        double objective(const std::vector<double>& x) const override;
        std::vector<double> gradient(const std::vector<double>& x) const override;
        int getDimension() const override { return 1; }
        const IGradientModel* asGradient() const override { return this; }

    private:
        double xStar_;
    };

    /**
     * Model: PolyResidualModel
     * Description: squared residual p(x0)^2 of a polynomial given highest
     * degree first; its minima are the real roots of p
     */
    class PolyResidualModel : public IModel, public IGradientModel {
    public:
        explicit PolyResidualModel(std::vector<double> coeffs);

        double objective(const std::vector<double>& x) const override;
        std::vector<double> gradient(const std::vector<double>& x) const override;
        int getDimension() const override { return 1; }
        const IGradientModel* asGradient() const override { return this; }

    private:
        static double Horner(const std::vector<double>& coeffs, double x);

        std::vector<double> coeffs_;
        std::vector<double> dcoeffs_;
    };

    /**
     * Model: FunctionModel
     * Description: adapts plain callables; the gradient capability is only
     * advertised when a gradient callable is given
     */
    class FunctionModel : public IModel, public IGradientModel {
    public:
        using Objective = std::function<double(const std::vector<double>&)>;
        using Gradient = std::function<std::vector<double>(const std::vector<double>&)>;

        explicit FunctionModel(Objective objective, Gradient gradient = nullptr, int dimension = 0)
            : objective_(std::move(objective)), gradient_(std::move(gradient)), dimension_(dimension) {}

        double objective(const std::vector<double>& x) const override { return objective_(x); }
        std::vector<double> gradient(const std::vector<double>& x) const override { return gradient_(x); }
        int getDimension() const override { return dimension_; }
        const IGradientModel* asGradient() const override { return gradient_ ? this : nullptr; }

    private:
        Objective objective_;
        Gradient gradient_;
        int dimension_;
    };

    /**
     * Method: createModel
     * Description: resolve a model by name ("parabola", "quadratic",
     * "poly_residual", "poly", "polynomial") with its keyword parameters
     */
    std::shared_ptr<IModel> createModel(const std::string& name, const YAML::Node& params);

    /**
     * Method: createController
     * Description: resolve a controller by type; "null" and "none" give the
     * NullController
     */
    std::shared_ptr<IController> createController(const std::string& type);
}
