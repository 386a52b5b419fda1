#pragma once
#include "optimlib/core/data.hpp"

namespace optimlib::core {

    class IGradientModel;

    // Objective model consumed by every strategy
    class IModel {
        public:
            virtual ~IModel() = default;

            virtual double objective(const std::vector<double>& x) const = 0;

            // Expected dimension of x, 0 when the model accepts any
            virtual int getDimension() const { return 0; }

            // Capability probe: models that provide derivatives return themselves
            virtual const IGradientModel* asGradient() const { return nullptr; }
        };

    // Optional extension: analytic gradient of the objective
    class IGradientModel {
        public:
            virtual ~IGradientModel() = default;

            virtual std::vector<double> gradient(const std::vector<double>& x) const = 0;
        };

    // Hardware-in-the-loop or simulation controller
    class IController {
        public:
            virtual ~IController() = default;

            virtual void reset(std::optional<unsigned int> seed) = 0;
            virtual double apply(const std::vector<double>& x) = 0;
            virtual bool safe(const std::vector<double>& x) const = 0;
        };

    class NullController : public IController {
        public:
            void reset(std::optional<unsigned int>) override {}
            double apply(const std::vector<double>&) override { return 0.0; }
            bool safe(const std::vector<double>&) const override { return true; }
        };

}
