#include "network/RateFunctions.hpp"
#include "exceptions/Exceptions.hpp"
#include <cmath>

namespace crn {
namespace RateFunctions {

    double hillRepression(double x, double v, double K, double n) {
        const double Kn = std::pow(K, n);
        const double denom = Kn + std::pow(x, n);
        return denom > 0.0 ? v * Kn / denom : 0.0;
    }

    double hillActivation(double x, double v, double K, double n) {
        const double xn = std::pow(x, n);
        const double denom = std::pow(K, n) + xn;
        return denom > 0.0 ? v * xn / denom : 0.0;
    }

    double michaelisMenten(double x, double v, double K) {
        const double denom = K + x;
        return denom > 0.0 ? v * x / denom : 0.0;
    }

    RateFunctionDefinition lookup(const std::string& name) {
        if (name == "hillr") {
            return {name,
                    [](const std::vector<double>& s, const std::vector<double>& p) {
                        return hillRepression(s[0], p[0], p[1], p[2]);
                    },
                    1, 3};
        }
        if (name == "hill") {
            return {name,
                    [](const std::vector<double>& s, const std::vector<double>& p) {
                        return hillActivation(s[0], p[0], p[1], p[2]);
                    },
                    1, 3};
        }
        if (name == "mm") {
            return {name,
                    [](const std::vector<double>& s, const std::vector<double>& p) {
                        return michaelisMenten(s[0], p[0], p[1]);
                    },
                    1, 2};
        }
        THROW_MODEL_ERROR("RateFunctions::lookup", "Unknown rate function '" + name + "'. Available: hillr, hill, mm.");
    }

    bool contains(const std::string& name) {
        return name == "hillr" || name == "hill" || name == "mm";
    }

} // namespace RateFunctions
} // namespace crn
