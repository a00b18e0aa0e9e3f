#ifndef MASS_ACTION_ODE_SYSTEM_HPP
#define MASS_ACTION_ODE_SYSTEM_HPP

#include "network/ReactionNetwork.hpp"
#include <Eigen/Dense>
#include <memory>

namespace crn {

    /**
     * @class MassActionOdeSystem
     * @brief Right-hand side of the reaction rate equations of a network.
     *
     * dx/dt = sum over reactions of netChange_r * rate_r(x, p), where rate_r
     * is the deterministic form of each reaction's rate law. Parameters are
     * bound at construction. Usable directly as a Boost.Odeint system functor.
     */
    class MassActionOdeSystem {
    public:
        /**
         * @throws InvalidParameterException If `network` is null.
         * @throws ModelException If `parameters` fails the network's parameter validation.
         */
        MassActionOdeSystem(std::shared_ptr<const ReactionNetwork> network, parameter_type parameters);

        /**
         * @brief Evaluates the derivatives.
         *
         * @param x Current concentrations.
         * @param[out] dxdt Derivatives; resized to the species count.
         * @param t Current time (the system is autonomous).
         *
         * @throws ModelException If a custom rate law returns a negative or non-finite value.
         */
        void operator()(const state_type& x, state_type& dxdt, double t) const;

        /** @brief Derivatives at x as an Eigen vector. */
        Eigen::VectorXd computeDerivatives(const Eigen::VectorXd& x) const;

        int getStateSize() const;

    private:
        std::shared_ptr<const ReactionNetwork> network_;
        parameter_type parameters_;
    };

} // namespace crn

#endif // MASS_ACTION_ODE_SYSTEM_HPP
