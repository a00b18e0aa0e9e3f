#include "simulation/MassActionOdeSystem.hpp"
#include "exceptions/Exceptions.hpp"
#include <utility>

namespace crn {

    MassActionOdeSystem::MassActionOdeSystem(std::shared_ptr<const ReactionNetwork> network, parameter_type parameters)
        : network_(std::move(network)), parameters_(std::move(parameters))
    {
        if (!network_) {
            THROW_INVALID_PARAM("MassActionOdeSystem::MassActionOdeSystem", "Network pointer cannot be null.");
        }
        network_->validateParameters(parameters_);
    }

    void MassActionOdeSystem::operator()(const state_type& x, state_type& dxdt, double /*t*/) const {
        dxdt.assign(x.size(), 0.0);
        const int num_reactions = network_->getReactionCount();
        for (int r = 0; r < num_reactions; ++r) {
            const Reaction& reaction = network_->getReaction(r);
            const double flux = reaction.rate_law->rate(x, parameters_);
            if (flux == 0.0) {
                continue;
            }
            for (const auto& entry : reaction.net_change) {
                dxdt[static_cast<size_t>(entry.species_index)] += entry.coefficient * flux;
            }
        }
    }

    Eigen::VectorXd MassActionOdeSystem::computeDerivatives(const Eigen::VectorXd& x) const {
        if (x.size() != getStateSize()) {
            THROW_INVALID_PARAM("MassActionOdeSystem::computeDerivatives",
                                "State size " + std::to_string(x.size()) +
                                " does not match species count " + std::to_string(getStateSize()) + ".");
        }
        state_type xs(x.data(), x.data() + x.size());
        state_type dxdt;
        (*this)(xs, dxdt, 0.0);
        return Eigen::Map<const Eigen::VectorXd>(dxdt.data(), static_cast<Eigen::Index>(dxdt.size()));
    }

    int MassActionOdeSystem::getStateSize() const {
        return network_->getSpeciesCount();
    }

} // namespace crn
