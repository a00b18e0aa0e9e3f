#include "simulation/solvers/SolverStrategyFactory.hpp"
#include "simulation/solvers/CashKarpSolverStrategy.hpp"
#include "simulation/solvers/Dopri5SolverStrategy.hpp"
#include "simulation/solvers/FehlbergSolverStrategy.hpp"
#include "exceptions/Exceptions.hpp"

namespace crn {

    std::shared_ptr<IOdeSolverStrategy> SolverStrategyFactory::create(const std::string& name) {
        if (name == "dopri5") {
            return std::make_shared<Dopri5SolverStrategy>();
        }
        if (name == "cash_karp") {
            return std::make_shared<CashKarpSolverStrategy>();
        }
        if (name == "fehlberg78") {
            return std::make_shared<FehlbergSolverStrategy>();
        }
        THROW_INVALID_PARAM("SolverStrategyFactory::create",
                            "Unknown ODE solver '" + name + "'. Expected dopri5, cash_karp or fehlberg78.");
    }

    std::vector<std::string> SolverStrategyFactory::availableSolvers() {
        return {"dopri5", "cash_karp", "fehlberg78"};
    }

} // namespace crn
