#ifndef NETWORK_FACTORY_HPP
#define NETWORK_FACTORY_HPP

#include "network/ReactionNetwork.hpp"
#include "exceptions/Exceptions.hpp"
#include <memory>
#include <Eigen/Dense>

namespace crn {
    /**
     * @class NetworkFactory
     * @brief Factory class for the standard example reaction networks.
     *
     * Each method returns an immutable network; parameter values are
     * supplied at solve time in the documented declaration order.
     */
    class NetworkFactory {
        public:
            /**
             * @brief Pure production: `b, 0 --> X`.
             *
             * Parameters: [b]. Species: [X]. Starting from X = 0 the count
             * at time t is Poisson distributed with mean b*t.
             */
            static std::shared_ptr<const ReactionNetwork> createProductionNetwork();

            /**
             * @brief Birth-death process: `b, 0 --> X`, `d, X --> 0`.
             *
             * Parameters: [b, d]. Species: [X]. Stationary mean b/d.
             */
            static std::shared_ptr<const ReactionNetwork> createBirthDeathNetwork();

            /**
             * @brief Two-stage gene expression.
             *
             * `kR, 0 --> mRNA`, `gR, mRNA --> 0`, `kP, mRNA --> mRNA + protein`,
             * `gP, protein --> 0`.
             *
             * Parameters: [kR, gR, kP, gP]. Species: [mRNA, protein].
             * Steady state: mRNA = kR/gR, protein = kP*kR/(gR*gP).
             */
            static std::shared_ptr<const ReactionNetwork> createGeneExpressionNetwork();

            /**
             * @brief Gene expression with transcription repressed by its own protein.
             *
             * `hillr(protein; v, K, n), 0 --> mRNA`, followed by the degradation and
             * translation reactions of the two-stage model.
             *
             * Parameters: [v, K, n, gR, kP, gP]. Species: [mRNA, protein].
             */
            static std::shared_ptr<const ReactionNetwork> createHillRepressionNetwork();

            /**
             * @brief Production and pairwise annihilation: `b, 0 --> X`, `d, 2X --> 0`.
             *
             * Built with combinatoric rate laws, so the ODE rate d*X^2/2 is the
             * large-number limit of the propensity d*X(X-1)/2.
             * Parameters: [b, d]. Species: [X]. ODE steady state sqrt(b/d).
             */
            static std::shared_ptr<const ReactionNetwork> createDimerizationNetwork();

            /**
             * @brief Parameter vector for the gene expression network.
             */
            static Eigen::VectorXd geneExpressionParameters(double kR, double gR, double kP, double gP);
    };
} // namespace crn
#endif // NETWORK_FACTORY_HPP
