#ifndef READ_REACTION_NETWORK_HPP
#define READ_REACTION_NETWORK_HPP

#include "network/ReactionNetwork.hpp"
#include <Eigen/Dense>
#include <istream>
#include <memory>
#include <string>

namespace crn {

    /**
     * @brief A network read from a file together with its numeric values.
     */
    struct NetworkDescription {
        std::string name;                                 ///< File stem, used as an output prefix.
        std::shared_ptr<const ReactionNetwork> network;
        Eigen::VectorXd parameters;                       ///< In parameter declaration order.
        Eigen::VectorXd initial_state;                    ///< In species order; unspecified species start at 0.
    };

} // namespace crn

/**
 * @brief Reads a reaction network description file.
 *
 * Line-oriented format; `#` starts a comment:
 * @code
 *   parameter kR 10.0
 *   species mRNA 0
 *   initial protein 5
 *   option combinatoric_ratelaws false
 *   reaction kR : 0 -> mRNA
 *   reaction 0.5 : 2 A + B -> C
 *   reaction hillr(protein; v, K, n) : 0 -> mRNA
 * @endcode
 *
 * @param filename Path to the `.crn` file.
 * @return crn::NetworkDescription Built network, parameter vector and initial state.
 *
 * @throws crn::NetworkParseException On syntax errors or if the file cannot be opened.
 * @throws crn::ModelException On semantic errors (undeclared symbols, negative coefficients).
 */
crn::NetworkDescription readReactionNetwork(const std::string& filename);

/**
 * @brief Parses a network description from a stream.
 *
 * @param input Stream holding the description.
 * @param name Name stored in the result and used in error messages.
 *
 * @throws crn::NetworkParseException On syntax errors.
 * @throws crn::ModelException On semantic errors.
 */
crn::NetworkDescription parseReactionNetwork(std::istream& input, const std::string& name);

#endif // READ_REACTION_NETWORK_HPP
