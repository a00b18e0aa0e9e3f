#include "network/NetworkFactory.hpp"
#include "network/NetworkBuilder.hpp"

namespace crn {

    std::shared_ptr<const ReactionNetwork> NetworkFactory::createProductionNetwork() {
        return NetworkBuilder()
            .addParameter("b")
            .addReaction({{}, {{"X", 1}}, RateExpression::massAction("b"), ""})
            .build();
    }

    std::shared_ptr<const ReactionNetwork> NetworkFactory::createBirthDeathNetwork() {
        return NetworkBuilder()
            .addParameters({"b", "d"})
            .addReaction({{}, {{"X", 1}}, RateExpression::massAction("b"), ""})
            .addReaction({{{"X", 1}}, {}, RateExpression::massAction("d"), ""})
            .build();
    }

    std::shared_ptr<const ReactionNetwork> NetworkFactory::createGeneExpressionNetwork() {
        return NetworkBuilder()
            .addParameters({"kR", "gR", "kP", "gP"})
            .addReaction({{}, {{"mRNA", 1}}, RateExpression::massAction("kR"), ""})
            .addReaction({{{"mRNA", 1}}, {}, RateExpression::massAction("gR"), ""})
            .addReaction({{{"mRNA", 1}}, {{"mRNA", 1}, {"protein", 1}}, RateExpression::massAction("kP"), ""})
            .addReaction({{{"protein", 1}}, {}, RateExpression::massAction("gP"), ""})
            .build();
    }

    std::shared_ptr<const ReactionNetwork> NetworkFactory::createHillRepressionNetwork() {
        return NetworkBuilder()
            .addParameters({"v", "K", "n", "gR", "kP", "gP"})
            .addSpecies("mRNA")
            .addSpecies("protein")
            .addReaction({{}, {{"mRNA", 1}}, RateExpression::library("hillr", {"protein"}, {"v", "K", "n"}), ""})
            .addReaction({{{"mRNA", 1}}, {}, RateExpression::massAction("gR"), ""})
            .addReaction({{{"mRNA", 1}}, {{"mRNA", 1}, {"protein", 1}}, RateExpression::massAction("kP"), ""})
            .addReaction({{{"protein", 1}}, {}, RateExpression::massAction("gP"), ""})
            .build();
    }

    std::shared_ptr<const ReactionNetwork> NetworkFactory::createDimerizationNetwork() {
        return NetworkBuilder()
            .addParameters({"b", "d"})
            .setCombinatoricRateLaws(true)
            .addReaction({{}, {{"X", 1}}, RateExpression::massAction("b"), ""})
            .addReaction({{{"X", 2}}, {}, RateExpression::massAction("d"), ""})
            .build();
    }

    Eigen::VectorXd NetworkFactory::geneExpressionParameters(double kR, double gR, double kP, double gP) {
        Eigen::VectorXd p(4);
        p << kR, gR, kP, gP;
        return p;
    }

} // namespace crn
