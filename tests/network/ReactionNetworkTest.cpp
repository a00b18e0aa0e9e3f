#include "gtest/gtest.h"
#include "network/NetworkBuilder.hpp"
#include "network/MassActionRateLaw.hpp"
#include "exceptions/Exceptions.hpp"
#include <Eigen/Dense>
#include <limits>
#include <map>
#include <memory>
#include <vector>

using namespace crn;

// Network with a second-order and a heterodimer reaction:
//   k1, 2A --> B
//   k2, A + B --> C
//   k3, C --> 0
class ReactionNetworkTest : public ::testing::Test {
protected:
    std::shared_ptr<const ReactionNetwork> network;
    parameter_type params;

    void SetUp() override {
        network = NetworkBuilder()
            .addParameters({"k1", "k2", "k3"})
            .addReaction({{{"A", 2}}, {{"B", 1}}, RateExpression::massAction("k1"), ""})
            .addReaction({{{"A", 1}, {"B", 1}}, {{"C", 1}}, RateExpression::massAction("k2"), ""})
            .addReaction({{{"C", 1}}, {}, RateExpression::massAction("k3"), ""})
            .build();
        params = {0.5, 2.0, 0.1};
    }
};

TEST_F(ReactionNetworkTest, SpeciesOrderFollowsFirstAppearance) {
    ASSERT_EQ(network->getSpeciesCount(), 3);
    EXPECT_EQ(network->getSpeciesNames(), (std::vector<std::string>{"A", "B", "C"}));
    EXPECT_EQ(network->getSpeciesIndex("B"), 1);
    EXPECT_EQ(network->getParameterIndex("k3"), 2);
    EXPECT_TRUE(network->hasSpecies("C"));
    EXPECT_FALSE(network->hasSpecies("k1"));
    EXPECT_TRUE(network->hasParameter("k1"));
    EXPECT_THROW(network->getSpeciesIndex("D"), ModelException);
    EXPECT_THROW(network->getParameterIndex("k4"), ModelException);
}

TEST_F(ReactionNetworkTest, NetChangeVectors) {
    Eigen::VectorXi expected0(3);
    expected0 << -2, 1, 0;
    EXPECT_EQ(network->getNetChange(0), expected0);

    Eigen::VectorXi expected1(3);
    expected1 << -1, -1, 1;
    EXPECT_EQ(network->getNetChange(1), expected1);

    Eigen::MatrixXi S = network->getStoichiometryMatrix();
    ASSERT_EQ(S.rows(), 3);
    ASSERT_EQ(S.cols(), 3);
    EXPECT_EQ(S(2, 2), -1);

    EXPECT_THROW(network->getNetChange(3), InvalidParameterException);
    EXPECT_THROW(network->getReaction(-1), InvalidParameterException);
}

TEST_F(ReactionNetworkTest, DefaultLabels) {
    EXPECT_EQ(network->getReaction(0).label, "2A --> B");
    EXPECT_EQ(network->getReaction(1).label, "A + B --> C");
    EXPECT_EQ(network->getReaction(2).label, "C --> 0");
}

TEST_F(ReactionNetworkTest, StochasticPropensityUsesBinomials) {
    state_type x = {5.0, 3.0, 1.0};
    // k1 * C(5,2) = 0.5 * 10
    EXPECT_DOUBLE_EQ(network->propensity(0, x, params), 5.0);
    // k2 * 5 * 3
    EXPECT_DOUBLE_EQ(network->propensity(1, x, params), 30.0);
    EXPECT_DOUBLE_EQ(network->propensity(2, x, params), 0.1);
}

TEST_F(ReactionNetworkTest, PropensityIsZeroWhenReactantsInsufficient) {
    state_type one_a = {1.0, 0.0, 0.0};
    EXPECT_EQ(network->propensity(0, one_a, params), 0.0);
    EXPECT_EQ(network->propensity(1, one_a, params), 0.0);
    EXPECT_EQ(network->propensity(2, one_a, params), 0.0);

    state_type empty = {0.0, 0.0, 0.0};
    for (int r = 0; r < network->getReactionCount(); ++r) {
        EXPECT_EQ(network->propensity(r, empty, params), 0.0);
    }
}

TEST_F(ReactionNetworkTest, DeterministicRateUsesPowerLaw) {
    EXPECT_FALSE(network->usesCombinatoricRateLaws());
    state_type x = {5.0, 3.0, 1.0};
    // k1 * 5^2, no combinatorial correction
    EXPECT_DOUBLE_EQ(network->rate(0, x, params), 12.5);
    EXPECT_DOUBLE_EQ(network->rate(1, x, params), 30.0);
}

TEST_F(ReactionNetworkTest, SizeMismatchIsRejected) {
    state_type short_state = {1.0, 2.0};
    EXPECT_THROW(network->propensity(0, short_state, params), InvalidParameterException);
    state_type x = {1.0, 2.0, 3.0};
    parameter_type short_params = {1.0};
    EXPECT_THROW(network->rate(0, x, short_params), InvalidParameterException);
}

TEST_F(ReactionNetworkTest, ValidateParameters) {
    EXPECT_NO_THROW(network->validateParameters(params));
    EXPECT_THROW(network->validateParameters({1.0, 2.0}), ModelException);
    EXPECT_THROW(network->validateParameters({1.0, -2.0, 0.1}), ModelException);
    EXPECT_THROW(network->validateParameters({1.0, std::numeric_limits<double>::quiet_NaN(), 0.1}), ModelException);
}

TEST_F(ReactionNetworkTest, NamedVectors) {
    Eigen::VectorXd p = network->parameterVector({{"k1", 1.0}, {"k2", 2.0}, {"k3", 3.0}});
    ASSERT_EQ(p.size(), 3);
    EXPECT_DOUBLE_EQ(p(2), 3.0);
    EXPECT_THROW(network->parameterVector({{"k1", 1.0}, {"k2", 2.0}}), ModelException);
    EXPECT_THROW(network->parameterVector({{"k1", 1.0}, {"k2", 2.0}, {"k3", 3.0}, {"k9", 1.0}}), ModelException);

    Eigen::VectorXd x = network->stateVector({{"B", 7.0}});
    ASSERT_EQ(x.size(), 3);
    EXPECT_DOUBLE_EQ(x(0), 0.0);
    EXPECT_DOUBLE_EQ(x(1), 7.0);
    EXPECT_THROW(network->stateVector({{"Z", 1.0}}), ModelException);
}

TEST(MassActionRateLawTest, Binomial) {
    EXPECT_DOUBLE_EQ(MassActionRateLaw::binomial(5.0, 0), 1.0);
    EXPECT_DOUBLE_EQ(MassActionRateLaw::binomial(5.0, 1), 5.0);
    EXPECT_DOUBLE_EQ(MassActionRateLaw::binomial(5.0, 2), 10.0);
    EXPECT_DOUBLE_EQ(MassActionRateLaw::binomial(5.0, 3), 10.0);
    EXPECT_DOUBLE_EQ(MassActionRateLaw::binomial(2.0, 3), 0.0);
}

TEST(MassActionRateLawTest, CombinatoricDeterministicRate) {
    MassActionRateLaw law({{0, 2}, {1, 1}}, 3.0, true, "3");
    state_type x = {4.0, 2.0};
    // 3 * 4^2 * 2 / (2! * 1!)
    EXPECT_DOUBLE_EQ(law.rate(x, {}), 48.0);
    // 3 * C(4,2) * C(2,1)
    EXPECT_DOUBLE_EQ(law.propensity(x, {}), 36.0);
}

TEST(MassActionRateLawTest, RejectsNegativeConstant) {
    EXPECT_THROW(MassActionRateLaw({{0, 1}}, -1.0, false, "-1"), ModelException);
}
