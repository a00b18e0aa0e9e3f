#include "gtest/gtest.h"
#include "network/NetworkBuilder.hpp"
#include "exceptions/Exceptions.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace crn;

TEST(NetworkBuilderTest, DeclaredSpeciesComeFirst) {
    auto network = NetworkBuilder()
        .addParameter("k")
        .addSpecies("Z")
        .addReaction({{{"A", 1}}, {{"Z", 1}, {"B", 1}}, RateExpression::massAction("k"), ""})
        .build();
    EXPECT_EQ(network->getSpeciesNames(), (std::vector<std::string>{"Z", "A", "B"}));
}

TEST(NetworkBuilderTest, RepeatedSpeciesAreMerged) {
    auto network = NetworkBuilder()
        .addReaction({{{"A", 1}, {"A", 1}}, {{"B", 1}, {"B", 0}}, RateExpression::massAction(1.0), ""})
        .build();
    const Reaction& reaction = network->getReaction(0);
    ASSERT_EQ(reaction.reactants.size(), 1u);
    EXPECT_EQ(reaction.reactants[0].coefficient, 2);
    EXPECT_EQ(network->getNetChange(0)(0), -2);
    EXPECT_EQ(network->getNetChange(0)(1), 1);
}

TEST(NetworkBuilderTest, CatalystHasNoNetChange) {
    auto network = NetworkBuilder()
        .addReaction({{{"E", 1}}, {{"E", 1}, {"P", 1}}, RateExpression::massAction(2.0), ""})
        .build();
    const Reaction& reaction = network->getReaction(0);
    ASSERT_EQ(reaction.net_change.size(), 1u);
    EXPECT_EQ(reaction.net_change[0].species_index, network->getSpeciesIndex("P"));
    EXPECT_EQ(reaction.net_change[0].coefficient, 1);
    EXPECT_DOUBLE_EQ(network->propensity(0, {3.0, 0.0}, {}), 6.0);
}

TEST(NetworkBuilderTest, UndeclaredRateParameterIsRejected) {
    NetworkBuilder builder;
    builder.addReaction({{}, {{"X", 1}}, RateExpression::massAction("b"), ""});
    EXPECT_THROW(builder.build(), ModelException);
}

TEST(NetworkBuilderTest, SpeciesUsedAsRateConstantIsRejected) {
    NetworkBuilder builder;
    builder.addReaction({{{"X", 1}}, {}, RateExpression::massAction("X"), ""});
    try {
        builder.build();
        FAIL() << "Expected ModelException";
    } catch (const ModelException& e) {
        EXPECT_NE(std::string(e.what()).find("is a species"), std::string::npos);
    }
}

TEST(NetworkBuilderTest, NegativeCoefficientIsRejected) {
    NetworkBuilder builder;
    builder.addReaction({{{"X", -1}}, {}, RateExpression::massAction(1.0), ""});
    EXPECT_THROW(builder.build(), ModelException);
}

TEST(NetworkBuilderTest, NegativeRateConstantIsRejected) {
    NetworkBuilder builder;
    builder.addReaction({{{"X", 1}}, {}, RateExpression::massAction(-0.5), ""});
    EXPECT_THROW(builder.build(), ModelException);
}

TEST(NetworkBuilderTest, EmptyNetworkIsRejected) {
    EXPECT_THROW(NetworkBuilder().addParameter("k").build(), ModelException);
}

TEST(NetworkBuilderTest, EmptyReactionIsRejected) {
    NetworkBuilder builder;
    builder.addReaction({{}, {}, RateExpression::massAction(1.0), ""});
    EXPECT_THROW(builder.build(), ModelException);
}

TEST(NetworkBuilderTest, DuplicateAndClashingNamesAreRejected) {
    NetworkBuilder builder;
    builder.addParameter("k");
    EXPECT_THROW(builder.addParameter("k"), ModelException);
    EXPECT_THROW(builder.addSpecies("k"), ModelException);
    EXPECT_THROW(builder.addParameter(""), ModelException);

    builder.addSpecies("X");
    EXPECT_THROW(builder.addSpecies("X"), ModelException);
    EXPECT_THROW(builder.addParameter("X"), ModelException);
}

TEST(NetworkBuilderTest, ParameterInStoichiometryIsRejected) {
    NetworkBuilder builder;
    builder.addParameter("k");
    builder.addReaction({{{"k", 1}}, {}, RateExpression::massAction("k"), ""});
    EXPECT_THROW(builder.build(), ModelException);
}

TEST(NetworkBuilderTest, CustomLawArgumentsMustResolve) {
    {
        NetworkBuilder builder;
        builder.addParameters({"v", "K", "n"});
        builder.addReaction({{}, {{"mRNA", 1}}, RateExpression::library("hillr", {"protein"}, {"v", "K", "n"}), ""});
        EXPECT_THROW(builder.build(), ModelException);
    }
    {
        NetworkBuilder builder;
        builder.addParameters({"v", "K"});
        builder.addSpecies("protein");
        builder.addReaction({{}, {{"mRNA", 1}}, RateExpression::library("hillr", {"protein"}, {"v", "K", "n"}), ""});
        EXPECT_THROW(builder.build(), ModelException);
    }
    {
        NetworkBuilder builder;
        builder.addParameters({"v", "K", "n"});
        builder.addSpecies("protein");
        builder.addReaction({{}, {{"mRNA", 1}}, RateExpression::library("hillr", {"protein"}, {"v", "K", "n"}), ""});
        EXPECT_NO_THROW(builder.build());
    }
}

TEST(NetworkBuilderTest, CustomLawSpeciesFromStoichiometryIsKnown) {
    auto network = NetworkBuilder()
        .addParameters({"v", "K"})
        .addReaction({{{"S", 1}}, {{"P", 1}}, RateExpression::library("mm", {"S"}, {"v", "K"}), ""})
        .build();
    // v*S/(K+S) with v=2, K=3, S=3
    EXPECT_DOUBLE_EQ(network->propensity(0, {3.0, 0.0}, {2.0, 3.0}), 1.0);
    // Custom laws are used as-is in both forms.
    EXPECT_DOUBLE_EQ(network->rate(0, {3.0, 0.0}, {2.0, 3.0}), 1.0);
}

TEST(NetworkBuilderTest, NegativeCustomLawFailsAtEvaluation) {
    RateFunction negative = [](const std::vector<double>& s, const std::vector<double>&) { return -s[0]; };
    auto network = NetworkBuilder()
        .addReaction({{{"X", 1}}, {}, RateExpression::custom("neg", negative, {"X"}, {}), ""})
        .build();
    EXPECT_DOUBLE_EQ(network->propensity(0, {0.0}, {}), 0.0);
    EXPECT_THROW(network->propensity(0, {2.0}, {}), ModelException);
}

TEST(NetworkBuilderTest, CustomRateClampsSpeciesButPropensityDoesNot) {
    auto network = NetworkBuilder()
        .addParameters({"v", "K"})
        .addReaction({{{"S", 1}}, {{"P", 1}}, RateExpression::library("mm", {"S"}, {"v", "K"}), ""})
        .build();
    // Solver trial states can dip just below zero.
    EXPECT_DOUBLE_EQ(network->rate(0, {-1e-9, 100.0}, {10.0, 1.0}), 0.0);
    EXPECT_THROW(network->propensity(0, {-1e-9, 100.0}, {10.0, 1.0}), ModelException);

    RateFunction negative = [](const std::vector<double>& s, const std::vector<double>&) { return -s[0]; };
    auto leaky = NetworkBuilder()
        .addReaction({{{"X", 1}}, {}, RateExpression::custom("neg", negative, {"X"}, {}), ""})
        .build();
    EXPECT_THROW(leaky->rate(0, {2.0}, {}), ModelException);
}

TEST(NetworkBuilderTest, RateLawsReportTheirParameters) {
    auto network = NetworkBuilder()
        .addParameters({"v", "K", "n", "k"})
        .addReaction({{}, {{"X", 1}}, RateExpression::library("hillr", {"X"}, {"v", "K", "n"}), ""})
        .addReaction({{{"X", 1}}, {}, RateExpression::massAction("k"), ""})
        .addReaction({{{"X", 1}}, {}, RateExpression::massAction(0.5), ""})
        .build();
    EXPECT_EQ(network->getReaction(0).rate_law->getParameterIndices(), (std::vector<int>{0, 1, 2}));
    EXPECT_EQ(network->getReaction(1).rate_law->getParameterIndices(), (std::vector<int>{3}));
    EXPECT_TRUE(network->getReaction(2).rate_law->getParameterIndices().empty());

    // Only mass-action constants are required to be non-negative.
    EXPECT_NO_THROW(network->validateParameters(parameter_type{1.0, -1.0, 2.0, 0.1}));
    EXPECT_THROW(network->validateParameters(parameter_type{1.0, 1.0, 2.0, -0.1}), ModelException);
}

TEST(NetworkBuilderTest, CustomLawWithoutCallableIsRejected) {
    NetworkBuilder builder;
    builder.addReaction({{{"X", 1}}, {}, RateExpression::custom("empty", RateFunction(), {"X"}, {}), ""});
    EXPECT_THROW(builder.build(), ModelException);
}

TEST(NetworkBuilderTest, ExplicitLabelIsKept) {
    auto network = NetworkBuilder()
        .addReaction({{}, {{"X", 1}}, RateExpression::massAction(1.0), "influx"})
        .build();
    EXPECT_EQ(network->getReaction(0).label, "influx");
}
