#include "gtest/gtest.h"
#include "network/RateFunctions.hpp"
#include "network/ReactionClause.hpp"
#include "exceptions/Exceptions.hpp"

using namespace crn;

TEST(RateFunctionsTest, HillRepression) {
    EXPECT_DOUBLE_EQ(RateFunctions::hillRepression(0.0, 10.0, 5.0, 2.0), 10.0);
    EXPECT_DOUBLE_EQ(RateFunctions::hillRepression(5.0, 10.0, 5.0, 2.0), 5.0);
    EXPECT_NEAR(RateFunctions::hillRepression(1e6, 10.0, 5.0, 2.0), 0.0, 1e-6);
}

TEST(RateFunctionsTest, HillActivation) {
    EXPECT_DOUBLE_EQ(RateFunctions::hillActivation(0.0, 10.0, 5.0, 2.0), 0.0);
    EXPECT_DOUBLE_EQ(RateFunctions::hillActivation(5.0, 10.0, 5.0, 2.0), 5.0);
    EXPECT_DOUBLE_EQ(RateFunctions::hillActivation(10.0, 10.0, 10.0, 1.0)
                     + RateFunctions::hillRepression(10.0, 10.0, 10.0, 1.0), 10.0);
}

TEST(RateFunctionsTest, MichaelisMenten) {
    EXPECT_DOUBLE_EQ(RateFunctions::michaelisMenten(0.0, 4.0, 2.0), 0.0);
    EXPECT_DOUBLE_EQ(RateFunctions::michaelisMenten(2.0, 4.0, 2.0), 2.0);
    // Degenerate denominator yields zero rather than NaN.
    EXPECT_DOUBLE_EQ(RateFunctions::michaelisMenten(0.0, 4.0, 0.0), 0.0);
}

TEST(RateFunctionsTest, LookupReturnsArity) {
    RateFunctionDefinition hillr = RateFunctions::lookup("hillr");
    EXPECT_EQ(hillr.num_species, 1);
    EXPECT_EQ(hillr.num_parameters, 3);
    EXPECT_DOUBLE_EQ(hillr.function({5.0}, {10.0, 5.0, 2.0}), 5.0);

    RateFunctionDefinition mm = RateFunctions::lookup("mm");
    EXPECT_EQ(mm.num_parameters, 2);

    EXPECT_TRUE(RateFunctions::contains("hill"));
    EXPECT_FALSE(RateFunctions::contains("exp"));
    EXPECT_THROW(RateFunctions::lookup("exp"), ModelException);
}

TEST(RateFunctionsTest, LibraryExpressionChecksArity) {
    EXPECT_THROW(RateExpression::library("mm", {"S"}, {"v", "K", "n"}), ModelException);
    EXPECT_THROW(RateExpression::library("hillr", {}, {"v", "K", "n"}), ModelException);

    RateExpression expr = RateExpression::library("mm", {"S"}, {"v", "K"});
    EXPECT_EQ(expr.kind, RateExpression::Kind::Custom);
    EXPECT_EQ(expr.toString(), "mm(S; v, K)");
}

TEST(RateFunctionsTest, MassActionToString) {
    EXPECT_EQ(RateExpression::massAction("k1").toString(), "k1");
    EXPECT_EQ(RateExpression::massAction(0.5).toString(), "0.5");
}
