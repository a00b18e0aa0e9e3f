#include "gtest/gtest.h"
#include "simulation/TauLeapingSimulator.hpp"
#include "simulation/DirectMethodSimulator.hpp"
#include "simulation/EnsembleRunner.hpp"
#include "network/NetworkBuilder.hpp"
#include "network/NetworkFactory.hpp"
#include "utils/TimeGrid.hpp"
#include "exceptions/Exceptions.hpp"
#include <cmath>
#include <limits>
#include <memory>
#include <vector>

using namespace crn;

class TauLeapingSimulatorTest : public ::testing::Test {
protected:
    std::shared_ptr<const ReactionNetwork> production;
    Eigen::VectorXd production_rate;

    void SetUp() override {
        production = NetworkFactory::createProductionNetwork();
        production_rate = Eigen::VectorXd::Constant(1, 5.0);
    }
};

TEST_F(TauLeapingSimulatorTest, LastLeapIsShortenedToHorizon) {
    TauLeapingSimulator simulator(production, 0.0, 1.0, 0.3);
    RandomStream rng(17);
    Trajectory result = simulator.run(Eigen::VectorXd::Zero(1), production_rate, {}, rng);

    ASSERT_EQ(result.time_points.size(), 5u);
    EXPECT_EQ(result.event_count, 4);
    EXPECT_DOUBLE_EQ(result.time_points[1], 0.3);
    EXPECT_DOUBLE_EQ(result.time_points[2], 0.6);
    EXPECT_DOUBLE_EQ(result.time_points[3], 0.9);
    EXPECT_EQ(result.time_points[4], 1.0);
}

TEST_F(TauLeapingSimulatorTest, StepBoundaryWithinRoundingOfHorizonIsSnapped) {
    // Boundaries are start + k * tau, so ten leaps of 0.1 end exactly on the horizon.
    TauLeapingSimulator simulator(production, 0.0, 1.0, 0.1);
    RandomStream rng(17);
    Trajectory result = simulator.run(Eigen::VectorXd::Zero(1), production_rate, {}, rng);
    EXPECT_EQ(result.event_count, 10);
    EXPECT_EQ(result.time_points.back(), 1.0);
}

TEST_F(TauLeapingSimulatorTest, CheckpointGridIsRespected) {
    TauLeapingSimulator simulator(production, 0.0, 10.0, 0.25);
    const std::vector<double> checkpoints = TimeGrid::linspace(0.0, 10.0, 7);
    RandomStream rng(23);
    Trajectory result = simulator.run(Eigen::VectorXd::Zero(1), production_rate, checkpoints, rng);

    ASSERT_EQ(result.time_points, checkpoints);
    EXPECT_EQ(result.solution.front()[0], 0.0);
    for (size_t k = 1; k < result.solution.size(); ++k) {
        EXPECT_GE(result.solution[k][0], result.solution[k - 1][0]);
        EXPECT_EQ(result.solution[k][0], std::floor(result.solution[k][0]));
    }
}

TEST_F(TauLeapingSimulatorTest, ExactForPureProduction) {
    TauLeapingSimulator simulator(production, 0.0, 10.0, 0.5);
    const int runs = 2000;
    double sum = 0.0;
    for (int i = 0; i < runs; ++i) {
        RandomStream rng(500 + static_cast<unsigned long>(i));
        sum += simulator.run(Eigen::VectorXd::Zero(1), production_rate, {10.0}, rng).solution.back()[0];
    }
    EXPECT_NEAR(sum / runs, 50.0, 1.0);
}

TEST_F(TauLeapingSimulatorTest, OvershootingLeapFails) {
    auto decay = NetworkBuilder()
        .addParameter("d")
        .addReaction({{{"X", 1}}, {}, RateExpression::massAction("d"), ""})
        .build();
    TauLeapingSimulator simulator(decay, 0.0, 10.0, 10.0);
    RandomStream rng(8);
    // One leap with Poisson mean 50 against a single molecule.
    EXPECT_THROW(simulator.run(Eigen::VectorXd::Ones(1), Eigen::VectorXd::Constant(1, 5.0), {}, rng),
                 SimulationException);
}

TEST_F(TauLeapingSimulatorTest, AgreesWithDirectMethodForBirthDeath) {
    auto network = NetworkFactory::createBirthDeathNetwork();
    Eigen::VectorXd params(2);
    params << 10.0, 0.1;
    const Eigen::VectorXd initial = Eigen::VectorXd::Constant(1, 20.0);
    const std::vector<double> checkpoints = TimeGrid::linspace(0.0, 100.0, 5);

    auto tau = std::make_shared<TauLeapingSimulator>(network, 0.0, 100.0, 0.1);
    auto ssa = std::make_shared<DirectMethodSimulator>(network, 0.0, 100.0);
    Trajectory tau_mean = EnsembleRunner::computeMean(EnsembleRunner(tau, 500, 1).run(initial, params, checkpoints));
    Trajectory ssa_mean = EnsembleRunner::computeMean(EnsembleRunner(ssa, 500, 100001).run(initial, params, checkpoints));

    for (size_t k = 1; k < checkpoints.size(); ++k) {
        EXPECT_NEAR(tau_mean.solution[k][0], ssa_mean.solution[k][0], 0.05 * ssa_mean.solution[k][0])
            << "t = " << checkpoints[k];
    }
    EXPECT_NEAR(tau_mean.solution.back()[0], 100.0, 3.0);
}

TEST_F(TauLeapingSimulatorTest, ConstructorValidation) {
    EXPECT_THROW(TauLeapingSimulator(production, 0.0, 1.0, 0.0), InvalidParameterException);
    EXPECT_THROW(TauLeapingSimulator(production, 0.0, 1.0, -0.1), InvalidParameterException);
    EXPECT_THROW(TauLeapingSimulator(production, 0.0, 1.0, std::numeric_limits<double>::infinity()),
                 InvalidParameterException);
    EXPECT_THROW(TauLeapingSimulator(production, 2.0, 1.0, 0.1), InvalidParameterException);

    TauLeapingSimulator simulator(production, 0.0, 1.0, 0.1);
    EXPECT_EQ(simulator.getName(), "tau_leaping");
    EXPECT_DOUBLE_EQ(simulator.getTauStep(), 0.1);
}
