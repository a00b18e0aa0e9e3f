#include "gtest/gtest.h"
#include "simulation/TrajectoryProcessor.hpp"
#include "exceptions/Exceptions.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace crn;
namespace fs = std::filesystem;

class TrajectoryProcessorTest : public ::testing::Test {
protected:
    Trajectory trajectory;
    fs::path outputDir;

    void SetUp() override {
        trajectory.time_points = {0.0, 0.5, 1.0};
        trajectory.species_names = {"mRNA", "protein"};
        trajectory.solution = {{0.0, 0.0}, {3.0, 10.0}, {5.0, 40.0}};
        outputDir = fs::temp_directory_path() / "crn_processor_test";
        fs::remove_all(outputDir);
        fs::create_directories(outputDir);
    }

    void TearDown() override {
        fs::remove_all(outputDir);
    }

    std::vector<std::string> readLines(const fs::path& file) {
        std::ifstream in(file);
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(in, line)) lines.push_back(line);
        return lines;
    }
};

TEST_F(TrajectoryProcessorTest, GetSpeciesData) {
    Eigen::VectorXd protein = TrajectoryProcessor::getSpeciesData(trajectory, "protein");
    ASSERT_EQ(protein.size(), 3);
    EXPECT_DOUBLE_EQ(protein(2), 40.0);
    EXPECT_THROW(TrajectoryProcessor::getSpeciesData(trajectory, "dimer"), InvalidParameterException);
    EXPECT_THROW(TrajectoryProcessor::getSpeciesData(Trajectory(), "protein"), InvalidResultException);
}

TEST_F(TrajectoryProcessorTest, ToMatrix) {
    Eigen::MatrixXd m = TrajectoryProcessor::toMatrix(trajectory);
    ASSERT_EQ(m.rows(), 3);
    ASSERT_EQ(m.cols(), 2);
    EXPECT_DOUBLE_EQ(m(1, 0), 3.0);
    EXPECT_DOUBLE_EQ(m(2, 1), 40.0);
}

TEST_F(TrajectoryProcessorTest, RelativeDeviationUsesFloor) {
    Trajectory candidate = trajectory;
    candidate.solution = {{0.5, 0.0}, {3.3, 8.0}, {5.0, 44.0}};

    Eigen::MatrixXd deviation = TrajectoryProcessor::relativeDeviation(trajectory, candidate);
    EXPECT_DOUBLE_EQ(deviation(0, 0), 0.5);
    EXPECT_NEAR(deviation(1, 0), 0.1, 1e-12);
    EXPECT_DOUBLE_EQ(deviation(1, 1), 0.2);
    EXPECT_DOUBLE_EQ(deviation(2, 1), 0.1);

    Eigen::MatrixXd floored = TrajectoryProcessor::relativeDeviation(trajectory, candidate, 10.0);
    EXPECT_DOUBLE_EQ(floored(0, 0), 0.05);

    EXPECT_THROW(TrajectoryProcessor::relativeDeviation(trajectory, candidate, 0.0), InvalidParameterException);

    Trajectory shifted = candidate;
    shifted.time_points[1] = 0.6;
    EXPECT_THROW(TrajectoryProcessor::relativeDeviation(trajectory, shifted), InvalidResultException);

    Trajectory renamed = candidate;
    renamed.species_names = {"mRNA", "P"};
    EXPECT_THROW(TrajectoryProcessor::relativeDeviation(trajectory, renamed), InvalidResultException);
}

TEST_F(TrajectoryProcessorTest, SaveTrajectoryToCSV) {
    const fs::path file = outputDir / "trajectory.csv";
    TrajectoryProcessor::saveTrajectoryToCSV(trajectory, file.string());

    std::vector<std::string> lines = readLines(file);
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "Time,mRNA,protein");
    EXPECT_EQ(lines[2], "0.5,3,10");

    EXPECT_THROW(TrajectoryProcessor::saveTrajectoryToCSV(Trajectory(), file.string()), InvalidResultException);
    EXPECT_THROW(TrajectoryProcessor::saveTrajectoryToCSV(trajectory, (outputDir / "missing" / "x.csv").string()),
                 FileIOException);
}

TEST_F(TrajectoryProcessorTest, SaveStatisticsToCSV) {
    EnsembleStatistics stats;
    stats.time_points = {0.0, 1.0};
    stats.species_names = {"X"};
    stats.num_trajectories = 4;
    stats.mean = Eigen::MatrixXd::Constant(2, 1, 2.5);
    stats.median = Eigen::MatrixXd::Constant(2, 1, 2.0);
    stats.p05 = Eigen::MatrixXd::Constant(2, 1, 1.0);
    stats.p95 = Eigen::MatrixXd::Constant(2, 1, 4.0);
    stats.mean(1, 0) = 100.0 / 3.0;

    const fs::path file = outputDir / "stats.csv";
    TrajectoryProcessor::saveStatisticsToCSV(stats, file.string());
    std::vector<std::string> lines = readLines(file);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "Time,X_mean,X_median,X_p05,X_p95");
    EXPECT_EQ(lines[1], "0,2.5,2,1,4");

    // Written with full precision, like trajectories.
    const size_t first = lines[2].find(',');
    const size_t second = lines[2].find(',', first + 1);
    ASSERT_NE(second, std::string::npos);
    EXPECT_EQ(std::stod(lines[2].substr(first + 1, second - first - 1)), 100.0 / 3.0);

    stats.p95.resize(1, 1);
    EXPECT_THROW(TrajectoryProcessor::saveStatisticsToCSV(stats, file.string()), InvalidResultException);
}
