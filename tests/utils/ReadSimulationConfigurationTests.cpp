#include "utils/ReadSimulationConfiguration.hpp"
#include "exceptions/Exceptions.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

class ReadSimulationConfigurationTest : public ::testing::Test {
protected:
    fs::path testDir;

    void SetUp() override {
        testDir = fs::temp_directory_path() / "crn_settings_test";
        fs::remove_all(testDir);
        fs::create_directories(testDir / "config");
    }

    void TearDown() override {
        fs::remove_all(testDir);
    }

    std::string writeSettings(const std::string& content) {
        const fs::path file = testDir / "config" / "settings.txt";
        std::ofstream out(file);
        out << content;
        return file.string();
    }
};

TEST_F(ReadSimulationConfigurationTest, ReadSettingsFileSkipsCommentsAndBlankLines) {
    const std::string file = writeSettings(
        "# comment\n"
        "\n"
        "   method   ssa   # trailing comment\n"
        "\tseed\t42\n");
    auto raw = readSettingsFile(file);
    ASSERT_EQ(raw.size(), 2u);
    EXPECT_EQ(raw["method"], "ssa");
    EXPECT_EQ(raw["seed"], "42");
}

TEST_F(ReadSimulationConfigurationTest, ReadSettingsFileErrors) {
    EXPECT_THROW(readSettingsFile((testDir / "missing.txt").string()), crn::FileIOException);
    EXPECT_THROW(readSettingsFile(writeSettings("method\n")), crn::DataFormatException);
    EXPECT_THROW(readSettingsFile(writeSettings("method ssa ode\n")), crn::DataFormatException);
}

TEST_F(ReadSimulationConfigurationTest, DefaultsApplyForMissingKeys) {
    crn::SimulationSettings settings = readSimulationSettings(writeSettings("t_end 50\n"));
    EXPECT_DOUBLE_EQ(settings.t_start, 0.0);
    EXPECT_DOUBLE_EQ(settings.t_end, 50.0);
    EXPECT_EQ(settings.num_checkpoints, 101);
    EXPECT_EQ(settings.method, "all");
    EXPECT_TRUE(settings.runsSsa());
    EXPECT_TRUE(settings.runsTauLeaping());
    EXPECT_TRUE(settings.runsOde());
    EXPECT_EQ(settings.ode_solver, "dopri5");
    EXPECT_TRUE(settings.parallel);
    EXPECT_EQ(settings.seed, 0u);
}

TEST_F(ReadSimulationConfigurationTest, ParsesAllKeys) {
    const std::string file = writeSettings(
        "network_file ../networks/birth_death.crn\n"
        "t_start 1\n"
        "t_end 11\n"
        "num_checkpoints 6\n"
        "method tau_leaping\n"
        "num_trajectories 25\n"
        "seed 7\n"
        "tau_step 0.05\n"
        "ode_solver fehlberg78\n"
        "abs_error 1e-9\n"
        "rel_error 1e-7\n"
        "dt_hint 0.001\n"
        "parallel off\n"
        "log_level debug\n"
        "log_file run.log\n"
        "output_prefix bd\n");
    crn::SimulationSettings settings = readSimulationSettings(file);

    EXPECT_EQ(settings.network_file, (testDir / "networks" / "birth_death.crn").lexically_normal().string());
    EXPECT_DOUBLE_EQ(settings.t_start, 1.0);
    EXPECT_DOUBLE_EQ(settings.t_end, 11.0);
    EXPECT_EQ(settings.num_checkpoints, 6);
    EXPECT_FALSE(settings.runsSsa());
    EXPECT_TRUE(settings.runsTauLeaping());
    EXPECT_FALSE(settings.runsOde());
    EXPECT_EQ(settings.num_trajectories, 25);
    EXPECT_EQ(settings.seed, 7u);
    EXPECT_DOUBLE_EQ(settings.tau_step, 0.05);
    EXPECT_EQ(settings.ode_solver, "fehlberg78");
    EXPECT_DOUBLE_EQ(settings.abs_error, 1e-9);
    EXPECT_DOUBLE_EQ(settings.rel_error, 1e-7);
    EXPECT_DOUBLE_EQ(settings.dt_hint, 0.001);
    EXPECT_FALSE(settings.parallel);
    EXPECT_EQ(settings.log_level, "debug");
    EXPECT_EQ(settings.log_file, "run.log");
    EXPECT_EQ(settings.output_prefix, "bd");
}

TEST_F(ReadSimulationConfigurationTest, UnknownKeyIsIgnored) {
    crn::SimulationSettings settings;
    EXPECT_NO_THROW(settings = readSimulationSettings(writeSettings("colour blue\nmethod ode\n")));
    EXPECT_EQ(settings.method, "ode");
}

TEST_F(ReadSimulationConfigurationTest, RejectsBadValues) {
    const char* invalid[] = {
        "t_end abc\n",
        "num_checkpoints 2.5\n",
        "seed -3\n",
        "parallel maybe\n",
        "t_start 10\nt_end 5\n",
        "num_checkpoints 1\n",
        "num_trajectories 0\n",
        "tau_step 0\n",
        "dt_hint -0.1\n",
        "abs_error -1\n",
        "method gillespie\n",
        "ode_solver euler\n",
        "log_level loud\n",
    };
    for (const char* content : invalid) {
        SCOPED_TRACE(content);
        EXPECT_THROW(readSimulationSettings(writeSettings(content)), crn::DataFormatException);
    }
}

TEST(ValidateSimulationSettingsTest, DefaultsAreValid) {
    crn::SimulationSettings settings;
    EXPECT_NO_THROW(validateSimulationSettings(settings));
    settings.output_prefix.clear();
    EXPECT_THROW(validateSimulationSettings(settings), crn::DataFormatException);
}
