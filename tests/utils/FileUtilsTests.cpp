#include "utils/FileUtils.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

// Runs each test inside a scratch project tree (data/, include/, src/).
class FileUtilsFixture : public ::testing::Test {
protected:
    fs::path original_cwd;
    fs::path projectDir;

    void SetUp() override {
        original_cwd = fs::current_path();
        projectDir = fs::temp_directory_path() / "crn_fileutils_test";
        fs::remove_all(projectDir);
        fs::create_directories(projectDir / "data");
        fs::create_directory(projectDir / "include");
        fs::create_directory(projectDir / "src");
        fs::current_path(projectDir);
    }

    void TearDown() override {
        fs::current_path(original_cwd);
        fs::remove_all(projectDir);
    }

    std::string expectedRoot() const {
        return fs::absolute(projectDir).lexically_normal().string();
    }
};

TEST(FileUtilsTest, JoinPaths) {
    EXPECT_EQ(FileUtils::joinPaths("networks", "birth_death.crn"), "networks/birth_death.crn");
    EXPECT_EQ(FileUtils::joinPaths("/", "tmp/run"), "/tmp/run");
    EXPECT_EQ(FileUtils::joinPaths("data/output/", "crn_ode.csv"), "data/output/crn_ode.csv");
    EXPECT_EQ(FileUtils::joinPaths("data", "/config"), "data/config");
    EXPECT_EQ(FileUtils::joinPaths("", "settings.txt"), "settings.txt");
    EXPECT_EQ(FileUtils::joinPaths("data", ""), "data");
    EXPECT_EQ(FileUtils::joinPaths("data/./config", "../networks"), "data/networks");
}

TEST(FileUtilsTest, ResolveRelativeTo) {
    EXPECT_EQ(FileUtils::resolveRelativeTo("data/config/settings.txt", "../networks/a.crn"), "data/networks/a.crn");
    EXPECT_EQ(FileUtils::resolveRelativeTo("data/config/settings.txt", "a.crn"), "data/config/a.crn");
    EXPECT_EQ(FileUtils::resolveRelativeTo("data/config/settings.txt", "/opt/a.crn"), "/opt/a.crn");
    EXPECT_EQ(FileUtils::resolveRelativeTo("settings.txt", "a.crn"), "a.crn");
}

TEST(FileUtilsTest, Trim) {
    EXPECT_EQ(FileUtils::trim("  X -> Y \t\r"), "X -> Y");
    EXPECT_EQ(FileUtils::trim("plain"), "plain");
    EXPECT_EQ(FileUtils::trim(" \t "), "");
    EXPECT_EQ(FileUtils::trim(""), "");
}

TEST_F(FileUtilsFixture, EnsureDirectoryExists) {
    ASSERT_FALSE(fs::exists("runs"));
    EXPECT_TRUE(FileUtils::ensureDirectoryExists("runs"));
    EXPECT_TRUE(fs::is_directory("runs"));

    EXPECT_TRUE(FileUtils::ensureDirectoryExists("data"));

    EXPECT_TRUE(FileUtils::ensureDirectoryExists("runs/ssa/seed_1"));
    EXPECT_TRUE(fs::is_directory("runs/ssa/seed_1"));
}

TEST_F(FileUtilsFixture, GetOutputPath) {
    const std::string outputDir = FileUtils::joinPaths(expectedRoot(), "data/output");
    ASSERT_FALSE(fs::exists(outputDir));

    EXPECT_EQ(FileUtils::getOutputPath(), outputDir);
    EXPECT_TRUE(fs::is_directory(outputDir));
    EXPECT_EQ(FileUtils::getOutputPath("crn_ssa_stats.csv"), FileUtils::joinPaths(outputDir, "crn_ssa_stats.csv"));
}

TEST_F(FileUtilsFixture, GetProjectRootFromNestedDirectory) {
    fs::create_directories(projectDir / "src/simulation/solvers");
    fs::current_path(projectDir / "src/simulation/solvers");
    EXPECT_EQ(FileUtils::getProjectRoot(), expectedRoot());
}

TEST_F(FileUtilsFixture, GetProjectRootFallsBackToWorkingDirectory) {
    const fs::path isolated = fs::temp_directory_path() / "crn_fileutils_no_project" / "work";
    fs::remove_all(isolated.parent_path());
    fs::create_directories(isolated);
    fs::current_path(isolated);

    EXPECT_EQ(FileUtils::getProjectRoot(), fs::absolute(isolated).lexically_normal().string());

    fs::current_path(original_cwd);
    fs::remove_all(isolated.parent_path());
}
