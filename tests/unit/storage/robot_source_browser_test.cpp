/// @file robot_source_browser_test.cpp
/// @brief Tests for Robot Framework source parsing and scanning

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "storage/robot_source_browser.h"

namespace runlens::storage {
namespace {

namespace fs = std::filesystem;

constexpr const char* kLoginSuite =
    "*** Settings ***\n"
    "Library    SeleniumLibrary\n"
    "Library    libs/CustomKeywords.py\n"
    "Resource   common.resource\n"
    "\n"
    "*** Test Cases ***\n"
    "Valid Login\n"
    "    [Documentation]    Logs in with valid credentials\n"
    "    [Tags]    smoke    auth\n"
    "    Open Browser    ${URL}    chrome\n"
    "    Input Text    id=user    demo\n"
    "    Page Should Contain    Welcome\n"
    "\n"
    "# a comment between tests\n"
    "Invalid Login\n"
    "    [Setup]    Reset Session\n"
    "    Open Browser    ${URL}    chrome\n"
    "    Page Should Contain    Error\n"
    "\n"
    "*** Keywords ***\n"
    "Reset Session\n"
    "    Delete All Cookies\n";

TEST(RobotSourceBrowserTest, ParsesTestCases) {
    auto tests = RobotSourceBrowser::ParseTestCases(kLoginSuite);
    ASSERT_EQ(tests.size(), 2u);

    EXPECT_EQ(tests[0].name, "Valid Login");
    EXPECT_EQ(tests[0].documentation, "Logs in with valid credentials");
    EXPECT_EQ(tests[0].tags, (std::vector<std::string>{"smoke", "auth"}));
    EXPECT_EQ(tests[0].steps,
              (std::vector<std::string>{"Open Browser", "Input Text", "Page Should Contain"}));
    // Runs up to the line before "Invalid Login"
    EXPECT_EQ(tests[0].line_count, 8);

    EXPECT_EQ(tests[1].name, "Invalid Login");
    EXPECT_EQ(tests[1].steps,
              (std::vector<std::string>{"Open Browser", "Page Should Contain"}));
    EXPECT_EQ(tests[1].line_count, 5);
}

TEST(RobotSourceBrowserTest, KeywordsSectionIsNotTests) {
    auto tests = RobotSourceBrowser::ParseTestCases(
        "*** Keywords ***\nHelper\n    Log    hi\n");
    EXPECT_TRUE(tests.empty());
}

TEST(RobotSourceBrowserTest, ParsesLibraryImports) {
    auto libraries = RobotSourceBrowser::ParseLibraryImports(kLoginSuite);
    EXPECT_EQ(libraries, (std::vector<std::string>{"SeleniumLibrary", "CustomKeywords"}));
}

TEST(RobotSourceBrowserTest, NormalizesPathLikeLibraries) {
    EXPECT_EQ(RobotSourceBrowser::NormalizeLibraryName("Collections"), "Collections");
    EXPECT_EQ(RobotSourceBrowser::NormalizeLibraryName("libs/Custom.py"), "Custom");
    EXPECT_EQ(RobotSourceBrowser::NormalizeLibraryName("libs\\win\\Helpers.py"), "Helpers");
    EXPECT_EQ(RobotSourceBrowser::NormalizeLibraryName("Keywords.py"), "Keywords");
}

class RobotSourceScanTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() / "runlens_source_scan_test";
        fs::remove_all(root_);
        fs::create_directories(root_ / "suites");
        fs::create_directories(root_ / ".git");
        Write(root_ / "suites" / "login.robot", kLoginSuite);
        Write(root_ / "common.resource", "*** Settings ***\nLibrary    Collections\n");
        Write(root_ / ".git" / "ignored.robot", kLoginSuite);
        Write(root_ / "notes.txt", kLoginSuite);
    }

    void TearDown() override { fs::remove_all(root_); }

    static void Write(const fs::path& path, const std::string& content) {
        std::ofstream out(path);
        out << content;
    }

    RobotSourceBrowser MakeBrowser() {
        RobotSourceConfig config;
        config.repositories[1] = root_;
        config.repositories[2] = root_ / "missing";
        return RobotSourceBrowser(config);
    }

    fs::path root_;
};

TEST_F(RobotSourceScanTest, ListsTestFiles) {
    auto browser = MakeBrowser();
    auto files = browser.ListTestFiles(1);
    ASSERT_TRUE(files.ok());
    ASSERT_EQ(files->size(), 1u);
    EXPECT_EQ((*files)[0].path, "suites/login.robot");
    EXPECT_EQ((*files)[0].suite, "login");
    EXPECT_EQ((*files)[0].tests.size(), 2u);
}

TEST_F(RobotSourceScanTest, ListsLibraryImportsAcrossFiles) {
    auto browser = MakeBrowser();
    auto imports = browser.ListLibraryImports(1);
    ASSERT_TRUE(imports.ok());
    ASSERT_EQ(imports->size(), 3u);
    EXPECT_EQ((*imports)[0].library_name, "Collections");
    EXPECT_EQ((*imports)[0].files, (std::vector<std::string>{"common.resource"}));
    EXPECT_EQ((*imports)[2].library_name, "SeleniumLibrary");
}

TEST_F(RobotSourceScanTest, UnknownOrMissingCheckoutIsEmpty) {
    auto browser = MakeBrowser();
    auto missing = browser.ListTestFiles(2);
    ASSERT_TRUE(missing.ok());
    EXPECT_TRUE(missing->empty());

    auto unknown = browser.ListLibraryImports(99);
    ASSERT_TRUE(unknown.ok());
    EXPECT_TRUE(unknown->empty());
}

}  // namespace
}  // namespace runlens::storage
