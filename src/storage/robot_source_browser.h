#pragma once

/// @file robot_source_browser.h
/// @brief Source browser over checked-out .robot / .resource files

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "storage/source_browser.h"

namespace runlens::storage {

/// @brief Repository checkouts to scan
struct RobotSourceConfig {
    /// Repository id -> checkout directory
    std::map<RepositoryId, std::filesystem::path> repositories;

    /// Directory names never descended into
    std::vector<std::string> ignored_dirs = {
        ".git", "__pycache__", ".venv", "node_modules",
        ".tox", ".pytest_cache", ".mypy_cache"};
};

/// @brief Scans Robot Framework sources on disk
///
/// Test cases come from "*** Test Cases ***" sections of .robot files;
/// library imports from "*** Settings ***" sections of .robot and
/// .resource files. A checkout that does not exist yields empty results.
class RobotSourceBrowser : public SourceBrowser {
public:
    explicit RobotSourceBrowser(RobotSourceConfig config);

    absl::StatusOr<std::vector<SourceTestFile>> ListTestFiles(
        RepositoryId repository_id) override;

    absl::StatusOr<std::vector<LibraryImport>> ListLibraryImports(
        RepositoryId repository_id) override;

    /// @brief Parse the test cases of one .robot document
    static std::vector<SourceTestCase> ParseTestCases(std::string_view content);

    /// @brief Library names imported by one document's settings section
    static std::vector<std::string> ParseLibraryImports(std::string_view content);

    /// @brief "libs/Custom.py" -> "Custom"; plain names are returned unchanged
    static std::string NormalizeLibraryName(std::string_view name);

private:
    /// Source files under the checkout with one of the extensions, sorted
    std::vector<std::filesystem::path> CollectFiles(
        const std::filesystem::path& root,
        const std::vector<std::string>& extensions) const;

    RobotSourceConfig config_;
};

}  // namespace runlens::storage
