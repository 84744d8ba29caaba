#pragma once

/// @file source_browser.h
/// @brief Static view of a repository's test sources

#include <string>
#include <vector>

#include <absl/status/statusor.h>

#include "model/types.h"

namespace runlens::storage {

/// @brief One test case as written in a source file
struct SourceTestCase {
    std::string name;
    int line_count = 0;               ///< Header line through last body line
    std::vector<std::string> steps;   ///< First cell of every keyword line
    std::vector<std::string> tags;
    std::string documentation;
};

/// @brief A test source file and the cases it declares
struct SourceTestFile {
    std::string path;    ///< Relative to the repository root
    std::string suite;   ///< File stem
    std::vector<SourceTestCase> tests;
};

/// @brief A library and the files importing it
struct LibraryImport {
    std::string library_name;
    std::vector<std::string> files;   ///< Sorted, relative paths
};

/// @brief Source browser interface
class SourceBrowser {
public:
    virtual ~SourceBrowser() = default;

    /// @brief Test files of a repository; unknown repositories yield no files
    virtual absl::StatusOr<std::vector<SourceTestFile>> ListTestFiles(
        RepositoryId repository_id) = 0;

    /// @brief Library imports of a repository, sorted by library name
    virtual absl::StatusOr<std::vector<LibraryImport>> ListLibraryImports(
        RepositoryId repository_id) = 0;
};

}  // namespace runlens::storage
