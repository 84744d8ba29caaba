/// @file robot_source_browser.cpp
/// @brief Robot Framework source scanning implementation

#include "storage/robot_source_browser.h"

#include <algorithm>
#include <fstream>
#include <optional>
#include <regex>
#include <set>
#include <sstream>
#include <system_error>

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/str_split.h>
#include <absl/strings/strip.h>

#include "common/logging.h"

namespace runlens::storage {

namespace fs = std::filesystem;

namespace {

// Robot cells are separated by two or more spaces or by tabs
const std::regex& CellSeparator() {
    static const std::regex kSeparator("  +|\t+");
    return kSeparator;
}

std::vector<std::string> SplitCells(const std::string& line) {
    std::vector<std::string> cells;
    std::sregex_token_iterator it(line.begin(), line.end(), CellSeparator(), -1);
    for (std::sregex_token_iterator end; it != end; ++it) {
        std::string cell(absl::StripAsciiWhitespace(it->str()));
        if (!cell.empty()) {
            cells.push_back(std::move(cell));
        }
    }
    return cells;
}

std::vector<std::string> SplitLines(std::string_view content) {
    std::vector<std::string> lines = absl::StrSplit(content, '\n');
    for (auto& line : lines) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
    }
    // A trailing newline does not start another line
    if (!lines.empty() && lines.back().empty()) {
        lines.pop_back();
    }
    return lines;
}

std::optional<std::string> ReadFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

}  // namespace

RobotSourceBrowser::RobotSourceBrowser(RobotSourceConfig config)
    : config_(std::move(config)) {}

std::vector<SourceTestCase> RobotSourceBrowser::ParseTestCases(std::string_view content) {
    const auto lines = SplitLines(content);
    std::vector<SourceTestCase> tests;
    std::optional<SourceTestCase> current;
    int current_start = 0;
    bool in_test_section = false;

    auto close_current = [&](int last_line) {
        if (current) {
            current->line_count = last_line - current_start + 1;
            tests.push_back(std::move(*current));
            current.reset();
        }
    };

    for (size_t idx = 0; idx < lines.size(); ++idx) {
        const int line_no = static_cast<int>(idx) + 1;
        const std::string& line = lines[idx];
        const std::string stripped(absl::StripAsciiWhitespace(line));

        if (absl::StartsWithIgnoreCase(stripped, "*** test case")) {
            close_current(line_no - 1);
            in_test_section = true;
            continue;
        }
        if (absl::StartsWith(stripped, "***")) {
            close_current(line_no - 1);
            in_test_section = false;
            continue;
        }
        if (!in_test_section || stripped.empty()) {
            continue;
        }

        const bool indented = line[0] == ' ' || line[0] == '\t';
        if (!indented) {
            if (absl::StartsWith(stripped, "#")) {
                continue;
            }
            close_current(line_no - 1);
            current = SourceTestCase{};
            current->name = stripped;
            current_start = line_no;
            continue;
        }

        if (!current || absl::StartsWith(stripped, "#")) {
            continue;
        }
        if (absl::StartsWithIgnoreCase(stripped, "[tags]")) {
            current->tags = SplitCells(std::string(absl::StripAsciiWhitespace(
                absl::string_view(stripped).substr(6))));
        } else if (absl::StartsWithIgnoreCase(stripped, "[documentation]")) {
            current->documentation = std::string(absl::StripAsciiWhitespace(
                absl::string_view(stripped).substr(15)));
        } else if (absl::StartsWith(stripped, "[")) {
            // [Setup], [Teardown], [Template], [Timeout] are not steps
        } else {
            auto cells = SplitCells(stripped);
            if (!cells.empty()) {
                current->steps.push_back(cells.front());
            }
        }
    }
    close_current(static_cast<int>(lines.size()));
    return tests;
}

std::vector<std::string> RobotSourceBrowser::ParseLibraryImports(std::string_view content) {
    std::vector<std::string> libraries;
    bool in_settings = false;
    for (const auto& line : SplitLines(content)) {
        const std::string stripped(absl::StripAsciiWhitespace(line));
        if (absl::StartsWithIgnoreCase(stripped, "*** setting")) {
            in_settings = true;
            continue;
        }
        if (absl::StartsWith(stripped, "***")) {
            in_settings = false;
            continue;
        }
        if (!in_settings || stripped.empty() || absl::StartsWith(stripped, "#")) {
            continue;
        }
        auto cells = SplitCells(stripped);
        if (cells.size() > 1 && absl::AsciiStrToLower(cells[0]) == "library") {
            libraries.push_back(NormalizeLibraryName(cells[1]));
        }
    }
    return libraries;
}

std::string RobotSourceBrowser::NormalizeLibraryName(std::string_view name) {
    const bool path_like = name.find('/') != std::string_view::npos ||
                           name.find('\\') != std::string_view::npos ||
                           absl::EndsWithIgnoreCase(name, ".py");
    if (!path_like) {
        return std::string(name);
    }
    std::string generic(name);
    std::replace(generic.begin(), generic.end(), '\\', '/');
    return fs::path(generic).stem().string();
}

std::vector<fs::path> RobotSourceBrowser::CollectFiles(
    const fs::path& root, const std::vector<std::string>& extensions) const {
    std::vector<fs::path> files;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        RUNLENS_LOG_DEBUG("Source checkout {} does not exist", root.string());
        return files;
    }

    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        RUNLENS_LOG_WARN("Cannot scan {}: {}", root.string(), ec.message());
        return files;
    }

    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            RUNLENS_LOG_WARN("Error while scanning {}: {}", root.string(), ec.message());
            break;
        }
        const auto& entry = *it;
        const std::string name = entry.path().filename().string();
        if (entry.is_directory(ec)) {
            if (std::find(config_.ignored_dirs.begin(), config_.ignored_dirs.end(), name) !=
                config_.ignored_dirs.end()) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        const std::string ext = absl::AsciiStrToLower(entry.path().extension().string());
        if (std::find(extensions.begin(), extensions.end(), ext) != extensions.end()) {
            files.push_back(entry.path());
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

absl::StatusOr<std::vector<SourceTestFile>> RobotSourceBrowser::ListTestFiles(
    RepositoryId repository_id) {
    std::vector<SourceTestFile> out;
    auto repo = config_.repositories.find(repository_id);
    if (repo == config_.repositories.end()) {
        RUNLENS_LOG_DEBUG("No source checkout configured for repository {}", repository_id);
        return out;
    }

    const fs::path& root = repo->second;
    for (const auto& path : CollectFiles(root, {".robot"})) {
        auto content = ReadFile(path);
        if (!content) {
            RUNLENS_LOG_WARN("Skipping unreadable source file {}", path.string());
            continue;
        }
        SourceTestFile file;
        file.path = path.lexically_relative(root).generic_string();
        file.suite = path.stem().string();
        file.tests = ParseTestCases(*content);
        if (!file.tests.empty()) {
            out.push_back(std::move(file));
        }
    }
    return out;
}

absl::StatusOr<std::vector<LibraryImport>> RobotSourceBrowser::ListLibraryImports(
    RepositoryId repository_id) {
    std::vector<LibraryImport> out;
    auto repo = config_.repositories.find(repository_id);
    if (repo == config_.repositories.end()) {
        RUNLENS_LOG_DEBUG("No source checkout configured for repository {}", repository_id);
        return out;
    }

    const fs::path& root = repo->second;
    std::map<std::string, std::set<std::string>> by_library;
    for (const auto& path : CollectFiles(root, {".robot", ".resource"})) {
        auto content = ReadFile(path);
        if (!content) {
            RUNLENS_LOG_WARN("Skipping unreadable source file {}", path.string());
            continue;
        }
        const std::string rel = path.lexically_relative(root).generic_string();
        for (auto& library : ParseLibraryImports(*content)) {
            by_library[std::move(library)].insert(rel);
        }
    }

    for (auto& [name, files] : by_library) {
        out.push_back(LibraryImport{name, std::vector<std::string>(files.begin(), files.end())});
    }
    return out;
}

}  // namespace runlens::storage
