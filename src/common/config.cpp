#include "config.h"

#include <cstdlib>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>

#include "logging.h"

namespace runlens {

namespace {

struct EnvironmentKey {
    const char* suffix;
    const char* key;
    bool integer;
};

constexpr EnvironmentKey kEnvironmentKeys[] = {
    {"SERVER_HOST", "server.host", false},
    {"SERVER_PORT", "server.port", true},
    {"REPORTS_FILE", "data.reports_file", false},
    {"LOG_LEVEL", "logging.level", false},
    {"LOG_FILE", "logging.file", false},
    {"JOB_WORKERS", "jobs.workers", true},
};

void MergeNodes(YAML::Node base, const YAML::Node& overlay) {
    for (const auto& kv : overlay) {
        const std::string key = kv.first.as<std::string>();
        YAML::Node existing = base[key];
        if (existing.IsMap() && kv.second.IsMap()) {
            MergeNodes(existing, kv.second);
        } else {
            base[key] = kv.second;
        }
    }
}

}  // namespace

// ============================================================================
// Loading
// ============================================================================

absl::StatusOr<Config> Config::LoadFromFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return absl::NotFoundError(absl::StrCat("Configuration file not found: ", path.string()));
    }
    try {
        Config config;
        config.root_ = YAML::LoadFile(path.string());
        return config;
    } catch (const YAML::Exception& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Cannot parse ", path.string(), ": ", e.what()));
    }
}

absl::StatusOr<Config> Config::LoadFromString(std::string_view yaml_content) {
    try {
        Config config;
        config.root_ = YAML::Load(std::string(yaml_content));
        return config;
    } catch (const YAML::Exception& e) {
        return absl::InvalidArgumentError(absl::StrCat("Cannot parse YAML: ", e.what()));
    }
}

absl::StatusOr<Config> Config::LoadFromEnvironment(std::string_view prefix) {
    Config config;
    for (const auto& entry : kEnvironmentKeys) {
        const std::string name = absl::StrCat(prefix, entry.suffix);
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            continue;
        }
        if (!entry.integer) {
            config.Set(entry.key, std::string(value));
            continue;
        }
        int64_t parsed = 0;
        if (!absl::SimpleAtoi(value, &parsed)) {
            return absl::InvalidArgumentError(
                absl::StrCat(name, " is not an integer: ", value));
        }
        config.Set(entry.key, parsed);
    }
    return config;
}

absl::StatusOr<Config> Config::Load(const std::optional<std::filesystem::path>& path,
                                    std::string_view env_prefix) {
    Config config;
    if (path) {
        auto file_config = LoadFromFile(*path);
        if (!file_config.ok()) {
            return file_config.status();
        }
        config.Merge(*file_config);
    }

    auto env_config = LoadFromEnvironment(env_prefix);
    if (!env_config.ok()) {
        return env_config.status();
    }
    config.Merge(*env_config);
    return config;
}

void Config::Merge(const Config& other) {
    if (other.root_.IsMap()) {
        if (!root_.IsMap()) {
            root_.reset(YAML::Node(YAML::NodeType::Map));
        }
        MergeNodes(root_, other.root_);
    }
}

// ============================================================================
// Lookup
// ============================================================================

std::optional<YAML::Node> Config::GetSection(std::string_view key) const {
    // reset() rebinds the handle; operator= would write through into root_
    YAML::Node current;
    current.reset(root_);
    for (absl::string_view part : absl::StrSplit(key, '.')) {
        if (!current || !current.IsMap()) {
            return std::nullopt;
        }
        const YAML::Node& view = current;
        YAML::Node next = view[std::string(part)];
        current.reset(next);
    }
    if (!current || current.IsNull()) {
        return std::nullopt;
    }
    return current;
}

bool Config::HasKey(std::string_view key) const {
    return GetSection(key).has_value();
}

std::string Config::GetString(std::string_view key, std::string_view default_value) const {
    auto node = GetSection(key);
    if (node && node->IsScalar()) {
        return node->Scalar();
    }
    return std::string(default_value);
}

int64_t Config::GetInt(std::string_view key, int64_t default_value) const {
    auto node = GetSection(key);
    if (!node || !node->IsScalar()) {
        return default_value;
    }
    int64_t value = 0;
    if (!absl::SimpleAtoi(node->Scalar(), &value)) {
        RUNLENS_LOG_WARN("Config key '{}' is not an integer: {}", key, node->Scalar());
        return default_value;
    }
    return value;
}

std::vector<std::string> Config::GetStringList(std::string_view key) const {
    std::vector<std::string> result;
    auto node = GetSection(key);
    if (node && node->IsSequence()) {
        for (const auto& item : *node) {
            if (item.IsScalar()) {
                result.push_back(item.Scalar());
            }
        }
    }
    return result;
}

std::vector<int64_t> Config::GetIntList(std::string_view key) const {
    std::vector<int64_t> result;
    for (const auto& item : GetStringList(key)) {
        int64_t value = 0;
        if (absl::SimpleAtoi(item, &value)) {
            result.push_back(value);
        } else {
            RUNLENS_LOG_WARN("Ignoring non-integer entry '{}' in '{}'", item, key);
        }
    }
    return result;
}

// ============================================================================
// Overrides
// ============================================================================

void Config::Set(std::string_view key, const std::string& value) {
    SetNode(key, YAML::Node(value));
}

void Config::Set(std::string_view key, int64_t value) {
    SetNode(key, YAML::Node(value));
}

void Config::SetNode(std::string_view key, const YAML::Node& value) {
    std::vector<std::string> parts = absl::StrSplit(key, '.');
    if (!root_.IsMap()) {
        root_.reset(YAML::Node(YAML::NodeType::Map));
    }

    YAML::Node current;
    current.reset(root_);
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        YAML::Node child = current[parts[i]];
        if (!child.IsMap()) {
            current[parts[i]] = YAML::Node(YAML::NodeType::Map);
            child.reset(current[parts[i]]);
        }
        current.reset(child);
    }
    current[parts.back()] = value;
}

}  // namespace runlens
