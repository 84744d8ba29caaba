#pragma once

/// @file config.h
/// @brief Layered daemon configuration: YAML file, then environment, then CLI

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>
#include <yaml-cpp/yaml.h>

namespace runlens {

/// @brief Untyped YAML tree addressed with dotted keys ("server.port")
///
/// Getters never fail; a missing key or a scalar of the wrong shape yields
/// the default. Typed validation happens in server::EngineConfig.
///
/// @code
///   auto config = Config::Load("runlens.yaml");
///   int64_t port = config->GetInt("server.port", 8080);
/// @endcode
class Config {
public:
    Config() = default;

    /// @return NotFound for a missing file, InvalidArgument for bad YAML
    static absl::StatusOr<Config> LoadFromFile(const std::filesystem::path& path);

    static absl::StatusOr<Config> LoadFromString(std::string_view yaml_content);

    /// @brief Read the supported <prefix>* variables
    ///
    /// SERVER_HOST, SERVER_PORT, REPORTS_FILE, LOG_LEVEL, LOG_FILE and
    /// JOB_WORKERS. Integer variables that do not parse give InvalidArgument.
    static absl::StatusOr<Config> LoadFromEnvironment(std::string_view prefix = "RUNLENS_");

    /// @brief Optional file overlaid by the environment
    static absl::StatusOr<Config> Load(const std::optional<std::filesystem::path>& path,
                                       std::string_view env_prefix = "RUNLENS_");

    /// @brief Deep-merge maps from @p other; its scalars and lists replace ours
    void Merge(const Config& other);

    std::string GetString(std::string_view key, std::string_view default_value = "") const;
    int64_t GetInt(std::string_view key, int64_t default_value = 0) const;

    /// @brief Scalar entries of a list, empty if the key is missing
    std::vector<std::string> GetStringList(std::string_view key) const;

    /// @brief Integer entries of a list; others are skipped with a warning
    std::vector<int64_t> GetIntList(std::string_view key) const;

    bool HasKey(std::string_view key) const;

    /// @brief Node at @p key, for sections with a nested shape
    std::optional<YAML::Node> GetSection(std::string_view key) const;

    /// @brief Overwrite a scalar, creating intermediate maps
    void Set(std::string_view key, const std::string& value);
    void Set(std::string_view key, int64_t value);

private:
    void SetNode(std::string_view key, const YAML::Node& value);

    YAML::Node root_;
};

}  // namespace runlens
