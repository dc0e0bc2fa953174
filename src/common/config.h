#pragma once

/// @file config.h
/// @brief Layered YAML configuration for the validator and its tooling

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include "common/error.h"

namespace promptguard {

/// @brief Scalar that can be stored with Config::Set
using ConfigValue = std::variant<bool, int64_t, double, std::string>;

/// @brief Key/value configuration backed by a YAML tree
///
/// Keys use dot notation ("validator.max_length"). Layers are combined with
/// Merge(); later layers win. The Get* accessors are lenient and return the
/// default for missing or mistyped keys. Read() is strict and reports a
/// mistyped key as a ConfigurationError.
class Config {
public:
    Config() = default;

    static absl::StatusOr<Config> LoadFromFile(const std::filesystem::path& path);
    static absl::StatusOr<Config> LoadFromString(std::string_view yaml_content);

    /// @brief Read the recognised settings from environment variables
    ///
    /// <prefix>MAX_LENGTH -> validator.max_length,
    /// <prefix>STRICT_MODE -> validator.strict_mode,
    /// <prefix>LOG_LEVEL -> logging.level.
    /// Values that fail to parse are reported as ConfigurationError.
    static absl::StatusOr<Config> LoadFromEnvironment(std::string_view prefix = "PROMPTGUARD_");

    /// @brief Optional file layer overlaid with the environment layer
    static absl::StatusOr<Config> LoadLayered(
        const std::optional<std::filesystem::path>& path,
        std::string_view env_prefix = "PROMPTGUARD_");

    /// @brief Overlay another configuration (other takes precedence)
    void Merge(const Config& other);

    std::string GetString(std::string_view key, std::string_view default_value = "") const;
    int64_t GetInt(std::string_view key, int64_t default_value = 0) const;
    double GetDouble(std::string_view key, double default_value = 0.0) const;
    bool GetBool(std::string_view key, bool default_value = false) const;

    /// @brief Strict typed lookup
    /// @return default_value if the key is absent, ConfigurationError if it
    ///         is present but not convertible to T
    template <typename T>
    absl::StatusOr<T> Read(std::string_view key, T default_value) const {
        auto node = GetNestedNode(key);
        if (!node) {
            return default_value;
        }
        if (!node->IsScalar()) {
            return ConfigurationError(absl::StrCat(std::string(key), " must be a scalar"));
        }
        try {
            return node->as<T>();
        } catch (const YAML::Exception&) {
            return ConfigurationError(
                absl::StrCat(std::string(key), " has an invalid value: ", node->Scalar()));
        }
    }

    bool HasKey(std::string_view key) const;

    /// @brief Set a value, creating intermediate maps
    void Set(std::string_view key, ConfigValue value);

    /// @brief The whole tree as JSON, with scalars typed where they parse
    nlohmann::json ToJson() const;

private:
    YAML::Node root_;

    std::optional<YAML::Node> GetNestedNode(std::string_view key) const;
};

}  // namespace promptguard
