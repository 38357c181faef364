#pragma once

/// @file config_manager.hpp
/// @brief Flattened view of a gw YAML config file.

#include <filesystem>
#include <initializer_list>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "gw/foundation/game_result.hpp"

namespace gw::foundation {

/// Dotted-key access to a YAML document such as config/gw.yaml.
///
/// Sections nest one level (`simulation`, `missile`, `mapgen`) and every
/// leaf is stored under its full key, e.g. "missile.max_velocity".
/// Loading replaces the previous contents; nothing is merged.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load a YAML file.
    /// @return Success or ConfigLoadFailed.
    GameResult<void> load(const std::filesystem::path& path);

    /// Load an in-memory YAML document.
    /// @return Success or ConfigLoadFailed.
    GameResult<void> loadFromString(std::string_view yaml);

    /// Typed value at @p key.
    /// @return The value, ConfigKeyNotFound or ConfigTypeMismatch.
    template <typename T>
    GameResult<T> get(std::string_view key) const;

    /// Override a single key, e.g. from a command-line flag.
    template <typename T>
    void set(std::string_view key, const T& value) {
        entries_[std::string(key)] = YAML::Node(value);
    }

    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// Loaded keys that are not in @p known, sorted.
    [[nodiscard]] std::vector<std::string> unrecognizedKeys(
        std::initializer_list<std::string_view> known) const;

    /// Where the current entries came from: a file path, "<string>", or
    /// empty when nothing was loaded.
    [[nodiscard]] const std::string& source() const noexcept { return source_; }

private:
    void replaceEntries(const YAML::Node& root);
    void flatten(const std::string& prefix, const YAML::Node& node);

    std::unordered_map<std::string, YAML::Node> entries_;
    std::string source_;
};

template <typename T>
GameResult<T> ConfigManager::get(std::string_view key) const {
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return GameResult<T>::err(GameError(ErrorCode::ConfigKeyNotFound,
                                            "no such key: " + std::string(key)));
    }
    try {
        return GameResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return GameResult<T>::err(GameError(ErrorCode::ConfigTypeMismatch,
                                            "wrong type for " + std::string(key)));
    }
}

} // namespace gw::foundation
