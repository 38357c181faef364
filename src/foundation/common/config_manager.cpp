#include "gw/foundation/config_manager.hpp"

#include <algorithm>

namespace gw::foundation {

GameResult<void> ConfigManager::load(const std::filesystem::path& path) {
    try {
        replaceEntries(YAML::LoadFile(path.string()));
    } catch (const YAML::BadFile&) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed, "cannot open " + path.string()));
    } catch (const YAML::ParserException& e) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed, path.string() + ": " + e.what()));
    }
    source_ = path.string();
    return GameResult<void>::ok();
}

GameResult<void> ConfigManager::loadFromString(std::string_view yaml) {
    try {
        replaceEntries(YAML::Load(std::string(yaml)));
    } catch (const YAML::ParserException& e) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed, std::string("<string>: ") + e.what()));
    }
    source_ = "<string>";
    return GameResult<void>::ok();
}

bool ConfigManager::hasKey(std::string_view key) const {
    return entries_.count(std::string(key)) > 0;
}

std::vector<std::string> ConfigManager::unrecognizedKeys(
    std::initializer_list<std::string_view> known) const {
    std::vector<std::string> out;
    for (const auto& [key, node] : entries_) {
        if (std::find(known.begin(), known.end(), key) == known.end()) {
            out.push_back(key);
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

void ConfigManager::replaceEntries(const YAML::Node& root) {
    entries_.clear();
    if (root.IsMap()) {
        flatten("", root);
    }
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (!node.IsMap()) {
        entries_[prefix] = YAML::Clone(node);
        return;
    }
    for (const auto& child : node) {
        const auto name = child.first.as<std::string>();
        flatten(prefix.empty() ? name : prefix + "." + name, child.second);
    }
}

}  // namespace gw::foundation
