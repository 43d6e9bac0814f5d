#include "rsb/foundation/config_manager.hpp"

#include <set>

namespace rsb::foundation {

ServiceResult<void> ConfigManager::load(const std::filesystem::path& path) {
    std::lock_guard lock(mutex_);
    try {
        auto root = YAML::LoadFile(path.string());
        entries_.clear();
        flatten("", root);
        return ServiceResult<void>::ok();
    } catch (const YAML::BadFile&) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

ServiceResult<void> ConfigManager::loadFromString(std::string_view yaml) {
    std::lock_guard lock(mutex_);
    try {
        auto root = YAML::Load(std::string(yaml));
        entries_.clear();
        flatten("", root);
        return ServiceResult<void>::ok();
    } catch (const YAML::ParserException& e) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

void ConfigManager::watch(std::string_view key, ConfigWatchCallback callback) {
    std::lock_guard lock(mutex_);
    watchers_[std::string(key)].push_back(std::move(callback));
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

std::vector<std::string> ConfigManager::childKeys(std::string_view prefix) const {
    std::lock_guard lock(mutex_);

    auto base = std::string(prefix) + ".";
    std::set<std::string> names;
    for (const auto& [key, _] : entries_) {
        if (key.size() <= base.size() || key.compare(0, base.size(), base) != 0) {
            continue;
        }
        auto rest = key.substr(base.size());
        names.insert(rest.substr(0, rest.find('.')));
    }
    return {names.begin(), names.end()};
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else {
        // Leaf node (scalar, sequence, null) stored under its dotted key.
        entries_[prefix] = YAML::Clone(node);
    }
}

void ConfigManager::notifyWatchers(std::string_view key) {
    std::lock_guard lock(mutex_);
    auto it = watchers_.find(std::string(key));
    if (it != watchers_.end()) {
        for (auto& cb : it->second) {
            cb(key);
        }
    }
}

}  // namespace rsb::foundation
