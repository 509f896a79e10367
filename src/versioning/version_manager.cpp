// File: src/versioning/version_manager.cpp
#include "versioning/version_manager.hpp"
#include <cctype>
#include <iostream>
#include <sstream>

namespace motionrank {

namespace {

/// Parse a non-negative decimal component; rejects empty and non-digit text
bool ParseComponent(const std::string& text, unsigned long& out) {
    if (text.empty() || text.size() > 9) {
        return false;
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    out = std::stoul(text);
    return true;
}

} // anonymous namespace

std::string VersionManager::CreateVersion(const Solution& solution,
                                          const std::string& change_description) {
    auto& entries = history_[solution.GetID()];

    std::string new_version = entries.empty()
        ? std::string(kInitialVersion)
        : IncrementVersion(entries.back().snapshot.GetVersion());

    Solution snapshot = solution.Clone();
    snapshot.SetVersion(new_version);
    snapshot.SetParentID(solution.GetID());

    entries.push_back(VersionEntry{std::move(snapshot), change_description, Timestamp::Now()});

    std::cerr << "[versioning] " << solution.GetID().value()
              << " v" << new_version << std::endl;

    return new_version;
}

std::vector<VersionEntry> VersionManager::GetVersionHistory(const SolutionID& id) const {
    auto it = history_.find(id);
    if (it == history_.end()) {
        return {};
    }
    return it->second;
}

std::optional<Solution> VersionManager::GetLatestVersion(const SolutionID& id) const {
    auto it = history_.find(id);
    if (it == history_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second.back().snapshot;
}

std::optional<Solution> VersionManager::RollbackToVersion(const SolutionID& id,
                                                          const std::string& version) const {
    auto it = history_.find(id);
    if (it == history_.end()) {
        return std::nullopt;
    }

    for (const auto& entry : it->second) {
        if (entry.snapshot.GetVersion() == version) {
            return entry.snapshot.Clone();
        }
    }

    return std::nullopt;
}

size_t VersionManager::GetVersionCount(const SolutionID& id) const {
    auto it = history_.find(id);
    return it == history_.end() ? 0 : it->second.size();
}

std::string VersionManager::IncrementVersion(const std::string& version) {
    std::vector<std::string> parts;
    std::stringstream ss(version);
    std::string part;
    while (std::getline(ss, part, '.')) {
        parts.push_back(part);
    }

    unsigned long major = 0, minor = 0, patch = 0;
    if (parts.size() != 3 ||
        !ParseComponent(parts[0], major) ||
        !ParseComponent(parts[1], minor) ||
        !ParseComponent(parts[2], patch)) {
        return kFallbackVersion;
    }

    return std::to_string(major) + "." + std::to_string(minor) + "." +
           std::to_string(patch + 1);
}

} // namespace motionrank
