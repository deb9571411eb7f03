#include "ProfileManager.hpp"
#include "utils/Logger.hpp"
#include <filesystem>
#include <fstream>

namespace jungle {

    ProfileManager::ProfileManager(std::string activeRetail, std::string activeMonkey) {
        profiles_[AgentRole::RETAIL] = {};
        profiles_[AgentRole::MONKEY] = {};
        active_[AgentRole::RETAIL] = std::move(activeRetail);
        active_[AgentRole::MONKEY] = std::move(activeMonkey);
    }

    size_t ProfileManager::loadDirectory(const std::string& directory) {
        namespace fs = std::filesystem;

        std::error_code ec;
        if (!fs::is_directory(directory, ec)) {
            Logger::warn("Profile directory {} not found, agents will use default weights", directory);
            return 0;
        }

        size_t loaded = 0;
        for (const auto& entry : fs::directory_iterator(directory, ec)) {
            if (!entry.is_regular_file() || entry.path().extension() != ".json") continue;

            std::string filename = entry.path().filename().string();
            std::optional<AgentRole> role;
            if (filename.rfind("retail_", 0) == 0) role = AgentRole::RETAIL;
            else if (filename.rfind("monkey_", 0) == 0) role = AgentRole::MONKEY;
            if (!role) continue;

            try {
                std::ifstream file(entry.path());
                auto profile = AgentProfile::fromJson(nlohmann::json::parse(file));
                addProfile(*role, filename, std::move(profile));
                loaded++;
            }
            catch (const std::exception& e) {
                Logger::error("Error loading profile {}: {}", entry.path().string(), e.what());
            }
        }

        for (auto role : { AgentRole::RETAIL, AgentRole::MONKEY }) {
            if (profiles_[role].empty()) {
                Logger::warn("No {} profiles found in {}", toString(role), directory);
            }
        }

        Logger::info("Loaded {} profiles from {}", loaded, directory);
        return loaded;
    }

    void ProfileManager::addProfile(AgentRole role, const std::string& key, AgentProfile profile) {
        profiles_[role][key] = std::move(profile);
    }

    std::optional<AgentProfile> ProfileManager::getActiveProfile(AgentRole role) const {
        auto rit = profiles_.find(role);
        if (rit == profiles_.end()) return std::nullopt;

        auto pit = rit->second.find(getActiveName(role));
        if (pit == rit->second.end()) return std::nullopt;
        return pit->second;
    }

    std::vector<std::string> ProfileManager::listProfiles(AgentRole role) const {
        std::vector<std::string> names;
        auto it = profiles_.find(role);
        if (it == profiles_.end()) return names;

        for (const auto& [name, _] : it->second) {
            names.push_back(name);
        }
        return names;
    }

    bool ProfileManager::switchProfile(AgentRole role, const std::string& name) {
        auto it = profiles_.find(role);
        if (it == profiles_.end() || it->second.find(name) == it->second.end()) {
            return false;
        }

        active_[role] = name;
        Logger::info("Switched {} profile to {}", toString(role), name);
        return true;
    }

    const std::string& ProfileManager::getActiveName(AgentRole role) const {
        return active_.at(role);
    }

} // namespace jungle
