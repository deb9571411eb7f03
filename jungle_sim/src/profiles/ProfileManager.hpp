#pragma once

#include "ProfileProvider.hpp"
#include <map>
#include <string>

namespace jungle {

    // Loads retail_*.json / monkey_*.json profiles from a directory and tracks
    // the active one per role. Profiles are keyed by file name.
    class ProfileManager : public ProfileProvider {
    public:
        ProfileManager(std::string activeRetail = "retail_profile.json",
            std::string activeMonkey = "monkey_profile.json");

        // Returns the number of profiles loaded
        size_t loadDirectory(const std::string& directory);

        void addProfile(AgentRole role, const std::string& key, AgentProfile profile);

        std::optional<AgentProfile> getActiveProfile(AgentRole role) const override;
        std::vector<std::string> listProfiles(AgentRole role) const override;
        bool switchProfile(AgentRole role, const std::string& name) override;

        const std::string& getActiveName(AgentRole role) const;

    private:
        std::map<AgentRole, std::map<std::string, AgentProfile>> profiles_;
        std::map<AgentRole, std::string> active_;
    };

} // namespace jungle
