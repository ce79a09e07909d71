#pragma once

#include <string>
#include <vector>

#include "common/enums.hpp"

namespace killfeed {

// Classifies a destruction or death from its destroy level, damage type and
// the parties involved. `driver` may be empty.
DeathType determineDeathType(int level,
                             const std::string &damageType,
                             const std::string &causedBy,
                             const std::string &driver,
                             SelfInflictedPolicy policy = SelfInflictedPolicy::Unknown);

// One-line summary for the feed. A victim list equal to [vehicleModel] is the
// unresolved vehicle placeholder and is rendered as the vehicle label.
std::string formatKillDescription(const std::vector<std::string> &killers,
                                  const std::vector<std::string> &victims,
                                  const std::string &vehicleType,
                                  const std::string &vehicleModel,
                                  DeathType deathType);

bool isPlaceholderVictim(const std::vector<std::string> &victims, const std::string &vehicleModel);

std::string joinNames(const std::vector<std::string> &names, const std::string &separator = " + ");

} // namespace killfeed
