#include "daemon/kill_description.hpp"

#include <algorithm>

namespace killfeed {

namespace {

std::string spaced(std::string value)
{
    std::replace(value.begin(), value.end(), '_', ' ');
    return value;
}

std::string withCraft(const std::string &prefix, const std::string &craftName)
{
    return craftName.empty() ? prefix : prefix + " (" + craftName + ")";
}

std::string possessiveCraft(const std::string &victimName, const std::string &craftName)
{
    return craftName.empty() ? victimName : victimName + "'s " + craftName;
}

} // namespace

DeathType determineDeathType(int level,
                             const std::string &damageType,
                             const std::string &causedBy,
                             const std::string &driver,
                             SelfInflictedPolicy policy)
{
    const bool selfInflicted = causedBy == "unknown" || (!driver.empty() && causedBy == driver);

    if (damageType == "Collision" || damageType == "Crash") {
        return selfInflicted ? DeathType::Crash : DeathType::Collision;
    }
    if (damageType == "BleedOut") {
        return DeathType::BleedOut;
    }
    if (damageType == "SuffocationDamage" || damageType == "Suffocation") {
        return DeathType::Suffocation;
    }
    if (level == 1) {
        return DeathType::Soft;
    }
    if (level >= 2) {
        return DeathType::Hard;
    }
    if (causedBy == "Environment") {
        return DeathType::Unknown;
    }
    if (selfInflicted) {
        return policy == SelfInflictedPolicy::Crash ? DeathType::Crash : DeathType::Unknown;
    }
    return DeathType::Combat;
}

bool isPlaceholderVictim(const std::vector<std::string> &victims, const std::string &vehicleModel)
{
    return victims.size() == 1 && !vehicleModel.empty() && victims.front() == vehicleModel;
}

std::string joinNames(const std::vector<std::string> &names, const std::string &separator)
{
    std::string joined;
    for (const auto &name : names) {
        if (!joined.empty()) {
            joined += separator;
        }
        joined += name;
    }
    return joined;
}

std::string formatKillDescription(const std::vector<std::string> &killers,
                                  const std::vector<std::string> &victims,
                                  const std::string &vehicleType,
                                  const std::string &vehicleModel,
                                  DeathType deathType)
{
    const bool placeholder = isPlaceholderVictim(victims, vehicleModel);

    std::string victimName = placeholder ? spaced(vehicleType) : joinNames(victims);
    if (victimName.empty()) {
        victimName = "Unknown";
    }

    std::vector<std::string> validKillers;
    for (const auto &killer : killers) {
        if (!killer.empty() && killer != "unknown" && killer != "Environment") {
            validKillers.push_back(killer);
        }
    }
    const bool environmentKiller =
        std::find(killers.begin(), killers.end(), "Environment") != killers.end();
    std::string killerName = joinNames(validKillers);
    if (killerName.empty()) {
        killerName = environmentKiller ? "Environment" : "Unknown";
    }

    const std::string craftName =
        (vehicleModel.empty() || vehicleModel == "Player") ? std::string() : spaced(vehicleModel);

    switch (deathType) {
    case DeathType::Suffocation:
        return victimName + " suffocated";
    case DeathType::BleedOut:
        return victimName + " bled out";
    case DeathType::Crash:
        return withCraft(victimName, craftName) + " crashed";
    case DeathType::Collision:
        if (validKillers.empty()) {
            return withCraft("A collision occurred involving " + victimName, craftName);
        }
        return placeholder
            ? killerName + "'s vessel collided with " + victimName
            : withCraft(killerName + " collided with " + victimName, craftName);
    case DeathType::Soft:
        return killerName + " disabled " + (placeholder ? victimName : possessiveCraft(victimName, craftName));
    case DeathType::Hard:
    case DeathType::Combat:
        return killerName + " destroyed " + (placeholder ? victimName : possessiveCraft(victimName, craftName));
    case DeathType::Unknown:
        break;
    }

    if (environmentKiller) {
        return victimName + " succumbed to environmental factors";
    }
    return killerName + " defeated " + victimName;
}

} // namespace killfeed
