#include "daemon/entity_resolver.hpp"

#include <algorithm>
#include <regex>
#include <unordered_set>

#include "common/logging.hpp"

namespace killfeed {

namespace {

const std::unordered_set<std::string> &manufacturerCodes()
{
    static const std::unordered_set<std::string> codes{
        "ORIG", "CRUS", "RSI", "AEGS", "VNCL", "DRAK", "ANVL", "BANU", "MISC",
        "CNOU", "XIAN", "GAMA", "TMBL", "ESPR", "KRIG", "GRIN", "XNAA", "MRAI"};
    return codes;
}

const std::vector<std::regex> &npcPatterns()
{
    static const std::vector<std::regex> patterns{
        std::regex(R"(^PU_Human)"),
        std::regex(R"(^NPC_)"),
        std::regex(R"(_NPC$)"),
        std::regex(R"(^Security_)"),
        std::regex(R"(^Guard_)"),
        std::regex(R"(^Civilian_)"),
        std::regex(R"(^Pirate_)"),
        std::regex(R"(^BountyTarget_)"),
        std::regex(R"(^[A-Za-z]+Security$)"),
        std::regex(R"(^[A-Za-z]+Guard$)"),
        std::regex(R"(^[A-Za-z]+Police$)"),
        std::regex(R"(^PU_Pilots)"),
        std::regex(R"(^AIModule_)"),
        std::regex(R"(^Kopion_)"),
        std::regex(R"(^vlk_juvenile_sentry_)"),
        std::regex(R"(^Orbital_Sentry_)"),
    };
    return patterns;
}

EntityCategory categoryFromKey(const std::string &key)
{
    if (key == "ships" || key == "vehicles") {
        return EntityCategory::Ship;
    }
    if (key == "weapons") {
        return EntityCategory::Weapon;
    }
    if (key == "objects") {
        return EntityCategory::Object;
    }
    if (key == "npcs") {
        return EntityCategory::Npc;
    }
    if (key == "locations") {
        return EntityCategory::Location;
    }
    return EntityCategory::Unknown;
}

} // namespace

std::string cleanEntityName(const std::string &entityId)
{
    static const std::regex instanceSuffix(R"(^(.+?)_\d+$)");

    if (entityId.empty()) {
        return "Unknown";
    }

    std::string cleaned = std::regex_replace(entityId, instanceSuffix, "$1");

    const auto firstUnderscore = cleaned.find('_');
    if (firstUnderscore != std::string::npos
        && manufacturerCodes().contains(cleaned.substr(0, firstUnderscore))) {
        cleaned = cleaned.substr(firstUnderscore + 1);
    }

    std::replace(cleaned.begin(), cleaned.end(), '_', ' ');
    return cleaned;
}

bool hasManufacturerPrefix(const std::string &entityId)
{
    const auto firstUnderscore = entityId.find('_');
    return firstUnderscore != std::string::npos
        && manufacturerCodes().contains(entityId.substr(0, firstUnderscore));
}

std::string toEntityCategoryString(EntityCategory category)
{
    switch (category) {
    case EntityCategory::Ship:
        return "ship";
    case EntityCategory::Weapon:
        return "weapon";
    case EntityCategory::Object:
        return "object";
    case EntityCategory::Npc:
        return "npc";
    case EntityCategory::Location:
        return "location";
    case EntityCategory::Unknown:
        break;
    }
    return "unknown";
}

DefaultEntityResolver::DefaultEntityResolver()
    : m_npcExactNames{"Security", "SecurityGuard", "Civilian", "UEESecurity", "Pirate",
                      "NineTails", "Security Backup", "Stanton Security", "Crusader Security",
                      "Microtech Security", "Hurston Security", "Arccorp Security", "Bounty Hunter"}
{
}

bool DefaultEntityResolver::isNpc(const std::string &entityId) const
{
    if (std::find(m_npcExactNames.begin(), m_npcExactNames.end(), entityId) != m_npcExactNames.end()) {
        return true;
    }
    for (const auto &pattern : npcPatterns()) {
        if (std::regex_search(entityId, pattern)) {
            return true;
        }
    }
    return false;
}

ResolvedEntity DefaultEntityResolver::resolve(const std::string &entityId) const
{
    ResolvedEntity resolved;
    resolved.originalId = entityId;
    if (entityId.empty()) {
        resolved.displayName = "Unknown";
        return resolved;
    }

    resolved.isNpc = isNpc(entityId);

    const auto it = m_definitions.find(entityId);
    if (it != m_definitions.end()) {
        resolved.displayName = it->second.displayName;
        resolved.category = it->second.category;
        resolved.matchMethod = EntityMatchMethod::Exact;
        return resolved;
    }

    if (resolved.isNpc) {
        resolved.displayName = cleanEntityName(entityId);
        resolved.category = EntityCategory::Npc;
        resolved.matchMethod = EntityMatchMethod::Pattern;
        return resolved;
    }

    resolved.displayName = cleanEntityName(entityId);
    resolved.category = hasManufacturerPrefix(entityId) ? EntityCategory::Ship : EntityCategory::Unknown;
    resolved.matchMethod = EntityMatchMethod::Fallback;
    return resolved;
}

void DefaultEntityResolver::addDefinition(const std::string &entityId,
                                          const std::string &displayName,
                                          EntityCategory category)
{
    m_definitions[entityId] = Definition{displayName, category};
}

int DefaultEntityResolver::loadDefinitions(const nlohmann::json &definitions)
{
    if (!definitions.is_object()) {
        return 0;
    }

    int loaded = 0;
    for (const auto &[key, items] : definitions.items()) {
        if (!items.is_object()) {
            continue;
        }
        const EntityCategory category = categoryFromKey(key);
        for (const auto &[entityId, name] : items.items()) {
            if (!name.is_string()) {
                continue;
            }
            addDefinition(entityId, name.get<std::string>(), category);
            ++loaded;
        }
    }

    KFLOG_INFO(QStringLiteral("EntityResolver"),
               QStringLiteral("loadDefinitions"),
               QStringLiteral("definitions_loaded"),
               QStringLiteral("definitions_file"),
               QStringLiteral("merge_by_id"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"count", loaded}}));
    return loaded;
}

} // namespace killfeed
