#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace killfeed {

enum class EntityCategory {
    Ship,
    Weapon,
    Object,
    Npc,
    Location,
    Unknown
};

enum class EntityMatchMethod {
    Exact,
    Pattern,
    Fallback
};

struct ResolvedEntity {
    std::string displayName;
    bool isNpc = false;
    EntityCategory category = EntityCategory::Unknown;
    EntityMatchMethod matchMethod = EntityMatchMethod::Fallback;
    std::string originalId;
};

// Turns raw killer, victim and vehicle tokens into display names and decides
// whether a token is an NPC.
class EntityResolver
{
public:
    virtual ~EntityResolver() = default;
    virtual ResolvedEntity resolve(const std::string &entityId) const = 0;
};

// Local definitions table plus the built-in NPC ignore list.
class DefaultEntityResolver : public EntityResolver
{
public:
    DefaultEntityResolver();

    ResolvedEntity resolve(const std::string &entityId) const override;

    bool isNpc(const std::string &entityId) const;
    void addDefinition(const std::string &entityId, const std::string &displayName, EntityCategory category);

    // {"ships": {"AEGS_Avenger": "Avenger Titan"}, "weapons": {...}, ...}
    int loadDefinitions(const nlohmann::json &definitions);

private:
    struct Definition {
        std::string displayName;
        EntityCategory category = EntityCategory::Unknown;
    };

    std::unordered_map<std::string, Definition> m_definitions;
    std::vector<std::string> m_npcExactNames;
};

// Strips the instance suffix and a leading manufacturer code, then turns
// underscores into spaces: AEGS_Avenger_Titan_01 -> "Avenger Titan".
std::string cleanEntityName(const std::string &entityId);

// Manufacturer code (AEGS, DRAK, ...) at the start of a token.
bool hasManufacturerPrefix(const std::string &entityId);

std::string toEntityCategoryString(EntityCategory category);

} // namespace killfeed
