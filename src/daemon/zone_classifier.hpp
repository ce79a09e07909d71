#pragma once

#include <optional>
#include <string>

#include "common/models.hpp"

namespace killfeed {

// Pattern rules for Game.log zone tokens. Every function is total: any input,
// including an empty string, yields a usable answer.
class ZoneClassifier
{
public:
    // Drops an instance suffix (OOC_Stanton_2b_Daymar_0042 -> OOC_Stanton_2b_Daymar).
    // Planet ids such as OOC_Stanton_1 are left alone.
    static std::string cleanZoneId(const std::string &zoneId);

    // Unrecognized tokens default to Secondary.
    static ZoneClassification classify(const std::string &zoneId);
    static StarSystem determineSystem(const std::string &zoneId);
    static PrimaryZoneType determinePrimaryType(const std::string &zoneId);
    static SecondaryZoneType determineSecondaryType(const std::string &zoneId);
    static std::string generateDisplayName(const std::string &zoneId);

    // Primary a secondary token belongs to, from the OOC prefix or a known
    // station association.
    static std::optional<std::string> derivePrimaryZone(const std::string &zoneId);
};

} // namespace killfeed
