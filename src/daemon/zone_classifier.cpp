#include "daemon/zone_classifier.hpp"

#include <cctype>
#include <regex>
#include <unordered_map>
#include <vector>

namespace killfeed {

namespace {

constexpr auto kIcase = std::regex::ECMAScript | std::regex::icase;

const std::vector<std::regex> &primaryPatterns()
{
    static const std::vector<std::regex> patterns{
        std::regex(R"(^OOC_Stanton$)", kIcase),
        std::regex(R"(^OOC_Stanton_\d+$)", kIcase),
        std::regex(R"(^OOC_Stanton_\d+[a-z]$)", kIcase),
        std::regex(R"(^OOC_Pyro$)", kIcase),
        std::regex(R"(^OOC_Pyro_\d+$)", kIcase),
        std::regex(R"(^OOC_Pyro_\d+[a-z]$)", kIcase),
        std::regex(R"(^JP_)", kIcase),
        std::regex(R"(^Quantum_)", kIcase),
        std::regex(R"(^(Hurston|Crusader|ArcCorp|microTech)$)", kIcase),
    };
    return patterns;
}

const std::vector<std::regex> &secondaryPatterns()
{
    static const std::vector<std::regex> patterns{
        std::regex(R"(^OOC_Stanton_\d+[a-z]?_(.+)$)", kIcase),
        std::regex(R"(^OOC_Pyro_\d+[a-z]?_(.+)$)", kIcase),
        std::regex(R"(^(GrimHex|PortOlisar|PortTressler|Orison|NewBabbage|Area18|Lorville)$)", kIcase),
        std::regex(R"(^(.+)_(Outpost|Station|Mining|Research|Security|Medical)$)", kIcase),
        std::regex(R"(^(CRU|HUR|ARC|MIC)-L[1-5]$)", kIcase),
        std::regex(R"(^(Everus_Harbor|Baijini_Point|Tressler|Seraphim|Sentinel)$)", kIcase),
        std::regex(R"(^(.+)_(Admin|Industrial|Residential|Commercial)$)", kIcase),
        std::regex(R"(^R&R_)", kIcase),
        std::regex(R"(^SPK$)", kIcase),
        std::regex(R"(^(Kareah|Covalex|Comm_Array)$)", kIcase),
    };
    return patterns;
}

bool anyMatch(const std::vector<std::regex> &patterns, const std::string &value)
{
    for (const auto &pattern : patterns) {
        if (std::regex_search(value, pattern)) {
            return true;
        }
    }
    return false;
}

std::string lowered(const std::string &value)
{
    std::string out = value;
    for (char &c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::string titleCase(std::string value)
{
    bool atWordStart = true;
    for (char &c : value) {
        const unsigned char uc = static_cast<unsigned char>(c);
        const bool wordChar = std::isalnum(uc) || c == '_';
        if (wordChar && atWordStart) {
            c = static_cast<char>(std::toupper(uc));
        }
        atWordStart = !wordChar;
    }
    return value;
}

std::string trim(const std::string &value)
{
    size_t start = 0;
    while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    size_t end = value.size();
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(start, end - start);
}

std::string romanNumeral(int value)
{
    static const std::vector<std::pair<int, const char *>> numerals{
        {10, "X"}, {9, "IX"}, {5, "V"}, {4, "IV"}, {1, "I"}};
    std::string out;
    for (const auto &[arabic, roman] : numerals) {
        while (value >= arabic) {
            out += roman;
            value -= arabic;
        }
    }
    return out;
}

const std::unordered_map<std::string, std::string> &stantonPlanets()
{
    static const std::unordered_map<std::string, std::string> planets{
        {"OOC_Stanton_1", "Hurston"},
        {"OOC_Stanton_2", "Crusader"},
        {"OOC_Stanton_3", "ArcCorp"},
        {"OOC_Stanton_4", "microTech"},
    };
    return planets;
}

} // namespace

std::string ZoneClassifier::cleanZoneId(const std::string &zoneId)
{
    static const std::regex bodyId(R"(^OOC_(Stanton|Pyro)_\d+$)", kIcase);
    static const std::regex instanceSuffix(R"(_\d+$)");

    const std::string trimmed = trim(zoneId);
    if (trimmed.empty() || std::regex_match(trimmed, bodyId)) {
        return trimmed;
    }
    return std::regex_replace(trimmed, instanceSuffix, "");
}

ZoneClassification ZoneClassifier::classify(const std::string &zoneId)
{
    const std::string cleanId = cleanZoneId(zoneId);
    if (anyMatch(primaryPatterns(), cleanId)) {
        return ZoneClassification::Primary;
    }
    // Secondary patterns are checked for documentation value only; anything
    // left over is a point of interest as well.
    return ZoneClassification::Secondary;
}

StarSystem ZoneClassifier::determineSystem(const std::string &zoneId)
{
    static const std::vector<std::string> stantonMarkers{
        "stanton", "hurston", "crusader", "arccorp", "microtech",
        "orison", "lorville", "area18", "newbabbage"};
    static const std::vector<std::string> pyroMarkers{"pyro", "ruin_station"};

    const std::string lower = lowered(cleanZoneId(zoneId));
    for (const auto &marker : stantonMarkers) {
        if (lower.find(marker) != std::string::npos) {
            return StarSystem::Stanton;
        }
    }
    for (const auto &marker : pyroMarkers) {
        if (lower.find(marker) != std::string::npos) {
            return StarSystem::Pyro;
        }
    }
    return StarSystem::Unknown;
}

PrimaryZoneType ZoneClassifier::determinePrimaryType(const std::string &zoneId)
{
    static const std::regex systemId(R"(^OOC_(Stanton|Pyro)$)", kIcase);
    static const std::regex jumpPoint(R"(^JP_)", kIcase);
    static const std::regex planet(R"(^OOC_(Stanton|Pyro)_\d+$)", kIcase);
    static const std::regex moon(R"(^OOC_(Stanton|Pyro)_\d+[a-z]$)", kIcase);
    static const std::regex namedPlanet(R"(^(Hurston|Crusader|ArcCorp|microTech)$)", kIcase);

    const std::string cleanId = cleanZoneId(zoneId);
    if (std::regex_search(cleanId, systemId)) {
        return PrimaryZoneType::System;
    }
    if (std::regex_search(cleanId, jumpPoint)) {
        return PrimaryZoneType::JumpPoint;
    }
    if (std::regex_search(cleanId, planet) || std::regex_search(cleanId, namedPlanet)) {
        return PrimaryZoneType::Planet;
    }
    if (std::regex_search(cleanId, moon)) {
        return PrimaryZoneType::Moon;
    }
    if (lowered(cleanId).find("asteroid") != std::string::npos) {
        return PrimaryZoneType::AsteroidField;
    }
    return PrimaryZoneType::System;
}

SecondaryZoneType ZoneClassifier::determineSecondaryType(const std::string &zoneId)
{
    static const std::regex station(
        R"(^(GrimHex|PortOlisar|PortTressler|CRU-L\d|HUR-L\d|ARC-L\d|MIC-L\d|Everus_Harbor|Baijini_Point|Seraphim|Tressler)$)",
        kIcase);
    static const std::regex landingZone(R"(^(Orison|NewBabbage|Area18|Lorville)$)", kIcase);
    static const std::regex outpost(R"(outpost|mining|research|security|medical)", kIcase);
    static const std::regex restStop(R"(^R&R_)", kIcase);
    static const std::regex derelict(R"(derelict|wreck|abandoned)", kIcase);
    static const std::regex asteroid(R"(asteroid)", kIcase);
    static const std::regex ship(R"(ship|vessel|craft)", kIcase);

    const std::string cleanId = cleanZoneId(zoneId);
    if (std::regex_search(cleanId, station)) {
        return SecondaryZoneType::Station;
    }
    if (std::regex_search(cleanId, landingZone)) {
        return SecondaryZoneType::LandingZone;
    }
    if (std::regex_search(cleanId, outpost)) {
        return SecondaryZoneType::Outpost;
    }
    if (std::regex_search(cleanId, restStop)) {
        return SecondaryZoneType::Station;
    }
    if (std::regex_search(cleanId, derelict)) {
        return SecondaryZoneType::Derelict;
    }
    if (std::regex_search(cleanId, asteroid)) {
        return SecondaryZoneType::Asteroid;
    }
    if (std::regex_search(cleanId, ship)) {
        return SecondaryZoneType::Ship;
    }
    return SecondaryZoneType::Poi;
}

std::string ZoneClassifier::generateDisplayName(const std::string &zoneId)
{
    static const std::unordered_map<std::string, std::string> moonNames{
        {"1a", "Arial"}, {"1b", "Aberdeen"}, {"1c", "Magda"}, {"1d", "Ita"},
        {"2a", "Cellin"}, {"2b", "Daymar"}, {"2c", "Yela"},
        {"3a", "Lyria"}, {"3b", "Wala"},
        {"4a", "Calliope"}, {"4b", "Clio"}, {"4c", "Euterpe"},
    };
    static const std::unordered_map<std::string, std::string> knownLocations{
        {"GrimHex", "GrimHEX"},
        {"PortOlisar", "Port Olisar"},
        {"PortTressler", "Port Tressler"},
        {"Orison", "Orison Landing Zone"},
        {"NewBabbage", "New Babbage"},
        {"Area18", "Area18"},
        {"Lorville", "Lorville"},
        {"SPK", "Security Post Kareah"},
        {"OOC_Stanton", "Stanton System"},
        {"OOC_Pyro", "Pyro System"},
    };
    static const std::regex stantonMoon(R"(^OOC_Stanton_(\d+)([a-z])$)", kIcase);
    static const std::regex pyroPlanet(R"(^OOC_Pyro_(\d+)$)", kIcase);
    static const std::regex ocPrefix(R"(^OOC_)");

    const std::string cleanId = cleanZoneId(zoneId);
    if (cleanId.empty()) {
        return "Unknown";
    }

    const auto planetIt = stantonPlanets().find(cleanId);
    if (planetIt != stantonPlanets().end()) {
        return planetIt->second;
    }

    std::smatch match;
    if (std::regex_match(cleanId, match, stantonMoon)) {
        const std::string planetNumber = match[1].str();
        const std::string moonLetter = lowered(match[2].str());
        const auto moonIt = moonNames.find(planetNumber + moonLetter);
        if (moonIt != moonNames.end()) {
            return moonIt->second;
        }
        const auto parentIt = stantonPlanets().find("OOC_Stanton_" + planetNumber);
        const std::string parent = parentIt != stantonPlanets().end()
            ? parentIt->second
            : "Planet " + planetNumber;
        std::string letter = moonLetter;
        letter[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(letter[0])));
        return parent + " " + letter;
    }

    if (std::regex_match(cleanId, match, pyroPlanet)) {
        return "Pyro " + romanNumeral(std::stoi(match[1].str()));
    }

    const auto knownIt = knownLocations.find(cleanId);
    if (knownIt != knownLocations.end()) {
        return knownIt->second;
    }

    std::string generic = std::regex_replace(cleanId, ocPrefix, "");
    for (char &c : generic) {
        if (c == '_') {
            c = ' ';
        }
    }
    generic = trim(titleCase(generic));
    return generic.empty() ? std::string("Unknown") : generic;
}

std::optional<std::string> ZoneClassifier::derivePrimaryZone(const std::string &zoneId)
{
    static const std::regex bodyPrefix(R"(^(OOC_(Stanton|Pyro)_\d+[a-z]?)_)", kIcase);
    static const std::unordered_map<std::string, std::string> stationAssociations{
        {"PortOlisar", "OOC_Stanton_2"},
        {"PortTressler", "OOC_Stanton_4"},
        {"Everus_Harbor", "OOC_Stanton_1"},
        {"Baijini_Point", "OOC_Stanton_3"},
        {"Seraphim", "OOC_Stanton_2"},
        {"GrimHex", "OOC_Stanton_2c"},
        {"Lorville", "OOC_Stanton_1"},
        {"Orison", "OOC_Stanton_2"},
        {"Area18", "OOC_Stanton_3"},
        {"NewBabbage", "OOC_Stanton_4"},
        {"HUR-L1", "OOC_Stanton_1"},
        {"CRU-L1", "OOC_Stanton_2"},
        {"ARC-L1", "OOC_Stanton_3"},
        {"MIC-L1", "OOC_Stanton_4"},
    };

    const std::string cleanId = cleanZoneId(zoneId);
    std::smatch match;
    if (std::regex_search(cleanId, match, bodyPrefix)) {
        return match[1].str();
    }

    const auto it = stationAssociations.find(cleanId);
    if (it != stationAssociations.end()) {
        return it->second;
    }
    return std::nullopt;
}

} // namespace killfeed
