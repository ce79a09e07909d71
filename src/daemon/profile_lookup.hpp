#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace killfeed {

struct ProfileData {
    std::string enlisted = "-";
    std::string record = "-";
    std::string org = "-";
};

// Player profile enrichment keyed by handle. Implementations answer
// asynchronously and may never call back at all.
class ProfileLookup
{
public:
    using Callback = std::function<void(const std::unordered_map<std::string, ProfileData> &)>;

    virtual ~ProfileLookup() = default;
    virtual void lookup(const std::vector<std::string> &names, Callback callback) = 0;
};

class NullProfileLookup : public ProfileLookup
{
public:
    void lookup(const std::vector<std::string> &, Callback) override {}
};

} // namespace killfeed
