#pragma once
#include <ctime>
#include <optional>
#include <string>
#include "Types.hpp"

// Resolves one service's calls, in calling order, from railway clock strings to
// epoch times. A time more than six hours behind its predecessor belongs to the
// next calendar day.
class CallResolver
{
public:
    struct RawCall
    {
        std::string location;
        std::string pta;
        std::string ptd;
        std::string wta;
        std::string wtd;
        std::string wtp;
    };

    CallResolver(std::string ssd, std::string zone);

    // Stop when a public time exists, otherwise pass. Empty when the call has no usable time.
    std::optional<ScheduledCall> resolve(RawCall const& raw);

private:
    std::string ssd;
    std::string zone;
    int previousSec = -1;
    int dayOffset = 0;

    std::time_t stamp(int sec);
};
