#include "CallResolver.hpp"
#include "LocalTime.hpp"

namespace
{
    constexpr int kRolloverSeconds = 6 * 3600;
}

CallResolver::CallResolver(std::string ssd, std::string zone)
    : ssd(std::move(ssd))
    , zone(std::move(zone))
{
}

std::time_t CallResolver::stamp(int sec)
{
    if (previousSec >= 0 && sec + dayOffset < previousSec - kRolloverSeconds)
        dayOffset += 86400;
    previousSec = sec + dayOffset;
    return LocalTime::toEpoch(ssd, sec + dayOffset, zone);
}

std::optional<ScheduledCall> CallResolver::resolve(RawCall const& raw)
{
    auto pta = LocalTime::parseClock(raw.pta);
    auto ptd = LocalTime::parseClock(raw.ptd);
    auto wta = LocalTime::parseClock(raw.wta);
    auto wtd = LocalTime::parseClock(raw.wtd);
    auto wtp = LocalTime::parseClock(raw.wtp);

    ScheduledCall call;
    call.location = raw.location;

    std::optional<int> when;
    std::optional<int> arrival;
    if (pta || ptd)
    {
        call.callType = CallType::Stop;
        arrival = pta ? pta : wta;
        when = ptd ? ptd : (wtd ? wtd : arrival);
    }
    else
    {
        call.callType = CallType::Pass;
        when = wtp ? wtp : (wtd ? wtd : wta);
    }

    if (!when)
        return std::nullopt;

    if (arrival)
        call.scheduledArrival = stamp(*arrival);
    call.scheduledTime = stamp(*when);
    return call;
}
