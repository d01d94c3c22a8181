#include <cstdio>
#include <stdexcept>
#include <date/tz.h>
#include "LocalTime.hpp"

using namespace date;
using namespace std::chrono;

std::optional<int> LocalTime::parseClock(std::string const& text)
{
    if (text.empty())
        return std::nullopt;

    int h = 0, m = 0, s = 0;
    int fields = std::sscanf(text.c_str(), "%d:%d:%d", &h, &m, &s);
    if (fields < 2)
        return std::nullopt;
    if (fields == 2)
    {
        s = 0;
        if (text.back() == 'H')
            s = 30;
    }

    if (h < 0 || h > 47 || m < 0 || m > 59 || s < 0 || s > 59)
        return std::nullopt;

    return h * 3600 + m * 60 + s;
}

std::time_t LocalTime::toEpoch(std::string const& ssd, int secondsOfDay, std::string const& zone)
{
    int y = 0;
    unsigned mo = 0, d = 0;
    if (std::sscanf(ssd.c_str(), "%d-%u-%u", &y, &mo, &d) != 3)
        throw std::invalid_argument("Bad operating day: " + ssd);

    year_month_day ymd{year{y}, month{mo}, day{d}};
    if (!ymd.ok())
        throw std::invalid_argument("Bad operating day: " + ssd);

    auto tz = date::locate_zone(zone);
    local_seconds local = local_days{ymd} + seconds{secondsOfDay};
    auto sys = tz->to_sys(local, date::choose::earliest);

    return system_clock::to_time_t(sys);
}

std::string LocalTime::operatingDay(std::time_t t, std::string const& zone)
{
    zoned_time local{date::locate_zone(zone), system_clock::from_time_t(t)};
    auto day = date::floor<days>(local.get_local_time());
    return date::format("%F", day);
}

int LocalTime::secondsOfDay(std::time_t t, std::string const& zone)
{
    zoned_time local{date::locate_zone(zone), system_clock::from_time_t(t)};

    auto lt = local.get_local_time();
    auto day = date::floor<days>(lt);
    hh_mm_ss tod{date::floor<seconds>(lt - day)};

    return tod.hours().count() * 3600
         + tod.minutes().count() * 60
         + static_cast<int>(tod.seconds().count());
}

std::string LocalTime::format(std::time_t t, std::string const& zone)
{
    int sec = secondsOfDay(t, zone);

    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d", sec / 3600, (sec % 3600) / 60, sec % 60);
    return buf;
}
