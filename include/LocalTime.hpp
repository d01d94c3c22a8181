#pragma once
#include <ctime>
#include <optional>
#include <string>

// Conversions between railway local clock times and epoch seconds.
class LocalTime
{
public:
    // "HH:MM" or "HH:MM:SS" to seconds after midnight. Half-minutes ("HH:MMH") are accepted.
    static std::optional<int> parseClock(std::string const& text);

    // Seconds after local midnight of the operating day (may exceed 24h) to epoch seconds.
    static std::time_t toEpoch(std::string const& ssd, int secondsOfDay, std::string const& zone);

    static std::string operatingDay(std::time_t t, std::string const& zone);
    static int secondsOfDay(std::time_t t, std::string const& zone);
    static std::string format(std::time_t t, std::string const& zone);
};
