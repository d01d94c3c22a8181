#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include "ConfigurationManager.hpp"

std::string ConfigurationManager::readString(char const* name, std::string const& fallback)
{
    const char* value = std::getenv(name);
    if (!value || !*value)
        return fallback;
    return value;
}

int ConfigurationManager::readInt(char const* name, int fallback, int minimum)
{
    const char* value = std::getenv(name);
    if (!value || !*value)
        return fallback;

    std::size_t used = 0;
    int parsed = 0;
    try
    {
        parsed = std::stoi(value, &used);
    }
    catch (std::exception const&)
    {
        throw std::runtime_error(std::string(name) + " is not a number: " + value);
    }

    if (used != std::string(value).size())
        throw std::runtime_error(std::string(name) + " is not a number: " + value);
    if (parsed < minimum)
        throw std::runtime_error(std::string(name) + " must be at least " + std::to_string(minimum));

    return parsed;
}

std::vector<std::string> ConfigurationManager::splitList(std::string const& value, char separator)
{
    std::vector<std::string> out;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, separator))
    {
        if (!item.empty())
            out.push_back(item);
    }
    return out;
}

ConfigurationManager::ConfigurationManager()
{
    settings.crossingName = readString("CROSSING_NAME", settings.crossingName);
    settings.timeZone     = readString("CROSSING_TZ", settings.timeZone);

    auto tiplocs = splitList(readString("CROSSING_TIPLOCS", "ROYDON"), ',');
    if (tiplocs.empty())
        throw std::runtime_error("CROSSING_TIPLOCS names no location.");
    settings.protectingLocations = tiplocs;

    settings.leadTimeSec           = readInt("LEAD_TIME_SEC", settings.leadTimeSec, 0);
    settings.clearTimeSec          = readInt("CLEAR_TIME_SEC", settings.clearTimeSec, 0);
    settings.mergeGapSec           = readInt("MERGE_GAP_SEC", settings.mergeGapSec, 0);
    settings.briefOpeningSec       = readInt("BRIEF_OPENING_SEC", settings.briefOpeningSec, 0);
    settings.dwellSec              = readInt("DWELL_SEC", settings.dwellSec, 0);
    settings.departureClearanceSec = readInt("DEPARTURE_CLEARANCE_SEC", settings.departureClearanceSec, 0);
    settings.defaultOffsetSec      = readInt("DEFAULT_OFFSET_SEC", settings.defaultOffsetSec, -3600);
    settings.uncalibratedMarginSec = readInt("UNCALIBRATED_MARGIN_SEC", settings.uncalibratedMarginSec, 0);
    settings.horizonMinutes        = readInt("HORIZON_MIN", settings.horizonMinutes, 1);
    settings.retentionMinutes      = readInt("RETENTION_MIN", settings.retentionMinutes, 0);

    recomputeSeconds = readInt("RECOMPUTE_SEC", recomputeSeconds, 1);
    pollSeconds      = readInt("POLL_SEC", pollSeconds, 1);
    queueCapacity    = static_cast<std::size_t>(readInt("QUEUE_CAPACITY", 1024, 1));
    dayStartHour     = readInt("DAY_START_HOUR", dayStartHour, 0);
    if (dayStartHour > 23)
        throw std::runtime_error("DAY_START_HOUR must be below 24.");

    int port = readInt("HTTP_PORT", httpPort, 1);
    if (port > 65535)
        throw std::runtime_error("HTTP_PORT out of range.");
    httpPort = static_cast<unsigned short>(port);

    calibrationPath = readString("CALIBRATION_PATH", "data/routes.csv");
    timetablePath   = readString("TIMETABLE_DB", "data/timetable.db");

    feed.name   = "Movement feed";
    feed.host   = readString("FEED_HOST", "");
    feed.port   = readString("FEED_PORT", DEFAULT_FEED_PORT);
    feed.target = readString("FEED_TARGET", "/");
    apiKey      = readString("FEED_API_KEY", "");
}

CrossingSettings const& ConfigurationManager::getSettings() const noexcept { return settings; }
FeedEndpoint const& ConfigurationManager::getFeed() const noexcept { return feed; }
bool ConfigurationManager::hasFeed() const noexcept { return !feed.host.empty(); }
std::string ConfigurationManager::getAPIKey() const noexcept { return apiKey; }
std::string ConfigurationManager::getCalibrationPath() const noexcept { return calibrationPath; }
std::string ConfigurationManager::getTimetablePath() const noexcept { return timetablePath; }
unsigned short ConfigurationManager::getHttpPort() const noexcept { return httpPort; }
int ConfigurationManager::getRecomputeSeconds() const noexcept { return recomputeSeconds; }
int ConfigurationManager::getPollSeconds() const noexcept { return pollSeconds; }
std::size_t ConfigurationManager::getQueueCapacity() const noexcept { return queueCapacity; }
int ConfigurationManager::getDayStartHour() const noexcept { return dayStartHour; }
