#pragma once
#include <ctime>
#include <string>
#include <vector>
#include "Types.hpp"

// HTML rendering of the crossing status for the presentation layer.
class Dashboard
{
public:
    static std::string generate(CrossingStatus const& status,
                                std::vector<TimelineSegment> const& timeline,
                                HealthReport const& health,
                                CrossingSettings const& settings,
                                std::time_t now);

    static std::string healthText(HealthReport const& health);

private:
    static std::string buildHtmlHead(CrossingStatus const& status, CrossingSettings const& settings, std::time_t now);
    static std::string buildTimeline(std::vector<TimelineSegment> const& timeline, std::string const& zone);
    static std::string buildTrainTable(std::vector<TrainState> const& trains, std::string const& zone);
    static std::string formatDelay(TrainState const& t);
    static std::string formatDuration(std::time_t seconds);
};
