#pragma once
#include <ctime>
#include <vector>
#include "Types.hpp"

// Cuts a closure prediction down to the [now, now + horizon] timeline.
class TimelineAssembler
{
public:
    explicit TimelineAssembler(CrossingSettings const& settings);

    std::vector<TimelineSegment> build(ClosurePrediction const& prediction, std::time_t now, int horizonMinutes = 90) const;

private:
    CrossingSettings const& settings;
};
