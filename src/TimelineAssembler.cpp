#include <algorithm>
#include "TimelineAssembler.hpp"

TimelineAssembler::TimelineAssembler(CrossingSettings const& settings)
    : settings(settings)
{
}

std::vector<TimelineSegment> TimelineAssembler::build(ClosurePrediction const& prediction, std::time_t now, int horizonMinutes) const
{
    std::vector<TimelineSegment> segments;
    if (horizonMinutes <= 0)
        return segments;

    std::time_t horizonEnd = now + static_cast<std::time_t>(horizonMinutes) * 60;
    std::time_t cursor = now;
    bool interior = false;

    for (auto const& window : prediction.closures)
    {
        if (window.end <= now)
            continue;
        if (window.start >= horizonEnd)
            break;

        std::time_t start = std::max(window.start, cursor);
        std::time_t end   = std::min(window.end, horizonEnd);
        if (end <= start)
            continue;

        if (start > cursor)
        {
            TimelineSegment opening;
            opening.type  = SegmentType::Opening;
            opening.start = cursor;
            opening.end   = start;
            opening.brief = interior && (start - cursor) < settings.briefOpeningSec;
            segments.push_back(std::move(opening));
        }

        TimelineSegment closure;
        closure.type   = SegmentType::Closure;
        closure.start  = start;
        closure.end    = end;
        closure.trains = window.services;
        segments.push_back(std::move(closure));

        cursor = end;
        interior = true;
    }

    if (cursor < horizonEnd)
    {
        TimelineSegment opening;
        opening.type  = SegmentType::Opening;
        opening.start = cursor;
        opening.end   = horizonEnd;
        segments.push_back(std::move(opening));
    }

    return segments;
}
