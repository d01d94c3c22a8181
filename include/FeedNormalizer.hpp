#pragma once
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>
#include "movement_feed.pb.h"
#include "Types.hpp"

class TimetableStore;

// Schedules announced and movements reported by one feed message.
struct NormalizedFeed
{
    std::vector<ServiceRecord> schedules;
    std::vector<TrainUpdate> updates;
};

// Maps raw movement-feed messages onto canonical TrainUpdates and ServiceRecords.
class FeedNormalizer
{
public:
    FeedNormalizer(TimetableStore const& timetable, std::string zone);

    NormalizedFeed normalize(std::string const& raw);
    std::optional<TrainUpdate> normalize(movement_feed::MovementEvent const& event, std::uint64_t headerTimestamp);
    std::optional<ServiceRecord> normalize(movement_feed::ScheduleEvent const& schedule);

    static std::optional<EventType> mapEventType(std::string_view raw);

    std::uint64_t ignoredCount() const;
    std::uint64_t malformedCount() const;

private:
    TimetableStore const& timetable;
    std::string zone;

    std::optional<TrainUpdate> toUpdate(movement_feed::MovementEvent const& event, std::uint64_t headerTimestamp,
                                        std::unordered_set<std::string> const& announced);
    std::atomic<std::uint64_t> ignored{0};
    std::atomic<std::uint64_t> malformed{0};
};
