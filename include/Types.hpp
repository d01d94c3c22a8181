#pragma once
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <variant>
#include <vector>

enum class CallType
{
    Stop,
    Pass
};

struct ScheduledCall
{
    std::string location;                        // TIPLOC
    std::time_t scheduledTime = 0;               // departure for stops, pass time for passes
    CallType callType = CallType::Pass;
    std::optional<std::time_t> scheduledArrival;  // stops only

    bool operator==(ScheduledCall const&) const = default;
};

// One service of the operating day, as loaded from the timetable snapshot.
struct ServiceRecord
{
    std::string serviceId;   // RID
    std::string headcode;
    std::string uid;
    std::string toc;
    std::string ssd;         // YYYY-MM-DD
    std::vector<ScheduledCall> calls;
    std::string routePattern;

    ScheduledCall const* callAt(std::string const& location) const
    {
        for (auto const& call : calls)
        {
            if (call.location == location)
                return &call;
        }
        return nullptr;
    }

    std::string origin() const { return calls.empty() ? "" : calls.front().location; }
    std::string destination() const { return calls.empty() ? "" : calls.back().location; }
};

enum class EventType
{
    Departure,
    Arrival,
    Passing,
    Cancellation,
    Reinstatement
};

struct TrainUpdate
{
    std::string serviceId;
    std::string location;
    EventType type = EventType::Passing;
    std::time_t reportedTime = 0;
    bool actual = false;
    std::uint64_t sourceTimestamp = 0;   // ms
};

enum class TrainStatus
{
    Scheduled,
    RunningEarly,
    RunningLate,
    Passed,
    Cancelled
};

struct Stopping
{
    std::string callingPoint;
    std::string calibrationKey;   // route pattern for lead/clear overrides

    bool operator==(Stopping const&) const = default;
};

struct Passing
{
    std::string calibrationKey;

    bool operator==(Passing const&) const = default;
};

using Classification = std::variant<Stopping, Passing>;

struct Sighting
{
    std::string location;
    EventType type = EventType::Passing;
    std::time_t reportedTime = 0;
    bool actual = false;
    std::optional<std::int64_t> delaySeconds;   // against the schedule at this location

    bool operator==(Sighting const&) const = default;
};

struct TrainState
{
    std::string serviceId;
    std::string headcode;
    Classification classification;
    TrainStatus status = TrainStatus::Scheduled;
    std::optional<std::time_t> scheduledCrossing;
    std::optional<std::time_t> currentEstimate;
    std::int64_t delaySeconds = 0;
    std::uint64_t lastUpdate = 0;   // source timestamp of the last applied update, ms
    std::optional<Sighting> lastSighting;

    bool isActive() const
    {
        return status != TrainStatus::Passed && status != TrainStatus::Cancelled;
    }

    bool isStopping() const { return std::holds_alternative<Stopping>(classification); }

    bool operator==(TrainState const&) const = default;
};

enum class WindowKind
{
    Single,
    Merged
};

struct ClosureWindow
{
    std::time_t start = 0;
    std::time_t end = 0;
    std::vector<std::string> services;
    WindowKind kind = WindowKind::Single;

    bool operator==(ClosureWindow const&) const = default;
};

struct Opening
{
    std::time_t start = 0;
    std::time_t end = 0;
    bool brief = false;

    bool operator==(Opening const&) const = default;
};

struct ClosurePrediction
{
    std::time_t computedAt = 0;
    std::vector<ClosureWindow> closures;
    std::vector<Opening> openings;

    bool operator==(ClosurePrediction const&) const = default;
};

enum class SegmentType
{
    Closure,
    Opening
};

struct TimelineSegment
{
    SegmentType type = SegmentType::Opening;
    std::time_t start = 0;
    std::time_t end = 0;
    std::vector<std::string> trains;
    bool brief = false;

    bool operator==(TimelineSegment const&) const = default;
};

struct CrossingStatus
{
    bool crossingOpen = true;
    std::optional<ClosureWindow> nextClosure;
    std::vector<TrainState> activeTrains;
};

struct HealthReport
{
    bool feedConnected = false;
    bool timetableLoadedForDay = false;
    bool degraded = false;
    std::optional<std::int64_t> lastUpdateAgeSeconds;
    std::optional<std::int64_t> lastRecomputeAgeSeconds;
    std::size_t trainsTracked = 0;

    bool healthy() const { return feedConnected && timetableLoadedForDay; }
};

// Tuning values of the prediction core. All durations in seconds.
struct CrossingSettings
{
    std::string crossingName = "Roydon";
    std::vector<std::string> protectingLocations = {"ROYDON"};
    std::string timeZone = "Europe/London";
    int leadTimeSec = 120;
    int clearTimeSec = 30;
    int mergeGapSec = 60;
    int briefOpeningSec = 300;
    int dwellSec = 45;
    int departureClearanceSec = 15;
    int defaultOffsetSec = 0;
    int uncalibratedMarginSec = 120;
    int horizonMinutes = 90;
    int retentionMinutes = 5;

    bool isProtecting(std::string const& location) const
    {
        for (auto const& l : protectingLocations)
        {
            if (l == location)
                return true;
        }
        return false;
    }
};

char const* toString(EventType type);
char const* toString(TrainStatus status);
