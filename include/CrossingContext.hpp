#pragma once
#include <atomic>
#include <ctime>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "Types.hpp"
#include "RouteCalibration.hpp"
#include "TimetableStore.hpp"
#include "CrossingEstimator.hpp"
#include "TrainTracker.hpp"
#include "FeedNormalizer.hpp"
#include "ClosurePredictor.hpp"
#include "TimelineAssembler.hpp"

// Everything the crossing knows about one operating day. Several contexts may
// live side by side (tests, more than one crossing).
class CrossingContext
{
public:
    CrossingContext(CrossingSettings settings, RouteCalibration routes);

    CrossingContext(CrossingContext const&) = delete;
    CrossingContext& operator=(CrossingContext const&) = delete;

    // Loads the day's timetable and seeds the tracker. Returns false, keeping
    // the previous timetable, when the snapshot is unavailable.
    bool beginDay(std::string const& day, TimetableStore::Fetcher const& fetch);
    void endDay();
    std::string day() const;

    std::size_t ingest(std::string const& rawMessage);
    ApplyResult apply(TrainUpdate const& update);

    // Publishes a complete new prediction, or leaves the previous one in place.
    void recompute(std::time_t now);

    CrossingStatus currentStatus(std::time_t now) const;
    std::vector<TimelineSegment> timeline(std::time_t now, int horizonMinutes) const;
    std::vector<TimelineSegment> timeline(std::time_t now) const;
    HealthReport health(std::time_t now) const;

    void setFeedConnected(bool connected);

    CrossingSettings const& getSettings() const noexcept { return settings; }
    TimetableStore const& getTimetable() const noexcept { return timetable; }
    TrainTracker const& getTracker() const noexcept { return tracker; }

private:
    struct Published
    {
        std::vector<TrainState> trains;
        ClosurePrediction prediction;
    };

    CrossingSettings settings;
    RouteCalibration routes;
    TimetableStore timetable;
    CrossingEstimator estimator;
    TrainTracker tracker;
    FeedNormalizer normalizer;
    ClosurePredictor predictor;
    TimelineAssembler assembler;

    mutable std::mutex publishMutex;
    std::shared_ptr<Published const> published;

    mutable std::mutex dayMutex;
    std::string currentDay;

    std::atomic<bool> feedConnected{false};
    std::atomic<std::time_t> lastIngest{0};
    std::atomic<std::time_t> lastRecompute{0};

    std::shared_ptr<Published const> latest() const;
};
