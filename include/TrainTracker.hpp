#pragma once
#include <atomic>
#include <ctime>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "Types.hpp"

class TimetableStore;
class CrossingEstimator;

enum class ApplyResult
{
    Applied,
    Stale,            // older than the stored source timestamp, or the service already retired
    UnknownService,
    Rejected          // inconsistent with the service's classification
};

// Live state of every service affecting the crossing today.
class TrainTracker
{
public:
    TrainTracker(TimetableStore const& timetable, CrossingEstimator const& estimator, CrossingSettings const& settings);

    // Creates baseline states for services not tracked yet. Returns the number added.
    std::size_t seed();

    ApplyResult apply(TrainUpdate const& update);

    // States with an estimate in [now - retention, now + horizon], by estimate then id.
    std::vector<TrainState> snapshot(std::time_t now, int horizonMinutes) const;

    std::optional<TrainState> find(std::string const& serviceId) const;
    std::size_t expire(std::time_t now);
    void clear();
    std::size_t size() const;

    // Wall-clock time of the last applied update, 0 if none.
    std::time_t lastAppliedAt() const;

private:
    struct Entry
    {
        mutable std::mutex mutex;
        TrainState state;
        bool passConfirmed = false;   // Passed came from a report, not from the clock
    };

    TimetableStore const& timetable;
    CrossingEstimator const& estimator;
    CrossingSettings const& settings;

    mutable std::shared_mutex mapMutex;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries;
    std::unordered_set<std::string> retired;   // confirmed passed and dropped, ignored until clear()
    std::atomic<std::time_t> lastApplied{0};

    std::shared_ptr<Entry> entryFor(std::string const& serviceId);
    TrainState makeState(ServiceRecord const& record) const;
    void refresh(TrainState& state) const;
    bool beyondCrossing(TrainState const& state, ServiceRecord const* record, TrainUpdate const& update) const;
};
