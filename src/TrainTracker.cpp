#include <algorithm>
#include <iostream>
#include "TrainTracker.hpp"
#include "TimetableStore.hpp"
#include "CrossingEstimator.hpp"
#include "VirtualClock.hpp"

namespace
{
    constexpr std::int64_t kPunctualSlackSec = 60;
}

TrainTracker::TrainTracker(TimetableStore const& timetable, CrossingEstimator const& estimator, CrossingSettings const& settings)
    : timetable(timetable)
    , estimator(estimator)
    , settings(settings)
{
}

TrainState TrainTracker::makeState(ServiceRecord const& record) const
{
    TrainState state;
    state.serviceId         = record.serviceId;
    state.headcode          = record.headcode;
    state.classification    = CrossingEstimator::classify(record, settings);
    state.scheduledCrossing = estimator.baseline(record, state.classification);
    state.currentEstimate   = state.scheduledCrossing;
    return state;
}

std::size_t TrainTracker::seed()
{
    auto services = timetable.services();
    std::size_t added = 0;

    std::unique_lock<std::shared_mutex> lock(mapMutex);
    for (auto const& [id, record] : *services)
    {
        if (entries.count(id) || retired.count(id))
            continue;

        auto entry = std::make_shared<Entry>();
        entry->state = makeState(record);
        entries.emplace(id, std::move(entry));
        ++added;
    }
    return added;
}

std::shared_ptr<TrainTracker::Entry> TrainTracker::entryFor(std::string const& serviceId)
{
    {
        std::shared_lock<std::shared_mutex> lock(mapMutex);
        auto it = entries.find(serviceId);
        if (it != entries.end())
            return it->second;
        if (retired.count(serviceId))
            return nullptr;
    }

    auto record = timetable.lookup(serviceId);
    if (!record)
        return nullptr;

    std::unique_lock<std::shared_mutex> lock(mapMutex);
    if (retired.count(serviceId))
        return nullptr;

    auto& slot = entries[serviceId];
    if (!slot)
    {
        slot = std::make_shared<Entry>();
        slot->state = makeState(*record);
    }
    return slot;
}

void TrainTracker::refresh(TrainState& state) const
{
    auto estimate = estimator.estimate(state);
    state.currentEstimate = estimate ? std::optional<std::time_t>(estimate->crossingTime) : std::nullopt;

    if (state.currentEstimate && state.scheduledCrossing)
        state.delaySeconds = static_cast<std::int64_t>(*state.currentEstimate - *state.scheduledCrossing);
    else if (state.lastSighting && state.lastSighting->delaySeconds)
        state.delaySeconds = *state.lastSighting->delaySeconds;

    if (state.status == TrainStatus::Passed || state.status == TrainStatus::Cancelled)
        return;

    if (state.delaySeconds > kPunctualSlackSec)
        state.status = TrainStatus::RunningLate;
    else if (state.delaySeconds < -kPunctualSlackSec)
        state.status = TrainStatus::RunningEarly;
    else
        state.status = TrainStatus::Scheduled;
}

bool TrainTracker::beyondCrossing(TrainState const& state, ServiceRecord const* record, TrainUpdate const& update) const
{
    if (!update.actual)
        return false;

    if (settings.isProtecting(update.location))
        return update.type == EventType::Departure || update.type == EventType::Passing;

    if (!record || !state.scheduledCrossing)
        return false;

    ScheduledCall const* call = record->callAt(update.location);
    return call && call->scheduledTime > *state.scheduledCrossing;
}

ApplyResult TrainTracker::apply(TrainUpdate const& update)
{
    auto entry = entryFor(update.serviceId);
    if (!entry)
    {
        std::shared_lock<std::shared_mutex> lock(mapMutex);
        return retired.count(update.serviceId) ? ApplyResult::Stale : ApplyResult::UnknownService;
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    TrainState& state = entry->state;

    if (update.sourceTimestamp < state.lastUpdate)
        return ApplyResult::Stale;

    switch (update.type)
    {
        case EventType::Cancellation:
            state.status = TrainStatus::Cancelled;
            break;

        case EventType::Reinstatement:
            if (state.status == TrainStatus::Cancelled)
                state.status = TrainStatus::Scheduled;
            refresh(state);
            break;

        case EventType::Arrival:
        case EventType::Departure:
        case EventType::Passing:
        {
            if (!state.isStopping() && update.type != EventType::Passing && settings.isProtecting(update.location))
                return ApplyResult::Rejected;

            auto record = timetable.lookup(update.serviceId);
            ServiceRecord const* rec = record ? &*record : nullptr;

            Sighting sighting;
            sighting.location     = update.location;
            sighting.type         = update.type;
            sighting.reportedTime = update.reportedTime;
            sighting.actual       = update.actual;

            if (ScheduledCall const* call = rec ? rec->callAt(update.location) : nullptr)
            {
                std::time_t scheduled = call->scheduledTime;
                if (update.type == EventType::Arrival && call->scheduledArrival)
                    scheduled = *call->scheduledArrival;
                sighting.delaySeconds = static_cast<std::int64_t>(update.reportedTime - scheduled);
            }

            state.lastSighting = std::move(sighting);
            if (state.status == TrainStatus::Passed)
                state.status = TrainStatus::Scheduled;
            refresh(state);

            entry->passConfirmed = false;
            if (state.status != TrainStatus::Cancelled && beyondCrossing(state, rec, update))
            {
                state.status = TrainStatus::Passed;
                entry->passConfirmed = true;
            }
            break;
        }
    }

    state.lastUpdate = update.sourceTimestamp;
    lastApplied.store(VirtualClock::now(), std::memory_order_relaxed);
    return ApplyResult::Applied;
}

std::vector<TrainState> TrainTracker::snapshot(std::time_t now, int horizonMinutes) const
{
    std::time_t from = now - static_cast<std::time_t>(settings.retentionMinutes) * 60;
    std::time_t to   = now + static_cast<std::time_t>(horizonMinutes) * 60;

    std::vector<TrainState> out;
    {
        std::shared_lock<std::shared_mutex> lock(mapMutex);
        out.reserve(entries.size());

        for (auto const& [id, entry] : entries)
        {
            std::lock_guard<std::mutex> entryLock(entry->mutex);
            auto const& est = entry->state.currentEstimate;
            if (est && *est >= from && *est <= to)
                out.push_back(entry->state);
        }
    }

    std::sort(out.begin(), out.end(), [](TrainState const& a, TrainState const& b) {
        if (*a.currentEstimate != *b.currentEstimate)
            return *a.currentEstimate < *b.currentEstimate;
        return a.serviceId < b.serviceId;
    });
    return out;
}

std::optional<TrainState> TrainTracker::find(std::string const& serviceId) const
{
    std::shared_lock<std::shared_mutex> lock(mapMutex);
    auto it = entries.find(serviceId);
    if (it == entries.end())
        return std::nullopt;

    std::lock_guard<std::mutex> entryLock(it->second->mutex);
    return it->second->state;
}

std::size_t TrainTracker::expire(std::time_t now)
{
    std::time_t retention = static_cast<std::time_t>(settings.retentionMinutes) * 60;
    std::size_t removed = 0;

    std::unique_lock<std::shared_mutex> lock(mapMutex);
    for (auto it = entries.begin(); it != entries.end();)
    {
        bool drop = false;
        {
            std::lock_guard<std::mutex> entryLock(it->second->mutex);
            TrainState& state = it->second->state;

            if (state.currentEstimate)
            {
                // Inferred from the clock only; a later report revives the service.
                if (state.isActive() && now > *state.currentEstimate + settings.clearTimeSec)
                    state.status = TrainStatus::Passed;

                drop = it->second->passConfirmed
                    && state.status == TrainStatus::Passed
                    && now > *state.currentEstimate + retention;
            }
        }

        if (drop)
        {
            retired.insert(it->first);
            it = entries.erase(it);
            ++removed;
        }
        else
        {
            ++it;
        }
    }
    return removed;
}

void TrainTracker::clear()
{
    std::unique_lock<std::shared_mutex> lock(mapMutex);
    entries.clear();
    retired.clear();
}

std::size_t TrainTracker::size() const
{
    std::shared_lock<std::shared_mutex> lock(mapMutex);
    return entries.size();
}

std::time_t TrainTracker::lastAppliedAt() const
{
    return lastApplied.load(std::memory_order_relaxed);
}
