#include <iostream>
#include "CrossingContext.hpp"
#include "Errors.hpp"
#include "VirtualClock.hpp"

CrossingContext::CrossingContext(CrossingSettings settings, RouteCalibration routes)
    : settings(std::move(settings))
    , routes(std::move(routes))
    , timetable(this->settings.protectingLocations)
    , estimator(this->settings, this->routes)
    , tracker(timetable, estimator, this->settings)
    , normalizer(timetable, this->settings.timeZone)
    , predictor(this->settings, estimator)
    , assembler(this->settings)
    , published(std::make_shared<Published const>())
{
}

bool CrossingContext::beginDay(std::string const& day, TimetableStore::Fetcher const& fetch)
{
    std::cout << "[System] Loading timetable for " << day << "..." << std::endl;

    std::size_t loaded = 0;
    try
    {
        loaded = timetable.load(day, fetch, routes);
    }
    catch (TimetableUnavailable const& e)
    {
        std::cerr << "[Timetable] " << e.what() << ". Serving "
                  << (timetable.day().empty() ? "no timetable" : "the timetable of " + timetable.day())
                  << " (degraded)." << std::endl;
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(dayMutex);
        if (currentDay != day)
        {
            tracker.clear();
            currentDay = day;
        }
    }

    std::size_t seeded = tracker.seed();
    std::cout << "[System] " << loaded << " services loaded, " << seeded << " new trains tracked." << std::endl;
    return true;
}

void CrossingContext::endDay()
{
    tracker.clear();
    {
        std::lock_guard<std::mutex> lock(publishMutex);
        published = std::make_shared<Published const>();
    }
    std::lock_guard<std::mutex> lock(dayMutex);
    std::cout << "[System] Operating day " << currentDay << " closed." << std::endl;
    currentDay.clear();
}

std::string CrossingContext::day() const
{
    std::lock_guard<std::mutex> lock(dayMutex);
    return currentDay;
}

ApplyResult CrossingContext::apply(TrainUpdate const& update)
{
    ApplyResult result = tracker.apply(update);
    if (result == ApplyResult::Applied)
        lastIngest.store(VirtualClock::now(), std::memory_order_relaxed);
    return result;
}

std::size_t CrossingContext::ingest(std::string const& rawMessage)
{
    NormalizedFeed feed = normalizer.normalize(rawMessage);

    std::size_t added = 0;
    for (auto& record : feed.schedules)
    {
        if (timetable.insert(std::move(record), routes))
            ++added;
    }
    if (added > 0)
        tracker.seed();

    std::size_t applied = 0;
    std::size_t stale = 0;
    std::size_t rejected = 0;
    for (auto const& update : feed.updates)
    {
        switch (apply(update))
        {
            case ApplyResult::Applied:        ++applied; break;
            case ApplyResult::Stale:          ++stale; break;
            case ApplyResult::Rejected:       ++rejected; break;
            case ApplyResult::UnknownService: break;
        }
    }

    if (stale > 0 || rejected > 0)
    {
        std::cout << "[Tracker] " << applied << " applied, " << stale << " stale, "
                  << rejected << " rejected." << std::endl;
    }
    return applied;
}

void CrossingContext::recompute(std::time_t now)
{
    tracker.expire(now);

    auto next = std::make_shared<Published>();
    next->trains = tracker.snapshot(now, settings.horizonMinutes);
    next->prediction = predictor.predict(next->trains, now);

    {
        std::lock_guard<std::mutex> lock(publishMutex);
        published = std::move(next);
    }
    lastRecompute.store(now, std::memory_order_relaxed);
}

std::shared_ptr<CrossingContext::Published const> CrossingContext::latest() const
{
    std::lock_guard<std::mutex> lock(publishMutex);
    return published;
}

CrossingStatus CrossingContext::currentStatus(std::time_t now) const
{
    auto snapshot = latest();

    CrossingStatus status;
    status.activeTrains = snapshot->trains;

    for (auto const& window : snapshot->prediction.closures)
    {
        if (window.end <= now)
            continue;

        if (window.start <= now)
            status.crossingOpen = false;
        status.nextClosure = window;
        break;
    }

    return status;
}

std::vector<TimelineSegment> CrossingContext::timeline(std::time_t now, int horizonMinutes) const
{
    return assembler.build(latest()->prediction, now, horizonMinutes);
}

std::vector<TimelineSegment> CrossingContext::timeline(std::time_t now) const
{
    return timeline(now, settings.horizonMinutes);
}

HealthReport CrossingContext::health(std::time_t now) const
{
    HealthReport report;
    report.feedConnected = feedConnected.load(std::memory_order_relaxed);
    report.degraded      = timetable.isDegraded();
    report.trainsTracked = tracker.size();

    std::string today = day();
    report.timetableLoadedForDay = !today.empty() && timetable.day() == today && !report.degraded;

    std::time_t ingestAt = lastIngest.load(std::memory_order_relaxed);
    if (ingestAt > 0)
        report.lastUpdateAgeSeconds = static_cast<std::int64_t>(now - ingestAt);

    std::time_t recomputeAt = lastRecompute.load(std::memory_order_relaxed);
    if (recomputeAt > 0)
        report.lastRecomputeAgeSeconds = static_cast<std::int64_t>(now - recomputeAt);

    return report;
}

void CrossingContext::setFeedConnected(bool connected)
{
    bool was = feedConnected.exchange(connected);
    if (was != connected)
        std::cout << "[Feed] " << (connected ? "Connected" : "Disconnected") << std::endl;
}
