#include "CrossingEstimator.hpp"
#include "RouteCalibration.hpp"
#include "Errors.hpp"

namespace
{
    template <class... Ts>
    struct overloaded : Ts...
    {
        using Ts::operator()...;
    };
    template <class... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;
}

CrossingEstimator::CrossingEstimator(CrossingSettings const& settings, RouteCalibration const& routes)
    : settings(settings)
    , routes(routes)
{
}

Classification CrossingEstimator::classify(ServiceRecord const& record, CrossingSettings const& settings)
{
    for (auto const& call : record.calls)
    {
        if (call.callType == CallType::Stop && settings.isProtecting(call.location))
            return Stopping{call.location, record.routePattern};
    }
    return Passing{record.routePattern};
}

std::optional<std::time_t> CrossingEstimator::baseline(ServiceRecord const& record, Classification const& classification) const
{
    return std::visit(overloaded{
        [&](Stopping const& s) -> std::optional<std::time_t> {
            ScheduledCall const* call = record.callAt(s.callingPoint);
            if (!call)
                return std::nullopt;
            return call->scheduledTime + settings.departureClearanceSec;
        },
        [&](Passing const& p) -> std::optional<std::time_t> {
            for (auto const& location : settings.protectingLocations)
            {
                if (ScheduledCall const* call = record.callAt(location))
                    return call->scheduledTime;
            }

            if (!routes.contains(p.calibrationKey))
                return std::nullopt;

            auto const& entry = routes.entry(p.calibrationKey);
            ScheduledCall const* reference = record.callAt(entry.referenceLocation);
            if (!reference)
                return std::nullopt;
            return reference->scheduledTime + entry.runningTimeSec;
        }
    }, classification);
}

CrossingEstimate CrossingEstimator::withMargins(std::time_t crossing, std::string const& pattern) const
{
    CrossingEstimate out;
    out.crossingTime = crossing;
    out.leadTimeSec  = settings.leadTimeSec;
    out.clearTimeSec = settings.clearTimeSec;

    if (!pattern.empty() && routes.contains(pattern))
    {
        auto const& entry = routes.entry(pattern);
        if (entry.leadTimeSec)  out.leadTimeSec  = *entry.leadTimeSec;
        if (entry.clearTimeSec) out.clearTimeSec = *entry.clearTimeSec;
    }
    return out;
}

CrossingEstimate CrossingEstimator::uncalibrated(std::time_t crossing) const
{
    CrossingEstimate out;
    out.crossingTime = crossing;
    out.leadTimeSec  = settings.leadTimeSec + settings.uncalibratedMarginSec;
    out.clearTimeSec = settings.clearTimeSec + settings.uncalibratedMarginSec;
    out.calibrated   = false;
    return out;
}

std::optional<CrossingEstimate> CrossingEstimator::estimateStopping(Stopping const& stopping, TrainState const& state) const
{
    std::string const& key = stopping.calibrationKey;

    if (state.lastSighting)
    {
        Sighting const& s = *state.lastSighting;
        if (s.location == stopping.callingPoint)
        {
            switch (s.type)
            {
                case EventType::Arrival:
                    return withMargins(s.reportedTime + settings.dwellSec + settings.departureClearanceSec, key);
                case EventType::Departure:
                    return withMargins(s.reportedTime + settings.departureClearanceSec, key);
                case EventType::Passing:
                    return withMargins(s.reportedTime, key);
                default:
                    break;
            }
        }
        else if (s.delaySeconds && state.scheduledCrossing)
        {
            return withMargins(*state.scheduledCrossing + *s.delaySeconds, key);
        }
    }

    if (state.scheduledCrossing)
        return withMargins(*state.scheduledCrossing, key);
    return std::nullopt;
}

std::optional<CrossingEstimate> CrossingEstimator::estimatePassing(Passing const& passing, TrainState const& state) const
{
    std::string const& key = passing.calibrationKey;

    if (!state.lastSighting)
    {
        if (!state.scheduledCrossing)
            return std::nullopt;
        return withMargins(*state.scheduledCrossing, key);
    }

    Sighting const& s = *state.lastSighting;

    if (settings.isProtecting(s.location))
        return withMargins(s.reportedTime, key);

    try
    {
        auto const& entry = routes.entry(key);
        if (s.location == entry.referenceLocation)
            return withMargins(routes.estimateCrossingTime(key, s.reportedTime), key);
    }
    catch (UncalibratedRoute const&)
    {
        // Falls back to the schedule below, then to the default offset.
    }

    if (s.delaySeconds && state.scheduledCrossing)
        return withMargins(*state.scheduledCrossing + *s.delaySeconds, key);

    return uncalibrated(s.reportedTime + settings.defaultOffsetSec);
}

std::optional<CrossingEstimate> CrossingEstimator::estimate(TrainState const& state) const
{
    return std::visit(overloaded{
        [&](Stopping const& s) { return estimateStopping(s, state); },
        [&](Passing const& p) { return estimatePassing(p, state); }
    }, state.classification);
}
