#include <algorithm>
#include "ClosurePredictor.hpp"
#include "CrossingEstimator.hpp"

namespace
{
    struct Contributor
    {
        std::time_t crossingTime;
        std::string serviceId;
    };

    void finish(ClosureWindow& window, std::vector<Contributor>& contributors)
    {
        std::sort(contributors.begin(), contributors.end(), [](Contributor const& a, Contributor const& b) {
            if (a.crossingTime != b.crossingTime)
                return a.crossingTime < b.crossingTime;
            return a.serviceId < b.serviceId;
        });

        window.services.clear();
        for (auto& c : contributors)
            window.services.push_back(std::move(c.serviceId));
        window.kind = window.services.size() > 1 ? WindowKind::Merged : WindowKind::Single;
        contributors.clear();
    }
}

ClosurePredictor::ClosurePredictor(CrossingSettings const& settings, CrossingEstimator const& estimator)
    : settings(settings)
    , estimator(estimator)
{
}

std::vector<ClosureInterval> ClosurePredictor::intervals(std::vector<TrainState> const& snapshot) const
{
    std::vector<ClosureInterval> out;
    out.reserve(snapshot.size());

    for (auto const& state : snapshot)
    {
        if (!state.isActive())
            continue;

        auto estimate = estimator.estimate(state);
        if (!estimate)
            continue;

        ClosureInterval interval;
        interval.serviceId    = state.serviceId;
        interval.crossingTime = estimate->crossingTime;
        interval.start        = estimate->crossingTime - estimate->leadTimeSec;
        interval.end          = estimate->crossingTime + estimate->clearTimeSec;
        interval.calibrated   = estimate->calibrated;
        out.push_back(std::move(interval));
    }
    return out;
}

ClosurePrediction ClosurePredictor::merge(std::vector<ClosureInterval> intervals, int mergeGapSec, int briefOpeningSec)
{
    std::sort(intervals.begin(), intervals.end(), [](ClosureInterval const& a, ClosureInterval const& b) {
        if (a.start != b.start)
            return a.start < b.start;
        if (a.crossingTime != b.crossingTime)
            return a.crossingTime < b.crossingTime;
        return a.serviceId < b.serviceId;
    });

    ClosurePrediction prediction;
    if (intervals.empty())
        return prediction;

    ClosureWindow current;
    std::vector<Contributor> contributors;

    current.start = intervals.front().start;
    current.end   = intervals.front().end;

    for (auto const& interval : intervals)
    {
        if (!contributors.empty() && interval.start - current.end >= mergeGapSec)
        {
            finish(current, contributors);
            prediction.closures.push_back(std::move(current));

            current = ClosureWindow{};
            current.start = interval.start;
            current.end   = interval.end;
        }

        current.end = std::max(current.end, interval.end);
        contributors.push_back({interval.crossingTime, interval.serviceId});
    }

    finish(current, contributors);
    prediction.closures.push_back(std::move(current));

    for (std::size_t i = 1; i < prediction.closures.size(); ++i)
    {
        Opening gap;
        gap.start = prediction.closures[i - 1].end;
        gap.end   = prediction.closures[i].start;
        gap.brief = gap.end - gap.start < briefOpeningSec;
        prediction.openings.push_back(gap);
    }

    return prediction;
}

ClosurePrediction ClosurePredictor::predict(std::vector<TrainState> const& snapshot, std::time_t now) const
{
    ClosurePrediction prediction = merge(intervals(snapshot), settings.mergeGapSec, settings.briefOpeningSec);
    prediction.computedAt = now;
    return prediction;
}
