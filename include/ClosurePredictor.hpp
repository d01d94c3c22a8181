#pragma once
#include <ctime>
#include <string>
#include <vector>
#include "Types.hpp"

class CrossingEstimator;

struct ClosureInterval
{
    std::string serviceId;
    std::time_t crossingTime = 0;
    std::time_t start = 0;
    std::time_t end = 0;
    bool calibrated = true;
};

// Turns a tracker snapshot into barrier-down windows. Holds no state of its own.
class ClosurePredictor
{
public:
    ClosurePredictor(CrossingSettings const& settings, CrossingEstimator const& estimator);

    ClosurePrediction predict(std::vector<TrainState> const& snapshot, std::time_t now) const;
    std::vector<ClosureInterval> intervals(std::vector<TrainState> const& snapshot) const;

    // Intervals whose gap is below mergeGapSec join one window; a gap of exactly
    // mergeGapSec or more leaves them apart and becomes an opening.
    static ClosurePrediction merge(std::vector<ClosureInterval> intervals, int mergeGapSec, int briefOpeningSec);

private:
    CrossingSettings const& settings;
    CrossingEstimator const& estimator;
};
