#pragma once
#include <ctime>
#include <optional>
#include "Types.hpp"

class RouteCalibration;

struct CrossingEstimate
{
    std::time_t crossingTime = 0;
    int leadTimeSec = 0;
    int clearTimeSec = 0;
    bool calibrated = true;   // false when the default offset stood in for a route calibration
};

// Converts what is known about a train into the time it reaches the crossing.
class CrossingEstimator
{
public:
    CrossingEstimator(CrossingSettings const& settings, RouteCalibration const& routes);

    static Classification classify(ServiceRecord const& record, CrossingSettings const& settings);

    std::optional<std::time_t> baseline(ServiceRecord const& record, Classification const& classification) const;
    std::optional<CrossingEstimate> estimate(TrainState const& state) const;

private:
    CrossingSettings const& settings;
    RouteCalibration const& routes;

    std::optional<CrossingEstimate> estimateStopping(Stopping const& stopping, TrainState const& state) const;
    std::optional<CrossingEstimate> estimatePassing(Passing const& passing, TrainState const& state) const;

    CrossingEstimate withMargins(std::time_t crossing, std::string const& pattern) const;
    CrossingEstimate uncalibrated(std::time_t crossing) const;
};
