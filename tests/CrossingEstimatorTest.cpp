#include <gtest/gtest.h>
#include "CrossingEstimator.hpp"
#include "TestSupport.hpp"

namespace
{
    class CrossingEstimatorTest : public ::testing::Test
    {
    protected:
        CrossingSettings settings = testSettings();
        RouteCalibration routes = testRoutes();
        CrossingEstimator estimator{settings, routes};

        TrainState stateFor(ServiceRecord const& record) const
        {
            TrainState state;
            state.serviceId         = record.serviceId;
            state.classification    = CrossingEstimator::classify(record, settings);
            state.scheduledCrossing = estimator.baseline(record, state.classification);
            state.currentEstimate   = state.scheduledCrossing;
            return state;
        }
    };
}

TEST_F(CrossingEstimatorTest, ClassifiesByCallAtCrossing)
{
    auto stopping = service("S", {stopAt("ROYDON", at(9, 59), at(10, 0))});
    auto passing  = service("P", {passAt("ROYDON", at(10, 0))}, "cambridge-outbound");

    EXPECT_EQ(CrossingEstimator::classify(stopping, settings), Classification(Stopping{"ROYDON"}));
    EXPECT_EQ(CrossingEstimator::classify(passing, settings), Classification(Passing{"cambridge-outbound"}));
}

TEST_F(CrossingEstimatorTest, StoppingBaselineAddsDepartureClearance)
{
    settings.departureClearanceSec = 15;
    auto record = service("S", {stopAt("ROYDON", at(10, 0), at(10, 1))});
    EXPECT_EQ(estimator.baseline(record, Stopping{"ROYDON"}), at(10, 1, 15));
}

TEST_F(CrossingEstimatorTest, PassingBaselineFromTimetableOrCalibration)
{
    auto direct = service("P1", {passAt("ROYDON", at(10, 0))});
    EXPECT_EQ(estimator.baseline(direct, Passing{""}), at(10, 0));

    auto viaReference = service("P2", {passAt("LIVST", at(9, 30)), passAt("BROXBRN", at(9, 57, 15))}, "cambridge-outbound");
    EXPECT_EQ(estimator.baseline(viaReference, Passing{"cambridge-outbound"}), at(10, 0));

    auto unknown = service("P3", {passAt("HLWTWN", at(10, 5))}, "freight");
    EXPECT_EQ(estimator.baseline(unknown, Passing{"freight"}), std::nullopt);
}

TEST_F(CrossingEstimatorTest, StoppingTrainArrivalAddsDwell)
{
    auto state = stateFor(service("S", {stopAt("ROYDON", at(9, 59), at(10, 0))}));
    state.lastSighting = Sighting{"ROYDON", EventType::Arrival, at(10, 2), true, 180};

    auto estimate = estimator.estimate(state);
    ASSERT_TRUE(estimate.has_value());
    EXPECT_EQ(estimate->crossingTime, at(10, 2, 45));
    EXPECT_EQ(estimate->leadTimeSec, 90);
    EXPECT_EQ(estimate->clearTimeSec, 30);
    EXPECT_TRUE(estimate->calibrated);
}

TEST_F(CrossingEstimatorTest, StoppingTrainDelayElsewhereShiftsSchedule)
{
    auto state = stateFor(service("S", {stopAt("BROXBRN", at(9, 50), at(9, 51)), stopAt("ROYDON", at(9, 59), at(10, 0))}));
    state.lastSighting = Sighting{"BROXBRN", EventType::Departure, at(9, 53), true, 120};

    EXPECT_EQ(estimator.estimate(state)->crossingTime, at(10, 2));
}

TEST_F(CrossingEstimatorTest, ReferenceSightingUsesRouteRunningTime)
{
    auto state = stateFor(service("P", {passAt("LIVST", at(9, 30)), passAt("BROXBRN", at(9, 57, 15))}, "cambridge-outbound"));
    state.lastSighting = Sighting{"BROXBRN", EventType::Passing, at(10, 2), true, 285};

    auto estimate = estimator.estimate(state);
    ASSERT_TRUE(estimate.has_value());
    EXPECT_EQ(estimate->crossingTime, at(10, 4, 45));
    EXPECT_TRUE(estimate->calibrated);
}

TEST_F(CrossingEstimatorTest, RouteOverridesLeadTime)
{
    auto state = stateFor(service("P", {passAt("STANAIR", at(9, 40)), passAt("BSHPSFD", at(9, 52)), passAt("ROYDON", at(10, 0))}, "stansted-inbound"));

    auto estimate = estimator.estimate(state);
    ASSERT_TRUE(estimate.has_value());
    EXPECT_EQ(estimate->leadTimeSec, 150);
    EXPECT_EQ(estimate->clearTimeSec, 30);
}

TEST_F(CrossingEstimatorTest, StoppingTrainUsesRouteOverrides)
{
    auto record = service("S", {stopAt("STANAIR", at(9, 40), at(9, 40)), stopAt("ROYDON", at(9, 59), at(10, 0)), stopAt("LIVST", at(10, 30), at(10, 30))}, "stansted-inbound");
    auto state = stateFor(record);
    EXPECT_EQ(state.classification, Classification(Stopping{"ROYDON", "stansted-inbound"}));

    auto scheduled = estimator.estimate(state);
    ASSERT_TRUE(scheduled.has_value());
    EXPECT_EQ(scheduled->crossingTime, at(10, 0));
    EXPECT_EQ(scheduled->leadTimeSec, 150);
    EXPECT_EQ(scheduled->clearTimeSec, 30);

    state.lastSighting = Sighting{"ROYDON", EventType::Arrival, at(10, 2), true, 180};
    auto sighted = estimator.estimate(state);
    ASSERT_TRUE(sighted.has_value());
    EXPECT_EQ(sighted->crossingTime, at(10, 2, 45));
    EXPECT_EQ(sighted->leadTimeSec, 150);
}

TEST_F(CrossingEstimatorTest, UncalibratedRouteFallsBackToDefaultOffset)
{
    settings.defaultOffsetSec = 240;
    auto state = stateFor(service("F", {passAt("HLWTWN", at(10, 5))}, "freight"));
    ASSERT_FALSE(state.scheduledCrossing.has_value());

    state.lastSighting = Sighting{"HLWTWN", EventType::Passing, at(10, 6), true, 60};

    auto estimate = estimator.estimate(state);
    ASSERT_TRUE(estimate.has_value());
    EXPECT_EQ(estimate->crossingTime, at(10, 10));
    EXPECT_FALSE(estimate->calibrated);
    EXPECT_EQ(estimate->leadTimeSec, 90 + 120);
    EXPECT_EQ(estimate->clearTimeSec, 30 + 120);
}

TEST_F(CrossingEstimatorTest, NoTimesMeansNoEstimate)
{
    auto state = stateFor(service("F", {passAt("HLWTWN", at(10, 5))}, "freight"));
    EXPECT_EQ(estimator.estimate(state), std::nullopt);
}
