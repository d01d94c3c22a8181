#include <algorithm>
#include <gtest/gtest.h>
#include "CrossingContext.hpp"
#include "Errors.hpp"
#include "VirtualClock.hpp"
#include "TestSupport.hpp"

namespace
{
    std::vector<ServiceRecord> twoTrains()
    {
        return {
            service("A", {passAt("LIVST", at(9, 30)), passAt("ROYDON", at(10, 0))}),
            service("B", {passAt("HERTFDE", at(9, 40)), passAt("ROYDON", at(10, 1, 30))}),
        };
    }

    bool timelineMentions(std::vector<TimelineSegment> const& timeline, std::string const& id)
    {
        return std::any_of(timeline.begin(), timeline.end(), [&](TimelineSegment const& s) {
            return std::find(s.trains.begin(), s.trains.end(), id) != s.trains.end();
        });
    }

    std::string feedOf(std::string rid, std::string tpl, std::string code, std::time_t estimated, std::uint64_t timestamp)
    {
        movement_feed::FeedMessage feed;
        feed.mutable_header()->set_timestamp(timestamp);
        auto* e = feed.add_event();
        e->set_rid(rid);
        e->set_tpl(tpl);
        e->set_event(code);
        e->set_estimated_time(estimated);
        return feed.SerializeAsString();
    }

    std::string scheduleOf(std::string rid, std::vector<std::pair<std::string, std::string>> passes, std::uint64_t timestamp)
    {
        movement_feed::FeedMessage feed;
        feed.mutable_header()->set_timestamp(timestamp);
        auto* s = feed.add_schedule();
        s->set_rid(rid);
        s->set_ssd(kDay);
        for (auto const& [tpl, wtp] : passes)
        {
            auto* call = s->add_call();
            call->set_tpl(tpl);
            call->set_wtp(wtp);
        }
        auto* e = feed.add_event();
        e->set_rid(rid);
        e->set_tpl(passes.front().first);
        e->set_event("dep");
        e->set_actual_time(at(9, 40));
        return feed.SerializeAsString();
    }

    class CrossingContextTest : public ::testing::Test
    {
    protected:
        CrossingContext ctx{testSettings(), testRoutes()};

        void TearDown() override
        {
            VirtualClock::disable();
        }
    };
}

TEST_F(CrossingContextTest, PredictsMergedClosureForTwoTrains)
{
    ASSERT_TRUE(ctx.beginDay(kDay, fixedFetcher(twoTrains())));
    ctx.recompute(at(9, 30));

    auto timeline = ctx.timeline(at(9, 30), 90);
    ASSERT_EQ(timeline.size(), 3u);
    EXPECT_EQ(timeline[0].type, SegmentType::Opening);
    EXPECT_EQ(timeline[1].type, SegmentType::Closure);
    EXPECT_EQ(timeline[1].start, at(9, 58, 30));
    EXPECT_EQ(timeline[1].end, at(10, 2));
    EXPECT_EQ(timeline[1].trains, (std::vector<std::string>{"A", "B"}));
    EXPECT_EQ(timeline[2].end, at(11, 0));

    auto status = ctx.currentStatus(at(9, 30));
    EXPECT_TRUE(status.crossingOpen);
    ASSERT_TRUE(status.nextClosure.has_value());
    EXPECT_EQ(status.nextClosure->start, at(9, 58, 30));
    EXPECT_EQ(status.nextClosure->kind, WindowKind::Merged);
    EXPECT_EQ(status.activeTrains.size(), 2u);

    auto during = ctx.currentStatus(at(9, 59));
    EXPECT_FALSE(during.crossingOpen);
    EXPECT_EQ(during.nextClosure->end, at(10, 2));
}

TEST_F(CrossingContextTest, CancelledTrainLeavesTimelineOnNextRecompute)
{
    ctx.beginDay(kDay, fixedFetcher(twoTrains()));
    ctx.recompute(at(9, 30));

    ASSERT_EQ(ctx.apply(movement("A", "", EventType::Cancellation, 0, false, 1000)), ApplyResult::Applied);
    EXPECT_TRUE(timelineMentions(ctx.timeline(at(9, 30)), "A"));

    ctx.recompute(at(9, 31));

    auto timeline = ctx.timeline(at(9, 31));
    EXPECT_FALSE(timelineMentions(timeline, "A"));
    EXPECT_TRUE(timelineMentions(timeline, "B"));

    auto status = ctx.currentStatus(at(9, 31));
    auto it = std::find_if(status.activeTrains.begin(), status.activeTrains.end(),
                           [](TrainState const& t) { return t.serviceId == "A"; });
    ASSERT_NE(it, status.activeTrains.end());
    EXPECT_EQ(it->status, TrainStatus::Cancelled);
    EXPECT_EQ(status.nextClosure->start, at(10, 0));
}

TEST_F(CrossingContextTest, LiveUpdateSplitsClosure)
{
    ctx.beginDay(kDay, fixedFetcher(twoTrains()));

    EXPECT_EQ(ctx.ingest(feedOf("A", "ROYDON", "pass", at(10, 10), 2000)), 1u);
    ctx.recompute(at(9, 30));

    auto timeline = ctx.timeline(at(9, 30));
    ASSERT_EQ(timeline.size(), 5u);
    EXPECT_EQ(timeline[1].trains, (std::vector<std::string>{"B"}));
    EXPECT_EQ(timeline[3].trains, (std::vector<std::string>{"A"}));
    EXPECT_EQ(timeline[3].start, at(10, 8, 30));
}

TEST_F(CrossingContextTest, UncalibratedPassingTrainUsesDefaultOffset)
{
    CrossingSettings settings = testSettings();
    settings.defaultOffsetSec = 240;
    CrossingContext freightCtx(settings, testRoutes());

    std::vector<ServiceRecord> services = {
        service("F", {passAt("TEMPLEM", at(10, 0)), passAt("HLWTWN", at(10, 20))}, "freight"),
    };
    ASSERT_TRUE(freightCtx.beginDay(kDay, fixedFetcher(services)));

    freightCtx.recompute(at(10, 0));
    EXPECT_FALSE(timelineMentions(freightCtx.timeline(at(10, 0)), "F"));

    freightCtx.apply(movement("F", "HLWTWN", EventType::Passing, at(10, 21), true, 1000));
    freightCtx.recompute(at(10, 0));

    auto timeline = freightCtx.timeline(at(10, 0));
    ASSERT_TRUE(timelineMentions(timeline, "F"));

    auto closure = std::find_if(timeline.begin(), timeline.end(),
                                [](TimelineSegment const& s) { return s.type == SegmentType::Closure; });
    EXPECT_EQ(closure->start, at(10, 25) - 90 - 120);
    EXPECT_EQ(closure->end, at(10, 25) + 30 + 120);
}

TEST_F(CrossingContextTest, MissingTimetableIsDegraded)
{
    auto failing = [](std::string const&) -> std::vector<ServiceRecord> {
        throw TimetableUnavailable("snapshot missing");
    };

    ctx.setFeedConnected(true);
    EXPECT_FALSE(ctx.beginDay(kDay, failing));

    auto health = ctx.health(at(9, 30));
    EXPECT_TRUE(health.feedConnected);
    EXPECT_FALSE(health.timetableLoadedForDay);
    EXPECT_TRUE(health.degraded);
    EXPECT_FALSE(health.healthy());
}

TEST_F(CrossingContextTest, HealthReportsFreshness)
{
    VirtualClock::set(at(9, 30));

    auto before = ctx.health(at(9, 30));
    EXPECT_FALSE(before.healthy());
    EXPECT_FALSE(before.lastUpdateAgeSeconds.has_value());
    EXPECT_FALSE(before.lastRecomputeAgeSeconds.has_value());

    ctx.beginDay(kDay, fixedFetcher(twoTrains()));
    ctx.setFeedConnected(true);
    ctx.apply(movement("A", "LIVST", EventType::Departure, at(9, 30), true, 1000));
    ctx.recompute(at(9, 30, 5));

    auto health = ctx.health(at(9, 30, 20));
    EXPECT_TRUE(health.healthy());
    EXPECT_FALSE(health.degraded);
    EXPECT_EQ(health.lastUpdateAgeSeconds, 20);
    EXPECT_EQ(health.lastRecomputeAgeSeconds, 15);
    EXPECT_EQ(health.trainsTracked, 2u);

    ctx.setFeedConnected(false);
    EXPECT_FALSE(ctx.health(at(9, 30, 20)).healthy());
}

TEST_F(CrossingContextTest, NewDayReplacesTrains)
{
    ctx.beginDay(kDay, fixedFetcher(twoTrains()));
    ctx.apply(movement("A", "", EventType::Cancellation, 0, false, 1000));

    std::vector<ServiceRecord> tomorrow = {
        service("A", {passAt("ROYDON", kMidnight + 86400 + 36000)}),
        service("C", {passAt("ROYDON", kMidnight + 86400 + 36600)}),
    };
    ASSERT_TRUE(ctx.beginDay("2026-01-14", fixedFetcher(tomorrow)));

    EXPECT_EQ(ctx.day(), "2026-01-14");
    EXPECT_EQ(ctx.getTracker().size(), 2u);
    EXPECT_EQ(ctx.getTracker().find("A")->status, TrainStatus::Scheduled);
    EXPECT_FALSE(ctx.getTracker().find("B").has_value());
}

TEST_F(CrossingContextTest, EndDayClearsPublishedState)
{
    ctx.beginDay(kDay, fixedFetcher(twoTrains()));
    ctx.recompute(at(9, 30));
    ctx.endDay();

    EXPECT_TRUE(ctx.day().empty());
    EXPECT_EQ(ctx.getTracker().size(), 0u);
    EXPECT_FALSE(ctx.currentStatus(at(9, 30)).nextClosure.has_value());
    EXPECT_FALSE(ctx.health(at(9, 30)).timetableLoadedForDay);
}

TEST_F(CrossingContextTest, ContextsAreIndependent)
{
    CrossingContext other(testSettings(), testRoutes());
    ctx.beginDay(kDay, fixedFetcher(twoTrains()));
    other.beginDay(kDay, fixedFetcher(twoTrains()));

    ctx.apply(movement("A", "", EventType::Cancellation, 0, false, 1000));

    EXPECT_EQ(ctx.getTracker().find("A")->status, TrainStatus::Cancelled);
    EXPECT_EQ(other.getTracker().find("A")->status, TrainStatus::Scheduled);
}

TEST_F(CrossingContextTest, ScheduleFromFeedAddsTrainMidDay)
{
    ctx.beginDay(kDay, fixedFetcher(twoTrains()));
    ctx.recompute(at(9, 30));
    EXPECT_FALSE(timelineMentions(ctx.timeline(at(9, 30)), "V"));

    EXPECT_EQ(ctx.ingest(scheduleOf("V", {{"LIVST", "09:40"}, {"ROYDON", "10:20"}, {"HLWTWN", "10:25"}}, 2000)), 1u);
    EXPECT_TRUE(ctx.getTimetable().contains("V"));
    ASSERT_TRUE(ctx.getTracker().find("V").has_value());
    EXPECT_EQ(ctx.getTracker().find("V")->scheduledCrossing, at(10, 20));

    ctx.recompute(at(9, 45));
    auto timeline = ctx.timeline(at(9, 45));
    EXPECT_TRUE(timelineMentions(timeline, "V"));
    EXPECT_TRUE(timelineMentions(timeline, "A"));

    EXPECT_EQ(ctx.ingest(scheduleOf("W", {{"HERTFDE", "09:40"}, {"HERTFDN", "09:50"}}, 2000)), 0u);
    EXPECT_FALSE(ctx.getTimetable().contains("W"));
}

TEST_F(CrossingContextTest, LateTrainGoingQuietKeepsItsClosure)
{
    ctx.beginDay(kDay, fixedFetcher(twoTrains()));

    ctx.recompute(at(10, 6));
    ctx.recompute(at(10, 8));
    EXPECT_FALSE(timelineMentions(ctx.timeline(at(10, 8)), "A"));

    EXPECT_EQ(ctx.ingest(feedOf("A", "ROYDON", "pass", at(10, 12), 3000)), 1u);
    ctx.recompute(at(10, 8));

    auto status = ctx.currentStatus(at(10, 8));
    ASSERT_TRUE(status.nextClosure.has_value());
    EXPECT_EQ(status.nextClosure->start, at(10, 10, 30));
    EXPECT_TRUE(timelineMentions(ctx.timeline(at(10, 8)), "A"));
}
