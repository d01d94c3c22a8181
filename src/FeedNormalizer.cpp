#include <algorithm>
#include <cctype>
#include <iostream>
#include "FeedNormalizer.hpp"
#include "TimetableStore.hpp"
#include "CallResolver.hpp"

FeedNormalizer::FeedNormalizer(TimetableStore const& timetable, std::string zone)
    : timetable(timetable)
    , zone(std::move(zone))
{
}

std::optional<EventType> FeedNormalizer::mapEventType(std::string_view raw)
{
    std::string code(raw);
    std::transform(code.begin(), code.end(), code.begin(), [](unsigned char c) { return std::tolower(c); });

    if (code == "arr" || code == "arrival")
        return EventType::Arrival;
    if (code == "dep" || code == "departure")
        return EventType::Departure;
    if (code == "pass" || code == "passing")
        return EventType::Passing;
    if (code == "can" || code == "cancelled" || code == "deactivated")
        return EventType::Cancellation;
    if (code == "rein" || code == "reinstated")
        return EventType::Reinstatement;

    return std::nullopt;
}

std::optional<TrainUpdate> FeedNormalizer::normalize(movement_feed::MovementEvent const& event, std::uint64_t headerTimestamp)
{
    return toUpdate(event, headerTimestamp, {});
}

std::optional<TrainUpdate> FeedNormalizer::toUpdate(movement_feed::MovementEvent const& event, std::uint64_t headerTimestamp,
                                                    std::unordered_set<std::string> const& announced)
{
    if (!event.has_rid() || event.rid().empty() || !event.has_event())
    {
        ++malformed;
        return std::nullopt;
    }

    auto type = mapEventType(event.event());
    if (!type)
    {
        ++ignored;
        return std::nullopt;
    }

    if (!announced.count(event.rid()) && !timetable.contains(event.rid()))
    {
        ++ignored;
        return std::nullopt;
    }

    TrainUpdate update;
    update.serviceId       = event.rid();
    update.type            = *type;
    update.location        = event.tpl();
    update.sourceTimestamp = event.has_timestamp() ? event.timestamp() : headerTimestamp;

    bool movement = *type != EventType::Cancellation && *type != EventType::Reinstatement;
    if (event.has_actual_time())
    {
        update.reportedTime = static_cast<std::time_t>(event.actual_time());
        update.actual = true;
    }
    else if (event.has_estimated_time())
    {
        update.reportedTime = static_cast<std::time_t>(event.estimated_time());
    }
    else if (movement)
    {
        ++malformed;
        return std::nullopt;
    }

    if (movement && update.location.empty())
    {
        ++malformed;
        return std::nullopt;
    }

    return update;
}

std::optional<ServiceRecord> FeedNormalizer::normalize(movement_feed::ScheduleEvent const& schedule)
{
    if (!schedule.has_rid() || schedule.rid().empty() || !schedule.has_ssd() || schedule.ssd().empty())
    {
        ++malformed;
        return std::nullopt;
    }

    std::string day = timetable.day();
    if (!day.empty() && schedule.ssd() != day)
    {
        ++ignored;
        return std::nullopt;
    }

    ServiceRecord record;
    record.serviceId = schedule.rid();
    record.uid       = schedule.uid();
    record.headcode  = schedule.train_id();
    record.toc       = schedule.toc();
    record.ssd       = schedule.ssd();

    try
    {
        CallResolver resolver(schedule.ssd(), zone);
        for (auto const& c : schedule.call())
        {
            if (!c.has_tpl() || c.tpl().empty())
                continue;

            CallResolver::RawCall raw;
            raw.location = c.tpl();
            raw.pta      = c.pta();
            raw.ptd      = c.ptd();
            raw.wta      = c.wta();
            raw.wtd      = c.wtd();
            raw.wtp      = c.wtp();

            if (auto call = resolver.resolve(raw))
                record.calls.push_back(std::move(*call));
        }
    }
    catch (std::exception const& e)
    {
        std::cerr << "[Feed] Schedule " << schedule.rid() << " has unreadable times: " << e.what() << std::endl;
        ++malformed;
        return std::nullopt;
    }

    if (record.calls.empty())
    {
        ++malformed;
        return std::nullopt;
    }

    return record;
}

NormalizedFeed FeedNormalizer::normalize(std::string const& raw)
{
    if (raw.empty() || raw[0] == '<')
    {
        ++malformed;
        return {};
    }

    movement_feed::FeedMessage feed;
    if (!feed.ParseFromString(raw))
    {
        ++malformed;
        return {};
    }

    std::uint64_t ts = feed.header().timestamp();

    NormalizedFeed out;
    std::unordered_set<std::string> announced;
    for (auto const& schedule : feed.schedule())
    {
        if (auto record = normalize(schedule))
        {
            announced.insert(record->serviceId);
            out.schedules.push_back(std::move(*record));
        }
    }

    out.updates.reserve(feed.event_size());
    for (auto const& event : feed.event())
    {
        if (auto update = toUpdate(event, ts, announced))
            out.updates.push_back(std::move(*update));
    }

    return out;
}

std::uint64_t FeedNormalizer::ignoredCount() const
{
    return ignored.load();
}

std::uint64_t FeedNormalizer::malformedCount() const
{
    return malformed.load();
}
