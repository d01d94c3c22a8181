#include <algorithm>
#include <iostream>
#include "TimetableStore.hpp"
#include "RouteCalibration.hpp"
#include "Errors.hpp"

TimetableStore::TimetableStore(std::vector<std::string> protectingLocations)
    : protectingLocations(std::move(protectingLocations))
    , table(std::make_shared<Table const>())
{
}

bool TimetableStore::isRelevant(ServiceRecord const& record) const
{
    if (!record.routePattern.empty())
        return true;

    return std::any_of(record.calls.begin(), record.calls.end(), [this](ScheduledCall const& call) {
        return std::find(protectingLocations.begin(), protectingLocations.end(), call.location)
            != protectingLocations.end();
    });
}

std::size_t TimetableStore::load(std::string const& day, Fetcher const& fetch, RouteCalibration const& routes)
{
    auto next = std::make_shared<Table>();
    std::size_t fetched = 0;

    try
    {
        std::vector<ServiceRecord> records = fetch(day);
        fetched = records.size();

        for (auto& record : records)
        {
            if (record.serviceId.empty() || record.calls.empty())
                continue;

            if (record.routePattern.empty())
                record.routePattern = routes.patternFor(record.origin(), record.destination());

            if (!isRelevant(record))
                continue;

            std::string id = record.serviceId;
            (*next)[id] = std::move(record);
        }
    }
    catch (TimetableUnavailable const&)
    {
        std::lock_guard<std::mutex> lock(swapMutex);
        degraded = true;
        throw;
    }
    catch (std::exception const& e)
    {
        std::lock_guard<std::mutex> lock(swapMutex);
        degraded = true;
        throw TimetableUnavailable("Timetable for " + day + " could not be loaded: " + e.what());
    }

    if (next->empty())
    {
        std::lock_guard<std::mutex> lock(swapMutex);
        degraded = true;
        throw TimetableUnavailable("Timetable for " + day + " has no services at the crossing");
    }

    std::size_t count = next->size();
    {
        std::lock_guard<std::mutex> lock(swapMutex);
        table     = std::move(next);
        loadedDay = day;
        degraded  = false;
    }

    std::cout << "[Timetable] " << day << ": " << count << " of " << fetched
              << " services affect the crossing." << std::endl;
    return count;
}

bool TimetableStore::insert(ServiceRecord record, RouteCalibration const& routes)
{
    if (record.serviceId.empty() || record.calls.empty())
        return false;

    if (record.routePattern.empty())
        record.routePattern = routes.patternFor(record.origin(), record.destination());

    if (!isRelevant(record))
        return false;

    std::string id = record.serviceId;
    bool replaced = false;
    {
        std::lock_guard<std::mutex> lock(swapMutex);
        auto next = std::make_shared<Table>(*table);
        replaced = next->count(id) > 0;
        (*next)[id] = std::move(record);
        table = std::move(next);
    }

    std::cout << "[Timetable] " << (replaced ? "Revised" : "Added") << " service " << id
              << " from the feed." << std::endl;
    return true;
}

std::shared_ptr<TimetableStore::Table const> TimetableStore::services() const
{
    std::lock_guard<std::mutex> lock(swapMutex);
    return table;
}

std::optional<ServiceRecord> TimetableStore::lookup(std::string const& serviceId) const
{
    auto current = services();
    auto it = current->find(serviceId);
    if (it == current->end())
        return std::nullopt;
    return it->second;
}

bool TimetableStore::contains(std::string const& serviceId) const
{
    return services()->count(serviceId) > 0;
}

std::string TimetableStore::day() const
{
    std::lock_guard<std::mutex> lock(swapMutex);
    return loadedDay;
}

bool TimetableStore::isDegraded() const
{
    std::lock_guard<std::mutex> lock(swapMutex);
    return degraded;
}

std::size_t TimetableStore::size() const
{
    return services()->size();
}
