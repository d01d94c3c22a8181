#pragma once
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "Types.hpp"

class RouteCalibration;

// The operating day's services relevant to the crossing. Read-only between loads.
class TimetableStore
{
public:
    using Table   = std::unordered_map<std::string, ServiceRecord>;
    using Fetcher = std::function<std::vector<ServiceRecord>(std::string const& day)>;

    explicit TimetableStore(std::vector<std::string> protectingLocations);

    // Builds a new table and publishes it in one swap. On failure the previous
    // table stays in place, the store turns degraded and TimetableUnavailable is thrown.
    std::size_t load(std::string const& day, Fetcher const& fetch, RouteCalibration const& routes);

    // Adds or replaces one service announced during the day by publishing a
    // modified copy of the table. False when the service does not affect the crossing.
    bool insert(ServiceRecord record, RouteCalibration const& routes);

    std::optional<ServiceRecord> lookup(std::string const& serviceId) const;
    bool contains(std::string const& serviceId) const;
    std::shared_ptr<Table const> services() const;

    std::string day() const;
    bool isDegraded() const;
    std::size_t size() const;

    bool isRelevant(ServiceRecord const& record) const;

private:
    std::vector<std::string> protectingLocations;

    mutable std::mutex swapMutex;
    std::shared_ptr<Table const> table;
    std::string loadedDay;
    bool degraded = false;
};
