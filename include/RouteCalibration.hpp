#pragma once
#include <ctime>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct RouteCalibrationEntry
{
    std::string pattern;
    std::vector<std::string> origins;        // "*" matches any
    std::vector<std::string> destinations;
    std::string referenceLocation;
    int runningTimeSec = 0;                  // reference point to crossing, negative if the crossing comes first
    std::string speedClass;
    std::optional<int> leadTimeSec;
    std::optional<int> clearTimeSec;
};

// Per-route running times from a reference sighting point to the crossing.
class RouteCalibration
{
private:
    std::vector<RouteCalibrationEntry> entries;
    std::unordered_map<std::string, std::size_t> byPattern;

    static std::vector<std::string> splitCodes(std::string const& field);
    static bool matches(std::vector<std::string> const& codes, std::string const& location);

public:
    RouteCalibration() = default;
    explicit RouteCalibration(std::string const& filepath);

    void add(RouteCalibrationEntry entry);
    bool contains(std::string const& pattern) const;
    std::size_t size() const;

    // Throws UncalibratedRoute.
    RouteCalibrationEntry const& entry(std::string const& pattern) const;
    std::time_t estimateCrossingTime(std::string const& pattern, std::time_t referenceSighting) const;

    // First rule whose endpoints match, or an empty string.
    std::string patternFor(std::string const& origin, std::string const& destination) const;
};
