#include "RouteCalibration.hpp"
#include "Errors.hpp"

#include <iostream>
#include <fstream>
#include <sstream>

RouteCalibration::RouteCalibration(std::string const& filepath)
{
    std::ifstream file(filepath);
    if (!file.is_open())
    {
        std::cerr << "[Calibration] ERROR: Could not open " << filepath
                  << ", passing trains will use the default offset.\n";
        return;
    }

    std::string line;
    std::getline(file, line);

    int lineNo = 1;
    while (std::getline(file, line))
    {
        ++lineNo;
        if (line.empty() || line[0] == '#') continue;

        std::stringstream ss(line);
        std::string pattern, origins, destinations, reference, running, speed, lead, clear;

        std::getline(ss, pattern, ',');
        std::getline(ss, origins, ',');
        std::getline(ss, destinations, ',');
        std::getline(ss, reference, ',');
        std::getline(ss, running, ',');
        std::getline(ss, speed, ',');
        std::getline(ss, lead, ',');
        std::getline(ss, clear, ',');

        RouteCalibrationEntry entry;
        entry.pattern           = pattern;
        entry.origins           = splitCodes(origins);
        entry.destinations      = splitCodes(destinations);
        entry.referenceLocation = reference;
        entry.speedClass        = speed;

        try
        {
            entry.runningTimeSec = std::stoi(running);
            if (!lead.empty())  entry.leadTimeSec  = std::stoi(lead);
            if (!clear.empty()) entry.clearTimeSec = std::stoi(clear);
        }
        catch (std::exception const&)
        {
            std::cerr << "[Calibration] Skipping line " << lineNo << " of " << filepath
                      << ": bad number\n";
            continue;
        }

        if (entry.pattern.empty() || entry.referenceLocation.empty())
        {
            std::cerr << "[Calibration] Skipping line " << lineNo << " of " << filepath
                      << ": pattern and reference location are required\n";
            continue;
        }

        add(std::move(entry));
    }

    std::cout << "[Calibration] Loaded " << entries.size() << " route patterns\n";
}

std::vector<std::string> RouteCalibration::splitCodes(std::string const& field)
{
    std::vector<std::string> codes;
    std::stringstream ss(field);
    std::string code;
    while (std::getline(ss, code, '|'))
    {
        if (!code.empty())
            codes.push_back(code);
    }
    return codes;
}

bool RouteCalibration::matches(std::vector<std::string> const& codes, std::string const& location)
{
    for (auto const& code : codes)
    {
        if (code == "*" || code == location)
            return true;
    }
    return false;
}

void RouteCalibration::add(RouteCalibrationEntry entry)
{
    auto it = byPattern.find(entry.pattern);
    if (it != byPattern.end())
    {
        entries[it->second] = std::move(entry);
        return;
    }

    byPattern[entry.pattern] = entries.size();
    entries.push_back(std::move(entry));
}

bool RouteCalibration::contains(std::string const& pattern) const
{
    return byPattern.count(pattern) > 0;
}

std::size_t RouteCalibration::size() const
{
    return entries.size();
}

RouteCalibrationEntry const& RouteCalibration::entry(std::string const& pattern) const
{
    auto it = byPattern.find(pattern);
    if (it == byPattern.end())
        throw UncalibratedRoute(pattern);
    return entries[it->second];
}

std::time_t RouteCalibration::estimateCrossingTime(std::string const& pattern, std::time_t referenceSighting) const
{
    return referenceSighting + entry(pattern).runningTimeSec;
}

std::string RouteCalibration::patternFor(std::string const& origin, std::string const& destination) const
{
    for (auto const& e : entries)
    {
        if (matches(e.origins, origin) && matches(e.destinations, destination))
            return e.pattern;
    }
    return "";
}
