#pragma once
#include <stdexcept>
#include <string>

// The day's timetable snapshot could not be fetched or parsed.
class TimetableUnavailable : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class UncalibratedRoute : public std::runtime_error
{
public:
    explicit UncalibratedRoute(std::string route)
        : std::runtime_error("No calibration for route '" + route + "'")
        , pattern(std::move(route))
    {
    }

    std::string const& route() const noexcept { return pattern; }

private:
    std::string pattern;
};
