#include "Types.hpp"

char const* toString(EventType type)
{
    switch (type)
    {
        case EventType::Departure:     return "departure";
        case EventType::Arrival:       return "arrival";
        case EventType::Passing:       return "passing";
        case EventType::Cancellation:  return "cancellation";
        case EventType::Reinstatement: return "reinstatement";
    }
    return "unknown";
}

char const* toString(TrainStatus status)
{
    switch (status)
    {
        case TrainStatus::Scheduled:    return "scheduled";
        case TrainStatus::RunningEarly: return "running-early";
        case TrainStatus::RunningLate:  return "running-late";
        case TrainStatus::Passed:       return "passed";
        case TrainStatus::Cancelled:    return "cancelled";
    }
    return "unknown";
}
