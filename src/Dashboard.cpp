#include <sstream>
#include <ctime>
#include "LocalTime.hpp"
#include "Dashboard.hpp"

std::string Dashboard::formatDuration(std::time_t seconds)
{
    std::stringstream ss;
    ss << seconds / 60 << "m " << seconds % 60 << "s";
    return ss.str();
}

std::string Dashboard::buildHtmlHead(CrossingStatus const& status, CrossingSettings const& settings, std::time_t now)
{
    std::stringstream ss;

    ss << "<html><head><title>" << settings.crossingName << " Level Crossing</title>"
       << "<style>"
       << "body { font-family: sans-serif; background: #1a1a1a; color: #ddd; padding: 20px; }"
       << "h1 { border-bottom: 2px solid #444; padding-bottom: 10px; }"
       << "table { width: 100%; border-collapse: collapse; margin-top: 20px; }"
       << "th { text-align: left; background: #333; padding: 10px; border-bottom: 2px solid #555; }"
       << "td { padding: 10px; border-bottom: 1px solid #333; }"
       << "tr:hover { background: #2c2c2c; }"
       << ".open { color: #2ecc71; font-weight: bold; }"
       << ".closed { color: #e74c3c; font-weight: bold; }"
       << ".seg-closure { border-left: 5px solid #e74c3c; }"
       << ".seg-opening { border-left: 5px solid #2ecc71; }"
       << ".seg-brief { border-left: 5px solid #f1c40f; }"
       << ".badge { background: #444; padding: 2px 5px; border-radius: 3px; "
                     "font-size: 0.8em; margin-right:5px;}"
       << "</style>"
       << "<meta charset='UTF-8'>"
       << "<meta http-equiv='refresh' content='15'>"
       << "</head><body>";

    ss << "<h1>" << settings.crossingName << " Level Crossing</h1>";
    ss << "<p>" << LocalTime::format(now, settings.timeZone) << " | ";
    if (status.crossingOpen)
        ss << "<span class='open'>OPEN</span>";
    else
        ss << "<span class='closed'>CLOSED</span>";

    if (status.nextClosure)
    {
        auto const& w = *status.nextClosure;
        ss << (status.crossingOpen ? ". Next closure " : ". Reopens ")
           << LocalTime::format(status.crossingOpen ? w.start : w.end, settings.timeZone)
           << " (" << w.services.size() << (w.services.size() == 1 ? " train" : " trains") << ")";
    }
    ss << "</p>";

    return ss.str();
}

std::string Dashboard::buildTimeline(std::vector<TimelineSegment> const& timeline, std::string const& zone)
{
    std::stringstream ss;
    ss << "<table><thead><tr>"
       << "<th>From</th>"
       << "<th>To</th>"
       << "<th>State</th>"
       << "<th>Duration</th>"
       << "<th>Trains</th>"
       << "</tr></thead><tbody>";

    for (auto const& seg : timeline)
    {
        bool closure = seg.type == SegmentType::Closure;
        std::string cls = closure ? "seg-closure" : (seg.brief ? "seg-brief" : "seg-opening");
        std::string label = closure ? "CLOSED" : (seg.brief ? "BRIEF OPENING" : "OPEN");

        ss << "<tr class='" << cls << "'>"
           << "<td>" << LocalTime::format(seg.start, zone) << "</td>"
           << "<td>" << LocalTime::format(seg.end, zone) << "</td>"
           << "<td>" << label << "</td>"
           << "<td>" << formatDuration(seg.end - seg.start) << "</td>"
           << "<td>";
        for (auto const& id : seg.trains)
            ss << "<span class='badge'>" << id << "</span>";
        ss << "</td></tr>";
    }

    ss << "</tbody></table>";
    return ss.str();
}

std::string Dashboard::formatDelay(TrainState const& t)
{
    if (t.status == TrainStatus::Cancelled)
        return "<span style='color:#777'>Cancelled</span>";

    std::int64_t minutes = t.delaySeconds / 60;
    std::string color = "#888";
    if (t.delaySeconds > 60)       color = "#e74c3c";
    else if (t.delaySeconds < -60) color = "#2ecc71";

    std::stringstream ss;
    ss << "<span style='color:" << color << "; font-weight:bold'>"
       << (minutes > 0 ? "+" : "") << minutes << "m</span>";
    return ss.str();
}

std::string Dashboard::buildTrainTable(std::vector<TrainState> const& trains, std::string const& zone)
{
    std::stringstream ss;
    ss << "<table><thead><tr>"
       << "<th>Train</th>"
       << "<th>Type</th>"
       << "<th>Scheduled</th>"
       << "<th>Expected</th>"
       << "<th>Status</th>"
       << "<th>Delay</th>"
       << "</tr></thead><tbody>";

    for (auto const& t : trains)
    {
        ss << "<tr>"
           << "<td><b>" << (t.headcode.empty() ? t.serviceId : t.headcode) << "</b>"
           << " <span style='color:#666; font-size:0.8em'>(" << t.serviceId << ")</span></td>"
           << "<td><span class='badge'>" << (t.isStopping() ? "stopping" : "passing") << "</span></td>"
           << "<td>" << (t.scheduledCrossing ? LocalTime::format(*t.scheduledCrossing, zone) : "-") << "</td>"
           << "<td>" << (t.currentEstimate ? LocalTime::format(*t.currentEstimate, zone) : "-") << "</td>"
           << "<td>" << toString(t.status) << "</td>"
           << "<td>" << formatDelay(t) << "</td>"
           << "</tr>";
    }

    ss << "</tbody></table>";
    return ss.str();
}

std::string Dashboard::generate(CrossingStatus const& status,
                                std::vector<TimelineSegment> const& timeline,
                                HealthReport const& health,
                                CrossingSettings const& settings,
                                std::time_t now)
{
    std::stringstream ss;
    ss << buildHtmlHead(status, settings, now);
    ss << buildTimeline(timeline, settings.timeZone);
    ss << buildTrainTable(status.activeTrains, settings.timeZone);

    ss << "<p style='color:#777; font-size:0.8em'>"
       << "Feed " << (health.feedConnected ? "connected" : "disconnected")
       << " | Timetable " << (health.timetableLoadedForDay ? "loaded" : "missing")
       << (health.degraded ? " (degraded)" : "")
       << "</p>";

    ss << "</body></html>";

    return ss.str();
}

std::string Dashboard::healthText(HealthReport const& health)
{
    std::stringstream ss;
    ss << "status=" << (health.healthy() ? "ok" : "degraded") << "\n"
       << "feed_connected=" << (health.feedConnected ? "true" : "false") << "\n"
       << "timetable_loaded_for_day=" << (health.timetableLoadedForDay ? "true" : "false") << "\n"
       << "timetable_degraded=" << (health.degraded ? "true" : "false") << "\n"
       << "last_update_age=";
    if (health.lastUpdateAgeSeconds)
        ss << *health.lastUpdateAgeSeconds;
    else
        ss << "none";
    ss << "\nlast_recompute_age=";
    if (health.lastRecomputeAgeSeconds)
        ss << *health.lastRecomputeAgeSeconds;
    else
        ss << "none";
    ss << "\ntrains_tracked=" << health.trainsTracked << "\n";
    return ss.str();
}
