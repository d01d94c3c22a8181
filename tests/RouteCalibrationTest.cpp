#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include "RouteCalibration.hpp"
#include "Errors.hpp"
#include "TestSupport.hpp"

namespace
{
    std::string writeCsv(std::string const& name, std::string const& content)
    {
        auto path = std::filesystem::temp_directory_path() / name;
        std::ofstream out(path);
        out << content;
        return path.string();
    }
}

TEST(RouteCalibration, LoadsRoutesFromCsv)
{
    std::string path = writeCsv("crossing_routes_test.csv",
        "pattern,origins,destinations,reference,running_time_sec,speed_class,lead_time_sec,clear_time_sec\n"
        "# comment line\n"
        "stansted-outbound,LIVST|STFD,STANAIR,CHESHNT,390,express,,\n"
        "stratford-local,STFD,BSHPSFD,CHESHNT,420,stopping,150,45\n"
        "broken,LIVST,CAMBDGE,BROXBRN,soon,express,,\n");

    RouteCalibration routes(path);
    std::filesystem::remove(path);

    ASSERT_EQ(routes.size(), 2u);
    EXPECT_FALSE(routes.contains("broken"));

    auto const& outbound = routes.entry("stansted-outbound");
    EXPECT_EQ(outbound.referenceLocation, "CHESHNT");
    EXPECT_EQ(outbound.runningTimeSec, 390);
    EXPECT_EQ(outbound.origins, (std::vector<std::string>{"LIVST", "STFD"}));
    EXPECT_FALSE(outbound.leadTimeSec.has_value());

    auto const& local = routes.entry("stratford-local");
    EXPECT_EQ(local.speedClass, "stopping");
    EXPECT_EQ(local.leadTimeSec, 150);
    EXPECT_EQ(local.clearTimeSec, 45);
}

TEST(RouteCalibration, MissingFileLeavesTableEmpty)
{
    RouteCalibration routes("/nonexistent/routes.csv");
    EXPECT_EQ(routes.size(), 0u);
}

TEST(RouteCalibration, UnknownPatternThrows)
{
    RouteCalibration routes = testRoutes();
    try
    {
        routes.entry("ely-outbound");
        FAIL() << "expected UncalibratedRoute";
    }
    catch (UncalibratedRoute const& e)
    {
        EXPECT_EQ(e.route(), "ely-outbound");
    }
    EXPECT_THROW(routes.estimateCrossingTime("", at(10, 0)), UncalibratedRoute);
}

TEST(RouteCalibration, AddsRunningTimeToReferenceSighting)
{
    RouteCalibration routes = testRoutes();
    EXPECT_EQ(routes.estimateCrossingTime("cambridge-outbound", at(9, 57, 15)), at(10, 0));
}

TEST(RouteCalibration, MatchesEndpointsInOrder)
{
    RouteCalibration routes = testRoutes();

    RouteCalibrationEntry any;
    any.pattern           = "any-to-cambridge";
    any.origins           = {"*"};
    any.destinations      = {"CAMBDGE"};
    any.referenceLocation = "BROXBRN";
    any.runningTimeSec    = 200;
    routes.add(any);

    EXPECT_EQ(routes.patternFor("LIVST", "CAMBDGE"), "cambridge-outbound");
    EXPECT_EQ(routes.patternFor("STFD", "CAMBDGE"), "any-to-cambridge");
    EXPECT_EQ(routes.patternFor("STANAIR", "LIVST"), "stansted-inbound");
    EXPECT_EQ(routes.patternFor("HERTFDE", "LIVST"), "");
}

TEST(RouteCalibration, AddReplacesSamePattern)
{
    RouteCalibration routes = testRoutes();

    RouteCalibrationEntry slower = routes.entry("cambridge-outbound");
    slower.runningTimeSec = 200;
    routes.add(slower);

    EXPECT_EQ(routes.size(), 2u);
    EXPECT_EQ(routes.entry("cambridge-outbound").runningTimeSec, 200);
}
