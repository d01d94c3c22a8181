#pragma once
#include <string>
#include <vector>
#include "Types.hpp"

struct FeedEndpoint
{
    std::string name;
    std::string host;
    std::string port;
    std::string target;
};

// Reads the process configuration from the environment.
class ConfigurationManager
{
private:
    CrossingSettings settings;
    FeedEndpoint feed;
    std::string apiKey;
    std::string calibrationPath;
    std::string timetablePath;
    unsigned short httpPort = 8080;
    int recomputeSeconds = 5;
    int pollSeconds = 15;
    std::size_t queueCapacity = 1024;
    int dayStartHour = 3;

    static std::string readString(char const* name, std::string const& fallback);
    static int readInt(char const* name, int fallback, int minimum);
    static std::vector<std::string> splitList(std::string const& value, char separator);

public:
    ConfigurationManager();

    static inline const std::string DEFAULT_FEED_PORT = "443";

    [[nodiscard]] CrossingSettings const& getSettings() const noexcept;
    [[nodiscard]] FeedEndpoint const& getFeed() const noexcept;
    [[nodiscard]] bool hasFeed() const noexcept;
    [[nodiscard]] std::string getAPIKey() const noexcept;
    [[nodiscard]] std::string getCalibrationPath() const noexcept;
    [[nodiscard]] std::string getTimetablePath() const noexcept;
    [[nodiscard]] unsigned short getHttpPort() const noexcept;
    [[nodiscard]] int getRecomputeSeconds() const noexcept;
    [[nodiscard]] int getPollSeconds() const noexcept;
    [[nodiscard]] std::size_t getQueueCapacity() const noexcept;
    [[nodiscard]] int getDayStartHour() const noexcept;
};
