#include <string>
#include <iostream>
#include <fstream>
#include <filesystem>
#include <thread>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <exception>
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include "ConfigurationManager.hpp"
#include "FeedClient.hpp"
#include "BoundedQueue.hpp"
#include "CrossingContext.hpp"
#include "TimetableDatabase.hpp"
#include "RouteCalibration.hpp"
#include "LocalTime.hpp"
#include "VirtualClock.hpp"
#include "Dashboard.hpp"
#include "ReplayEngine.hpp"

std::string operatingDayAt(std::time_t t, ConfigurationManager const& config)
{
    return LocalTime::operatingDay(t - static_cast<std::time_t>(config.getDayStartHour()) * 3600,
                                   config.getSettings().timeZone);
}

boost::asio::awaitable<void> runPollingLoop(FeedClient& client, boost::asio::io_context& io, CrossingContext& ctx, BoundedQueue<std::string>& queue, FeedEndpoint const& feed, int pollSeconds, bool recordMode)
{
    boost::asio::steady_timer timer(io);

    std::ofstream recFile;
    if (recordMode)
    {
        std::filesystem::create_directories("recordings");
        recFile.open("recordings/session.rec", std::ios::binary | std::ios::app);
        std::cout << "[System] Recording activated. Saving to recordings/session.rec" << std::endl;
    }

    std::uint64_t dropped = 0;

    for (;;)
    {
        try
        {
            std::string data = co_await client.fetch();
            ctx.setFeedConnected(true);

            if (recordMode && recFile.is_open())
                ReplayEngine::appendChunk(recFile, static_cast<std::uint64_t>(std::time(nullptr)), data);

            if (!queue.tryPush(std::move(data)))
            {
                ++dropped;
                std::cerr << "[Feed] Update queue full, message dropped (" << dropped << " so far)" << std::endl;
            }
        }
        catch (std::exception const& e)
        {
            ctx.setFeedConnected(false);
            std::cerr << "[Feed] Error fetching " << feed.name << ": " << e.what() << std::endl;
        }

        timer.expires_after(std::chrono::seconds(pollSeconds));
        co_await timer.async_wait(boost::asio::use_awaitable);
    }
}

boost::asio::awaitable<void> runRecomputeLoop(boost::asio::io_context& io, CrossingContext& ctx, TimetableDatabase& db, ConfigurationManager const& config)
{
    boost::asio::steady_timer timer(io);
    std::string const zone = config.getSettings().timeZone;

    std::string attemptedDay = ctx.day();
    auto lastAttempt = std::chrono::steady_clock::now();

    for (;;)
    {
        std::time_t now = VirtualClock::now();
        std::string today = operatingDayAt(now, config);

        if (today != ctx.day())
        {
            auto sinceAttempt = std::chrono::steady_clock::now() - lastAttempt;
            if (today != attemptedDay || sinceAttempt > std::chrono::minutes(5))
            {
                attemptedDay = today;
                lastAttempt = std::chrono::steady_clock::now();

                bool loaded = ctx.beginDay(today, [&db, zone](std::string const& day) {
                    return db.readDay(day, zone);
                });
                if (loaded)
                    db.pruneBefore(operatingDayAt(now - 7 * 86400, config));
            }
        }

        ctx.recompute(now);

        timer.expires_after(std::chrono::seconds(config.getRecomputeSeconds()));
        co_await timer.async_wait(boost::asio::use_awaitable);
    }
}

boost::asio::awaitable<void> handleHttpClient(std::shared_ptr<boost::asio::ip::tcp::socket> socket, CrossingContext& ctx)
{
    try
    {
        boost::asio::streambuf buffer;

        co_await boost::asio::async_read_until(*socket, buffer, "\r\n\r\n", boost::asio::use_awaitable);

        std::istream requestStream(&buffer);
        std::string method, target;
        requestStream >> method >> target;
        target = target.substr(0, target.find('?'));

        std::time_t now = VirtualClock::now();
        std::string status = "200 OK";
        std::string contentType = "text/html";
        std::string body;

        if (target == "/health")
        {
            HealthReport health = ctx.health(now);
            body = Dashboard::healthText(health);
            contentType = "text/plain";
            if (!health.healthy())
                status = "503 Service Unavailable";
        }
        else if (target == "/" || target == "/timeline")
        {
            body = Dashboard::generate(ctx.currentStatus(now), ctx.timeline(now), ctx.health(now), ctx.getSettings(), now);
        }
        else
        {
            status = "404 Not Found";
            contentType = "text/plain";
            body = "Not found\n";
        }

        std::string response =
            "HTTP/1.1 " + status + "\r\n"
            "Content-Type: " + contentType + "\r\n"
            "Content-Length: " + std::to_string(body.size()) + "\r\n"
            "Connection: close\r\n\r\n" +
            body;

        co_await boost::asio::async_write(*socket, boost::asio::buffer(response), boost::asio::use_awaitable);

        boost::system::error_code ignore;
        socket->shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignore);
    }
    catch (boost::system::system_error const& e)
    {
        auto code = e.code();
        if (code == boost::asio::error::operation_aborted ||
            code == boost::asio::error::connection_reset ||
            code == boost::asio::error::connection_aborted ||
            code == boost::asio::error::eof)
        {
            co_return;
        }

        std::cerr << "HTTP handler error: " << e.what() << "\n";
    }
    catch (std::exception const& e)
    {
        std::cerr << "HTTP handler error: " << e.what() << "\n";
    }
}

boost::asio::awaitable<void> httpAcceptLoop(boost::asio::ip::tcp::acceptor& acceptor, CrossingContext& ctx)
{
    for (;;)
    {
        auto socket = std::make_shared<boost::asio::ip::tcp::socket>(co_await boost::asio::this_coro::executor);

        co_await acceptor.async_accept(*socket, boost::asio::use_awaitable);
        boost::asio::co_spawn(socket->get_executor(), handleHttpClient(socket, ctx), boost::asio::detached);
    }
}

void runHttpServer(boost::asio::io_context& ioc, CrossingContext& ctx, unsigned short port)
{
    try
    {
        boost::asio::ip::tcp::acceptor acceptor(ioc, {boost::asio::ip::tcp::v4(), port});

        std::cout << "   -> Dashboard active at http://localhost:" << port << "\n";

        boost::asio::co_spawn(ioc, httpAcceptLoop(acceptor, ctx), boost::asio::detached);

        ioc.run();
    }
    catch (std::exception const& e)
    {
        std::cerr << "Server Error: " << e.what() << std::endl;
    }
}

void parseCommandLineArgs(int argc, char* argv[], bool& recordMode, bool& replayMode, std::string& replayFile, std::string& importFile)
{
    recordMode = false;
    replayMode = false;
    replayFile.clear();
    importFile.clear();

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--record")
        {
            recordMode = true;
        }
        else if (arg == "--replay" && i + 1 < argc)
        {
            replayMode = true;
            replayFile = argv[++i];
        }
        else if (arg == "--import" && i + 1 < argc)
        {
            importFile = argv[++i];
        }
        else
        {
            std::cerr << "Warning: ignoring unknown or malformed argument: " << arg << "\n";
        }
    }
}

int main(int argc, char* argv[])
{
    try
    {
        bool replayMode = false;
        bool recordMode = false;
        std::string replayFile;
        std::string importFile;

        parseCommandLineArgs(argc, argv, recordMode, replayMode, replayFile, importFile);

        ConfigurationManager config;
        if (!replayMode && !config.hasFeed())
            throw std::runtime_error("FEED_HOST not set.");

        if (replayMode)
        {
            if (auto start = ReplayEngine::firstTimestamp(replayFile))
                VirtualClock::set(static_cast<std::time_t>(*start));
        }

        RouteCalibration routes(config.getCalibrationPath());
        TimetableDatabase db(config.getTimetablePath());
        if (!importFile.empty())
            db.importCsv(importFile);

        CrossingContext ctx(config.getSettings(), std::move(routes));
        std::string const zone = config.getSettings().timeZone;

        ctx.beginDay(operatingDayAt(VirtualClock::now(), config), [&db, zone](std::string const& day) {
            return db.readDay(day, zone);
        });
        ctx.recompute(VirtualClock::now());

        std::cout << "System Initialized.\n";

        BoundedQueue<std::string> queue(config.getQueueCapacity());
        boost::asio::io_context io;
        boost::asio::io_context httpIo;

        std::thread ingestThread([&queue, &ctx]()
        {
            while (auto message = queue.pop())
            {
                try
                {
                    ctx.ingest(*message);
                }
                catch (std::exception const& e)
                {
                    std::cerr << "[Feed] Ingestion error: " << e.what() << std::endl;
                }
            }
        });

        std::thread serverThread([&httpIo, &ctx, &config]()
        {
            runHttpServer(httpIo, ctx, config.getHttpPort());
        });

        std::exception_ptr failure;
        try
        {
            boost::asio::co_spawn(io, runRecomputeLoop(io, ctx, db, config), boost::asio::detached);

            if (replayMode)
            {
                ctx.setFeedConnected(true);
                std::thread ioThread([&io]() { io.run(); });

                ReplayEngine::run(replayFile, queue);
                std::cout << "Replay Finished. Dashboard is frozen at replay time. Press Enter to exit." << std::endl;
                std::cin.get();

                io.stop();
                ioThread.join();
            }
            else
            {
                FeedClient client(io, config.getFeed(), config.getAPIKey());
                boost::asio::co_spawn(io, runPollingLoop(client, io, ctx, queue, config.getFeed(), config.getPollSeconds(), recordMode), boost::asio::detached);

                io.run();
            }
        }
        catch (...)
        {
            failure = std::current_exception();
        }

        queue.close();
        ingestThread.join();
        httpIo.stop();
        serverThread.join();
        ctx.endDay();

        if (failure)
            std::rethrow_exception(failure);
    }
    catch (const std::exception& e)
    {
        std::cerr << "Main Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
