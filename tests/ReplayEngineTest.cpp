#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include "ReplayEngine.hpp"
#include "VirtualClock.hpp"
#include "TestSupport.hpp"

namespace
{
    class ReplayEngineTest : public ::testing::Test
    {
    protected:
        std::string path = (std::filesystem::temp_directory_path() / "crossing_replay_test.rec").string();

        void TearDown() override
        {
            std::filesystem::remove(path);
            VirtualClock::disable();
        }
    };
}

TEST_F(ReplayEngineTest, ReplaysRecordedMessagesInOrder)
{
    std::uint64_t recordedAt = static_cast<std::uint64_t>(at(10, 0));
    {
        std::ofstream out(path, std::ios::binary);
        ReplayEngine::appendChunk(out, recordedAt, "first");
        ReplayEngine::appendChunk(out, recordedAt, std::string("sec\0ond", 7));
    }

    EXPECT_EQ(ReplayEngine::firstTimestamp(path), recordedAt);

    BoundedQueue<std::string> queue(8);
    ReplayEngine::run(path, queue);
    queue.close();

    EXPECT_EQ(queue.pop(), "first");
    EXPECT_EQ(queue.pop(), std::string("sec\0ond", 7));
    EXPECT_EQ(queue.pop(), std::nullopt);

    EXPECT_TRUE(VirtualClock::isVirtual());
    EXPECT_EQ(VirtualClock::now(), at(10, 0));
}

TEST_F(ReplayEngineTest, StopsAtTruncatedChunk)
{
    {
        std::ofstream out(path, std::ios::binary);
        ReplayEngine::appendChunk(out, static_cast<std::uint64_t>(at(10, 0)), "whole");

        std::uint64_t ts = static_cast<std::uint64_t>(at(10, 0));
        std::uint32_t size = 100;
        out.write(reinterpret_cast<const char*>(&ts), sizeof(ts));
        out.write(reinterpret_cast<const char*>(&size), sizeof(size));
        out.write("short", 5);
    }

    BoundedQueue<std::string> queue(8);
    ReplayEngine::run(path, queue);
    queue.close();

    EXPECT_EQ(queue.pop(), "whole");
    EXPECT_EQ(queue.pop(), std::nullopt);
}

TEST_F(ReplayEngineTest, MissingRecordingHasNoStart)
{
    EXPECT_EQ(ReplayEngine::firstTimestamp("/nonexistent/session.rec"), std::nullopt);
}
