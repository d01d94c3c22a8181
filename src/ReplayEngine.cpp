#include "ReplayEngine.hpp"
#include <iostream>
#include <thread>
#include <chrono>
#include <ctime>
#include "VirtualClock.hpp"

namespace
{
    constexpr std::uint32_t kMaxChunkSize = 64u * 1024u * 1024u;
}

void ReplayEngine::appendChunk(std::ofstream& file, std::uint64_t timestamp, std::string const& data)
{
    std::uint32_t size = static_cast<std::uint32_t>(data.size());
    file.write(reinterpret_cast<const char*>(&timestamp), sizeof(timestamp));
    file.write(reinterpret_cast<const char*>(&size), sizeof(size));
    file.write(data.data(), size);
    file.flush();
}

bool ReplayEngine::readChunkHeader(std::ifstream& file, std::uint64_t& timestamp, std::uint32_t& size)
{
    file.read(reinterpret_cast<char*>(&timestamp), sizeof(timestamp));
    file.read(reinterpret_cast<char*>(&size), sizeof(size));

    if (file.eof() || !file.good())
        return false;

    return size <= kMaxChunkSize;
}

std::optional<std::uint64_t> ReplayEngine::firstTimestamp(std::string const& filename)
{
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open())
        return std::nullopt;

    std::uint64_t timestamp = 0;
    std::uint32_t size      = 0;
    if (!readChunkHeader(file, timestamp, size))
        return std::nullopt;
    return timestamp;
}

void ReplayEngine::syncRealtime(std::uint64_t timestamp, std::uint64_t& replayStart, std::uint64_t realStart)
{
    if (replayStart == 0)
    {
        replayStart = timestamp;
    }

    std::uint64_t recordingDelta = timestamp - replayStart;
    std::uint64_t realDelta      = static_cast<std::uint64_t>(std::time(nullptr)) - realStart;

    if (recordingDelta > realDelta)
    {
        std::uint64_t waitSeconds = recordingDelta - realDelta;
        if (waitSeconds > 1)
        {
            std::cout << "[REPLAY] Syncing... sleeping for "
                      << waitSeconds << "s" << std::endl;
        }
        std::this_thread::sleep_for(std::chrono::seconds(waitSeconds));
    }
}

void ReplayEngine::run(std::string const& filename, BoundedQueue<std::string>& queue)
{
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open())
    {
        std::cerr << "Failed to open replay file: " << filename << std::endl;
        return;
    }

    std::cout << ">>> STARTING REPLAY MODE (1:1 SPEED) <<<" << std::endl;

    std::uint64_t replayStart = 0;
    std::uint64_t realStart   = static_cast<std::uint64_t>(std::time(nullptr));
    std::size_t chunks = 0;

    while (file.peek() != EOF)
    {
        std::uint64_t timestamp = 0;
        std::uint32_t size      = 0;

        if (!readChunkHeader(file, timestamp, size))
            break;

        syncRealtime(timestamp, replayStart, realStart);

        std::string data(size, '\0');
        file.read(&data[0], size);
        if (static_cast<std::uint32_t>(file.gcount()) != size)
        {
            std::cerr << "[REPLAY] Truncated chunk at T=" << timestamp << std::endl;
            break;
        }

        VirtualClock::set(static_cast<std::time_t>(timestamp));
        if (!queue.push(std::move(data)))
            break;
        ++chunks;
    }

    std::cout << ">>> REPLAY COMPLETE (" << chunks << " messages) <<<" << std::endl;
}
