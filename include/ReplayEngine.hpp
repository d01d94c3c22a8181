#pragma once

#include <string>
#include <fstream>
#include <cstdint>
#include <optional>
#include "BoundedQueue.hpp"

// Recording format: [u64 timestamp][u32 size][size bytes of raw feed message] per chunk.
class ReplayEngine
{
public:
    static void run(std::string const& filename, BoundedQueue<std::string>& queue);
    static std::optional<std::uint64_t> firstTimestamp(std::string const& filename);
    static void appendChunk(std::ofstream& file, std::uint64_t timestamp, std::string const& data);

private:
    static bool readChunkHeader(std::ifstream& file, std::uint64_t& timestamp, std::uint32_t& size);
    static void syncRealtime(std::uint64_t timestamp, std::uint64_t& replayStart, std::uint64_t realStart);
};
