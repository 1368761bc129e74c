#include "FileHasher/FileHasher.hpp"

#include <array>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

#include <xxhash.h>

namespace fs = std::filesystem;

namespace
{
constexpr std::size_t ChunkSize = 64 * 1024;
constexpr XXH64_hash_t HashSeed = 0;

struct HashStateDeleter
{
    void operator()(XXH64_state_t* hashState) const
    {
        XXH64_freeState(hashState);
    }
};

using HashState = std::unique_ptr<XXH64_state_t, HashStateDeleter>;
}

std::optional<FileFingerprint> FileHasher::Fingerprint(const fs::path& filePath) const
{
    std::ifstream inputStream(filePath, std::ios::binary);
    if (false == inputStream.is_open())
    {
        return std::nullopt;
    }

    HashState hashState(XXH64_createState());
    if ((nullptr == hashState) || (XXH_OK != XXH64_reset(hashState.get(), HashSeed)))
    {
        return std::nullopt;
    }

    // Size is counted from the bytes hashed, not from a separate stat.
    std::array<char, ChunkSize> chunk{};
    std::uintmax_t totalBytes = 0;
    while (inputStream)
    {
        inputStream.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        const std::streamsize chunkBytes = inputStream.gcount();
        if (0 < chunkBytes)
        {
            XXH64_update(hashState.get(), chunk.data(), static_cast<std::size_t>(chunkBytes));
            totalBytes += static_cast<std::uintmax_t>(chunkBytes);
        }
    }
    if (true == inputStream.bad())
    {
        return std::nullopt;
    }

    return FileFingerprint{totalBytes, FormatDigest(XXH64_digest(hashState.get()))};
}

std::string FileHasher::FormatDigest(std::uint64_t digest)
{
    std::ostringstream outputStream;
    outputStream << std::hex << std::setw(16) << std::setfill('0') << digest;
    return outputStream.str();
}
