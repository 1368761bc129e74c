#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

/**
 * @brief Size and content fingerprint of a snapshot artifact.
 */
struct FileFingerprint
{
    std::uintmax_t size; /**< Bytes read while hashing */
    std::string hash;    /**< XXH64 digest, 16 lowercase hex digits */
};

/**
 * @brief Fingerprints snapshot artifacts with xxHash so runs can be compared in the history.
 */
class FileHasher
{
  public:
    /**
     * @brief Hash a file in one streaming pass, counting its size on the way.
     *
     * @param[in] filePath Path to the file to fingerprint
     * @return Fingerprint, or std::nullopt if the file cannot be opened or read
     */
    std::optional<FileFingerprint> Fingerprint(const std::filesystem::path& filePath) const;

    /**
     * @brief Render a digest the way fingerprints store it.
     */
    static std::string FormatDigest(std::uint64_t digest);
};
