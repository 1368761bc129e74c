#pragma once

#include "TimestampProvider/TimestampProvider.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

enum class DirectoryListingMode
{
    Recursive,
    NonRecursive
};

/**
 * @brief Get directory contents as a sorted vector of strings.
 *
 * @param[in] directoryPath Path to the directory to traverse
 * @param[in] mode Specifies the traversal mode (Recursive or NonRecursive).
 * @return Sorted vector of paths (relative if recursive, filenames if not)
 */
inline std::vector<std::string> GetDirectoryEntries(const fs::path& directoryPath,
                                                    DirectoryListingMode mode = DirectoryListingMode::NonRecursive)
{
    std::vector<std::string> contents;
    if ((fs::exists(directoryPath)) && (fs::is_directory(directoryPath)))
    {
        if (mode == DirectoryListingMode::Recursive)
        {
            for (const auto& entry : fs::recursive_directory_iterator(directoryPath))
            {
                contents.push_back(fs::relative(entry.path(), directoryPath).generic_string());
            }
        }
        else
        {
            for (const auto& entry : fs::directory_iterator(directoryPath))
            {
                contents.push_back(entry.path().filename().string());
            }
        }
    }
    std::sort(contents.begin(), contents.end());
    return contents;
}

/**
 * @brief Fresh scratch directory below the system temp directory, named after the running test.
 *
 * @param[in] prefix Distinguishes several directories of the same test
 * @return Empty directory path
 */
inline fs::path MakeTestDirectory(const std::string& prefix)
{
    const auto* testInfo = ::testing::UnitTest::GetInstance()->current_test_info();
    const fs::path directory =
        fs::temp_directory_path() / (prefix + "_" + testInfo->test_suite_name() + "_" + testInfo->name());

    fs::remove_all(directory);
    fs::create_directories(directory);
    return directory;
}

inline void CreateFile(const fs::path& path, const std::string& content)
{
    fs::create_directories(path.parent_path());
    std::ofstream ofs(path, std::ios::binary);
    ASSERT_TRUE(ofs.good()) << "Failed to create file: " << path;
    ofs << content;
}

inline std::string ReadFile(const fs::path& path)
{
    std::ifstream ifs(path, std::ios::binary);
    EXPECT_TRUE(ifs.good()) << "Failed to open file: " << path;
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    return buffer.str();
}

/**
 * @brief Move a file or directory's modification time into the past.
 */
inline void SetAge(const fs::path& path, std::chrono::hours age)
{
    fs::last_write_time(path, fs::file_time_type::clock::now() - age);
}

/**
 * @brief Clock that advances by a fixed step on every reading.
 */
class SteppingTimestampProvider : public TimestampProvider
{
  public:
    explicit SteppingTimestampProvider(TimePoint start, std::chrono::seconds step = std::chrono::seconds(1))
        : _start(start), _step(step), _readings(0)
    {
    }

    TimePoint Now() const override
    {
        return _start + _step * _readings.fetch_add(1);
    }

  private:
    TimePoint _start;
    std::chrono::seconds _step;
    mutable std::atomic<long> _readings;
};

/**
 * @brief Clock that stays where the test puts it.
 */
class ManualTimestampProvider : public TimestampProvider
{
  public:
    explicit ManualTimestampProvider(TimePoint now) : _now(now)
    {
    }

    TimePoint Now() const override
    {
        return _now;
    }

    void Advance(std::chrono::seconds duration)
    {
        _now += duration;
    }

  private:
    TimePoint _now;
};

/**
 * @brief Fixed, DST-free local noon used as a base time by clock fakes.
 */
inline TimestampProvider::TimePoint ReferenceTime()
{
    std::tm timeStruct{};
    timeStruct.tm_year = 2024 - 1900;
    timeStruct.tm_mon = 5;
    timeStruct.tm_mday = 15;
    timeStruct.tm_hour = 12;
    timeStruct.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&timeStruct));
}
