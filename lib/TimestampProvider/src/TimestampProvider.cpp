#include "TimestampProvider/TimestampProvider.hpp"

#include <cctype>
#include <ctime>

namespace
{
constexpr std::size_t TimestampBufferSize = 32;
constexpr std::size_t SnapshotNameLength = 15;
constexpr std::size_t SnapshotNameSeparatorIndex = 8;

std::string FormatLocalTime(std::chrono::system_clock::time_point timePoint, const char* format)
{
    std::time_t currentTime = std::chrono::system_clock::to_time_t(timePoint);
    std::tm timeStruct{};

#ifdef _WIN32
    _localtime64_s(&timeStruct, &currentTime);
#else
    localtime_r(&currentTime, &timeStruct);
#endif

    char buffer[TimestampBufferSize];
    std::strftime(buffer, sizeof(buffer), format, &timeStruct);
    return buffer;
}
}

TimestampProvider::TimePoint TimestampProvider::Now() const
{
    return std::chrono::system_clock::now();
}

std::string TimestampProvider::NowSnapshotName() const
{
    return FormatSnapshotName(Now());
}

std::string TimestampProvider::NowReadable() const
{
    return FormatReadable(Now());
}

std::string TimestampProvider::FormatSnapshotName(TimePoint timePoint)
{
    return FormatLocalTime(timePoint, "%Y%m%d_%H%M%S");
}

std::string TimestampProvider::FormatReadable(TimePoint timePoint)
{
    return FormatLocalTime(timePoint, "%Y-%m-%d %H:%M:%S");
}

bool TimestampProvider::IsSnapshotName(const std::string& name)
{
    if (SnapshotNameLength != name.size())
    {
        return false;
    }

    for (std::size_t index = 0; index < name.size(); ++index)
    {
        const unsigned char character = static_cast<unsigned char>(name[index]);
        if (SnapshotNameSeparatorIndex == index)
        {
            if ('_' != character)
            {
                return false;
            }
        }
        else if (0 == std::isdigit(character))
        {
            return false;
        }
    }
    return true;
}
