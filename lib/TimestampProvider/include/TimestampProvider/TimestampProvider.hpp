#pragma once

#include <chrono>
#include <string>

/**
 * @brief Infrastructure component providing timestamps and snapshot names using C time APIs.
 */
class TimestampProvider
{
  public:
    using TimePoint = std::chrono::system_clock::time_point;

    virtual ~TimestampProvider() = default;

    /**
     * @brief Get the current wall-clock time.
     *
     * @return Current time point
     */
    virtual TimePoint Now() const;

    /**
     * @brief Get the snapshot directory name for the current time.
     *
     * @return Timestamp string formatted as YYYYMMDD_HHMMSS
     */
    std::string NowSnapshotName() const;

    /**
     * @brief Get a human-readable timestamp for the current time.
     *
     * @return Timestamp string formatted as YYYY-MM-DD HH:MM:SS
     */
    std::string NowReadable() const;

    /**
     * @brief Format a time point as a snapshot directory name (local time).
     *
     * @param[in] timePoint Time point to format
     * @return Timestamp string formatted as YYYYMMDD_HHMMSS
     */
    static std::string FormatSnapshotName(TimePoint timePoint);

    /**
     * @brief Format a time point as a human-readable local timestamp.
     *
     * @param[in] timePoint Time point to format
     * @return Timestamp string formatted as YYYY-MM-DD HH:MM:SS
     */
    static std::string FormatReadable(TimePoint timePoint);

    /**
     * @brief Check whether a string is a well-formed snapshot name.
     *
     * @param[in] name Candidate directory name
     * @return true if the name has the YYYYMMDD_HHMMSS shape
     */
    static bool IsSnapshotName(const std::string& name);
};
