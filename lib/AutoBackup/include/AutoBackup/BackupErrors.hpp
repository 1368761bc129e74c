// file BackupErrors.hpp:

#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Enumeration of the failure kinds a backup run can report.
 */
enum class BackupErrorKind
{
    Permission,        /**< Orchestrator is not running as the expected principal */
    DirectoryCreation, /**< Snapshot directory could not be created */
    Export,            /**< External exporter failed */
    Verification,      /**< Artifacts incomplete after export */
    WatchBackend,      /**< Change notification primitive failed */
    Prune              /**< A snapshot directory could not be deleted */
};

inline const char* BackupErrorKindToString(BackupErrorKind errorKind)
{
    switch (errorKind)
    {
    case BackupErrorKind::Permission:
        return "PermissionError";
    case BackupErrorKind::DirectoryCreation:
        return "DirectoryCreationError";
    case BackupErrorKind::Export:
        return "ExportError";
    case BackupErrorKind::Verification:
        return "VerificationError";
    case BackupErrorKind::WatchBackend:
        return "WatchBackendError";
    case BackupErrorKind::Prune:
        return "PruneError";
    }
    return "UnknownError";
}

inline BackupErrorKind StringToBackupErrorKind(const std::string& stringValue)
{
    if ("PermissionError" == stringValue)
    {
        return BackupErrorKind::Permission;
    }
    if ("DirectoryCreationError" == stringValue)
    {
        return BackupErrorKind::DirectoryCreation;
    }
    if ("VerificationError" == stringValue)
    {
        return BackupErrorKind::Verification;
    }
    if ("WatchBackendError" == stringValue)
    {
        return BackupErrorKind::WatchBackend;
    }
    if ("PruneError" == stringValue)
    {
        return BackupErrorKind::Prune;
    }
    return BackupErrorKind::Export;
}

/**
 * @brief Base class of all backup failures.
 */
class BackupError : public std::runtime_error
{
  public:
    BackupError(BackupErrorKind errorKind, const std::string& message)
        : std::runtime_error(message)
        , _errorKind(errorKind)
    {
    }

    BackupErrorKind Kind() const
    {
        return _errorKind;
    }

  private:
    BackupErrorKind _errorKind;
};

class PermissionError : public BackupError
{
  public:
    explicit PermissionError(const std::string& message) : BackupError(BackupErrorKind::Permission, message)
    {
    }
};

class DirectoryCreationError : public BackupError
{
  public:
    explicit DirectoryCreationError(const std::string& message) : BackupError(BackupErrorKind::DirectoryCreation, message)
    {
    }
};

class ExportError : public BackupError
{
  public:
    explicit ExportError(const std::string& message) : BackupError(BackupErrorKind::Export, message)
    {
    }
};

class VerificationError : public BackupError
{
  public:
    explicit VerificationError(const std::string& message) : BackupError(BackupErrorKind::Verification, message)
    {
    }
};

class WatchBackendError : public BackupError
{
  public:
    explicit WatchBackendError(const std::string& message) : BackupError(BackupErrorKind::WatchBackend, message)
    {
    }
};

class PruneError : public BackupError
{
  public:
    explicit PruneError(const std::string& message) : BackupError(BackupErrorKind::Prune, message)
    {
    }
};
