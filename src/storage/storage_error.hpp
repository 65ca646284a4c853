#ifndef TIERCACHE_SRC_STORAGE_STORAGE_ERROR_HPP_
#define TIERCACHE_SRC_STORAGE_STORAGE_ERROR_HPP_

#include <cerrno>
#include <expected>
#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>

namespace TierCache::Storage
{

//------------------------------------------------------------------------------//
// Error Codes declared for Tier/Cache Operations
//------------------------------------------------------------------------------//

// clang-format off
enum class StorageErrc {
    Success = 0,           // Not an error
    CacheMiss,             // Key not present in the tier (internal signal)
    Expired,               // Entry found but its expiry has passed
    CorruptEntry,          // Stored envelope could not be decoded
    FileNotFound,          // Path does not exist
    PermissionDenied,      // Operation not permitted
    IOError,               // General I/O error during read/write/etc.
    NotSupported,          // Operation is not supported by this tier
    OutOfSpace,            // No space left on the storage medium
    AlreadyExists,         // Attempted to create something that already exists
    NotADirectory,         // Expected a directory, found a file
    LockFailed,            // Advisory lock could not be taken
    InvalidConfiguration,  // Malformed tier or engine configuration
    EmptyValue,            // Empty values are never cached
    ConnectionFailed,      // Network backend unreachable or connection dropped
    ProtocolError,         // Unexpected reply from a network backend
    Timeout,               // Network operation timed out
    TierUnavailable,       // Tier failed its round-trip check or is not enabled
    PoolExhausted,         // No connection could be handed out
    UnknownError,          // An unspecified error occurred
};
// clang-format on

std::error_code make_error_code(StorageErrc e);

inline StorageErrc ErrnoToStorageErrc(int err_no)
{
    switch (err_no) {
        case 0:
            return StorageErrc::Success;
        case ENOENT:
            return StorageErrc::FileNotFound;
        case EACCES:
        case EPERM:
            return StorageErrc::PermissionDenied;
        case EIO:
            return StorageErrc::IOError;
        case ENOSPC:
        case ENOMEM:
            return StorageErrc::OutOfSpace;
        case EEXIST:
            return StorageErrc::AlreadyExists;
        case ENOTDIR:
            return StorageErrc::NotADirectory;
        case EOPNOTSUPP:
        case ENOSYS:
            return StorageErrc::NotSupported;
        case EWOULDBLOCK:
        case ETIMEDOUT:
            return StorageErrc::Timeout;
        case ECONNREFUSED:
        case ECONNRESET:
        case ECONNABORTED:
        case EPIPE:
        case EHOSTUNREACH:
        case ENETUNREACH:
        case ENOTCONN:
            return StorageErrc::ConnectionFailed;
        case ENOLCK:
            return StorageErrc::LockFailed;

        default:
            return StorageErrc::UnknownError;
    }
}

//------------------------------------------------------------------------------//
// Error Category Definition (Private Implementation Detail)
//------------------------------------------------------------------------------//
namespace detail
{
class StorageErrorCategory : public std::error_category
{
    public:
    const char* name() const noexcept override { return "TierCache::Storage"; }
    std::string message(int ev) const override
    {
        switch (static_cast<StorageErrc>(ev)) {
            case StorageErrc::Success:
                return "Success";
            case StorageErrc::CacheMiss:
                return "Item not found in cache";
            case StorageErrc::Expired:
                return "Cache entry expired";
            case StorageErrc::CorruptEntry:
                return "Cache entry could not be decoded";
            case StorageErrc::FileNotFound:
                return "File or directory not found";
            case StorageErrc::PermissionDenied:
                return "Permission denied";
            case StorageErrc::IOError:
                return "Input/output error";
            case StorageErrc::NotSupported:
                return "Operation not supported";
            case StorageErrc::OutOfSpace:
                return "No space left on device";
            case StorageErrc::AlreadyExists:
                return "File or directory already exists";
            case StorageErrc::NotADirectory:
                return "Path is not a directory";
            case StorageErrc::LockFailed:
                return "Unable to acquire lock";
            case StorageErrc::InvalidConfiguration:
                return "Invalid configuration";
            case StorageErrc::EmptyValue:
                return "Empty values are not cached";
            case StorageErrc::ConnectionFailed:
                return "Connection to backend failed";
            case StorageErrc::ProtocolError:
                return "Unexpected reply from backend";
            case StorageErrc::Timeout:
                return "Operation timed out";
            case StorageErrc::TierUnavailable:
                return "Tier not available";
            case StorageErrc::PoolExhausted:
                return "Connection pool exhausted";
            case StorageErrc::UnknownError:
                return "Unknown storage/cache error";
            default:
                return "Unrecognized error code";
        }
    }
};
}  // namespace detail

// Global instance of the category
inline const detail::StorageErrorCategory storage_error_category;

// Make the enum usable with std::error_code
inline std::error_code make_error_code(StorageErrc e)
{
    return {static_cast<int>(e), storage_error_category};
}

inline std::error_code ErrnoToErrorCode(int err_no)
{
    return make_error_code(ErrnoToStorageErrc(err_no));
}

/// True for the error codes a tier reports when it simply does not hold the key.
inline bool IsMissError(const std::error_code& ec)
{
    return ec == make_error_code(StorageErrc::CacheMiss) ||
           ec == make_error_code(StorageErrc::Expired) ||
           ec == make_error_code(StorageErrc::CorruptEntry);
}

//------------------------------------------------------------------------------//
// Custom Exception Type
//------------------------------------------------------------------------------//
class StorageException : public std::runtime_error
{
    private:
    std::error_code ec_;

    public:
    explicit StorageException(std::error_code ec) : std::runtime_error(ec.message()), ec_(ec) {}
    StorageException(std::error_code ec, const std::string& what)
        : std::runtime_error(ec.message() + ": " + what), ec_(ec)
    {
    }

    const std::error_code& code() const noexcept { return ec_; }
};

//------------------------------------------------------------------------------//
// Result Type Alias
//------------------------------------------------------------------------------//
template <typename T>
using StorageResult = std::expected<T, std::error_code>;

}  // namespace TierCache::Storage

// Enable std::error_code implicit conversion for StorageErrc
namespace std
{
template <>
struct is_error_code_enum<TierCache::Storage::StorageErrc> : true_type {
};
}  // namespace std

#endif  // TIERCACHE_SRC_STORAGE_STORAGE_ERROR_HPP_
