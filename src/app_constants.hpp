#ifndef TIERCACHE_SRC_APP_CONSTANTS_HPP_
#define TIERCACHE_SRC_APP_CONSTANTS_HPP_

#include <spdlog/common.h>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace TierCache::Constants
{
// Application Info
constexpr std::string_view APP_NAME           = "TierCache";
constexpr std::string_view CLI_NAME           = "tiercachectl";
constexpr std::string_view APP_VERSION_STRING = "TierCache version 0.1.0";
constexpr std::string_view APP_VERSION_SHORT  = "0.1.0";

// Logging
constexpr spdlog::level::level_enum DEFAULT_LOG_LEVEL   = spdlog::level::info;
constexpr spdlog::level::level_enum DEFAULT_FLUSH_LEVEL = spdlog::level::warn;
constexpr std::string_view DEFAULT_CONSOLE_LOG_PATTERN =
    "[%Y-%m-%d %H:%M:%S.%e] [ThreadID:%t] [%^%l%$] [%n] %v";

// Entries
constexpr std::int64_t DEFAULT_TTL_SECONDS       = 3600;
constexpr std::int64_t DEFAULT_PROMOTION_TTL     = 3600;
constexpr std::string_view DEFAULT_KEY_PREFIX    = "TIERCACHE:";
constexpr std::string_view DEFAULT_FILE_PREFIX   = "tiercache_";
constexpr std::string_view DEFAULT_OPCODE_PREFIX = "tiercache_op_";
constexpr std::string_view OPCODE_EXTENSION      = ".cache";
constexpr std::string_view MMAP_EXTENSION        = ".mmap";
constexpr std::string_view CANARY_KEY_PREFIX      = "__tiercache_canary_";

// Envelope layout
constexpr std::size_t EXPIRY_FIELD_WIDTH    = 10;
constexpr std::size_t ENVELOPE_HEADROOM     = 100;
constexpr std::int64_t MAX_ENCODED_EXPIRY   = 9999999999LL;
constexpr std::size_t DEFAULT_SEGMENT_SIZE  = 1024 * 1024;
constexpr std::size_t DEFAULT_MMAP_FILESIZE = 1024 * 1024;

// Shared memory
constexpr std::int32_t DEFAULT_SHM_BASE_KEY    = 0x12345000;
constexpr std::uint32_t SHM_KEY_PARTITION_SIZE = 100000;

// Local process caches
constexpr std::size_t DEFAULT_LOCAL_MAX_ENTRIES = 100000;
constexpr std::size_t DEFAULT_ALT_SLOTS         = 65536;
constexpr std::size_t DEFAULT_ALT_MAX_KEY_LEN   = 48;

// Network tiers
constexpr std::string_view DEFAULT_NETWORK_HOST            = "localhost";
constexpr std::uint16_t DEFAULT_REDIS_PORT                 = 6379;
constexpr std::uint16_t DEFAULT_MEMCACHED_PORT             = 11211;
constexpr int DEFAULT_RETRY_ATTEMPTS                       = 2;
constexpr std::chrono::milliseconds DEFAULT_RETRY_DELAY    = std::chrono::milliseconds(100);
constexpr std::chrono::seconds DEFAULT_CONNECT_TIMEOUT     = std::chrono::seconds(2);
constexpr std::size_t MEMCACHED_MAX_KEY_LENGTH             = 250;
constexpr std::int64_t MEMCACHED_RELATIVE_TTL_LIMIT        = 60 * 60 * 24 * 30;

// Connection pool
constexpr std::size_t DEFAULT_REDIS_MIN_CONNECTIONS     = 2;
constexpr std::size_t DEFAULT_REDIS_MAX_CONNECTIONS     = 10;
constexpr std::size_t DEFAULT_MEMCACHED_MIN_CONNECTIONS = 1;
constexpr std::size_t DEFAULT_MEMCACHED_MAX_CONNECTIONS = 5;
constexpr std::chrono::seconds DEFAULT_IDLE_TIMEOUT     = std::chrono::seconds(300);

// Filesystem provisioning
constexpr int DIRECTORY_PROVISION_ATTEMPTS                    = 3;
constexpr std::chrono::milliseconds DIRECTORY_PROVISION_DELAY = std::chrono::milliseconds(100);

}  // namespace TierCache::Constants

#endif  // TIERCACHE_SRC_APP_CONSTANTS_HPP_
