#include "net/memcached_connection.hpp"

#include <spdlog/spdlog.h>
#include <sstream>

namespace TierCache::Net
{

using Storage::make_error_code;
using Storage::StorageErrc;

namespace
{

bool IsServerError(const std::string& line)
{
    return line == "ERROR" || line.starts_with("CLIENT_ERROR") || line.starts_with("SERVER_ERROR");
}

}  // namespace

StorageResult<std::unique_ptr<MemcachedConnection>> MemcachedConnection::Open(
    const Config::NetworkSettings& settings
)
{
    auto socket = TcpSocket::Connect(
        settings.host, settings.port,
        std::chrono::duration_cast<std::chrono::milliseconds>(settings.connect_timeout)
    );
    if (!socket) {
        return std::unexpected(socket.error());
    }
    return std::make_unique<MemcachedConnection>(std::move(*socket));
}

StorageResult<std::string> MemcachedConnection::Request(const std::string& command)
{
    if (auto sent = socket_.SendAll(command); !sent) {
        return std::unexpected(sent.error());
    }
    auto line = socket_.ReadLine();
    if (!line) {
        return std::unexpected(line.error());
    }
    if (IsServerError(*line)) {
        spdlog::debug("Memcached rejected '{}': {}", command.substr(0, command.find('\r')), *line);
        return std::unexpected(make_error_code(StorageErrc::ProtocolError));
    }
    return line;
}

StorageResult<void> MemcachedConnection::ExpectLine(
    const std::string& command, const std::string& expected
)
{
    auto line = Request(command);
    if (!line) {
        return std::unexpected(line.error());
    }
    if (*line != expected) {
        return std::unexpected(make_error_code(StorageErrc::ProtocolError));
    }
    return {};
}

StorageResult<void> MemcachedConnection::Set(
    const std::string& key, const std::string& data, std::int64_t exptime, std::uint32_t flags
)
{
    std::string command = "set " + key + " " + std::to_string(flags) + " " +
                          std::to_string(exptime) + " " + std::to_string(data.size()) + "\r\n";
    command += data;
    command += "\r\n";
    return ExpectLine(command, "STORED");
}

StorageResult<std::map<std::string, std::string>> MemcachedConnection::Get(
    const std::vector<std::string>& keys
)
{
    std::map<std::string, std::string> values;
    if (keys.empty()) {
        return values;
    }

    std::string command = "get";
    for (const auto& key : keys) {
        command += " " + key;
    }
    command += "\r\n";

    auto line = Request(command);
    while (line && *line != "END") {
        // VALUE <key> <flags> <bytes>
        std::istringstream header(*line);
        std::string tag, key;
        std::uint32_t flags = 0;
        std::size_t bytes   = 0;
        if (!(header >> tag >> key >> flags >> bytes) || tag != "VALUE") {
            Close();
            return std::unexpected(make_error_code(StorageErrc::ProtocolError));
        }
        auto data = socket_.ReadExact(bytes + 2);
        if (!data) {
            return std::unexpected(data.error());
        }
        data->resize(bytes);
        values.emplace(std::move(key), std::move(*data));
        line = socket_.ReadLine();
    }
    if (!line) {
        return std::unexpected(line.error());
    }
    return values;
}

StorageResult<bool> MemcachedConnection::Delete(const std::string& key)
{
    auto line = Request("delete " + key + "\r\n");
    if (!line) {
        return std::unexpected(line.error());
    }
    if (*line == "DELETED") {
        return true;
    }
    if (*line == "NOT_FOUND") {
        return false;
    }
    return std::unexpected(make_error_code(StorageErrc::ProtocolError));
}

StorageResult<void> MemcachedConnection::FlushAll() { return ExpectLine("flush_all\r\n", "OK"); }

StorageResult<std::string> MemcachedConnection::Version()
{
    auto line = Request("version\r\n");
    if (!line) {
        return std::unexpected(line.error());
    }
    if (!line->starts_with("VERSION ")) {
        return std::unexpected(make_error_code(StorageErrc::ProtocolError));
    }
    return line->substr(8);
}

StorageResult<void> MemcachedConnection::Ping()
{
    auto version = Version();
    if (!version) {
        return std::unexpected(version.error());
    }
    return {};
}

StorageResult<std::map<std::string, std::string>> MemcachedConnection::ServerStats()
{
    std::map<std::string, std::string> stats;
    auto line = Request("stats\r\n");
    while (line && *line != "END") {
        // STAT <name> <value>
        std::istringstream entry(*line);
        std::string tag, name, value;
        if (entry >> tag >> name && tag == "STAT") {
            std::getline(entry >> std::ws, value);
            stats.emplace(std::move(name), std::move(value));
        }
        line = socket_.ReadLine();
    }
    if (!line) {
        return std::unexpected(line.error());
    }
    return stats;
}

}  // namespace TierCache::Net
