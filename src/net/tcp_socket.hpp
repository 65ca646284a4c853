#ifndef TIERCACHE_SRC_NET_TCP_SOCKET_HPP_
#define TIERCACHE_SRC_NET_TCP_SOCKET_HPP_

#include "storage/posix_file.hpp"
#include "storage/storage_error.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace TierCache::Net
{

using Storage::StorageResult;

// Blocking, buffered TCP client socket with connect and I/O timeouts
class TcpSocket
{
    public:
    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//
    static StorageResult<TcpSocket> Connect(
        const std::string& host, std::uint16_t port, std::chrono::milliseconds timeout
    );

    TcpSocket()                                = default;
    ~TcpSocket()                               = default;
    TcpSocket(const TcpSocket&)                = delete;
    TcpSocket& operator=(const TcpSocket&)     = delete;
    TcpSocket(TcpSocket&&) noexcept            = default;
    TcpSocket& operator=(TcpSocket&&) noexcept = default;

    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//
    StorageResult<void> SendAll(std::string_view data);

    /// Buffered bytes if there are any, otherwise whatever one recv() returns.
    StorageResult<std::string> Receive();

    /// One line without its trailing CRLF.
    StorageResult<std::string> ReadLine();

    /// Exactly n bytes.
    StorageResult<std::string> ReadExact(std::size_t n);

    bool IsOpen() const { return static_cast<bool>(fd_); }
    void Close();

    private:
    explicit TcpSocket(Storage::FileDescriptorGuard fd) : fd_(std::move(fd)) {}

    StorageResult<void> Fill();

    Storage::FileDescriptorGuard fd_;
    std::string buffer_;
};

}  // namespace TierCache::Net

#endif  // TIERCACHE_SRC_NET_TCP_SOCKET_HPP_
