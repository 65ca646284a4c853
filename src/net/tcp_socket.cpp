#include "net/tcp_socket.hpp"

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <cerrno>
#include <memory>
#include <utility>

namespace TierCache::Net
{

using Storage::make_error_code;
using Storage::StorageErrc;

namespace
{

constexpr std::size_t RECEIVE_CHUNK = 16 * 1024;

StorageResult<void> ConnectWithTimeout(int fd, const sockaddr* addr, socklen_t len, int timeout_ms)
{
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags == -1 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
        return std::unexpected(Storage::ErrnoToErrorCode(errno));
    }

    if (::connect(fd, addr, len) == -1) {
        if (errno != EINPROGRESS) {
            return std::unexpected(Storage::ErrnoToErrorCode(errno));
        }
        pollfd pfd{fd, POLLOUT, 0};
        int ready = 0;
        do {
            ready = ::poll(&pfd, 1, timeout_ms);
        } while (ready == -1 && errno == EINTR);
        if (ready == 0) {
            return std::unexpected(make_error_code(StorageErrc::Timeout));
        }
        if (ready == -1) {
            return std::unexpected(Storage::ErrnoToErrorCode(errno));
        }
        int so_error  = 0;
        socklen_t slen = sizeof(so_error);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &slen) == -1) {
            return std::unexpected(Storage::ErrnoToErrorCode(errno));
        }
        if (so_error != 0) {
            return std::unexpected(Storage::ErrnoToErrorCode(so_error));
        }
    }

    if (::fcntl(fd, F_SETFL, flags) == -1) {
        return std::unexpected(Storage::ErrnoToErrorCode(errno));
    }
    return {};
}

}  // namespace

StorageResult<TcpSocket> TcpSocket::Connect(
    const std::string& host, std::uint16_t port, std::chrono::milliseconds timeout
)
{
    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* raw = nullptr;
    const auto service = std::to_string(port);
    if (int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &raw); rc != 0) {
        spdlog::debug("Resolving {}:{} failed: {}", host, port, ::gai_strerror(rc));
        return std::unexpected(make_error_code(StorageErrc::ConnectionFailed));
    }
    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> addresses(raw, &::freeaddrinfo);

    std::error_code last_error = make_error_code(StorageErrc::ConnectionFailed);
    for (const addrinfo* ai = addresses.get(); ai != nullptr; ai = ai->ai_next) {
        Storage::FileDescriptorGuard fd(
            ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol)
        );
        if (!fd) {
            last_error = Storage::ErrnoToErrorCode(errno);
            continue;
        }
        auto connected = ConnectWithTimeout(
            fd.get(), ai->ai_addr, ai->ai_addrlen, static_cast<int>(timeout.count())
        );
        if (!connected) {
            last_error = connected.error();
            continue;
        }

        timeval tv{};
        tv.tv_sec  = static_cast<time_t>(timeout.count() / 1000);
        tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
        int one = 1;
        if (::setsockopt(fd.get(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == -1 ||
            ::setsockopt(fd.get(), SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == -1) {
            last_error = Storage::ErrnoToErrorCode(errno);
            continue;
        }
        if (::setsockopt(fd.get(), IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) == -1) {
            spdlog::debug("TCP_NODELAY not applied on {}:{}", host, port);
        }
        return TcpSocket(std::move(fd));
    }

    spdlog::debug("Connecting to {}:{} failed: {}", host, port, last_error.message());
    if (last_error == make_error_code(StorageErrc::Timeout)) {
        return std::unexpected(last_error);
    }
    return std::unexpected(make_error_code(StorageErrc::ConnectionFailed));
}

void TcpSocket::Close()
{
    fd_.reset();
    buffer_.clear();
}

StorageResult<void> TcpSocket::SendAll(std::string_view data)
{
    if (!fd_) {
        return std::unexpected(make_error_code(StorageErrc::ConnectionFailed));
    }
    std::size_t sent = 0;
    while (sent < data.size()) {
        const ssize_t n = ::send(fd_.get(), data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n == -1) {
            if (errno == EINTR) {
                continue;
            }
            const auto ec = Storage::ErrnoToErrorCode(errno);
            Close();
            return std::unexpected(ec);
        }
        sent += static_cast<std::size_t>(n);
    }
    return {};
}

StorageResult<void> TcpSocket::Fill()
{
    if (!fd_) {
        return std::unexpected(make_error_code(StorageErrc::ConnectionFailed));
    }
    char chunk[RECEIVE_CHUNK];
    ssize_t n = 0;
    do {
        n = ::recv(fd_.get(), chunk, sizeof(chunk), 0);
    } while (n == -1 && errno == EINTR);

    if (n == 0) {
        Close();
        return std::unexpected(make_error_code(StorageErrc::ConnectionFailed));
    }
    if (n == -1) {
        const auto ec = Storage::ErrnoToErrorCode(errno);
        Close();
        return std::unexpected(ec);
    }
    buffer_.append(chunk, static_cast<std::size_t>(n));
    return {};
}

StorageResult<std::string> TcpSocket::Receive()
{
    if (buffer_.empty()) {
        if (auto filled = Fill(); !filled) {
            return std::unexpected(filled.error());
        }
    }
    return std::exchange(buffer_, std::string());
}

StorageResult<std::string> TcpSocket::ReadLine()
{
    std::size_t crlf;
    while ((crlf = buffer_.find("\r\n")) == std::string::npos) {
        if (auto filled = Fill(); !filled) {
            return std::unexpected(filled.error());
        }
    }
    std::string line = buffer_.substr(0, crlf);
    buffer_.erase(0, crlf + 2);
    return line;
}

StorageResult<std::string> TcpSocket::ReadExact(std::size_t n)
{
    while (buffer_.size() < n) {
        if (auto filled = Fill(); !filled) {
            return std::unexpected(filled.error());
        }
    }
    std::string out = buffer_.substr(0, n);
    buffer_.erase(0, n);
    return out;
}

}  // namespace TierCache::Net
