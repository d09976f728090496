#include "flycache/cache/remote/RemoteConnection.hpp"
#include "flycache/cache/base/CacheError.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace flycache {
namespace cache {
namespace remote {

namespace {

// Таймаут poll в миллисекундах для срока; -1 если срок не задан
int pollTimeout(const Deadline& deadline) {
    auto remaining = deadline.remaining();
    if (!remaining) return -1;
    auto ms = remaining->count();
    if (ms > 0x7fffffff) return 0x7fffffff;
    return static_cast<int>(ms);
}

std::string errnoText(int err) {
    return std::strerror(err);
}

bool setNonBlocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    return flags >= 0 && ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

} // namespace

std::unique_ptr<RemoteConnection> RemoteConnection::open(const RemoteTarget& target,
                                                         std::chrono::milliseconds connectTimeout,
                                                         std::chrono::milliseconds ioTimeout,
                                                         const Deadline& deadline) {
    const std::string endpoint = target.host + ":" + std::to_string(target.port);
    auto connectDeadline = Deadline::earliest(deadline, Deadline::after(connectTimeout));

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* result = nullptr;
    int rc = ::getaddrinfo(target.host.c_str(), std::to_string(target.port).c_str(), &hints, &result);
    if (rc != 0) {
        throw BackendUnavailableError("connect", endpoint, std::string("resolve failed: ") + ::gai_strerror(rc));
    }
    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> addresses(result, &::freeaddrinfo);

    std::string lastError = "no addresses";
    for (addrinfo* ai = addresses.get(); ai != nullptr; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            lastError = errnoText(errno);
            continue;
        }
        if (!setNonBlocking(fd)) {
            lastError = errnoText(errno);
            ::close(fd);
            continue;
        }

        rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (rc != 0 && errno != EINPROGRESS) {
            lastError = errnoText(errno);
            ::close(fd);
            continue;
        }

        if (rc != 0) {
            pollfd pfd{fd, POLLOUT, 0};
            int ready = ::poll(&pfd, 1, pollTimeout(connectDeadline));
            if (ready <= 0) {
                lastError = ready == 0 ? "connect timeout" : errnoText(errno);
                ::close(fd);
                continue;
            }
            int soError = 0;
            socklen_t len = sizeof(soError);
            if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len) != 0 || soError != 0) {
                lastError = errnoText(soError != 0 ? soError : errno);
                ::close(fd);
                continue;
            }
        }

        int one = 1;
        ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
        return std::unique_ptr<RemoteConnection>(new RemoteConnection(fd, ioTimeout, endpoint));
    }

    throw BackendUnavailableError("connect", endpoint, lastError);
}

RemoteConnection::RemoteConnection(int fd, std::chrono::milliseconds ioTimeout, std::string endpoint)
    : fd_(fd)
    , ioTimeout_(ioTimeout)
    , endpoint_(std::move(endpoint))
    , createdAt_(Clock::now())
    , lastUsed_(createdAt_) {
}

RemoteConnection::~RemoteConnection() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

RespValue RemoteConnection::execute(const std::vector<std::string>& args, const Deadline& deadline) {
    if (broken_) {
        throw BackendUnavailableError("execute", endpoint_, "connection is broken");
    }
    auto ioDeadline = Deadline::earliest(deadline, Deadline::after(ioTimeout_));

    try {
        sendAll(encodeCommand(args), ioDeadline);
        while (true) {
            auto reply = reader_.next();
            if (reply) {
                lastUsed_ = Clock::now();
                return std::move(*reply);
            }
            receiveSome(ioDeadline);
        }
    } catch (const BackendError&) {
        broken_ = true;
        throw;
    } catch (const std::runtime_error& e) {
        // Нарушение протокола: состояние потока неизвестно
        broken_ = true;
        throw BackendError("execute", endpoint_, e.what());
    }
}

int RemoteConnection::waitFor(short events, const Deadline& deadline) {
    while (true) {
        pollfd pfd{fd_, events, 0};
        int ready = ::poll(&pfd, 1, pollTimeout(deadline));
        if (ready > 0) {
            return pfd.revents;
        }
        if (ready == 0) {
            throw BackendUnavailableError("io", endpoint_, "operation timed out");
        }
        if (errno != EINTR) {
            throw BackendUnavailableError("io", endpoint_, errnoText(errno));
        }
    }
}

void RemoteConnection::sendAll(const std::string& data, const Deadline& deadline) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            waitFor(POLLOUT, deadline);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        throw BackendUnavailableError("send", endpoint_, n == 0 ? "connection closed" : errnoText(errno));
    }
}

void RemoteConnection::receiveSome(const Deadline& deadline) {
    char buf[16384];
    while (true) {
        ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
        if (n > 0) {
            reader_.feed(buf, static_cast<size_t>(n));
            return;
        }
        if (n == 0) {
            throw BackendUnavailableError("recv", endpoint_, "connection closed by peer");
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            waitFor(POLLIN, deadline);
            continue;
        }
        if (errno != EINTR) {
            throw BackendUnavailableError("recv", endpoint_, errnoText(errno));
        }
    }
}

} // namespace remote
} // namespace cache
} // namespace flycache
