#pragma once

#include <arpa/inet.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <netinet/in.h>
#include <unistd.h>

#include <optional>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "poller.hpp"
#include "address.hpp"

namespace NOdin {

namespace NDetail {

/**
 * @brief One non-blocking read or write.
 *
 * The syscall is tried in await_ready(); only if it would block is the
 * coroutine parked on the poller, and the syscall is retried on resume.
 * The awaited value is what the syscall returned: bytes moved, 0 at end of
 * stream, or a negative value if it would still block (callers retry).
 * Any other failure is thrown as std::system_error.
 */
template<typename TOps, int Direction>
struct TIoAwaiter {
    bool await_ready() {
        Try();
        return Done = Ret >= 0;
    }

    void await_suspend(THandle h) {
        if constexpr (Direction == TEvent::READ) {
            Poller->AddRead(Fd, h);
        } else {
            Poller->AddWrite(Fd, h);
        }
    }

    ssize_t await_resume() {
        if (!Done) {
            Try();
        }
        return Ret;
    }

    void Try() {
        if (Fd < 0) {
            throw std::system_error(EBADF, std::generic_category(), "closed descriptor");
        }
        if constexpr (Direction == TEvent::READ) {
            Ret = TOps::Read(Fd, Buf, Size);
        } else {
            Ret = TOps::Write(Fd, Buf, Size);
        }
        if (Ret < 0 && errno != EINTR && errno != EAGAIN && errno != EINPROGRESS) {
            throw std::system_error(errno, std::generic_category());
        }
    }

    TPollerBase* Poller;
    int Fd;
    void* Buf;
    size_t Size;
    ssize_t Ret = -1;
    bool Done = false;
};

} // namespace NDetail

/// Owns a non-blocking descriptor registered with a poller.
class TDescriptor {
public:
    TPollerBase* Poller() { return Poller_; }

    bool IsOpen() const {
        return Fd_ >= 0;
    }

    int Fd() const {
        return Fd_;
    }

    /// Closes the descriptor and withdraws it from the poller. Idempotent.
    void Close();

protected:
    TDescriptor() = default;
    TDescriptor(TPollerBase& poller, int fd);
    ~TDescriptor();

    TDescriptor(const TDescriptor&) = delete;
    TDescriptor& operator=(const TDescriptor&) = delete;

    void Take(TDescriptor& other);

    TPollerBase* Poller_ = nullptr;
    int Fd_ = -1;
};

/**
 * @class TStream
 * @brief Awaitable ReadSome()/WriteSome() over a descriptor.
 *
 * @tparam TOps static Read/Write wrappers for the descriptor kind
 */
template<typename TOps>
class TStream: public TDescriptor {
public:
    auto ReadSome(void* buf, size_t size) {
        return NDetail::TIoAwaiter<TOps, TEvent::READ>{Poller_, Fd_, buf, size};
    }

    auto WriteSome(const void* buf, size_t size) {
        return NDetail::TIoAwaiter<TOps, TEvent::WRITE>{Poller_, Fd_, const_cast<void*>(buf), size};
    }

protected:
    using TDescriptor::TDescriptor;
};

struct TFileOps {
    static ssize_t Read(int fd, void* buf, size_t count) {
        return ::read(fd, buf, count);
    }

    static ssize_t Write(int fd, const void* buf, size_t count) {
        return ::write(fd, buf, count);
    }
};

struct TSockOps {
    static ssize_t Read(int fd, void* buf, size_t count) {
        return ::recv(fd, buf, count, 0);
    }

    static ssize_t Write(int fd, const void* buf, size_t count) {
        return ::send(fd, buf, count, MSG_NOSIGNAL);
    }
};

/// eventfd, signalfd or any other pollable descriptor that is not a socket.
class TFileHandle: public TStream<TFileOps> {
public:
    TFileHandle() = default;
    TFileHandle(int fd, TPollerBase& poller);

    TFileHandle(TFileHandle&& other);
    TFileHandle& operator=(TFileHandle&& other);
};

/**
 * @class TSocket
 * @brief Non-blocking TCP socket.
 *
 * @code{.cpp}
 * TSocket listener(poller, address.Domain());
 * listener.Bind(address);
 * listener.Listen();
 * auto client = co_await listener.Accept();
 * @endcode
 */
class TSocket: public TStream<TSockOps> {
public:
    using TPoller = TPollerBase;

    TSocket() = default;

    TSocket(TPollerBase& poller, int domain, int type = SOCK_STREAM);
    TSocket(const TAddress& addr, int fd, TPollerBase& poller);

    TSocket(TSocket&& other);
    TSocket& operator=(TSocket&& other);

    /**
     * @brief Connects to @p addr.
     *
     * Throws std::system_error(timed_out) if @p deadline passes first and
     * std::system_error with the socket error if the connection is refused.
     */
    auto Connect(const TAddress& addr, TTime deadline = TTime::max()) {
        if (RemoteAddr_) {
            throw std::runtime_error("Already connected");
        }
        RemoteAddr_ = addr;

        struct TConnectAwaiter {
            bool await_ready() {
                auto [raw, len] = Addr;
                if (connect(Fd, raw, len) == 0) {
                    return true;
                }
                if (errno != EINTR && errno != EAGAIN && errno != EINPROGRESS) {
                    throw std::system_error(errno, std::generic_category(), "connect");
                }
                return false;
            }

            void await_suspend(THandle h) {
                Poller->AddWrite(Fd, h);
                if (Deadline != TTime::max()) {
                    TimerId = Poller->AddTimer(Deadline, h);
                }
                Suspended = true;
            }

            void await_resume() {
                if (!Suspended) {
                    return;
                }
                if (Deadline != TTime::max() && Poller->RemoveTimer(TimerId, Deadline)) {
                    throw std::system_error(std::make_error_code(std::errc::timed_out));
                }
                int err = PendingError(Fd);
                if (err != 0) {
                    throw std::system_error(err, std::generic_category(), "connect");
                }
            }

            TPollerBase* Poller;
            int Fd;
            std::pair<const sockaddr*, int> Addr;
            TTime Deadline;
            unsigned TimerId = 0;
            bool Suspended = false;
        };
        return TConnectAwaiter{Poller_, Fd_, RemoteAddr_->RawAddr(), deadline};
    }

    auto Accept() {
        struct TAcceptAwaiter {
            bool await_ready() const { return false; }

            void await_suspend(THandle h) {
                Poller->AddRead(Fd, h);
            }

            TSocket await_resume() {
                sockaddr_storage peer;
                socklen_t len = sizeof(peer);
                int fd = accept4(Fd, reinterpret_cast<sockaddr*>(&peer), &len, SOCK_CLOEXEC);
                if (fd < 0) {
                    throw std::system_error(errno, std::generic_category(), "accept");
                }
                return TSocket{TAddress{reinterpret_cast<sockaddr*>(&peer), len}, fd, *Poller};
            }

            TPollerBase* Poller;
            int Fd;
        };
        return TAcceptAwaiter{Poller_, Fd_};
    }

    /// Binds with SO_REUSEADDR. Port 0 picks a free port; LocalAddr() reports it.
    void Bind(const TAddress& addr);
    void Listen(int backlog = 128);
    const std::optional<TAddress>& RemoteAddr() const;
    const std::optional<TAddress>& LocalAddr() const;

private:
    static int PendingError(int fd);

    std::optional<TAddress> LocalAddr_;
    std::optional<TAddress> RemoteAddr_;
};

} // namespace NOdin
