#include "socket.hpp"

#include <fcntl.h>

namespace NOdin {

namespace {

// Non-blocking mode, plus keep-alive for stream sockets.
int MakeNonBlocking(int fd) {
    int type = 0;
    socklen_t len = sizeof(type);
    if (getsockopt(fd, SOL_SOCKET, SO_TYPE, &type, &len) == 0 && type == SOCK_STREAM) {
        int on = 1;
        if (setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on)) < 0) {
            throw std::system_error(errno, std::generic_category(), "setsockopt");
        }
    }

    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        throw std::system_error(errno, std::generic_category(), "fcntl");
    }
    return fd;
}

int OpenSocket(int domain, int type) {
    int fd = socket(domain, type | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), "socket");
    }
    return fd;
}

} // namespace

TDescriptor::TDescriptor(TPollerBase& poller, int fd)
    : Poller_(&poller)
    , Fd_(MakeNonBlocking(fd))
{ }

TDescriptor::~TDescriptor() {
    Close();
}

void TDescriptor::Close() {
    if (Fd_ < 0) {
        return;
    }
    ::close(Fd_);
    Poller_->RemoveEvent(Fd_);
    Fd_ = -1;
}

void TDescriptor::Take(TDescriptor& other) {
    Close();
    Poller_ = other.Poller_;
    Fd_ = std::exchange(other.Fd_, -1);
}

TFileHandle::TFileHandle(int fd, TPollerBase& poller)
    : TStream(poller, fd)
{ }

TFileHandle::TFileHandle(TFileHandle&& other) {
    Take(other);
}

TFileHandle& TFileHandle::operator=(TFileHandle&& other) {
    if (this != &other) {
        Take(other);
    }
    return *this;
}

TSocket::TSocket(TPollerBase& poller, int domain, int type)
    : TStream(poller, OpenSocket(domain, type))
{ }

TSocket::TSocket(const TAddress& addr, int fd, TPollerBase& poller)
    : TStream(poller, fd)
    , RemoteAddr_(addr)
{ }

TSocket::TSocket(TSocket&& other) {
    *this = std::move(other);
}

TSocket& TSocket::operator=(TSocket&& other) {
    if (this != &other) {
        Take(other);
        LocalAddr_ = std::move(other.LocalAddr_);
        RemoteAddr_ = std::move(other.RemoteAddr_);
    }
    return *this;
}

void TSocket::Bind(const TAddress& addr) {
    if (LocalAddr_) {
        throw std::runtime_error("Already bound");
    }
    int on = 1;
    if (setsockopt(Fd_, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on)) < 0) {
        throw std::system_error(errno, std::generic_category(), "setsockopt");
    }
    auto [raw, len] = addr.RawAddr();
    if (bind(Fd_, raw, len) < 0) {
        throw std::system_error(errno, std::generic_category(), "bind");
    }

    // read back the port the kernel picked for port 0
    sockaddr_storage bound;
    socklen_t boundLen = sizeof(bound);
    if (getsockname(Fd_, reinterpret_cast<sockaddr*>(&bound), &boundLen) < 0) {
        throw std::system_error(errno, std::generic_category(), "getsockname");
    }
    LocalAddr_ = TAddress{reinterpret_cast<sockaddr*>(&bound), boundLen};
}

void TSocket::Listen(int backlog) {
    if (listen(Fd_, backlog) < 0) {
        throw std::system_error(errno, std::generic_category(), "listen");
    }
}

const std::optional<TAddress>& TSocket::LocalAddr() const {
    return LocalAddr_;
}

const std::optional<TAddress>& TSocket::RemoteAddr() const {
    return RemoteAddr_;
}

int TSocket::PendingError(int fd) {
    int err = 0;
    socklen_t len = sizeof(err);
    if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) < 0) {
        return errno;
    }
    return err;
}

} // namespace NOdin
