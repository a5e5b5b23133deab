#pragma once

#include <arpa/inet.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <netinet/in.h>

#include <string>
#include <variant>
#include <vector>

namespace NOdin {

/**
 * @class TAddress
 * @brief IPv4 or IPv6 socket address.
 *
 * Literal addresses are parsed directly. Host names go through Resolve(),
 * which blocks and therefore must run on the blocking pool.
 */
class TAddress {
public:
    TAddress(const std::string& addr, int port);
    TAddress(sockaddr_in addr);
    TAddress(sockaddr_in6 addr);
    TAddress(const sockaddr* addr, socklen_t len);
    TAddress() = default;

    /// getaddrinfo() lookup of @p host. Throws std::runtime_error if nothing is found.
    static std::vector<TAddress> Resolve(const std::string& host, int port);

    const std::variant<sockaddr_in, sockaddr_in6>& Addr() const;
    std::pair<const sockaddr*, int> RawAddr() const;
    bool operator == (const TAddress& other) const;
    int Domain() const;
    int Port() const;
    TAddress WithPort(int port) const;
    /// "1.2.3.4:80" or "[::1]:80"
    std::string ToString() const;

private:
    std::variant<sockaddr_in, sockaddr_in6> Addr_ = {};
};

} // namespace NOdin
