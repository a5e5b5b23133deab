#include "address.hpp"

#include <netdb.h>
#include <string.h>
#include <stdexcept>
#include <type_traits>

namespace NOdin {

TAddress::TAddress(const std::string& addr, int port)
{
    sockaddr_in addr4 = {};
    sockaddr_in6 addr6 = {};
    if (inet_pton(AF_INET, addr.c_str(), &addr4.sin_addr) == 1) {
        addr4.sin_family = AF_INET;
        addr4.sin_port = htons(port);
        Addr_ = addr4;
    } else if (inet_pton(AF_INET6, addr.c_str(), &addr6.sin6_addr) == 1) {
        addr6.sin6_family = AF_INET6;
        addr6.sin6_port = htons(port);
        Addr_ = addr6;
    } else {
        throw std::runtime_error("Cannot parse address: '" + addr + "'");
    }
}

TAddress::TAddress(sockaddr_in addr)
    : Addr_(addr)
{ }

TAddress::TAddress(sockaddr_in6 addr)
    : Addr_(addr)
{ }

TAddress::TAddress(const sockaddr* addr, socklen_t len) {
    if (addr->sa_family == AF_INET && len >= static_cast<socklen_t>(sizeof(sockaddr_in))) {
        sockaddr_in addr4; memcpy(&addr4, addr, sizeof(addr4));
        Addr_ = addr4;
    } else if (addr->sa_family == AF_INET6 && len >= static_cast<socklen_t>(sizeof(sockaddr_in6))) {
        sockaddr_in6 addr6; memcpy(&addr6, addr, sizeof(addr6));
        Addr_ = addr6;
    } else {
        throw std::runtime_error("Unsupported address, family: " + std::to_string(addr->sa_family)
            + ", size: " + std::to_string(len));
    }
}

std::vector<TAddress> TAddress::Resolve(const std::string& host, int port) {
    addrinfo hints = {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* result = nullptr;
    int err = getaddrinfo(host.c_str(), nullptr, &hints, &result);
    if (err != 0) {
        throw std::runtime_error("Cannot resolve '" + host + "': " + gai_strerror(err));
    }
    std::vector<TAddress> addresses;
    for (auto* it = result; it; it = it->ai_next) {
        if (it->ai_family == AF_INET || it->ai_family == AF_INET6) {
            addresses.emplace_back(TAddress{it->ai_addr, it->ai_addrlen}.WithPort(port));
        }
    }
    freeaddrinfo(result);
    if (addresses.empty()) {
        throw std::runtime_error("No addresses for '" + host + "'");
    }
    return addresses;
}

int TAddress::Domain() const {
    return std::holds_alternative<sockaddr_in>(Addr_) ? PF_INET : PF_INET6;
}

int TAddress::Port() const {
    return std::visit([](const auto& a) -> int {
        if constexpr (std::is_same_v<std::decay_t<decltype(a)>, sockaddr_in>) {
            return ntohs(a.sin_port);
        } else {
            return ntohs(a.sin6_port);
        }
    }, Addr_);
}

TAddress TAddress::WithPort(int port) const {
    return std::visit([port](auto a) -> TAddress {
        if constexpr (std::is_same_v<decltype(a), sockaddr_in>) {
            a.sin_port = htons(port);
        } else {
            a.sin6_port = htons(port);
        }
        return TAddress{a};
    }, Addr_);
}

const std::variant<sockaddr_in, sockaddr_in6>& TAddress::Addr() const { return Addr_; }

std::pair<const sockaddr*, int> TAddress::RawAddr() const {
    return std::visit([](const auto& a) -> std::pair<const sockaddr*, int> {
        return {reinterpret_cast<const sockaddr*>(&a), sizeof(a)};
    }, Addr_);
}

bool TAddress::operator == (const TAddress& other) const {
    return memcmp(&Addr_, &other.Addr_, sizeof(Addr_)) == 0;
}

std::string TAddress::ToString() const {
    char buf[INET6_ADDRSTRLEN];
    if (const auto* val = std::get_if<sockaddr_in>(&Addr_)) {
        if (inet_ntop(AF_INET, &val->sin_addr, buf, sizeof(buf))) {
            return std::string(buf) + ":" + std::to_string(Port());
        }
    } else if (const auto* val = std::get_if<sockaddr_in6>(&Addr_)) {
        if (inet_ntop(AF_INET6, &val->sin6_addr, buf, sizeof(buf))) {
            return "[" + std::string(buf) + "]:" + std::to_string(Port());
        }
    }
    return "";
}

} // namespace NOdin
