#include "ws.hpp"

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace NOdin {

namespace {

// Value of the Sec-WebSocket-Accept header in a raw response head, or "".
std::string FindSecWebSocketAccept(const std::string& head) {
    static constexpr std::string_view name = "sec-websocket-accept";
    std::istringstream lines(head);
    std::string line;
    while (std::getline(lines, line)) {
        auto colon = line.find(':');
        if (colon != name.size()) {
            continue;
        }
        bool same = std::equal(name.begin(), name.end(), line.begin(), [](char a, char b) {
            return a == std::tolower(static_cast<unsigned char>(b));
        });
        if (!same) {
            continue;
        }
        auto first = line.find_first_not_of(" \t", colon + 1);
        auto last = line.find_last_not_of(" \t\r");
        if (first == std::string::npos || last < first) {
            return {};
        }
        return line.substr(first, last - first + 1);
    }
    return {};
}

} // namespace

namespace NDetail {

std::string Base64Encode(const unsigned char* data, size_t size) {
    std::string out(4 * ((size + 2) / 3), '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data, static_cast<int>(size));
    if (n < 0) {
        throw std::runtime_error("EVP_EncodeBlock failed");
    }
    out.resize(n);
    return out;
}

std::string GenerateWebSocketKey(std::random_device& rd) {
    unsigned char nonce[16];
    for (auto& byte : nonce) {
        byte = static_cast<unsigned char>(rd());
    }
    return Base64Encode(nonce, sizeof(nonce));
}

std::string ComputeWebSocketAccept(std::string_view clientKeyBase64) {
    // RFC 6455 section 1.3
    std::string keyed = std::string(clientKeyBase64) + "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
    unsigned char digest[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(keyed.data()), keyed.size(), digest);
    return Base64Encode(digest, sizeof(digest));
}

void CheckSecWebSocketAccept(const std::string& allServerHeaders, const std::string& clientKeyBase64)
{
    auto got = FindSecWebSocketAccept(allServerHeaders);
    if (got.empty()) {
        throw std::invalid_argument("No Sec-WebSocket-Accept header in handshake response");
    }
    auto expected = ComputeWebSocketAccept(clientKeyBase64);
    if (got != expected) {
        throw std::invalid_argument("Sec-WebSocket-Accept mismatch: got '" + got + "', expected '" + expected + "'");
    }
}

std::string FormatWebSocketAccept(std::string_view clientKeyBase64) {
    return "HTTP/1.1 101 Switching Protocols\r\n"
           "Upgrade: websocket\r\n"
           "Connection: Upgrade\r\n"
           "Sec-WebSocket-Accept: " + ComputeWebSocketAccept(clientKeyBase64) + "\r\n\r\n";
}

void AppendWsFrame(std::string& out, EWsOpcode opcode, std::string_view payload, bool fin, const uint8_t* mask) {
    out.push_back(static_cast<char>((fin ? 0x80 : 0) | static_cast<uint8_t>(opcode)));

    uint8_t maskBit = mask ? 0x80 : 0;
    uint64_t size = payload.size();
    if (size <= 125) {
        out.push_back(static_cast<char>(maskBit | size));
    } else if (size <= 0xFFFF) {
        out.push_back(static_cast<char>(maskBit | 126));
        out.push_back(static_cast<char>(size >> 8));
        out.push_back(static_cast<char>(size & 0xff));
    } else {
        out.push_back(static_cast<char>(maskBit | 127));
        for (int shift = 56; shift >= 0; shift -= 8) {
            out.push_back(static_cast<char>((size >> shift) & 0xff));
        }
    }

    if (!mask) {
        out.append(payload);
        return;
    }
    out.append(reinterpret_cast<const char*>(mask), 4);
    auto offset = out.size();
    out.append(payload);
    for (size_t i = 0; i < payload.size(); ++i) {
        out[offset + i] ^= static_cast<char>(mask[i % 4]);
    }
}

} // namespace NDetail

} // namespace NOdin
