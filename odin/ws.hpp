#pragma once

#include "corochain.hpp"
#include "sockutils.hpp"

#include <cstdint>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace NOdin {

enum class EWsRole {
    Client,
    Server,
};

enum class EWsOpcode : uint8_t {
    Continuation = 0x0,
    Text = 0x1,
    Binary = 0x2,
    Close = 0x8,
    Ping = 0x9,
    Pong = 0xA,
};

// RFC 6455 close codes in use
inline constexpr uint16_t WsCloseNormal = 1000;
inline constexpr uint16_t WsCloseGoingAway = 1001;
inline constexpr uint16_t WsCloseProtocolError = 1002;
inline constexpr uint16_t WsCloseUnsupported = 1003;
inline constexpr uint16_t WsCloseTooBig = 1009;
inline constexpr uint16_t WsCloseInternal = 1011;

/// Peer violated the protocol; the close frame with Code() has been sent.
class TWsError: public std::runtime_error {
public:
    TWsError(uint16_t code, const std::string& message)
        : std::runtime_error(message)
        , Code_(code)
    { }

    uint16_t Code() const {
        return Code_;
    }

private:
    uint16_t Code_;
};

struct TWsMessage {
    EWsOpcode Opcode = EWsOpcode::Text;
    std::string Data;
};

namespace NDetail {

std::string Base64Encode(const unsigned char* data, size_t dataLen);
std::string GenerateWebSocketKey(std::random_device& rd);
/// base64(SHA1(key + GUID))
std::string ComputeWebSocketAccept(std::string_view clientKeyBase64);
void CheckSecWebSocketAccept(const std::string& allServerHeaders, const std::string& clientKeyBase64);
/// 101 response for a request carrying @p clientKeyBase64.
std::string FormatWebSocketAccept(std::string_view clientKeyBase64);
void AppendWsFrame(std::string& out, EWsOpcode opcode, std::string_view payload, bool fin, const uint8_t* mask);

} // namespace NDetail

/**
 * @class TWebSocket
 * @brief WebSocket protocol layer on top of a connected stream.
 *
 * A client performs the opening handshake with Connect(); a server side
 * instance is created after the HTTP upgrade request has been read and
 * answers it with Accept(). Client frames are masked, server frames are not.
 *
 * Receive() returns whole messages: fragments are reassembled, pings are
 * answered, pongs are skipped, and a close frame is echoed and reported as
 * std::nullopt. Messages above MaxMessageSize close the connection with
 * 1009.
 *
 * Sends may be issued while a Receive() is pending; frames are queued and
 * written by whichever send is currently flushing, so a frame is never
 * interleaved with another.
 *
 * @code{.cpp}
 * TWebSocket<TSocket> ws(socket);
 * co_await ws.Connect("localhost", "/ws");
 * co_await ws.SendText(R"({"service":"odin","type":"hello","payload":{}})");
 * auto reply = co_await ws.Receive();
 * @endcode
 */
template<typename TSocket>
class TWebSocket {
public:
    static constexpr size_t MaxMessageSize = 16 * 1024 * 1024;

    explicit TWebSocket(TSocket& socket, EWsRole role = EWsRole::Client, std::string buffered = {})
        : Socket(socket)
        , Role(role)
        , Reader(socket, std::move(buffered))
        , Writer(socket)
    { }

    /// Client handshake. @p headers go into the upgrade request as they are.
    TFuture<void> Connect(const std::string& host, const std::string& path,
                          const std::vector<std::pair<std::string, std::string>>& headers = {})
    {
        auto key = NDetail::GenerateWebSocketKey(Rd);
        std::string request =
            "GET " + path + " HTTP/1.1\r\n"
            "Host: " + host + "\r\n"
            "User-Agent: odin\r\n"
            "Accept: */*\r\n"
            "Connection: Upgrade\r\n"
            "Upgrade: websocket\r\n"
            "Sec-WebSocket-Key: " + key + "\r\n"
            "Sec-WebSocket-Version: 13\r\n";
        for (const auto& [name, value] : headers) {
            request += name + ": " + value + "\r\n";
        }
        request += "\r\n";

        co_await Writer.Write(request.data(), request.size());

        auto response = co_await Reader.ReadUntil("\r\n\r\n", 64 * 1024);
        if (response.find(" 101 ") == std::string::npos) {
            throw std::runtime_error("Failed to establish WebSocket connection: " + response.substr(0, response.find("\r\n")));
        }
        NDetail::CheckSecWebSocketAccept(response, key);
        co_return;
    }

    /// Completes the server handshake for a request carrying @p clientKey.
    TFuture<void> Accept(std::string_view clientKey) {
        auto response = NDetail::FormatWebSocketAccept(clientKey);
        co_await Writer.Write(response.data(), response.size());
        co_return;
    }

    TFuture<void> SendText(std::string_view message) {
        co_await SendFrame(EWsOpcode::Text, message);
    }

    TFuture<void> SendBinary(std::string_view message) {
        co_await SendFrame(EWsOpcode::Binary, message);
    }

    TFuture<void> Ping(std::string_view payload = {}) {
        co_await SendFrame(EWsOpcode::Ping, payload);
    }

    /// Sends a close frame once; later calls do nothing.
    TFuture<void> Close(uint16_t code = WsCloseNormal, std::string_view reason = {}) {
        if (CloseSent_ || Broken_) {
            co_return;
        }
        std::string payload;
        payload.push_back(static_cast<char>(code >> 8));
        payload.push_back(static_cast<char>(code & 0xff));
        payload.append(reason.substr(0, 123));
        co_await SendFrame(EWsOpcode::Close, payload);
        CloseSent_ = true;
    }

    /// Next text or binary message, std::nullopt after a close frame.
    TFuture<std::optional<TWsMessage>> Receive() {
        std::optional<TWsMessage> message;
        while (true) {
            auto frame = co_await ReadFrame();
            auto opcode = frame.Opcode;

            if (opcode == EWsOpcode::Ping) {
                co_await SendFrame(EWsOpcode::Pong, frame.Payload);
                continue;
            }
            if (opcode == EWsOpcode::Pong) {
                continue;
            }
            if (opcode == EWsOpcode::Close) {
                uint16_t code = WsCloseNormal;
                if (frame.Payload.size() >= 2) {
                    code = static_cast<uint16_t>((static_cast<uint8_t>(frame.Payload[0]) << 8) | static_cast<uint8_t>(frame.Payload[1]));
                }
                CloseCode_ = code;
                co_await Close(code);
                co_return std::nullopt;
            }

            if (opcode == EWsOpcode::Continuation) {
                if (!message) {
                    co_await Fail(WsCloseProtocolError, "continuation frame without a message");
                }
                message->Data += frame.Payload;
            } else {
                if (message) {
                    co_await Fail(WsCloseProtocolError, "new message inside a fragmented one");
                }
                message = TWsMessage{opcode, std::move(frame.Payload)};
            }
            if (message->Data.size() > MaxMessageSize) {
                co_await Fail(WsCloseTooBig, "message exceeds " + std::to_string(MaxMessageSize) + " bytes");
            }
            if (frame.Fin) {
                co_return std::move(message);
            }
        }
    }

    /// Text of the next message; throws on binary messages and on close.
    TFuture<std::string> ReceiveText() {
        auto message = co_await Receive();
        if (!message) {
            throw std::runtime_error("WebSocket closed with code " + std::to_string(CloseCode_.value_or(WsCloseNormal)));
        }
        if (message->Opcode != EWsOpcode::Text) {
            throw std::runtime_error("Unexpected binary message");
        }
        co_return std::move(message->Data);
    }

    bool CloseSent() const {
        return CloseSent_;
    }

    /// Code of the close frame received from the peer.
    std::optional<uint16_t> CloseCode() const {
        return CloseCode_;
    }

    size_t PendingBytes() const {
        return OutBuf_.size();
    }

private:
    struct TFrame {
        EWsOpcode Opcode;
        bool Fin;
        std::string Payload;
    };

    TFuture<void> Fail(uint16_t code, const std::string& message) {
        co_await Close(code, message);
        throw TWsError(code, message);
    }

    TFuture<TFrame> ReadFrame() {
        uint8_t header[2];
        co_await Reader.Read(header, sizeof(header));

        bool fin = header[0] & 0x80;
        uint8_t rsv = header[0] & 0x70;
        auto opcode = static_cast<EWsOpcode>(header[0] & 0x0F);
        bool masked = header[1] & 0x80;
        uint64_t payloadLength = header[1] & 0x7F;

        if (rsv != 0) {
            co_await Fail(WsCloseProtocolError, "reserved bits set");
        }
        switch (opcode) {
        case EWsOpcode::Continuation:
        case EWsOpcode::Text:
        case EWsOpcode::Binary:
            break;
        case EWsOpcode::Close:
        case EWsOpcode::Ping:
        case EWsOpcode::Pong:
            if (!fin || payloadLength > 125) {
                co_await Fail(WsCloseProtocolError, "fragmented or oversized control frame");
            }
            break;
        default:
            co_await Fail(WsCloseProtocolError, "unknown opcode " + std::to_string(static_cast<int>(opcode)));
        }
        if (masked != (Role == EWsRole::Server)) {
            co_await Fail(WsCloseProtocolError, Role == EWsRole::Server ? "unmasked client frame" : "masked server frame");
        }

        if (payloadLength == 126) {
            uint8_t ext[2];
            co_await Reader.Read(ext, sizeof(ext));
            payloadLength = (uint64_t(ext[0]) << 8) | ext[1];
        } else if (payloadLength == 127) {
            uint8_t ext[8];
            co_await Reader.Read(ext, sizeof(ext));
            payloadLength = 0;
            for (auto b : ext) {
                payloadLength = (payloadLength << 8) | b;
            }
        }
        if (payloadLength > MaxMessageSize) {
            co_await Fail(WsCloseTooBig, "frame exceeds " + std::to_string(MaxMessageSize) + " bytes");
        }

        uint8_t mask[4] = {0};
        if (masked) {
            co_await Reader.Read(mask, sizeof(mask));
        }

        TFrame frame{opcode, fin, std::string(payloadLength, '\0')};
        co_await Reader.Read(frame.Payload.data(), frame.Payload.size());

        if (masked) {
            for (size_t i = 0; i < frame.Payload.size(); ++i) {
                frame.Payload[i] ^= mask[i % 4];
            }
        }
        co_return frame;
    }

    TFuture<void> SendFrame(EWsOpcode opcode, std::string_view payload) {
        if (Broken_) {
            throw std::runtime_error("WebSocket connection is broken");
        }
        if (CloseSent_) {
            co_return;
        }
        if (Role == EWsRole::Client) {
            uint8_t mask[4];
            for (auto& b : mask) {
                b = static_cast<uint8_t>(Rd());
            }
            NDetail::AppendWsFrame(OutBuf_, opcode, payload, true, mask);
        } else {
            NDetail::AppendWsFrame(OutBuf_, opcode, payload, true, nullptr);
        }
        if (Writing_) {
            co_return;
        }

        Writing_ = true;
        try {
            while (!OutBuf_.empty()) {
                auto chunk = std::exchange(OutBuf_, {});
                co_await Writer.Write(chunk.data(), chunk.size());
            }
        } catch (...) {
            Writing_ = false;
            Broken_ = true;
            throw;
        }
        Writing_ = false;
    }

    TSocket& Socket;
    EWsRole Role;
    TByteReader<TSocket> Reader;
    TByteWriter<TSocket> Writer;
    std::random_device Rd;
    std::string OutBuf_;
    bool Writing_ = false;
    bool Broken_ = false;
    bool CloseSent_ = false;
    std::optional<uint16_t> CloseCode_;
};

} // namespace NOdin
