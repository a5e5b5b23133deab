#pragma once

#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include <odin/errors.hpp>

namespace NOdin {
namespace NSpa {

/// Outgoing side of a websocket as seen by the server actor.
class IWsChannel {
public:
    virtual ~IWsChannel() = default;

    /// Queues a text frame. False once the channel is closed.
    virtual bool Send(std::string text) = 0;
    /// Sends a close frame after the queued ones; later sends are dropped.
    virtual void Close(uint16_t code, std::string reason) = 0;
    virtual bool IsOpen() const = 0;
    /// Frames (or the close frame) not yet written.
    virtual bool Pending() const {
        return false;
    }
};

/// `{"service": .., "type": .., "payload": ..}`
struct TWsEnvelope {
    std::string Service;
    std::string Type;
    nlohmann::json Payload;
};

std::string FormatWsMessage(const std::string& service, const std::string& type, const nlohmann::json& payload);

/// ProtocolError if @p text is not a JSON object with string "service" and "type".
TResult<TWsEnvelope> ParseWsMessage(std::string_view text);

/**
 * @class TSpaConnection
 * @brief One websocket session of the SPA server.
 *
 * The set of services that finished their per-connection init only grows
 * while the connection lives.
 */
class TSpaConnection {
public:
    TSpaConnection(uint64_t id, std::string remote, std::shared_ptr<IWsChannel> channel, std::string principal = {})
        : Id_(id)
        , Remote_(std::move(remote))
        , Principal_(std::move(principal))
        , Channel_(std::move(channel))
    { }

    uint64_t Id() const {
        return Id_;
    }

    /// Peer address, for logs.
    const std::string& Remote() const {
        return Remote_;
    }

    /// Authenticated user, empty when the server does not authenticate.
    const std::string& Principal() const {
        return Principal_;
    }

    bool IsInitialized(const std::string& service) const {
        return Initialized_.contains(service);
    }

    void MarkInitialized(const std::string& service) {
        Initialized_.insert(service);
    }

    const std::set<std::string>& Initialized() const {
        return Initialized_;
    }

    bool Send(const std::string& service, const std::string& type, const nlohmann::json& payload);
    bool SendText(std::string text);
    void Close(uint16_t code, std::string reason = {});
    bool IsOpen() const;
    bool Pending() const;

    size_t SentFrames() const {
        return SentFrames_;
    }

private:
    uint64_t Id_;
    std::string Remote_;
    std::string Principal_;
    std::shared_ptr<IWsChannel> Channel_;
    std::set<std::string> Initialized_;
    size_t SentFrames_ = 0;
};

} // namespace NSpa
} // namespace NOdin
