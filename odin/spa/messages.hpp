#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include <odin/actors/handle.hpp>
#include <odin/actors/messages.hpp>

namespace NOdin {
namespace NSpa {

class TSpaConnection;

/// Unicast to one connection.
struct TSendWsMsg {
    uint64_t ConnId = 0;
    std::string Service;
    std::string Type;
    nlohmann::json Payload;
};

/// To every connection that completed the init of Service.
struct TBroadcastWsMsg {
    std::string Service;
    std::string Type;
    nlohmann::json Payload;
};

/// Service has (new) data: broadcast its reaction and run its pending inits.
struct TDataAvailable {
    std::string Service;
    std::string Kind;
};

// Sent by the websocket side of the server itself.
struct TConnectionOpened {
    std::shared_ptr<TSpaConnection> Connection;
};

struct TWsInbound {
    uint64_t ConnId = 0;
    std::string Text;
};

struct TConnectionClosed {
    uint64_t ConnId = 0;
};

struct TSpaStatus {
    // bound port, 0 before the listener is up
    int Port = 0;
    size_t Connections = 0;
};

struct TGetSpaStatus { };

using TQuerySpaStatus = NActors::TQuery<TGetSpaStatus, TSpaStatus>;

using TSpaServerMessages = NActors::TMessageSet<
    TSendWsMsg,
    TBroadcastWsMsg,
    TDataAvailable,
    TConnectionOpened,
    TWsInbound,
    TConnectionClosed,
    TQuerySpaStatus>;

using TSpaServerHandle = NActors::TActorHandle<TSpaServerMessages>;

} // namespace NSpa
} // namespace NOdin
