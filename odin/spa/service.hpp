#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <odin/corochain.hpp>
#include <odin/errors.hpp>

#include "components.hpp"
#include "connection.hpp"
#include "messages.hpp"

namespace NOdin {
namespace NActors {
class TActorSystem;
} // namespace NActors

namespace NSpa {

/// What the server does after a service handled an inbound message.
struct TWsReaction {
    enum class EKind {
        None,
        Reply,
        Broadcast,
    };

    EKind Kind = EKind::None;
    std::string Type;
    nlohmann::json Payload;

    static TWsReaction None() {
        return {};
    }

    /// Back to the sender only.
    static TWsReaction Reply(std::string type, nlohmann::json payload) {
        return {EKind::Reply, std::move(type), std::move(payload)};
    }

    /// To every connection initialized for the service.
    static TWsReaction Broadcast(std::string type, nlohmann::json payload) {
        return {EKind::Broadcast, std::move(type), std::move(payload)};
    }
};

/**
 * @class IService
 * @brief Composable unit of the SPA server.
 *
 * A service contributes assets, proxies, HTML and client modules once at
 * composition time, and takes part in the websocket protocol under its
 * name. All hooks run on the loop thread on behalf of the server actor.
 *
 * InitConnection() resolves to true when the connection is initialized for
 * the service, to false when the service has nothing to send yet (the
 * server retries after a TDataAvailable for it).
 */
class IService {
public:
    virtual ~IService() = default;

    virtual std::string Name() const = 0;

    virtual std::vector<std::string> Deps() const {
        return {};
    }

    virtual void AddComponents(TComponentsBuilder& builder) = 0;

    /// Called when the server actor starts, before any connection exists.
    virtual void OnServerStart(const TSpaServerHandle&, NActors::TActorSystem&) { }

    virtual TFuture<TResult<bool>> InitConnection(TSpaConnection&) {
        co_return true;
    }

    virtual TFuture<TResult<TWsReaction>> HandleWsMessage(TSpaConnection&, const std::string& type, const nlohmann::json&) {
        co_return MakeError(EErrorKind::ProtocolError, "unexpected message type '" + type + "' for service " + Name());
    }

    /// Reaction to broadcast, if any.
    virtual std::optional<TWsReaction> DataAvailable(const std::string& /*kind*/) {
        return std::nullopt;
    }

    /// The connection is gone; drop whatever is kept for it.
    virtual void RemoveConnection(const TSpaConnection&) { }
};

} // namespace NSpa
} // namespace NOdin
