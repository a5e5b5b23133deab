#pragma once

#include <chrono>

#include <nlohmann/json.hpp>

#include <odin/store/store_actor.hpp>

#include "service.hpp"

namespace NOdin {
namespace NSpa {

using TShareStoreHandle = NActors::TActorHandle<NStore::TSharedStoreMessages<nlohmann::json>>;

/**
 * @class TShareService
 * @brief Exposes a shared store of JSON values to the page.
 *
 * Websocket protocol under service "share":
 *
 *   server -> client  initSharedItems   {"items": [item, ...]}
 *   server -> client  sharedItemChanged {"key": .., "item": item or null}
 *   client -> server  setShared         {"key": .., "value": .., "comment": ..}
 *   client -> server  removeShared      {"key": ..}
 *
 * where an item is {"key", "value", "timestamp", "owner", "comment"}. The
 * owner of a change is the connection's principal, or its address when
 * there is none.
 */
class TShareService: public IService {
public:
    static constexpr const char* ServiceName = "share";

    explicit TShareService(TShareStoreHandle store, std::chrono::milliseconds timeout = std::chrono::seconds(5))
        : Store_(std::move(store))
        , Timeout_(timeout)
    { }

    std::string Name() const override {
        return ServiceName;
    }

    void AddComponents(TComponentsBuilder& builder) override;
    void OnServerStart(const TSpaServerHandle& server, NActors::TActorSystem& system) override;
    TFuture<TResult<bool>> InitConnection(TSpaConnection& conn) override;
    TFuture<TResult<TWsReaction>> HandleWsMessage(TSpaConnection& conn, const std::string& type, const nlohmann::json& payload) override;

private:
    TShareStoreHandle Store_;
    std::chrono::milliseconds Timeout_;
    TSpaServerHandle Subscribed_;
};

} // namespace NSpa
} // namespace NOdin
