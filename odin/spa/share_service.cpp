#include "share_service.hpp"

#include <odin/action/action.hpp>
#include <odin/log.hpp>

namespace NOdin {
namespace NSpa {

namespace {

using TJsonStore = NStore::ISharedStore<nlohmann::json>;
using TJsonChange = NStore::TSharedStoreChange<nlohmann::json>;

const char* ShareJs = R"JS(import { addWsHandler, sendWsMessage } from "../odin/ws.js";

const items = new Map();
const listeners = [];

function notify(key, item) {
  for (const listener of listeners) {
    listener(key, item);
  }
}

addWsHandler("share", (type, payload) => {
  if (type === "initSharedItems") {
    items.clear();
    for (const item of payload.items) {
      items.set(item.key, item);
      notify(item.key, item);
    }
  } else if (type === "sharedItemChanged") {
    if (payload.item === null) {
      items.delete(payload.key);
    } else {
      items.set(payload.key, payload.item);
    }
    notify(payload.key, payload.item);
  }
});

export function getShared(key) {
  return items.get(key);
}

export function onSharedChange(listener) {
  listeners.push(listener);
}

export function setShared(key, value, comment = "") {
  sendWsMessage("share", "setShared", { key, value, comment });
}

export function removeShared(key) {
  sendWsMessage("share", "removeShared", { key });
}
)JS";

TResult<std::string> RequireKey(const nlohmann::json& payload) {
    if (!payload.is_object()) {
        return MakeError(EErrorKind::ProtocolError, "share payload must be an object");
    }
    auto key = payload.find("key");
    if (key == payload.end() || !key->is_string() || key->get_ref<const std::string&>().empty()) {
        return MakeError(EErrorKind::ProtocolError, "share payload needs a non-empty string 'key'");
    }
    return key->get<std::string>();
}

} // namespace

void TShareService::AddComponents(TComponentsBuilder& builder) {
    builder.AddAsset("share.js", ShareJs);
    builder.AddModule("share.js");
}

void TShareService::OnServerStart(const TSpaServerHandle& server, NActors::TActorSystem&) {
    if (Subscribed_ == server) {
        return;
    }
    Subscribed_ = server;

    auto action = NAction::SendMsgAction<TJsonChange>(server, [](const TJsonChange& change) {
        nlohmann::json item = nullptr;
        if (change.New) {
            item = TJsonStore::ItemToJson(*change.New);
        }
        return TBroadcastWsMsg{ServiceName, "sharedItemChanged", {{"key", change.Key}, {"item", std::move(item)}}};
    });
    auto res = Store_.TrySend(NStore::TSubscribeStore<nlohmann::json>{
        std::make_shared<NAction::TDynActionAdapter<TJsonChange>>(std::move(action))});
    if (!res) {
        ODIN_ERROR << "share service cannot subscribe to '" << Store_.Name() << "': " << res.error().ToString();
    }
}

TFuture<TResult<bool>> TShareService::InitConnection(TSpaConnection& conn) {
    auto items = co_await Store_.Ask<std::vector<NStore::TSharedItem<nlohmann::json>>>(NStore::TListShared{}, Timeout_);
    if (!items) {
        co_return std::unexpected(items.error());
    }
    auto list = nlohmann::json::array();
    for (const auto& item : *items) {
        list.push_back(TJsonStore::ItemToJson(item));
    }
    conn.Send(ServiceName, "initSharedItems", {{"items", std::move(list)}});
    co_return true;
}

TFuture<TResult<TWsReaction>> TShareService::HandleWsMessage(TSpaConnection& conn, const std::string& type, const nlohmann::json& payload) {
    if (type == "setShared") {
        auto key = RequireKey(payload);
        if (!key) {
            co_return std::unexpected(key.error());
        }
        NStore::TSetShared<nlohmann::json> set;
        set.Key = std::move(*key);
        set.Value = payload.value("value", nlohmann::json());
        set.Owner = conn.Principal().empty() ? conn.Remote() : conn.Principal();
        if (auto comment = payload.find("comment"); comment != payload.end() && comment->is_string()) {
            set.Comment = comment->get<std::string>();
        }
        auto sent = co_await Store_.SendWithTimeout(std::move(set), Timeout_);
        if (!sent) {
            co_return std::unexpected(sent.error());
        }
        co_return TWsReaction::None();
    }
    if (type == "removeShared") {
        auto key = RequireKey(payload);
        if (!key) {
            co_return std::unexpected(key.error());
        }
        NStore::TRemoveShared remove{std::move(*key)};
        auto sent = co_await Store_.SendWithTimeout(std::move(remove), Timeout_);
        if (!sent) {
            co_return std::unexpected(sent.error());
        }
        co_return TWsReaction::None();
    }
    co_return MakeError(EErrorKind::ProtocolError, "unexpected message type '" + type + "' for service share");
}

} // namespace NSpa
} // namespace NOdin
