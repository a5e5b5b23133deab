#include "odin_service.hpp"

namespace NOdin {
namespace NSpa {

namespace {

const char* WsJs = R"JS(// websocket client, one socket per page
const handlers = new Map();
const pending = [];
let socket = null;
let retryMs = 1000;

export function addWsHandler(service, handler) {
  if (!handlers.has(service)) {
    handlers.set(service, []);
  }
  handlers.get(service).push(handler);
}

export function sendWsMessage(service, type, payload) {
  const text = JSON.stringify({ service, type, payload });
  if (socket && socket.readyState === WebSocket.OPEN) {
    socket.send(text);
  } else {
    pending.push(text);
  }
}

function dispatch(event) {
  let msg;
  try {
    msg = JSON.parse(event.data);
  } catch (e) {
    console.warn("odin: malformed message", e);
    return;
  }
  const list = handlers.get(msg.service);
  if (!list) {
    console.debug("odin: no handler for", msg.service);
    return;
  }
  for (const handler of list) {
    handler(msg.type, msg.payload);
  }
}

export function connect() {
  const scheme = location.protocol === "https:" ? "wss:" : "ws:";
  socket = new WebSocket(`${scheme}//${location.host}/ws`);
  socket.onopen = () => {
    retryMs = 1000;
    while (pending.length > 0) {
      socket.send(pending.shift());
    }
  };
  socket.onmessage = dispatch;
  socket.onclose = () => {
    socket = null;
    setTimeout(connect, retryMs);
    retryMs = Math.min(retryMs * 2, 30000);
  };
}
)JS";

const char* MainJs = R"JS(import * as ws from "./ws.js";

ws.addWsHandler("odin", (type, payload) => {
  if (type === "pong") {
    console.debug("odin: pong", payload);
  }
});

export function postInitialize() {
  ws.connect();
}
)JS";

} // namespace

void TOdinService::AddComponents(TComponentsBuilder& builder) {
    builder.AddAsset("ws.js", WsJs);
    builder.AddAsset("main.js", MainJs);
    builder.AddModule("ws.js");
    builder.AddModule("main.js");
}

TFuture<TResult<TWsReaction>> TOdinService::HandleWsMessage(TSpaConnection&, const std::string& type, const nlohmann::json& payload) {
    if (type == "ping") {
        co_return TWsReaction::Reply("pong", payload);
    }
    co_return MakeError(EErrorKind::ProtocolError, "unexpected message type '" + type + "' for service odin");
}

std::shared_ptr<IService> MakeOdinService() {
    return std::make_shared<TOdinService>();
}

} // namespace NSpa
} // namespace NOdin
