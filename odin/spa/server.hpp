#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>

#include <odin/actors/actor.hpp>
#include <odin/actors/actorsystem.hpp>
#include <odin/address.hpp>
#include <odin/http/httpd.hpp>
#include <odin/log.hpp>
#include <odin/socket.hpp>
#include <odin/ssl.hpp>
#include <odin/ws.hpp>

#include "composition.hpp"
#include "connection.hpp"
#include "messages.hpp"
#include "router.hpp"
#include "service.hpp"
#include "ws_channel.hpp"

namespace NOdin {
namespace NSpa {

struct TSpaServerOptions {
    std::string Host = "127.0.0.1";
    // 0 picks a free port, see TSpaStatus
    int Port = 8080;
    // required when TConn is a TLS socket
    std::shared_ptr<TSslContext> Ssl;
    size_t MaxQueuedFrames = 1024;
    // how long OnStop waits for close frames to go out
    std::chrono::milliseconds CloseLinger{500};
    // upgrade request header carrying the user an authenticating front end
    // let through; empty leaves every connection anonymous
    std::string PrincipalHeader;
};

/**
 * @class TSpaServer
 * @brief Actor serving a composed single-page application.
 *
 * Owns the HTTP listener (routes in TSpaRouter) and every websocket
 * session. Inbound websocket messages are routed to the service named in
 * the envelope; per-connection init runs service by service in dependency
 * order, and a service only gets broadcasts on connections that completed
 * its init.
 *
 * @p TConn is TSocket for plain HTTP or TSslSocket<TSocket> for HTTPS.
 *
 * @code{.cpp}
 * auto composition = TComposition::Build({std::make_shared<TMyService>()}, "demo");
 * auto spa = system.Spawn<TSpaServer<TSocket>>("spa", {}, TSpaServerOptions{}, composition);
 * spa.TrySend(TBroadcastWsMsg{"my", "tick", {{"n", 1}}});
 * @endcode
 */
template<typename TConn>
class TSpaServer
    : public NActors::TActor<TSpaServer<TConn>, TSpaServerMessages>
    , public NHttp::IUpgradeHandler<TConn>
{
public:
    using TContext = NActors::TActorContext<TSpaServerMessages>;

    TSpaServer(TSpaServerOptions options, std::shared_ptr<const TComposition> composition)
        : Options_(std::move(options))
        , Composition_(std::move(composition))
    { }

    TFuture<void> OnStart(TContext& ctx) override {
        System_ = &ctx.System();
        Self_ = ctx.Self();

        auto host = Options_.Host;
        auto port = Options_.Port;
        auto resolve = [host, port]() {
            return TAddress::Resolve(host, port);
        };
        auto addresses = co_await ctx.Offload(std::move(resolve));
        if (addresses.empty()) {
            throw TOdinError(EErrorKind::ConfigError, "cannot resolve " + host);
        }
        const auto& address = addresses.front();

        TSocket listener(*System_->Poller(), address.Domain());
        listener.Bind(address);
        listener.Listen();
        Port_ = listener.LocalAddr() ? listener.LocalAddr()->Port() : port;

        Router_ = std::make_unique<TSpaRouter>(Composition_, *System_);
        Server_ = std::make_unique<NHttp::TWebServer<TConn>>(std::move(listener), *Router_, this, Options_.Ssl.get());
        Server_->Start();

        for (const auto& service : Composition_->Services()) {
            service->OnServerStart(Self_, *System_);
        }
        ODIN_INFO << "spa server '" << ctx.Name() << "' listening on " << host << ":" << Port_
            << " with " << Composition_->Services().size() << " services";
    }

    TFuture<void> OnStop(TContext& ctx) override {
        for (auto& [id, entry] : Connections_) {
            entry.Connection->Close(WsCloseGoingAway, "server shutting down");
        }
        auto deadline = TClock::now() + Options_.CloseLinger;
        while (HasPending() && TClock::now() < deadline) {
            co_await ctx.Sleep(std::chrono::milliseconds(10));
        }
        for (auto& [id, entry] : Connections_) {
            RemoveFromServices(*entry.Connection);
        }
        Connections_.clear();
        if (Server_) {
            Server_->Stop();
        }
        ODIN_INFO << "spa server '" << ctx.Name() << "' stopped";
    }

    void Receive(TConnectionOpened&& opened, TContext&) {
        auto id = opened.Connection->Id();
        ODIN_DEBUG << "websocket " << id << " opened from " << opened.Connection->Remote();
        Connections_[id].Connection = std::move(opened.Connection);
        StartInit(id);
    }

    void Receive(TConnectionClosed&& closed, TContext&) {
        auto it = Connections_.find(closed.ConnId);
        if (it == Connections_.end()) {
            return;
        }
        ODIN_DEBUG << "websocket " << closed.ConnId << " closed";
        RemoveFromServices(*it->second.Connection);
        Connections_.erase(it);
    }

    TFuture<void> Receive(TWsInbound&& inbound, TContext&) {
        auto it = Connections_.find(inbound.ConnId);
        if (it == Connections_.end()) {
            co_return;
        }
        auto conn = it->second.Connection;

        auto envelope = ParseWsMessage(inbound.Text);
        if (!envelope) {
            ODIN_WARN << "websocket " << conn->Id() << " from " << conn->Remote() << ": " << envelope.error().Message;
            conn->Close(WsCloseUnsupported, "malformed message");
            co_return;
        }
        auto service = Composition_->Find(envelope->Service);
        if (!service) {
            ODIN_DEBUG << "websocket " << conn->Id() << ": dropping message for unknown service '" << envelope->Service << "'";
            co_return;
        }

        TResult<TWsReaction> reaction;
        try {
            reaction = co_await service->HandleWsMessage(*conn, envelope->Type, envelope->Payload);
        } catch (const std::exception& ex) {
            ODIN_ERROR << "service '" << envelope->Service << "' failed on '" << envelope->Type << "': " << ex.what();
            conn->Close(WsCloseInternal, "internal error");
            co_return;
        }
        if (!reaction) {
            if (reaction.error().Kind == EErrorKind::ProtocolError) {
                ODIN_WARN << "websocket " << conn->Id() << ": " << reaction.error().Message;
                conn->Close(WsCloseUnsupported, reaction.error().Message);
            } else {
                ODIN_ERROR << "service '" << envelope->Service << "' failed on '" << envelope->Type << "': " << reaction.error().ToString();
            }
            co_return;
        }
        Apply(*conn, envelope->Service, *reaction);
    }

    void Receive(TSendWsMsg&& msg, TContext&) {
        auto it = Connections_.find(msg.ConnId);
        if (it == Connections_.end()) {
            ODIN_DEBUG << "no websocket " << msg.ConnId << " for " << msg.Service << "/" << msg.Type;
            return;
        }
        it->second.Connection->Send(msg.Service, msg.Type, msg.Payload);
    }

    void Receive(TBroadcastWsMsg&& msg, TContext&) {
        Broadcast(msg.Service, msg.Type, msg.Payload);
    }

    void Receive(TDataAvailable&& data, TContext&) {
        auto service = Composition_->Find(data.Service);
        if (!service) {
            ODIN_WARN << "data available for unknown service '" << data.Service << "'";
            return;
        }
        if (auto reaction = service->DataAvailable(data.Kind); reaction && reaction->Kind != TWsReaction::EKind::None) {
            Broadcast(data.Service, reaction->Type, reaction->Payload);
        }
        for (auto& [id, entry] : Connections_) {
            if (!entry.Connection->IsInitialized(data.Service)) {
                StartInit(id);
            }
        }
    }

    void Receive(TQuerySpaStatus&& query, TContext&) {
        query.Respond(TSpaStatus{Port_, Connections_.size()});
    }

    TFuture<void> HandleUpgrade(NHttp::TRequest& request, TConn& conn, std::string buffered, const std::string& peer) override {
        auto writer = [&conn](const void* data, size_t size) -> TFuture<ssize_t> {
            co_return co_await conn.WriteSome(data, size);
        };
        NHttp::TResponse rejection(writer);
        rejection.SetHeader("Connection", "close");

        if (request.Uri().Path() != "/ws") {
            co_await rejection.Reply(404, "text/plain", "not found\n");
            co_return;
        }
        if (System_->ShutdownRequested()) {
            co_await rejection.Reply(503, "text/plain", "shutting down\n");
            co_return;
        }
        if (request.Header("Sec-WebSocket-Version").value_or("") != "13") {
            rejection.SetHeader("Sec-WebSocket-Version", "13");
            co_await rejection.Reply(426, "text/plain", "unsupported websocket version\n");
            co_return;
        }
        auto key = request.Header("Sec-WebSocket-Key");
        if (!key || key->empty()) {
            co_await rejection.Reply(400, "text/plain", "missing Sec-WebSocket-Key\n");
            co_return;
        }

        TWebSocket<TConn> ws(conn, EWsRole::Server, std::move(buffered));
        co_await ws.Accept(*key);

        auto channel = std::make_shared<TWsChannel<TConn>>(ws, *System_, Options_.MaxQueuedFrames);
        TDetachOnExit detach{channel.get()};
        channel->Start();

        auto id = NextConnId_++;
        auto self = Self_;
        std::string principal;
        if (!Options_.PrincipalHeader.empty()) {
            principal = request.Header(Options_.PrincipalHeader).value_or("");
        }
        TConnectionOpened opening{std::make_shared<TSpaConnection>(id, peer, channel, std::move(principal))};
        auto opened = co_await self.Send(std::move(opening));
        if (!opened) {
            co_await ws.Close(WsCloseInternal, "server unavailable");
            co_return;
        }

        try {
            while (auto message = co_await ws.Receive()) {
                if (message->Opcode != EWsOpcode::Text) {
                    channel->Close(WsCloseUnsupported, "text frames only");
                    continue;
                }
                TWsInbound inbound{id, std::move(message->Data)};
                if (!co_await self.Send(std::move(inbound))) {
                    break;
                }
            }
        } catch (const TWsError& ex) {
            ODIN_WARN << "websocket " << id << " from " << peer << " closed with " << ex.Code() << ": " << ex.what();
        } catch (const std::exception& ex) {
            ODIN_DEBUG << "websocket " << id << " from " << peer << ": " << ex.what();
        }

        TConnectionClosed closing{id};
        auto closed = co_await self.Send(std::move(closing));
        if (!closed) {
            ODIN_DEBUG << "websocket " << id << ": " << closed.error().ToString();
        }
    }

private:
    struct TEntry {
        std::shared_ptr<TSpaConnection> Connection;
        TFuture<void> InitTask;
        // more data arrived while InitTask was running
        bool Rerun = false;
    };

    struct TDetachOnExit {
        TWsChannel<TConn>* Channel;

        ~TDetachOnExit() {
            Channel->Detach();
        }
    };

    void StartInit(uint64_t id) {
        auto& entry = Connections_[id];
        if (entry.InitTask.raw() && !entry.InitTask.done()) {
            entry.Rerun = true;
            return;
        }
        entry.InitTask = RunInit(id);
    }

    // Initializes the connection for every service whose dependencies are
    // done, in dependency order. A service answering false stays pending
    // until its next TDataAvailable.
    TFuture<void> RunInit(uint64_t id) {
        while (true) {
            auto it = Connections_.find(id);
            if (it == Connections_.end()) {
                co_return;
            }
            it->second.Rerun = false;
            auto conn = it->second.Connection;

            for (const auto& service : Composition_->Services()) {
                auto name = service->Name();
                if (!conn->IsOpen()) {
                    co_return;
                }
                if (conn->IsInitialized(name) || !DepsReady(*conn, name)) {
                    continue;
                }
                TResult<bool> done;
                try {
                    done = co_await service->InitConnection(*conn);
                } catch (const std::exception& ex) {
                    ODIN_ERROR << "init of '" << name << "' for websocket " << id << " threw: " << ex.what();
                    continue;
                }
                if (!Connections_.contains(id)) {
                    co_return;
                }
                if (!done) {
                    ODIN_WARN << "init of '" << name << "' for websocket " << id << " failed: " << done.error().ToString();
                } else if (*done) {
                    conn->MarkInitialized(name);
                    ODIN_DEBUG << "websocket " << id << " initialized for '" << name << "'";
                }
            }

            it = Connections_.find(id);
            if (it == Connections_.end() || !it->second.Rerun) {
                co_return;
            }
        }
    }

    bool DepsReady(const TSpaConnection& conn, const std::string& service) const {
        for (const auto& dep : Composition_->DepsOf(service)) {
            if (!conn.IsInitialized(dep)) {
                return false;
            }
        }
        return true;
    }

    void Apply(TSpaConnection& conn, const std::string& service, const TWsReaction& reaction) {
        switch (reaction.Kind) {
        case TWsReaction::EKind::None:
            break;
        case TWsReaction::EKind::Reply:
            conn.Send(service, reaction.Type, reaction.Payload);
            break;
        case TWsReaction::EKind::Broadcast:
            Broadcast(service, reaction.Type, reaction.Payload);
            break;
        }
    }

    void Broadcast(const std::string& service, const std::string& type, const nlohmann::json& payload) {
        std::string text;
        size_t sent = 0;
        for (auto& [id, entry] : Connections_) {
            if (!entry.Connection->IsInitialized(service)) {
                continue;
            }
            if (text.empty()) {
                text = FormatWsMessage(service, type, payload);
            }
            sent += entry.Connection->SendText(text);
        }
        ODIN_DEBUG << "broadcast " << service << "/" << type << " to " << sent << " connections";
    }

    void RemoveFromServices(const TSpaConnection& conn) {
        for (const auto& service : Composition_->Services()) {
            service->RemoveConnection(conn);
        }
    }

    bool HasPending() const {
        for (const auto& [id, entry] : Connections_) {
            if (entry.Connection->Pending()) {
                return true;
            }
        }
        return false;
    }

    TSpaServerOptions Options_;
    std::shared_ptr<const TComposition> Composition_;
    NActors::TActorSystem* System_ = nullptr;
    TSpaServerHandle Self_;
    int Port_ = 0;
    uint64_t NextConnId_ = 1;
    std::map<uint64_t, TEntry> Connections_;
    std::unique_ptr<TSpaRouter> Router_;
    // last: its client coroutines reference the members above
    std::unique_ptr<NHttp::TWebServer<TConn>> Server_;
};

} // namespace NSpa
} // namespace NOdin
