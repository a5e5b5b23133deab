#pragma once

#include <deque>
#include <memory>
#include <string>

#include <odin/actors/actorsystem.hpp>
#include <odin/log.hpp>
#include <odin/ws.hpp>

#include "connection.hpp"

namespace NOdin {
namespace NSpa {

/**
 * @class TWsChannel
 * @brief IWsChannel writing into a server side TWebSocket.
 *
 * Frames are queued and written by a writer coroutine, so the actor that
 * sends never waits for the network. A connection that lets more than
 * @p maxQueued frames pile up is closed with 1008.
 *
 * The websocket lives in the upgrade coroutine; Detach() must be called
 * before it goes away.
 */
template<typename TConn>
class TWsChannel: public IWsChannel {
public:
    TWsChannel(TWebSocket<TConn>& ws, NActors::TActorSystem& system, size_t maxQueued)
        : Ws_(&ws)
        , System_(system)
        , MaxQueued_(maxQueued)
    { }

    void Start() {
        Writer_ = RunWriter();
    }

    bool Send(std::string text) override {
        if (!IsOpen()) {
            return false;
        }
        if (Queue_.size() >= MaxQueued_) {
            ODIN_WARN << "websocket peer is too slow, " << Queue_.size() << " frames queued";
            Close(1008, "too many queued frames");
            return false;
        }
        Queue_.push_back(std::move(text));
        Wake();
        return true;
    }

    void Close(uint16_t code, std::string reason) override {
        if (!IsOpen()) {
            return;
        }
        Open_ = false;
        CloseCode_ = code;
        CloseReason_ = std::move(reason);
        Wake();
    }

    bool IsOpen() const override {
        return Open_ && Ws_;
    }

    bool Pending() const override {
        return Ws_ && Running_ && (!Parked_ || !Queue_.empty() || !Open_);
    }

    void Detach() {
        Open_ = false;
        Ws_ = nullptr;
        Queue_.clear();
        Writer_ = {};
    }

private:
    void Wake() {
        if (Slot_ && !Slot_->Fired) {
            System_.Wake(Slot_);
        }
    }

    TFuture<void> RunWriter() {
        Running_ = true;
        try {
            while (Ws_) {
                while (!Queue_.empty()) {
                    auto text = std::move(Queue_.front());
                    Queue_.pop_front();
                    co_await Ws_->SendText(text);
                }
                if (!Open_) {
                    co_await Ws_->Close(CloseCode_, CloseReason_);
                    break;
                }
                Slot_ = std::make_shared<TParked>();
                Parked_ = true;
                co_await TParkAwaiter(Slot_);
                Parked_ = false;
            }
        } catch (const std::exception& ex) {
            ODIN_DEBUG << "websocket writer: " << ex.what();
            Open_ = false;
        }
        Running_ = false;
    }

    TWebSocket<TConn>* Ws_;
    NActors::TActorSystem& System_;
    size_t MaxQueued_;
    std::deque<std::string> Queue_;
    std::shared_ptr<TParked> Slot_;
    bool Open_ = true;
    bool Running_ = false;
    bool Parked_ = false;
    uint16_t CloseCode_ = WsCloseNormal;
    std::string CloseReason_;
    TFuture<void> Writer_;
};

} // namespace NSpa
} // namespace NOdin
