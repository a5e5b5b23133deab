#include <chrono>
#include <ctime>
#include <iostream>
#include <memory>

#include <odin/all.hpp>
#include <odin/cli.hpp>
#include <odin/actors/actorsystem.hpp>
#include <odin/spa/server.hpp>

using namespace NOdin;
using namespace NOdin::NActors;
using namespace NOdin::NSpa;

namespace {

const char* ClockJs = R"JS(import { addWsHandler } from "../odin/ws.js";

addWsHandler("clock", (type, payload) => {
  if (type === "tick") {
    document.getElementById("clock").textContent = new Date(payload.time).toISOString();
  }
});
)JS";

const char* CounterJs = R"JS(import { addWsHandler, sendWsMessage } from "../odin/ws.js";

addWsHandler("counter", (type, payload) => {
  if (type === "count") {
    document.getElementById("count").textContent = payload.value;
  }
});

export function postInitialize() {
  document.getElementById("increment").onclick = () => sendWsMessage("counter", "increment", {});
}
)JS";

class TClockService: public IService {
public:
    std::string Name() const override {
        return "clock";
    }

    void AddComponents(TComponentsBuilder& builder) override {
        builder.AddAsset("clock.js", ClockJs);
        builder.AddModule("clock.js");
        builder.AddBodyFragment("<p>server time: <span id=\"clock\">-</span></p>");
    }
};

// Shared counter; its updates go to every page that saw the clock first.
class TCounterService: public IService {
public:
    std::string Name() const override {
        return "counter";
    }

    std::vector<std::string> Deps() const override {
        return {"clock"};
    }

    void AddComponents(TComponentsBuilder& builder) override {
        builder.AddAsset("counter.js", CounterJs);
        builder.AddModule("counter.js");
        builder.AddBodyFragment("<p>count: <span id=\"count\">0</span> <button id=\"increment\">+1</button></p>");
    }

    TFuture<TResult<bool>> InitConnection(TSpaConnection& conn) override {
        conn.Send(Name(), "count", {{"value", Count_}});
        co_return true;
    }

    TFuture<TResult<TWsReaction>> HandleWsMessage(TSpaConnection&, const std::string& type, const nlohmann::json&) override {
        if (type != "increment") {
            co_return MakeError(EErrorKind::ProtocolError, "unexpected message type '" + type + "' for service counter");
        }
        ++Count_;
        co_return TWsReaction::Broadcast("count", {{"value", Count_}});
    }

    std::optional<TWsReaction> DataAvailable(const std::string& kind) override {
        if (kind == "reset") {
            Count_ = 0;
        }
        return TWsReaction::Broadcast("count", {{"value", Count_}});
    }

private:
    int64_t Count_ = 0;
};

// Sends the time every second and resets the counter every minute.
class TTicker: public TActor<TTicker, TMessageSet<std::monostate>> {
public:
    explicit TTicker(TSpaServerHandle spa)
        : Spa_(std::move(spa))
    { }

    void Receive(std::monostate&&, TContext&) { }

    TFuture<void> OnStart(TContext& ctx) override {
        ctx.StartRepeatTimer(1, std::chrono::seconds(1));
        co_return;
    }

    TFuture<TReceiveAction> OnTimer(TTimerId, uint32_t coalesced, TContext&) override {
        Ticks_ += coalesced;
        auto now = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch());
        if (auto res = Spa_.TrySend(TBroadcastWsMsg{"clock", "tick", {{"time", now.count()}}}); !res) {
            ODIN_DEBUG << "tick dropped: " << res.error().ToString();
        }
        if (Ticks_ % 60 == 0) {
            if (auto res = Spa_.TrySend(TDataAvailable{"counter", "reset"}); !res) {
                ODIN_DEBUG << "reset dropped: " << res.error().ToString();
            }
        }
        co_return TReceiveAction::Continue();
    }

private:
    TSpaServerHandle Spa_;
    uint64_t Ticks_ = 0;
};

} // namespace

int main(int argc, char** argv) {
    TInitializer init;
    TCommandLine cli("spa_demo");
    cli.AddOption("port", "listen port", true, "8080");
    int port = 0;
    try {
        cli.Parse(argc, argv);
        port = std::stoi(*cli.Get("port"));
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << "\n";
        cli.PrintUsage(std::cerr);
        return 2;
    }
    if (cli.Has("help")) {
        cli.PrintUsage(std::cout);
        return 0;
    }
    if (auto level = ParseLogLevel(cli.Get("log").value_or("info"))) {
        TLogger::Instance().SetLevel(*level);
    }

    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());
    system.HandleSignals();

    // listed out of order on purpose: composition sorts by dependencies
    auto composition = TComposition::Build({std::make_shared<TCounterService>(), std::make_shared<TClockService>()}, "odin demo");

    TSpaServerOptions options;
    options.Port = port;
    auto spa = system.Spawn<TSpaServer<TSocket>>("spa", {}, options, composition);
    system.Spawn<TTicker>("ticker", {}, spa);

    system.ProcessRequests(loop);
    return 0;
}
