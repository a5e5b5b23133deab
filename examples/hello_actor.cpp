#include <iostream>
#include <string>

#include <odin/all.hpp>
#include <odin/actors/actorsystem.hpp>

using namespace NOdin;
using namespace NOdin::NActors;

struct TGreet {
    std::string Name;
};

class TGreeter: public TActor<TGreeter, TMessageSet<TGreet>> {
public:
    TReceiveAction Receive(TGreet&& greet, TContext&) {
        std::cout << "hello " << greet.Name << std::endl;
        return TReceiveAction::RequestTermination();
    }

    TFuture<void> OnStop(TContext& ctx) override {
        std::cout << "greeter '" << ctx.Name() << "' stopped" << std::endl;
        co_return;
    }
};

int main(int argc, char** argv) {
    TInitializer init;
    std::string name = argc > 1 ? argv[1] : "world";

    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());
    system.HandleSignals();

    auto greeter = system.Spawn<TGreeter>("g");
    if (auto res = greeter.TrySend(TGreet{name}); !res) {
        std::cerr << res.error().ToString() << std::endl;
        return 1;
    }
    system.ProcessRequests(loop);
    return 0;
}
