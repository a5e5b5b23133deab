#include <iostream>
#include <memory>
#include <type_traits>

#include <odin/all.hpp>
#include <odin/cli.hpp>
#include <odin/config.hpp>
#include <odin/actors/actorsystem.hpp>
#include <odin/spa/server.hpp>
#include <odin/spa/share_service.hpp>
#include <odin/store/store_actor.hpp>

using namespace NOdin;

namespace {

NActors::TSystemOptions SystemOptions(const TSystemConfig& config) {
    NActors::TSystemOptions options;
    options.MailboxCapacity = config.MailboxCapacity;
    options.GracePeriod = config.GracePeriod;
    options.SchedulerGranularity = config.SchedulerGranularity;
    options.BlockingThreads = config.BlockingThreads;
    options.Heartbeat = config.Heartbeat;
    return options;
}

// Shuts the system down with a failure code if the server does not come up.
TFuture<void> WatchStartup(NSpa::TSpaServerHandle spa, NActors::TActorSystem& system, int& exitCode) {
    auto status = co_await spa.Ask<NSpa::TSpaStatus>(NSpa::TGetSpaStatus{}, std::chrono::seconds(10));
    if (!status || status->Port == 0) {
        ODIN_ERROR << "spa server did not start" << (status ? std::string() : ": " + status.error().ToString());
        exitCode = 1;
        system.Shutdown();
        co_return;
    }
    ODIN_INFO << "serving on port " << status->Port;
}

template<typename TPoller, typename TConn>
int Serve(const TConfig& config) {
    TLoop<TPoller> loop;
    NActors::TActorSystem system(&loop.Poller(), SystemOptions(config.System));
    system.HandleSignals();

    std::shared_ptr<TSslContext> ssl;
    if constexpr (!std::is_same_v<TConn, TSocket>) {
        ssl = std::make_shared<TSslContext>(TSslContext::Server(config.Server.Tls->Cert, config.Server.Tls->Key));
    }

    auto store = system.Spawn<NStore::TSharedStoreActor<nlohmann::json>>(
        "store", {}, NStore::TSharedStoreOptions{config.Store.Path, config.Store.Debounce});

    auto composition = NSpa::TComposition::Build({std::make_shared<NSpa::TShareService>(store)}, config.Server.Name);

    NActors::TSpawnOptions spawnOptions;
    spawnOptions.Supervision = NActors::ESupervision::Escalate;
    NSpa::TSpaServerOptions serverOptions;
    serverOptions.Host = config.Server.Host;
    serverOptions.Port = config.Server.Port;
    serverOptions.Ssl = ssl;
    serverOptions.PrincipalHeader = config.Server.PrincipalHeader;
    auto spa = system.Spawn<NSpa::TSpaServer<TConn>>("spa", spawnOptions, serverOptions, composition);

    int exitCode = 0;
    auto startup = WatchStartup(spa, system, exitCode);
    system.ProcessRequests(loop);
    ODIN_INFO << "bye";
    return exitCode;
}

template<typename TPoller>
int ServeWith(const TConfig& config) {
    if (config.Server.Tls) {
        return Serve<TPoller, TSslSocket<TSocket>>(config);
    }
    return Serve<TPoller, TSocket>(config);
}

} // namespace

int main(int argc, char** argv) {
    TInitializer init;
    TCommandLine cli("odin_server");

    TConfig config;
    try {
        cli.Parse(argc, argv);
        if (cli.Has("help")) {
            cli.PrintUsage(std::cout);
            return 0;
        }
        if (auto path = cli.Get("config")) {
            config = TConfig::Load(*path);
        }
        config.ApplyEnvironment();
        if (auto level = cli.Get("log")) {
            auto parsed = ParseLogLevel(*level);
            if (!parsed) {
                throw TOdinError(EErrorKind::ConfigError, "unknown log level '" + *level + "'");
            }
            config.LogLevel = *parsed;
        }
    } catch (const TOdinError& ex) {
        std::cerr << ex.what() << "\n";
        cli.PrintUsage(std::cerr);
        return 2;
    }
    TLogger::Instance().SetLevel(config.LogLevel);

    try {
        if (config.System.Poller == EPollerKind::Poll) {
            return ServeWith<TPoll>(config);
        }
        return ServeWith<TDefaultPoller>(config);
    } catch (const std::exception& ex) {
        ODIN_ERROR << ex.what();
        return 1;
    }
}
