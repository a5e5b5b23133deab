#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "log.hpp"

namespace NOdin {

enum class EPollerKind {
    Epoll,
    Poll,
};

struct TSystemConfig {
    size_t MailboxCapacity = 16;
    std::chrono::milliseconds GracePeriod{2000};
    std::chrono::milliseconds SchedulerGranularity{1};
    size_t BlockingThreads = 4;
    // 0: off
    std::chrono::milliseconds Heartbeat{0};
    EPollerKind Poller = EPollerKind::Epoll;
};

struct TTlsConfig {
    std::string Cert;
    std::string Key;
};

struct TServerConfig {
    std::string Name = "odin";
    std::string Host = "127.0.0.1";
    int Port = 8080;
    std::optional<TTlsConfig> Tls;
    // see TSpaServerOptions::PrincipalHeader
    std::string PrincipalHeader;
};

struct TStoreConfig {
    // empty: memory only
    std::string Path;
    std::chrono::milliseconds Debounce{200};
};

/**
 * @brief Process configuration, one JSON document.
 *
 * @code{.json}
 * {
 *   "system": {"mailbox_capacity": 16, "grace_period_ms": 2000, "poller": "epoll"},
 *   "server": {"name": "odin", "host": "0.0.0.0", "port": 8443,
 *              "tls": {"cert": "server.crt", "key": "server.key"},
 *              "principal_header": "X-Forwarded-User"},
 *   "store": {"path": "/var/lib/odin/shared.bin", "debounce_ms": 200},
 *   "services": {"share": {}},
 *   "log_level": "info"
 * }
 * @endcode
 *
 * Every field is optional. Unknown keys are ignored, wrong types and out of
 * range values are a ConfigError.
 */
struct TConfig {
    TSystemConfig System;
    TServerConfig Server;
    TStoreConfig Store;
    // opaque per-service options, keyed by service name
    std::map<std::string, nlohmann::json> Services;
    ELogLevel LogLevel = ELogLevel::Info;

    /// @throws TOdinError ConfigError
    static TConfig FromJson(const nlohmann::json& json);
    static TConfig Parse(const std::string& text);
    static TConfig Load(const std::string& path);

    /// Applies ODIN_HOST, ODIN_PORT, ODIN_NAME, ODIN_MAILBOX_CAPACITY,
    /// ODIN_GRACE_MS, ODIN_STORE_PATH and ODIN_LOG found in the environment.
    void ApplyEnvironment();

    /// Options of @p service, an empty object if none are configured.
    const nlohmann::json& ServiceOptions(const std::string& service) const;
};

} // namespace NOdin
