#include "config.hpp"
#include "errors.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace NOdin {

namespace {

[[noreturn]] void Fail(const std::string& message) {
    throw TOdinError(EErrorKind::ConfigError, message);
}

const nlohmann::json* Section(const nlohmann::json& json, const char* name) {
    auto it = json.find(name);
    if (it == json.end() || it->is_null()) {
        return nullptr;
    }
    if (!it->is_object()) {
        Fail(std::string("'") + name + "' must be an object");
    }
    return &*it;
}

template<typename T>
void ReadInteger(const nlohmann::json& section, const char* path, const char* name, T& to, int64_t min, int64_t max) {
    auto it = section.find(name);
    if (it == section.end()) {
        return;
    }
    if (!it->is_number_integer()) {
        Fail(std::string(path) + "." + name + " must be an integer");
    }
    auto value = it->get<int64_t>();
    if (value < min || value > max) {
        Fail(std::string(path) + "." + name + " must be in [" + std::to_string(min) + ", " + std::to_string(max) + "]");
    }
    to = static_cast<T>(value);
}

void ReadMillis(const nlohmann::json& section, const char* path, const char* name, std::chrono::milliseconds& to, int64_t min) {
    int64_t value = to.count();
    ReadInteger(section, path, name, value, min, 24 * 3600 * 1000);
    to = std::chrono::milliseconds(value);
}

void ReadString(const nlohmann::json& section, const char* path, const char* name, std::string& to) {
    auto it = section.find(name);
    if (it == section.end()) {
        return;
    }
    if (!it->is_string()) {
        Fail(std::string(path) + "." + name + " must be a string");
    }
    to = it->get<std::string>();
}

ELogLevel ToLogLevel(const std::string& name, const char* where) {
    auto level = ParseLogLevel(name);
    if (!level) {
        Fail(std::string(where) + ": unknown log level '" + name + "'");
    }
    return *level;
}

int64_t ToInteger(const char* name, const char* value) {
    int64_t result = 0;
    auto end = value + std::char_traits<char>::length(value);
    auto [ptr, ec] = std::from_chars(value, end, result);
    if (ec != std::errc() || ptr != end) {
        Fail(std::string(name) + "=" + value + " is not an integer");
    }
    return result;
}

void Validate(const TConfig& config) {
    if (config.Server.Port < 0 || config.Server.Port > 65535) {
        Fail("server.port must be in [0, 65535]");
    }
    if (config.Server.Host.empty()) {
        Fail("server.host must not be empty");
    }
    if (config.System.MailboxCapacity == 0) {
        Fail("system.mailbox_capacity must be positive");
    }
}

} // namespace

TConfig TConfig::FromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        Fail("configuration must be a JSON object");
    }

    TConfig config;
    if (auto* system = Section(json, "system")) {
        ReadInteger(*system, "system", "mailbox_capacity", config.System.MailboxCapacity, 1, 1 << 24);
        ReadMillis(*system, "system", "grace_period_ms", config.System.GracePeriod, 0);
        ReadMillis(*system, "system", "scheduler_granularity_ms", config.System.SchedulerGranularity, 1);
        ReadInteger(*system, "system", "blocking_threads", config.System.BlockingThreads, 1, 256);
        ReadMillis(*system, "system", "heartbeat_ms", config.System.Heartbeat, 0);
        std::string poller = config.System.Poller == EPollerKind::Poll ? "poll" : "epoll";
        ReadString(*system, "system", "poller", poller);
        if (poller == "epoll") {
            config.System.Poller = EPollerKind::Epoll;
        } else if (poller == "poll") {
            config.System.Poller = EPollerKind::Poll;
        } else {
            Fail("system.poller must be \"epoll\" or \"poll\"");
        }
    }

    if (auto* server = Section(json, "server")) {
        ReadString(*server, "server", "name", config.Server.Name);
        ReadString(*server, "server", "host", config.Server.Host);
        ReadInteger(*server, "server", "port", config.Server.Port, 0, 65535);
        ReadString(*server, "server", "principal_header", config.Server.PrincipalHeader);
        if (auto* tls = Section(*server, "tls")) {
            TTlsConfig files;
            ReadString(*tls, "server.tls", "cert", files.Cert);
            ReadString(*tls, "server.tls", "key", files.Key);
            if (files.Cert.empty() != files.Key.empty()) {
                Fail("server.tls needs both 'cert' and 'key'");
            }
            if (!files.Cert.empty()) {
                config.Server.Tls = std::move(files);
            }
        }
    }

    if (auto* store = Section(json, "store")) {
        ReadString(*store, "store", "path", config.Store.Path);
        ReadMillis(*store, "store", "debounce_ms", config.Store.Debounce, 0);
    }

    if (auto* services = Section(json, "services")) {
        for (const auto& [name, options] : services->items()) {
            config.Services[name] = options;
        }
    }

    if (auto it = json.find("log_level"); it != json.end()) {
        if (!it->is_string()) {
            Fail("log_level must be a string");
        }
        config.LogLevel = ToLogLevel(it->get<std::string>(), "log_level");
    }

    Validate(config);
    return config;
}

TConfig TConfig::Parse(const std::string& text) {
    auto json = nlohmann::json::parse(text, nullptr, false, true);
    if (json.is_discarded()) {
        Fail("configuration is not valid JSON");
    }
    return FromJson(json);
}

TConfig TConfig::Load(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        Fail("cannot open configuration file " + path);
    }
    std::stringstream text;
    text << in.rdbuf();
    try {
        return Parse(text.str());
    } catch (const TOdinError& ex) {
        Fail(path + ": " + ex.Error().Message);
    }
}

void TConfig::ApplyEnvironment() {
    if (auto* host = std::getenv("ODIN_HOST")) {
        Server.Host = host;
    }
    if (auto* port = std::getenv("ODIN_PORT")) {
        Server.Port = static_cast<int>(ToInteger("ODIN_PORT", port));
    }
    if (auto* name = std::getenv("ODIN_NAME")) {
        Server.Name = name;
    }
    if (auto* capacity = std::getenv("ODIN_MAILBOX_CAPACITY")) {
        auto value = ToInteger("ODIN_MAILBOX_CAPACITY", capacity);
        if (value <= 0) {
            Fail("ODIN_MAILBOX_CAPACITY must be positive");
        }
        System.MailboxCapacity = static_cast<size_t>(value);
    }
    if (auto* grace = std::getenv("ODIN_GRACE_MS")) {
        auto value = ToInteger("ODIN_GRACE_MS", grace);
        if (value < 0) {
            Fail("ODIN_GRACE_MS must not be negative");
        }
        System.GracePeriod = std::chrono::milliseconds(value);
    }
    if (auto* path = std::getenv("ODIN_STORE_PATH")) {
        Store.Path = path;
    }
    if (auto* level = std::getenv("ODIN_LOG")) {
        LogLevel = ToLogLevel(level, "ODIN_LOG");
    }
    Validate(*this);
}

const nlohmann::json& TConfig::ServiceOptions(const std::string& service) const {
    static const nlohmann::json empty = nlohmann::json::object();
    auto it = Services.find(service);
    return it == Services.end() ? empty : it->second;
}

} // namespace NOdin
