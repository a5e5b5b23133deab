#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace NOdin {

enum class ELogLevel {
    Trace = 0,
    Debug,
    Info,
    Warn,
    Error,
    Off,
};

const char* ToString(ELogLevel level);
std::optional<ELogLevel> ParseLogLevel(std::string_view name);

/**
 * @class TLogger
 * @brief Process-wide leveled logger with a replaceable sink.
 *
 * The default sink prints `[<utc time>] <LEVEL> <message>` to stderr.
 * Tests replace the sink to capture records.
 *
 * @code{.cpp}
 * TLogger::Instance().SetLevel(ELogLevel::Debug);
 * ODIN_INFO << "listening on " << address.ToString();
 * @endcode
 */
class TLogger {
public:
    using TSink = std::function<void(ELogLevel, const std::string&)>;

    static TLogger& Instance();

    void SetLevel(ELogLevel level) {
        Level_.store(level, std::memory_order_relaxed);
    }

    ELogLevel Level() const {
        return Level_.load(std::memory_order_relaxed);
    }

    bool Enabled(ELogLevel level) const {
        return level != ELogLevel::Off && level >= Level();
    }

    void SetSink(TSink sink);
    void ResetSink();
    void Write(ELogLevel level, const std::string& message);

private:
    TLogger();

    std::atomic<ELogLevel> Level_{ELogLevel::Info};
    std::mutex Mutex_;
    TSink Sink_;
};

/// One log line, written on destruction.
class TLogRecord {
public:
    explicit TLogRecord(ELogLevel level)
        : Level_(level)
    { }

    ~TLogRecord() {
        TLogger::Instance().Write(Level_, Stream_.str());
    }

    template<typename T>
    TLogRecord& operator<<(const T& value) {
        Stream_ << value;
        return *this;
    }

private:
    ELogLevel Level_;
    std::ostringstream Stream_;
};

} // namespace NOdin

#define ODIN_LOG(level) \
    if (!::NOdin::TLogger::Instance().Enabled(level)) { } else ::NOdin::TLogRecord(level)

#define ODIN_TRACE ODIN_LOG(::NOdin::ELogLevel::Trace)
#define ODIN_DEBUG ODIN_LOG(::NOdin::ELogLevel::Debug)
#define ODIN_INFO ODIN_LOG(::NOdin::ELogLevel::Info)
#define ODIN_WARN ODIN_LOG(::NOdin::ELogLevel::Warn)
#define ODIN_ERROR ODIN_LOG(::NOdin::ELogLevel::Error)
