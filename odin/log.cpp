#include "log.hpp"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>

namespace NOdin {

namespace {

std::string FormatTime(std::chrono::system_clock::time_point now) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    time_t seconds = ms / 1000;
    tm utc;
    gmtime_r(&seconds, &utc);
    char buf[64];
    auto len = strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &utc);
    snprintf(buf + len, sizeof(buf) - len, ".%03dZ", static_cast<int>(ms % 1000));
    return buf;
}

void StderrSink(ELogLevel level, const std::string& message) {
    auto line = "[" + FormatTime(std::chrono::system_clock::now()) + "] " + ToString(level) + " " + message + "\n";
    fwrite(line.data(), 1, line.size(), stderr);
}

} // namespace

const char* ToString(ELogLevel level) {
    switch (level) {
    case ELogLevel::Trace: return "TRACE";
    case ELogLevel::Debug: return "DEBUG";
    case ELogLevel::Info: return "INFO";
    case ELogLevel::Warn: return "WARN";
    case ELogLevel::Error: return "ERROR";
    case ELogLevel::Off: return "OFF";
    }
    return "?";
}

std::optional<ELogLevel> ParseLogLevel(std::string_view name) {
    std::string lower;
    for (char ch : name) {
        lower += static_cast<char>(tolower(static_cast<unsigned char>(ch)));
    }
    if (lower == "trace") return ELogLevel::Trace;
    if (lower == "debug") return ELogLevel::Debug;
    if (lower == "info") return ELogLevel::Info;
    if (lower == "warn" || lower == "warning") return ELogLevel::Warn;
    if (lower == "error") return ELogLevel::Error;
    if (lower == "off" || lower == "none") return ELogLevel::Off;
    return std::nullopt;
}

TLogger::TLogger()
    : Sink_(StderrSink)
{ }

TLogger& TLogger::Instance() {
    static TLogger logger;
    return logger;
}

void TLogger::SetSink(TSink sink) {
    std::lock_guard guard(Mutex_);
    Sink_ = std::move(sink);
}

void TLogger::ResetSink() {
    std::lock_guard guard(Mutex_);
    Sink_ = StderrSink;
}

void TLogger::Write(ELogLevel level, const std::string& message) {
    std::lock_guard guard(Mutex_);
    if (Sink_) {
        Sink_(level, message);
    }
}

} // namespace NOdin
