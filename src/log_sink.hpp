#pragma once

#include <iostream>
#include <memory>
#include <mutex>
#include <string>

namespace gceclient {

enum class LogLevel {
    kDebug = 0,
    kInfo = 1,
    kWarning = 2,
    kError = 3
};

const char* logLevelName(LogLevel level);

/**
 * ILogSink - Destination for leveled log events
 *
 * Supplied by the caller when constructing a client; there is no global logger.
 * Implementations must be safe to call from several threads at once, since
 * snapshot fan-out logs from one thread per disk.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void log(LogLevel level, const std::string& message) = 0;

    void debug(const std::string& message) { log(LogLevel::kDebug, message); }
    void info(const std::string& message) { log(LogLevel::kInfo, message); }
    void warning(const std::string& message) { log(LogLevel::kWarning, message); }
    void error(const std::string& message) { log(LogLevel::kError, message); }
};

/**
 * StreamLogSink - Writes "[LEVEL] message" lines to a stream
 *
 * Events below min_level are dropped.
 */
class StreamLogSink : public ILogSink {
public:
    explicit StreamLogSink(LogLevel min_level = LogLevel::kInfo,
                           std::ostream& out = std::cerr);

    void log(LogLevel level, const std::string& message) override;

    LogLevel minLevel() const { return min_level_; }

private:
    LogLevel min_level_;
    std::ostream& out_;
    std::mutex mu_;
};

// Discards everything
class NullLogSink : public ILogSink {
public:
    void log(LogLevel, const std::string&) override {}
};

std::shared_ptr<ILogSink> makeDefaultLogSink();

} // namespace gceclient
