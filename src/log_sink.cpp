#include "log_sink.hpp"

namespace gceclient {

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug:
            return "DEBUG";
        case LogLevel::kInfo:
            return "INFO";
        case LogLevel::kWarning:
            return "WARN";
        case LogLevel::kError:
            return "ERROR";
    }
    return "UNKNOWN";
}

StreamLogSink::StreamLogSink(LogLevel min_level, std::ostream& out)
    : min_level_(min_level), out_(out) {}

void StreamLogSink::log(LogLevel level, const std::string& message) {
    if (static_cast<int>(level) < static_cast<int>(min_level_)) {
        return;
    }
    std::lock_guard<std::mutex> lock(mu_);
    out_ << "[" << logLevelName(level) << "] " << message << std::endl;
}

std::shared_ptr<ILogSink> makeDefaultLogSink() {
    return std::make_shared<StreamLogSink>(LogLevel::kWarning);
}

} // namespace gceclient
