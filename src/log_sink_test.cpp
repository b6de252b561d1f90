#include "log_sink.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using gceclient::LogLevel;
using gceclient::StreamLogSink;

TEST(LogSinkTest, LevelNames) {
    EXPECT_STREQ(gceclient::logLevelName(LogLevel::kDebug), "DEBUG");
    EXPECT_STREQ(gceclient::logLevelName(LogLevel::kInfo), "INFO");
    EXPECT_STREQ(gceclient::logLevelName(LogLevel::kWarning), "WARN");
    EXPECT_STREQ(gceclient::logLevelName(LogLevel::kError), "ERROR");
}

TEST(LogSinkTest, StreamSink_WritesPrefixedLines) {
    std::ostringstream out;
    StreamLogSink sink(LogLevel::kDebug, out);

    sink.debug("polling");
    sink.error("failed");

    EXPECT_EQ(out.str(), "[DEBUG] polling\n[ERROR] failed\n");
}

TEST(LogSinkTest, StreamSink_DropsBelowMinimumLevel) {
    std::ostringstream out;
    StreamLogSink sink(LogLevel::kWarning, out);

    sink.debug("hidden");
    sink.info("hidden");
    sink.warning("shown");

    EXPECT_EQ(out.str(), "[WARN] shown\n");
    EXPECT_EQ(sink.minLevel(), LogLevel::kWarning);
}

// Lines from concurrent writers are never interleaved
TEST(LogSinkTest, StreamSink_ConcurrentWriters) {
    std::ostringstream out;
    StreamLogSink sink(LogLevel::kInfo, out);

    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&sink] {
            for (int i = 0; i < 50; ++i) {
                sink.info("disk snapshot done");
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }

    std::istringstream lines(out.str());
    std::string line;
    int count = 0;
    while (std::getline(lines, line)) {
        EXPECT_EQ(line, "[INFO] disk snapshot done");
        ++count;
    }
    EXPECT_EQ(count, 200);
}

TEST(LogSinkTest, DefaultSinkIsWarningStream) {
    auto sink = gceclient::makeDefaultLogSink();
    auto* stream_sink = dynamic_cast<StreamLogSink*>(sink.get());

    ASSERT_NE(stream_sink, nullptr);
    EXPECT_EQ(stream_sink->minLevel(), LogLevel::kWarning);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
