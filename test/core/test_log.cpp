#include <catch2/catch_test_macros.hpp>

#include <mcp_gateway/core/log.hpp>

#include <algorithm>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace mcp_gateway;

// ===========================================================================
// Helper: a sink that captures messages into a vector.
// ===========================================================================

struct CapturedMessage {
    LogLevel level;
    std::string component;
    std::string message;
};

class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::vector<CapturedMessage>& out) : out_(out) {}

    void Write(LogLevel level, std::string_view component,
               std::string_view message) override {
        out_.push_back({level, std::string(component), std::string(message)});
    }

private:
    std::vector<CapturedMessage>& out_;
};

// ===========================================================================
// Sinks
// ===========================================================================

TEST_CASE("ConsoleSink: writes level, component and message", "[log]") {
    std::ostringstream oss;
    ConsoleSink sink(oss);
    sink.Write(LogLevel::Warn, "store", "slow reply");

    auto line = oss.str();
    CHECK(line.find("[WARN] [store] slow reply") != std::string::npos);
    CHECK(line.back() == '\n');
}

TEST_CASE("JsonSink: writes valid JSON lines", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Info, "gateway", "started");
    sink.Write(LogLevel::Debug, "gateway", "with \"quotes\"");

    auto output = oss.str();
    CHECK(std::count(output.begin(), output.end(), '\n') == 2);
    CHECK(output.find("\"level\":\"INFO\"") != std::string::npos);
    CHECK(output.find("\"component\":\"gateway\"") != std::string::npos);
    CHECK(output.find(R"(with \"quotes\")") != std::string::npos);
}

// ===========================================================================
// ParseLogLevel
// ===========================================================================

TEST_CASE("ParseLogLevel: accepts known names case-insensitively", "[log]") {
    CHECK(ParseLogLevel("debug") == LogLevel::Debug);
    CHECK(ParseLogLevel("INFO") == LogLevel::Info);
    CHECK(ParseLogLevel("Warning") == LogLevel::Warn);
    CHECK(ParseLogLevel("error") == LogLevel::Error);
    CHECK_FALSE(ParseLogLevel("verbose").has_value());
}

// ===========================================================================
// Logger
// ===========================================================================

TEST_CASE("Logger: filters below the minimum level", "[log]") {
    std::vector<CapturedMessage> captured;
    Logger logger(std::make_unique<CaptureSink>(captured), LogLevel::Warn);

    logger.Debug("c", "dropped");
    logger.Info("c", "dropped");
    logger.Warn("c", "kept");
    logger.Error("c", "kept too");

    REQUIRE(captured.size() == 2);
    CHECK(captured[0].level == LogLevel::Warn);
    CHECK(captured[1].message == "kept too");
}

TEST_CASE("Logger: SetLevel lowers the threshold", "[log]") {
    std::vector<CapturedMessage> captured;
    Logger logger(std::make_unique<CaptureSink>(captured), LogLevel::Error);
    logger.Info("c", "dropped");
    logger.SetLevel(LogLevel::Debug);
    logger.Debug("c", "kept");
    REQUIRE(captured.size() == 1);
    CHECK(captured[0].message == "kept");
}

TEST_CASE("Logger: concurrent writers do not lose lines", "[log]") {
    std::vector<CapturedMessage> captured;
    Logger logger(std::make_unique<CaptureSink>(captured), LogLevel::Debug);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&logger] {
            for (int i = 0; i < 100; ++i) {
                logger.Info("worker", "line");
            }
        });
    }
    for (auto& th : threads) th.join();
    CHECK(captured.size() == 400);
}

// ===========================================================================
// DiagnosticTapSink
// ===========================================================================

TEST_CASE("DiagnosticTapSink: forwards everything, taps session lines", "[log][tap]") {
    std::vector<CapturedMessage> captured;
    std::vector<std::string> tapped;
    DiagnosticTapSink sink(std::make_unique<CaptureSink>(captured),
                           [&tapped](std::string_view line) {
                               tapped.emplace_back(line);
                           });

    sink.Write(LogLevel::Info, "gateway", "Processing tools/call request for session abc");
    sink.Write(LogLevel::Info, "store", "backend reachable");
    sink.Write(LogLevel::Debug, "http", "POST /messages/ 202");

    CHECK(captured.size() == 3);
    REQUIRE(tapped.size() == 2);
    CHECK(tapped[0].find("session abc") != std::string::npos);
    CHECK(tapped[1].find("/messages/") != std::string::npos);
}

TEST_CASE("DiagnosticTapSink: IsSessionRelated ignores case", "[log][tap]") {
    CHECK(DiagnosticTapSink::IsSessionRelated("Mcp-Session-Id: 42"));
    CHECK(DiagnosticTapSink::IsSessionRelated("SESSION created"));
    CHECK_FALSE(DiagnosticTapSink::IsSessionRelated("ping ok"));
}

TEST_CASE("ScopedTapSuppression: silences the tap on this thread only", "[log][tap]") {
    std::vector<CapturedMessage> captured;
    std::vector<std::string> tapped;
    DiagnosticTapSink sink(std::make_unique<CaptureSink>(captured),
                           [&tapped](std::string_view line) {
                               tapped.emplace_back(line);
                           });

    CHECK_FALSE(ScopedTapSuppression::Active());
    {
        ScopedTapSuppression quiet;
        CHECK(ScopedTapSuppression::Active());
        sink.Write(LogLevel::Info, "discovery", "tracked session s1");

        std::thread other([&sink] {
            sink.Write(LogLevel::Info, "other", "session from another thread");
        });
        other.join();
    }
    CHECK_FALSE(ScopedTapSuppression::Active());

    CHECK(captured.size() == 2);
    REQUIRE(tapped.size() == 1);
    CHECK(tapped[0] == "session from another thread");
}
