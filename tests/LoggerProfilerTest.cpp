#include <catch2/catch_test_macros.hpp>
#include "server/Logger.hpp"
#include "server/Profiler.hpp"
#include <sstream>

using namespace inventory::server;

namespace {

// Redirects the logger for one test and restores it afterwards
class CapturedLog {
public:
    explicit CapturedLog(LogLevel level) : m_previousLevel(Logger::instance().level()) {
        Logger::instance().setOutputStream(&m_stream);
        Logger::instance().setLevel(level);
    }

    ~CapturedLog() {
        Logger::instance().setOutputStream(&std::cout);
        Logger::instance().setLevel(m_previousLevel);
    }

    std::string text() const { return m_stream.str(); }

private:
    std::ostringstream m_stream;
    LogLevel m_previousLevel;
};

} // anonymous namespace

// =============================================================================
// Logger
// =============================================================================

TEST_CASE("Messages below the level are dropped", "[Logger]") {
    CapturedLog log(LogLevel::WARN);

    LOG_INFO("quiet message");
    LOG_WARN("loud message");

    CHECK(log.text().find("quiet message") == std::string::npos);
    CHECK(log.text().find("[WARN ] loud message") != std::string::npos);
}

TEST_CASE("Channel traffic is logged at debug level", "[Logger]") {
    CapturedLog log(LogLevel::DEBUG);

    Logger::instance().logChannel("ch_42", "->", R"({"type":"pong"})");

    CHECK(log.text().find("[ch_42] -> {\"type\":\"pong\"}") != std::string::npos);
}

TEST_CASE("Channel logging can be switched off", "[Logger]") {
    CapturedLog log(LogLevel::DEBUG);

    Logger::instance().setLogChannels(false);
    Logger::instance().logChannel("ch_43", "<-", R"({"action":"ping"})");
    Logger::instance().setLogChannels(true);

    CHECK(log.text().find("ch_43") == std::string::npos);
}

TEST_CASE("Request and response lines share an id", "[Logger]") {
    CapturedLog log(LogLevel::INFO);

    uint64_t id = Logger::instance().logRequest("GET", "/health");
    Logger::instance().logResponse(id, 200, "{}", 2);

    std::string tag = "[REQ-" + std::to_string(id) + "]";
    auto first = log.text().find(tag);
    REQUIRE(first != std::string::npos);
    CHECK(log.text().find(tag, first + 1) != std::string::npos);
}

TEST_CASE("Level names", "[Logger]") {
    CHECK(Logger::parseLevel("debug") == LogLevel::DEBUG);
    CHECK(Logger::parseLevel("error") == LogLevel::ERROR);
    CHECK_THROWS_AS(Logger::parseLevel("loud"), std::invalid_argument);
    CHECK(Logger::levelToString(LogLevel::ERROR) == "ERROR");
}

TEST_CASE("Sizes are human readable", "[Logger]") {
    CHECK(Logger::formatSize(512) == "512 B");
    CHECK(Logger::formatSize(2048) == "2.0 KB");
    CHECK(Logger::formatSize(3 * 1024 * 1024) == "3.00 MB");
}

TEST_CASE("Unwritable log file throws", "[Logger]") {
    CHECK_THROWS_AS(Logger::instance().enableFileLogging("/nonexistent/dir/server.log"),
                    std::runtime_error);
}

// =============================================================================
// Profiler
// =============================================================================

TEST_CASE("Profiler aggregates samples per name", "[Profiler]") {
    auto& profiler = Profiler::instance();
    profiler.reset();
    profiler.setEnabled(true);

    profiler.record("op", 2.0);
    profiler.record("op", 4.0);

    auto stats = profiler.getStats("op");
    CHECK(stats.count == 2);
    CHECK(stats.totalMs == 6.0);
    CHECK(stats.minMs == 2.0);
    CHECK(stats.maxMs == 4.0);
    CHECK(stats.avgMs() == 3.0);

    CHECK(profiler.getStats("other").count == 0);
    CHECK(profiler.formatStats().find("op") != std::string::npos);

    profiler.reset();
}

TEST_CASE("ScopedTimer records once", "[Profiler]") {
    auto& profiler = Profiler::instance();
    profiler.reset();

    {
        ScopedTimer timer("scoped");
        double first = timer.stop();
        CHECK(first >= 0.0);
        CHECK(timer.stop() == first);
    }
    CHECK(profiler.getStats("scoped").count == 1);

    profiler.setEnabled(false);
    {
        PROFILE_SCOPE("disabled");
    }
    CHECK(profiler.getStats("disabled").count == 0);
    profiler.setEnabled(true);

    profiler.reset();
}
