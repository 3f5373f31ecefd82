#include <catch2/catch_test_macros.hpp>

#include "core/Logger.h"

#include <string>
#include <vector>

using namespace spindeck;

// --- Callback test helpers ---

struct CapturedLog {
    int level;
    std::string message;
};

static std::vector<CapturedLog> g_captured;

static void captureCallback(int level, const char* message, void* /*userData*/)
{
    g_captured.push_back({level, message});
}

static void resetLogger()
{
    Logger::setCallback(nullptr, nullptr);
    Logger::setLevel(LogLevel::warn);
    Logger::drain(); // flush leftover RT entries from other tests
    g_captured.clear();
}

static void captureAt(LogLevel level)
{
    resetLogger();
    Logger::setLevel(level);
    Logger::setCallback(captureCallback, nullptr);
}

// ═══════════════════════════════════════════════════════════════════
// Levels
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("Logger default level is warn")
{
    resetLogger();
    REQUIRE(Logger::getLevel() == LogLevel::warn);
}

TEST_CASE("Logger parseLevel accepts every level name")
{
    LogLevel level = LogLevel::warn;

    REQUIRE(Logger::parseLevel("off", level));
    REQUIRE(level == LogLevel::off);
    REQUIRE(Logger::parseLevel("error", level));
    REQUIRE(level == LogLevel::error);
    REQUIRE(Logger::parseLevel("info", level));
    REQUIRE(level == LogLevel::info);
    REQUIRE(Logger::parseLevel("debug", level));
    REQUIRE(level == LogLevel::debug);
    REQUIRE(Logger::parseLevel("trace", level));
    REQUIRE(level == LogLevel::trace);
    REQUIRE(Logger::parseLevel("warn", level));
    REQUIRE(level == LogLevel::warn);
}

TEST_CASE("Logger parseLevel rejects unknown names and keeps the level")
{
    LogLevel level = LogLevel::debug;
    REQUIRE_FALSE(Logger::parseLevel("verbose", level));
    REQUIRE_FALSE(Logger::parseLevel("", level));
    REQUIRE(level == LogLevel::debug);
}

// ═══════════════════════════════════════════════════════════════════
// Control-timeline macros
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("SD_ERROR fires at error level while SD_WARN does not")
{
    captureAt(LogLevel::error);

    SD_ERROR("device gone %d", 7);
    SD_WARN("quiet");

    REQUIRE(g_captured.size() == 1);
    REQUIRE(g_captured[0].message.find("[error]") != std::string::npos);
    REQUIRE(g_captured[0].message.find("device gone 7") != std::string::npos);
    REQUIRE(g_captured[0].level == static_cast<int>(LogLevel::error));

    resetLogger();
}

TEST_CASE("SD_WARN fires at warn level")
{
    captureAt(LogLevel::warn);

    SD_WARN("warn msg %d", 42);
    REQUIRE(g_captured.size() == 1);
    REQUIRE(g_captured[0].message.find("[warn]") != std::string::npos);
    REQUIRE(g_captured[0].message.find("warn msg 42") != std::string::npos);

    resetLogger();
}

TEST_CASE("Nothing fires when level is off")
{
    captureAt(LogLevel::off);

    SD_ERROR("no");
    SD_WARN("no");
    SD_WARN_RT("no");
    Logger::drain();
    REQUIRE(g_captured.empty());

    resetLogger();
}

TEST_CASE("SD_INFO is suppressed at warn level and fires at info level")
{
    captureAt(LogLevel::warn);
    SD_INFO("hidden");
    REQUIRE(g_captured.empty());

    Logger::setLevel(LogLevel::info);
    SD_INFO("deck %d plays", 2);
    REQUIRE(g_captured.size() == 1);
    REQUIRE(g_captured[0].message.find("[info]") != std::string::npos);
    REQUIRE(g_captured[0].message.find("deck 2 plays") != std::string::npos);

    resetLogger();
}

TEST_CASE("SD_DEBUG and SD_TRACE follow the level ladder")
{
    captureAt(LogLevel::debug);

    SD_DEBUG("dbg");
    SD_TRACE("trc");
    REQUIRE(g_captured.size() == 1);
    REQUIRE(g_captured[0].message.find("[debug]") != std::string::npos);

    Logger::setLevel(LogLevel::trace);
    SD_TRACE("trc");
    REQUIRE(g_captured.size() == 2);
    REQUIRE(g_captured[1].message.find("[trace]") != std::string::npos);

    resetLogger();
}

// ═══════════════════════════════════════════════════════════════════
// Audio-thread macros
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("SD_WARN_RT is queued until drain")
{
    captureAt(LogLevel::warn);

    SD_WARN_RT("queue full on deck %d", 3);
    REQUIRE(g_captured.empty());

    Logger::drain();
    REQUIRE(g_captured.size() == 1);
    REQUIRE(g_captured[0].message.find("[RT]") != std::string::npos);
    REQUIRE(g_captured[0].message.find("queue full on deck 3") != std::string::npos);
    REQUIRE(g_captured[0].level == static_cast<int>(LogLevel::warn));

    resetLogger();
}

TEST_CASE("SD_DEBUG_RT is suppressed at warn level")
{
    captureAt(LogLevel::warn);

    SD_DEBUG_RT("hidden");
    Logger::drain();
    REQUIRE(g_captured.empty());

    resetLogger();
}

TEST_CASE("SD_TRACE_RT fires at trace level and drains")
{
    captureAt(LogLevel::trace);

    SD_TRACE_RT("block %d", 9);
    Logger::drain();
    REQUIRE(g_captured.size() == 1);
    REQUIRE(g_captured[0].message.find("[trace]") != std::string::npos);

    resetLogger();
}

// ═══════════════════════════════════════════════════════════════════
// Format
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("CT log message carries timestamp, CT tag, file and user text")
{
    captureAt(LogLevel::warn);

    SD_WARN("hello %s", "surface");
    REQUIRE(g_captured.size() == 1);
    const auto& msg = g_captured[0].message;
    REQUIRE(msg[0] == '[');
    REQUIRE(msg.find("[CT]") != std::string::npos);
    REQUIRE(msg.find("LoggerTests.cpp:") != std::string::npos);
    REQUIRE(msg.find("hello surface") != std::string::npos);
    // basename only
    REQUIRE(msg.find("tests/core/") == std::string::npos);

    resetLogger();
}

TEST_CASE("Long messages are truncated safely")
{
    captureAt(LogLevel::warn);

    std::string longText(2000, 'x');
    SD_WARN("%s", longText.c_str());
    SD_WARN_RT("%s", longText.c_str());
    Logger::drain();

    REQUIRE(g_captured.size() == 2);
    REQUIRE(g_captured[0].message.size() < 512);
    REQUIRE(g_captured[1].message.size() < 512);

    resetLogger();
}

TEST_CASE("RT queue overflow drops entries instead of blocking")
{
    captureAt(LogLevel::warn);

    for (int i = 0; i < 3000; ++i)
        SD_WARN_RT("entry %d", i);
    Logger::drain();

    REQUIRE(g_captured.size() == 1024);
    REQUIRE(g_captured.front().message.find("entry 0") != std::string::npos);

    resetLogger();
}

TEST_CASE("Multiple RT logs drain in order")
{
    captureAt(LogLevel::warn);

    SD_WARN_RT("first");
    SD_WARN_RT("second");
    SD_WARN_RT("third");
    Logger::drain();

    REQUIRE(g_captured.size() == 3);
    REQUIRE(g_captured[0].message.find("first") != std::string::npos);
    REQUIRE(g_captured[1].message.find("second") != std::string::npos);
    REQUIRE(g_captured[2].message.find("third") != std::string::npos);

    resetLogger();
}

TEST_CASE("Drain on empty queue is safe")
{
    captureAt(LogLevel::warn);
    Logger::drain();
    Logger::drain();
    REQUIRE(g_captured.empty());
    resetLogger();
}
