#include <catch2/catch_test_macros.hpp>

#include "core/Config.h"

using namespace spindeck;

static bool parseArgs(std::initializer_list<const char*> args, Config& config, std::string& error)
{
    juce::StringArray list;
    for (auto* a : args)
        list.add(a);
    return Config::parse(juce::ArgumentList("spindeck", list), config, error);
}

TEST_CASE("Config defaults")
{
    Config config;
    CHECK(config.deviceName == "DDJ-SP1");
    CHECK(config.musicRoot == "./music");
    CHECK(config.getCatalogPath() == "./music/catalog.json");
    CHECK(config.logLevel == LogLevel::warn);
    CHECK(config.sampleRate == 48000.0);
    CHECK(config.blockSize == 512);
    CHECK_FALSE(config.listDevices);
    CHECK_FALSE(config.showHelp);
}

TEST_CASE("Config parses separate and inline option values")
{
    Config config;
    std::string error;
    REQUIRE(parseArgs({"--device", "SP1", "--music=/srv/music/", "--log", "debug",
                       "--sample-rate=44100", "--block", "256"}, config, error));
    CHECK(config.deviceName == "SP1");
    CHECK(config.musicRoot == "/srv/music/");
    CHECK(config.getCatalogPath() == "/srv/music/catalog.json");
    CHECK(config.logLevel == LogLevel::debug);
    CHECK(config.sampleRate == 44100.0);
    CHECK(config.blockSize == 256);
}

TEST_CASE("Config explicit catalog overrides the music root default")
{
    Config config;
    std::string error;
    REQUIRE(parseArgs({"--catalog", "tracks.json"}, config, error));
    CHECK(config.getCatalogPath() == "tracks.json");
}

TEST_CASE("Config flags")
{
    Config config;
    std::string error;
    REQUIRE(parseArgs({"--list-devices", "-h"}, config, error));
    CHECK(config.listDevices);
    CHECK(config.showHelp);
}

TEST_CASE("Config rejects unknown options and missing values")
{
    Config config;
    std::string error;
    CHECK_FALSE(parseArgs({"--turbo"}, config, error));
    CHECK(error == "Unknown option: --turbo");

    CHECK_FALSE(parseArgs({"--device"}, config, error));
    CHECK(error == "Missing value for --device");

    CHECK_FALSE(parseArgs({"--music", "--log", "info"}, config, error));
    CHECK(error == "Missing value for --music");
}

TEST_CASE("Config validates numeric ranges and log levels")
{
    Config config;
    std::string error;
    CHECK_FALSE(parseArgs({"--sample-rate", "1000"}, config, error));
    CHECK_FALSE(parseArgs({"--sample-rate", "fast"}, config, error));
    CHECK_FALSE(parseArgs({"--block", "8"}, config, error));
    CHECK_FALSE(parseArgs({"--block", "12.5"}, config, error));
    CHECK_FALSE(parseArgs({"--log", "loud"}, config, error));
    CHECK(error == "Unknown log level: loud");
    CHECK_FALSE(parseArgs({"--device="}, config, error));

    CHECK(config.sampleRate == 48000.0);
    CHECK(config.blockSize == 512);
}

TEST_CASE("Config usage mentions every option")
{
    auto text = Config::usage();
    for (const char* opt : {"--device", "--music", "--catalog", "--log", "--sample-rate",
                            "--block", "--list-devices", "--help"})
        CHECK(text.find(opt) != std::string::npos);
}
