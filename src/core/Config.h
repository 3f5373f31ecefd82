#pragma once

#include "core/Logger.h"

#include <juce_core/juce_core.h>

#include <string>

namespace spindeck {

/// Command-line configuration of the spindeck application.
struct Config {
    std::string deviceName = "DDJ-SP1";
    std::string musicRoot = "./music";
    std::string catalogPath;            // empty: <musicRoot>/catalog.json
    LogLevel logLevel = LogLevel::warn;
    double sampleRate = 48000.0;
    int blockSize = 512;
    bool listDevices = false;
    bool showHelp = false;

    std::string getCatalogPath() const;

    /// Fills `config` from `args`. Unknown options and malformed values
    /// return false with a message in `error`.
    static bool parse(const juce::ArgumentList& args, Config& config, std::string& error);

    static std::string usage();
};

} // namespace spindeck
