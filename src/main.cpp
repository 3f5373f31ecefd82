#include "core/AudioDevice.h"
#include "core/BufferCache.h"
#include "core/Config.h"
#include "core/ControlStateResolver.h"
#include "core/ControlSurface.h"
#include "core/DeckEngine.h"
#include "core/Logger.h"
#include "core/PerformanceRouter.h"
#include "core/TrackCatalog.h"

#include <juce_core/juce_core.h>
#include <juce_audio_devices/juce_audio_devices.h>

#include <atomic>
#include <csignal>
#include <cstdio>

namespace {

constexpr int kControlWaitMs = 5;
constexpr juce::uint32 kSurfaceCheckMs = 1000;

std::atomic<bool> quitRequested{false};

void requestQuit(int)
{
    quitRequested.store(true);
}

bool deviceListed(const std::string& name)
{
    for (const auto& available : spindeck::ControlSurface::getAvailableDevices())
        if (available == name)
            return true;
    return false;
}

// Closes the surface when it is unplugged and reopens it when it returns.
// A reconnected surface starts from power-on state.
void superviseSurface(spindeck::ControlSurface& surface, spindeck::PerformanceRouter& router,
                      const std::string& nameMatch)
{
    if (surface.isOpen())
    {
        if (!deviceListed(surface.getDeviceName()))
        {
            SD_WARN("main: control surface %s disconnected", surface.getDeviceName().c_str());
            surface.close();
        }
        return;
    }

    bool present = false;
    for (const auto& available : spindeck::ControlSurface::getAvailableDevices())
        present = present || juce::String(available).containsIgnoreCase(juce::String(nameMatch));
    if (!present)
        return;

    std::string error;
    if (!surface.open(nameMatch, error))
    {
        SD_WARN("main: control surface reconnect failed: %s", error.c_str());
        return;
    }
    SD_INFO("main: control surface %s reconnected", surface.getDeviceName().c_str());
    router.resetSurface();
}

} // namespace

int main(int argc, char* argv[])
{
    juce::ScopedJuceInitialiser_GUI init;
    using namespace spindeck;

    Config config;
    std::string error;
    if (!Config::parse(juce::ArgumentList(argc, argv), config, error))
    {
        std::fprintf(stderr, "spindeck: %s\n\n%s", error.c_str(), Config::usage().c_str());
        return 2;
    }
    if (config.showHelp)
    {
        std::printf("%s", Config::usage().c_str());
        return 0;
    }

    Logger::setLevel(config.logLevel);

    if (config.listDevices)
    {
        for (const auto& name : ControlSurface::getAvailableDevices())
            std::printf("%s\n", name.c_str());
        return 0;
    }

    TrackCatalog catalog;
    if (!catalog.loadFromFile(config.getCatalogPath(), error))
        SD_WARN("main: %s; starting with an empty catalog", error.c_str());

    ControlMailbox mailbox;
    ControlSurface surface(mailbox);
    if (!surface.open(config.deviceName, error))
    {
        SD_ERROR("main: %s", error.c_str());
        std::fprintf(stderr, "spindeck: %s. Make sure the device is connected via USB.\n", error.c_str());
        return 1;
    }

    BufferCache cache;
    DeckEngine engine(cache, config.sampleRate, config.blockSize, config.musicRoot);
    AudioDevice audio(engine);
    if (!audio.start(error))
    {
        SD_ERROR("main: audio output: %s", error.c_str());
        std::fprintf(stderr, "spindeck: audio output: %s\n", error.c_str());
        return 1;
    }

    JsonLineEventSink eventSink(stdout);
    ControlStateResolver resolver;
    PerformanceRouter router(resolver, engine, catalog, eventSink, surface);
    router.syncIndicators();
    router.clientConnected();

    std::signal(SIGINT, requestQuit);
    std::signal(SIGTERM, requestQuit);
    SD_INFO("main: running on %s with %d tracks", surface.getDeviceName().c_str(), catalog.getNumTracks());

    auto nextSurfaceCheck = juce::Time::getMillisecondCounter() + kSurfaceCheckMs;
    while (!quitRequested.load())
    {
        mailbox.waitForMessages(kControlWaitMs);
        router.processPending(mailbox);
        engine.poll();

        auto nowMs = juce::Time::getMillisecondCounter();
        if (nowMs >= nextSurfaceCheck)
        {
            nextSurfaceCheck = nowMs + kSurfaceCheckMs;
            superviseSurface(surface, router, config.deviceName);
        }
    }

    SD_INFO("main: shutting down");
    engine.stopAll();
    audio.stop();
    surface.close();
    if (mailbox.getDroppedCount() > 0)
        SD_WARN("main: %d control messages dropped", mailbox.getDroppedCount());
    Logger::drain();
    return 0;
}
