#include "core/AudioDevice.h"
#include "core/Logger.h"

#include <cmath>

namespace spindeck {

AudioDevice::AudioDevice(DeckEngine& engine)
    : engine_(engine)
{
    SD_INFO("AudioDevice: created");
}

AudioDevice::~AudioDevice()
{
    stop();
    SD_INFO("AudioDevice: destroyed");
}

// ═══════════════════════════════════════════════════════════════════
// Control thread
// ═══════════════════════════════════════════════════════════════════

bool AudioDevice::start(std::string& error)
{
    const double requestedRate = engine_.getSampleRate();
    const int requestedBlock = engine_.getBlockSize();
    SD_INFO("AudioDevice::start: requested sr=%.0f bs=%d", requestedRate, requestedBlock);

    if (running_.load())
    {
        SD_INFO("AudioDevice::start: already running, stopping first");
        stop();
    }

    juce::AudioDeviceManager::AudioDeviceSetup setup;
    setup.sampleRate = requestedRate;
    setup.bufferSize = requestedBlock;

    auto err = deviceManager_.initialise(0, 2, nullptr, true, {}, &setup);
    if (err.isNotEmpty())
    {
        error = err.toStdString();
        SD_WARN("AudioDevice::start: initialise failed: %s", error.c_str());
        return false;
    }

    auto* device = deviceManager_.getCurrentAudioDevice();
    if (!device)
    {
        error = "No audio output device available";
        SD_WARN("AudioDevice::start: %s", error.c_str());
        return false;
    }

    double actualRate = device->getCurrentSampleRate();
    if (std::abs(actualRate - requestedRate) > 0.5)
    {
        error = "Audio device runs at " + std::to_string(static_cast<int>(actualRate))
              + " Hz, engine expects " + std::to_string(static_cast<int>(requestedRate)) + " Hz";
        SD_WARN("AudioDevice::start: %s", error.c_str());
        deviceManager_.closeAudioDevice();
        return false;
    }

    deviceManager_.addAudioCallback(this);

    SD_INFO("AudioDevice::start: %s opened, actual sr=%.0f bs=%d",
            device->getName().toRawUTF8(), actualRate, device->getCurrentBufferSizeSamples());
    return true;
}

void AudioDevice::stop()
{
    if (!running_.load())
        return;

    SD_INFO("AudioDevice::stop");
    deviceManager_.removeAudioCallback(this);
    deviceManager_.closeAudioDevice();
    running_.store(false);
    sampleRate_ = 0.0;
    blockSize_ = 0;
}

bool AudioDevice::isRunning() const
{
    return running_.load();
}

double AudioDevice::getSampleRate() const
{
    return running_.load() ? sampleRate_ : 0.0;
}

int AudioDevice::getBlockSize() const
{
    return running_.load() ? blockSize_ : 0;
}

// ═══════════════════════════════════════════════════════════════════
// JUCE AudioIODeviceCallback
// ═══════════════════════════════════════════════════════════════════

void AudioDevice::audioDeviceIOCallbackWithContext(
    const float* const* /*inputChannelData*/, int /*numInputChannels*/,
    float* const* outputChannelData, int numOutputChannels,
    int numSamples,
    const juce::AudioIODeviceCallbackContext& /*context*/)
{
    engine_.processBlock(outputChannelData, numOutputChannels, numSamples);
}

void AudioDevice::audioDeviceAboutToStart(juce::AudioIODevice* device)
{
    double sr = device->getCurrentSampleRate();
    int bs = device->getCurrentBufferSizeSamples();

    SD_INFO("AudioDevice::audioDeviceAboutToStart: sr=%.0f bs=%d", sr, bs);

    if (bs > engine_.getBlockSize())
        SD_DEBUG("AudioDevice: device block %d exceeds configured block %d", bs, engine_.getBlockSize());

    sampleRate_ = sr;
    blockSize_ = bs;
    running_.store(true);
}

void AudioDevice::audioDeviceStopped()
{
    SD_INFO("AudioDevice::audioDeviceStopped");
    running_.store(false);
    sampleRate_ = 0.0;
    blockSize_ = 0;
}

} // namespace spindeck
