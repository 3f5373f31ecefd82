#pragma once

#include "core/DeckEngine.h"

#include <juce_audio_devices/juce_audio_devices.h>

#include <atomic>
#include <string>

namespace spindeck {

/// Owns the juce::AudioDeviceManager and feeds its output callback from
/// DeckEngine::processBlock(). The engine clock counts rendered samples, so
/// the device must run at the engine's sample rate.
class AudioDevice : public juce::AudioIODeviceCallback {
public:
    explicit AudioDevice(DeckEngine& engine);
    ~AudioDevice() override;

    AudioDevice(const AudioDevice&) = delete;
    AudioDevice& operator=(const AudioDevice&) = delete;

    // --- Control thread ---
    bool start(std::string& error);
    void stop();
    bool isRunning() const;
    double getSampleRate() const;
    int getBlockSize() const;

    // --- JUCE AudioIODeviceCallback (audio thread) ---
    void audioDeviceIOCallbackWithContext(
        const float* const* inputChannelData, int numInputChannels,
        float* const* outputChannelData, int numOutputChannels,
        int numSamples,
        const juce::AudioIODeviceCallbackContext& context) override;

    void audioDeviceAboutToStart(juce::AudioIODevice* device) override;
    void audioDeviceStopped() override;

private:
    DeckEngine& engine_;
    juce::AudioDeviceManager deviceManager_;
    std::atomic<bool> running_{false};
    double sampleRate_ = 0.0;
    int blockSize_ = 0;
};

} // namespace spindeck
