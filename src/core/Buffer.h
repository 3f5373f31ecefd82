#pragma once

#include "core/Logger.h"

#include <juce_audio_basics/juce_audio_basics.h>

#include <memory>
#include <string>

namespace spindeck {

/// Decoded audio for one section asset. Immutable once created; shared between
/// the cache, the control timeline and the audio thread via shared_ptr<const Buffer>.
class Buffer {
public:
    /// Zeroed buffer for programmatic use. Returns nullptr for invalid parameters.
    static std::unique_ptr<Buffer> createEmpty(
        int numChannels, int lengthInSamples, double sampleRate,
        const std::string& name = "");

    /// Takes ownership of decoded data. Returns nullptr for invalid parameters.
    static std::unique_ptr<Buffer> createFromData(
        juce::AudioBuffer<float>&& data, double sampleRate,
        const std::string& name, const std::string& filePath = "");

    /// Sample-reversed copy of `source` (last sample first).
    static std::unique_ptr<Buffer> createReversed(const Buffer& source);

    ~Buffer();

    Buffer(const Buffer&) = delete;
    Buffer& operator=(const Buffer&) = delete;

    // --- Audio data access (RT-safe) ---

    /// Returns read pointer for channel, or nullptr if channel is out of range.
    const float* getReadPointer(int channel) const;

    /// Write access is for construction and tests; never touch a buffer
    /// once it has been handed to a deck.
    float* getWritePointer(int channel);

    // --- Metadata ---

    int getNumChannels() const;
    int getLengthInSamples() const;
    double getSampleRate() const;
    double getLengthInSeconds() const;
    const std::string& getName() const;
    const std::string& getFilePath() const;

private:
    Buffer();

    juce::AudioBuffer<float> data_;
    double sampleRate_ = 0.0;
    std::string name_;
    std::string filePath_;
};

} // namespace spindeck
