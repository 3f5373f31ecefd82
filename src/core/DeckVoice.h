#pragma once

#include "core/Buffer.h"

#include <cstdint>

namespace spindeck {

/// Audio-thread renderer for one deck: plays a region of a buffer once or in
/// a loop, with a linear gain ramp (fades) and an exponential rate ramp
/// (spindown). Not thread-safe; owned and driven by the audio thread only.
class DeckVoice {
public:
    DeckVoice();
    ~DeckVoice();

    DeckVoice(const DeckVoice&) = delete;
    DeckVoice& operator=(const DeckVoice&) = delete;

    void prepare(double engineSampleRate);

    /// Starts playing `buffer` from `startSample` up to `endSample` (buffer
    /// sample units). With `looping`, the region wraps back to `startSample`
    /// forever. Gain and rate return to unity.
    void start(const Buffer* buffer, double startSample, double endSample,
               bool looping, uint32_t generation);
    void stop();

    void rampGain(float target, int numSamples);
    void rampRate(double target, int numSamples);

    /// Adds `numSamples` into destL/destR scaled by `deckGain`.
    /// Returns true when a one-shot region reached its end during this call.
    bool render(float* destL, float* destR, int numSamples, float deckGain);

    bool isActive() const { return active_; }
    uint32_t getGeneration() const { return generation_; }
    double getPosition() const { return position_; }
    double getRate() const { return rate_; }
    float getFadeGain() const { return fadeGain_; }

private:
    float interpolate(const float* data, int length, double pos) const;

    const Buffer* buffer_ = nullptr;
    double engineSampleRate_ = 48000.0;
    bool active_ = false;
    uint32_t generation_ = 0;

    double position_ = 0.0;
    double regionStart_ = 0.0;
    double regionEnd_ = 0.0;
    bool looping_ = false;

    float fadeGain_ = 1.0f;
    float gainStep_ = 0.0f;
    float gainTarget_ = 1.0f;
    int gainRampRemaining_ = 0;

    double rate_ = 1.0;
    double rateFactor_ = 1.0;
    double rateTarget_ = 1.0;
    int rateRampRemaining_ = 0;
};

} // namespace spindeck
