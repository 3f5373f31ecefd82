#include "core/DeckVoice.h"

#include <algorithm>
#include <cmath>

namespace spindeck {

DeckVoice::DeckVoice() = default;
DeckVoice::~DeckVoice() = default;

void DeckVoice::prepare(double engineSampleRate)
{
    engineSampleRate_ = engineSampleRate;
}

void DeckVoice::start(const Buffer* buffer, double startSample, double endSample,
                      bool looping, uint32_t generation)
{
    generation_ = generation;
    if (!buffer || buffer->getLengthInSamples() < 1)
    {
        stop();
        return;
    }

    const double length = static_cast<double>(buffer->getLengthInSamples());
    buffer_ = buffer;
    regionEnd_ = std::clamp(endSample, 0.0, length);
    regionStart_ = std::clamp(startSample, 0.0, regionEnd_);
    position_ = regionStart_;
    looping_ = looping && regionEnd_ > regionStart_;
    active_ = regionEnd_ > regionStart_;

    fadeGain_ = 1.0f;
    gainTarget_ = 1.0f;
    gainRampRemaining_ = 0;
    rate_ = 1.0;
    rateTarget_ = 1.0;
    rateRampRemaining_ = 0;
}

void DeckVoice::stop()
{
    active_ = false;
    buffer_ = nullptr;
    gainRampRemaining_ = 0;
    rateRampRemaining_ = 0;
    fadeGain_ = 1.0f;
    rate_ = 1.0;
}

void DeckVoice::rampGain(float target, int numSamples)
{
    gainTarget_ = target;
    if (numSamples <= 0)
    {
        fadeGain_ = target;
        gainRampRemaining_ = 0;
        return;
    }
    gainStep_ = (target - fadeGain_) / static_cast<float>(numSamples);
    gainRampRemaining_ = numSamples;
}

void DeckVoice::rampRate(double target, int numSamples)
{
    rateTarget_ = target;
    if (numSamples <= 0 || rate_ <= 0.0 || target <= 0.0)
    {
        rate_ = target;
        rateRampRemaining_ = 0;
        return;
    }
    // Exponential: constant per-sample factor from the current rate to target.
    rateFactor_ = std::pow(target / rate_, 1.0 / static_cast<double>(numSamples));
    rateRampRemaining_ = numSamples;
}

float DeckVoice::interpolate(const float* data, int length, double pos) const
{
    int i = static_cast<int>(std::floor(pos));
    double t = pos - std::floor(pos);

    auto clamp = [&](int idx) -> int {
        return std::max(0, std::min(idx, length - 1));
    };

    float s0 = data[clamp(i - 1)];
    float s1 = data[clamp(i)];
    float s2 = data[clamp(i + 1)];
    float s3 = data[clamp(i + 2)];

    float ft = static_cast<float>(t);
    float a0 = -0.5f * s0 + 1.5f * s1 - 1.5f * s2 + 0.5f * s3;
    float a1 =        s0 - 2.5f * s1 + 2.0f * s2 - 0.5f * s3;
    float a2 = -0.5f * s0             + 0.5f * s2;
    float a3 =                    s1;

    return ((a0 * ft + a1) * ft + a2) * ft + a3;
}

bool DeckVoice::render(float* destL, float* destR, int numSamples, float deckGain)
{
    if (!active_ || !buffer_ || numSamples <= 0)
        return false;

    const int length = buffer_->getLengthInSamples();
    const float* ch0 = buffer_->getReadPointer(0);
    const float* ch1 = buffer_->getNumChannels() > 1 ? buffer_->getReadPointer(1) : ch0;
    const double sampleRateRatio = buffer_->getSampleRate() / engineSampleRate_;
    const double regionLength = regionEnd_ - regionStart_;

    for (int i = 0; i < numSamples; ++i)
    {
        if (!looping_ && position_ >= regionEnd_)
        {
            active_ = false;
            buffer_ = nullptr;
            return true;
        }

        float gain = fadeGain_ * deckGain;
        destL[i] += interpolate(ch0, length, position_) * gain;
        if (destR != destL)
            destR[i] += interpolate(ch1, length, position_) * gain;

        position_ += rate_ * sampleRateRatio;
        if (looping_ && position_ >= regionEnd_)
            position_ = regionStart_ + std::fmod(position_ - regionStart_, regionLength);

        if (gainRampRemaining_ > 0)
        {
            fadeGain_ += gainStep_;
            if (--gainRampRemaining_ == 0)
                fadeGain_ = gainTarget_;
        }
        if (rateRampRemaining_ > 0)
        {
            rate_ *= rateFactor_;
            if (--rateRampRemaining_ == 0)
                rate_ = rateTarget_;
        }
    }

    if (!looping_ && position_ >= regionEnd_)
    {
        active_ = false;
        buffer_ = nullptr;
        return true;
    }
    return false;
}

} // namespace spindeck
