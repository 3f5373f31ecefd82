#include "core/Buffer.h"

namespace spindeck {

Buffer::Buffer() = default;
Buffer::~Buffer() = default;

std::unique_ptr<Buffer> Buffer::createEmpty(
    int numChannels, int lengthInSamples, double sampleRate,
    const std::string& name)
{
    if (numChannels < 1 || lengthInSamples < 1 || sampleRate <= 0.0)
    {
        SD_WARN("Buffer::createEmpty: invalid params (ch=%d, len=%d, sr=%.1f)",
                numChannels, lengthInSamples, sampleRate);
        return nullptr;
    }

    auto buf = std::unique_ptr<Buffer>(new Buffer());
    buf->data_.setSize(numChannels, lengthInSamples);
    buf->data_.clear();
    buf->sampleRate_ = sampleRate;
    buf->name_ = name;

    SD_DEBUG("Buffer::createEmpty: name=%s, ch=%d, len=%d, sr=%.1f",
             name.c_str(), numChannels, lengthInSamples, sampleRate);
    return buf;
}

std::unique_ptr<Buffer> Buffer::createFromData(
    juce::AudioBuffer<float>&& data, double sampleRate,
    const std::string& name, const std::string& filePath)
{
    if (data.getNumChannels() < 1 || data.getNumSamples() < 1 || sampleRate <= 0.0)
    {
        SD_WARN("Buffer::createFromData: invalid params (ch=%d, len=%d, sr=%.1f)",
                data.getNumChannels(), data.getNumSamples(), sampleRate);
        return nullptr;
    }

    auto buf = std::unique_ptr<Buffer>(new Buffer());
    buf->data_ = std::move(data);
    buf->sampleRate_ = sampleRate;
    buf->name_ = name;
    buf->filePath_ = filePath;

    SD_DEBUG("Buffer::createFromData: name=%s, ch=%d, len=%d, sr=%.1f, path=%s",
             name.c_str(), buf->data_.getNumChannels(), buf->data_.getNumSamples(),
             sampleRate, filePath.c_str());
    return buf;
}

std::unique_ptr<Buffer> Buffer::createReversed(const Buffer& source)
{
    juce::AudioBuffer<float> reversed(source.data_);
    reversed.reverse(0, reversed.getNumSamples());

    auto buf = createFromData(std::move(reversed), source.sampleRate_,
                              source.name_ + "-reversed", source.filePath_);
    SD_DEBUG("Buffer::createReversed: %s (%d samples)",
             source.name_.c_str(), source.getLengthInSamples());
    return buf;
}

const float* Buffer::getReadPointer(int channel) const
{
    if (channel < 0 || channel >= data_.getNumChannels())
        return nullptr;
    return data_.getReadPointer(channel);
}

float* Buffer::getWritePointer(int channel)
{
    if (channel < 0 || channel >= data_.getNumChannels())
        return nullptr;
    return data_.getWritePointer(channel);
}

int Buffer::getNumChannels() const { return data_.getNumChannels(); }
int Buffer::getLengthInSamples() const { return data_.getNumSamples(); }
double Buffer::getSampleRate() const { return sampleRate_; }

double Buffer::getLengthInSeconds() const
{
    return static_cast<double>(data_.getNumSamples()) / sampleRate_;
}

const std::string& Buffer::getName() const { return name_; }
const std::string& Buffer::getFilePath() const { return filePath_; }

} // namespace spindeck
