#include "core/BufferCache.h"
#include "core/Logger.h"

namespace spindeck {

static constexpr int kDecodeThreads = 2;

BufferCache::BufferCache()
    : pool_(kDecodeThreads)
{
    formatManager_.registerBasicFormats();
    SD_INFO("BufferCache: initialized with %d audio formats",
            formatManager_.getNumKnownFormats());
}

BufferCache::~BufferCache()
{
    pool_.removeAllJobs(true, 10000);
    SD_DEBUG("BufferCache: destroying with %d buffers", size());
}

// ═══════════════════════════════════════════════════════════════════
// Lookup / loading
// ═══════════════════════════════════════════════════════════════════

BufferPtr BufferCache::get(const std::string& filePath, std::string& error)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = buffers_.find(filePath);
        if (it != buffers_.end())
        {
            SD_TRACE("BufferCache::get: hit %s", filePath.c_str());
            return it->second;
        }
    }

    auto result = acquire(filePath).get();
    if (!result.buffer)
        error = result.error;
    return result.buffer;
}

void BufferCache::preload(const std::string& filePath)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (buffers_.count(filePath))
            return;
    }
    acquire(filePath);
}

std::shared_future<BufferCache::LoadResult> BufferCache::acquire(const std::string& filePath)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto cached = buffers_.find(filePath);
    if (cached != buffers_.end())
    {
        std::promise<LoadResult> ready;
        ready.set_value({cached->second, {}});
        return ready.get_future().share();
    }

    auto pending = inFlight_.find(filePath);
    if (pending != inFlight_.end())
    {
        SD_DEBUG("BufferCache: joining in-flight load of %s", filePath.c_str());
        return pending->second;
    }

    auto promise = std::make_shared<std::promise<LoadResult>>();
    auto future = promise->get_future().share();
    inFlight_[filePath] = future;
    decodeCount_.fetch_add(1, std::memory_order_relaxed);

    pool_.addJob([this, filePath, promise]
    {
        auto result = decode(filePath);
        {
            std::lock_guard<std::mutex> jobLock(mutex_);
            if (result.buffer)
                buffers_[filePath] = result.buffer;
            inFlight_.erase(filePath);
        }
        promise->set_value(std::move(result));
    });

    return future;
}

BufferCache::LoadResult BufferCache::decode(const std::string& filePath)
{
    LoadResult result;
    auto loadStart = juce::Time::getMillisecondCounter();

    auto file = juce::File::getCurrentWorkingDirectory().getChildFile(filePath);
    if (!file.existsAsFile())
    {
        result.error = "File not found: " + filePath;
        SD_WARN("BufferCache::decode: %s", result.error.c_str());
        return result;
    }

    std::lock_guard<std::mutex> lock(decodeMutex_);

    std::unique_ptr<juce::AudioFormatReader> reader(formatManager_.createReaderFor(file));
    if (!reader)
    {
        result.error = "Unsupported or corrupted audio file: " + filePath;
        SD_WARN("BufferCache::decode: %s", result.error.c_str());
        return result;
    }

    auto numChannels = static_cast<int>(reader->numChannels);
    auto numSamples = static_cast<int>(reader->lengthInSamples);

    juce::AudioBuffer<float> data(numChannels, numSamples);
    if (!reader->read(&data, 0, numSamples, 0, true, true))
    {
        result.error = "Failed to read audio data from: " + filePath;
        SD_WARN("BufferCache::decode: %s", result.error.c_str());
        return result;
    }

    std::string name = file.getFileNameWithoutExtension().toStdString();
    auto buf = Buffer::createFromData(std::move(data), reader->sampleRate, name, filePath);
    if (!buf)
    {
        result.error = "Failed to create buffer from file: " + filePath;
        SD_WARN("BufferCache::decode: %s", result.error.c_str());
        return result;
    }

    SD_INFO("BufferCache: loaded %s in %u ms (ch=%d, len=%d, sr=%.1f)",
            name.c_str(), juce::Time::getMillisecondCounter() - loadStart,
            buf->getNumChannels(), buf->getLengthInSamples(), buf->getSampleRate());
    result.buffer = std::move(buf);
    return result;
}

// ═══════════════════════════════════════════════════════════════════
// Programmatic buffers / queries
// ═══════════════════════════════════════════════════════════════════

bool BufferCache::add(const std::string& filePath, std::unique_ptr<Buffer> buffer)
{
    if (!buffer)
    {
        SD_WARN("BufferCache::add: null buffer for %s", filePath.c_str());
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    buffers_[filePath] = std::move(buffer);
    SD_DEBUG("BufferCache::add: %s", filePath.c_str());
    return true;
}

bool BufferCache::contains(const std::string& filePath) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return buffers_.count(filePath) > 0;
}

bool BufferCache::isLoading(const std::string& filePath) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return inFlight_.count(filePath) > 0;
}

int BufferCache::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(buffers_.size());
}

void BufferCache::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    SD_DEBUG("BufferCache::clear: dropping %d buffers", static_cast<int>(buffers_.size()));
    buffers_.clear();
}

int BufferCache::getDecodeCount() const
{
    return decodeCount_.load(std::memory_order_relaxed);
}

} // namespace spindeck
