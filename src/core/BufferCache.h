#pragma once

#include "core/Buffer.h"

#include <juce_audio_formats/juce_audio_formats.h>

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace spindeck {

using BufferPtr = std::shared_ptr<const Buffer>;

/// Decoded section assets keyed by file path.
/// Decoding runs on a worker pool; concurrent requests for the same uncached
/// path share a single in-flight decode. Failed decodes are not cached.
class BufferCache {
public:
    BufferCache();
    ~BufferCache();

    BufferCache(const BufferCache&) = delete;
    BufferCache& operator=(const BufferCache&) = delete;

    /// Returns the cached buffer, or blocks until it has been decoded.
    /// On failure returns nullptr and fills `error`.
    BufferPtr get(const std::string& filePath, std::string& error);

    /// Starts decoding in the background if the path is neither cached nor in flight.
    void preload(const std::string& filePath);

    /// Injects a programmatically created buffer under `filePath`.
    bool add(const std::string& filePath, std::unique_ptr<Buffer> buffer);

    bool contains(const std::string& filePath) const;
    bool isLoading(const std::string& filePath) const;
    int size() const;
    void clear();

    /// Number of decodes actually started since construction.
    int getDecodeCount() const;

private:
    struct LoadResult {
        BufferPtr buffer;
        std::string error;
    };

    std::shared_future<LoadResult> acquire(const std::string& filePath);
    LoadResult decode(const std::string& filePath);

    juce::AudioFormatManager formatManager_;
    std::mutex decodeMutex_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, BufferPtr> buffers_;
    std::unordered_map<std::string, std::shared_future<LoadResult>> inFlight_;
    std::atomic<int> decodeCount_{0};

    // Declared last: destroyed first, so pending decodes finish before the maps go away.
    juce::ThreadPool pool_;
};

} // namespace spindeck
