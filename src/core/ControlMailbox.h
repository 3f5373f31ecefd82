#pragma once

#include "core/ChannelMap.h"
#include "core/Logger.h"
#include "core/SPSCQueue.h"

#include <juce_core/juce_core.h>

#include <atomic>
#include <utility>

namespace spindeck {

/// Ordered hand-off of decoded control messages from the MIDI thread to the
/// control timeline. One producer, one consumer; overflow drops and counts.
class ControlMailbox {
public:
    static constexpr int kCapacity = 1024;

    ControlMailbox() = default;

    ControlMailbox(const ControlMailbox&) = delete;
    ControlMailbox& operator=(const ControlMailbox&) = delete;

    // --- Producer (MIDI thread) ---
    bool post(const ControlMessage& message)
    {
        if (!queue_.tryPush(message))
        {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        signal_.signal();
        return true;
    }

    // --- Consumer (control timeline) ---
    template<typename Handler>
    int drain(Handler&& handler)
    {
        // Drops are counted on the MIDI thread and reported here.
        int dropped = dropped_.load(std::memory_order_relaxed);
        if (dropped != reportedDrops_)
        {
            SD_WARN("ControlMailbox: full, dropped %d message(s)", dropped - reportedDrops_);
            reportedDrops_ = dropped;
        }
        return queue_.drain(std::forward<Handler>(handler));
    }

    /// Blocks until a message is posted, wake() is called or the timeout passes.
    bool waitForMessages(int timeoutMs)
    {
        if (!queue_.empty())
            return true;
        return signal_.wait(timeoutMs);
    }

    void wake() { signal_.signal(); }

    int pending() const { return queue_.size(); }
    int getDroppedCount() const { return dropped_.load(std::memory_order_relaxed); }

private:
    SPSCQueue<ControlMessage, kCapacity> queue_;
    std::atomic<int> dropped_{0};
    int reportedDrops_ = 0; // consumer only
    juce::WaitableEvent signal_;
};

} // namespace spindeck
