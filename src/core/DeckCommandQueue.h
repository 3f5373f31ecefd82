#pragma once

#include "core/SPSCQueue.h"
#include "core/Logger.h"
#include <cstdint>
#include <utility>

namespace spindeck {

class Buffer;

struct DeckCommand {
    enum class Type {
        startVoice,
        stopVoice,
        rampGain,
        rampRate,
        setDeckGain,
        setMasterGain
    };

    Type type = Type::stopVoice;
    int deck = 0;             // 0-based; unused by setMasterGain
    uint32_t generation = 0;

    const Buffer* buffer = nullptr;
    double startSample = 0.0;
    double endSample = 0.0;
    bool looping = false;

    double target = 0.0;      // gain or rate
    int rampSamples = 0;
};

/// A one-shot voice reached the end of its region.
struct DeckCompletion {
    int deck = 0;
    uint32_t generation = 0;
};

inline const char* deckCommandTypeName(DeckCommand::Type type)
{
    switch (type) {
        case DeckCommand::Type::startVoice:    return "startVoice";
        case DeckCommand::Type::stopVoice:     return "stopVoice";
        case DeckCommand::Type::rampGain:      return "rampGain";
        case DeckCommand::Type::rampRate:      return "rampRate";
        case DeckCommand::Type::setDeckGain:   return "setDeckGain";
        case DeckCommand::Type::setMasterGain: return "setMasterGain";
    }
    return "unknown";
}

class DeckCommandQueue {
public:
    DeckCommandQueue() = default;
    ~DeckCommandQueue() = default;

    DeckCommandQueue(const DeckCommandQueue&) = delete;
    DeckCommandQueue& operator=(const DeckCommandQueue&) = delete;

    // --- Control thread ---
    bool sendCommand(const DeckCommand& cmd)
    {
        if (!commandQueue_.tryPush(cmd)) {
            SD_WARN("DeckCommandQueue: command queue full, dropping %s for deck %d",
                    deckCommandTypeName(cmd.type), cmd.deck + 1);
            return false;
        }
        SD_TRACE("DeckCommandQueue: sent %s for deck %d", deckCommandTypeName(cmd.type), cmd.deck + 1);
        return true;
    }

    // --- Audio thread ---
    template<typename Handler>
    int processPending(Handler&& handler)
    {
        return commandQueue_.drain(std::forward<Handler>(handler));
    }

    bool sendCompletion(const DeckCompletion& completion)
    {
        if (!completionQueue_.tryPush(completion)) {
            SD_WARN_RT("DeckCommandQueue: completion queue full, deck %d end lost", completion.deck + 1);
            return false;
        }
        return true;
    }

    // --- Control thread ---
    template<typename Handler>
    int collectCompletions(Handler&& handler)
    {
        return completionQueue_.drain(std::forward<Handler>(handler));
    }

private:
    static constexpr int kCommandCapacity = 256;
    static constexpr int kCompletionCapacity = 64;

    SPSCQueue<DeckCommand, kCommandCapacity> commandQueue_;
    SPSCQueue<DeckCompletion, kCompletionCapacity> completionQueue_;
};

} // namespace spindeck
