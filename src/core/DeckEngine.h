#pragma once

#include "core/BufferCache.h"
#include "core/DeckCommandQueue.h"
#include "core/DeckVoice.h"
#include "core/Types.h"

#include <array>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace spindeck {

constexpr double kFadeOutSeconds = 0.2;
constexpr double kSpindownSeconds = 0.8;
constexpr double kSpindownFloorRate = 0.01;
constexpr double kSpindownStopGraceSeconds = 0.1;

/// Live section playback on a deck. Position = now - clockStartTime + sectionStartOffsetSeconds.
struct PlaybackState {
    Track track;
    Section section = Section::lead;
    double sectionStartOffsetSeconds = 0.0;
    double clockStartTime = 0.0;
};

/// Pre-excursion position saved while a roll or reverse drives the deck.
struct ExcursionState {
    double startClockTime = 0.0;
    double savedPositionSeconds = 0.0;
    Section savedSection = Section::lead;
    Track savedTrack;
};

using RollState = ExcursionState;
using ReverseState = ExcursionState;

struct DeckPosition {
    Track track;
    Section section = Section::lead;
    double positionSeconds = 0.0;
};

/// Four beat-locked playback decks on one audio clock.
///
/// Control methods and poll() run on the control timeline; processBlock()
/// runs on the audio thread. Decks are numbered 1..4.
class DeckEngine {
public:
    DeckEngine(BufferCache& cache, double sampleRate, int blockSize,
               const std::string& musicRoot);
    ~DeckEngine();

    DeckEngine(const DeckEngine&) = delete;
    DeckEngine& operator=(const DeckEngine&) = delete;

    double getSampleRate() const;
    int getBlockSize() const;
    const std::string& getMusicRoot() const;

    /// Seconds of audio rendered since construction.
    double now() const;

    // --- Transport (control timeline) ---

    /// Plays `section` of `track` from `beatOffset`, replacing whatever the
    /// deck was doing. Offsets past the section end continue into the other
    /// section. Returns false (deck untouched) if the asset cannot be loaded.
    bool play(const Track& track, int deck, Section section, double beatOffset = 0.0);
    bool stop(int deck);
    void stopAll();

    bool fadeOut(int deck, double durationSeconds = kFadeOutSeconds);
    bool spindown(int deck);

    /// Loops `rollBeats` from the current position. `fallback` is used when
    /// the deck has no live playback (body section, position 0).
    bool startRoll(int deck, double rollBeats, const std::optional<Track>& fallback = std::nullopt);
    bool stopRoll(int deck);

    bool startReverse(int deck, const std::optional<Track>& fallback = std::nullopt);
    bool stopReverse(int deck);

    /// nullopt when the deck has no live section playback (idle, rolling or reversing).
    std::optional<DeckPosition> getCurrentPlaybackState(int deck) const;

    /// Restarts `targetTrack` on `targetDeck` at the source deck's beat position.
    bool syncTo(int sourceDeck, int targetDeck, const Track& targetTrack);

    bool setVolume(int deck, float level);
    float getVolume(int deck) const;
    void setMasterVolume(float level);
    float getMasterVolume() const;

    /// Starts background decoding of both sections.
    void preload(const Track& track);

    bool isActive(int deck) const;
    bool isRolling(int deck) const;
    bool isReversing(int deck) const;
    uint32_t getGeneration(int deck) const;

    /// Services voice completions, due timers and retired buffers.
    void poll();

    // --- Audio processing (audio thread) ---
    void processBlock(float* const* outputChannels, int numChannels, int numSamples);

    // --- Testing ---

    /// Renders `numSamples` headless in block-sized chunks, polling after each.
    void render(int numSamples);
    const juce::AudioBuffer<float>& getLastRender() const;

private:
    struct Timer {
        enum class Action { stopAfterFade, stopAfterSpindown };
        Action action;
        int deck;
        uint32_t generation;
        double due;
    };

    struct Deck {
        std::optional<PlaybackState> playback;
        std::optional<RollState> roll;
        std::optional<ReverseState> reverse;
        BufferPtr buffer;
        // Buffers the voice may still read because the command replacing
        // them was not queued. Released once a start or stop gets through.
        std::vector<BufferPtr> unreleased;
        bool stopPending = false;
        uint32_t generation = 0;
        bool sounding = false;
        bool fading = false;
        bool spinningDown = false;
        float volume = 1.0f;
    };

    struct RetiredBuffer {
        BufferPtr buffer;
        int64_t releaseAfterBlock;
    };

    bool validDeck(int deck) const;
    BufferPtr loadSection(const Track& track, Section section);
    BufferPtr reversedSection(const Track& track, Section section, const BufferPtr& forward);

    bool playLocked(const Track& track, int idx, Section section, double beatOffset, bool supersede);
    void stopLocked(int idx);
    void startVoice(int idx, BufferPtr buffer, double startSeconds, double endSeconds, bool looping);
    void retire(BufferPtr buffer);
    void releaseUnreleased(Deck& d);
    bool capturePosition(int idx, const std::optional<Track>& fallback, ExcursionState& out) const;
    bool resumeFromExcursion(int idx, const ExcursionState& saved, double resumeSeconds);
    double positionOf(const Deck& d) const;
    void handleCompletion(const DeckCompletion& completion);
    void handleCommand(const DeckCommand& cmd);

    BufferCache& cache_;
    double sampleRate_;
    int blockSize_;
    std::string musicRoot_;

    mutable std::mutex controlMutex_;
    std::array<Deck, kNumDecks> decks_;
    std::vector<Timer> timers_;
    std::vector<RetiredBuffer> retired_;
    std::unordered_map<std::string, BufferPtr> reversed_;
    float masterVolume_ = 1.0f;

    DeckCommandQueue commandQueue_;

    // Audio thread only
    std::array<DeckVoice, kNumDecks> voices_;
    std::array<float, kNumDecks> deckGains_{};
    float masterGain_ = 1.0f;

    std::atomic<int64_t> samplesRendered_{0};
    std::atomic<int64_t> blocksRendered_{0};

    juce::AudioBuffer<float> renderBuffer_;
};

} // namespace spindeck
