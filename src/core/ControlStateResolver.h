#pragma once

#include "core/ChannelMap.h"
#include "core/Types.h"

#include <array>
#include <bitset>
#include <optional>
#include <utility>
#include <vector>

namespace spindeck {

/// Semantic outcome of one control-surface message.
struct ControlAction {
    enum class Kind {
        ignored,              // release of a stateful button, encoder at rest
        passthrough,          // no state change; forwarded as a raw event
        shift,
        lockToggled,
        fxAssignToggled,
        deckAlternateToggled,
        modeChanged,
        padPressed,
        padReleased,
        sync,
        spindown,
        slip,
        load,
        tempoChanged,
        browse,
        masterVolume
    };

    Kind kind = Kind::ignored;
    ControlMessage message;   // canonical message (shifted notes remapped)
    Side side = Side::a;
    int deck = 0;             // 1..4 when the action targets a deck
    int fxUnit = 0;
    int pad = 0;
    bool on = false;          // locked / assigned / alternate on / synced
    PadMode mode = PadMode::hotCue;
    int tempo = 0;
    int direction = 0;        // encoder step, +1 or -1
};

const char* actionKindName(ControlAction::Kind kind);

/// Interprets the control surface: shift layer, sticky locks, FX assignment,
/// deck-alternate routing, pad-mode radio groups and stepped tempo.
/// Pure state; performs no audio, rendering or hardware I/O.
class ControlStateResolver {
public:
    static constexpr int kNumFxUnits = 2;

    ControlStateResolver();

    ControlStateResolver(const ControlStateResolver&) = delete;
    ControlStateResolver& operator=(const ControlStateResolver&) = delete;

    /// Classifies `message`, updates state and describes what happened.
    ControlAction resolve(const ControlMessage& message);

    // --- Shift layer ---
    void setShiftHeld(bool pressed);
    bool isShiftHeld() const;

    /// Maps a shifted alternate note to its canonical note; identity otherwise.
    int resolveNote(int channel, int note) const;
    bool isShiftedNote(int channel, int note) const;

    // --- Locks ---

    /// Flips the sticky latch of (channel, note). Releases (value 0) change
    /// nothing and return nullopt.
    std::optional<bool> toggleLock(int channel, int note, int value);
    bool isLocked(int channel, int note) const;
    std::vector<std::pair<int, int>> lockedButtons() const;
    void clearAllLocks();

    /// Locked buttons stay fully lit; everything else echoes the press value.
    int indicatorLevel(int channel, int note, int value) const;

    // --- FX assignment ---

    /// Maps an FX ASSIGN button to (fxUnit, deck) through the side's alternate toggle.
    bool resolveFXAssignButton(int note, int& fxUnit, int& deck) const;
    bool toggleFXAssignment(int fxUnit, int deck);
    bool isFXAssigned(int fxUnit, int deck) const;

    // --- Deck alternate ---
    bool toggleDeckAlternate(Side side);
    bool isDeckAlternateOn(Side side) const;
    std::array<bool, 2> deckAlternateStates() const; // {side A, side B}
    int resolveActiveDeck(Side side) const;

    // --- Pad modes ---

    /// Radio-select; true only if the deck's mode actually changed.
    bool setPadMode(int deck, PadMode mode);
    PadMode getPadMode(int deck) const;
    std::array<PadMode, kNumDecks> padModeStates() const;

    // --- Tempo ---

    /// +1 for values below the encoder rest point, -1 above, 0 at rest.
    static int encoderDirection(int value);

    /// Moves one step through the tempo set; nullopt at the boundary.
    std::optional<int> stepTempo(int direction);
    int getTempo() const;
    bool setTempo(int bpm);

    // --- Sync indicator ---
    bool toggleSync(int deck);
    bool isSynced(int deck) const;

    /// Explicit clear used on reconnect: every toggle, lock, mode and flag
    /// returns to its power-on value.
    void reset();

private:
    int deckForControlChannel(int channel) const;
    int deckForPadChannel(int channel) const;
    static bool isValidDeck(int deck);

    ControlAction resolveButton(const ControlMessage& message);
    ControlAction resolveKnob(const ControlMessage& message);

    bool shiftHeld_ = false;
    std::array<std::bitset<channels::kNumNotes>, channels::kNumChannels> locks_;
    std::array<std::array<bool, kNumDecks>, kNumFxUnits> fxAssigned_{};
    std::array<bool, 2> deckAlternate_{};
    std::array<PadMode, kNumDecks> padModes_{};
    std::array<bool, kNumDecks> synced_{};
    int tempoIndex_ = 1;
};

} // namespace spindeck
