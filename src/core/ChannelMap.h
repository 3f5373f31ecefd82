#pragma once

#include "core/Types.h"

#include <cstdint>

namespace spindeck {

/// Decoded control-surface message. Channels are 0-based MIDI channels.
struct ControlMessage {
    enum class Type : uint8_t { button, knob };

    Type type = Type::button;
    int channel = 0;
    int number = 0;  // note (button) or controller (knob)
    int value = 0;   // velocity (button, 0 = release) or controller value

    bool isPress() const { return type == Type::button && value > 0; }

    static ControlMessage button(int channel, int note, int velocity)
    {
        return {Type::button, channel, note, velocity};
    }

    static ControlMessage knob(int channel, int controller, int value)
    {
        return {Type::knob, channel, controller, value};
    }
};

// Fixed addressing scheme of the surface.
namespace channels {
    constexpr int kNumChannels = 16;
    constexpr int kNumNotes = 128;

    constexpr int deckA = 0;       // side A deck controls
    constexpr int deckB = 1;       // side B deck controls
    constexpr int deckAltA = 2;    // side A controls while deck 3 is selected
    constexpr int deckAltB = 3;    // side B controls while deck 4 is selected
    constexpr int fxA = 4;
    constexpr int fxB = 5;
    constexpr int center = 6;
    constexpr int padsDeck1 = 7;   // pads of decks 1..4 on channels 7..10
    constexpr int padsDeck4 = 10;
} // namespace channels

namespace notes {
    // Deck control channels
    constexpr int hotCueMode = 27;
    constexpr int rollMode = 30;
    constexpr int slicerMode = 32;
    constexpr int samplerMode = 34;
    constexpr int slip = 64;
    constexpr int sync = 88;
    constexpr int deckAlternate = 114;

    // FX channels
    constexpr int fx1 = 71;
    constexpr int fx2 = 72;
    constexpr int fx3 = 73;
    constexpr int fxAssign = 74;
    constexpr int tap = 67;

    // Center channel
    constexpr int shift = 64;
    constexpr int loadA = 70;
    constexpr int loadB = 71;
    constexpr int fxAssign1Left = 76;
    constexpr int fxAssign1Right = 77;
    constexpr int fxAssign2Left = 80;
    constexpr int fxAssign2Right = 81;

    constexpr int numPads = 8;
} // namespace notes

namespace controllers {
    constexpr int beats = 0;        // FX channels, tempo encoder
    constexpr int masterVolume = 3; // center
    constexpr int browse = 64;      // center
    constexpr int encoderRest = 64;
} // namespace controllers

constexpr int kIndicatorOn = 127;
constexpr int kIndicatorOff = 0;
constexpr int kIndicatorPadDim = 2;

inline int padModeNote(PadMode m)
{
    switch (m) {
        case PadMode::hotCue:  return notes::hotCueMode;
        case PadMode::roll:    return notes::rollMode;
        case PadMode::slicer:  return notes::slicerMode;
        case PadMode::sampler: return notes::samplerMode;
    }
    return notes::hotCueMode;
}

inline bool padModeFromNote(int note, PadMode& mode)
{
    switch (note) {
        case notes::hotCueMode:  mode = PadMode::hotCue;  return true;
        case notes::rollMode:    mode = PadMode::roll;    return true;
        case notes::slicerMode:  mode = PadMode::slicer;  return true;
        case notes::samplerMode: mode = PadMode::sampler; return true;
        default: return false;
    }
}

/// Pads of the deck currently selected on a side report on channel 7 (A) or 8 (B).
inline int padChannelForSide(Side side)
{
    return side == Side::a ? channels::padsDeck1 : channels::padsDeck1 + 1;
}

inline int controlChannelForSide(Side side)
{
    return side == Side::a ? channels::deckA : channels::deckB;
}

/// FX ASSIGN buttons light for decks 1/2; a companion note lights for decks 3/4.
inline int fxAssignAltIndicatorNote(int assignNote)
{
    switch (assignNote) {
        case notes::fxAssign1Left:  return 90;
        case notes::fxAssign1Right: return 91;
        case notes::fxAssign2Left:  return 92;
        case notes::fxAssign2Right: return 93;
        default: return -1;
    }
}

inline bool isPadChannel(int channel)
{
    return channel >= channels::padsDeck1 && channel <= channels::padsDeck4;
}

} // namespace spindeck
