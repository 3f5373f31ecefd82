#include "core/ControlStateResolver.h"
#include "core/Logger.h"

#include <algorithm>

namespace spindeck {

namespace {

struct NoteRemap {
    int shifted;
    int canonical;
};

// FX channels: the surface reports shift+button on an alternate note range.
constexpr NoteRemap kShiftedFxNotes[] = {
    {99, notes::fx1},
    {100, notes::fx2},
    {101, notes::fx3},
    {102, notes::tap},
};

// Deck control channels: shift + top-row pad selects a pad mode.
constexpr NoteRemap kShiftedPadNotes[] = {
    {105, notes::hotCueMode},
    {107, notes::rollMode},
    {109, notes::slicerMode},
    {111, notes::samplerMode},
};

struct FxAssignButton {
    int note;
    int fxUnit;
    Side side;
};

constexpr FxAssignButton kFxAssignButtons[] = {
    {notes::fxAssign1Left, 1, Side::a},
    {notes::fxAssign2Left, 2, Side::a},
    {notes::fxAssign1Right, 1, Side::b},
    {notes::fxAssign2Right, 2, Side::b},
};

bool isFxChannel(int channel)
{
    return channel == channels::fxA || channel == channels::fxB;
}

bool isDeckControlChannel(int channel)
{
    return channel >= channels::deckA && channel <= channels::deckAltB;
}

bool isInRange(int channel, int note)
{
    return channel >= 0 && channel < channels::kNumChannels
        && note >= 0 && note < channels::kNumNotes;
}

} // namespace

const char* actionKindName(ControlAction::Kind kind)
{
    using K = ControlAction::Kind;
    switch (kind) {
        case K::ignored:              return "ignored";
        case K::passthrough:          return "passthrough";
        case K::shift:                return "shift";
        case K::lockToggled:          return "lockToggled";
        case K::fxAssignToggled:      return "fxAssignToggled";
        case K::deckAlternateToggled: return "deckAlternateToggled";
        case K::modeChanged:          return "modeChanged";
        case K::padPressed:           return "padPressed";
        case K::padReleased:          return "padReleased";
        case K::sync:                 return "sync";
        case K::spindown:             return "spindown";
        case K::slip:                 return "slip";
        case K::load:                 return "load";
        case K::tempoChanged:         return "tempoChanged";
        case K::browse:               return "browse";
        case K::masterVolume:         return "masterVolume";
    }
    return "unknown";
}

ControlStateResolver::ControlStateResolver()
{
    reset();
}

// ═══════════════════════════════════════════════════════════════════
// Classification
// ═══════════════════════════════════════════════════════════════════

ControlAction ControlStateResolver::resolve(const ControlMessage& message)
{
    ControlAction action = message.type == ControlMessage::Type::button
        ? resolveButton(message)
        : resolveKnob(message);

    SD_TRACE("ControlStateResolver: %s ch=%d num=%d val=%d -> %s deck=%d",
             message.type == ControlMessage::Type::button ? "button" : "knob",
             message.channel, message.number, message.value,
             actionKindName(action.kind), action.deck);
    return action;
}

ControlAction ControlStateResolver::resolveButton(const ControlMessage& message)
{
    using K = ControlAction::Kind;

    ControlAction action;
    action.message = message;
    const int ch = message.channel;
    const bool pressed = message.isPress();

    if (ch == channels::center && message.number == notes::shift)
    {
        setShiftHeld(pressed);
        action.kind = K::shift;
        action.on = pressed;
        return action;
    }

    // Shifted FX buttons toggle the lock of their canonical button.
    if (isFxChannel(ch) && isShiftedNote(ch, message.number))
    {
        int canonical = resolveNote(ch, message.number);
        action.message.number = canonical;
        auto locked = toggleLock(ch, canonical, message.value);
        if (!locked)
            return action;
        action.kind = K::lockToggled;
        action.on = *locked;
        return action;
    }

    if (ch == channels::center)
    {
        int fxUnit = 0;
        int deck = 0;
        if (resolveFXAssignButton(message.number, fxUnit, deck))
        {
            if (!pressed)
                return action;
            action.kind = K::fxAssignToggled;
            action.fxUnit = fxUnit;
            action.deck = deck;
            action.side = (deck == 1 || deck == 3) ? Side::a : Side::b;
            action.on = toggleFXAssignment(fxUnit, deck);
            return action;
        }

        if (message.number == notes::loadA || message.number == notes::loadB)
        {
            if (!pressed)
                return action;
            action.kind = K::load;
            action.side = message.number == notes::loadA ? Side::a : Side::b;
            action.deck = resolveActiveDeck(action.side);
            return action;
        }

        action.kind = K::passthrough;
        return action;
    }

    if ((ch == channels::deckAltA || ch == channels::deckAltB)
        && message.number == notes::deckAlternate)
    {
        if (!pressed)
            return action;
        action.kind = K::deckAlternateToggled;
        action.side = ch == channels::deckAltA ? Side::a : Side::b;
        action.on = toggleDeckAlternate(action.side);
        action.deck = resolveActiveDeck(action.side);
        return action;
    }

    if (isDeckControlChannel(ch))
    {
        action.side = (ch == channels::deckA || ch == channels::deckAltA) ? Side::a : Side::b;
        action.deck = deckForControlChannel(ch);

        int note = resolveNote(ch, message.number);
        PadMode mode;
        if (padModeFromNote(note, mode))
        {
            action.message.number = note;
            if (!pressed)
                return action;
            action.mode = mode;
            action.kind = setPadMode(action.deck, mode) ? K::modeChanged : K::passthrough;
            return action;
        }

        if (message.number == notes::sync)
        {
            if (!pressed)
                return action;
            if (shiftHeld_)
            {
                action.kind = K::spindown;
                return action;
            }
            action.kind = K::sync;
            action.on = toggleSync(action.deck);
            return action;
        }

        if (message.number == notes::slip)
        {
            if (!pressed)
                return action;
            action.kind = K::slip;
            return action;
        }

        action.kind = K::passthrough;
        return action;
    }

    if (isPadChannel(ch))
    {
        if (message.number < 0 || message.number >= notes::numPads)
        {
            action.kind = K::passthrough;
            return action;
        }
        action.deck = deckForPadChannel(ch);
        action.side = (action.deck == 1 || action.deck == 3) ? Side::a : Side::b;
        action.pad = message.number;
        action.mode = getPadMode(action.deck);
        action.kind = pressed ? K::padPressed : K::padReleased;
        return action;
    }

    action.kind = K::passthrough;
    return action;
}

ControlAction ControlStateResolver::resolveKnob(const ControlMessage& message)
{
    using K = ControlAction::Kind;

    ControlAction action;
    action.message = message;
    action.kind = K::passthrough;

    if (isFxChannel(message.channel) && message.number == controllers::beats)
    {
        int direction = encoderDirection(message.value);
        if (direction == 0)
        {
            action.kind = K::ignored;
            return action;
        }
        action.direction = direction;
        auto tempo = stepTempo(direction);
        if (tempo)
        {
            action.kind = K::tempoChanged;
            action.tempo = *tempo;
        }
        return action;
    }

    if (message.channel == channels::center && message.number == controllers::browse)
    {
        int direction = encoderDirection(message.value);
        if (direction == 0)
        {
            action.kind = K::ignored;
            return action;
        }
        action.kind = K::browse;
        action.direction = direction;
        return action;
    }

    if (message.channel == channels::center && message.number == controllers::masterVolume)
        action.kind = K::masterVolume;

    return action;
}

// ═══════════════════════════════════════════════════════════════════
// Shift layer
// ═══════════════════════════════════════════════════════════════════

void ControlStateResolver::setShiftHeld(bool pressed)
{
    if (shiftHeld_ != pressed)
        SD_DEBUG("ControlStateResolver: shift %s", pressed ? "held" : "released");
    shiftHeld_ = pressed;
}

bool ControlStateResolver::isShiftHeld() const
{
    return shiftHeld_;
}

bool ControlStateResolver::isShiftedNote(int channel, int note) const
{
    if (isFxChannel(channel))
    {
        for (const auto& r : kShiftedFxNotes)
            if (r.shifted == note)
                return true;
    }
    else if (channel == channels::deckA || channel == channels::deckB)
    {
        for (const auto& r : kShiftedPadNotes)
            if (r.shifted == note)
                return true;
    }
    return false;
}

int ControlStateResolver::resolveNote(int channel, int note) const
{
    if (isFxChannel(channel))
    {
        for (const auto& r : kShiftedFxNotes)
            if (r.shifted == note)
                return r.canonical;
    }
    else if (channel == channels::deckA || channel == channels::deckB)
    {
        for (const auto& r : kShiftedPadNotes)
            if (r.shifted == note)
                return r.canonical;
    }
    return note;
}

// ═══════════════════════════════════════════════════════════════════
// Locks
// ═══════════════════════════════════════════════════════════════════

std::optional<bool> ControlStateResolver::toggleLock(int channel, int note, int value)
{
    if (value == 0 || !isInRange(channel, note))
        return std::nullopt;

    locks_[channel].flip(static_cast<size_t>(note));
    bool locked = locks_[channel].test(static_cast<size_t>(note));
    SD_INFO("ControlStateResolver: lock ch=%d note=%d %s",
            channel, note, locked ? "on" : "off");
    return locked;
}

bool ControlStateResolver::isLocked(int channel, int note) const
{
    if (!isInRange(channel, note))
        return false;
    return locks_[channel].test(static_cast<size_t>(note));
}

std::vector<std::pair<int, int>> ControlStateResolver::lockedButtons() const
{
    std::vector<std::pair<int, int>> result;
    for (int ch = 0; ch < channels::kNumChannels; ++ch)
    {
        if (locks_[ch].none())
            continue;
        for (int note = 0; note < channels::kNumNotes; ++note)
            if (locks_[ch].test(static_cast<size_t>(note)))
                result.emplace_back(ch, note);
    }
    return result;
}

void ControlStateResolver::clearAllLocks()
{
    for (auto& row : locks_)
        row.reset();
    SD_DEBUG("ControlStateResolver: all locks cleared");
}

int ControlStateResolver::indicatorLevel(int channel, int note, int value) const
{
    return isLocked(channel, note) ? kIndicatorOn : value;
}

// ═══════════════════════════════════════════════════════════════════
// FX assignment
// ═══════════════════════════════════════════════════════════════════

bool ControlStateResolver::resolveFXAssignButton(int note, int& fxUnit, int& deck) const
{
    for (const auto& button : kFxAssignButtons)
    {
        if (button.note != note)
            continue;
        fxUnit = button.fxUnit;
        deck = resolveActiveDeck(button.side);
        return true;
    }
    return false;
}

bool ControlStateResolver::toggleFXAssignment(int fxUnit, int deck)
{
    if (fxUnit < 1 || fxUnit > kNumFxUnits || !isValidDeck(deck))
    {
        SD_WARN("ControlStateResolver::toggleFXAssignment: invalid fx=%d deck=%d", fxUnit, deck);
        return false;
    }
    bool& assigned = fxAssigned_[fxUnit - 1][deck - 1];
    assigned = !assigned;
    SD_INFO("ControlStateResolver: FX%d -> deck %d %s", fxUnit, deck, assigned ? "on" : "off");
    return assigned;
}

bool ControlStateResolver::isFXAssigned(int fxUnit, int deck) const
{
    if (fxUnit < 1 || fxUnit > kNumFxUnits || !isValidDeck(deck))
        return false;
    return fxAssigned_[fxUnit - 1][deck - 1];
}

// ═══════════════════════════════════════════════════════════════════
// Deck alternate
// ═══════════════════════════════════════════════════════════════════

bool ControlStateResolver::toggleDeckAlternate(Side side)
{
    bool& on = deckAlternate_[side == Side::a ? 0 : 1];
    on = !on;
    SD_INFO("ControlStateResolver: side %s now addresses deck %d",
            sideName(side), resolveActiveDeck(side));
    return on;
}

bool ControlStateResolver::isDeckAlternateOn(Side side) const
{
    return deckAlternate_[side == Side::a ? 0 : 1];
}

std::array<bool, 2> ControlStateResolver::deckAlternateStates() const
{
    return deckAlternate_;
}

int ControlStateResolver::resolveActiveDeck(Side side) const
{
    if (side == Side::a)
        return isDeckAlternateOn(Side::a) ? 3 : 1;
    return isDeckAlternateOn(Side::b) ? 4 : 2;
}

int ControlStateResolver::deckForControlChannel(int channel) const
{
    switch (channel) {
        case channels::deckA:    return resolveActiveDeck(Side::a);
        case channels::deckB:    return resolveActiveDeck(Side::b);
        case channels::deckAltA: return 3;
        case channels::deckAltB: return 4;
        default:                 return 0;
    }
}

int ControlStateResolver::deckForPadChannel(int channel) const
{
    if (channel == channels::padsDeck1)
        return resolveActiveDeck(Side::a);
    if (channel == channels::padsDeck1 + 1)
        return resolveActiveDeck(Side::b);
    return channel - channels::padsDeck1 + 1; // channels 9/10 address decks 3/4 directly
}

bool ControlStateResolver::isValidDeck(int deck)
{
    return deck >= 1 && deck <= kNumDecks;
}

// ═══════════════════════════════════════════════════════════════════
// Pad modes
// ═══════════════════════════════════════════════════════════════════

bool ControlStateResolver::setPadMode(int deck, PadMode mode)
{
    if (!isValidDeck(deck))
        return false;
    if (padModes_[deck - 1] == mode)
        return false;
    padModes_[deck - 1] = mode;
    SD_INFO("ControlStateResolver: deck %d mode %s", deck, padModeName(mode));
    return true;
}

PadMode ControlStateResolver::getPadMode(int deck) const
{
    if (!isValidDeck(deck))
        return PadMode::hotCue;
    return padModes_[deck - 1];
}

std::array<PadMode, kNumDecks> ControlStateResolver::padModeStates() const
{
    return padModes_;
}

// ═══════════════════════════════════════════════════════════════════
// Tempo
// ═══════════════════════════════════════════════════════════════════

int ControlStateResolver::encoderDirection(int value)
{
    if (value == controllers::encoderRest)
        return 0;
    return value < controllers::encoderRest ? 1 : -1;
}

std::optional<int> ControlStateResolver::stepTempo(int direction)
{
    if (direction == 0)
        return std::nullopt;

    const int last = static_cast<int>(kTempos.size()) - 1;
    int next = std::clamp(tempoIndex_ + (direction > 0 ? 1 : -1), 0, last);
    if (next == tempoIndex_)
    {
        SD_DEBUG("ControlStateResolver: tempo already at %s (%d)",
                 direction > 0 ? "max" : "min", kTempos[static_cast<size_t>(tempoIndex_)]);
        return std::nullopt;
    }

    tempoIndex_ = next;
    int tempo = kTempos[static_cast<size_t>(tempoIndex_)];
    SD_INFO("ControlStateResolver: tempo %d BPM", tempo);
    return tempo;
}

int ControlStateResolver::getTempo() const
{
    return kTempos[static_cast<size_t>(tempoIndex_)];
}

bool ControlStateResolver::setTempo(int bpm)
{
    for (size_t i = 0; i < kTempos.size(); ++i)
    {
        if (kTempos[i] == bpm)
        {
            tempoIndex_ = static_cast<int>(i);
            return true;
        }
    }
    SD_WARN("ControlStateResolver::setTempo: unsupported tempo %d", bpm);
    return false;
}

// ═══════════════════════════════════════════════════════════════════
// Sync indicator / reset
// ═══════════════════════════════════════════════════════════════════

bool ControlStateResolver::toggleSync(int deck)
{
    if (!isValidDeck(deck))
        return false;
    bool& synced = synced_[deck - 1];
    synced = !synced;
    SD_DEBUG("ControlStateResolver: deck %d sync %s", deck, synced ? "on" : "off");
    return synced;
}

bool ControlStateResolver::isSynced(int deck) const
{
    return isValidDeck(deck) && synced_[deck - 1];
}

void ControlStateResolver::reset()
{
    shiftHeld_ = false;
    clearAllLocks();
    for (auto& unit : fxAssigned_)
        unit.fill(false);
    deckAlternate_.fill(false);
    padModes_.fill(PadMode::hotCue);
    synced_.fill(false);
    setTempo(kDefaultTempo);
}

} // namespace spindeck
