#include "core/PerformanceRouter.h"
#include "core/Logger.h"

namespace spindeck {

namespace {

constexpr PadMode kAllModes[] = {PadMode::hotCue, PadMode::roll, PadMode::slicer, PadMode::sampler};
constexpr int kFxAssignNotes[] = {notes::fxAssign1Left, notes::fxAssign1Right,
                                  notes::fxAssign2Left, notes::fxAssign2Right};

Side sideOfDeck(int deck)
{
    return (deck == 1 || deck == 3) ? Side::a : Side::b;
}

} // namespace

PerformanceRouter::PerformanceRouter(ControlStateResolver& resolver, DeckEngine& engine,
                                     TrackCatalog& catalog, EventSink& events,
                                     IndicatorSink& indicators)
    : resolver_(resolver), engine_(engine), catalog_(catalog),
      events_(events), indicators_(indicators)
{
    catalog_.setTempo(resolver_.getTempo());
}

std::optional<HotCue> PerformanceRouter::hotCueForPad(int pad)
{
    if (pad < 0 || pad >= notes::numPads)
        return std::nullopt;
    return kHotCues[static_cast<size_t>(pad)];
}

std::optional<double> PerformanceRouter::rollBeatsForPad(int pad)
{
    if (pad < 0 || pad >= notes::numPads)
        return std::nullopt;
    return kRollBeats[static_cast<size_t>(pad)];
}

// ═══════════════════════════════════════════════════════════════════
// Dispatch
// ═══════════════════════════════════════════════════════════════════

int PerformanceRouter::processPending(ControlMailbox& mailbox)
{
    return mailbox.drain([this](const ControlMessage& message) { handleMessage(message); });
}

void PerformanceRouter::handleMessage(const ControlMessage& message)
{
    using K = ControlAction::Kind;
    const ControlAction action = resolver_.resolve(message);

    switch (action.kind) {
        case K::ignored:
            if (message.type == ControlMessage::Type::button)
                emitRaw(action.message);
            break;
        case K::passthrough:
        case K::shift:
            onButtonEcho(action);
            break;
        case K::lockToggled:          onLockToggled(action); break;
        case K::fxAssignToggled:      onFxAssignToggled(action); break;
        case K::deckAlternateToggled: onDeckAlternateToggled(action); break;
        case K::modeChanged:          onModeChanged(action); break;
        case K::padPressed:           onPadPressed(action); break;
        case K::padReleased:          onPadReleased(action); break;
        case K::sync:                 onSync(action); break;
        case K::spindown:             onSpindown(action); break;
        case K::slip:                 onSlip(action); break;
        case K::load:                 onLoad(action); break;
        case K::tempoChanged:         onTempoChanged(action); break;
        case K::browse:
            catalog_.browse(action.direction);
            emitRaw(action.message);
            break;
        case K::masterVolume:
            engine_.setMasterVolume(static_cast<float>(action.message.value) / 127.0f);
            emitRaw(action.message);
            break;
    }
}

void PerformanceRouter::emitRaw(const ControlMessage& message)
{
    if (message.type == ControlMessage::Type::knob)
        events_.emit(events::knob(message.channel, message.number, message.value));
    else
        events_.emit(events::button(message.channel, message.number, message.isPress()));
}

void PerformanceRouter::onButtonEcho(const ControlAction& action)
{
    const auto& m = action.message;
    if (m.type == ControlMessage::Type::button)
        indicators_.setIndicator(m.channel, m.number, resolver_.indicatorLevel(m.channel, m.number, m.value));
    emitRaw(m);
}

// ═══════════════════════════════════════════════════════════════════
// Surface state
// ═══════════════════════════════════════════════════════════════════

void PerformanceRouter::onLockToggled(const ControlAction& action)
{
    const auto& m = action.message;
    indicators_.setIndicator(m.channel, m.number, action.on ? kIndicatorOn : kIndicatorOff);
    events_.emit(events::lock(m.channel, m.number, action.on));
    emitRaw(m);
}

void PerformanceRouter::onFxAssignToggled(const ControlAction& action)
{
    refreshFxAssignIndicators(action.message.number);

    int baseDeck = action.side == Side::a ? 1 : 2;
    events_.emit(events::fxAssignButton(action.message.channel, action.message.number,
                                        resolver_.isFXAssigned(action.fxUnit, baseDeck),
                                        resolver_.isFXAssigned(action.fxUnit, baseDeck + 2)));
}

void PerformanceRouter::refreshFxAssignIndicators(int assignNote)
{
    int fxUnit = 0;
    int deck = 0;
    if (!resolver_.resolveFXAssignButton(assignNote, fxUnit, deck))
        return;
    int baseDeck = sideOfDeck(deck) == Side::a ? 1 : 2;
    indicators_.setIndicator(channels::center, assignNote,
                             resolver_.isFXAssigned(fxUnit, baseDeck) ? kIndicatorOn : kIndicatorOff);
    indicators_.setIndicator(channels::center, fxAssignAltIndicatorNote(assignNote),
                             resolver_.isFXAssigned(fxUnit, baseDeck + 2) ? kIndicatorOn : kIndicatorOff);
}

void PerformanceRouter::onDeckAlternateToggled(const ControlAction& action)
{
    const auto& m = action.message;
    indicators_.setIndicator(m.channel, m.number, action.on ? kIndicatorOn : kIndicatorOff);
    refreshModeIndicators(action.side);
    refreshPadIndicators(action.side);

    events_.emit(events::button(m.channel, m.number, action.on));
    events_.emit(events::deckButtonStates(resolver_.deckAlternateStates()));
    SD_INFO("PerformanceRouter: side %s -> deck %d", sideName(action.side), action.deck);
}

void PerformanceRouter::onModeChanged(const ControlAction& action)
{
    refreshModeIndicators(action.side);
    refreshPadIndicators(action.side);
    events_.emit(events::modeChange(action.deck, controlChannelForSide(action.side), action.mode));
}

void PerformanceRouter::refreshModeIndicators(Side side)
{
    int channel = controlChannelForSide(side);
    PadMode active = resolver_.getPadMode(resolver_.resolveActiveDeck(side));
    for (PadMode mode : kAllModes)
        indicators_.setIndicator(channel, padModeNote(mode), mode == active ? kIndicatorOn : kIndicatorOff);
}

void PerformanceRouter::refreshPadIndicators(Side side)
{
    int channel = padChannelForSide(side);
    int level = padRestLevel(resolver_.getPadMode(resolver_.resolveActiveDeck(side)));
    for (int pad = 0; pad < notes::numPads; ++pad)
        indicators_.setIndicator(channel, pad, level);
}

int PerformanceRouter::padRestLevel(PadMode mode)
{
    return mode == PadMode::sampler ? kIndicatorOff : kIndicatorPadDim;
}

std::optional<PerformanceRouter::HeldPad>& PerformanceRouter::heldPad(int channel, int pad)
{
    return heldPads_[static_cast<size_t>(channel - channels::padsDeck1)][static_cast<size_t>(pad)];
}

// ═══════════════════════════════════════════════════════════════════
// Pads
// ═══════════════════════════════════════════════════════════════════

void PerformanceRouter::onPadPressed(const ControlAction& action)
{
    const int deck = action.deck;
    const auto& m = action.message;
    heldPad(m.channel, action.pad) = HeldPad{deck, action.mode};
    events_.emit(events::padPress(m.channel, action.pad, deck, action.mode, resolver_.isSynced(deck)));

    if (action.mode == PadMode::sampler)
    {
        SD_INFO("PerformanceRouter: sampler pad %d on deck %d has no sample", action.pad + 1, deck);
        return;
    }

    auto track = catalog_.getLoadedTrack(deck);
    if (!track)
    {
        SD_INFO("PerformanceRouter: no track loaded on deck %d", deck);
        return;
    }

    indicators_.setIndicator(m.channel, m.number, kIndicatorOn);

    switch (action.mode) {
        case PadMode::hotCue: {
            auto cue = *hotCueForPad(action.pad);
            engine_.play(*track, deck, cue.section, cue.beats);
            break;
        }
        case PadMode::roll:
            engine_.startRoll(deck, *rollBeatsForPad(action.pad), track);
            break;
        case PadMode::slicer:
            engine_.startReverse(deck, track);
            break;
        case PadMode::sampler:
            break;
    }
}

void PerformanceRouter::onPadReleased(const ControlAction& action)
{
    const auto& m = action.message;
    auto& held = heldPad(m.channel, action.pad);
    const int deck = held ? held->deck : action.deck;
    const PadMode mode = held ? held->mode : action.mode;
    held.reset();

    switch (mode) {
        case PadMode::roll:
            if (engine_.isRolling(deck))
                engine_.stopRoll(deck);
            break;
        case PadMode::slicer:
            if (engine_.isReversing(deck))
                engine_.stopReverse(deck);
            break;
        case PadMode::hotCue:
        case PadMode::sampler:
            break;
    }

    indicators_.setIndicator(m.channel, m.number, padRestLevel(mode));
    events_.emit(events::padRelease(m.channel, action.pad, deck, mode));
}

// ═══════════════════════════════════════════════════════════════════
// Transport buttons
// ═══════════════════════════════════════════════════════════════════

void PerformanceRouter::onSync(const ControlAction& action)
{
    const auto& m = action.message;
    indicators_.setIndicator(m.channel, m.number, action.on ? kIndicatorOn : kIndicatorOff);
    events_.emit(events::syncChange(action.deck, action.on));
    syncFrom(action.deck);
}

int PerformanceRouter::syncFrom(int deck)
{
    if (!engine_.getCurrentPlaybackState(deck))
    {
        SD_INFO("PerformanceRouter: sync from deck %d skipped, deck is not playing", deck);
        return 0;
    }

    int synced = 0;
    for (int target = 1; target <= kNumDecks; ++target)
    {
        if (target == deck)
            continue;
        auto track = catalog_.getLoadedTrack(target);
        if (!track)
        {
            SD_INFO("PerformanceRouter: sync skips deck %d, no track loaded", target);
            continue;
        }
        if (engine_.syncTo(deck, target, *track))
            ++synced;
        else
            SD_INFO("PerformanceRouter: sync skips deck %d", target);
    }
    SD_INFO("PerformanceRouter: synced %d deck(s) to deck %d", synced, deck);
    return synced;
}

void PerformanceRouter::onSpindown(const ControlAction& action)
{
    engine_.spindown(action.deck);
    events_.emit(events::spindown(action.deck));
}

void PerformanceRouter::onSlip(const ControlAction& action)
{
    engine_.fadeOut(action.deck, kFadeOutSeconds);
    onButtonEcho(action);
}

void PerformanceRouter::onLoad(const ControlAction& action)
{
    emitRaw(action.message);

    auto track = catalog_.selectedTrack();
    if (!track)
    {
        SD_INFO("PerformanceRouter: nothing selected to load on deck %d", action.deck);
        return;
    }
    if (!catalog_.loadTrack(action.deck, *track))
        return;

    engine_.preload(*track);
    if (action.deck == 1)
        catalog_.setReferenceKey(track->key);
}

void PerformanceRouter::onTempoChanged(const ControlAction& action)
{
    catalog_.setTempo(action.tempo);
    events_.emit(events::tempoChange(action.tempo));
    emitRaw(action.message);
}

// ═══════════════════════════════════════════════════════════════════
// Renderer / reconnect
// ═══════════════════════════════════════════════════════════════════

void PerformanceRouter::clientConnected()
{
    events_.emit(events::layout());
    events_.emit(events::deckButtonStates(resolver_.deckAlternateStates()));
    events_.emit(events::padModeStates(resolver_.padModeStates()));
    events_.emit(events::tempoChange(resolver_.getTempo()));
    for (const auto& [channel, note] : resolver_.lockedButtons())
        events_.emit(events::lock(channel, note, true));
}

void PerformanceRouter::syncIndicators()
{
    for (Side side : {Side::a, Side::b})
    {
        refreshModeIndicators(side);
        refreshPadIndicators(side);
        int altChannel = side == Side::a ? channels::deckAltA : channels::deckAltB;
        indicators_.setIndicator(altChannel, notes::deckAlternate,
                                 resolver_.isDeckAlternateOn(side) ? kIndicatorOn : kIndicatorOff);
        int deck = resolver_.resolveActiveDeck(side);
        indicators_.setIndicator(controlChannelForSide(side), notes::sync,
                                 resolver_.isSynced(deck) ? kIndicatorOn : kIndicatorOff);
    }
    for (int note : kFxAssignNotes)
        refreshFxAssignIndicators(note);
    for (const auto& [channel, note] : resolver_.lockedButtons())
        indicators_.setIndicator(channel, note, kIndicatorOn);
}

void PerformanceRouter::resetSurface()
{
    for (const auto& [channel, note] : resolver_.lockedButtons())
        indicators_.setIndicator(channel, note, kIndicatorOff);

    resolver_.reset();
    catalog_.setTempo(resolver_.getTempo());
    syncIndicators();

    events_.emit(events::deckButtonStates(resolver_.deckAlternateStates()));
    events_.emit(events::padModeStates(resolver_.padModeStates()));
    events_.emit(events::tempoChange(resolver_.getTempo()));
    SD_INFO("PerformanceRouter: surface reset");
}

} // namespace spindeck
