#pragma once

#include "core/ControlMailbox.h"
#include "core/ControlStateResolver.h"
#include "core/DeckEngine.h"
#include "core/SurfaceEvents.h"
#include "core/TrackCatalog.h"

#include <array>
#include <optional>

namespace spindeck {

struct HotCue {
    Section section;
    double beats;
};

/// Turns resolved control actions into deck transport, catalog changes,
/// surface lights and outbound events. Runs on the control timeline only.
class PerformanceRouter {
public:
    static constexpr std::array<HotCue, notes::numPads> kHotCues = {{
        {Section::lead, 0.0},
        {Section::body, 0.5},
        {Section::body, 0.75},
        {Section::body, 1.0},
        {Section::body, 0.0},
        {Section::body, 16.0},
        {Section::body, 32.0},
        {Section::body, 48.0},
    }};

    static constexpr std::array<double, notes::numPads> kRollBeats = {
        2.0, 1.0, 0.5, 0.25, 0.125, 0.0625, 0.03125, 0.015625
    };

    PerformanceRouter(ControlStateResolver& resolver, DeckEngine& engine, TrackCatalog& catalog,
                      EventSink& events, IndicatorSink& indicators);

    PerformanceRouter(const PerformanceRouter&) = delete;
    PerformanceRouter& operator=(const PerformanceRouter&) = delete;

    /// Routes every queued message in arrival order. Returns the number routed.
    int processPending(ControlMailbox& mailbox);
    void handleMessage(const ControlMessage& message);

    /// Restarts every other loaded deck at `deck`'s beat position.
    /// Returns the number of decks synced.
    int syncFrom(int deck);

    /// Initial state for a newly attached renderer.
    void clientConnected();

    /// Pushes the whole resolver state to the surface lights.
    void syncIndicators();

    /// Reconnect: clears the resolver and the lights that mirrored it.
    void resetSurface();

    static std::optional<HotCue> hotCueForPad(int pad);
    static std::optional<double> rollBeatsForPad(int pad);

private:
    void onButtonEcho(const ControlAction& action);
    void onLockToggled(const ControlAction& action);
    void onFxAssignToggled(const ControlAction& action);
    void onDeckAlternateToggled(const ControlAction& action);
    void onModeChanged(const ControlAction& action);
    void onPadPressed(const ControlAction& action);
    void onPadReleased(const ControlAction& action);
    void onSync(const ControlAction& action);
    void onSpindown(const ControlAction& action);
    void onSlip(const ControlAction& action);
    void onLoad(const ControlAction& action);
    void onTempoChanged(const ControlAction& action);

    void emitRaw(const ControlMessage& message);
    void refreshModeIndicators(Side side);
    void refreshPadIndicators(Side side);
    void refreshFxAssignIndicators(int assignNote);
    static int padRestLevel(PadMode mode);

    // Deck and mode a held pad started under, so its release ends the same action.
    struct HeldPad {
        int deck;
        PadMode mode;
    };
    std::optional<HeldPad>& heldPad(int channel, int pad);

    ControlStateResolver& resolver_;
    DeckEngine& engine_;
    TrackCatalog& catalog_;
    EventSink& events_;
    IndicatorSink& indicators_;

    std::array<std::array<std::optional<HeldPad>, notes::numPads>,
               channels::padsDeck4 - channels::padsDeck1 + 1> heldPads_;
};

} // namespace spindeck
