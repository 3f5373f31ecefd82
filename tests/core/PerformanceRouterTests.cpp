#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "core/PerformanceRouter.h"

#include <cmath>
#include <vector>

using namespace spindeck;
using Catch::Matchers::WithinAbs;

// --- Recording sinks ---

struct RecordingEventSink : EventSink {
    std::vector<SurfaceEvent> events;

    void emit(const SurfaceEvent& event) override { events.push_back(event); }

    int count(const std::string& type) const
    {
        int n = 0;
        for (const auto& e : events)
            if (e.type == type)
                ++n;
        return n;
    }

    const SurfaceEvent* last(const std::string& type) const
    {
        for (auto it = events.rbegin(); it != events.rend(); ++it)
            if (it->type == type)
                return &*it;
        return nullptr;
    }
};

struct IndicatorWrite {
    int channel;
    int number;
    int intensity;
};

struct RecordingIndicatorSink : IndicatorSink {
    std::vector<IndicatorWrite> writes;

    void setIndicator(int channel, int number, int intensity) override
    {
        writes.push_back({channel, number, intensity});
    }

    /// Last intensity written to (channel, number), or -1.
    int level(int channel, int number) const
    {
        for (auto it = writes.rbegin(); it != writes.rend(); ++it)
            if (it->channel == channel && it->number == number)
                return it->intensity;
        return -1;
    }
};

static constexpr double kSr = 1000.0;
static const std::string kRoot = "music";

static Track makeTrack(int id, const std::string& title, int bpm, int key)
{
    Track t;
    t.id = id;
    t.title = title;
    t.artist = "Artist";
    t.bpm = bpm;
    t.key = key;
    return t;
}

static void addSections(BufferCache& cache, const Track& track)
{
    for (auto section : {Section::lead, Section::body})
    {
        int length = static_cast<int>(std::ceil(sectionDurationSeconds(section, track.bpm) * kSr)) + 1;
        auto buf = Buffer::createEmpty(2, length, kSr, sectionName(section));
        std::fill(buf->getWritePointer(0), buf->getWritePointer(0) + length, 0.5f);
        REQUIRE(cache.add(sectionAssetPath(kRoot, track, section), std::move(buf)));
    }
}

// Resolver, engine, catalog and router wired to recording sinks.
struct Rig {
    BufferCache cache;
    DeckEngine engine{cache, kSr, 100, kRoot};
    TrackCatalog catalog;
    ControlStateResolver resolver;
    RecordingEventSink events;
    RecordingIndicatorSink lights;
    PerformanceRouter router{resolver, engine, catalog, events, lights};

    Track alpha = makeTrack(1, "Alpha", 94, 3);
    Track beta = makeTrack(2, "Beta", 94, 5);
    Track gamma = makeTrack(3, "Gamma", 84, 3);

    Rig()
    {
        std::string error;
        for (const auto& t : {alpha, beta, gamma})
        {
            REQUIRE(catalog.addTrack(t, error));
            addSections(cache, t);
        }
    }

    void press(int channel, int note) { router.handleMessage(ControlMessage::button(channel, note, 127)); }
    void release(int channel, int note) { router.handleMessage(ControlMessage::button(channel, note, 0)); }
    void turn(int channel, int controller, int value) { router.handleMessage(ControlMessage::knob(channel, controller, value)); }
};

// ═══════════════════════════════════════════════════════════════════
// Pad tables
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("Hot cue table maps pads to sections and beats")
{
    auto first = PerformanceRouter::hotCueForPad(0);
    REQUIRE(first);
    CHECK(first->section == Section::lead);
    CHECK(first->beats == 0.0);

    auto fifth = PerformanceRouter::hotCueForPad(4);
    CHECK(fifth->section == Section::body);
    CHECK(fifth->beats == 0.0);

    CHECK(PerformanceRouter::hotCueForPad(7)->beats == 48.0);
    CHECK_FALSE(PerformanceRouter::hotCueForPad(8));
    CHECK_FALSE(PerformanceRouter::hotCueForPad(-1));
}

TEST_CASE("Roll table halves from two beats down")
{
    CHECK(*PerformanceRouter::rollBeatsForPad(0) == 2.0);
    CHECK(*PerformanceRouter::rollBeatsForPad(1) == 1.0);
    CHECK(*PerformanceRouter::rollBeatsForPad(7) == 0.015625);
    CHECK_FALSE(PerformanceRouter::rollBeatsForPad(8));
}

// ═══════════════════════════════════════════════════════════════════
// Renderer state
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("clientConnected sends layout and current state")
{
    Rig rig;
    rig.resolver.toggleLock(channels::fxA, notes::fx2, 127);

    rig.router.clientConnected();

    REQUIRE(rig.events.events.size() == 5);
    CHECK(rig.events.events[0].type == "layout");
    CHECK(rig.events.events[1].type == "deckButtonStates");
    CHECK(rig.events.events[2].type == "padModeStates");
    CHECK(rig.events.events[3].type == "tempoChange");
    CHECK(static_cast<int>(rig.events.events[3].data["tempo"]) == 94);
    CHECK(rig.events.events[4].type == "lock");
    CHECK(static_cast<int>(rig.events.events[4].data["button"]) == notes::fx2);
    CHECK(static_cast<bool>(rig.events.events[4].data["locked"]));
}

TEST_CASE("syncIndicators lights the active modes and dims the pads")
{
    Rig rig;
    rig.router.syncIndicators();

    CHECK(rig.lights.level(channels::deckA, notes::hotCueMode) == kIndicatorOn);
    CHECK(rig.lights.level(channels::deckA, notes::rollMode) == kIndicatorOff);
    CHECK(rig.lights.level(channels::deckB, notes::hotCueMode) == kIndicatorOn);
    CHECK(rig.lights.level(channels::padsDeck1, 3) == kIndicatorPadDim);
    CHECK(rig.lights.level(channels::deckAltA, notes::deckAlternate) == kIndicatorOff);
    CHECK(rig.lights.level(channels::center, notes::fxAssign1Left) == kIndicatorOff);
}

// ═══════════════════════════════════════════════════════════════════
// Buttons with surface state
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("Shifted FX press lights the lock and reports it")
{
    Rig rig;
    rig.press(channels::fxB, 100);

    CHECK(rig.lights.level(channels::fxB, notes::fx2) == kIndicatorOn);
    auto* lock = rig.events.last("lock");
    REQUIRE(lock);
    CHECK(static_cast<int>(lock->data["channel"]) == channels::fxB);
    CHECK(static_cast<int>(lock->data["button"]) == notes::fx2);
    CHECK(static_cast<bool>(lock->data["locked"]));

    rig.press(channels::fxB, 100);
    CHECK(rig.lights.level(channels::fxB, notes::fx2) == kIndicatorOff);
    CHECK_FALSE(static_cast<bool>(rig.events.last("lock")->data["locked"]));
}

TEST_CASE("Locked button stays lit when the plain button is released")
{
    Rig rig;
    rig.press(channels::fxA, 99);
    rig.release(channels::fxA, notes::fx1);
    CHECK(rig.lights.level(channels::fxA, notes::fx1) == kIndicatorOn);

    auto* raw = rig.events.last("event");
    REQUIRE(raw);
    CHECK(raw->data["type"].toString() == "button");
    CHECK_FALSE(static_cast<bool>(raw->data["pressed"]));
}

TEST_CASE("FX assign lights the main or companion note by deck")
{
    Rig rig;
    rig.press(channels::center, notes::fxAssign1Left);
    CHECK(rig.lights.level(channels::center, notes::fxAssign1Left) == kIndicatorOn);
    CHECK(rig.lights.level(channels::center, 90) == kIndicatorOff);

    auto* e = rig.events.last("event");
    REQUIRE(e);
    CHECK(static_cast<bool>(e->data["mainDeckAssigned"]));
    CHECK_FALSE(static_cast<bool>(e->data["altDeckAssigned"]));

    rig.press(channels::deckAltA, notes::deckAlternate);
    rig.press(channels::center, notes::fxAssign1Left);
    CHECK(rig.lights.level(channels::center, 90) == kIndicatorOn);
    CHECK(rig.resolver.isFXAssigned(1, 3));
}

TEST_CASE("Deck alternate press reports deck button states")
{
    Rig rig;
    rig.press(channels::deckAltB, notes::deckAlternate);

    CHECK(rig.lights.level(channels::deckAltB, notes::deckAlternate) == kIndicatorOn);
    auto* states = rig.events.last("deckButtonStates");
    REQUIRE(states);
    CHECK_FALSE(static_cast<bool>(states->data["deck1_3"]));
    CHECK(static_cast<bool>(states->data["deck2_4"]));
}

TEST_CASE("Mode change is radio-lit and reported")
{
    Rig rig;
    rig.press(channels::deckB, notes::slicerMode);

    CHECK(rig.lights.level(channels::deckB, notes::slicerMode) == kIndicatorOn);
    CHECK(rig.lights.level(channels::deckB, notes::hotCueMode) == kIndicatorOff);
    auto* e = rig.events.last("modeChange");
    REQUIRE(e);
    CHECK(static_cast<int>(e->data["deck"]) == 2);
    CHECK(static_cast<int>(e->data["activeMode"]) == notes::slicerMode);

    rig.press(channels::deckB, notes::samplerMode);
    CHECK(rig.lights.level(channels::padsDeck1 + 1, 0) == kIndicatorOff);
}

// ═══════════════════════════════════════════════════════════════════
// Pads
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("Hot cue pad plays the loaded track at the cue")
{
    Rig rig;
    rig.catalog.loadTrack(1, rig.alpha);

    rig.press(channels::padsDeck1, 5);

    auto state = rig.engine.getCurrentPlaybackState(1);
    REQUIRE(state);
    CHECK(state->track == rig.alpha);
    CHECK(state->section == Section::body);
    CHECK_THAT(state->positionSeconds, WithinAbs(16.0 * 60.0 / 94.0, 1e-9));
    CHECK(rig.lights.level(channels::padsDeck1, 5) == kIndicatorOn);

    auto* e = rig.events.last("padPress");
    REQUIRE(e);
    CHECK(static_cast<int>(e->data["deck"]) == 1);
    CHECK(static_cast<int>(e->data["note"]) == 5);
    CHECK(e->data["mode"].toString() == "HOT CUE");
    CHECK_FALSE(static_cast<bool>(e->data["synced"]));

    rig.release(channels::padsDeck1, 5);
    CHECK(rig.lights.level(channels::padsDeck1, 5) == kIndicatorPadDim);
    CHECK(rig.events.count("padRelease") == 1);
    CHECK(rig.engine.isActive(1));
}

TEST_CASE("Pad press on an empty deck is reported but plays nothing")
{
    Rig rig;
    rig.press(channels::padsDeck1 + 1, 0);

    CHECK(rig.events.count("padPress") == 1);
    CHECK_FALSE(rig.engine.isActive(2));
    CHECK(rig.lights.level(channels::padsDeck1 + 1, 0) == -1);
}

TEST_CASE("Roll pad loops while held and resumes on release")
{
    Rig rig;
    rig.catalog.loadTrack(2, rig.beta);
    rig.engine.play(rig.beta, 2, Section::body, 8.0);
    rig.press(channels::deckB, notes::rollMode);

    rig.press(channels::padsDeck1 + 1, 1);
    CHECK(rig.engine.isRolling(2));

    rig.engine.render(300);
    rig.release(channels::padsDeck1 + 1, 1);
    CHECK_FALSE(rig.engine.isRolling(2));
    auto state = rig.engine.getCurrentPlaybackState(2);
    REQUIRE(state);
    CHECK_THAT(state->positionSeconds, WithinAbs(8.0 * 60.0 / 94.0 + 0.3, 1e-9));
}

TEST_CASE("Slicer pad reverses while held")
{
    Rig rig;
    rig.catalog.loadTrack(1, rig.alpha);
    rig.engine.play(rig.alpha, 1, Section::body, 16.0);
    rig.press(channels::deckA, notes::slicerMode);

    rig.press(channels::padsDeck1, 2);
    CHECK(rig.engine.isReversing(1));

    rig.release(channels::padsDeck1, 2);
    CHECK_FALSE(rig.engine.isReversing(1));
    CHECK(rig.engine.isActive(1));
}

TEST_CASE("Roll pad release stops the deck it started on after a deck switch")
{
    Rig rig;
    rig.catalog.loadTrack(1, rig.alpha);
    rig.engine.play(rig.alpha, 1, Section::body, 8.0);
    rig.press(channels::deckA, notes::rollMode);

    rig.press(channels::padsDeck1, 1);
    REQUIRE(rig.engine.isRolling(1));

    rig.press(channels::deckAltA, notes::deckAlternate);
    REQUIRE(rig.resolver.resolveActiveDeck(Side::a) == 3);

    rig.release(channels::padsDeck1, 1);
    CHECK_FALSE(rig.engine.isRolling(1));
    CHECK(rig.engine.getCurrentPlaybackState(1));

    auto* e = rig.events.last("padRelease");
    REQUIRE(e);
    CHECK(static_cast<int>(e->data["deck"]) == 1);
    CHECK(e->data["mode"].toString() == "ROLL");
    CHECK(rig.lights.level(channels::padsDeck1, 1) == kIndicatorPadDim);
}

TEST_CASE("Slicer pad release resumes even if the mode changed while held")
{
    Rig rig;
    rig.catalog.loadTrack(1, rig.alpha);
    rig.engine.play(rig.alpha, 1, Section::body, 16.0);
    rig.press(channels::deckA, notes::slicerMode);

    rig.press(channels::padsDeck1, 0);
    REQUIRE(rig.engine.isReversing(1));

    rig.press(channels::deckA, notes::hotCueMode);
    rig.release(channels::padsDeck1, 0);
    CHECK_FALSE(rig.engine.isReversing(1));
    CHECK(rig.engine.isActive(1));
}

TEST_CASE("Sampler pad only reports the press")
{
    Rig rig;
    rig.catalog.loadTrack(1, rig.alpha);
    rig.press(channels::deckA, notes::samplerMode);

    rig.press(channels::padsDeck1, 0);
    CHECK_FALSE(rig.engine.isActive(1));
    CHECK(rig.events.last("padPress")->data["mode"].toString() == "SAMPLER");

    rig.release(channels::padsDeck1, 0);
    CHECK(rig.lights.level(channels::padsDeck1, 0) == kIndicatorOff);
}

// ═══════════════════════════════════════════════════════════════════
// Transport
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("SYNC restarts every other loaded deck at a matching tempo")
{
    Rig rig;
    rig.catalog.loadTrack(1, rig.alpha);
    rig.catalog.loadTrack(2, rig.beta);
    rig.catalog.loadTrack(3, rig.gamma);
    rig.engine.play(rig.alpha, 1, Section::body, 4.0);
    rig.engine.render(200);

    rig.press(channels::deckA, notes::sync);

    CHECK(rig.lights.level(channels::deckA, notes::sync) == kIndicatorOn);
    auto* e = rig.events.last("syncChange");
    REQUIRE(e);
    CHECK(static_cast<int>(e->data["deck"]) == 1);
    CHECK(static_cast<bool>(e->data["synced"]));

    auto src = rig.engine.getCurrentPlaybackState(1);
    auto dst = rig.engine.getCurrentPlaybackState(2);
    REQUIRE(dst);
    CHECK(dst->track == rig.beta);
    CHECK_THAT(dst->positionSeconds, WithinAbs(src->positionSeconds, 1e-9));
    CHECK_FALSE(rig.engine.isActive(3));
    CHECK_FALSE(rig.engine.isActive(4));
}

TEST_CASE("syncFrom an idle deck does nothing")
{
    Rig rig;
    rig.catalog.loadTrack(2, rig.beta);
    CHECK(rig.router.syncFrom(1) == 0);
    CHECK_FALSE(rig.engine.isActive(2));
}

TEST_CASE("syncFrom counts the decks it restarted")
{
    Rig rig;
    auto delta = makeTrack(4, "Delta", 94, 8);
    addSections(rig.cache, delta);
    rig.catalog.loadTrack(2, rig.alpha);
    rig.catalog.loadTrack(3, rig.beta);
    rig.catalog.loadTrack(4, delta);
    rig.engine.play(rig.alpha, 2, Section::lead, 2.0);

    CHECK(rig.router.syncFrom(2) == 2);
    CHECK(rig.engine.isActive(3));
    CHECK(rig.engine.isActive(4));
}

TEST_CASE("SHIFT+SYNC spins the deck down")
{
    Rig rig;
    rig.engine.play(rig.alpha, 1, Section::body);
    rig.press(channels::center, notes::shift);
    rig.press(channels::deckA, notes::sync);

    auto* e = rig.events.last("spindown");
    REQUIRE(e);
    CHECK(static_cast<int>(e->data["deck"]) == 1);
    CHECK(rig.events.count("syncChange") == 0);

    rig.engine.render(1000);
    CHECK_FALSE(rig.engine.isActive(1));
}

TEST_CASE("SLIP fades the deck out")
{
    Rig rig;
    rig.engine.play(rig.alpha, 1, Section::body);
    rig.press(channels::deckA, notes::slip);
    CHECK(rig.lights.level(channels::deckA, notes::slip) == 127);

    rig.engine.render(300);
    CHECK_FALSE(rig.engine.isActive(1));
}

// ═══════════════════════════════════════════════════════════════════
// Catalog controls
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("LOAD puts the browsed track on the side's deck")
{
    Rig rig;
    rig.turn(channels::center, controllers::browse, 63);
    auto selected = rig.catalog.selectedTrack();
    REQUIRE(selected);

    rig.press(channels::center, notes::loadB);
    auto loaded = rig.catalog.getLoadedTrack(2);
    REQUIRE(loaded);
    CHECK(*loaded == *selected);
    CHECK_FALSE(rig.catalog.getReferenceKey());
    CHECK(rig.events.last("event")->data["button"].equals(juce::var(notes::loadB)));
}

TEST_CASE("LOAD on deck 1 sets the reference key")
{
    Rig rig;
    rig.press(channels::center, notes::loadA);
    auto loaded = rig.catalog.getLoadedTrack(1);
    REQUIRE(loaded);
    REQUIRE(rig.catalog.getReferenceKey());
    CHECK(*rig.catalog.getReferenceKey() == loaded->key);
}

TEST_CASE("LOAD with nothing at the current tempo leaves the deck empty")
{
    Rig rig;
    rig.turn(channels::fxA, controllers::beats, 63);
    REQUIRE(rig.catalog.getTempo() == 102);
    rig.press(channels::center, notes::loadA);
    CHECK_FALSE(rig.catalog.getLoadedTrack(1));
}

TEST_CASE("BEATS encoder changes the catalog tempo and reports it")
{
    Rig rig;
    rig.turn(channels::fxB, controllers::beats, 65);

    CHECK(rig.catalog.getTempo() == 84);
    auto* e = rig.events.last("tempoChange");
    REQUIRE(e);
    CHECK(static_cast<int>(e->data["tempo"]) == 84);

    auto* raw = rig.events.last("event");
    REQUIRE(raw);
    CHECK(raw->data["type"].toString() == "knob");
    CHECK(static_cast<int>(raw->data["value"]) == 65);

    rig.turn(channels::fxB, controllers::beats, 65);
    CHECK(rig.events.count("tempoChange") == 1);
}

TEST_CASE("Master volume knob sets the engine master gain")
{
    Rig rig;
    rig.turn(channels::center, controllers::masterVolume, 0);
    CHECK(rig.engine.getMasterVolume() == 0.0f);
    rig.turn(channels::center, controllers::masterVolume, 127);
    CHECK(rig.engine.getMasterVolume() == 1.0f);
}

// ═══════════════════════════════════════════════════════════════════
// Mailbox / reset
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("processPending routes queued messages in order")
{
    Rig rig;
    ControlMailbox mailbox;
    mailbox.post(ControlMessage::knob(channels::fxA, controllers::beats, 63));
    mailbox.post(ControlMessage::knob(channels::fxA, controllers::beats, 65));
    mailbox.post(ControlMessage::knob(channels::fxA, controllers::beats, 65));

    CHECK(rig.router.processPending(mailbox) == 3);
    CHECK(mailbox.pending() == 0);
    CHECK(rig.resolver.getTempo() == 84);
    CHECK(rig.events.count("tempoChange") == 3);
}

TEST_CASE("resetSurface clears locks and restores power-on state")
{
    Rig rig;
    rig.press(channels::fxA, 101);
    rig.press(channels::deckA, notes::rollMode);
    rig.turn(channels::fxA, controllers::beats, 65);
    rig.events.events.clear();

    rig.router.resetSurface();

    CHECK(rig.lights.level(channels::fxA, notes::fx3) == kIndicatorOff);
    CHECK(rig.lights.level(channels::deckA, notes::hotCueMode) == kIndicatorOn);
    CHECK(rig.resolver.lockedButtons().empty());
    CHECK(rig.resolver.getPadMode(1) == PadMode::hotCue);
    CHECK(rig.catalog.getTempo() == kDefaultTempo);
    CHECK(rig.events.count("padModeStates") == 1);
    CHECK(static_cast<int>(rig.events.last("tempoChange")->data["tempo"]) == kDefaultTempo);
}
