#include "core/SurfaceEvents.h"
#include "core/Logger.h"

namespace spindeck {

namespace {

juce::var object(std::initializer_list<std::pair<const char*, juce::var>> properties)
{
    juce::DynamicObject::Ptr obj = new juce::DynamicObject();
    for (const auto& p : properties)
        obj->setProperty(juce::Identifier(p.first), p.second);
    return juce::var(obj.get());
}

SurfaceEvent make(const char* type, juce::var data)
{
    return SurfaceEvent{type, std::move(data)};
}

void addControl(juce::Array<juce::var>& controls, const char* type, int channel, int number,
                const char* label, const char* section)
{
    juce::String id = juce::String(type) + "-" + juce::String(number) + "-ch" + juce::String(channel);
    controls.add(object({{"id", id},
                         {"type", type},
                         {"channel", channel},
                         {"number", number},
                         {"label", label},
                         {"section", section}}));
}

} // namespace

std::string SurfaceEvent::toJson() const
{
    auto envelope = object({{"type", juce::String(type)}, {"data", data}});
    return juce::JSON::toString(envelope, true).toStdString();
}

JsonLineEventSink::JsonLineEventSink(std::FILE* stream)
    : stream_(stream)
{
}

void JsonLineEventSink::emit(const SurfaceEvent& event)
{
    auto line = event.toJson();
    std::fprintf(stream_, "%s\n", line.c_str());
    std::fflush(stream_);
}

namespace events {

SurfaceEvent layout()
{
    juce::Array<juce::var> controls;

    for (Side side : {Side::a, Side::b})
    {
        const char* deckSection = side == Side::a ? "deck-a" : "deck-b";
        const char* buttonSection = side == Side::a ? "deck-a-buttons" : "deck-b-buttons";
        const char* topSection = side == Side::a ? "deck-a-top" : "deck-b-top";
        int padChannel = padChannelForSide(side);
        int controlChannel = controlChannelForSide(side);
        int fxChannel = side == Side::a ? channels::fxA : channels::fxB;

        for (int pad = 0; pad < notes::numPads; ++pad)
            addControl(controls, "button", padChannel, pad, "", deckSection);

        for (PadMode mode : {PadMode::hotCue, PadMode::roll, PadMode::slicer, PadMode::sampler})
            addControl(controls, "button", controlChannel, padModeNote(mode), padModeName(mode), buttonSection);
        addControl(controls, "button", controlChannel, notes::sync, "SYNC", buttonSection);
        addControl(controls, "button", controlChannel, notes::slip, "SLIP", buttonSection);

        addControl(controls, "button", fxChannel, notes::fx1, "FX1", topSection);
        addControl(controls, "button", fxChannel, notes::fx2, "FX2", topSection);
        addControl(controls, "button", fxChannel, notes::fx3, "FX3", topSection);
        addControl(controls, "button", fxChannel, notes::fxAssign, "FX ASSIGN", topSection);
        addControl(controls, "button", fxChannel, notes::tap, "TAP", topSection);
        addControl(controls, "knob", fxChannel, controllers::beats, "BEATS", topSection);
    }

    addControl(controls, "button", channels::deckAltA, notes::deckAlternate, "DECK 1/3", "center-row-2");
    addControl(controls, "button", channels::deckAltB, notes::deckAlternate, "DECK 2/4", "center-row-2");
    addControl(controls, "button", channels::center, notes::fxAssign1Left, "FX1 1", "center-row-4");
    addControl(controls, "button", channels::center, notes::fxAssign1Right, "FX1 2", "center-row-4");
    addControl(controls, "button", channels::center, notes::fxAssign2Left, "FX2 1", "center-row-4");
    addControl(controls, "button", channels::center, notes::fxAssign2Right, "FX2 2", "center-row-4");
    addControl(controls, "knob", channels::center, controllers::browse, "BROWSE", "center-browser");
    addControl(controls, "button", channels::center, notes::loadA, "LOAD A", "center-load");
    addControl(controls, "button", channels::center, notes::loadB, "LOAD B", "center-load");
    addControl(controls, "button", channels::center, notes::shift, "SHIFT", "center-shift");
    addControl(controls, "slider", channels::center, controllers::masterVolume, "VOLUME", "center-volume");

    return make("layout", juce::var(controls));
}

SurfaceEvent button(int channel, int note, bool pressed)
{
    return make("event", object({{"type", "button"},
                                 {"button", note},
                                 {"pressed", pressed},
                                 {"channel", channel}}));
}

SurfaceEvent fxAssignButton(int channel, int note, bool mainDeckAssigned, bool altDeckAssigned)
{
    return make("event", object({{"type", "button"},
                                 {"button", note},
                                 {"pressed", mainDeckAssigned || altDeckAssigned},
                                 {"channel", channel},
                                 {"mainDeckAssigned", mainDeckAssigned},
                                 {"altDeckAssigned", altDeckAssigned}}));
}

SurfaceEvent knob(int channel, int controller, int value)
{
    return make("event", object({{"type", "knob"},
                                 {"knob", controller},
                                 {"value", value},
                                 {"channel", channel}}));
}

SurfaceEvent lock(int channel, int note, bool locked)
{
    return make("lock", object({{"button", note}, {"channel", channel}, {"locked", locked}}));
}

SurfaceEvent tempoChange(int tempo)
{
    return make("tempoChange", object({{"tempo", tempo}}));
}

SurfaceEvent deckButtonStates(const std::array<bool, 2>& alternates)
{
    return make("deckButtonStates", object({{"deck1_3", alternates[0]}, {"deck2_4", alternates[1]}}));
}

SurfaceEvent padModeStates(const std::array<PadMode, kNumDecks>& modes)
{
    return make("padModeStates", object({{"deck1", padModeNote(modes[0])},
                                         {"deck2", padModeNote(modes[1])},
                                         {"deck3", padModeNote(modes[2])},
                                         {"deck4", padModeNote(modes[3])}}));
}

SurfaceEvent modeChange(int deck, int channel, PadMode mode)
{
    return make("modeChange", object({{"deck", deck},
                                      {"channel", channel},
                                      {"activeMode", padModeNote(mode)},
                                      {"modeName", padModeName(mode)}}));
}

SurfaceEvent padPress(int channel, int pad, int deck, PadMode mode, bool synced)
{
    return make("padPress", object({{"channel", channel},
                                    {"note", pad},
                                    {"deck", deck},
                                    {"mode", padModeName(mode)},
                                    {"synced", synced}}));
}

SurfaceEvent padRelease(int channel, int pad, int deck, PadMode mode)
{
    return make("padRelease", object({{"channel", channel},
                                      {"note", pad},
                                      {"deck", deck},
                                      {"mode", padModeName(mode)}}));
}

SurfaceEvent spindown(int deck)
{
    return make("spindown", object({{"deck", deck}}));
}

SurfaceEvent syncChange(int deck, bool synced)
{
    return make("syncChange", object({{"deck", deck}, {"synced", synced}}));
}

} // namespace events

} // namespace spindeck
