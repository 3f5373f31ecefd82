#pragma once

#include "core/ChannelMap.h"
#include "core/Types.h"

#include <juce_core/juce_core.h>

#include <array>
#include <cstdio>
#include <string>

namespace spindeck {

/// Outbound record for the renderer: `{"type": <type>, "data": <data>}`.
struct SurfaceEvent {
    std::string type;
    juce::var data;

    std::string toJson() const;
};

/// Receives outbound events in emission order.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void emit(const SurfaceEvent& event) = 0;
};

/// Feedback lights on the physical surface.
class IndicatorSink {
public:
    virtual ~IndicatorSink() = default;
    virtual void setIndicator(int channel, int number, int intensity) = 0;
};

/// Writes one JSON line per event to a stream (stdout in the application).
class JsonLineEventSink : public EventSink {
public:
    explicit JsonLineEventSink(std::FILE* stream);
    void emit(const SurfaceEvent& event) override;

private:
    std::FILE* stream_;
};

namespace events {

SurfaceEvent layout();
SurfaceEvent button(int channel, int note, bool pressed);
SurfaceEvent fxAssignButton(int channel, int note, bool mainDeckAssigned, bool altDeckAssigned);
SurfaceEvent knob(int channel, int controller, int value);
SurfaceEvent lock(int channel, int note, bool locked);
SurfaceEvent tempoChange(int tempo);
SurfaceEvent deckButtonStates(const std::array<bool, 2>& alternates);
SurfaceEvent padModeStates(const std::array<PadMode, kNumDecks>& modes);
SurfaceEvent modeChange(int deck, int channel, PadMode mode);
SurfaceEvent padPress(int channel, int pad, int deck, PadMode mode, bool synced);
SurfaceEvent padRelease(int channel, int pad, int deck, PadMode mode);
SurfaceEvent spindown(int deck);
SurfaceEvent syncChange(int deck, bool synced);

} // namespace events

} // namespace spindeck
