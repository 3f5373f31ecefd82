#pragma once

#include "core/ControlMailbox.h"
#include "core/SurfaceEvents.h"

#include <juce_audio_devices/juce_audio_devices.h>

#include <memory>
#include <string>
#include <vector>

namespace spindeck {

/// Hardware control surface. Wraps a JUCE MidiInput/MidiOutput pair, posts
/// decoded messages into the mailbox and drives the surface's lights.
class ControlSurface : public juce::MidiInputCallback, public IndicatorSink {
public:
    explicit ControlSurface(ControlMailbox& mailbox);
    ~ControlSurface() override;

    ControlSurface(const ControlSurface&) = delete;
    ControlSurface& operator=(const ControlSurface&) = delete;

    // --- Control thread ---
    static std::vector<std::string> getAvailableDevices();

    /// Opens the first input whose name contains `nameMatch`, and the output
    /// of the same name when there is one.
    bool open(const std::string& nameMatch, std::string& error);
    void close();
    bool isOpen() const;
    bool hasOutput() const;
    const std::string& getDeviceName() const;

    void setIndicator(int channel, int number, int intensity) override;

    /// Note-on, note-off (or note-on at velocity 0) and controller changes.
    /// Everything else is rejected.
    static bool decode(const juce::MidiMessage& message, ControlMessage& out);

    // --- JUCE MidiInputCallback (MIDI thread) ---
    void handleIncomingMidiMessage(juce::MidiInput* source,
                                   const juce::MidiMessage& message) override;

private:
    ControlMailbox& mailbox_;
    std::unique_ptr<juce::MidiInput> input_;
    std::unique_ptr<juce::MidiOutput> output_;
    std::string deviceName_;
};

} // namespace spindeck
