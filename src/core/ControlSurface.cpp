#include "core/ControlSurface.h"
#include "core/Logger.h"

#include <algorithm>

namespace spindeck {

ControlSurface::ControlSurface(ControlMailbox& mailbox)
    : mailbox_(mailbox)
{
    SD_INFO("ControlSurface: created");
}

ControlSurface::~ControlSurface()
{
    close();
    SD_INFO("ControlSurface: destroyed");
}

// ═══════════════════════════════════════════════════════════════════
// Control thread
// ═══════════════════════════════════════════════════════════════════

std::vector<std::string> ControlSurface::getAvailableDevices()
{
    auto devices = juce::MidiInput::getAvailableDevices();
    std::vector<std::string> names;
    names.reserve(static_cast<size_t>(devices.size()));
    for (const auto& d : devices)
        names.push_back(d.name.toStdString());
    SD_DEBUG("ControlSurface::getAvailableDevices: %d devices",
             static_cast<int>(names.size()));
    return names;
}

bool ControlSurface::open(const std::string& nameMatch, std::string& error)
{
    SD_DEBUG("ControlSurface::open: %s", nameMatch.c_str());
    close();

    const juce::String match(nameMatch);
    juce::MidiDeviceInfo inputInfo;
    bool found = false;
    for (const auto& d : juce::MidiInput::getAvailableDevices())
    {
        if (d.name.containsIgnoreCase(match))
        {
            inputInfo = d;
            found = true;
            break;
        }
    }

    if (!found)
    {
        error = "Control surface not found: " + nameMatch;
        SD_WARN("ControlSurface::open: %s", error.c_str());
        return false;
    }

    input_ = juce::MidiInput::openDevice(inputInfo.identifier, this);
    if (!input_)
    {
        error = "Failed to open control surface: " + inputInfo.name.toStdString();
        SD_WARN("ControlSurface::open: %s", error.c_str());
        return false;
    }

    for (const auto& d : juce::MidiOutput::getAvailableDevices())
    {
        if (d.name.containsIgnoreCase(match))
        {
            output_ = juce::MidiOutput::openDevice(d.identifier);
            break;
        }
    }
    if (!output_)
        SD_WARN("ControlSurface::open: no output port for %s, lights disabled",
                inputInfo.name.toRawUTF8());

    deviceName_ = inputInfo.name.toStdString();
    input_->start();

    SD_INFO("ControlSurface: opened %s", deviceName_.c_str());
    return true;
}

void ControlSurface::close()
{
    if (input_)
    {
        input_->stop();
        input_.reset();
        SD_INFO("ControlSurface: closed %s", deviceName_.c_str());
    }
    output_.reset();
    deviceName_.clear();
}

bool ControlSurface::isOpen() const
{
    return input_ != nullptr;
}

bool ControlSurface::hasOutput() const
{
    return output_ != nullptr;
}

const std::string& ControlSurface::getDeviceName() const
{
    return deviceName_;
}

void ControlSurface::setIndicator(int channel, int number, int intensity)
{
    if (!output_)
        return;
    if (channel < 0 || channel >= channels::kNumChannels || number < 0 || number >= channels::kNumNotes)
    {
        SD_WARN("ControlSurface::setIndicator: out of range ch=%d num=%d", channel, number);
        return;
    }
    auto level = static_cast<juce::uint8>(std::clamp(intensity, 0, 127));
    output_->sendMessageNow(juce::MidiMessage::noteOn(channel + 1, number, level));
    SD_TRACE("ControlSurface: light ch=%d num=%d -> %d", channel, number, intensity);
}

// ═══════════════════════════════════════════════════════════════════
// Decoding
// ═══════════════════════════════════════════════════════════════════

bool ControlSurface::decode(const juce::MidiMessage& message, ControlMessage& out)
{
    const int channel = message.getChannel() - 1;
    if (channel < 0)
        return false;

    if (message.isNoteOn())
    {
        out = ControlMessage::button(channel, message.getNoteNumber(), message.getVelocity());
        return true;
    }
    if (message.isNoteOff(true))
    {
        out = ControlMessage::button(channel, message.getNoteNumber(), 0);
        return true;
    }
    if (message.isController())
    {
        out = ControlMessage::knob(channel, message.getControllerNumber(), message.getControllerValue());
        return true;
    }
    return false;
}

// ═══════════════════════════════════════════════════════════════════
// JUCE MidiInputCallback (MIDI thread, must be lock-free)
// ═══════════════════════════════════════════════════════════════════

void ControlSurface::handleIncomingMidiMessage(juce::MidiInput* /*source*/,
                                               const juce::MidiMessage& message)
{
    ControlMessage decoded;
    if (decode(message, decoded))
        mailbox_.post(decoded);
}

} // namespace spindeck
