#include "core/Config.h"

namespace spindeck {

namespace {

constexpr double kMinSampleRate = 8000.0;
constexpr double kMaxSampleRate = 384000.0;
constexpr int kMinBlockSize = 16;
constexpr int kMaxBlockSize = 8192;

bool isUnsignedNumber(const juce::String& text, bool allowPoint)
{
    return text.isNotEmpty() && text.containsOnly(allowPoint ? "0123456789." : "0123456789");
}

} // namespace

std::string Config::getCatalogPath() const
{
    if (!catalogPath.empty())
        return catalogPath;
    if (!musicRoot.empty() && musicRoot.back() == '/')
        return musicRoot + "catalog.json";
    return musicRoot + "/catalog.json";
}

bool Config::parse(const juce::ArgumentList& args, Config& config, std::string& error)
{
    for (int i = 0; i < args.size(); ++i)
    {
        const juce::String text = args[i].text;
        const bool inlineValue = text.startsWith("--") && text.contains("=");
        const juce::String name = inlineValue ? text.upToFirstOccurrenceOf("=", false, false) : text;
        juce::String value = inlineValue ? text.fromFirstOccurrenceOf("=", false, false) : juce::String();

        auto takeValue = [&]() -> bool {
            if (inlineValue)
                return true;
            if (i + 1 < args.size() && !args[i + 1].text.startsWith("--"))
            {
                value = args[++i].text;
                return true;
            }
            error = "Missing value for " + name.toStdString();
            return false;
        };

        if (name == "--help" || name == "-h")
        {
            config.showHelp = true;
        }
        else if (name == "--list-devices")
        {
            config.listDevices = true;
        }
        else if (name == "--device")
        {
            if (!takeValue())
                return false;
            if (value.trim().isEmpty())
            {
                error = "Empty --device name";
                return false;
            }
            config.deviceName = value.toStdString();
        }
        else if (name == "--music")
        {
            if (!takeValue())
                return false;
            config.musicRoot = value.toStdString();
        }
        else if (name == "--catalog")
        {
            if (!takeValue())
                return false;
            config.catalogPath = value.toStdString();
        }
        else if (name == "--log")
        {
            if (!takeValue())
                return false;
            if (!Logger::parseLevel(value.toStdString(), config.logLevel))
            {
                error = "Unknown log level: " + value.toStdString();
                return false;
            }
        }
        else if (name == "--sample-rate")
        {
            if (!takeValue())
                return false;
            double rate = value.getDoubleValue();
            if (!isUnsignedNumber(value, true) || rate < kMinSampleRate || rate > kMaxSampleRate)
            {
                error = "Invalid --sample-rate: " + value.toStdString();
                return false;
            }
            config.sampleRate = rate;
        }
        else if (name == "--block")
        {
            if (!takeValue())
                return false;
            int block = value.getIntValue();
            if (!isUnsignedNumber(value, false) || block < kMinBlockSize || block > kMaxBlockSize)
            {
                error = "Invalid --block: " + value.toStdString();
                return false;
            }
            config.blockSize = block;
        }
        else
        {
            error = "Unknown option: " + text.toStdString();
            return false;
        }
    }
    return true;
}

std::string Config::usage()
{
    return "usage: spindeck [options]\n"
           "  --device <name>       control surface name match (default DDJ-SP1)\n"
           "  --music <dir>         section asset directory (default ./music)\n"
           "  --catalog <file>      track catalog (default <music>/catalog.json)\n"
           "  --log <level>         off|error|warn|info|debug|trace (default warn)\n"
           "  --sample-rate <hz>    audio sample rate (default 48000)\n"
           "  --block <samples>     audio block size (default 512)\n"
           "  --list-devices        print MIDI inputs and exit\n"
           "  --help                show this text\n";
}

} // namespace spindeck
