#pragma once

#include <array>
#include <cstdio>
#include <string>

namespace spindeck {

constexpr int kNumDecks = 4;

// --- Tracks ---

struct Track {
    int id = 0;
    std::string title;
    std::string artist;
    int bpm = 0;
    int key = 1; // harmonic key, 1..12, circular

    bool operator==(const Track& other) const { return id == other.id; }
    bool operator!=(const Track& other) const { return id != other.id; }
};

/// Only these tempos exist in the catalog; ordered low to high.
constexpr std::array<int, 3> kTempos = {84, 94, 102};
constexpr int kDefaultTempo = 94;

inline bool isSupportedTempo(int bpm)
{
    for (int t : kTempos)
        if (t == bpm)
            return true;
    return false;
}

// --- Sections ---

enum class Section { lead, body };

inline const char* sectionName(Section s)
{
    return s == Section::lead ? "lead" : "body";
}

inline Section otherSection(Section s)
{
    return s == Section::lead ? Section::body : Section::lead;
}

inline double sectionBeats(Section s)
{
    return s == Section::lead ? 16.0 : 64.0;
}

inline double beatsPerSecond(int bpm)
{
    return static_cast<double>(bpm) / 60.0;
}

inline double sectionDurationSeconds(Section s, int bpm)
{
    return sectionBeats(s) / beatsPerSecond(bpm);
}

/// Section asset file: `<root>/<8-digit zero-padded id>-<lead|body>.wav`
inline std::string sectionAssetPath(const std::string& root, const Track& track, Section section)
{
    char name[64];
    std::snprintf(name, sizeof(name), "%08d-%s.wav", track.id, sectionName(section));
    if (root.empty())
        return name;
    if (root.back() == '/')
        return root + name;
    return root + "/" + name;
}

// --- Performance pads ---

enum class PadMode { hotCue, roll, slicer, sampler };

inline const char* padModeName(PadMode m)
{
    switch (m) {
        case PadMode::hotCue:  return "HOT CUE";
        case PadMode::roll:    return "ROLL";
        case PadMode::slicer:  return "SLICER";
        case PadMode::sampler: return "SAMPLER";
    }
    return "UNKNOWN";
}

// --- Sides ---

/// A = decks 1/3 (left), B = decks 2/4 (right).
enum class Side { a, b };

inline const char* sideName(Side s)
{
    return s == Side::a ? "A" : "B";
}

} // namespace spindeck
