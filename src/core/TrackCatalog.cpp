#include "core/TrackCatalog.h"
#include "core/Logger.h"

#include <juce_core/juce_core.h>

#include <algorithm>
#include <iterator>

namespace spindeck {

// ═══════════════════════════════════════════════════════════════════
// Library
// ═══════════════════════════════════════════════════════════════════

bool TrackCatalog::loadFromFile(const std::string& filePath, std::string& error)
{
    auto file = juce::File::getCurrentWorkingDirectory().getChildFile(filePath);
    if (!file.existsAsFile())
    {
        error = "Catalog not found: " + filePath;
        SD_WARN("TrackCatalog::loadFromFile: %s", error.c_str());
        return false;
    }
    return loadFromJson(file.loadFileAsString().toStdString(), error);
}

bool TrackCatalog::loadFromJson(const std::string& json, std::string& error)
{
    juce::var parsed;
    auto result = juce::JSON::parse(juce::String(json), parsed);
    if (result.failed())
    {
        error = "Invalid catalog JSON: " + result.getErrorMessage().toStdString();
        SD_WARN("TrackCatalog::loadFromJson: %s", error.c_str());
        return false;
    }

    auto* entries = parsed.getArray();
    if (!entries)
    {
        error = "Catalog JSON must be an array of tracks";
        SD_WARN("TrackCatalog::loadFromJson: %s", error.c_str());
        return false;
    }

    tracks_.clear();
    int skipped = 0;
    for (const auto& entry : *entries)
    {
        if (!entry.isObject())
        {
            ++skipped;
            continue;
        }

        Track track;
        track.id = static_cast<int>(entry.getProperty("id", 0));
        track.title = entry.getProperty("title", "").toString().toStdString();
        track.artist = entry.getProperty("artist", "").toString().toStdString();
        track.bpm = static_cast<int>(entry.getProperty("bpm", 0));
        track.key = static_cast<int>(entry.getProperty("key", 0));

        std::string entryError;
        if (!addTrack(track, entryError))
            ++skipped;
    }

    selectedIndex_ = 0;
    SD_INFO("TrackCatalog: loaded %d tracks (%d skipped)", getNumTracks(), skipped);
    return true;
}

bool TrackCatalog::addTrack(const Track& track, std::string& error)
{
    if (track.id <= 0)
    {
        error = "Track id must be positive";
    }
    else if (!isSupportedTempo(track.bpm))
    {
        error = "Unsupported tempo " + std::to_string(track.bpm) + " for track " + std::to_string(track.id);
    }
    else if (track.key < 1 || track.key > 12)
    {
        error = "Key out of range for track " + std::to_string(track.id);
    }
    else if (findTrack(track.id))
    {
        error = "Duplicate track id " + std::to_string(track.id);
    }
    else
    {
        tracks_.push_back(track);
        return true;
    }

    SD_WARN("TrackCatalog::addTrack: %s", error.c_str());
    return false;
}

int TrackCatalog::getNumTracks() const
{
    return static_cast<int>(tracks_.size());
}

std::optional<Track> TrackCatalog::findTrack(int id) const
{
    auto it = std::find_if(tracks_.begin(), tracks_.end(),
                           [id](const Track& t) { return t.id == id; });
    if (it == tracks_.end())
        return std::nullopt;
    return *it;
}

int TrackCatalog::keyDistance(int keyA, int keyB)
{
    int forward = ((keyB - keyA) % 12 + 12) % 12;
    int backward = ((keyA - keyB) % 12 + 12) % 12;
    return std::min(forward, backward);
}

std::vector<Track> TrackCatalog::listTracksAtTempo(int bpm) const
{
    std::vector<Track> result;
    std::copy_if(tracks_.begin(), tracks_.end(), std::back_inserter(result),
                 [bpm](const Track& t) { return t.bpm == bpm; });

    auto rank = [this](const Track& t) {
        return referenceKey_ ? keyDistance(*referenceKey_, t.key) : t.key;
    };

    std::stable_sort(result.begin(), result.end(), [&rank](const Track& a, const Track& b) {
        int ra = rank(a);
        int rb = rank(b);
        if (ra != rb)
            return ra < rb;
        if (a.artist != b.artist)
            return a.artist < b.artist;
        return a.title < b.title;
    });
    return result;
}

void TrackCatalog::setReferenceKey(std::optional<int> key)
{
    referenceKey_ = key;
    selectedIndex_ = 0;
    if (key)
        SD_DEBUG("TrackCatalog: reference key %d", *key);
}

std::optional<int> TrackCatalog::getReferenceKey() const
{
    return referenceKey_;
}

// ═══════════════════════════════════════════════════════════════════
// Browse cursor
// ═══════════════════════════════════════════════════════════════════

void TrackCatalog::setTempo(int bpm)
{
    tempo_ = bpm;
    selectedIndex_ = 0;
}

int TrackCatalog::getTempo() const
{
    return tempo_;
}

bool TrackCatalog::browse(int direction)
{
    auto visible = listTracksAtTempo(tempo_);
    if (visible.empty() || direction == 0)
        return false;

    int last = static_cast<int>(visible.size()) - 1;
    int next = std::clamp(selectedIndex_ + (direction > 0 ? 1 : -1), 0, last);
    if (next == selectedIndex_)
        return false;
    selectedIndex_ = next;
    SD_DEBUG("TrackCatalog: selected %d/%d \"%s\"", selectedIndex_ + 1, last + 1,
             visible[static_cast<size_t>(selectedIndex_)].title.c_str());
    return true;
}

int TrackCatalog::getSelectedIndex() const
{
    return selectedIndex_;
}

std::optional<Track> TrackCatalog::selectedTrack() const
{
    auto visible = listTracksAtTempo(tempo_);
    if (selectedIndex_ < 0 || selectedIndex_ >= static_cast<int>(visible.size()))
        return std::nullopt;
    return visible[static_cast<size_t>(selectedIndex_)];
}

// ═══════════════════════════════════════════════════════════════════
// Deck slots
// ═══════════════════════════════════════════════════════════════════

bool TrackCatalog::loadTrack(int deck, const Track& track)
{
    if (deck < 1 || deck > kNumDecks)
    {
        SD_WARN("TrackCatalog::loadTrack: invalid deck %d", deck);
        return false;
    }
    decks_[static_cast<size_t>(deck - 1)] = track;
    SD_INFO("TrackCatalog: deck %d loaded \"%s\" (%d BPM, key %d)",
            deck, track.title.c_str(), track.bpm, track.key);
    return true;
}

bool TrackCatalog::unloadTrack(int deck)
{
    if (deck < 1 || deck > kNumDecks || !decks_[static_cast<size_t>(deck - 1)])
        return false;
    decks_[static_cast<size_t>(deck - 1)].reset();
    SD_INFO("TrackCatalog: deck %d unloaded", deck);
    return true;
}

std::optional<Track> TrackCatalog::getLoadedTrack(int deck) const
{
    if (deck < 1 || deck > kNumDecks)
        return std::nullopt;
    return decks_[static_cast<size_t>(deck - 1)];
}

} // namespace spindeck
