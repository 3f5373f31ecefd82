#pragma once

#include "core/Types.h"

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace spindeck {

/// Track library, browse cursor and the four deck slots.
class TrackCatalog {
public:
    TrackCatalog() = default;

    TrackCatalog(const TrackCatalog&) = delete;
    TrackCatalog& operator=(const TrackCatalog&) = delete;

    // --- Library ---

    /// Replaces the library with the JSON array in `filePath`.
    /// Malformed entries are skipped with a warning.
    bool loadFromFile(const std::string& filePath, std::string& error);
    bool loadFromJson(const std::string& json, std::string& error);

    /// Adds one track; rejects unsupported tempos and keys outside 1..12.
    bool addTrack(const Track& track, std::string& error);
    int getNumTracks() const;
    std::optional<Track> findTrack(int id) const;

    /// Tracks at `bpm`, closest harmonic key to the reference key first,
    /// then artist and title.
    std::vector<Track> listTracksAtTempo(int bpm) const;

    /// Circular distance between keys on the 12-key wheel (0..6).
    static int keyDistance(int keyA, int keyB);

    void setReferenceKey(std::optional<int> key);
    std::optional<int> getReferenceKey() const;

    // --- Browse cursor ---
    void setTempo(int bpm);
    int getTempo() const;
    bool browse(int direction);
    int getSelectedIndex() const;
    std::optional<Track> selectedTrack() const;

    // --- Deck slots ---
    bool loadTrack(int deck, const Track& track);
    bool unloadTrack(int deck);
    std::optional<Track> getLoadedTrack(int deck) const;

private:
    std::vector<Track> tracks_;
    std::optional<int> referenceKey_;
    int tempo_ = kDefaultTempo;
    int selectedIndex_ = 0;
    std::array<std::optional<Track>, kNumDecks> decks_;
};

} // namespace spindeck
