#include "core/DeckEngine.h"
#include "core/Logger.h"

#include <algorithm>
#include <cmath>

namespace spindeck {

namespace {

constexpr size_t kMaxReversedBuffers = 8;

// Walks whole sections off the front of `beats`, alternating lead/body.
void normalizeBeats(Section& section, double& beats)
{
    if (beats < 0.0)
        beats = 0.0;
    while (beats >= sectionBeats(section))
    {
        beats -= sectionBeats(section);
        section = otherSection(section);
    }
}

} // namespace

// ═══════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════

DeckEngine::DeckEngine(BufferCache& cache, double sampleRate, int blockSize,
                       const std::string& musicRoot)
    : cache_(cache), sampleRate_(sampleRate), blockSize_(blockSize), musicRoot_(musicRoot)
{
    deckGains_.fill(1.0f);
    for (auto& voice : voices_)
        voice.prepare(sampleRate_);
    SD_INFO("DeckEngine: created sr=%.0f bs=%d music=%s", sampleRate_, blockSize_, musicRoot_.c_str());
}

DeckEngine::~DeckEngine()
{
    retired_.clear();
    SD_INFO("DeckEngine: destroyed");
}

double DeckEngine::getSampleRate() const { return sampleRate_; }
int DeckEngine::getBlockSize() const { return blockSize_; }
const std::string& DeckEngine::getMusicRoot() const { return musicRoot_; }

double DeckEngine::now() const
{
    return static_cast<double>(samplesRendered_.load(std::memory_order_acquire)) / sampleRate_;
}

bool DeckEngine::validDeck(int deck) const
{
    return deck >= 1 && deck <= kNumDecks;
}

// ═══════════════════════════════════════════════════════════════════
// Buffers
// ═══════════════════════════════════════════════════════════════════

BufferPtr DeckEngine::loadSection(const Track& track, Section section)
{
    std::string error;
    auto buffer = cache_.get(sectionAssetPath(musicRoot_, track, section), error);
    if (!buffer)
        SD_WARN("DeckEngine: cannot load %s of \"%s\": %s",
                sectionName(section), track.title.c_str(), error.c_str());
    return buffer;
}

BufferPtr DeckEngine::reversedSection(const Track& track, Section section, const BufferPtr& forward)
{
    auto key = sectionAssetPath(musicRoot_, track, section);
    auto it = reversed_.find(key);
    if (it != reversed_.end())
        return it->second;

    BufferPtr reversed = Buffer::createReversed(*forward);
    if (!reversed)
    {
        SD_WARN("DeckEngine: cannot reverse %s", key.c_str());
        return nullptr;
    }
    // Decks hold their own reference; dropping the map entries is safe.
    if (reversed_.size() >= kMaxReversedBuffers)
        reversed_.clear();
    reversed_[key] = reversed;
    return reversed;
}

void DeckEngine::retire(BufferPtr buffer)
{
    if (!buffer)
        return;
    retired_.push_back({std::move(buffer), blocksRendered_.load(std::memory_order_acquire) + 2});
}

void DeckEngine::releaseUnreleased(Deck& d)
{
    for (auto& buffer : d.unreleased)
        retire(std::move(buffer));
    d.unreleased.clear();
    d.stopPending = false;
}

void DeckEngine::preload(const Track& track)
{
    cache_.preload(sectionAssetPath(musicRoot_, track, Section::lead));
    cache_.preload(sectionAssetPath(musicRoot_, track, Section::body));
}

// ═══════════════════════════════════════════════════════════════════
// Transport
// ═══════════════════════════════════════════════════════════════════

bool DeckEngine::play(const Track& track, int deck, Section section, double beatOffset)
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    if (!validDeck(deck))
    {
        SD_WARN("DeckEngine::play: invalid deck %d", deck);
        return false;
    }
    return playLocked(track, deck - 1, section, beatOffset, true);
}

bool DeckEngine::playLocked(const Track& track, int idx, Section section, double beatOffset,
                            bool supersede)
{
    if (track.bpm <= 0)
    {
        SD_WARN("DeckEngine::play: track %d has no tempo", track.id);
        return false;
    }

    double beats = beatOffset;
    normalizeBeats(section, beats);

    auto buffer = loadSection(track, section);
    if (!buffer)
        return false;

    if (supersede)
        stopLocked(idx);

    double startSeconds = beats / beatsPerSecond(track.bpm);
    double duration = sectionDurationSeconds(section, track.bpm);

    auto& d = decks_[static_cast<size_t>(idx)];
    d.playback = PlaybackState{track, section, startSeconds, now()};
    startVoice(idx, buffer, startSeconds, duration, false);

    SD_INFO("DeckEngine: deck %d plays \"%s\" %s from beat %.3f (%.3fs for %.3fs)",
            idx + 1, track.title.c_str(), sectionName(section), beats,
            startSeconds, duration - startSeconds);
    return true;
}

void DeckEngine::startVoice(int idx, BufferPtr buffer, double startSeconds, double endSeconds, bool looping)
{
    auto& d = decks_[static_cast<size_t>(idx)];
    double sr = buffer->getSampleRate();

    DeckCommand cmd;
    cmd.type = DeckCommand::Type::startVoice;
    cmd.deck = idx;
    cmd.generation = d.generation;
    cmd.buffer = buffer.get();
    cmd.startSample = startSeconds * sr;
    cmd.endSample = endSeconds * sr;
    cmd.looping = looping;

    bool queued = commandQueue_.sendCommand(cmd);
    if (d.buffer != buffer)
    {
        if (d.buffer)
            d.unreleased.push_back(std::move(d.buffer));
        d.buffer = std::move(buffer);
    }
    if (queued)
        releaseUnreleased(d);
    else
        d.stopPending = true;
    d.sounding = queued;
    d.fading = false;
    d.spinningDown = false;
}

bool DeckEngine::stop(int deck)
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    if (!validDeck(deck))
    {
        SD_WARN("DeckEngine::stop: invalid deck %d", deck);
        return false;
    }
    stopLocked(deck - 1);
    SD_DEBUG("DeckEngine: deck %d stopped", deck);
    return true;
}

void DeckEngine::stopLocked(int idx)
{
    auto& d = decks_[static_cast<size_t>(idx)];
    ++d.generation;
    d.playback.reset();
    d.roll.reset();
    d.reverse.reset();
    d.sounding = false;
    d.fading = false;
    d.spinningDown = false;

    DeckCommand cmd;
    cmd.type = DeckCommand::Type::stopVoice;
    cmd.deck = idx;
    cmd.generation = d.generation;

    if (d.buffer)
        d.unreleased.push_back(std::move(d.buffer));
    d.buffer.reset();

    if (commandQueue_.sendCommand(cmd))
        releaseUnreleased(d);
    else
        d.stopPending = true;
}

void DeckEngine::stopAll()
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    for (int i = 0; i < kNumDecks; ++i)
        stopLocked(i);
    SD_INFO("DeckEngine: all decks stopped");
}

bool DeckEngine::fadeOut(int deck, double durationSeconds)
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    if (!validDeck(deck))
    {
        SD_WARN("DeckEngine::fadeOut: invalid deck %d", deck);
        return false;
    }
    auto& d = decks_[static_cast<size_t>(deck - 1)];
    if (!d.sounding)
    {
        SD_INFO("DeckEngine::fadeOut: nothing playing on deck %d", deck);
        return false;
    }

    DeckCommand cmd;
    cmd.type = DeckCommand::Type::rampGain;
    cmd.deck = deck - 1;
    cmd.generation = d.generation;
    cmd.target = 0.0;
    cmd.rampSamples = static_cast<int>(std::max(0.0, durationSeconds) * sampleRate_);
    if (!commandQueue_.sendCommand(cmd))
        return false;

    d.fading = true;
    timers_.push_back({Timer::Action::stopAfterFade, deck - 1, d.generation,
                       now() + std::max(0.0, durationSeconds)});
    SD_DEBUG("DeckEngine: deck %d fading out over %.3fs", deck, durationSeconds);
    return true;
}

bool DeckEngine::spindown(int deck)
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    if (!validDeck(deck))
    {
        SD_WARN("DeckEngine::spindown: invalid deck %d", deck);
        return false;
    }
    auto& d = decks_[static_cast<size_t>(deck - 1)];
    if (!d.sounding)
    {
        SD_INFO("DeckEngine::spindown: nothing playing on deck %d", deck);
        return false;
    }
    if (d.spinningDown)
    {
        SD_DEBUG("DeckEngine::spindown: deck %d already spinning down", deck);
        return false;
    }

    DeckCommand cmd;
    cmd.type = DeckCommand::Type::rampRate;
    cmd.deck = deck - 1;
    cmd.generation = d.generation;
    cmd.target = kSpindownFloorRate;
    cmd.rampSamples = static_cast<int>(kSpindownSeconds * sampleRate_);
    if (!commandQueue_.sendCommand(cmd))
        return false;

    d.spinningDown = true;
    timers_.push_back({Timer::Action::stopAfterSpindown, deck - 1, d.generation,
                       now() + kSpindownSeconds + kSpindownStopGraceSeconds});
    SD_DEBUG("DeckEngine: deck %d spinning down", deck);
    return true;
}

// ═══════════════════════════════════════════════════════════════════
// Roll / reverse
// ═══════════════════════════════════════════════════════════════════

double DeckEngine::positionOf(const Deck& d) const
{
    const auto& p = *d.playback;
    double position = now() - p.clockStartTime + p.sectionStartOffsetSeconds;
    return std::clamp(position, 0.0, sectionDurationSeconds(p.section, p.track.bpm));
}

bool DeckEngine::capturePosition(int idx, const std::optional<Track>& fallback, ExcursionState& out) const
{
    const auto& d = decks_[static_cast<size_t>(idx)];
    out.startClockTime = now();
    if (d.playback)
    {
        out.savedPositionSeconds = positionOf(d);
        out.savedSection = d.playback->section;
        out.savedTrack = d.playback->track;
        return true;
    }
    if (fallback && fallback->bpm > 0)
    {
        out.savedPositionSeconds = 0.0;
        out.savedSection = Section::body;
        out.savedTrack = *fallback;
        return true;
    }
    return false;
}

bool DeckEngine::startRoll(int deck, double rollBeats, const std::optional<Track>& fallback)
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    if (!validDeck(deck) || rollBeats <= 0.0)
    {
        SD_WARN("DeckEngine::startRoll: invalid deck %d or roll length %.4f", deck, rollBeats);
        return false;
    }
    int idx = deck - 1;
    auto& d = decks_[static_cast<size_t>(idx)];
    if (d.reverse)
    {
        SD_INFO("DeckEngine::startRoll: deck %d is reversing", deck);
        return false;
    }

    // A new roll while rolling keeps the original resume anchor and loops
    // from where playback would be by now.
    ExcursionState saved;
    double beats = 0.0;
    Section section = Section::body;
    if (d.roll)
    {
        saved = *d.roll;
        beats = (saved.savedPositionSeconds + now() - saved.startClockTime)
                * beatsPerSecond(saved.savedTrack.bpm);
        section = saved.savedSection;
        normalizeBeats(section, beats);
    }
    else if (capturePosition(idx, fallback, saved))
    {
        beats = saved.savedPositionSeconds * beatsPerSecond(saved.savedTrack.bpm);
        section = saved.savedSection;
        normalizeBeats(section, beats);
    }
    else
    {
        SD_INFO("DeckEngine::startRoll: nothing to roll on deck %d", deck);
        return false;
    }

    const Track& track = saved.savedTrack;
    auto buffer = loadSection(track, section);
    if (!buffer)
        return false;

    double bps = beatsPerSecond(track.bpm);
    double length = rollBeats / bps;
    double sectionEnd = sectionDurationSeconds(section, track.bpm);
    double start = beats / bps;
    // The loop begins where playback was interrupted; only its end is cut
    // at the section boundary.
    double end = std::min(start + length, sectionEnd);
    if (end - start < 1.0 / buffer->getSampleRate())
        start = std::max(0.0, end - length);

    stopLocked(idx);
    startVoice(idx, buffer, start, end, true);
    d.roll = saved;

    SD_DEBUG("DeckEngine: deck %d rolling %.4f beats at %s %.3fs",
             deck, rollBeats, sectionName(section), start);
    return true;
}

bool DeckEngine::stopRoll(int deck)
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    if (!validDeck(deck))
        return false;
    int idx = deck - 1;
    auto& d = decks_[static_cast<size_t>(idx)];
    if (!d.roll)
    {
        SD_INFO("DeckEngine::stopRoll: no roll active on deck %d", deck);
        return false;
    }
    ExcursionState saved = *d.roll;
    double elapsed = now() - saved.startClockTime;
    return resumeFromExcursion(idx, saved, saved.savedPositionSeconds + elapsed);
}

bool DeckEngine::startReverse(int deck, const std::optional<Track>& fallback)
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    if (!validDeck(deck))
    {
        SD_WARN("DeckEngine::startReverse: invalid deck %d", deck);
        return false;
    }
    int idx = deck - 1;
    auto& d = decks_[static_cast<size_t>(idx)];
    if (d.reverse || d.roll)
    {
        SD_INFO("DeckEngine::startReverse: deck %d is already %s", deck, d.roll ? "rolling" : "reversing");
        return false;
    }

    ExcursionState saved;
    if (!capturePosition(idx, fallback, saved))
    {
        SD_INFO("DeckEngine::startReverse: nothing to reverse on deck %d", deck);
        return false;
    }

    auto forward = loadSection(saved.savedTrack, saved.savedSection);
    if (!forward)
        return false;
    auto reversed = reversedSection(saved.savedTrack, saved.savedSection, forward);
    if (!reversed)
        return false;

    double reversedDuration = reversed->getLengthInSeconds();
    double start = std::clamp(reversedDuration - saved.savedPositionSeconds, 0.0, reversedDuration);

    stopLocked(idx);
    startVoice(idx, reversed, start, reversedDuration, false);
    d.reverse = saved;

    SD_DEBUG("DeckEngine: deck %d reversing from %s %.3fs",
             deck, sectionName(saved.savedSection), saved.savedPositionSeconds);
    return true;
}

bool DeckEngine::stopReverse(int deck)
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    if (!validDeck(deck))
        return false;
    int idx = deck - 1;
    auto& d = decks_[static_cast<size_t>(idx)];
    if (!d.reverse)
    {
        SD_INFO("DeckEngine::stopReverse: no reverse active on deck %d", deck);
        return false;
    }
    ExcursionState saved = *d.reverse;
    double elapsed = now() - saved.startClockTime;
    return resumeFromExcursion(idx, saved, std::max(0.0, saved.savedPositionSeconds + elapsed));
}

bool DeckEngine::resumeFromExcursion(int idx, const ExcursionState& saved, double resumeSeconds)
{
    double beats = std::max(0.0, resumeSeconds) * beatsPerSecond(saved.savedTrack.bpm);
    if (playLocked(saved.savedTrack, idx, saved.savedSection, beats, true))
        return true;

    // The resume asset is gone; silence the excursion rather than loop forever.
    stopLocked(idx);
    return false;
}

// ═══════════════════════════════════════════════════════════════════
// Queries / sync / gain
// ═══════════════════════════════════════════════════════════════════

std::optional<DeckPosition> DeckEngine::getCurrentPlaybackState(int deck) const
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    if (!validDeck(deck))
        return std::nullopt;
    const auto& d = decks_[static_cast<size_t>(deck - 1)];
    if (!d.playback)
        return std::nullopt;
    return DeckPosition{d.playback->track, d.playback->section, positionOf(d)};
}

bool DeckEngine::syncTo(int sourceDeck, int targetDeck, const Track& targetTrack)
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    if (!validDeck(sourceDeck) || !validDeck(targetDeck) || sourceDeck == targetDeck)
    {
        SD_WARN("DeckEngine::syncTo: invalid decks %d -> %d", sourceDeck, targetDeck);
        return false;
    }
    const auto& src = decks_[static_cast<size_t>(sourceDeck - 1)];
    if (!src.playback)
    {
        SD_INFO("DeckEngine::syncTo: deck %d is not playing", sourceDeck);
        return false;
    }
    if (src.playback->track.bpm != targetTrack.bpm)
    {
        SD_WARN("DeckEngine::syncTo: tempo mismatch deck %d (%d BPM) vs deck %d (%d BPM)",
                sourceDeck, src.playback->track.bpm, targetDeck, targetTrack.bpm);
        return false;
    }

    Section section = src.playback->section;
    double beats = positionOf(src) * beatsPerSecond(targetTrack.bpm);
    SD_INFO("DeckEngine: sync deck %d -> deck %d at %s beat %.3f",
            sourceDeck, targetDeck, sectionName(section), beats);
    return playLocked(targetTrack, targetDeck - 1, section, beats, true);
}

bool DeckEngine::setVolume(int deck, float level)
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    if (!validDeck(deck))
        return false;
    level = std::clamp(level, 0.0f, 1.0f);
    decks_[static_cast<size_t>(deck - 1)].volume = level;

    DeckCommand cmd;
    cmd.type = DeckCommand::Type::setDeckGain;
    cmd.deck = deck - 1;
    cmd.target = level;
    return commandQueue_.sendCommand(cmd);
}

float DeckEngine::getVolume(int deck) const
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    if (!validDeck(deck))
        return 0.0f;
    return decks_[static_cast<size_t>(deck - 1)].volume;
}

void DeckEngine::setMasterVolume(float level)
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    masterVolume_ = std::clamp(level, 0.0f, 1.0f);

    DeckCommand cmd;
    cmd.type = DeckCommand::Type::setMasterGain;
    cmd.target = masterVolume_;
    commandQueue_.sendCommand(cmd);
}

float DeckEngine::getMasterVolume() const
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    return masterVolume_;
}

bool DeckEngine::isActive(int deck) const
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    return validDeck(deck) && decks_[static_cast<size_t>(deck - 1)].sounding;
}

bool DeckEngine::isRolling(int deck) const
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    return validDeck(deck) && decks_[static_cast<size_t>(deck - 1)].roll.has_value();
}

bool DeckEngine::isReversing(int deck) const
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    return validDeck(deck) && decks_[static_cast<size_t>(deck - 1)].reverse.has_value();
}

uint32_t DeckEngine::getGeneration(int deck) const
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    return validDeck(deck) ? decks_[static_cast<size_t>(deck - 1)].generation : 0;
}

// ═══════════════════════════════════════════════════════════════════
// Control timeline servicing
// ═══════════════════════════════════════════════════════════════════

void DeckEngine::poll()
{
    std::lock_guard<std::mutex> lock(controlMutex_);

    commandQueue_.collectCompletions([this](const DeckCompletion& c) { handleCompletion(c); });

    double t = now();
    std::vector<Timer> due;
    auto split = std::stable_partition(timers_.begin(), timers_.end(),
                                       [t](const Timer& timer) { return timer.due > t; });
    due.assign(split, timers_.end());
    timers_.erase(split, timers_.end());

    for (const auto& timer : due)
    {
        auto& d = decks_[static_cast<size_t>(timer.deck)];
        if (timer.generation != d.generation)
        {
            SD_TRACE("DeckEngine: stale timer for deck %d dropped", timer.deck + 1);
            continue;
        }
        stopLocked(timer.deck);
        SD_DEBUG("DeckEngine: deck %d stopped after %s", timer.deck + 1,
                 timer.action == Timer::Action::stopAfterFade ? "fade" : "spindown");
    }

    for (int i = 0; i < kNumDecks; ++i)
    {
        auto& d = decks_[static_cast<size_t>(i)];
        if (!d.stopPending)
            continue;
        DeckCommand cmd;
        cmd.type = DeckCommand::Type::stopVoice;
        cmd.deck = i;
        cmd.generation = d.generation;
        if (commandQueue_.sendCommand(cmd))
        {
            releaseUnreleased(d);
            d.sounding = false;
            SD_DEBUG("DeckEngine: deck %d silenced after a dropped command", i + 1);
        }
    }

    int64_t blocks = blocksRendered_.load(std::memory_order_acquire);
    retired_.erase(std::remove_if(retired_.begin(), retired_.end(),
                                  [blocks](const RetiredBuffer& r) { return blocks >= r.releaseAfterBlock; }),
                   retired_.end());

    Logger::drain();
}

void DeckEngine::handleCompletion(const DeckCompletion& completion)
{
    if (completion.deck < 0 || completion.deck >= kNumDecks)
        return;
    auto& d = decks_[static_cast<size_t>(completion.deck)];
    if (completion.generation != d.generation)
    {
        SD_TRACE("DeckEngine: stale completion for deck %d dropped", completion.deck + 1);
        return;
    }

    d.sounding = false;
    if (d.fading || d.spinningDown)
    {
        stopLocked(completion.deck);
        return;
    }
    if (!d.playback)
        return; // a reverse reached the section start and waits for release

    Track track = d.playback->track;
    Section next = otherSection(d.playback->section);
    SD_DEBUG("DeckEngine: deck %d chaining into %s", completion.deck + 1, sectionName(next));
    if (!playLocked(track, completion.deck, next, 0.0, false))
        d.playback.reset();
}

// ═══════════════════════════════════════════════════════════════════
// processBlock (audio thread)
// ═══════════════════════════════════════════════════════════════════

void DeckEngine::handleCommand(const DeckCommand& cmd)
{
    if (cmd.type == DeckCommand::Type::setMasterGain)
    {
        masterGain_ = static_cast<float>(cmd.target);
        return;
    }
    if (cmd.deck < 0 || cmd.deck >= kNumDecks)
        return;

    auto& voice = voices_[static_cast<size_t>(cmd.deck)];
    switch (cmd.type) {
        case DeckCommand::Type::startVoice:
            voice.start(cmd.buffer, cmd.startSample, cmd.endSample, cmd.looping, cmd.generation);
            break;
        case DeckCommand::Type::stopVoice:
            voice.stop();
            break;
        case DeckCommand::Type::rampGain:
            if (voice.getGeneration() == cmd.generation)
                voice.rampGain(static_cast<float>(cmd.target), cmd.rampSamples);
            break;
        case DeckCommand::Type::rampRate:
            if (voice.getGeneration() == cmd.generation)
                voice.rampRate(cmd.target, cmd.rampSamples);
            break;
        case DeckCommand::Type::setDeckGain:
            deckGains_[static_cast<size_t>(cmd.deck)] = static_cast<float>(cmd.target);
            break;
        case DeckCommand::Type::setMasterGain:
            break;
    }
}

void DeckEngine::processBlock(float* const* outputChannels, int numChannels, int numSamples)
{
    commandQueue_.processPending([this](const DeckCommand& cmd) { handleCommand(cmd); });

    for (int ch = 0; ch < numChannels; ++ch)
        std::fill(outputChannels[ch], outputChannels[ch] + numSamples, 0.0f);

    if (numChannels > 0 && numSamples > 0)
    {
        float* left = outputChannels[0];
        float* right = numChannels > 1 ? outputChannels[1] : outputChannels[0];

        for (int i = 0; i < kNumDecks; ++i)
        {
            auto& voice = voices_[static_cast<size_t>(i)];
            if (voice.render(left, right, numSamples, deckGains_[static_cast<size_t>(i)]))
                commandQueue_.sendCompletion({i, voice.getGeneration()});
        }

        if (masterGain_ != 1.0f)
        {
            for (int ch = 0; ch < std::min(numChannels, 2); ++ch)
                for (int s = 0; s < numSamples; ++s)
                    outputChannels[ch][s] *= masterGain_;
        }
    }

    samplesRendered_.fetch_add(numSamples, std::memory_order_release);
    blocksRendered_.fetch_add(1, std::memory_order_release);
}

// ═══════════════════════════════════════════════════════════════════
// Testing
// ═══════════════════════════════════════════════════════════════════

void DeckEngine::render(int numSamples)
{
    if (numSamples <= 0)
        return;

    renderBuffer_.setSize(2, numSamples, false, false, true);
    const int chunk = blockSize_ > 0 ? blockSize_ : numSamples;
    int done = 0;
    while (done < numSamples)
    {
        int n = std::min(chunk, numSamples - done);
        float* channels[2] = {renderBuffer_.getWritePointer(0, done),
                              renderBuffer_.getWritePointer(1, done)};
        processBlock(channels, 2, n);
        poll();
        done += n;
    }
    SD_TRACE("DeckEngine::render: %d samples", numSamples);
}

const juce::AudioBuffer<float>& DeckEngine::getLastRender() const
{
    return renderBuffer_;
}

} // namespace spindeck
