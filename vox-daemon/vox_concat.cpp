#include "vox_concat.hpp"

#include <spdlog/spdlog.h>

#include "vox_audio.hpp"
#include "vox_error.hpp"

using namespace std;

VoxConcatenation VoxConcatenator::concatenate(const VoxComposition& composition, int wordGapMs) const {
    if (wordGapMs < 0) throw VoxConcatenationError("Word gap must be non-negative");

    uint64_t clipBytes = 0;
    size_t clips = 0;
    for (const auto& e : composition) {
        if (!e.token.isWord() || !e.clip) continue;
        const auto n = e.clip->audioBytes.size();
        if (n == 0) throw VoxConcatenationError("Clip for '" + e.token.word + "' is empty");
        if (!isFrameAligned(n)) {
            throw VoxConcatenationError("Clip for '" + e.token.word + "' has " + to_string(n) +
                                        " bytes, not a whole number of frames");
        }
        clipBytes += n;
        clips++;
    }
    if (clips == 0) throw VoxConcatenationError("No clips to concatenate");

    VoxConcatenation out;
    out.buffer.reserve(clipBytes + (clips - 1) * silenceBytes(wordGapMs));

    auto appendSilence = [&](int64_t ms) {
        const auto n = silenceBytes(ms);
        if (n == 0) return;
        out.segments.push_back(VoxSegment{VoxSegment::Kind::Silence, "", out.buffer.size(), n});
        out.buffer.insert(out.buffer.end(), n, 0);
        out.silenceBytes += n;
    };

    bool emitted = false;
    int64_t pendingPauseMs = 0;
    for (const auto& e : composition) {
        if (!e.token.isWord()) {
            if (e.token.pauseDurationMs < 0) throw VoxConcatenationError("Pause duration must be non-negative");
            if (emitted) pendingPauseMs += e.token.pauseDurationMs;
            continue;
        }
        if (!e.clip) continue;

        if (emitted) {
            const bool overridden = mode_ == VoxPauseMode::Override && pendingPauseMs > 0;
            appendSilence(overridden ? pendingPauseMs : static_cast<int64_t>(wordGapMs) + pendingPauseMs);
        }
        const auto& bytes = e.clip->audioBytes;
        out.segments.push_back(VoxSegment{VoxSegment::Kind::Clip, e.token.word, out.buffer.size(), bytes.size()});
        out.buffer.insert(out.buffer.end(), bytes.begin(), bytes.end());
        out.clipCount++;
        emitted = true;
        pendingPauseMs = 0;
    }

    out.durationSeconds = durationForBytes(out.buffer.size());
    spdlog::debug("Concatenated {} clips into {} bytes ({} silence, {:.3f}s)", out.clipCount, out.buffer.size(),
                  out.silenceBytes, out.durationSeconds);
    return out;
}
