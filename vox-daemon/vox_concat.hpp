#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "vox_types.hpp"

struct VoxSegment {
    enum class Kind { Clip, Silence };
    Kind kind = Kind::Clip;
    std::string word; // empty for silence
    uint64_t offset = 0;
    uint64_t length = 0;
};

struct VoxConcatenation {
    std::vector<uint8_t> buffer;
    size_t clipCount = 0;
    uint64_t silenceBytes = 0;
    double durationSeconds = 0.0;
    std::vector<VoxSegment> segments;
};

// Joins resolved clips in token order with zeroed silence between them.
// Between two emitted words the word gap is inserted, combined with any pause
// tokens in between according to the pause mode. Pauses before the first or
// after the last emitted word are not rendered.
class VoxConcatenator {
public:
    explicit VoxConcatenator(VoxPauseMode mode = VoxPauseMode::Additive) : mode_(mode) {}

    // Throws VoxConcatenationError on empty or misaligned clips, a negative
    // gap, or a composition without any clip.
    VoxConcatenation concatenate(const VoxComposition& composition, int wordGapMs) const;

    VoxPauseMode pauseMode() const { return mode_; }

private:
    VoxPauseMode mode_;
};
