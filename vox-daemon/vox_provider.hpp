#pragma once

#include <string>

#include "vox_audio.hpp"
#include "vox_types.hpp"

// External text-to-speech service that renders one word at a time.
// Implementations must be safe to call from several generator workers at
// once and report failures by throwing.
class VoxSynthesisProvider {
public:
    virtual ~VoxSynthesisProvider() = default;

    virtual VoxProviderAudio synthesizeWord(const std::string& word, const std::string& voiceId,
                                            const VoxCancelToken& cancel) = 0;

    virtual bool hasVoice(const std::string& voiceId) const = 0;
};
