#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "vox_types.hpp"

// Audio-processing collaborator that runs highpass -> lowpass -> compression
// -> distortion over interleaved 16-bit samples in place.
class VoxDspChain {
public:
    virtual ~VoxDspChain() = default;
    virtual void process(std::vector<int16_t>& samples, int sampleRate, int channels,
                         const VoxCustomFilterSettings& settings) = 0;
};

// Default chain: RBJ biquads, a linked-stereo peak compressor and tanh drive.
class VoxBiquadDspChain : public VoxDspChain {
public:
    void process(std::vector<int16_t>& samples, int sampleRate, int channels,
                 const VoxCustomFilterSettings& settings) override;
};

// Applies the public-address effect to an assembled buffer.
class VoxFilterEngine {
public:
    VoxFilterEngine();
    explicit VoxFilterEngine(std::unique_ptr<VoxDspChain> chain);

    // Off returns the input untouched. Any chain failure is a VoxFilterError.
    std::vector<uint8_t> apply(const std::vector<uint8_t>& buffer, const VoxFilterSpec& spec) const;

    static VoxCustomFilterSettings presetSettings(VoxFilterPreset preset);
    // nullopt for Off, otherwise the validated parameters to run.
    static std::optional<VoxCustomFilterSettings> resolve(const VoxFilterSpec& spec);
    static void validate(const VoxCustomFilterSettings& settings);

private:
    std::unique_ptr<VoxDspChain> chain_;
};
