#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

// System-wide clip format: 48 kHz, signed 16-bit little-endian, stereo interleaved.
constexpr int kVoxSampleRate = 48000;
constexpr int kVoxBitsPerSample = 16;
constexpr int kVoxBytesPerSample = kVoxBitsPerSample / 8;
constexpr int kVoxChannels = 2;
constexpr int kVoxFrameBytes = kVoxBytesPerSample * kVoxChannels;
constexpr int kVoxBytesPerSecond = kVoxSampleRate * kVoxFrameBytes;

// Raw output of a synthesis provider, in whatever rate/layout it produces.
struct VoxProviderAudio {
    std::vector<int16_t> samples; // interleaved
    int sampleRate = kVoxSampleRate;
    int channels = 1;
};

// durationMs * sampleRate * bytesPerSample * channels / 1000 (= durationMs * 192)
uint64_t silenceBytes(int64_t durationMs);

double durationForBytes(uint64_t bytes);

inline bool isFrameAligned(uint64_t bytes) { return bytes % kVoxFrameBytes == 0; }

std::vector<int16_t> resamplePcm(std::span<const int16_t> input, size_t origRate, size_t outRate, int channels);

// Resamples and remaps channels so the result can be stored as a clip.
std::vector<uint8_t> normalizeToSystemFormat(const VoxProviderAudio& audio);

std::vector<uint8_t> samplesToBytes(std::span<const int16_t> samples);
std::vector<int16_t> bytesToSamples(std::span<const uint8_t> bytes);

// 44-byte RIFF header followed by the PCM payload.
std::vector<uint8_t> wrapWav(std::span<const uint8_t> pcm);
