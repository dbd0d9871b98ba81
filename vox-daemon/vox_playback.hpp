#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

// Plays finished announcements on the default ALSA device. One announcement
// plays at a time; concurrent callers queue on the device mutex.
class VoxAlsaPlayback {
public:
    explicit VoxAlsaPlayback(std::string device = "default") : device_(std::move(device)) {}

    // Volume in [0, 1]. Throws std::runtime_error on device errors.
    void play(const std::vector<uint8_t>& pcm, float volume = 1.0f);

private:
    std::string device_;
    std::mutex mutex_;
};

// Scales system-format PCM in place, clamping to the 16-bit range.
void applyVolume(std::vector<int16_t>& samples, float volume);
