#include "vox_playback.hpp"

#include <algorithm>
#include <cerrno>
#include <limits>
#include <span>
#include <stdexcept>

#include <alsa/asoundlib.h>
#include <spdlog/spdlog.h>

#include "vox_audio.hpp"

using namespace std;

void applyVolume(vector<int16_t>& samples, float volume) {
    if (volume == 1.0f) return;
    for (auto& sample : samples) {
        int32_t scaled = static_cast<int32_t>(sample * volume);
        sample = static_cast<int16_t>(clamp(scaled,
            static_cast<int32_t>(numeric_limits<int16_t>::min()),
            static_cast<int32_t>(numeric_limits<int16_t>::max())));
    }
}

namespace {

struct PcmHandle {
    snd_pcm_t* handle = nullptr;
    ~PcmHandle() {
        if (handle) snd_pcm_close(handle);
    }
};

void check(int err, const char* what) {
    if (err < 0) throw runtime_error(string(what) + ": " + snd_strerror(err));
}

} // namespace

void VoxAlsaPlayback::play(const vector<uint8_t>& pcm, float volume) {
    if (pcm.empty()) return;
    if (!isFrameAligned(pcm.size())) throw runtime_error("Playback buffer is not whole frames");

    auto samples = bytesToSamples(span<const uint8_t>(pcm.data(), pcm.size()));
    applyVolume(samples, clamp(volume, 0.0f, 1.0f));

    lock_guard<mutex> lk(mutex_);
    PcmHandle dev;
    check(snd_pcm_open(&dev.handle, device_.c_str(), SND_PCM_STREAM_PLAYBACK, 0), "Cannot open audio device");

    snd_pcm_hw_params_t* params;
    snd_pcm_hw_params_alloca(&params);
    snd_pcm_hw_params_any(dev.handle, params);
    snd_pcm_hw_params_set_access(dev.handle, params, SND_PCM_ACCESS_RW_INTERLEAVED);
    snd_pcm_hw_params_set_format(dev.handle, params, SND_PCM_FORMAT_S16_LE);
    snd_pcm_hw_params_set_channels(dev.handle, params, kVoxChannels);

    unsigned int rate = kVoxSampleRate;
    check(snd_pcm_hw_params_set_rate_near(dev.handle, params, &rate, 0), "Cannot set sample rate");
    if (rate != static_cast<unsigned int>(kVoxSampleRate)) {
        spdlog::warn("Audio device runs at {} Hz instead of {} Hz", rate, kVoxSampleRate);
    }
    check(snd_pcm_hw_params(dev.handle, params), "Cannot set parameters");
    check(snd_pcm_prepare(dev.handle), "Cannot prepare audio device");

    const snd_pcm_uframes_t totalFrames = samples.size() / kVoxChannels;
    snd_pcm_uframes_t written = 0;
    while (written < totalFrames) {
        snd_pcm_sframes_t frames =
            snd_pcm_writei(dev.handle, samples.data() + written * kVoxChannels, totalFrames - written);
        if (frames == -EPIPE) {
            // Underrun; re-prepare and continue from the same frame.
            check(snd_pcm_prepare(dev.handle), "Cannot recover from underrun");
            continue;
        }
        if (frames < 0) throw runtime_error("Write error: " + string(snd_strerror(static_cast<int>(frames))));
        written += static_cast<snd_pcm_uframes_t>(frames);
    }

    snd_pcm_drain(dev.handle);
    spdlog::debug("Played {} frames", totalFrames);
}
