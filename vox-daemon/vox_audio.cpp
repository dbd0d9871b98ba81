#include "vox_audio.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include <soxr.h>

using namespace std;

uint64_t silenceBytes(int64_t durationMs) {
    if (durationMs < 0) throw invalid_argument("Silence duration must be non-negative");
    return static_cast<uint64_t>(durationMs) * kVoxSampleRate * kVoxBytesPerSample * kVoxChannels / 1000;
}

double durationForBytes(uint64_t bytes) {
    return static_cast<double>(bytes) / kVoxBytesPerSecond;
}

vector<int16_t> resamplePcm(span<const int16_t> input, size_t origRate, size_t outRate, int channels) {
    if (channels <= 0) throw invalid_argument("Channel count must be positive");
    if (origRate == outRate || input.empty()) return vector<int16_t>(input.begin(), input.end());

    soxr_io_spec_t io_spec = soxr_io_spec(SOXR_INT16_I, SOXR_INT16_I);
    soxr_quality_spec_t q_spec = soxr_quality_spec(SOXR_MQ, 0);
    soxr_error_t error;
    soxr_t soxr = soxr_create(origRate, outRate, channels, &error, &io_spec, &q_spec, NULL);
    if (error != NULL) throw runtime_error(string("soxr_create failed: ") + error);

    const size_t inFrames = input.size() / channels;
    const size_t outCapacity = inFrames * outRate / origRate + 64;
    vector<int16_t> output(outCapacity * channels);

    size_t idone = 0, odone = 0;
    error = soxr_process(soxr, input.data(), inFrames, &idone, output.data(), outCapacity, &odone);
    if (error != NULL) { soxr_delete(soxr); throw runtime_error(string("soxr_process failed: ") + error); }

    // Drain the filter delay line.
    size_t flushed = 0;
    error = soxr_process(soxr, NULL, 0, NULL, output.data() + odone * channels, outCapacity - odone, &flushed);
    soxr_delete(soxr);
    if (error != NULL) throw runtime_error(string("soxr flush failed: ") + error);

    output.resize((odone + flushed) * channels);
    return output;
}

vector<uint8_t> normalizeToSystemFormat(const VoxProviderAudio& audio) {
    if (audio.channels <= 0) throw invalid_argument("Provider audio has no channels");
    if (audio.sampleRate <= 0) throw invalid_argument("Provider audio has no sample rate");

    const size_t frames = audio.samples.size() / audio.channels;
    vector<int16_t> stereo;
    stereo.reserve(frames * kVoxChannels);
    for (size_t f = 0; f < frames; f++) {
        const int16_t* frame = audio.samples.data() + f * audio.channels;
        if (audio.channels == 1) {
            stereo.push_back(frame[0]);
            stereo.push_back(frame[0]);
        } else {
            stereo.push_back(frame[0]);
            stereo.push_back(frame[1]);
        }
    }

    auto pcm = resamplePcm(span<const int16_t>(stereo.data(), stereo.size()), audio.sampleRate, kVoxSampleRate, kVoxChannels);
    return samplesToBytes(span<const int16_t>(pcm.data(), pcm.size()));
}

vector<uint8_t> samplesToBytes(span<const int16_t> samples) {
    vector<uint8_t> out(samples.size() * 2);
    for (size_t i = 0; i < samples.size(); i++) {
        const uint16_t v = static_cast<uint16_t>(samples[i]);
        out[2 * i] = static_cast<uint8_t>(v & 0xFF);
        out[2 * i + 1] = static_cast<uint8_t>((v >> 8) & 0xFF);
    }
    return out;
}

vector<int16_t> bytesToSamples(span<const uint8_t> bytes) {
    vector<int16_t> out(bytes.size() / 2);
    for (size_t i = 0; i < out.size(); i++) {
        const uint16_t v = static_cast<uint16_t>(bytes[2 * i]) | (static_cast<uint16_t>(bytes[2 * i + 1]) << 8);
        out[i] = static_cast<int16_t>(v);
    }
    return out;
}

static void putLittleEndian(vector<uint8_t>& b, uint32_t v, int n) {
    for (int i = 0; i < n; i++) b.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
}

vector<uint8_t> wrapWav(span<const uint8_t> pcm) {
    vector<uint8_t> wav;
    wav.reserve(44 + pcm.size());
    const uint32_t dataBytes = static_cast<uint32_t>(pcm.size());
    auto tag = [&](const char* t) { wav.insert(wav.end(), t, t + 4); };

    tag("RIFF");
    putLittleEndian(wav, 36 + dataBytes, 4);
    tag("WAVE");
    tag("fmt ");
    putLittleEndian(wav, 16, 4);
    putLittleEndian(wav, 1, 2); // PCM
    putLittleEndian(wav, kVoxChannels, 2);
    putLittleEndian(wav, kVoxSampleRate, 4);
    putLittleEndian(wav, kVoxBytesPerSecond, 4);
    putLittleEndian(wav, kVoxFrameBytes, 2);
    putLittleEndian(wav, kVoxBitsPerSample, 2);
    tag("data");
    putLittleEndian(wav, dataBytes, 4);
    wav.insert(wav.end(), pcm.begin(), pcm.end());
    return wav;
}
