#include "vox_filter.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>
#include <string>

#include <spdlog/spdlog.h>

#include "vox_audio.hpp"
#include "vox_error.hpp"

using namespace std;

namespace {

// Direct form I biquad with RBJ cookbook coefficients.
class Biquad {
public:
    enum class Type { Highpass, Lowpass };

    Biquad(Type type, double cutoffHz, int sampleRate) {
        const double q = 1.0 / numbers::sqrt2;
        const double w0 = 2.0 * numbers::pi * cutoffHz / sampleRate;
        const double cosW0 = cos(w0);
        const double alpha = sin(w0) / (2.0 * q);
        const double a0 = 1.0 + alpha;

        if (type == Type::Lowpass) {
            b0 = (1.0 - cosW0) / 2.0 / a0;
            b1 = (1.0 - cosW0) / a0;
            b2 = b0;
        } else {
            b0 = (1.0 + cosW0) / 2.0 / a0;
            b1 = -(1.0 + cosW0) / a0;
            b2 = b0;
        }
        a1 = -2.0 * cosW0 / a0;
        a2 = (1.0 - alpha) / a0;
    }

    double process(double in) {
        const double out = b0 * in + b1 * x1 + b2 * x2 - a1 * y1 - a2 * y2;
        x2 = x1; x1 = in;
        y2 = y1; y1 = out;
        return out;
    }

private:
    double b0 = 1.0, b1 = 0.0, b2 = 0.0, a1 = 0.0, a2 = 0.0;
    double x1 = 0.0, x2 = 0.0, y1 = 0.0, y2 = 0.0;
};

constexpr double kCompressorThreshold = 0.125; // -18 dBFS
constexpr double kAttackMs = 5.0;
constexpr double kReleaseMs = 80.0;

} // namespace

void VoxBiquadDspChain::process(vector<int16_t>& samples, int sampleRate, int channels,
                                const VoxCustomFilterSettings& s) {
    if (channels <= 0 || sampleRate <= 0) throw invalid_argument("Invalid audio layout for DSP chain");
    const size_t frames = samples.size() / channels;
    const double nyquist = sampleRate / 2.0;

    vector<vector<double>> work(channels, vector<double>(frames));
    for (size_t f = 0; f < frames; f++) {
        for (int c = 0; c < channels; c++) work[c][f] = samples[f * channels + c] / 32768.0;
    }

    for (int c = 0; c < channels; c++) {
        auto& ch = work[c];
        if (s.highpassHz > 0.0) {
            Biquad hp(Biquad::Type::Highpass, s.highpassHz, sampleRate);
            for (auto& x : ch) x = hp.process(x);
        }
        if (s.lowpassHz > 0.0 && s.lowpassHz < nyquist) {
            Biquad lp(Biquad::Type::Lowpass, s.lowpassHz, sampleRate);
            for (auto& x : ch) x = lp.process(x);
        }
    }

    if (s.compressionRatio > 1.0) {
        const double attack = exp(-1.0 / (kAttackMs * 0.001 * sampleRate));
        const double release = exp(-1.0 / (kReleaseMs * 0.001 * sampleRate));
        double env = 0.0;
        for (size_t f = 0; f < frames; f++) {
            double peak = 0.0;
            for (int c = 0; c < channels; c++) peak = max(peak, fabs(work[c][f]));
            const double coeff = peak > env ? attack : release;
            env = coeff * env + (1.0 - coeff) * peak;
            if (env <= kCompressorThreshold) continue;
            const double target = kCompressorThreshold * pow(env / kCompressorThreshold, 1.0 / s.compressionRatio);
            const double gain = target / env;
            for (int c = 0; c < channels; c++) work[c][f] *= gain;
        }
    }

    if (s.distortion > 0.0) {
        const double k = 1.0 + s.distortion * 9.0;
        const double norm = tanh(k);
        for (auto& ch : work) {
            for (auto& x : ch) x = (1.0 - s.distortion) * x + s.distortion * tanh(k * x) / norm;
        }
    }

    for (size_t f = 0; f < frames; f++) {
        for (int c = 0; c < channels; c++) {
            const double v = work[c][f];
            if (!isfinite(v)) throw runtime_error("DSP chain produced a non-finite sample");
            const double scaled = lround(v * 32768.0);
            samples[f * channels + c] = static_cast<int16_t>(clamp(scaled, -32768.0, 32767.0));
        }
    }
}

VoxFilterEngine::VoxFilterEngine() : chain_(make_unique<VoxBiquadDspChain>()) {}

VoxFilterEngine::VoxFilterEngine(unique_ptr<VoxDspChain> chain) : chain_(std::move(chain)) {
    if (!chain_) throw invalid_argument("Filter engine needs a DSP chain");
}

VoxCustomFilterSettings VoxFilterEngine::presetSettings(VoxFilterPreset preset) {
    switch (preset) {
        case VoxFilterPreset::Light: return VoxCustomFilterSettings{300.0, 3400.0, 2.0, 0.10};
        case VoxFilterPreset::Heavy: return VoxCustomFilterSettings{500.0, 2500.0, 4.0, 0.35};
        case VoxFilterPreset::Off: break;
    }
    return VoxCustomFilterSettings{0.0, kVoxSampleRate / 2.0, 1.0, 0.0};
}

void VoxFilterEngine::validate(const VoxCustomFilterSettings& s) {
    const double nyquist = kVoxSampleRate / 2.0;
    if (!isfinite(s.highpassHz) || !isfinite(s.lowpassHz) || !isfinite(s.compressionRatio) || !isfinite(s.distortion)) {
        throw VoxFilterError("Filter parameters must be finite numbers");
    }
    if (s.highpassHz < 0.0) throw VoxFilterError("Highpass cutoff must be non-negative");
    if (s.lowpassHz <= s.highpassHz) throw VoxFilterError("Lowpass cutoff must be above the highpass cutoff");
    if (s.lowpassHz > nyquist) throw VoxFilterError("Lowpass cutoff must not exceed " + to_string(static_cast<int>(nyquist)) + " Hz");
    if (s.compressionRatio < 1.0) throw VoxFilterError("Compression ratio must be at least 1");
    if (s.distortion < 0.0 || s.distortion > 1.0) throw VoxFilterError("Distortion must be between 0 and 1");
}

optional<VoxCustomFilterSettings> VoxFilterEngine::resolve(const VoxFilterSpec& spec) {
    if (const auto* preset = get_if<VoxFilterPreset>(&spec)) {
        if (*preset == VoxFilterPreset::Off) return nullopt;
        return presetSettings(*preset);
    }
    const auto& custom = get<VoxCustomFilterSettings>(spec);
    validate(custom);
    return custom;
}

vector<uint8_t> VoxFilterEngine::apply(const vector<uint8_t>& buffer, const VoxFilterSpec& spec) const {
    auto settings = resolve(spec);
    if (!settings) return buffer;

    if (buffer.empty() || !isFrameAligned(buffer.size())) {
        throw VoxFilterError("Cannot filter a buffer that is not whole frames");
    }

    auto samples = bytesToSamples(span<const uint8_t>(buffer.data(), buffer.size()));
    const size_t before = samples.size();
    try {
        chain_->process(samples, kVoxSampleRate, kVoxChannels, *settings);
    } catch (const VoxFilterError&) {
        throw;
    } catch (const exception& e) {
        throw VoxFilterError(string("DSP chain failed: ") + e.what());
    }
    if (samples.size() != before) throw VoxFilterError("DSP chain changed the buffer length");

    spdlog::debug("Filtered {} bytes (hp {} Hz, lp {} Hz, ratio {}, distortion {})", buffer.size(),
                  settings->highpassHz, settings->lowpassHz, settings->compressionRatio, settings->distortion);
    return samplesToBytes(span<const int16_t>(samples.data(), samples.size()));
}
