#include "piper_provider.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>

#include "vox_error.hpp"

using namespace std;

PiperVoiceSynthesizer::PiperVoiceSynthesizer(piper::PiperConfig& cfg, const VoxVoiceConfig& opts) {
    std::optional<piper::SpeakerId> speakerId = std::nullopt;
    if (opts.speakerId) speakerId = *opts.speakerId;
    loadVoice(cfg, "", opts.encoderPath.string(), opts.decoderPath.string(),
              opts.modelConfigPath.string(), voice_, speakerId, opts.accelerator);
}

vector<int16_t> PiperVoiceSynthesizer::synthesizePcm(piper::PiperConfig& cfg, const string& text,
                                                     mutex& eSpeakMutex) {
    lock_guard<mutex> lk(mutex_);
    unique_lock<mutex> eSpeakLock(eSpeakMutex, defer_lock);
    if (usesESpeak()) eSpeakLock.lock();

    vector<int16_t> chunk;
    vector<int16_t> allAudio;
    piper::SynthesisResult result;
    // textToAudio hands over audio per sentence through the callback.
    auto cb = [&]() {
        if (!chunk.empty()) {
            allAudio.insert(allAudio.end(), chunk.begin(), chunk.end());
            chunk.clear();
        }
    };
    piper::textToAudio(cfg, voice_, text, chunk, result, cb);
    if (!chunk.empty()) allAudio.insert(allAudio.end(), chunk.begin(), chunk.end());
    return allAudio;
}

PiperProvider::PiperProvider(const map<string, VoxVoiceConfig>& voices) {
    if (voices.empty()) throw runtime_error("No voices configured");

    optional<filesystem::path> eSpeakDataPath;
    bool anyESpeak = false;
    for (const auto& [id, v] : voices) {
        spdlog::info("Loading voice {} from {}", id, v.modelConfigPath.string());
        auto synth = make_unique<PiperVoiceSynthesizer>(cfg_, v);
        if (synth->usesESpeak()) {
            anyESpeak = true;
            if (v.eSpeakDataPath) {
                if (eSpeakDataPath && *eSpeakDataPath != *v.eSpeakDataPath) {
                    spdlog::warn("Voice {} asks for eSpeak data at {}, using {}", id, v.eSpeakDataPath->string(),
                                 eSpeakDataPath->string());
                } else {
                    eSpeakDataPath = v.eSpeakDataPath;
                }
            }
        }
        voices_.emplace(id, std::move(synth));
    }

    cfg_.useESpeak = anyESpeak;
    if (anyESpeak) {
        if (eSpeakDataPath) {
            cfg_.eSpeakDataPath = eSpeakDataPath->string();
        } else {
            auto exePath = std::filesystem::canonical("/proc/self/exe");
            cfg_.eSpeakDataPath = std::filesystem::absolute(exePath.parent_path().append("espeak-ng-data")).string();
        }
    }

    // espeak-ng keeps global state, so it is initialized once for all voices.
    piper::initialize(cfg_);
}

PiperProvider::~PiperProvider() {
    piper::terminate(cfg_);
}

bool PiperProvider::hasVoice(const string& voiceId) const {
    return voices_.count(voiceId) > 0;
}

VoxProviderAudio PiperProvider::synthesizeWord(const string& word, const string& voiceId,
                                               const VoxCancelToken& cancel) {
    auto it = voices_.find(voiceId);
    if (it == voices_.end()) throw runtime_error("unknown voice '" + voiceId + "'");
    if (isCancelled(cancel)) throw VoxCancelledError();

    VoxProviderAudio audio;
    audio.samples = it->second->synthesizePcm(cfg_, word, eSpeakMutex_);
    audio.sampleRate = it->second->nativeSampleRate();
    audio.channels = 1;
    if (isCancelled(cancel)) throw VoxCancelledError();
    if (audio.samples.empty()) throw runtime_error("piper produced no audio for '" + word + "'");

    spdlog::debug("piper rendered '{}' with voice {}: {} samples at {} Hz", word, voiceId, audio.samples.size(),
                  audio.sampleRate);
    return audio;
}
