#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "piper/piper.hpp"

#include "vox_config.hpp"
#include "vox_provider.hpp"

// One loaded piper voice. Its ONNX session is used by one caller at a time.
class PiperVoiceSynthesizer {
public:
    PiperVoiceSynthesizer(piper::PiperConfig& cfg, const VoxVoiceConfig& opts);

    PiperVoiceSynthesizer(const PiperVoiceSynthesizer&) = delete;
    PiperVoiceSynthesizer& operator=(const PiperVoiceSynthesizer&) = delete;

    int nativeSampleRate() const { return voice_.synthesisConfig.sampleRate; }
    bool usesESpeak() const { return voice_.phonemizeConfig.phonemeType == piper::eSpeakPhonemes; }

    // Mono PCM at the native rate. eSpeakMutex guards the process-wide
    // espeak-ng state and is taken for eSpeak-phoneme voices only.
    std::vector<int16_t> synthesizePcm(piper::PiperConfig& cfg, const std::string& text, std::mutex& eSpeakMutex);

private:
    piper::Voice voice_;
    std::mutex mutex_;
};

// Owns the single piper/espeak-ng initialization of the process and every
// configured voice.
class PiperProvider : public VoxSynthesisProvider {
public:
    explicit PiperProvider(const std::map<std::string, VoxVoiceConfig>& voices);
    ~PiperProvider() override;

    PiperProvider(const PiperProvider&) = delete;
    PiperProvider& operator=(const PiperProvider&) = delete;

    VoxProviderAudio synthesizeWord(const std::string& word, const std::string& voiceId,
                                    const VoxCancelToken& cancel) override;
    bool hasVoice(const std::string& voiceId) const override;

private:
    piper::PiperConfig cfg_;
    std::mutex eSpeakMutex_;
    std::map<std::string, std::unique_ptr<PiperVoiceSynthesizer>> voices_;
};
