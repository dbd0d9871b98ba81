#include "vox_config.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

#include "vox_types.hpp"

using json = nlohmann::json;
using namespace std;

namespace {

VoxVoiceConfig parseVoice(const string& id, const json& j) {
    if (!j.is_object()) throw runtime_error("Voice '" + id + "' must be an object");
    VoxVoiceConfig v;
    if (!j.contains("encoder") || !j.contains("decoder") || !j.contains("config")) {
        throw runtime_error("Voice '" + id + "' needs encoder, decoder and config paths");
    }
    v.encoderPath = j.at("encoder").get<string>();
    v.decoderPath = j.at("decoder").get<string>();
    v.modelConfigPath = j.at("config").get<string>();
    if (j.contains("espeak_data") && !j["espeak_data"].is_null()) v.eSpeakDataPath = j["espeak_data"].get<string>();
    v.accelerator = j.value<string>("accelerator", "");
    if (j.contains("speaker_id") && !j["speaker_id"].is_null()) v.speakerId = j["speaker_id"].get<int64_t>();
    return v;
}

void applyTokenizer(const json& j, VoxTokenizerOptions& t) {
    if (j.contains("max_word_length")) t.maxWordLength = j["max_word_length"].get<size_t>();
    if (j.contains("contractions")) {
        auto mode = j["contractions"].get<string>();
        if (mode == "strip") {
            t.contractions = VoxContractionMode::Strip;
        } else if (mode == "expand") {
            t.contractions = VoxContractionMode::Expand;
        } else {
            throw runtime_error("tokenizer.contractions must be strip or expand");
        }
    }
    if (j.contains("expand_numbers")) t.expandNumbers = j["expand_numbers"].get<bool>();
    if (j.contains("pauses")) {
        const auto& p = j["pauses"];
        t.periodPauseMs = p.value("period", t.periodPauseMs);
        t.commaPauseMs = p.value("comma", t.commaPauseMs);
        t.ellipsisPauseMs = p.value("ellipsis", t.ellipsisPauseMs);
        t.dashPauseMs = p.value("dash", t.dashPauseMs);
    }
}

int parseIntArg(const string& flag, const char* value) {
    try {
        size_t used = 0;
        int v = stoi(value, &used);
        if (used != string(value).size()) throw invalid_argument(value);
        return v;
    } catch (const logic_error&) {
        throw runtime_error(flag + " expects an integer, got '" + value + "'");
    }
}

} // namespace

void applyConfigJson(const json& j, VoxConfig& cfg) {
    if (!j.is_object()) throw runtime_error("Config must be a JSON object");
    try {
        if (j.contains("cache_root")) cfg.cacheRoot = j["cache_root"].get<string>();
        if (j.contains("voices")) {
            for (const auto& [id, v] : j["voices"].items()) cfg.voices[id] = parseVoice(id, v);
        }
        if (j.contains("default_voice")) cfg.defaultVoice = j["default_voice"].get<string>();

        if (j.contains("generation")) {
            const auto& g = j["generation"];
            cfg.generation.concurrency = g.value("concurrency", cfg.generation.concurrency);
            cfg.generation.maxRetries = g.value("max_retries", cfg.generation.maxRetries);
            cfg.generation.retryBackoffMs = g.value("retry_backoff_ms", cfg.generation.retryBackoffMs);
        }
        if (j.contains("tokenizer")) applyTokenizer(j["tokenizer"], cfg.orchestrator.tokenizer);
        if (j.contains("limits")) {
            auto& l = cfg.orchestrator.limits;
            const auto& lj = j["limits"];
            l.maxMessageLength = lj.value("max_message_length", l.maxMessageLength);
            l.maxWords = lj.value("max_words", l.maxWords);
            l.minWordGapMs = lj.value("min_word_gap_ms", l.minWordGapMs);
            l.maxWordGapMs = lj.value("max_word_gap_ms", l.maxWordGapMs);
            l.maxPauseMs = lj.value("max_pause_ms", l.maxPauseMs);
        }
        if (j.contains("default_word_gap_ms")) cfg.orchestrator.defaultWordGapMs = j["default_word_gap_ms"].get<int>();
        if (j.contains("pause_mode")) {
            auto mode = parsePauseMode(j["pause_mode"].get<string>());
            if (!mode) throw runtime_error("pause_mode must be additive or override");
            cfg.orchestrator.pauseMode = *mode;
        }
        if (j.contains("max_concurrency")) cfg.maxConcurrency = j["max_concurrency"].get<int>();
    } catch (const json::exception& e) {
        throw runtime_error(string("Invalid config: ") + e.what());
    }
}

VoxConfig loadConfigFile(const filesystem::path& path) {
    ifstream in(path);
    if (!in.good()) throw runtime_error("Config file doesn't exist: " + path.string());
    json j;
    try {
        j = json::parse(in);
    } catch (const json::parse_error& e) {
        throw runtime_error("Config file is not valid JSON: " + string(e.what()));
    }
    VoxConfig cfg;
    applyConfigJson(j, cfg);
    return cfg;
}

void printUsage(const char* argv0) {
    cerr << "\nusage: " << argv0 << " [options]\n\n";
    cerr << "options:\n";
    cerr << "   -c, --config FILE         path to daemon config file (JSON)\n";
    cerr << "   --cache-root DIR          word bank directory\n";
    cerr << "   --voice ID                voice the model flags below apply to\n";
    cerr << "   --encoder FILE            path to encoder model file\n";
    cerr << "   --decoder FILE            path to decoder model file\n";
    cerr << "   --model-config FILE       path to model config file\n";
    cerr << "   --espeak_data DIR         path to espeak-ng data directory\n";
    cerr << "   --accelerator STR         accelerator for ONNX (e.g., cuda|tensorrt)\n";
    cerr << "   --concurrency N           simultaneous word generations per request (default 3)\n";
    cerr << "   --max-concurrency N       number of concurrent requests (default 1)\n";
    cerr << "   --word-gap MS             default silence between words (default 50)\n";
    cerr << "   --pause-mode MODE         additive|override\n";
    cerr << "   --retries N               extra provider attempts per word (default 0)\n";
    cerr << "   --play                    play results through ALSA\n";
    cerr << "   --volume FLOAT            volume level for audio playback (0.0 to 1.0)\n";
    cerr << "   --progress                emit progress events on stdout\n";
    cerr << "   --debug                   debug logging\n";
    cerr << "   -q, --quiet               disable logging\n";
}

VoxConfig parseArgs(int argc, char* argv[]) {
    VoxConfig cfg;
    for (int i = 1; i < argc; i++) {
        string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            cfg = loadConfigFile(argv[++i]);
            break;
        }
    }

    optional<string> voiceId;
    optional<filesystem::path> encoder, decoder, modelConfig, eSpeakData;
    optional<string> accelerator;

    for (int i = 1; i < argc; i++) {
        string arg = argv[i];
        const bool hasValue = i + 1 < argc;

        if ((arg == "-c" || arg == "--config") && hasValue) {
            i++;
        } else if (arg == "--cache-root" && hasValue) {
            cfg.cacheRoot = filesystem::path(argv[++i]);
        } else if (arg == "--voice" && hasValue) {
            voiceId = argv[++i];
        } else if (arg == "--encoder" && hasValue) {
            encoder = filesystem::path(argv[++i]);
        } else if (arg == "--decoder" && hasValue) {
            decoder = filesystem::path(argv[++i]);
        } else if (arg == "--model-config" && hasValue) {
            modelConfig = filesystem::path(argv[++i]);
        } else if ((arg == "--espeak_data" || arg == "--espeak-data") && hasValue) {
            eSpeakData = filesystem::path(argv[++i]);
        } else if (arg == "--accelerator" && hasValue) {
            accelerator = argv[++i];
        } else if (arg == "--concurrency" && hasValue) {
            cfg.generation.concurrency = parseIntArg(arg, argv[++i]);
        } else if (arg == "--max-concurrency" && hasValue) {
            cfg.maxConcurrency = parseIntArg(arg, argv[++i]);
        } else if (arg == "--word-gap" && hasValue) {
            cfg.orchestrator.defaultWordGapMs = parseIntArg(arg, argv[++i]);
        } else if (arg == "--pause-mode" && hasValue) {
            auto mode = parsePauseMode(argv[++i]);
            if (!mode) throw runtime_error("--pause-mode must be additive or override");
            cfg.orchestrator.pauseMode = *mode;
        } else if (arg == "--retries" && hasValue) {
            cfg.generation.maxRetries = parseIntArg(arg, argv[++i]);
        } else if (arg == "--play") {
            cfg.playAudio = true;
        } else if (arg == "--volume" && hasValue) {
            try {
                cfg.volume = stof(argv[i + 1]);
            } catch (const logic_error&) {
                throw runtime_error("--volume expects a number, got '" + string(argv[i + 1]) + "'");
            }
            i++;
            if (cfg.volume < 0.0f || cfg.volume > 1.0f) {
                throw runtime_error("Volume must be between 0.0 and 1.0");
            }
        } else if (arg == "--progress") {
            cfg.progress = true;
        } else if (arg == "--debug") {
            cfg.logLevel = spdlog::level::debug;
        } else if (arg == "-q" || arg == "--quiet") {
            cfg.logLevel = spdlog::level::off;
        } else if (arg == "-h" || arg == "--help") {
            cfg.showHelp = true;
        } else {
            throw runtime_error("Unknown or incomplete option: " + arg);
        }
    }

    // Model flags describe one voice, merged over the config file's entry.
    if (encoder || decoder || modelConfig || eSpeakData || accelerator) {
        const string id = voiceId.value_or(cfg.defaultVoice.empty() ? "default" : cfg.defaultVoice);
        auto& v = cfg.voices[id];
        if (encoder) v.encoderPath = *encoder;
        if (decoder) v.decoderPath = *decoder;
        if (modelConfig) v.modelConfigPath = *modelConfig;
        if (eSpeakData) v.eSpeakDataPath = *eSpeakData;
        if (accelerator) v.accelerator = *accelerator;
        if (cfg.defaultVoice.empty()) cfg.defaultVoice = id;
    } else if (voiceId) {
        cfg.defaultVoice = *voiceId;
    }
    if (cfg.defaultVoice.empty() && cfg.voices.size() == 1) cfg.defaultVoice = cfg.voices.begin()->first;
    return cfg;
}

void validateConfig(const VoxConfig& cfg) {
    if (cfg.cacheRoot.empty()) throw runtime_error("cache_root must not be empty");
    if (cfg.maxConcurrency < 1) throw runtime_error("max_concurrency must be at least 1");
    if (cfg.generation.concurrency < 1) throw runtime_error("generation.concurrency must be at least 1");
    if (cfg.generation.maxRetries < 0) throw runtime_error("generation.max_retries must be non-negative");
    if (cfg.generation.retryBackoffMs < 0) throw runtime_error("generation.retry_backoff_ms must be non-negative");

    const auto& t = cfg.orchestrator.tokenizer;
    if (t.maxWordLength < 1) throw runtime_error("tokenizer.max_word_length must be at least 1");
    if (t.periodPauseMs < 0 || t.commaPauseMs < 0 || t.ellipsisPauseMs < 0 || t.dashPauseMs < 0) {
        throw runtime_error("tokenizer.pauses must be non-negative");
    }

    const auto& l = cfg.orchestrator.limits;
    if (l.maxMessageLength < 1) throw runtime_error("limits.max_message_length must be at least 1");
    if (l.maxWords < 1) throw runtime_error("limits.max_words must be at least 1");
    if (l.minWordGapMs < 0 || l.minWordGapMs > l.maxWordGapMs) {
        throw runtime_error("limits.min_word_gap_ms must be between 0 and limits.max_word_gap_ms");
    }
    if (l.maxPauseMs < 0) throw runtime_error("limits.max_pause_ms must be non-negative");
    if (t.periodPauseMs > l.maxPauseMs || t.commaPauseMs > l.maxPauseMs || t.ellipsisPauseMs > l.maxPauseMs ||
        t.dashPauseMs > l.maxPauseMs) {
        throw runtime_error("tokenizer.pauses must not exceed limits.max_pause_ms");
    }
    const int gap = cfg.orchestrator.defaultWordGapMs;
    if (gap < l.minWordGapMs || gap > l.maxWordGapMs) {
        throw runtime_error("Default word gap " + to_string(gap) + " ms is outside the configured limits");
    }

    for (const auto& [id, v] : cfg.voices) {
        if (!isValidIdentifier(id)) throw runtime_error("Invalid voice id '" + id + "'");
        if (v.encoderPath.empty() || v.decoderPath.empty() || v.modelConfigPath.empty()) {
            throw runtime_error("Voice '" + id + "' needs encoder, decoder and model config paths");
        }
    }
    if (!cfg.defaultVoice.empty() && !cfg.voices.empty() && !cfg.voices.count(cfg.defaultVoice)) {
        throw runtime_error("default_voice '" + cfg.defaultVoice + "' is not configured");
    }
}

void checkVoiceFiles(const VoxConfig& cfg) {
    for (const auto& [id, v] : cfg.voices) {
        if (!filesystem::exists(v.encoderPath)) {
            throw runtime_error("Encoder model file for voice '" + id + "' doesn't exist");
        }
        if (!filesystem::exists(v.decoderPath)) {
            throw runtime_error("Decoder model file for voice '" + id + "' doesn't exist");
        }
        if (!filesystem::exists(v.modelConfigPath)) {
            throw runtime_error("Model config for voice '" + id + "' doesn't exist");
        }
    }
}
