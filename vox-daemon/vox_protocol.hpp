#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "vox_orchestrator.hpp"
#include "vox_word_bank.hpp"

enum class VoxOp { Synthesize, Preview, Stats, List, Search, Purge, Export, Import };

const char* toString(VoxOp op);

enum class VoxOutputFormat { Pcm, Wav };

// One parsed stdin line. Fields not used by the op keep their defaults.
struct VoxDaemonRequest {
    VoxOp op = VoxOp::Synthesize;
    nlohmann::json id;

    VoxRequest synth;
    VoxOutputFormat format = VoxOutputFormat::Pcm;
    std::optional<std::filesystem::path> output;
    std::optional<std::filesystem::path> input;

    std::optional<std::string> voice; // optional filter for purge/export
    std::optional<std::string> word;
    std::string query;
    size_t maxResults = 25;
    bool overwrite = true;
};

struct VoxRequestDefaults {
    std::string voiceId;
    std::string scopeId = "default";
    bool generateMissing = true;
};

// Throws VoxValidationError on malformed requests.
VoxDaemonRequest parseRequest(const nlohmann::json& j, const VoxRequestDefaults& defaults);

// "off" | "light" | "heavy", or {"highpass_hz", "lowpass_hz", "compression_ratio", "distortion"}.
VoxFilterSpec parseFilterSpec(const nlohmann::json& j);

// Strings are words; objects are {"word": ...} or {"pause_ms": ...}.
std::vector<VoxToken> parseTokens(const nlohmann::json& j);

nlohmann::json toJson(const VoxSynthesisResult& result);
nlohmann::json toJson(const VoxPreview& preview);
nlohmann::json toJson(const VoxProgress& progress);
nlohmann::json toJson(const VoxCacheStats& stats);
nlohmann::json toJson(const VoxClipMeta& meta);
nlohmann::json toJson(const std::vector<VoxClipMeta>& metas);
nlohmann::json toJson(const VoxImportReport& report);
