#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "vox_generator.hpp"
#include "vox_orchestrator.hpp"

struct VoxVoiceConfig {
    std::filesystem::path encoderPath;
    std::filesystem::path decoderPath;
    std::filesystem::path modelConfigPath;
    std::optional<std::filesystem::path> eSpeakDataPath;
    std::string accelerator = ""; // e.g., "cuda", "tensorrt"
    std::optional<int64_t> speakerId;
};

struct VoxConfig {
    std::filesystem::path cacheRoot = "word-bank";
    std::map<std::string, VoxVoiceConfig> voices;
    std::string defaultVoice;

    VoxGeneratorOptions generation;
    VoxOrchestratorOptions orchestrator;

    int maxConcurrency = 1;
    bool playAudio = false;
    float volume = 1.0f;
    bool progress = false;
    spdlog::level::level_enum logLevel = spdlog::level::info;
    bool showHelp = false;
};

// Overlays the keys present in j onto cfg. Throws std::runtime_error.
void applyConfigJson(const nlohmann::json& j, VoxConfig& cfg);

VoxConfig loadConfigFile(const std::filesystem::path& path);

// Reads -c/--config first, then applies the remaining flags on top.
VoxConfig parseArgs(int argc, char* argv[]);

// Range and consistency checks; does not touch the filesystem.
void validateConfig(const VoxConfig& cfg);

// Model files of every configured voice must exist.
void checkVoiceFiles(const VoxConfig& cfg);

void printUsage(const char* argv0);
