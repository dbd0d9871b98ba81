#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

enum class VoxTokenKind { Word, Pause };

struct VoxToken {
    std::string word;
    VoxTokenKind kind = VoxTokenKind::Word;
    int pauseDurationMs = 0;
    size_t position = 0; // index of the whitespace-separated chunk it came from

    static VoxToken makeWord(std::string w, size_t pos = 0) {
        return VoxToken{std::move(w), VoxTokenKind::Word, 0, pos};
    }
    static VoxToken makePause(int ms, size_t pos = 0) {
        return VoxToken{"", VoxTokenKind::Pause, ms, pos};
    }
    bool isWord() const { return kind == VoxTokenKind::Word; }
};

struct VoxCacheKey {
    std::string scopeId;
    std::string word;
    std::string voiceId;

    bool operator==(const VoxCacheKey& o) const {
        return scopeId == o.scopeId && word == o.word && voiceId == o.voiceId;
    }
};

struct VoxCacheKeyHash {
    size_t operator()(const VoxCacheKey& k) const {
        size_t h = std::hash<std::string>{}(k.scopeId);
        h ^= std::hash<std::string>{}(k.voiceId) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        h ^= std::hash<std::string>{}(k.word) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        return h;
    }
};

// Clip metadata as kept in the in-memory index and in the sidecar files.
struct VoxClipMeta {
    VoxCacheKey key;
    double durationSeconds = 0.0;
    uint64_t sizeBytes = 0;
    int64_t createdAt = 0; // unix milliseconds
};

struct VoxWordClip {
    VoxClipMeta meta;
    std::vector<uint8_t> audioBytes;
};

enum class VoxGenerationStatus { Cached, Generated, Failed, Skipped };

struct VoxGenerationResult {
    VoxGenerationStatus status = VoxGenerationStatus::Skipped;
    std::string reason;
    int attempts = 0;

    bool ok() const {
        return status == VoxGenerationStatus::Cached || status == VoxGenerationStatus::Generated;
    }
};

struct VoxCompositionEntry {
    VoxToken token;
    std::shared_ptr<const VoxWordClip> clip; // null for pauses and unresolved words
};

using VoxComposition = std::vector<VoxCompositionEntry>;

enum class VoxFilterPreset { Off, Light, Heavy };

struct VoxCustomFilterSettings {
    double highpassHz = 0.0;
    double lowpassHz = 0.0;
    double compressionRatio = 1.0;
    double distortion = 0.0;
};

using VoxFilterSpec = std::variant<VoxFilterPreset, VoxCustomFilterSettings>;

enum class VoxPauseMode { Additive, Override };

enum class VoxStage { Tokenizing, CheckingCache, Generating, Concatenating, Filtering, Done, Failed };

struct VoxProgress {
    VoxStage stage = VoxStage::Tokenizing;
    size_t total = 0;
    size_t cached = 0;
    size_t generated = 0;
    size_t failed = 0;
    std::string word;
};

using VoxProgressCallback = std::function<void(const VoxProgress&)>;

// Shared cancellation flag. A null token never cancels.
using VoxCancelToken = std::shared_ptr<std::atomic<bool>>;

inline VoxCancelToken makeCancelToken() { return std::make_shared<std::atomic<bool>>(false); }
inline bool isCancelled(const VoxCancelToken& token) { return token && token->load(); }

const char* toString(VoxGenerationStatus status);
const char* toString(VoxFilterPreset preset);
const char* toString(VoxPauseMode mode);
const char* toString(VoxStage stage);

std::optional<VoxFilterPreset> parseFilterPreset(const std::string& name);
std::optional<VoxPauseMode> parsePauseMode(const std::string& name);

// Scope and voice identifiers end up as directory names.
bool isValidIdentifier(const std::string& id);
