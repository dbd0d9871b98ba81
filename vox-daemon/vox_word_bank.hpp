#pragma once

#include <array>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "vox_types.hpp"

struct VoxVoiceStats {
    size_t words = 0;
    uint64_t bytes = 0;
};

struct VoxCacheStats {
    size_t totalWords = 0;
    uint64_t totalBytes = 0;
    size_t voicesUsed = 0;
    std::map<std::string, VoxVoiceStats> perVoice;
};

struct VoxImportRejection {
    std::string word;
    std::string voiceId;
    std::string reason;
};

struct VoxImportReport {
    size_t imported = 0;
    size_t overwritten = 0;
    size_t keptExisting = 0;
    std::vector<VoxImportRejection> rejected;
};

// Persistent per-scope, per-voice store of synthesized word clips.
//
// Layout: <root>/<scope>/<voice>/<word>.pcm with a <word>.json metadata
// sidecar. The sidecars are scanned at construction to build the in-memory
// index, so listing and stats never touch audio payloads. Files are replaced
// by rename, and writers of the same key are serialized by striped locks;
// writers of different keys do not contend beyond the index update.
class VoxWordBank {
public:
    explicit VoxWordBank(std::filesystem::path root);

    VoxWordBank(const VoxWordBank&) = delete;
    VoxWordBank& operator=(const VoxWordBank&) = delete;

    std::optional<VoxWordClip> get(const VoxCacheKey& key) const;
    std::optional<VoxClipMeta> meta(const VoxCacheKey& key) const;
    bool contains(const VoxCacheKey& key) const { return meta(key).has_value(); }

    // Stores (or replaces) a clip. Bytes must be non-empty system-format PCM.
    VoxClipMeta put(const VoxCacheKey& key, std::vector<uint8_t> audioBytes,
                    std::optional<int64_t> createdAt = std::nullopt);

    bool purgeWord(const VoxCacheKey& key);
    size_t purge(const std::string& scopeId, const std::optional<std::string>& voiceId = std::nullopt);

    std::vector<VoxClipMeta> list(const std::string& scopeId, const std::string& voiceId) const;
    std::vector<VoxClipMeta> search(const std::string& scopeId, const std::string& voiceId,
                                    const std::string& query, size_t maxResults = 25) const;
    std::vector<std::string> voices(const std::string& scopeId) const;
    VoxCacheStats stats(const std::string& scopeId) const;

    std::vector<uint8_t> exportArchive(const std::string& scopeId,
                                       const std::optional<std::string>& voiceId = std::nullopt) const;
    VoxImportReport importArchive(const std::string& scopeId, std::span<const uint8_t> archive,
                                  bool overwrite = true);

    const std::filesystem::path& root() const { return root_; }
    size_t size() const;

    static bool isValidCacheWord(const std::string& word);

private:
    std::filesystem::path clipPath(const VoxCacheKey& key) const;
    std::filesystem::path metaPath(const VoxCacheKey& key) const;
    std::mutex& keyLock(const VoxCacheKey& key) const;
    void loadIndex();
    bool removeLocked(const VoxCacheKey& key);
    std::vector<VoxClipMeta> collect(const std::string& scopeId, const std::optional<std::string>& voiceId) const;

    std::filesystem::path root_;
    mutable std::shared_mutex indexMutex_;
    std::unordered_map<VoxCacheKey, VoxClipMeta, VoxCacheKeyHash> index_;
    mutable std::array<std::mutex, 64> keyLocks_;
};
