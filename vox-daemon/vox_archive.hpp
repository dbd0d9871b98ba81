#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "vox_types.hpp"

// Transfer package for word bank content:
//   "VOXA" | u32 version | u32 manifest length | manifest JSON | (u32 length | payload)*
// All integers little-endian; payloads follow manifest order.
constexpr uint32_t kVoxArchiveVersion = 1;

struct VoxArchiveItem {
    std::string word;
    std::string voiceId;
    uint64_t sizeBytes = 0; // as declared by the manifest
    double durationSeconds = 0.0;
    int64_t createdAt = 0;
    std::vector<uint8_t> payload;
};

struct VoxArchive {
    std::string sourceScope;
    int64_t exportedAt = 0;
    std::vector<VoxArchiveItem> items;
};

std::vector<uint8_t> encodeVoxArchive(const std::string& scopeId, const std::vector<VoxWordClip>& clips);

// Throws VoxArchiveError on structural problems (magic, version, format,
// truncated payloads). Per-entry consistency is left to the importer.
VoxArchive decodeVoxArchive(std::span<const uint8_t> data);
