#include "vox_archive.hpp"

#include <algorithm>
#include <chrono>

#include <nlohmann/json.hpp>

#include "vox_audio.hpp"
#include "vox_error.hpp"

using json = nlohmann::json;
using namespace std;

static const char kMagic[4] = {'V', 'O', 'X', 'A'};

static void appendLittleEndian4(vector<uint8_t>& b, uint32_t v) {
    b.push_back(static_cast<uint8_t>(v & 0xFF));
    b.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    b.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    b.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
}

static uint32_t readLittleEndian4(span<const uint8_t> data, size_t& offset) {
    if (offset + 4 > data.size()) throw VoxArchiveError("Archive is truncated");
    uint32_t v = static_cast<uint32_t>(data[offset]) |
                 (static_cast<uint32_t>(data[offset + 1]) << 8) |
                 (static_cast<uint32_t>(data[offset + 2]) << 16) |
                 (static_cast<uint32_t>(data[offset + 3]) << 24);
    offset += 4;
    return v;
}

vector<uint8_t> encodeVoxArchive(const string& scopeId, const vector<VoxWordClip>& clips) {
    json manifest;
    manifest["version"] = kVoxArchiveVersion;
    manifest["exportedAt"] = chrono::duration_cast<chrono::milliseconds>(
                                 chrono::system_clock::now().time_since_epoch()).count();
    manifest["scopeId"] = scopeId;
    manifest["format"] = {{"sampleRate", kVoxSampleRate},
                          {"bitsPerSample", kVoxBitsPerSample},
                          {"channels", kVoxChannels}};

    uint64_t totalSize = 0;
    json entries = json::array();
    for (const auto& clip : clips) {
        entries.push_back({{"word", clip.meta.key.word},
                           {"voice", clip.meta.key.voiceId},
                           {"sizeBytes", clip.audioBytes.size()},
                           {"durationSeconds", clip.meta.durationSeconds},
                           {"createdAt", clip.meta.createdAt}});
        totalSize += clip.audioBytes.size();
    }
    manifest["totalClips"] = clips.size();
    manifest["totalSizeBytes"] = totalSize;
    manifest["clips"] = std::move(entries);

    const string manifestText = manifest.dump();
    vector<uint8_t> out;
    out.reserve(12 + manifestText.size() + totalSize + 4 * clips.size());
    out.insert(out.end(), kMagic, kMagic + 4);
    appendLittleEndian4(out, kVoxArchiveVersion);
    appendLittleEndian4(out, static_cast<uint32_t>(manifestText.size()));
    out.insert(out.end(), manifestText.begin(), manifestText.end());
    for (const auto& clip : clips) {
        appendLittleEndian4(out, static_cast<uint32_t>(clip.audioBytes.size()));
        out.insert(out.end(), clip.audioBytes.begin(), clip.audioBytes.end());
    }
    return out;
}

VoxArchive decodeVoxArchive(span<const uint8_t> data) {
    if (data.size() < 12 || !equal(kMagic, kMagic + 4, data.begin())) {
        throw VoxArchiveError("Not a VOX archive");
    }
    size_t offset = 4;
    const uint32_t version = readLittleEndian4(data, offset);
    if (version != kVoxArchiveVersion) {
        throw VoxArchiveError("Unsupported archive version " + to_string(version));
    }
    const uint32_t manifestLen = readLittleEndian4(data, offset);
    if (offset + manifestLen > data.size()) throw VoxArchiveError("Archive manifest is truncated");

    json manifest;
    try {
        manifest = json::parse(data.begin() + offset, data.begin() + offset + manifestLen);
    } catch (const json::exception& e) {
        throw VoxArchiveError(string("Archive manifest is not valid JSON: ") + e.what());
    }
    offset += manifestLen;

    VoxArchive archive;
    try {
        const auto& fmt = manifest.at("format");
        if (fmt.at("sampleRate").get<int>() != kVoxSampleRate ||
            fmt.at("bitsPerSample").get<int>() != kVoxBitsPerSample ||
            fmt.at("channels").get<int>() != kVoxChannels) {
            throw VoxArchiveError("Archive audio format does not match the system format");
        }
        archive.sourceScope = manifest.value("scopeId", "");
        archive.exportedAt = manifest.value<int64_t>("exportedAt", 0);

        for (const auto& entry : manifest.at("clips")) {
            VoxArchiveItem item;
            item.word = entry.at("word").get<string>();
            item.voiceId = entry.at("voice").get<string>();
            item.sizeBytes = entry.at("sizeBytes").get<uint64_t>();
            item.durationSeconds = entry.at("durationSeconds").get<double>();
            item.createdAt = entry.value<int64_t>("createdAt", 0);
            archive.items.push_back(std::move(item));
        }
    } catch (const json::exception& e) {
        throw VoxArchiveError(string("Archive manifest is malformed: ") + e.what());
    }

    for (auto& item : archive.items) {
        const uint32_t len = readLittleEndian4(data, offset);
        if (offset + len > data.size()) throw VoxArchiveError("Archive payload for '" + item.word + "' is truncated");
        item.payload.assign(data.begin() + offset, data.begin() + offset + len);
        offset += len;
    }
    if (offset != data.size()) throw VoxArchiveError("Archive has trailing data after the last payload");
    return archive;
}
