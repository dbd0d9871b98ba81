#include "vox_word_bank.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cmath>
#include <fstream>
#include <iterator>
#include <set>
#include <tuple>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "vox_archive.hpp"
#include "vox_audio.hpp"
#include "vox_error.hpp"

using json = nlohmann::json;
using namespace std;
namespace fs = std::filesystem;

namespace {

atomic<uint64_t> gTempCounter{0};

int64_t nowMillis() {
    return chrono::duration_cast<chrono::milliseconds>(chrono::system_clock::now().time_since_epoch()).count();
}

vector<uint8_t> readFile(const fs::path& path) {
    ifstream in(path, ios::binary);
    if (!in.is_open()) throw VoxStorageError("Cannot open " + path.string());
    vector<uint8_t> data((istreambuf_iterator<char>(in)), istreambuf_iterator<char>());
    if (in.bad()) throw VoxStorageError("Failed to read " + path.string());
    return data;
}

void writeFileAtomic(const fs::path& path, const char* data, size_t n) {
    auto tmp = path;
    tmp += ".tmp" + to_string(gTempCounter.fetch_add(1));
    {
        ofstream out(tmp, ios::binary | ios::trunc);
        if (!out.is_open()) throw VoxStorageError("Cannot create " + tmp.string());
        out.write(data, static_cast<streamsize>(n));
        out.flush();
        if (!out.good()) {
            out.close();
            error_code ec;
            fs::remove(tmp, ec);
            throw VoxStorageError("Failed to write " + tmp.string());
        }
    }
    error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw VoxStorageError("Failed to replace " + path.string() + ": " + ec.message());
    }
}

void validateKey(const VoxCacheKey& key) {
    if (!isValidIdentifier(key.scopeId)) throw VoxValidationError("Invalid scope id '" + key.scopeId + "'");
    if (!isValidIdentifier(key.voiceId)) throw VoxValidationError("Invalid voice id '" + key.voiceId + "'");
    if (!VoxWordBank::isValidCacheWord(key.word)) throw VoxValidationError("Invalid word '" + key.word + "'");
}

json metaToJson(const VoxClipMeta& m) {
    return json{{"scope", m.key.scopeId},
                {"voice", m.key.voiceId},
                {"word", m.key.word},
                {"size_bytes", m.sizeBytes},
                {"duration_seconds", m.durationSeconds},
                {"created_at", m.createdAt}};
}

} // namespace

bool VoxWordBank::isValidCacheWord(const string& word) {
    if (word.empty() || word.size() > 64) return false;
    auto ok = [](unsigned char c) { return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9'); };
    if (!ok(static_cast<unsigned char>(word.front()))) return false;
    return all_of(word.begin(), word.end(), [&](unsigned char c) { return ok(c) || c == '-' || c == '_'; });
}

VoxWordBank::VoxWordBank(fs::path root) : root_(std::move(root)) {
    error_code ec;
    fs::create_directories(root_, ec);
    if (ec) throw VoxStorageError("Cannot create cache root " + root_.string() + ": " + ec.message());
    loadIndex();
}

fs::path VoxWordBank::clipPath(const VoxCacheKey& key) const {
    return root_ / key.scopeId / key.voiceId / (key.word + ".pcm");
}

fs::path VoxWordBank::metaPath(const VoxCacheKey& key) const {
    return root_ / key.scopeId / key.voiceId / (key.word + ".json");
}

mutex& VoxWordBank::keyLock(const VoxCacheKey& key) const {
    return keyLocks_[VoxCacheKeyHash{}(key) % keyLocks_.size()];
}

void VoxWordBank::loadIndex() {
    size_t loaded = 0, dropped = 0;
    for (const auto& scopeDir : fs::directory_iterator(root_)) {
        if (!scopeDir.is_directory() || !isValidIdentifier(scopeDir.path().filename().string())) continue;
        for (const auto& voiceDir : fs::directory_iterator(scopeDir.path())) {
            if (!voiceDir.is_directory() || !isValidIdentifier(voiceDir.path().filename().string())) continue;
            for (const auto& entry : fs::directory_iterator(voiceDir.path())) {
                if (!entry.is_regular_file() || entry.path().extension() != ".json") continue;
                try {
                    ifstream in(entry.path());
                    auto j = json::parse(in);
                    VoxClipMeta m;
                    m.key.scopeId = scopeDir.path().filename().string();
                    m.key.voiceId = voiceDir.path().filename().string();
                    m.key.word = j.at("word").get<string>();
                    if (!isValidCacheWord(m.key.word) || m.key.word != entry.path().stem().string()) {
                        spdlog::warn("Ignoring cache metadata {}: word '{}' does not match the file name",
                                     entry.path().string(), m.key.word);
                        dropped++;
                        continue;
                    }
                    m.sizeBytes = j.at("size_bytes").get<uint64_t>();
                    m.durationSeconds = j.at("duration_seconds").get<double>();
                    m.createdAt = j.value<int64_t>("created_at", 0);

                    error_code ec;
                    auto actual = fs::file_size(clipPath(m.key), ec);
                    if (ec || actual != m.sizeBytes) {
                        spdlog::warn("Dropping cache entry {}/{}/{}: payload missing or size mismatch",
                                     m.key.scopeId, m.key.voiceId, m.key.word);
                        dropped++;
                        continue;
                    }
                    index_[m.key] = m;
                    loaded++;
                } catch (const exception& e) {
                    spdlog::warn("Ignoring unreadable cache metadata {}: {}", entry.path().string(), e.what());
                    dropped++;
                }
            }
        }
    }
    spdlog::info("Word bank at {} loaded {} clips ({} dropped)", root_.string(), loaded, dropped);
}

optional<VoxClipMeta> VoxWordBank::meta(const VoxCacheKey& key) const {
    shared_lock<shared_mutex> lk(indexMutex_);
    auto it = index_.find(key);
    if (it == index_.end()) return nullopt;
    return it->second;
}

optional<VoxWordClip> VoxWordBank::get(const VoxCacheKey& key) const {
    lock_guard<mutex> keyLk(keyLock(key));
    auto m = meta(key);
    if (!m) return nullopt;

    VoxWordClip clip;
    clip.meta = *m;
    try {
        clip.audioBytes = readFile(clipPath(key));
    } catch (const VoxStorageError& e) {
        spdlog::warn("Cache entry {}/{}/{} unreadable: {}", key.scopeId, key.voiceId, key.word, e.what());
        return nullopt;
    }
    if (clip.audioBytes.size() != m->sizeBytes) {
        spdlog::warn("Cache entry {}/{}/{} size changed on disk ({} != {})", key.scopeId, key.voiceId,
                     key.word, clip.audioBytes.size(), m->sizeBytes);
        return nullopt;
    }
    return clip;
}

VoxClipMeta VoxWordBank::put(const VoxCacheKey& key, vector<uint8_t> audioBytes, optional<int64_t> createdAt) {
    validateKey(key);
    if (audioBytes.empty()) throw VoxValidationError("Refusing to cache an empty clip for '" + key.word + "'");
    if (!isFrameAligned(audioBytes.size())) {
        throw VoxValidationError("Clip for '" + key.word + "' is not aligned to the audio frame size");
    }

    VoxClipMeta m;
    m.key = key;
    m.sizeBytes = audioBytes.size();
    m.durationSeconds = durationForBytes(audioBytes.size());
    m.createdAt = createdAt.value_or(nowMillis());

    lock_guard<mutex> keyLk(keyLock(key));
    error_code ec;
    fs::create_directories(clipPath(key).parent_path(), ec);
    if (ec) throw VoxStorageError("Cannot create " + clipPath(key).parent_path().string() + ": " + ec.message());

    writeFileAtomic(clipPath(key), reinterpret_cast<const char*>(audioBytes.data()), audioBytes.size());
    const auto metaText = metaToJson(m).dump(2);
    writeFileAtomic(metaPath(key), metaText.data(), metaText.size());

    {
        unique_lock<shared_mutex> lk(indexMutex_);
        index_[key] = m;
    }
    spdlog::debug("Cached {}/{}/{} ({} bytes, {:.3f}s)", key.scopeId, key.voiceId, key.word, m.sizeBytes,
                  m.durationSeconds);
    return m;
}

bool VoxWordBank::removeLocked(const VoxCacheKey& key) {
    {
        unique_lock<shared_mutex> lk(indexMutex_);
        if (index_.erase(key) == 0) return false;
    }
    error_code ec;
    fs::remove(clipPath(key), ec);
    if (ec) spdlog::warn("Failed to remove {}: {}", clipPath(key).string(), ec.message());
    fs::remove(metaPath(key), ec);
    if (ec) spdlog::warn("Failed to remove {}: {}", metaPath(key).string(), ec.message());
    return true;
}

bool VoxWordBank::purgeWord(const VoxCacheKey& key) {
    lock_guard<mutex> keyLk(keyLock(key));
    return removeLocked(key);
}

vector<VoxClipMeta> VoxWordBank::collect(const string& scopeId, const optional<string>& voiceId) const {
    vector<VoxClipMeta> out;
    shared_lock<shared_mutex> lk(indexMutex_);
    for (const auto& [key, m] : index_) {
        if (key.scopeId != scopeId) continue;
        if (voiceId && key.voiceId != *voiceId) continue;
        out.push_back(m);
    }
    return out;
}

size_t VoxWordBank::purge(const string& scopeId, const optional<string>& voiceId) {
    size_t removed = 0;
    for (const auto& m : collect(scopeId, voiceId)) {
        lock_guard<mutex> keyLk(keyLock(m.key));
        if (removeLocked(m.key)) removed++;
    }

    // Drop directories left empty; non-empty ones (concurrent writers) stay.
    error_code ec;
    const auto scopeDir = root_ / scopeId;
    if (voiceId) {
        fs::remove(scopeDir / *voiceId, ec);
    } else if (fs::is_directory(scopeDir, ec)) {
        for (const auto& voiceDir : fs::directory_iterator(scopeDir, ec)) fs::remove(voiceDir.path(), ec);
    }
    fs::remove(scopeDir, ec);

    spdlog::info("Purged {} clips from scope {}{}", removed, scopeId, voiceId ? " voice " + *voiceId : "");
    return removed;
}

vector<VoxClipMeta> VoxWordBank::list(const string& scopeId, const string& voiceId) const {
    auto out = collect(scopeId, voiceId);
    sort(out.begin(), out.end(), [](const VoxClipMeta& a, const VoxClipMeta& b) { return a.key.word < b.key.word; });
    return out;
}

vector<VoxClipMeta> VoxWordBank::search(const string& scopeId, const string& voiceId, const string& query,
                                        size_t maxResults) const {
    string q = query;
    transform(q.begin(), q.end(), q.begin(), [](unsigned char c) { return static_cast<char>(tolower(c)); });
    if (q.empty() || maxResults == 0) return {};

    vector<VoxClipMeta> prefix, substring;
    for (auto& m : list(scopeId, voiceId)) {
        const auto pos = m.key.word.find(q);
        if (pos == 0) {
            prefix.push_back(std::move(m));
        } else if (pos != string::npos) {
            substring.push_back(std::move(m));
        }
    }

    vector<VoxClipMeta> results;
    for (auto* group : {&prefix, &substring}) {
        for (auto& m : *group) {
            if (results.size() >= maxResults) return results;
            results.push_back(std::move(m));
        }
    }
    return results;
}

vector<string> VoxWordBank::voices(const string& scopeId) const {
    set<string> names;
    for (const auto& m : collect(scopeId, nullopt)) names.insert(m.key.voiceId);
    return vector<string>(names.begin(), names.end());
}

VoxCacheStats VoxWordBank::stats(const string& scopeId) const {
    VoxCacheStats s;
    for (const auto& m : collect(scopeId, nullopt)) {
        s.totalWords++;
        s.totalBytes += m.sizeBytes;
        auto& v = s.perVoice[m.key.voiceId];
        v.words++;
        v.bytes += m.sizeBytes;
    }
    s.voicesUsed = s.perVoice.size();
    return s;
}

size_t VoxWordBank::size() const {
    shared_lock<shared_mutex> lk(indexMutex_);
    return index_.size();
}

vector<uint8_t> VoxWordBank::exportArchive(const string& scopeId, const optional<string>& voiceId) const {
    auto metas = collect(scopeId, voiceId);
    sort(metas.begin(), metas.end(), [](const VoxClipMeta& a, const VoxClipMeta& b) {
        return tie(a.key.voiceId, a.key.word) < tie(b.key.voiceId, b.key.word);
    });

    vector<VoxWordClip> clips;
    clips.reserve(metas.size());
    for (const auto& m : metas) {
        auto clip = get(m.key);
        if (!clip) {
            spdlog::warn("Skipping {}/{} during export: payload unavailable", m.key.voiceId, m.key.word);
            continue;
        }
        clips.push_back(std::move(*clip));
    }
    spdlog::info("Exporting {} clips from scope {}", clips.size(), scopeId);
    return encodeVoxArchive(scopeId, clips);
}

VoxImportReport VoxWordBank::importArchive(const string& scopeId, span<const uint8_t> archiveBytes, bool overwrite) {
    if (!isValidIdentifier(scopeId)) throw VoxValidationError("Invalid scope id '" + scopeId + "'");
    auto archive = decodeVoxArchive(archiveBytes);

    VoxImportReport report;
    vector<VoxArchiveItem*> accepted;
    set<pair<string, string>> seen;

    // Everything is validated before the first entry is committed.
    for (auto& item : archive.items) {
        auto reject = [&](const string& reason) {
            report.rejected.push_back(VoxImportRejection{item.word, item.voiceId, reason});
        };
        if (!isValidIdentifier(item.voiceId)) { reject("invalid voice id"); continue; }
        if (!isValidCacheWord(item.word)) { reject("invalid word"); continue; }
        if (item.payload.size() != item.sizeBytes) {
            reject("payload size " + to_string(item.payload.size()) + " does not match manifest size " +
                   to_string(item.sizeBytes));
            continue;
        }
        if (item.payload.empty() || !isFrameAligned(item.payload.size())) { reject("payload is not valid PCM"); continue; }
        if (fabs(durationForBytes(item.payload.size()) - item.durationSeconds) > 0.001) {
            reject("manifest duration does not match payload");
            continue;
        }
        if (!seen.insert({item.voiceId, item.word}).second) { reject("duplicate entry"); continue; }
        accepted.push_back(&item);
    }

    for (auto* item : accepted) {
        VoxCacheKey key{scopeId, item->word, item->voiceId};
        const bool exists = contains(key);
        if (exists && !overwrite) {
            report.keptExisting++;
            continue;
        }
        put(key, std::move(item->payload), item->createdAt);
        report.imported++;
        if (exists) report.overwritten++;
    }

    spdlog::info("Imported {} clips into scope {} from scope {} ({} overwritten, {} kept, {} rejected)",
                 report.imported, scopeId, archive.sourceScope, report.overwritten, report.keptExisting,
                 report.rejected.size());
    return report;
}
