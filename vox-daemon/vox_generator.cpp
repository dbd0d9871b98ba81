#include "vox_generator.hpp"

#include <algorithm>
#include <chrono>
#include <mutex>
#include <queue>
#include <set>
#include <stdexcept>
#include <thread>

#include <spdlog/spdlog.h>

#include "vox_audio.hpp"

using namespace std;

VoxGenerator::VoxGenerator(VoxWordBank& bank, VoxSynthesisProvider& provider, const VoxGeneratorOptions& opts)
    : bank_(bank), provider_(provider), opts_(opts) {
    opts_.concurrency = max(1, opts_.concurrency);
    opts_.maxRetries = max(0, opts_.maxRetries);
    opts_.retryBackoffMs = max(0, opts_.retryBackoffMs);
}

static void sleepUnlessCancelled(int ms, const VoxCancelToken& cancel) {
    auto deadline = chrono::steady_clock::now() + chrono::milliseconds(ms);
    while (!isCancelled(cancel) && chrono::steady_clock::now() < deadline) {
        this_thread::sleep_for(chrono::milliseconds(10));
    }
}

VoxGenerationResult VoxGenerator::generateOne(const VoxCacheKey& key, const VoxCancelToken& cancel) {
    VoxGenerationResult result;
    string lastError;
    for (int attempt = 0; attempt <= opts_.maxRetries; attempt++) {
        if (isCancelled(cancel)) {
            result.status = VoxGenerationStatus::Skipped;
            result.reason = "cancelled";
            return result;
        }
        result.attempts = attempt + 1;
        try {
            auto audio = provider_.synthesizeWord(key.word, key.voiceId, cancel);
            if (audio.samples.empty()) throw runtime_error("provider returned no audio");
            auto pcm = normalizeToSystemFormat(audio);
            if (pcm.empty()) throw runtime_error("provider audio was empty after conversion");
            bank_.put(key, std::move(pcm));
            result.status = VoxGenerationStatus::Generated;
            result.reason.clear();
            return result;
        } catch (const exception& e) {
            lastError = e.what();
            spdlog::warn("Synthesis of '{}' with voice {} failed (attempt {}/{}): {}", key.word, key.voiceId,
                         attempt + 1, opts_.maxRetries + 1, lastError);
        }
        if (attempt < opts_.maxRetries) sleepUnlessCancelled(opts_.retryBackoffMs * (attempt + 1), cancel);
    }
    result.status = isCancelled(cancel) ? VoxGenerationStatus::Skipped : VoxGenerationStatus::Failed;
    result.reason = isCancelled(cancel) ? "cancelled" : lastError;
    return result;
}

// A failing progress callback is logged and generation carries on.
static void report(const VoxProgressCallback& progress, const VoxProgress& state) {
    if (!progress) return;
    try {
        progress(state);
    } catch (const exception& e) {
        spdlog::warn("Progress callback failed: {}", e.what());
    }
}

VoxGenerationMap VoxGenerator::generateMissing(const vector<VoxToken>& tokens, const string& voiceId,
                                               const string& scopeId, const VoxProgressCallback& progress,
                                               const VoxCancelToken& cancel) {
    VoxGenerationMap results;
    // Callbacks are serialized but never run under the result lock.
    mutex progressMutex;
    size_t reportedDone = 0;
    VoxProgress state;
    state.stage = VoxStage::CheckingCache;

    // Unique words in first-occurrence order.
    vector<string> unique;
    set<string> seen;
    for (const auto& t : tokens) {
        if (t.isWord() && seen.insert(t.word).second) unique.push_back(t.word);
    }
    state.total = unique.size();

    queue<string> missing;
    for (const auto& w : unique) {
        if (bank_.contains(VoxCacheKey{scopeId, w, voiceId})) {
            results[w] = VoxGenerationResult{VoxGenerationStatus::Cached, "", 0};
            state.cached++;
        } else {
            missing.push(w);
        }
    }
    report(progress, state);

    spdlog::debug("Generation for scope {} voice {}: {} cached, {} missing", scopeId, voiceId, state.cached,
                  missing.size());
    if (missing.empty()) return results;

    state.stage = VoxStage::Generating;
    report(progress, state);

    if (!provider_.hasVoice(voiceId)) {
        while (!missing.empty()) {
            results[missing.front()] = VoxGenerationResult{VoxGenerationStatus::Failed, "unknown voice '" + voiceId + "'", 0};
            state.failed++;
            missing.pop();
        }
        report(progress, state);
        return results;
    }

    mutex mtx;
    const size_t workerCount = min(static_cast<size_t>(opts_.concurrency), missing.size());
    vector<thread> workers;
    workers.reserve(workerCount);
    for (size_t i = 0; i < workerCount; i++) {
        workers.emplace_back([&]() {
            while (true) {
                string word;
                {
                    lock_guard<mutex> lk(mtx);
                    if (missing.empty()) return;
                    word = missing.front();
                    missing.pop();
                }
                auto r = generateOne(VoxCacheKey{scopeId, word, voiceId}, cancel);

                VoxProgress snapshot;
                {
                    lock_guard<mutex> lk(mtx);
                    if (r.status == VoxGenerationStatus::Generated) {
                        state.generated++;
                    } else {
                        state.failed++;
                    }
                    results[word] = std::move(r);
                    state.word = word;
                    snapshot = state;
                }
                lock_guard<mutex> progressLk(progressMutex);
                const size_t done = snapshot.generated + snapshot.failed;
                if (done > reportedDone) {
                    reportedDone = done;
                    report(progress, snapshot);
                }
            }
        });
    }
    for (auto& t : workers) t.join();

    spdlog::info("Generated {} of {} missing words for voice {} ({} failed)", state.generated,
                 state.generated + state.failed, voiceId, state.failed);
    return results;
}
