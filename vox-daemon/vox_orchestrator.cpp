#include "vox_orchestrator.hpp"

#include <algorithm>
#include <cctype>
#include <map>

#include <spdlog/spdlog.h>

#include "vox_audio.hpp"

using namespace std;

VoxOrchestrator::VoxOrchestrator(VoxWordBank& bank, VoxGenerator& generator, const VoxOrchestratorOptions& opts,
                                 unique_ptr<VoxDspChain> dsp)
    : bank_(bank),
      generator_(generator),
      opts_(opts),
      tokenizer_(opts.tokenizer),
      concatenator_(opts.pauseMode),
      filter_(dsp ? VoxFilterEngine(std::move(dsp)) : VoxFilterEngine()) {
    if (opts_.limits.minWordGapMs < 0 || opts_.limits.minWordGapMs > opts_.limits.maxWordGapMs) {
        throw invalid_argument("Invalid word gap limits");
    }
}

void VoxOrchestrator::validateIds(const string& voiceId, const string& scopeId) const {
    if (!isValidIdentifier(scopeId)) throw VoxValidationError("Invalid scope id '" + scopeId + "'");
    if (!isValidIdentifier(voiceId)) throw VoxValidationError("Invalid voice id '" + voiceId + "'");
}

void VoxOrchestrator::validateText(const string& text) const {
    const bool blank = all_of(text.begin(), text.end(), [](unsigned char c) { return isspace(c); });
    if (blank) throw VoxValidationError("Message text is empty");
    if (text.size() > opts_.limits.maxMessageLength) {
        throw VoxValidationError("Message is " + to_string(text.size()) + " characters, the limit is " +
                                 to_string(opts_.limits.maxMessageLength));
    }
}

int VoxOrchestrator::resolveGap(optional<int> wordGapMs) const {
    const int gap = wordGapMs.value_or(opts_.defaultWordGapMs);
    if (gap < opts_.limits.minWordGapMs || gap > opts_.limits.maxWordGapMs) {
        throw VoxValidationError("Word gap " + to_string(gap) + " ms is outside " +
                                 to_string(opts_.limits.minWordGapMs) + "-" + to_string(opts_.limits.maxWordGapMs) +
                                 " ms");
    }
    return gap;
}

VoxTokenization VoxOrchestrator::prepareTokens(const VoxRequest& request) const {
    VoxTokenization out;
    if (request.tokens) {
        if (request.tokens->empty()) throw VoxValidationError("Composition has no tokens");
        for (const auto& t : *request.tokens) {
            if (!t.isWord()) {
                if (t.pauseDurationMs < 0) throw VoxValidationError("Pause duration must be non-negative");
                if (t.pauseDurationMs > opts_.limits.maxPauseMs) {
                    throw VoxValidationError("Pause of " + to_string(t.pauseDurationMs) + " ms exceeds the limit of " +
                                             to_string(opts_.limits.maxPauseMs) + " ms");
                }
                out.tokens.push_back(t);
                continue;
            }
            auto reason = tokenizer_.validateWord(t.word);
            if (reason.empty()) {
                out.tokens.push_back(t);
            } else {
                out.invalid.push_back(VoxInvalidWord{t.word, t.position, reason});
            }
        }
    } else {
        if (!request.text) throw VoxValidationError("Request has neither text nor tokens");
        validateText(*request.text);
        out = tokenizer_.tokenize(*request.text);
    }

    const size_t words = out.wordCount() + out.invalid.size();
    if (words > opts_.limits.maxWords) {
        throw VoxValidationError("Message has " + to_string(words) + " words, the limit is " +
                                 to_string(opts_.limits.maxWords));
    }
    return out;
}

// Failure kind for exceptions that do not carry one.
static VoxErrorKind errorKindForStage(VoxStage stage) {
    switch (stage) {
        case VoxStage::Tokenizing: return VoxErrorKind::Validation;
        case VoxStage::CheckingCache: return VoxErrorKind::Storage;
        case VoxStage::Generating: return VoxErrorKind::Provider;
        case VoxStage::Concatenating: return VoxErrorKind::Concatenation;
        case VoxStage::Filtering: return VoxErrorKind::Filter;
        case VoxStage::Done:
        case VoxStage::Failed: break;
    }
    return VoxErrorKind::Storage;
}

static void fail(VoxSynthesisResult& result, VoxErrorKind kind, const char* what) {
    result.success = false;
    result.failedStage = result.state;
    result.errorKind = kind;
    result.errorMessage = what;
    result.buffer.clear();
    result.durationEstimate = 0.0;
    if (kind == VoxErrorKind::Validation || kind == VoxErrorKind::Cancelled) {
        spdlog::warn("Synthesis failed during {}: {}", toString(result.failedStage), what);
    } else {
        spdlog::error("Synthesis failed during {}: {}", toString(result.failedStage), what);
    }
}

VoxSynthesisResult VoxOrchestrator::synthesize(const VoxRequest& request, const VoxProgressCallback& progress,
                                               const VoxCancelToken& cancel) {
    VoxSynthesisResult result;
    auto enter = [&](VoxStage stage) {
        result.state = stage;
        if (progress) {
            VoxProgress p;
            p.stage = stage;
            progress(p);
        }
    };
    auto checkCancelled = [&]() {
        if (isCancelled(cancel)) throw VoxCancelledError();
    };

    try {
        enter(VoxStage::Tokenizing);
        validateIds(request.voiceId, request.scopeId);
        result.wordGapMs = resolveGap(request.wordGapMs);
        auto tokenization = prepareTokens(request);
        for (const auto& bad : tokenization.invalid) {
            result.skippedWords.push_back(VoxSkippedWord{bad.word, bad.position, bad.reason});
        }
        checkCancelled();

        result.state = VoxStage::CheckingCache;
        if (request.generateMissing) {
            VoxProgressCallback forward = [&](const VoxProgress& p) {
                result.state = p.stage;
                if (progress) progress(p);
            };
            result.generation =
                generator_.generateMissing(tokenization.tokens, request.voiceId, request.scopeId, forward, cancel);
        } else {
            enter(VoxStage::CheckingCache);
            for (const auto& t : tokenization.tokens) {
                if (!t.isWord() || result.generation.count(t.word)) continue;
                const bool hit = bank_.contains(VoxCacheKey{request.scopeId, t.word, request.voiceId});
                result.generation[t.word] = hit ? VoxGenerationResult{VoxGenerationStatus::Cached, "", 0}
                                                : VoxGenerationResult{VoxGenerationStatus::Skipped,
                                                                      "not in word bank", 0};
            }
        }
        checkCancelled();

        // Order comes from the token list; each distinct clip is loaded once.
        VoxComposition composition;
        composition.reserve(tokenization.tokens.size());
        map<string, shared_ptr<const VoxWordClip>> clips;
        for (const auto& t : tokenization.tokens) {
            if (!t.isWord()) {
                composition.push_back(VoxCompositionEntry{t, nullptr});
                continue;
            }
            const auto& gen = result.generation[t.word];
            if (!gen.ok()) {
                result.skippedWords.push_back(VoxSkippedWord{t.word, t.position, gen.reason});
                continue;
            }
            auto it = clips.find(t.word);
            if (it == clips.end()) {
                auto clip = bank_.get(VoxCacheKey{request.scopeId, t.word, request.voiceId});
                shared_ptr<const VoxWordClip> shared;
                if (clip) shared = make_shared<const VoxWordClip>(std::move(*clip));
                it = clips.emplace(t.word, std::move(shared)).first;
            }
            if (!it->second) {
                result.skippedWords.push_back(VoxSkippedWord{t.word, t.position, "clip missing from word bank"});
                continue;
            }
            composition.push_back(VoxCompositionEntry{t, it->second});
            result.matchedWords.push_back(t.word);
        }

        for (const auto& s : result.skippedWords) {
            spdlog::warn("Skipping '{}' at position {}: {}", s.word, s.position, s.reason);
        }
        if (result.matchedWords.empty()) throw VoxError(VoxErrorKind::ZeroMatch, "no content to synthesize");

        enter(VoxStage::Concatenating);
        auto joined = concatenator_.concatenate(composition, result.wordGapMs);
        result.segments = std::move(joined.segments);
        checkCancelled();

        enter(VoxStage::Filtering);
        result.buffer = filter_.apply(joined.buffer, request.filter);
        checkCancelled();

        result.durationEstimate = durationForBytes(result.buffer.size());
        result.success = true;
        result.state = VoxStage::Done;
        spdlog::info("Synthesized {} words ({} skipped) for scope {} voice {}: {} bytes, {:.3f}s",
                     result.matchedWords.size(), result.skippedWords.size(), request.scopeId, request.voiceId,
                     result.buffer.size(), result.durationEstimate);
    } catch (const VoxError& e) {
        fail(result, e.kind(), e.what());
    } catch (const exception& e) {
        fail(result, errorKindForStage(result.state), e.what());
    }

    if (!result.success) result.state = VoxStage::Failed;
    // The outcome is settled; a failing listener can no longer change it.
    if (progress) {
        VoxProgress p;
        p.stage = result.state;
        try {
            progress(p);
        } catch (const exception& e) {
            spdlog::warn("Progress callback failed: {}", e.what());
        }
    }
    return result;
}

VoxPreview VoxOrchestrator::preview(const string& text, const string& voiceId, const string& scopeId,
                                    optional<int> wordGapMs) const {
    validateIds(voiceId, scopeId);
    const int gap = resolveGap(wordGapMs);
    VoxRequest request;
    request.text = text;
    auto tokenization = prepareTokens(request);

    VoxPreview out;
    out.invalid = tokenization.invalid;

    // Mirrors the concatenator's silence rules on metadata only.
    uint64_t bytes = 0;
    bool emitted = false;
    int64_t pendingPauseMs = 0;
    for (const auto& t : tokenization.tokens) {
        if (!t.isWord()) {
            if (emitted) pendingPauseMs += t.pauseDurationMs;
            continue;
        }
        auto m = bank_.meta(VoxCacheKey{scopeId, t.word, voiceId});
        VoxPreviewEntry entry{t.word, t.position, m.has_value(), m ? m->durationSeconds : 0.0};
        out.entries.push_back(entry);
        if (!m) {
            out.missing++;
            continue;
        }
        out.matched++;
        if (emitted) {
            const bool overridden = opts_.pauseMode == VoxPauseMode::Override && pendingPauseMs > 0;
            bytes += silenceBytes(overridden ? pendingPauseMs : static_cast<int64_t>(gap) + pendingPauseMs);
        }
        bytes += m->sizeBytes;
        emitted = true;
        pendingPauseMs = 0;
    }
    out.durationEstimate = durationForBytes(bytes);
    return out;
}
