#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "vox_concat.hpp"
#include "vox_error.hpp"
#include "vox_filter.hpp"
#include "vox_generator.hpp"
#include "vox_tokenizer.hpp"
#include "vox_types.hpp"
#include "vox_word_bank.hpp"

struct VoxLimits {
    size_t maxMessageLength = 500;
    size_t maxWords = 50;
    int minWordGapMs = 20;
    int maxWordGapMs = 200;
    int maxPauseMs = 5000; // per pause token
};

struct VoxOrchestratorOptions {
    VoxLimits limits;
    int defaultWordGapMs = 50;
    VoxPauseMode pauseMode = VoxPauseMode::Additive;
    VoxTokenizerOptions tokenizer;
};

// Either text or a pre-tokenized composition. Tokens win when both are set.
struct VoxRequest {
    std::optional<std::string> text;
    std::optional<std::vector<VoxToken>> tokens;
    std::string voiceId;
    std::string scopeId;
    VoxFilterSpec filter = VoxFilterPreset::Off;
    std::optional<int> wordGapMs;
    bool generateMissing = true;
};

struct VoxSkippedWord {
    std::string word;
    size_t position = 0;
    std::string reason;
};

struct VoxSynthesisResult {
    bool success = false;
    VoxStage state = VoxStage::Tokenizing;
    VoxStage failedStage = VoxStage::Tokenizing; // meaningful only when !success
    VoxErrorKind errorKind = VoxErrorKind::None;
    std::string errorMessage;

    std::vector<uint8_t> buffer;
    std::vector<std::string> matchedWords;
    std::vector<VoxSkippedWord> skippedWords;
    VoxGenerationMap generation;
    std::vector<VoxSegment> segments;
    int wordGapMs = 0;
    double durationEstimate = 0.0;
};

struct VoxPreviewEntry {
    std::string word;
    size_t position = 0;
    bool hasClip = false;
    double durationSeconds = 0.0;
};

struct VoxPreview {
    std::vector<VoxPreviewEntry> entries;
    size_t matched = 0;
    size_t missing = 0;
    std::vector<VoxInvalidWord> invalid;
    double durationEstimate = 0.0;
};

// Runs one announcement through tokenize -> cache check -> generate ->
// concatenate -> filter. Stage failures come back as a failed result rather
// than an exception; per-word problems end up in skippedWords.
class VoxOrchestrator {
public:
    VoxOrchestrator(VoxWordBank& bank, VoxGenerator& generator, const VoxOrchestratorOptions& opts = {},
                    std::unique_ptr<VoxDspChain> dsp = nullptr);

    VoxSynthesisResult synthesize(const VoxRequest& request,
                                  const VoxProgressCallback& progress = nullptr,
                                  const VoxCancelToken& cancel = nullptr);

    // Cache-only dry run; never calls the provider. Throws VoxValidationError.
    VoxPreview preview(const std::string& text, const std::string& voiceId, const std::string& scopeId,
                       std::optional<int> wordGapMs = std::nullopt) const;

    const VoxOrchestratorOptions& options() const { return opts_; }
    const VoxTokenizer& tokenizer() const { return tokenizer_; }

private:
    void validateIds(const std::string& voiceId, const std::string& scopeId) const;
    void validateText(const std::string& text) const;
    int resolveGap(std::optional<int> wordGapMs) const;
    VoxTokenization prepareTokens(const VoxRequest& request) const;

    VoxWordBank& bank_;
    VoxGenerator& generator_;
    VoxOrchestratorOptions opts_;
    VoxTokenizer tokenizer_;
    VoxConcatenator concatenator_;
    VoxFilterEngine filter_;
};
