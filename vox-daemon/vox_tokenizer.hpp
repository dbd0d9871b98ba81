#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "vox_types.hpp"

enum class VoxContractionMode { Strip, Expand };

struct VoxTokenizerOptions {
    size_t maxWordLength = 30;
    VoxContractionMode contractions = VoxContractionMode::Strip;
    bool expandNumbers = false;
    int periodPauseMs = 200;   // . ! ?
    int commaPauseMs = 150;    // , ; :
    int ellipsisPauseMs = 250; // ... and U+2026
    int dashPauseMs = 100;     // standalone or edge dashes
};

struct VoxInvalidWord {
    std::string word;
    size_t position = 0;
    std::string reason;
};

struct VoxTokenization {
    std::vector<VoxToken> tokens;
    std::vector<VoxInvalidWord> invalid;

    size_t wordCount() const;
    std::vector<std::string> words() const;
};

// Splits announcement text into ordered word and pause tokens.
// Stateless apart from its options; tokenize() may be called concurrently.
class VoxTokenizer {
public:
    VoxTokenizer() = default;
    explicit VoxTokenizer(const VoxTokenizerOptions& opts) : opts_(opts) {}

    VoxTokenization tokenize(const std::string& text) const;

    // Empty string when the word is acceptable, otherwise the reason it is not.
    std::string validateWord(const std::string& word) const;

    const VoxTokenizerOptions& options() const { return opts_; }

    static std::string numberToWords(uint64_t n);

private:
    int pauseForMarks(const std::string& marks) const;
    void emitWord(std::string word, size_t position, VoxTokenization& out) const;

    VoxTokenizerOptions opts_;
};
