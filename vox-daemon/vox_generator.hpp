#pragma once

#include <map>
#include <string>
#include <vector>

#include "vox_provider.hpp"
#include "vox_types.hpp"
#include "vox_word_bank.hpp"

struct VoxGeneratorOptions {
    int concurrency = 3;      // simultaneous provider calls
    int maxRetries = 0;       // extra attempts after the first failure
    int retryBackoffMs = 250; // multiplied by the attempt number
};

using VoxGenerationMap = std::map<std::string, VoxGenerationResult>;

// Fills word bank misses by calling the provider from a bounded worker pool.
// Failures are per word; one word failing never stops its siblings.
class VoxGenerator {
public:
    VoxGenerator(VoxWordBank& bank, VoxSynthesisProvider& provider, const VoxGeneratorOptions& opts = {});

    VoxGenerationMap generateMissing(const std::vector<VoxToken>& tokens,
                                     const std::string& voiceId,
                                     const std::string& scopeId,
                                     const VoxProgressCallback& progress = nullptr,
                                     const VoxCancelToken& cancel = nullptr);

    const VoxGeneratorOptions& options() const { return opts_; }

private:
    VoxGenerationResult generateOne(const VoxCacheKey& key, const VoxCancelToken& cancel);

    VoxWordBank& bank_;
    VoxSynthesisProvider& provider_;
    VoxGeneratorOptions opts_;
};
