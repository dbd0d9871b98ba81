#include "vox_types.hpp"
#include "vox_error.hpp"

#include <algorithm>
#include <cctype>

using namespace std;

const char* toString(VoxErrorKind kind) {
    switch (kind) {
        case VoxErrorKind::None: return "none";
        case VoxErrorKind::Validation: return "validation";
        case VoxErrorKind::Provider: return "provider";
        case VoxErrorKind::ZeroMatch: return "zero_match";
        case VoxErrorKind::Concatenation: return "concatenation";
        case VoxErrorKind::Filter: return "filter";
        case VoxErrorKind::Cancelled: return "cancelled";
        case VoxErrorKind::Archive: return "archive";
        case VoxErrorKind::Storage: return "storage";
    }
    return "unknown";
}

const char* toString(VoxGenerationStatus status) {
    switch (status) {
        case VoxGenerationStatus::Cached: return "cached";
        case VoxGenerationStatus::Generated: return "generated";
        case VoxGenerationStatus::Failed: return "failed";
        case VoxGenerationStatus::Skipped: return "skipped";
    }
    return "unknown";
}

const char* toString(VoxFilterPreset preset) {
    switch (preset) {
        case VoxFilterPreset::Off: return "off";
        case VoxFilterPreset::Light: return "light";
        case VoxFilterPreset::Heavy: return "heavy";
    }
    return "unknown";
}

const char* toString(VoxPauseMode mode) {
    return mode == VoxPauseMode::Override ? "override" : "additive";
}

const char* toString(VoxStage stage) {
    switch (stage) {
        case VoxStage::Tokenizing: return "tokenizing";
        case VoxStage::CheckingCache: return "checking_cache";
        case VoxStage::Generating: return "generating";
        case VoxStage::Concatenating: return "concatenating";
        case VoxStage::Filtering: return "filtering";
        case VoxStage::Done: return "done";
        case VoxStage::Failed: return "failed";
    }
    return "unknown";
}

static string lowered(string s) {
    transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(tolower(c)); });
    return s;
}

optional<VoxFilterPreset> parseFilterPreset(const string& name) {
    auto n = lowered(name);
    if (n == "off" || n == "none") return VoxFilterPreset::Off;
    if (n == "light") return VoxFilterPreset::Light;
    if (n == "heavy") return VoxFilterPreset::Heavy;
    return nullopt;
}

optional<VoxPauseMode> parsePauseMode(const string& name) {
    auto n = lowered(name);
    if (n == "additive") return VoxPauseMode::Additive;
    if (n == "override") return VoxPauseMode::Override;
    return nullopt;
}

bool isValidIdentifier(const string& id) {
    if (id.empty() || id.size() > 64 || id == "." || id == "..") return false;
    return all_of(id.begin(), id.end(), [](unsigned char c) {
        return isalnum(c) || c == '_' || c == '-' || c == '.';
    });
}
