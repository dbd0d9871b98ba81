#include "vox_protocol.hpp"

#include <limits>

#include "vox_audio.hpp"
#include "vox_error.hpp"

using json = nlohmann::json;
using namespace std;

const char* toString(VoxOp op) {
    switch (op) {
        case VoxOp::Synthesize: return "synthesize";
        case VoxOp::Preview: return "preview";
        case VoxOp::Stats: return "stats";
        case VoxOp::List: return "list";
        case VoxOp::Search: return "search";
        case VoxOp::Purge: return "purge";
        case VoxOp::Export: return "export";
        case VoxOp::Import: return "import";
    }
    return "unknown";
}

static VoxOp parseOp(const string& name) {
    static const VoxOp all[] = {VoxOp::Synthesize, VoxOp::Preview, VoxOp::Stats, VoxOp::List,
                                VoxOp::Search, VoxOp::Purge, VoxOp::Export, VoxOp::Import};
    for (auto op : all) {
        if (name == toString(op)) return op;
    }
    throw VoxValidationError("Unknown op '" + name + "'");
}

VoxFilterSpec parseFilterSpec(const json& j) {
    if (j.is_null()) return VoxFilterPreset::Off;
    if (j.is_string()) {
        auto preset = parseFilterPreset(j.get<string>());
        if (!preset) throw VoxValidationError("Unknown filter preset '" + j.get<string>() + "'");
        return *preset;
    }
    if (!j.is_object()) throw VoxValidationError("filter must be a preset name or an object");

    // Absent fields leave that stage out of the chain.
    VoxCustomFilterSettings s;
    s.lowpassHz = kVoxSampleRate / 2.0;
    s.highpassHz = j.value("highpass_hz", s.highpassHz);
    s.lowpassHz = j.value("lowpass_hz", s.lowpassHz);
    s.compressionRatio = j.value("compression_ratio", s.compressionRatio);
    s.distortion = j.value("distortion", s.distortion);
    return s;
}

vector<VoxToken> parseTokens(const json& j) {
    if (!j.is_array()) throw VoxValidationError("tokens must be an array");
    vector<VoxToken> out;
    out.reserve(j.size());
    for (size_t i = 0; i < j.size(); i++) {
        const auto& t = j[i];
        if (t.is_string()) {
            out.push_back(VoxToken::makeWord(t.get<string>(), i));
        } else if (t.is_object() && t.contains("word")) {
            out.push_back(VoxToken::makeWord(t["word"].get<string>(), i));
        } else if (t.is_object() && t.contains("pause_ms")) {
            const auto ms = t["pause_ms"].get<int64_t>();
            if (ms < 0 || ms > numeric_limits<int>::max()) {
                throw VoxValidationError("Token " + to_string(i) + " has an out-of-range pause_ms");
            }
            out.push_back(VoxToken::makePause(static_cast<int>(ms), i));
        } else {
            throw VoxValidationError("Token " + to_string(i) + " is neither a word nor a pause");
        }
    }
    return out;
}

VoxDaemonRequest parseRequest(const json& j, const VoxRequestDefaults& defaults) {
    if (!j.is_object()) throw VoxValidationError("Request must be a JSON object");
    VoxDaemonRequest r;
    try {
        if (j.contains("id")) r.id = j["id"];
        r.op = parseOp(j.value<string>("op", "synthesize"));

        auto& s = r.synth;
        s.scopeId = j.value<string>("scope", defaults.scopeId);
        s.voiceId = j.value<string>("voice", defaults.voiceId);
        s.generateMissing = j.value("generate_missing", defaults.generateMissing);
        if (j.contains("text") && !j["text"].is_null()) s.text = j["text"].get<string>();
        if (j.contains("tokens") && !j["tokens"].is_null()) s.tokens = parseTokens(j["tokens"]);
        if (j.contains("filter")) s.filter = parseFilterSpec(j["filter"]);
        if (j.contains("word_gap_ms") && !j["word_gap_ms"].is_null()) s.wordGapMs = j["word_gap_ms"].get<int>();

        if (j.contains("voice") && !j["voice"].is_null()) r.voice = j["voice"].get<string>();
        if (j.contains("word") && !j["word"].is_null()) r.word = j["word"].get<string>();
        if (j.contains("output") && !j["output"].is_null()) r.output = filesystem::path(j["output"].get<string>());
        if (j.contains("input") && !j["input"].is_null()) r.input = filesystem::path(j["input"].get<string>());
        r.query = j.value<string>("query", "");
        r.maxResults = j.value<size_t>("max_results", r.maxResults);
        r.overwrite = j.value("overwrite", r.overwrite);

        auto format = j.value<string>("format", "pcm");
        if (format == "pcm") {
            r.format = VoxOutputFormat::Pcm;
        } else if (format == "wav") {
            r.format = VoxOutputFormat::Wav;
        } else {
            throw VoxValidationError("Unsupported format (pcm|wav)");
        }
    } catch (const json::exception& e) {
        throw VoxValidationError(string("Malformed request: ") + e.what());
    }

    switch (r.op) {
        case VoxOp::Synthesize:
            if (!r.synth.text && !r.synth.tokens) throw VoxValidationError("Missing text");
            break;
        case VoxOp::Preview:
            if (!r.synth.text) throw VoxValidationError("Missing text");
            break;
        case VoxOp::List:
        case VoxOp::Search:
            if (r.synth.voiceId.empty()) throw VoxValidationError("Missing voice");
            break;
        case VoxOp::Export:
            if (!r.output) throw VoxValidationError("Missing output path");
            break;
        case VoxOp::Import:
            if (!r.input) throw VoxValidationError("Missing input path");
            break;
        case VoxOp::Stats:
        case VoxOp::Purge:
            break;
    }
    if (!isValidIdentifier(r.synth.scopeId)) throw VoxValidationError("Invalid scope id '" + r.synth.scopeId + "'");
    if (r.voice && !isValidIdentifier(*r.voice)) throw VoxValidationError("Invalid voice id '" + *r.voice + "'");
    return r;
}

json toJson(const VoxSynthesisResult& result) {
    json j;
    j["success"] = result.success;
    j["state"] = toString(result.state);
    if (!result.success) {
        j["error"] = {{"kind", toString(result.errorKind)},
                      {"message", result.errorMessage},
                      {"stage", toString(result.failedStage)}};
    }
    j["matchedWords"] = result.matchedWords;
    j["skippedWords"] = json::array();
    for (const auto& s : result.skippedWords) {
        j["skippedWords"].push_back({{"word", s.word}, {"position", s.position}, {"reason", s.reason}});
    }
    j["generation"] = json::object();
    for (const auto& [word, g] : result.generation) {
        json e = {{"status", toString(g.status)}, {"attempts", g.attempts}};
        if (!g.reason.empty()) e["reason"] = g.reason;
        j["generation"][word] = e;
    }
    j["wordGapMs"] = result.wordGapMs;
    j["sizeBytes"] = result.buffer.size();
    j["durationEstimate"] = result.durationEstimate;
    return j;
}

json toJson(const VoxPreview& preview) {
    json j;
    j["tokens"] = json::array();
    for (const auto& e : preview.entries) {
        j["tokens"].push_back({{"word", e.word},
                               {"position", e.position},
                               {"hasClip", e.hasClip},
                               {"durationSeconds", e.durationSeconds}});
    }
    j["matched"] = preview.matched;
    j["missing"] = preview.missing;
    j["invalid"] = json::array();
    for (const auto& w : preview.invalid) {
        j["invalid"].push_back({{"word", w.word}, {"position", w.position}, {"reason", w.reason}});
    }
    j["durationEstimate"] = preview.durationEstimate;
    return j;
}

json toJson(const VoxProgress& progress) {
    json j = {{"event", "progress"},
              {"stage", toString(progress.stage)},
              {"total", progress.total},
              {"cached", progress.cached},
              {"generated", progress.generated},
              {"failed", progress.failed}};
    if (!progress.word.empty()) j["word"] = progress.word;
    return j;
}

json toJson(const VoxCacheStats& stats) {
    json j = {{"totalWords", stats.totalWords}, {"totalBytes", stats.totalBytes}, {"voicesUsed", stats.voicesUsed}};
    j["perVoice"] = json::object();
    for (const auto& [voice, v] : stats.perVoice) {
        j["perVoice"][voice] = {{"words", v.words}, {"bytes", v.bytes}};
    }
    return j;
}

json toJson(const VoxClipMeta& meta) {
    return {{"word", meta.key.word},
            {"voice", meta.key.voiceId},
            {"sizeBytes", meta.sizeBytes},
            {"durationSeconds", meta.durationSeconds},
            {"createdAt", meta.createdAt}};
}

json toJson(const vector<VoxClipMeta>& metas) {
    json arr = json::array();
    for (const auto& m : metas) arr.push_back(toJson(m));
    return arr;
}

json toJson(const VoxImportReport& report) {
    json j = {{"imported", report.imported},
              {"overwritten", report.overwritten},
              {"keptExisting", report.keptExisting}};
    j["rejected"] = json::array();
    for (const auto& r : report.rejected) {
        j["rejected"].push_back({{"word", r.word}, {"voice", r.voiceId}, {"reason", r.reason}});
    }
    return j;
}
