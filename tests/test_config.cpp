#include <catch2/catch.hpp>

#include <fstream>
#include <stdexcept>

#include "test_support.hpp"
#include "vox_config.hpp"

using json = nlohmann::json;
using namespace std;

namespace {

// argv-style view over owned strings.
struct Args {
    vector<string> storage;
    vector<char*> argv;

    Args(initializer_list<string> args) : storage(args) {
        storage.insert(storage.begin(), "vox-daemon");
        for (auto& s : storage) argv.push_back(s.data());
    }
    int argc() { return static_cast<int>(argv.size()); }
};

const json kSampleConfig = R"({
    "cache_root": "/var/lib/vox",
    "voices": {
        "alice": {"encoder": "a.enc.onnx", "decoder": "a.dec.onnx", "config": "a.json", "accelerator": "cuda"},
        "bob": {"encoder": "b.enc.onnx", "decoder": "b.dec.onnx", "config": "b.json", "espeak_data": "/espeak"}
    },
    "default_voice": "bob",
    "generation": {"concurrency": 5, "max_retries": 2, "retry_backoff_ms": 100},
    "tokenizer": {"max_word_length": 20, "contractions": "expand", "expand_numbers": true,
                  "pauses": {"period": 300, "comma": 120}},
    "limits": {"max_message_length": 300, "max_words": 40, "min_word_gap_ms": 10, "max_word_gap_ms": 150},
    "default_word_gap_ms": 75,
    "pause_mode": "override"
})"_json;

} // namespace

TEST_CASE("config JSON overlays the defaults", "[config]") {
    VoxConfig cfg;
    applyConfigJson(kSampleConfig, cfg);

    CHECK(cfg.cacheRoot == "/var/lib/vox");
    REQUIRE(cfg.voices.size() == 2);
    CHECK(cfg.voices["alice"].accelerator == "cuda");
    CHECK(cfg.voices["bob"].eSpeakDataPath == filesystem::path("/espeak"));
    CHECK(cfg.defaultVoice == "bob");
    CHECK(cfg.generation.concurrency == 5);
    CHECK(cfg.generation.maxRetries == 2);
    CHECK(cfg.generation.retryBackoffMs == 100);

    const auto& t = cfg.orchestrator.tokenizer;
    CHECK(t.maxWordLength == 20);
    CHECK(t.contractions == VoxContractionMode::Expand);
    CHECK(t.expandNumbers);
    CHECK(t.periodPauseMs == 300);
    CHECK(t.commaPauseMs == 120);
    CHECK(t.ellipsisPauseMs == 250);

    CHECK(cfg.orchestrator.limits.maxWords == 40);
    CHECK(cfg.orchestrator.limits.minWordGapMs == 10);
    CHECK(cfg.orchestrator.defaultWordGapMs == 75);
    CHECK(cfg.orchestrator.pauseMode == VoxPauseMode::Override);
    CHECK_NOTHROW(validateConfig(cfg));
}

TEST_CASE("defaults match the documented values", "[config]") {
    VoxConfig cfg;
    CHECK(cfg.generation.concurrency == 3);
    CHECK(cfg.generation.maxRetries == 0);
    CHECK(cfg.orchestrator.defaultWordGapMs == 50);
    CHECK(cfg.orchestrator.limits.maxMessageLength == 500);
    CHECK(cfg.orchestrator.limits.maxWords == 50);
    CHECK(cfg.orchestrator.limits.minWordGapMs == 20);
    CHECK(cfg.orchestrator.limits.maxWordGapMs == 200);
    CHECK(cfg.orchestrator.pauseMode == VoxPauseMode::Additive);
    CHECK_NOTHROW(validateConfig(cfg));
}

TEST_CASE("bad config values are rejected", "[config]") {
    VoxConfig cfg;
    CHECK_THROWS_AS(applyConfigJson(json{{"pause_mode", "sideways"}}, cfg), runtime_error);
    CHECK_THROWS_AS(applyConfigJson(json{{"tokenizer", {{"contractions", "keep"}}}}, cfg), runtime_error);
    CHECK_THROWS_AS(applyConfigJson(json{{"generation", {{"concurrency", "many"}}}}, cfg), runtime_error);
    CHECK_THROWS_AS(applyConfigJson(json{{"voices", {{"x", {{"encoder", "e"}}}}}}, cfg), runtime_error);
    CHECK_THROWS_AS(applyConfigJson(json::array(), cfg), runtime_error);

    VoxConfig gap;
    gap.orchestrator.defaultWordGapMs = 500;
    CHECK_THROWS_AS(validateConfig(gap), runtime_error);

    VoxConfig pause;
    applyConfigJson(json{{"limits", {{"max_pause_ms", 100}}}}, pause);
    CHECK(pause.orchestrator.limits.maxPauseMs == 100);
    CHECK_THROWS_AS(validateConfig(pause), runtime_error); // default period pause is 200 ms

    VoxConfig conc;
    conc.generation.concurrency = 0;
    CHECK_THROWS_AS(validateConfig(conc), runtime_error);

    VoxConfig voice;
    applyConfigJson(kSampleConfig, voice);
    voice.defaultVoice = "carol";
    CHECK_THROWS_AS(validateConfig(voice), runtime_error);
}

TEST_CASE("command line overrides the config file", "[config]") {
    TempDir dir;
    auto path = dir.path() / "vox.json";
    {
        ofstream out(path);
        out << kSampleConfig.dump();
    }

    Args args{"-c", path.string(), "--cache-root", "/tmp/bank", "--concurrency", "2", "--max-concurrency", "4",
              "--word-gap", "100", "--pause-mode", "additive", "--retries", "1", "--progress", "--debug"};
    auto cfg = parseArgs(args.argc(), args.argv.data());

    CHECK(cfg.cacheRoot == "/tmp/bank");
    CHECK(cfg.generation.concurrency == 2);
    CHECK(cfg.generation.maxRetries == 1);
    CHECK(cfg.maxConcurrency == 4);
    CHECK(cfg.orchestrator.defaultWordGapMs == 100);
    CHECK(cfg.orchestrator.pauseMode == VoxPauseMode::Additive);
    CHECK(cfg.progress);
    CHECK(cfg.logLevel == spdlog::level::debug);
    CHECK(cfg.defaultVoice == "bob");
    CHECK(cfg.voices.size() == 2);
}

TEST_CASE("model flags define a voice without a config file", "[config]") {
    Args args{"--encoder", "e.onnx", "--decoder", "d.onnx", "--model-config", "m.json", "--play", "-q"};
    auto cfg = parseArgs(args.argc(), args.argv.data());
    REQUIRE(cfg.voices.count("default"));
    CHECK(cfg.defaultVoice == "default");
    CHECK(cfg.voices["default"].encoderPath == "e.onnx");
    CHECK(cfg.playAudio);
    CHECK(cfg.logLevel == spdlog::level::off);
    CHECK_NOTHROW(validateConfig(cfg));
    CHECK_THROWS_AS(checkVoiceFiles(cfg), runtime_error);
}

TEST_CASE("bad command lines throw", "[config]") {
    Args unknown{"--frobnicate"};
    CHECK_THROWS_AS(parseArgs(unknown.argc(), unknown.argv.data()), runtime_error);

    Args notNumber{"--concurrency", "three"};
    CHECK_THROWS_AS(parseArgs(notNumber.argc(), notNumber.argv.data()), runtime_error);

    Args mode{"--pause-mode", "random"};
    CHECK_THROWS_AS(parseArgs(mode.argc(), mode.argv.data()), runtime_error);

    Args missing{"-c", "/nonexistent/vox.json"};
    CHECK_THROWS_AS(parseArgs(missing.argc(), missing.argv.data()), runtime_error);

    Args help{"--help"};
    CHECK(parseArgs(help.argc(), help.argv.data()).showHelp);
}
