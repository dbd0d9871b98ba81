#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <mutex>
#include <optional>
#include <queue>
#include <span>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "piper_provider.hpp"
#include "vox_audio.hpp"
#include "vox_config.hpp"
#include "vox_error.hpp"
#include "vox_generator.hpp"
#include "vox_orchestrator.hpp"
#include "vox_playback.hpp"
#include "vox_protocol.hpp"
#include "vox_word_bank.hpp"

using json = nlohmann::json;
using namespace std;

// Set by SIGINT/SIGTERM; doubles as the cancel token of every request.
static VoxCancelToken gShutdown = makeCancelToken();
static mutex gOutMutex;

static void printError(const string &msg, VoxErrorKind kind = VoxErrorKind::None, const json &id = nullptr) {
    json e;
    e["error"] = msg;
    if (kind != VoxErrorKind::None) e["kind"] = toString(kind);
    if (!id.is_null()) e["id"] = id;
    lock_guard<mutex> lk(gOutMutex);
    cerr << e.dump() << '\n';
    cerr.flush();
}

static void printLine(const json &j) {
    lock_guard<mutex> lk(gOutMutex);
    cout << j.dump() << '\n';
    cout.flush();
}

static void writeFile(const filesystem::path &path, span<const uint8_t> bytes) {
    ofstream out(path, ios::binary | ios::trunc);
    if (!out.good()) throw VoxStorageError("Failed to open output file " + path.string());
    out.write(reinterpret_cast<const char *>(bytes.data()), static_cast<streamsize>(bytes.size()));
    if (!out.good()) throw VoxStorageError("Failed to write output file " + path.string());
}

static vector<uint8_t> readFile(const filesystem::path &path) {
    ifstream in(path, ios::binary);
    if (!in.good()) throw VoxStorageError("Failed to open input file " + path.string());
    return vector<uint8_t>(istreambuf_iterator<char>(in), istreambuf_iterator<char>());
}

struct Daemon {
    const VoxConfig &cfg;
    VoxWordBank &bank;
    VoxOrchestrator &orchestrator;
    unique_ptr<VoxAlsaPlayback> playback;
};

static json runSynthesize(Daemon &d, const VoxDaemonRequest &req) {
    VoxProgressCallback progress;
    if (d.cfg.progress) {
        progress = [&](const VoxProgress &p) {
            auto ev = toJson(p);
            ev["id"] = req.id;
            printLine(ev);
        };
    }

    auto result = d.orchestrator.synthesize(req.synth, progress, gShutdown);
    json out = toJson(result);
    if (!result.success) {
        printError(result.errorMessage, result.errorKind, req.id);
        return out;
    }

    span<const uint8_t> pcm(result.buffer.data(), result.buffer.size());
    if (req.output) {
        if (req.format == VoxOutputFormat::Wav) {
            auto wav = wrapWav(pcm);
            writeFile(*req.output, span<const uint8_t>(wav.data(), wav.size()));
        } else {
            writeFile(*req.output, pcm);
        }
        out["output"] = req.output->string();
    }
    if (d.playback) {
        d.playback->play(result.buffer, d.cfg.volume);
        out["played"] = true;
    }
    return out;
}

static json handleRequest(Daemon &d, const VoxDaemonRequest &req) {
    const auto &scope = req.synth.scopeId;
    switch (req.op) {
        case VoxOp::Synthesize:
            return runSynthesize(d, req);
        case VoxOp::Preview:
            return toJson(d.orchestrator.preview(*req.synth.text, req.synth.voiceId, scope, req.synth.wordGapMs));
        case VoxOp::Stats:
            return toJson(d.bank.stats(scope));
        case VoxOp::List:
            return toJson(d.bank.list(scope, req.synth.voiceId));
        case VoxOp::Search:
            return toJson(d.bank.search(scope, req.synth.voiceId, req.query, req.maxResults));
        case VoxOp::Purge: {
            if (req.word) {
                if (!req.voice) throw VoxValidationError("Purging a word needs a voice");
                bool removed = d.bank.purgeWord(VoxCacheKey{scope, *req.word, *req.voice});
                return json{{"removed", removed ? 1 : 0}};
            }
            return json{{"removed", d.bank.purge(scope, req.voice)}};
        }
        case VoxOp::Export: {
            auto archive = d.bank.exportArchive(scope, req.voice);
            writeFile(*req.output, span<const uint8_t>(archive.data(), archive.size()));
            return json{{"output", req.output->string()}, {"sizeBytes", archive.size()}};
        }
        case VoxOp::Import: {
            auto archive = readFile(*req.input);
            return toJson(d.bank.importArchive(scope, span<const uint8_t>(archive.data(), archive.size()),
                                               req.overwrite));
        }
    }
    throw VoxValidationError("Unhandled op");
}

static void processOne(Daemon &d, const VoxDaemonRequest &req) {
    json line;
    line["id"] = req.id;
    line["op"] = toString(req.op);
    try {
        line["result"] = handleRequest(d, req);
    } catch (const VoxError &e) {
        printError(e.what(), e.kind(), req.id);
        line["error"] = {{"kind", toString(e.kind())}, {"message", e.what()}};
    } catch (const exception &e) {
        printError(e.what(), VoxErrorKind::None, req.id);
        line["error"] = {{"message", e.what()}};
    }
    printLine(line);
}

struct WorkItem { VoxDaemonRequest req; };

int main(int argc, char *argv[]) {
    spdlog::set_default_logger(spdlog::stderr_color_mt("vox"));

    VoxConfig cfg;
    try {
        cfg = parseArgs(argc, argv);
        if (cfg.showHelp) {
            printUsage(argv[0]);
            return 0;
        }
        spdlog::set_level(cfg.logLevel);
        validateConfig(cfg);
        checkVoiceFiles(cfg);
    } catch (const exception &e) {
        printError(e.what());
        return 1;
    }

    unique_ptr<VoxWordBank> bank;
    unique_ptr<PiperProvider> provider;
    try {
        bank = make_unique<VoxWordBank>(cfg.cacheRoot);
        provider = make_unique<PiperProvider>(cfg.voices);
    } catch (const exception &e) {
        printError(e.what());
        return 1;
    }

    VoxGenerator generator(*bank, *provider, cfg.generation);
    VoxOrchestrator orchestrator(*bank, generator, cfg.orchestrator);
    Daemon daemon{cfg, *bank, orchestrator, nullptr};
    if (cfg.playAudio) daemon.playback = make_unique<VoxAlsaPlayback>();

    spdlog::info("vox-daemon ready: {} words cached under {}, {} voices, default voice {}", bank->size(),
                 cfg.cacheRoot.string(), cfg.voices.size(), cfg.defaultVoice);

    VoxRequestDefaults defaults;
    defaults.voiceId = cfg.defaultVoice;

    size_t nextId = 0;
    mutex qMutex;
    condition_variable qCv;
    queue<WorkItem> q;
    atomic<bool> inputDone{false};

    // Signal handling for graceful shutdown
    auto handler = +[](int) { gShutdown->store(true); };
    signal(SIGINT, handler);
    signal(SIGTERM, handler);

    vector<thread> workers;
    workers.reserve(cfg.maxConcurrency);
    for (int i = 0; i < cfg.maxConcurrency; i++) {
        workers.emplace_back([&]() {
            while (true) {
                WorkItem item;
                {
                    unique_lock<mutex> lk(qMutex);
                    qCv.wait_for(lk, chrono::milliseconds(200), [&]() {
                        return inputDone.load() || isCancelled(gShutdown) || !q.empty();
                    });
                    if (isCancelled(gShutdown) && !q.empty()) {
                        // Drain: answer queued requests without running them.
                        item = std::move(q.front());
                        q.pop();
                        lk.unlock();
                        printError("Daemon is shutting down", VoxErrorKind::Cancelled, item.req.id);
                        continue;
                    }
                    if (q.empty()) {
                        if (inputDone.load() || isCancelled(gShutdown)) return;
                        continue;
                    }
                    item = std::move(q.front());
                    q.pop();
                }
                processOne(daemon, item.req);
            }
        });
    }

    // Read requests from stdin (one JSON per line)
    string line;
    while (!isCancelled(gShutdown) && getline(cin, line)) {
        if (line.empty()) continue;
        json id = nextId++;
        try {
            auto j = json::parse(line);
            if (j.is_object() && j.contains("id")) id = j["id"];
            auto req = parseRequest(j, defaults);
            if (req.id.is_null()) req.id = id;
            {
                lock_guard<mutex> lk(qMutex);
                q.push(WorkItem{std::move(req)});
            }
            qCv.notify_one();
        } catch (const VoxError &e) {
            printError(e.what(), e.kind(), id);
        } catch (const json::exception &e) {
            printError(string("Malformed request: ") + e.what(), VoxErrorKind::Validation, id);
        }
    }

    inputDone.store(true);
    qCv.notify_all();
    for (auto &t : workers) t.join();
    spdlog::info("vox-daemon stopped");
    return 0;
}
