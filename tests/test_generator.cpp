#include <catch2/catch.hpp>

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <thread>

#include "test_support.hpp"
#include "vox_generator.hpp"
#include "vox_word_bank.hpp"

using namespace std;

static vector<VoxToken> words(initializer_list<string> ws) {
    vector<VoxToken> out;
    size_t pos = 0;
    for (const auto& w : ws) out.push_back(VoxToken::makeWord(w, pos++));
    return out;
}

TEST_CASE("missing words are generated and cached once", "[generator]") {
    TempDir dir;
    VoxWordBank bank(dir.path());
    FakeProvider provider;
    VoxGenerator generator(bank, provider);

    auto first = generator.generateMissing(words({"gate", "closed"}), "alice", "airport");
    CHECK(first["gate"].status == VoxGenerationStatus::Generated);
    CHECK(first["closed"].status == VoxGenerationStatus::Generated);
    auto bytes = bank.get(VoxCacheKey{"airport", "gate", "alice"});
    REQUIRE(bytes);

    auto second = generator.generateMissing(words({"gate"}), "alice", "airport");
    CHECK(second["gate"].status == VoxGenerationStatus::Cached);
    CHECK(provider.calls("gate") == 1);

    auto again = bank.get(VoxCacheKey{"airport", "gate", "alice"});
    REQUIRE(again);
    CHECK(again->audioBytes == bytes->audioBytes);
}

TEST_CASE("duplicate words in one request are generated once", "[generator]") {
    TempDir dir;
    VoxWordBank bank(dir.path());
    FakeProvider provider;
    VoxGenerator generator(bank, provider);

    auto results = generator.generateMissing(words({"go", "go", "go", "now"}), "alice", "s");
    CHECK(results.size() == 2);
    CHECK(provider.calls("go") == 1);
}

TEST_CASE("provider calls never exceed the concurrency limit", "[generator]") {
    TempDir dir;
    VoxWordBank bank(dir.path());
    FakeProvider provider;
    provider.delayMs = 30;
    VoxGeneratorOptions opts;
    opts.concurrency = 3;
    VoxGenerator generator(bank, provider, opts);

    auto results = generator.generateMissing(
        words({"a1", "a2", "a3", "a4", "a5", "a6", "a7", "a8", "a9", "a10"}), "alice", "s");
    CHECK(results.size() == 10);
    CHECK(provider.totalCalls() == 10);
    CHECK(provider.maxInFlight() <= 3);
    CHECK(bank.size() == 10);
}

TEST_CASE("one failing word does not stop its siblings", "[generator]") {
    TempDir dir;
    VoxWordBank bank(dir.path());
    FakeProvider provider;
    provider.failing = {"three"};
    VoxGenerator generator(bank, provider);

    auto results = generator.generateMissing(words({"one", "two", "three", "four", "five"}), "alice", "s");
    CHECK(results["three"].status == VoxGenerationStatus::Failed);
    CHECK(results["three"].reason.find("rejected") != string::npos);
    for (const auto* w : {"one", "two", "four", "five"}) CHECK(results[w].ok());
    CHECK_FALSE(bank.contains(VoxCacheKey{"s", "three", "alice"}));
}

TEST_CASE("retries recover from transient failures", "[generator]") {
    TempDir dir;
    VoxWordBank bank(dir.path());
    FakeProvider provider;
    provider.failuresBeforeSuccess["flaky"] = 2;
    VoxGeneratorOptions opts;
    opts.maxRetries = 2;
    opts.retryBackoffMs = 0;
    VoxGenerator generator(bank, provider, opts);

    auto results = generator.generateMissing(words({"flaky"}), "alice", "s");
    CHECK(results["flaky"].status == VoxGenerationStatus::Generated);
    CHECK(results["flaky"].attempts == 3);
}

TEST_CASE("a single attempt is made by default", "[generator]") {
    TempDir dir;
    VoxWordBank bank(dir.path());
    FakeProvider provider;
    provider.failuresBeforeSuccess["flaky"] = 1;
    VoxGenerator generator(bank, provider);

    auto results = generator.generateMissing(words({"flaky"}), "alice", "s");
    CHECK(results["flaky"].status == VoxGenerationStatus::Failed);
    CHECK(provider.calls("flaky") == 1);
}

TEST_CASE("unknown voice fails every missing word without provider calls", "[generator]") {
    TempDir dir;
    VoxWordBank bank(dir.path());
    FakeProvider provider;
    VoxGenerator generator(bank, provider);

    auto results = generator.generateMissing(words({"one", "two"}), "bob", "s");
    CHECK(results["one"].status == VoxGenerationStatus::Failed);
    CHECK(results["two"].status == VoxGenerationStatus::Failed);
    CHECK(provider.totalCalls() == 0);
}

TEST_CASE("cancellation skips words that have not started", "[generator]") {
    TempDir dir;
    VoxWordBank bank(dir.path());
    FakeProvider provider;
    VoxGenerator generator(bank, provider);

    auto cancel = makeCancelToken();
    cancel->store(true);
    auto results = generator.generateMissing(words({"one", "two"}), "alice", "s", nullptr, cancel);
    CHECK(results["one"].status == VoxGenerationStatus::Skipped);
    CHECK(results["one"].reason == "cancelled");
    CHECK(provider.totalCalls() == 0);
}

TEST_CASE("completed generations stay cached after a cancel", "[generator]") {
    TempDir dir;
    VoxWordBank bank(dir.path());
    FakeProvider provider;
    provider.delayMs = 20;
    VoxGeneratorOptions opts;
    opts.concurrency = 1;
    VoxGenerator generator(bank, provider, opts);

    auto cancel = makeCancelToken();
    auto progress = [&](const VoxProgress& p) {
        if (p.generated == 1) cancel->store(true);
    };
    auto results = generator.generateMissing(words({"one", "two", "three"}), "alice", "s", progress, cancel);
    CHECK(results["one"].status == VoxGenerationStatus::Generated);
    CHECK(bank.contains(VoxCacheKey{"s", "one", "alice"}));
    CHECK(results["three"].status == VoxGenerationStatus::Skipped);
}

TEST_CASE("progress reports cached and generated counts", "[generator]") {
    TempDir dir;
    VoxWordBank bank(dir.path());
    bank.put(VoxCacheKey{"s", "known", "alice"}, makeClipBytes(0.1));
    FakeProvider provider;
    VoxGenerator generator(bank, provider);

    vector<VoxProgress> events;
    generator.generateMissing(words({"known", "new1", "new2"}), "alice", "s",
                              [&](const VoxProgress& p) { events.push_back(p); });
    REQUIRE_FALSE(events.empty());
    CHECK(events.front().stage == VoxStage::CheckingCache);
    CHECK(events.front().total == 3);
    CHECK(events.front().cached == 1);
    CHECK(events.back().stage == VoxStage::Generating);
    CHECK(events.back().generated == 2);
    CHECK(events.back().failed == 0);
}

TEST_CASE("provider output is normalized before caching", "[generator]") {
    TempDir dir;
    VoxWordBank bank(dir.path());
    FakeProvider provider;
    provider.sampleRate = 22050;
    provider.seconds["slow"] = 0.5;
    VoxGenerator generator(bank, provider);

    generator.generateMissing(words({"slow"}), "alice", "s");
    auto m = bank.meta(VoxCacheKey{"s", "slow", "alice"});
    REQUIRE(m);
    CHECK(m->sizeBytes % 4 == 0);
    CHECK(m->durationSeconds == Approx(0.5).margin(0.01));
}

TEST_CASE("a throwing progress callback does not stop generation", "[generator]") {
    TempDir dir;
    VoxWordBank bank(dir.path());
    FakeProvider provider;
    VoxGeneratorOptions opts;
    opts.concurrency = 3;
    VoxGenerator generator(bank, provider, opts);

    atomic<int> calls{0};
    auto progress = [&](const VoxProgress&) {
        calls++;
        throw runtime_error("listener went away");
    };
    VoxGenerationMap results;
    REQUIRE_NOTHROW(results = generator.generateMissing(words({"one", "two", "three", "four"}), "alice", "s", progress));
    CHECK(calls.load() > 0);
    for (const auto& w : {"one", "two", "three", "four"}) {
        CHECK(results[w].status == VoxGenerationStatus::Generated);
        CHECK(bank.contains(VoxCacheKey{"s", w, "alice"}));
    }
}

TEST_CASE("progress counts never go backwards", "[generator]") {
    TempDir dir;
    VoxWordBank bank(dir.path());
    FakeProvider provider;
    provider.delays = {{"w0", 30}, {"w2", 10}};
    VoxGeneratorOptions opts;
    opts.concurrency = 4;
    VoxGenerator generator(bank, provider, opts);

    vector<size_t> done;
    generator.generateMissing(words({"w0", "w1", "w2", "w3", "w4", "w5"}), "alice", "s",
                              [&](const VoxProgress& p) { done.push_back(p.generated + p.failed); });
    CHECK(is_sorted(done.begin(), done.end()));
    REQUIRE_FALSE(done.empty());
    CHECK(done.back() == 6);
}
