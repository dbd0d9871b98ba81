#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <thread>

#include "test_support.hpp"
#include "vox_archive.hpp"
#include "vox_error.hpp"
#include "vox_word_bank.hpp"

using namespace std;

TEST_CASE("put then get returns the stored clip", "[word_bank]") {
    TempDir dir;
    VoxWordBank bank(dir.path());
    VoxCacheKey key{"airport", "gate", "alice"};

    CHECK_FALSE(bank.get(key));
    auto bytes = makeClipBytes(0.25, 77);
    auto meta = bank.put(key, bytes, 1700000000000);
    CHECK(meta.sizeBytes == bytes.size());
    CHECK(meta.durationSeconds == Approx(0.25));

    auto clip = bank.get(key);
    REQUIRE(clip);
    CHECK(clip->audioBytes == bytes);
    CHECK(clip->meta.createdAt == 1700000000000);
    CHECK(bank.contains(key));
    CHECK(filesystem::exists(dir.path() / "airport" / "alice" / "gate.pcm"));
    CHECK(filesystem::exists(dir.path() / "airport" / "alice" / "gate.json"));
}

TEST_CASE("scopes and voices are isolated", "[word_bank]") {
    TempDir dir;
    VoxWordBank bank(dir.path());
    bank.put(VoxCacheKey{"one", "gate", "alice"}, makeClipBytes(0.1));
    CHECK_FALSE(bank.contains(VoxCacheKey{"two", "gate", "alice"}));
    CHECK_FALSE(bank.contains(VoxCacheKey{"one", "gate", "bob"}));
}

TEST_CASE("put replaces an existing clip", "[word_bank]") {
    TempDir dir;
    VoxWordBank bank(dir.path());
    VoxCacheKey key{"s", "gate", "alice"};
    bank.put(key, makeClipBytes(0.1, 1));
    bank.put(key, makeClipBytes(0.2, 2));
    CHECK(bank.size() == 1);
    CHECK(bank.get(key)->audioBytes == makeClipBytes(0.2, 2));
}

TEST_CASE("put rejects invalid keys and payloads", "[word_bank]") {
    TempDir dir;
    VoxWordBank bank(dir.path());
    CHECK_THROWS_AS(bank.put(VoxCacheKey{"..", "gate", "alice"}, makeClipBytes(0.1)), VoxValidationError);
    CHECK_THROWS_AS(bank.put(VoxCacheKey{"s", "Gate", "alice"}, makeClipBytes(0.1)), VoxValidationError);
    CHECK_THROWS_AS(bank.put(VoxCacheKey{"s", "gate", "a/b"}, makeClipBytes(0.1)), VoxValidationError);
    CHECK_THROWS_AS(bank.put(VoxCacheKey{"s", "gate", "alice"}, {}), VoxValidationError);
    CHECK_THROWS_AS(bank.put(VoxCacheKey{"s", "gate", "alice"}, vector<uint8_t>(6, 0)), VoxValidationError);
    CHECK(bank.size() == 0);
}

TEST_CASE("index is rebuilt from sidecars on open", "[word_bank]") {
    TempDir dir;
    {
        VoxWordBank bank(dir.path());
        bank.put(VoxCacheKey{"s", "gate", "alice"}, makeClipBytes(0.1));
        bank.put(VoxCacheKey{"s", "door", "alice"}, makeClipBytes(0.1));
    }
    // Corrupt one payload so its recorded size no longer matches.
    {
        ofstream out(dir.path() / "s" / "alice" / "door.pcm", ios::binary | ios::app);
        out << "xx";
    }
    VoxWordBank reopened(dir.path());
    CHECK(reopened.contains(VoxCacheKey{"s", "gate", "alice"}));
    CHECK_FALSE(reopened.contains(VoxCacheKey{"s", "door", "alice"}));
    CHECK(reopened.size() == 1);
}

TEST_CASE("sidecars that do not name their own clip are ignored", "[word_bank]") {
    TempDir dir;
    const auto voiceDir = dir.path() / "s" / "alice";
    {
        VoxWordBank bank(dir.path());
        bank.put(VoxCacheKey{"s", "gate", "alice"}, makeClipBytes(0.1));
    }
    // A sidecar whose word differs from its file name.
    filesystem::copy_file(voiceDir / "gate.json", voiceDir / "door.json");
    // A sidecar whose word would escape the voice directory.
    {
        ofstream out(voiceDir / "escape.json");
        out << R"({"word": "../../escape", "size_bytes": 19200, "duration_seconds": 0.1, "created_at": 0})";
    }
    {
        ofstream out(dir.path() / "escape.pcm", ios::binary);
        out << string(19200, '\0');
    }

    VoxWordBank reopened(dir.path());
    CHECK(reopened.size() == 1);
    CHECK(reopened.contains(VoxCacheKey{"s", "gate", "alice"}));
    CHECK_FALSE(reopened.contains(VoxCacheKey{"s", "door", "alice"}));
    auto listed = reopened.list("s", "alice");
    REQUIRE(listed.size() == 1);
    CHECK(listed[0].key.word == "gate");
}

TEST_CASE("list, search and stats", "[word_bank]") {
    TempDir dir;
    VoxWordBank bank(dir.path());
    for (const auto* w : {"gate", "gates", "tailgate", "door", "agate"}) {
        bank.put(VoxCacheKey{"s", w, "alice"}, makeClipBytes(0.1));
    }
    bank.put(VoxCacheKey{"s", "gate", "bob"}, makeClipBytes(0.2));
    bank.put(VoxCacheKey{"other", "gate", "alice"}, makeClipBytes(0.1));

    auto listed = bank.list("s", "alice");
    REQUIRE(listed.size() == 5);
    CHECK(listed.front().key.word == "agate");
    CHECK(listed.back().key.word == "tailgate");

    auto found = bank.search("s", "alice", "GATE");
    vector<string> names;
    for (const auto& m : found) names.push_back(m.key.word);
    CHECK(names == vector<string>{"gate", "gates", "agate", "tailgate"});
    CHECK(bank.search("s", "alice", "gate", 2).size() == 2);
    CHECK(bank.search("s", "alice", "").empty());

    auto stats = bank.stats("s");
    CHECK(stats.totalWords == 6);
    CHECK(stats.voicesUsed == 2);
    CHECK(stats.perVoice["alice"].words == 5);
    CHECK(stats.perVoice["bob"].bytes == 38400);
    CHECK(stats.totalBytes == 5 * 19200 + 38400);
    CHECK(bank.voices("s") == vector<string>{"alice", "bob"});
}

TEST_CASE("purge by word, voice and scope", "[word_bank]") {
    TempDir dir;
    VoxWordBank bank(dir.path());
    bank.put(VoxCacheKey{"s", "gate", "alice"}, makeClipBytes(0.1));
    bank.put(VoxCacheKey{"s", "door", "alice"}, makeClipBytes(0.1));
    bank.put(VoxCacheKey{"s", "gate", "bob"}, makeClipBytes(0.1));
    bank.put(VoxCacheKey{"t", "gate", "alice"}, makeClipBytes(0.1));

    CHECK(bank.purgeWord(VoxCacheKey{"s", "door", "alice"}));
    CHECK_FALSE(bank.purgeWord(VoxCacheKey{"s", "door", "alice"}));
    CHECK_FALSE(filesystem::exists(dir.path() / "s" / "alice" / "door.pcm"));

    CHECK(bank.purge("s", string("bob")) == 1);
    CHECK_FALSE(filesystem::exists(dir.path() / "s" / "bob"));
    CHECK(bank.contains(VoxCacheKey{"s", "gate", "alice"}));

    CHECK(bank.purge("s") == 1);
    CHECK_FALSE(filesystem::exists(dir.path() / "s"));
    CHECK(bank.contains(VoxCacheKey{"t", "gate", "alice"}));
}

TEST_CASE("concurrent writers of different keys all land", "[word_bank]") {
    TempDir dir;
    VoxWordBank bank(dir.path());
    vector<thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([&bank, t]() {
            for (int i = 0; i < 10; i++) {
                bank.put(VoxCacheKey{"s", "w" + to_string(t) + "x" + to_string(i), "alice"}, makeClipBytes(0.01));
            }
        });
    }
    for (auto& th : threads) th.join();
    CHECK(bank.size() == 40);
}

TEST_CASE("same-key writers converge to one valid clip", "[word_bank]") {
    TempDir dir;
    VoxWordBank bank(dir.path());
    VoxCacheKey key{"s", "gate", "alice"};
    vector<thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([&bank, &key, t]() {
            for (int i = 0; i < 5; i++) bank.put(key, makeClipBytes(0.01 * (t + 1), static_cast<int16_t>(t + 1)));
        });
    }
    for (auto& th : threads) th.join();

    CHECK(bank.size() == 1);
    auto clip = bank.get(key);
    REQUIRE(clip);
    CHECK(clip->audioBytes.size() == clip->meta.sizeBytes);

    VoxWordBank reopened(dir.path());
    CHECK(reopened.contains(key));
}

TEST_CASE("export and import reproduce clips and metadata", "[word_bank]") {
    TempDir src, dst;
    VoxWordBank a(src.path());
    a.put(VoxCacheKey{"s", "gate", "alice"}, makeClipBytes(0.3, 5), 1111);
    a.put(VoxCacheKey{"s", "door", "alice"}, makeClipBytes(0.2, 6), 2222);
    a.put(VoxCacheKey{"s", "gate", "bob"}, makeClipBytes(0.1, 7), 3333);

    auto archive = a.exportArchive("s");
    VoxWordBank b(dst.path());
    auto report = b.importArchive("copy", span<const uint8_t>(archive.data(), archive.size()));
    CHECK(report.imported == 3);
    CHECK(report.rejected.empty());

    for (const auto& m : a.list("s", "alice")) {
        auto original = a.get(m.key);
        auto copied = b.get(VoxCacheKey{"copy", m.key.word, m.key.voiceId});
        REQUIRE(copied);
        CHECK(copied->audioBytes == original->audioBytes);
        CHECK(copied->meta.createdAt == original->meta.createdAt);
        CHECK(copied->meta.durationSeconds == Approx(original->meta.durationSeconds));
        CHECK(copied->meta.sizeBytes == original->meta.sizeBytes);
    }

    SECTION("export filtered by voice") {
        auto bobOnly = a.exportArchive("s", string("bob"));
        auto decoded = decodeVoxArchive(span<const uint8_t>(bobOnly.data(), bobOnly.size()));
        REQUIRE(decoded.items.size() == 1);
        CHECK(decoded.items[0].voiceId == "bob");
    }
    SECTION("import without overwrite keeps existing clips") {
        b.put(VoxCacheKey{"copy", "gate", "alice"}, makeClipBytes(0.05, 9));
        auto second = b.importArchive("copy", span<const uint8_t>(archive.data(), archive.size()), false);
        CHECK(second.keptExisting == 3);
        CHECK(second.imported == 0);
        CHECK(b.get(VoxCacheKey{"copy", "gate", "alice"})->audioBytes == makeClipBytes(0.05, 9));
    }
    SECTION("import with overwrite replaces clips") {
        b.put(VoxCacheKey{"copy", "gate", "alice"}, makeClipBytes(0.05, 9));
        auto second = b.importArchive("copy", span<const uint8_t>(archive.data(), archive.size()), true);
        CHECK(second.overwritten == 3);
        CHECK(b.get(VoxCacheKey{"copy", "gate", "alice"})->audioBytes == makeClipBytes(0.3, 5));
    }
}

TEST_CASE("import rejects inconsistent entries before committing", "[word_bank]") {
    TempDir dir;
    VoxWordBank bank(dir.path());

    auto clip = [](const string& word, vector<uint8_t> bytes, double duration) {
        VoxWordClip c;
        c.meta.key = VoxCacheKey{"src", word, "alice"};
        c.meta.sizeBytes = bytes.size();
        c.meta.durationSeconds = duration;
        c.audioBytes = std::move(bytes);
        return c;
    };
    vector<VoxWordClip> clips{
        clip("good", makeClipBytes(0.1), 0.1),
        clip("odd", vector<uint8_t>(6, 1), durationForBytes(6)),
        clip("BAD", makeClipBytes(0.1), 0.1),
        clip("wrongtime", makeClipBytes(0.1), 0.5),
        clip("good", makeClipBytes(0.1), 0.1),
    };
    auto archive = encodeVoxArchive("src", clips);
    auto report = bank.importArchive("s", span<const uint8_t>(archive.data(), archive.size()));

    CHECK(report.imported == 1);
    REQUIRE(report.rejected.size() == 4);
    CHECK(report.rejected[0].word == "odd");
    CHECK(report.rejected[1].reason == "invalid word");
    CHECK(report.rejected[3].reason == "duplicate entry");
    CHECK(bank.contains(VoxCacheKey{"s", "good", "alice"}));
    CHECK(bank.size() == 1);
}

TEST_CASE("structurally broken archives are rejected", "[word_bank]") {
    TempDir dir;
    VoxWordBank bank(dir.path());
    vector<uint8_t> junk{'n', 'o', 'p', 'e', 0, 0, 0, 0, 0, 0, 0, 0};
    CHECK_THROWS_AS(bank.importArchive("s", span<const uint8_t>(junk.data(), junk.size())), VoxArchiveError);
    CHECK(bank.size() == 0);
}
