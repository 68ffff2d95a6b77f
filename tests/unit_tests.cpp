#include "test_support.hpp"
#include "crypto/hasher.hpp"
#include "common/config.hpp"
#include "common/errors.hpp"
#include "files/archive_builder.hpp"
#include "files/download_coordinator.hpp"
#include "files/file_naming.hpp"
#include "files/volume_splitter.hpp"
#include "session/session_registry.hpp"
#include "session/session_state.hpp"
#include "transport/local_transport.hpp"
#include "nlohmann/json.hpp"

#include <vector>
#include <string>
#include <thread>
#include <chrono>
#include <filesystem>

namespace fs = std::filesystem;
using ::testing::_;
using ::testing::Invoke;

// --- Hasher ---

// Test Hasher::sha256_file on small, empty and multi-block files
TEST(HasherTest, Sha256File) {
    TempDir dir("hasher");
    write_file(dir.path() / "hello.txt", "Hello, World!");
    ASSERT_EQ(Hasher::hash_to_hex(Hasher::sha256_file(dir.path() / "hello.txt")),
              "dffd6021bb2bd5b0af676290809ec3a53191dd81c7f70a4b28688a362182986f");

    write_file(dir.path() / "empty.bin", "");
    ASSERT_EQ(Hasher::hash_to_hex(Hasher::sha256_file(dir.path() / "empty.bin")),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    std::string large;
    for (int i = 0; i < 100000; ++i) large += "abc";
    write_file(dir.path() / "large.bin", large);
    ASSERT_EQ(Hasher::hash_to_hex(Hasher::sha256_file(dir.path() / "large.bin")),
              "a77aedfe2e4a7232ea628a71745a966224c4521d93134b993cde5b65ea2f6e3c");

    ASSERT_THROW(Hasher::sha256_file(dir.path() / "missing.bin"), std::runtime_error);
}

// --- File naming ---

TEST(FileNamingTest, SanitizeReplacesReservedCharacters) {
    ASSERT_EQ(FileNaming::sanitize("Part 1: intro"), "Part 1 - intro");
    ASSERT_EQ(FileNaming::sanitize("a/b\\c?d*e"), "a_b_c_d_e");
    ASSERT_EQ(FileNaming::sanitize("  spaced  "), "spaced");
    ASSERT_EQ(FileNaming::sanitize("   "), "video");
    ASSERT_EQ(FileNaming::sanitize(".."), "video");
}

TEST(FileNamingTest, ResolveExtension) {
    ASSERT_EQ(FileNaming::resolve_extension(std::string("holiday.MOV"), std::string("video/mp4")), ".MOV");
    ASSERT_EQ(FileNaming::resolve_extension(std::nullopt, std::string("video/quicktime")), ".mov");
    ASSERT_EQ(FileNaming::resolve_extension(std::string("noext"), std::string("video/webm; codecs=vp9")), ".webm");
    ASSERT_EQ(FileNaming::resolve_extension(std::nullopt, std::string("application/x-unknown")), ".mp4");
    ASSERT_EQ(FileNaming::resolve_extension(std::nullopt, std::nullopt), ".mp4");
}

TEST(FileNamingTest, DefaultDisplayName) {
    ASSERT_EQ(FileNaming::default_display_name(1), "video_01");
    ASSERT_EQ(FileNaming::default_display_name(12), "video_12");
    ASSERT_EQ(FileNaming::default_display_name(123), "video_123");
}

TEST(FileNamingTest, AllocatorSuffixesCollisions) {
    FileNaming::NameAllocator names;
    ASSERT_EQ(names.allocate("clip", ".mp4"), "clip.mp4");
    ASSERT_EQ(names.allocate("clip", ".mp4"), "clip_01.mp4");
    ASSERT_EQ(names.allocate("clip.mp4", ".mp4"), "clip_02.mp4");
    ASSERT_EQ(names.allocate("clip", ".mov"), "clip.mov");
    ASSERT_EQ(names.size(), 4u);
    ASSERT_TRUE(names.contains("clip_01.mp4"));
}

TEST(FileNamingTest, AllocatorTruncatesLongNames) {
    FileNaming::NameAllocator names;
    std::string name = names.allocate(std::string(500, 'x'), ".mp4");
    ASSERT_LE(name.size(), 255u);
    ASSERT_EQ(name.substr(name.size() - 4), ".mp4");
}

// --- Config ---

TEST(ConfigTest, EmptyObjectGivesDefaults) {
    Config config = ConfigLoader::parse("{}");
    ASSERT_EQ(config.archive_name, "Monitor.zip");
    ASSERT_EQ(config.quiet_period, std::chrono::milliseconds(3000));
    ASSERT_EQ(config.archive_size_limit_bytes, 48ull * 1024 * 1024);
    ASSERT_EQ(config.compression, ArchiveCompression::DEFLATE);
    ASSERT_TRUE(config.eager_download);
    ASSERT_EQ(config.log_level, LogLevel::INFO);
}

TEST(ConfigTest, ParsesValues) {
    Config config = ConfigLoader::parse(R"({
        "archive_name": "Batch.zip",
        "quiet_period_ms": 500,
        "archive_size_limit_mb": 0,
        "archive_compression": "store",
        "eager_download": false,
        "worker_threads": 2,
        "log_level": "debug"
    })");
    ASSERT_EQ(config.archive_name, "Batch.zip");
    ASSERT_EQ(config.quiet_period, std::chrono::milliseconds(500));
    ASSERT_EQ(config.archive_size_limit_bytes, 0u);
    ASSERT_EQ(config.compression, ArchiveCompression::STORE);
    ASSERT_FALSE(config.eager_download);
    ASSERT_EQ(config.worker_threads, 2u);
    ASSERT_EQ(config.log_level, LogLevel::DEBUG);
}

TEST(ConfigTest, RejectsInvalidValues) {
    ASSERT_THROW(ConfigLoader::parse("{not json"), ConfigError);
    ASSERT_THROW(ConfigLoader::parse("[]"), ConfigError);
    ASSERT_THROW(ConfigLoader::parse(R"({"archive_size_limit_mb": -1})"), ConfigError);
    ASSERT_THROW(ConfigLoader::parse(R"({"archive_size_limit_mb": 1e20})"), ConfigError);
    ASSERT_THROW(ConfigLoader::parse(R"({"archive_compression": "lzma"})"), ConfigError);
    ASSERT_THROW(ConfigLoader::parse(R"({"quiet_period_ms": 0})"), ConfigError);
    ASSERT_THROW(ConfigLoader::parse(R"({"quiet_period_ms": "soon"})"), ConfigError);
    ASSERT_THROW(ConfigLoader::parse(R"({"log_level": "LOUD"})"), ConfigError);

    Config config;
    config.archive_name = "Monitor.tar";
    ASSERT_THROW(ConfigLoader::validate(config), ConfigError);
    config.archive_name = "sub/Monitor.zip";
    ASSERT_THROW(ConfigLoader::validate(config), ConfigError);
}

TEST(ConfigTest, LoadMissingFileUsesDefaultsAndCreatesWorkRoot) {
    TempDir dir("config");
    fs::path config_path = dir.path() / "burstpack.json";
    write_file(config_path, "{\"work_root\": \"" + (dir.path() / "work").generic_string() + "\"}");

    Config config = ConfigLoader::load(config_path);
    ASSERT_TRUE(fs::is_directory(dir.path() / "work"));

    Config defaults = ConfigLoader::load(dir.path() / "absent.json");
    ASSERT_EQ(defaults.archive_name, "Monitor.zip");
}

// --- Volume splitter ---

TEST(VolumeSplitterTest, SplitsIntoOrderedParts) {
    TempDir dir("split");
    fs::path source = dir.path() / "Monitor.zip";
    std::string content = random_bytes(2500);
    write_file(source, content);

    auto parts = VolumeSplitter::split(source, 1000);
    ASSERT_EQ(parts.size(), 3u);
    ASSERT_EQ(parts[0].filename(), "Monitor.zip.001");
    ASSERT_EQ(parts[2].filename(), "Monitor.zip.003");
    ASSERT_EQ(fs::file_size(parts[0]), 1000u);
    ASSERT_EQ(fs::file_size(parts[1]), 1000u);
    ASSERT_EQ(fs::file_size(parts[2]), 500u);
    ASSERT_FALSE(fs::exists(source));

    std::string joined;
    for (const auto& part : parts) joined += read_file(part);
    ASSERT_EQ(joined, content);
}

TEST(VolumeSplitterTest, LimitLargerThanFileGivesOnePart) {
    TempDir dir("split_one");
    fs::path source = dir.path() / "a.bin";
    write_file(source, "hello");

    auto parts = VolumeSplitter::split(source, 1024);
    ASSERT_EQ(parts.size(), 1u);
    ASSERT_EQ(read_file(parts[0]), "hello");
}

TEST(VolumeSplitterTest, NonPositiveLimitLeavesFileAlone) {
    TempDir dir("split_none");
    fs::path source = dir.path() / "a.bin";
    write_file(source, "hello");

    auto parts = VolumeSplitter::split(source, 0);
    ASSERT_EQ(parts, std::vector<fs::path>{source});
    ASSERT_TRUE(fs::exists(source));
    ASSERT_EQ(VolumeSplitter::split(source, -5), std::vector<fs::path>{source});
}

TEST(VolumeSplitterTest, MissingSourceThrows) {
    TempDir dir("split_missing");
    ASSERT_THROW(VolumeSplitter::split(dir.path() / "nope.zip", 10), ArchiveError);
}

// --- Archive builder ---

class ArchiveBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::make_unique<TempDir>("archive");
        write_file(dir_->path() / "in" / "first.mp4", random_bytes(4000, 1));
        write_file(dir_->path() / "in" / "second.mp4", random_bytes(3000, 2));
        files_ = {
            {dir_->path() / "in" / "first.mp4", "first.mp4", "first"},
            {dir_->path() / "in" / "second.mp4", "second.mp4", "second"},
        };
    }

    fs::path out(const std::string& name) {
        fs::path p = dir_->path() / name;
        fs::create_directories(p);
        return p;
    }

    std::unique_ptr<TempDir> dir_;
    std::vector<DownloadedFile> files_;
};

TEST_F(ArchiveBuilderTest, SingleVolumeKeepsEntryOrder) {
    ArchiveBuilder builder("Monitor.zip", 0, ArchiveCompression::STORE);
    auto volumes = builder.build(files_, out("single"));

    ASSERT_EQ(volumes.size(), 1u);
    ASSERT_EQ(volumes[0].index, 1u);
    ASSERT_EQ(volumes[0].total, 1u);
    ASSERT_EQ(volumes[0].path.filename(), "Monitor.zip");
    ASSERT_EQ(volumes[0].caption, "Done");
    ASSERT_EQ(volumes[0].size_bytes, fs::file_size(volumes[0].path));
    ASSERT_EQ(volumes[0].sha256, Hasher::hash_to_hex(Hasher::sha256_file(volumes[0].path)));

    std::vector<std::string> expected = {"first.mp4", "second.mp4"};
    ASSERT_EQ(zip_entries(read_file(volumes[0].path)), expected);
}

TEST_F(ArchiveBuilderTest, ArchiveExactlyAtLimitIsNotSplit) {
    uint64_t size = ArchiveBuilder("Monitor.zip", 0, ArchiveCompression::STORE)
                        .build(files_, out("probe"))[0].size_bytes;

    ArchiveBuilder builder("Monitor.zip", size, ArchiveCompression::STORE);
    auto volumes = builder.build(files_, out("at_limit"));
    ASSERT_EQ(volumes.size(), 1u);
    ASSERT_EQ(volumes[0].path.filename(), "Monitor.zip");
}

TEST_F(ArchiveBuilderTest, ArchiveOverLimitIsSplit) {
    uint64_t size = ArchiveBuilder("Monitor.zip", 0, ArchiveCompression::STORE)
                        .build(files_, out("probe"))[0].size_bytes;

    uint64_t limit = size - 1;
    ArchiveBuilder builder("Monitor.zip", limit, ArchiveCompression::STORE);
    fs::path work = out("over_limit");
    auto volumes = builder.build(files_, work);

    ASSERT_GE(volumes.size(), 2u);
    ASSERT_FALSE(fs::exists(work / "Monitor.zip"));
    std::string joined;
    for (size_t i = 0; i < volumes.size(); ++i) {
        ASSERT_EQ(volumes[i].index, i + 1);
        ASSERT_EQ(volumes[i].total, volumes.size());
        ASSERT_LE(volumes[i].size_bytes, limit);
        ASSERT_EQ(volumes[i].caption, ArchiveBuilder::volume_caption(i + 1, volumes.size()));
        joined += read_file(volumes[i].path);
    }
    ASSERT_EQ(joined.size(), size);
    std::vector<std::string> expected = {"first.mp4", "second.mp4"};
    ASSERT_EQ(zip_entries(joined), expected);
}

TEST_F(ArchiveBuilderTest, EmptyInputThrows) {
    ArchiveBuilder builder("Monitor.zip", 0);
    fs::path work = out("empty");
    ASSERT_THROW(builder.build({}, work), EmptyResultError);
    ASSERT_TRUE(fs::is_empty(work));
}

TEST_F(ArchiveBuilderTest, MissingInputFileThrowsArchiveError) {
    files_.push_back({dir_->path() / "in" / "gone.mp4", "gone.mp4", "gone"});
    ArchiveBuilder builder("Monitor.zip", 0);
    fs::path work = out("broken");
    ASSERT_THROW(builder.build(files_, work), ArchiveError);
    ASSERT_FALSE(fs::exists(work / "Monitor.zip"));
}

TEST(ArchiveCaptionTest, Captions) {
    ASSERT_EQ(ArchiveBuilder::volume_caption(1, 1), "Done");
    ASSERT_EQ(ArchiveBuilder::volume_caption(2, 3),
              "Done. Archive part 2/3. Download all parts before extracting.");
}

// --- Session state ---

TEST(SessionStateTest, AppendAssignsSequenceNamesAndEpoch) {
    TempDir dir("session");
    SessionState session(1, "chat-1", dir.path() / "s");

    IncomingMedia a;
    a.ref = "a";
    a.caption = "Holiday";
    a.mime_type = "video/quicktime";
    IncomingMedia b;
    b.ref = "b";
    b.caption = "Holiday";
    IncomingMedia c;
    c.ref = "c";
    c.caption = "   ";

    auto first = session.append(a, "chat-1");
    auto second = session.append(b, "chat-1");
    auto third = session.append(c, "chat-1");
    ASSERT_TRUE(first && second && third);

    ASSERT_EQ(first->sequence, 1u);
    ASSERT_EQ(first->display_name, "Holiday");
    ASSERT_EQ(first->extension, ".mov");
    ASSERT_EQ(second->extension, ".mp4");
    ASSERT_EQ(third->display_name, "video_03");
    ASSERT_NE(session.local_path(*first), session.local_path(*second));
    ASSERT_EQ(session.epoch(), 3u);
    ASSERT_TRUE(session.is_current(3));
    ASSERT_FALSE(session.is_current(2));
    ASSERT_EQ(session.item_count(), 3u);
}

TEST(SessionStateTest, ClosedSessionRejectsItems) {
    TempDir dir("session_closed");
    SessionState session(1, "chat-1", dir.path() / "s");
    IncomingMedia media;
    media.ref = "a";
    ASSERT_TRUE(session.append(media, "chat-1"));
    ASSERT_TRUE(session.close_if_current(1));
    ASSERT_FALSE(session.append(media, "chat-1"));
    ASSERT_FALSE(session.is_current(1));
}

TEST(SessionStateTest, FinalizeClaimWaitsForDownloads) {
    TempDir dir("session_claim");
    SessionState session(1, "chat-1", dir.path() / "s");
    IncomingMedia media;
    media.ref = "a";
    auto item = session.append(media, "chat-1");

    ASSERT_TRUE(session.claim_download(item->sequence));
    ASSERT_FALSE(session.claim_download(item->sequence));
    ASSERT_EQ(session.in_flight(), 1);
    ASSERT_EQ(session.try_begin_finalize(1, false), ClaimResult::BUSY);

    session.finish_download(item->sequence, std::nullopt);
    ASSERT_EQ(session.in_flight(), 0);
    ASSERT_EQ(session.download_slot(item->sequence).state, DownloadState::DONE);

    ASSERT_EQ(session.try_begin_finalize(1, false), ClaimResult::CLAIMED);
    ASSERT_EQ(session.try_begin_finalize(1, false), ClaimResult::BUSY);
    session.end_finalize();
    ASSERT_EQ(session.try_begin_finalize(0, false), ClaimResult::STALE);
}

TEST(SessionStateTest, ForcedClaimIgnoresInFlightDownloads) {
    TempDir dir("session_force");
    SessionState session(1, "chat-1", dir.path() / "s");
    IncomingMedia media;
    media.ref = "a";
    auto item = session.append(media, "chat-1");
    ASSERT_TRUE(session.claim_download(item->sequence));
    ASSERT_EQ(session.try_begin_finalize(1, true), ClaimResult::CLAIMED);
}

// --- Session registry ---

TEST(SessionRegistryTest, ResolveReturnsLiveSession) {
    TempDir dir("registry");
    SessionRegistry registry(dir.path());
    auto first = registry.resolve(7, "chat-7");
    auto again = registry.resolve(7, "chat-7");
    auto other = registry.resolve(8, "chat-8");
    ASSERT_EQ(first, again);
    ASSERT_NE(first, other);
    ASSERT_NE(first->download_dir(), other->download_dir());
    ASSERT_EQ(registry.size(), 2u);
}

TEST(SessionRegistryTest, DiscardIsIdempotent) {
    TempDir dir("registry_discard");
    SessionRegistry registry(dir.path());
    auto session = registry.resolve(7, "chat-7");
    IncomingMedia media;
    media.ref = "a";
    session->append(media, "chat-7");

    ASSERT_TRUE(registry.discard(7));
    ASSERT_TRUE(session->closed());
    ASSERT_EQ(session->item_count(), 0u);
    ASSERT_FALSE(registry.discard(7));
    ASSERT_FALSE(registry.discard(99));
    ASSERT_EQ(registry.size(), 0u);
}

TEST(SessionRegistryTest, CommitOnlyForCurrentEpoch) {
    TempDir dir("registry_commit");
    SessionRegistry registry(dir.path());
    auto session = registry.resolve(7, "chat-7");
    IncomingMedia media;
    media.ref = "a";
    session->append(media, "chat-7");
    session->append(media, "chat-7");

    ASSERT_FALSE(registry.commit(session, 1));
    ASSERT_EQ(registry.size(), 1u);
    ASSERT_TRUE(registry.commit(session, 2));
    ASSERT_EQ(registry.size(), 0u);

    auto fresh = registry.resolve(7, "chat-7");
    ASSERT_NE(fresh, session);
    ASSERT_EQ(fresh->item_count(), 0u);
}

TEST(SessionRegistryTest, SnapshotIsSortedByUser) {
    TempDir dir("registry_snapshot");
    SessionRegistry registry(dir.path());
    IncomingMedia media;
    media.ref = "a";
    registry.resolve(9, "chat-9")->append(media, "chat-9");
    registry.resolve(3, "chat-3")->append(media, "chat-3");
    registry.resolve(3, "chat-3")->append(media, "chat-3");

    auto snapshot = registry.snapshot();
    ASSERT_EQ(snapshot.size(), 2u);
    ASSERT_EQ(snapshot[0].user_id, 3);
    ASSERT_EQ(snapshot[0].items, 2u);
    ASSERT_EQ(snapshot[1].user_id, 9);
    ASSERT_FALSE(snapshot[1].finalizing);
}

// --- Download coordinator ---

TEST(DownloadCoordinatorTest, CollectsSuccessesAndFailuresInOrder) {
    TempDir dir("collect");
    RecordingTransport transport;
    transport.add_media("a", "AAAA");
    transport.add_media("c", "CCCC");

    SessionState session(1, "chat-1", dir.path() / "s");
    for (const char* ref : {"a", "b", "c"}) {
        IncomingMedia media;
        media.ref = ref;
        session.append(media, "chat-1");
    }

    DownloadCoordinator coordinator(transport, std::chrono::milliseconds(1000));
    auto outcome = coordinator.collect(session, session.items_snapshot(), session.epoch());
    ASSERT_TRUE(outcome);
    ASSERT_EQ(outcome->files.size(), 2u);
    ASSERT_EQ(outcome->files[0].archive_name, "video_01.mp4");
    ASSERT_EQ(outcome->files[1].archive_name, "video_03.mp4");
    ASSERT_EQ(read_file(outcome->files[1].local_path), "CCCC");
    ASSERT_EQ(outcome->failed.size(), 1u);
    ASSERT_EQ(outcome->failed[0].item.ref, "b");
    ASSERT_EQ(session.in_flight(), 0);
}

// Only downloaded files take part in naming, so a failed "clip" leaves the
// plain name to the next "clip".
TEST(DownloadCoordinatorTest, FailedItemDoesNotReserveName) {
    TempDir dir("collect_names");
    RecordingTransport transport;
    transport.add_media("good", "GOOD");
    transport.add_media("also-good", "ALSO");

    SessionState session(1, "chat-1", dir.path() / "s");
    for (const char* ref : {"gone", "good", "also-good"}) {
        IncomingMedia media;
        media.ref = ref;
        media.caption = "clip";
        session.append(media, "chat-1");
    }

    DownloadCoordinator coordinator(transport, std::chrono::milliseconds(1000));
    auto outcome = coordinator.collect(session, session.items_snapshot(), session.epoch());
    ASSERT_TRUE(outcome);
    ASSERT_EQ(outcome->failed.size(), 1u);
    ASSERT_EQ(outcome->files.size(), 2u);
    ASSERT_EQ(outcome->files[0].archive_name, "clip.mp4");
    ASSERT_EQ(outcome->files[1].archive_name, "clip_01.mp4");
    ASSERT_EQ(read_file(outcome->files[0].local_path), "GOOD");
}

TEST(DownloadCoordinatorTest, ReusesEarlierDownloads) {
    TempDir dir("collect_reuse");
    RecordingTransport transport;
    transport.add_media("a", "AAAA");

    SessionState session(1, "chat-1", dir.path() / "s");
    IncomingMedia media;
    media.ref = "a";
    auto item = session.append(media, "chat-1");

    DownloadCoordinator coordinator(transport, std::chrono::milliseconds(1000));
    ASSERT_TRUE(coordinator.download_item(session, *item));
    ASSERT_FALSE(coordinator.download_item(session, *item));

    auto outcome = coordinator.collect(session, session.items_snapshot(), session.epoch());
    ASSERT_TRUE(outcome);
    ASSERT_EQ(outcome->files.size(), 1u);
    ASSERT_EQ(transport.fetch_count(), 1);
}

TEST(DownloadCoordinatorTest, StopsWhenEpochMovesOn) {
    TempDir dir("collect_stale");
    MockTransport transport;
    SessionState session(1, "chat-1", dir.path() / "s");
    IncomingMedia media;
    media.ref = "a";
    session.append(media, "chat-1");
    session.append(media, "chat-1");
    auto items = session.items_snapshot();
    uint64_t epoch = session.epoch();

    // A new arrival lands while the first item is being fetched.
    EXPECT_CALL(transport, fetch(_, _, _))
        .Times(1)
        .WillOnce(Invoke([&](const MediaItem&, const fs::path& path, std::chrono::milliseconds) {
            write_file(path, "data");
            session.append(media, "chat-1");
        }));

    DownloadCoordinator coordinator(transport, std::chrono::milliseconds(1000));
    ASSERT_FALSE(coordinator.collect(session, items, epoch));
}

TEST(DownloadCoordinatorTest, UnexpectedExceptionCountsAsFailure) {
    TempDir dir("collect_throw");
    MockTransport transport;
    SessionState session(1, "chat-1", dir.path() / "s");
    IncomingMedia media;
    media.ref = "a";
    auto item = session.append(media, "chat-1");

    EXPECT_CALL(transport, fetch(_, _, _)).WillOnce(::testing::Throw(std::runtime_error("disk on fire")));

    DownloadCoordinator coordinator(transport, std::chrono::milliseconds(1000));
    ASSERT_TRUE(coordinator.download_item(session, *item));
    DownloadSlot slot = session.download_slot(item->sequence);
    ASSERT_EQ(slot.state, DownloadState::FAILED);
    ASSERT_NE(slot.error.find("disk on fire"), std::string::npos);
}

// --- Local transport ---

class LocalTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::make_unique<TempDir>("local");
        write_file(dir_->path() / "media" / "clip.mp4", "0123456789");
        transport_ = std::make_unique<LocalTransport>(dir_->path() / "media", dir_->path() / "outbox", 100);
    }

    MediaItem item(const std::string& ref) {
        MediaItem m;
        m.ref = ref;
        m.sequence = 1;
        m.extension = ".mp4";
        return m;
    }

    std::unique_ptr<TempDir> dir_;
    std::unique_ptr<LocalTransport> transport_;
};

TEST_F(LocalTransportTest, FetchCopiesMedia) {
    fs::path target = dir_->path() / "dl" / "clip.mp4";
    transport_->fetch(item("clip.mp4"), target, std::chrono::milliseconds(1000));
    ASSERT_EQ(read_file(target), "0123456789");
}

TEST_F(LocalTransportTest, FetchFailures) {
    fs::path target = dir_->path() / "dl" / "x.mp4";
    ASSERT_THROW(transport_->fetch(item("missing.mp4"), target, std::chrono::milliseconds(1000)), DownloadError);
    ASSERT_THROW(transport_->fetch(item("../outside.mp4"), target, std::chrono::milliseconds(1000)), DownloadError);

    write_file(dir_->path() / "media" / "big.mp4", std::string(101, 'x'));
    ASSERT_THROW(transport_->fetch(item("big.mp4"), target, std::chrono::milliseconds(1000)), DownloadError);
    ASSERT_FALSE(fs::exists(target));
}

TEST_F(LocalTransportTest, DeliverWritesVolumeAndJournal) {
    fs::path volume_path = dir_->path() / "run" / "Monitor.zip.001";
    write_file(volume_path, "zipdata");
    ArchiveVolume volume;
    volume.index = 1;
    volume.total = 2;
    volume.path = volume_path;
    volume.size_bytes = 7;
    volume.sha256 = "abc";
    volume.caption = ArchiveBuilder::volume_caption(1, 2);

    transport_->deliver("chat-1", volume);
    transport_->notify_text("chat-1", "hello");

    fs::path outbox = transport_->outbox_for("chat-1");
    ASSERT_EQ(read_file(outbox / "Monitor.zip.001"), "zipdata");

    std::ifstream journal(outbox / LocalTransport::JOURNAL_FILE);
    std::string line;
    std::vector<nlohmann::json> records;
    while (std::getline(journal, line)) records.push_back(nlohmann::json::parse(line));
    ASSERT_EQ(records.size(), 2u);
    ASSERT_EQ(records[0]["type"], "volume");
    ASSERT_EQ(records[0]["file"], "Monitor.zip.001");
    ASSERT_EQ(records[0]["part"], 1);
    ASSERT_EQ(records[0]["total"], 2);
    ASSERT_EQ(records[0]["sha256"], "abc");
    ASSERT_EQ(records[1]["type"], "message");
    ASSERT_EQ(records[1]["text"], "hello");
}

TEST_F(LocalTransportTest, DeliverMissingVolumeThrows) {
    ArchiveVolume volume;
    volume.path = dir_->path() / "run" / "nothing.zip";
    ASSERT_THROW(transport_->deliver("chat-1", volume), DeliveryError);
}
