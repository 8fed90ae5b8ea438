#include <gtest/gtest.h>

#include <functional>
#include <utility>

#include "core/backup_engine/backup_engine.hpp"
#include "core/state/state_store.hpp"
#include "infra/config/config.hpp"
#include "infra/interrupt.hpp"
#include "support/memory_object_store.hpp"
#include "support/memory_snapshot_source.hpp"
#include "support/temp_dir.hpp"

using namespace coldsend::core;
using coldsend::extensions::RunAction;
using coldsend::infra::ErrorCode;
using coldsend::testing::MemoryObjectStore;
using coldsend::testing::MemorySnapshotSource;
using coldsend::testing::TempDir;

namespace {

std::string pattern_bytes(std::size_t n, char first = 'a') {
    std::string s(n, '\0');
    for (std::size_t i = 0; i < n; ++i) {
        s[i] = static_cast<char>(first + i % 26);
    }
    return s;
}

// Runs `before_first_put` once, in the middle of the first upload
class InterleavingObjectStore final : public coldsend::adapters::ObjectStore {
public:
    InterleavingObjectStore(MemoryObjectStore& inner, std::function<void()> before_first_put)
        : inner_(inner)
        , before_first_put_(std::move(before_first_put))
    {}

    auto put_object(const coldsend::adapters::PutObjectRequest& request)
        -> coldsend::infra::VoidResult override
    {
        if (before_first_put_) {
            auto hook = std::exchange(before_first_put_, nullptr);
            hook();
        }
        return inner_.put_object(request);
    }

    auto list_objects(const std::string& prefix)
        -> coldsend::infra::Result<std::vector<coldsend::adapters::ObjectInfo>> override
    {
        return inner_.list_objects(prefix);
    }

private:
    MemoryObjectStore& inner_;
    std::function<void()> before_first_put_;
};

class BackupEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        BackupChainState initial;
        initial.config = ChainConfig{
            .dataset = "tank/home",
            .bucket = "archive",
            .snapshot_pattern = "backup{seq}",
            .object_prefix = "laptop/",
        };
        ASSERT_TRUE(store.create(initial).has_value());

        options.chunk_size = 10;
        options.retry = coldsend::infra::RetryPolicy{
            .max_attempts = 2,
            .initial_delay = std::chrono::milliseconds(1),
            .max_delay = std::chrono::milliseconds(1),
        };
    }

    void TearDown() override {
        coldsend::infra::set_interrupted(false);
    }

    auto run() -> coldsend::infra::Result<RunSummary> {
        BackupEngine engine(options, store, source, objects);
        return engine.run();
    }

    auto state() -> BackupChainState {
        return store.load().value().value();
    }

    // Contents of every stored chunk, by key
    auto stored() const -> std::map<std::string, std::string> {
        std::map<std::string, std::string> out;
        for (const auto& [key, object] : objects.objects) {
            out[key] = object.data;
        }
        return out;
    }

    TempDir dir;
    StateStore store{dir / "state.yaml"};
    MemorySnapshotSource source;
    MemoryObjectStore objects;
    RunOptions options;
};

} // namespace

TEST_F(BackupEngineTest, FullThenIncremental)
{
    const auto full = pattern_bytes(25);
    source.streams["backup0"] = full;

    auto first = run();
    ASSERT_TRUE(first.has_value()) << first.error().message;
    EXPECT_EQ(first->action, RunAction::StartNew);
    EXPECT_EQ(first->pair, (SnapshotPair{std::nullopt, "backup0"}));
    EXPECT_EQ(first->total_chunks, 3u);
    EXPECT_EQ(first->total_bytes, 25u);

    EXPECT_EQ(stored(), (std::map<std::string, std::string>{
        {"laptop/backup0/0", full.substr(0, 10)},
        {"laptop/backup0/1", full.substr(10, 10)},
        {"laptop/backup0/2", full.substr(20, 5)},
    }));

    source.streams["backup0_backup1"] = "delta";
    auto second = run();
    ASSERT_TRUE(second.has_value()) << second.error().message;
    EXPECT_EQ(second->pair, (SnapshotPair{"backup0", "backup1"}));
    EXPECT_EQ(objects.objects.at("laptop/backup0_backup1/0").data, "delta");

    const auto after = state();
    EXPECT_FALSE(after.in_flight);
    ASSERT_EQ(after.chain.size(), 2u);
    EXPECT_EQ(after.chain[0].chunk_count, 3u);
    EXPECT_EQ(after.chain[1].pair.base, "backup0");
    EXPECT_EQ(after.chain[1].total_bytes, 5u);
    EXPECT_EQ(objects.objects.at("laptop/backup0/0").storage_class, "DEEP_ARCHIVE");
}

TEST_F(BackupEngineTest, ResumeAfterFirstChunkSkipsItsBytes)
{
    const auto data = pattern_bytes(25);
    source.streams["backup0"] = data;
    objects.fail_after_puts = 1;

    auto failed = run();
    ASSERT_FALSE(failed.has_value());
    ASSERT_TRUE(state().in_flight);
    EXPECT_EQ(state().in_flight->highest_durable_chunk, 0);
    EXPECT_EQ(state().in_flight->bytes_streamed, 10u);

    objects.fail_after_puts.reset();
    objects.attempts.clear();
    auto resumed = run();
    ASSERT_TRUE(resumed.has_value()) << resumed.error().message;
    EXPECT_EQ(resumed->action, RunAction::Resume);
    EXPECT_EQ(resumed->chunks_skipped, 1u);
    EXPECT_EQ(resumed->chunks_uploaded, 2u);
    EXPECT_EQ(objects.attempts, (std::vector<std::string>{"laptop/backup0/1", "laptop/backup0/2"}));
    EXPECT_EQ(source.opens["backup0"], 2);
    EXPECT_EQ(source.snapshots.size(), 1u);
}

TEST_F(BackupEngineTest, CrashAtEveryChunkBoundaryConvergesToSameObjects)
{
    const auto data = pattern_bytes(45);

    std::map<std::string, std::string> reference;
    {
        TempDir ref_dir;
        StateStore ref_store(ref_dir / "state.yaml");
        ASSERT_TRUE(ref_store.create(state()).has_value());
        MemorySnapshotSource ref_source;
        ref_source.streams["backup0"] = data;
        MemoryObjectStore ref_objects;
        BackupEngine engine(options, ref_store, ref_source, ref_objects);
        ASSERT_TRUE(engine.run().has_value());
        for (const auto& [key, object] : ref_objects.objects) {
            reference[key] = object.data;
        }
    }
    ASSERT_EQ(reference.size(), 5u);

    for (std::size_t crash_after = 0; crash_after < reference.size(); ++crash_after) {
        TempDir run_dir;
        StateStore run_store(run_dir / "state.yaml");
        ASSERT_TRUE(run_store.create(state()).has_value());
        MemorySnapshotSource run_source;
        run_source.streams["backup0"] = data;
        MemoryObjectStore run_objects;
        run_objects.fail_after_puts = crash_after;

        BackupEngine crashing(options, run_store, run_source, run_objects);
        auto failed = crashing.run();
        ASSERT_FALSE(failed.has_value()) << "crash after " << crash_after;
        EXPECT_EQ(run_store.load().value()->in_flight->highest_durable_chunk,
                  static_cast<std::int64_t>(crash_after) - 1);
        EXPECT_EQ(run_objects.objects.size(), crash_after);

        run_objects.fail_after_puts.reset();
        BackupEngine resuming(options, run_store, run_source, run_objects);
        auto done = resuming.run();
        ASSERT_TRUE(done.has_value()) << done.error().message;

        std::map<std::string, std::string> got;
        for (const auto& [key, object] : run_objects.objects) {
            got[key] = object.data;
        }
        EXPECT_EQ(got, reference) << "crash after " << crash_after;
        EXPECT_EQ(run_objects.successful_puts(), reference.size());
    }
}

TEST_F(BackupEngineTest, AcknowledgedButUncommittedChunkIsUploadedAgain)
{
    const auto data = pattern_bytes(25);
    source.streams["backup0"] = data;
    objects.store_then_fail.insert("laptop/backup0/1");

    auto failed = run();
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(state().in_flight->highest_durable_chunk, 0);
    EXPECT_TRUE(objects.objects.contains("laptop/backup0/1"));

    auto resumed = run();
    ASSERT_TRUE(resumed.has_value()) << resumed.error().message;
    EXPECT_EQ(objects.objects.size(), 3u);
    EXPECT_EQ(objects.objects.at("laptop/backup0/1").data, data.substr(10, 10));
}

TEST_F(BackupEngineTest, PermanentFailureLeavesOnlyEarlierChunks)
{
    source.streams["backup0"] = pattern_bytes(25);
    objects.permanent_failures.insert("laptop/backup0/1");

    auto result = run();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::AccessDenied);
    EXPECT_NE(result.error().to_exit_code(), 0);

    const auto after = state();
    ASSERT_TRUE(after.in_flight);
    EXPECT_EQ(after.in_flight->highest_durable_chunk, 0);
    EXPECT_TRUE(after.chain.empty());
    EXPECT_EQ(objects.keys(), std::vector<std::string>{"laptop/backup0/0"});
}

TEST_F(BackupEngineTest, ExhaustedRetriesKeepInFlightRun)
{
    source.streams["backup0"] = pattern_bytes(25);
    objects.transient_failures["laptop/backup0/2"] = 100;

    auto result = run();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::RetriesExhausted);
    EXPECT_EQ(state().in_flight->highest_durable_chunk, 1);

    objects.transient_failures.clear();
    ASSERT_TRUE(run().has_value());
    EXPECT_EQ(objects.objects.size(), 3u);
}

TEST_F(BackupEngineTest, EmptyDiffCompletesWithZeroChunks)
{
    source.streams["backup0"] = "";

    auto result = run();
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->total_chunks, 0u);
    EXPECT_TRUE(objects.objects.empty());

    const auto after = state();
    EXPECT_FALSE(after.in_flight);
    ASSERT_EQ(after.chain.size(), 1u);
    EXPECT_EQ(after.chain[0].chunk_count, 0u);
}

TEST_F(BackupEngineTest, FailedSendUploadsNoShortTail)
{
    source.streams["backup0"] = pattern_bytes(25);
    source.exit_codes["backup0"] = 1;

    auto result = run();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::StreamFailed);
    EXPECT_EQ(state().in_flight->highest_durable_chunk, 1);
    EXPECT_FALSE(objects.objects.contains("laptop/backup0/2"));
}

TEST_F(BackupEngineTest, ReplayThatDiffersIsAMismatch)
{
    source.streams["backup0"] = pattern_bytes(25);
    objects.fail_after_puts = 1;
    ASSERT_FALSE(run().has_value());
    objects.fail_after_puts.reset();

    source.streams["backup0"] = pattern_bytes(25, 'A');
    auto result = run();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::StreamMismatch);
    EXPECT_EQ(state().in_flight->highest_durable_chunk, 0);
    EXPECT_EQ(objects.objects.size(), 1u);
}

TEST_F(BackupEngineTest, ReplayThatEndsEarlyIsTruncation)
{
    source.streams["backup0"] = pattern_bytes(25);
    objects.fail_after_puts = 2;
    ASSERT_FALSE(run().has_value());
    objects.fail_after_puts.reset();

    source.streams["backup0"] = pattern_bytes(10);
    auto result = run();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::StreamTruncated);
}

TEST_F(BackupEngineTest, ResumeKeepsRecordedChunkSize)
{
    source.streams["backup0"] = pattern_bytes(25);
    objects.fail_after_puts = 1;
    ASSERT_FALSE(run().has_value());
    objects.fail_after_puts.reset();

    options.chunk_size = 64;
    ASSERT_TRUE(run().has_value());
    EXPECT_EQ(objects.objects.at("laptop/backup0/1").data.size(), 10u);
    EXPECT_EQ(objects.objects.at("laptop/backup0/2").data.size(), 5u);
}

TEST_F(BackupEngineTest, InterruptStopsBeforeNextChunk)
{
    source.streams["backup0"] = pattern_bytes(25);
    coldsend::infra::set_interrupted(true);

    auto result = run();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Interrupted);
    EXPECT_EQ(result.error().to_exit_code(), 130);
    EXPECT_TRUE(objects.objects.empty());

    // The pair was persisted before streaming, so the next run resumes it
    const auto after = state();
    ASSERT_TRUE(after.in_flight);
    EXPECT_EQ(after.in_flight->highest_durable_chunk, -1);

    coldsend::infra::set_interrupted(false);
    auto resumed = run();
    ASSERT_TRUE(resumed.has_value());
    EXPECT_EQ(resumed->action, RunAction::Resume);
    EXPECT_EQ(objects.objects.size(), 3u);
}

TEST_F(BackupEngineTest, ExistingSnapshotIsReused)
{
    source.snapshots.insert("backup0");
    source.streams["backup0"] = "abc";

    auto result = run();
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->snapshot_reused);
}

TEST_F(BackupEngineTest, SnapshotFailurePersistsNothing)
{
    source.fail_snapshots = true;

    auto result = run();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::SnapshotFailed);
    EXPECT_FALSE(state().in_flight);
}

TEST_F(BackupEngineTest, SpoolsThroughTempDir)
{
    const auto data = pattern_bytes(25);
    source.streams["backup0"] = data;
    options.temp_dir = dir / "spool";

    ASSERT_TRUE(run().has_value());
    EXPECT_EQ(objects.objects.at("laptop/backup0/2").data, data.substr(20, 5));
    EXPECT_TRUE(std::filesystem::is_empty(dir / "spool"));
}

TEST_F(BackupEngineTest, DatasetsSharingTempDirKeepTheirOwnSpool)
{
    const auto ours = pattern_bytes(25, 'A');
    const auto theirs = pattern_bytes(25, 'a');
    source.streams["backup0"] = ours;
    options.temp_dir = dir / "spool";

    // A second dataset with its own state file, same snapshot names
    StateStore other_store(dir / "media.yaml");
    BackupChainState other_initial;
    other_initial.config = ChainConfig{
        .dataset = "tank/media",
        .bucket = "archive",
        .snapshot_pattern = "backup{seq}",
        .object_prefix = "media/",
    };
    ASSERT_TRUE(other_store.create(other_initial).has_value());
    MemorySnapshotSource other_source;
    other_source.streams["backup0"] = theirs;
    MemoryObjectStore other_objects;

    coldsend::infra::Result<RunSummary> other_result = std::unexpected(
        coldsend::infra::make_error(ErrorCode::Unknown, "second run never started"));
    InterleavingObjectStore interleaved(objects, [&] {
        BackupEngine other(options, other_store, other_source, other_objects);
        other_result = other.run();
    });

    BackupEngine engine(options, store, source, interleaved);
    auto result = engine.run();

    ASSERT_TRUE(result.has_value()) << result.error().message;
    ASSERT_TRUE(other_result.has_value()) << other_result.error().message;
    EXPECT_EQ(stored(), (std::map<std::string, std::string>{
        {"laptop/backup0/0", ours.substr(0, 10)},
        {"laptop/backup0/1", ours.substr(10, 10)},
        {"laptop/backup0/2", ours.substr(20, 5)},
    }));
    EXPECT_EQ(other_objects.objects.at("media/backup0/0").data, theirs.substr(0, 10));
    EXPECT_EQ(other_objects.objects.at("media/backup0/2").data, theirs.substr(20, 5));
    EXPECT_TRUE(std::filesystem::is_empty(dir / "spool"));
}

TEST_F(BackupEngineTest, LargeChunksWithoutTempDirAreRejectedBeforeSnapshot)
{
    source.streams["backup0"] = "abc";
    options.chunk_size = coldsend::infra::kMaxInMemoryChunkSize + 1;

    auto result = run();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
    EXPECT_TRUE(source.snapshots.empty());
    EXPECT_FALSE(state().in_flight);

    options.temp_dir = dir / "spool";
    auto spooled = run();
    ASSERT_TRUE(spooled.has_value()) << spooled.error().message;
    EXPECT_EQ(objects.objects.at("laptop/backup0/0").data, "abc");
}

TEST_F(BackupEngineTest, MissingStateFileAsksForInit)
{
    StateStore missing(dir / "nope.yaml");
    BackupEngine engine(options, missing, source, objects);

    auto result = engine.run();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::StateNotFound);
}

TEST_F(BackupEngineTest, UnknownStorageClassIsRejectedUpFront)
{
    source.streams["backup0"] = "abc";
    options.storage_class = "FREEZER";

    auto result = run();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
    EXPECT_TRUE(source.snapshots.empty());
}
