#include <gtest/gtest.h>

#include <chrono>
#include "core/state/backup_state.hpp"

using namespace coldsend::core;
using coldsend::infra::ErrorCode;

namespace {

BackupChainState two_pair_chain() {
    BackupChainState state;
    state.config = ChainConfig{.dataset = "tank/home", .bucket = "b"};
    state.chain.push_back({.pair = {std::nullopt, "backup0"}, .chunk_count = 2, .total_bytes = 15});
    state.chain.push_back({.pair = {"backup0", "backup1"}, .chunk_count = 1, .total_bytes = 3});
    return state;
}

} // namespace

TEST(SnapshotPairTest, NamesFullAndIncrementalPairs)
{
    EXPECT_EQ((SnapshotPair{std::nullopt, "backup0"}).name(), "backup0");
    EXPECT_EQ((SnapshotPair{"backup0", "backup1"}).name(), "backup0_backup1");
    EXPECT_TRUE((SnapshotPair{std::nullopt, "backup0"}).is_full());
}

TEST(ObjectKeyTest, FollowsPrefixPairIndexLayout)
{
    const SnapshotPair inc{"backup0", "backup1"};
    EXPECT_EQ(object_key("laptop/", inc, 7), "laptop/backup0_backup1/7");
    EXPECT_EQ(object_key("", SnapshotPair{std::nullopt, "backup0"}, 0), "backup0/0");
    EXPECT_EQ(pair_key_prefix("laptop/", inc), "laptop/backup0_backup1/");
}

TEST(ObjectKeyTest, ParsesOnlyCanonicalChunkKeys)
{
    const std::string prefix = "p/backup0/";
    EXPECT_EQ(parse_chunk_index(prefix, "p/backup0/0"), 0u);
    EXPECT_EQ(parse_chunk_index(prefix, "p/backup0/12"), 12u);
    EXPECT_FALSE(parse_chunk_index(prefix, "p/backup0/012"));
    EXPECT_FALSE(parse_chunk_index(prefix, "p/backup0/"));
    EXPECT_FALSE(parse_chunk_index(prefix, "p/backup0/1x"));
    EXPECT_FALSE(parse_chunk_index(prefix, "p/backup0_backup1/1"));
}

TEST(ValidateTest, AcceptsLinearChain)
{
    EXPECT_TRUE(validate(two_pair_chain()).has_value());
}

TEST(ValidateTest, RejectsBrokenLinearity)
{
    auto state = two_pair_chain();
    state.chain[1].pair.base = "backup9";
    auto valid = validate(state);
    ASSERT_FALSE(valid.has_value());
    EXPECT_EQ(valid.error().code, ErrorCode::StateCorrupted);
}

TEST(ValidateTest, RejectsInFlightNotContinuingHead)
{
    auto state = two_pair_chain();
    state.in_flight = InFlightRun{.pair = {"backup0", "backup2"}, .chunk_size = 10};
    auto valid = validate(state);
    ASSERT_FALSE(valid.has_value());
    EXPECT_EQ(valid.error().code, ErrorCode::StateCorrupted);
}

TEST(ValidateTest, RejectsInconsistentProgress)
{
    auto state = two_pair_chain();
    state.in_flight = InFlightRun{.pair = {"backup1", "backup2"}, .chunk_size = 10,
                                  .highest_durable_chunk = 1, .bytes_streamed = 10,
                                  .chunk_digests = {1, 2}};
    EXPECT_FALSE(validate(state).has_value());

    state.in_flight->bytes_streamed = 15;
    EXPECT_TRUE(validate(state).has_value());

    state.in_flight->chunk_digests.pop_back();
    EXPECT_FALSE(validate(state).has_value());
}

TEST(AdvanceTest, OnlyAcceptsTheNextIndex)
{
    InFlightRun run{.pair = {std::nullopt, "backup0"}, .chunk_size = 10};

    auto first = advance(run, 0, 10, 0xaa);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->highest_durable_chunk, 0);
    EXPECT_EQ(first->bytes_streamed, 10u);
    EXPECT_EQ(first->chunk_digests, std::vector<std::uint64_t>{0xaa});

    EXPECT_FALSE(advance(*first, 2, 10, 0).has_value());
    EXPECT_FALSE(advance(*first, 0, 10, 0).has_value());
    EXPECT_FALSE(advance(*first, 1, 11, 0).has_value());
}

TEST(FoldTest, MovesInFlightOntoChain)
{
    auto state = two_pair_chain();
    state.in_flight = InFlightRun{.pair = {"backup1", "backup2"}, .chunk_size = 10,
                                  .highest_durable_chunk = 0, .bytes_streamed = 4,
                                  .chunk_digests = {7}};
    auto folded = fold_in_flight(state);
    ASSERT_TRUE(folded.has_value());
    EXPECT_FALSE(folded->in_flight);
    ASSERT_EQ(folded->chain.size(), 3u);
    EXPECT_EQ(folded->chain.back().chunk_count, 1u);
    EXPECT_EQ(folded->chain.back().total_bytes, 4u);
    EXPECT_EQ(folded->head(), "backup2");
}

TEST(SnapshotNameTest, ExpandsSequenceAndTimestamp)
{
    const auto when = std::chrono::sys_days{std::chrono::year{2024} / 3 / 5} + std::chrono::hours{7} +
                      std::chrono::minutes{8} + std::chrono::seconds{9};

    EXPECT_EQ(make_snapshot_name("backup{seq}", 4, when).value(), "backup4");
    EXPECT_EQ(make_snapshot_name("cs-{timestamp}", 0, when).value(), "cs-20240305T070809Z");
    EXPECT_EQ(make_snapshot_name("n{seq}-{timestamp}", 2, when).value(), "n2-20240305T070809Z");
}

TEST(SnapshotNameTest, RejectsUnusablePatterns)
{
    EXPECT_FALSE(validate_snapshot_pattern("backup").has_value());
    EXPECT_FALSE(validate_snapshot_pattern("backup{seq").has_value());
    EXPECT_FALSE(validate_snapshot_pattern("back up{seq}").has_value());
    EXPECT_FALSE(validate_snapshot_pattern("{unknown}{seq}").has_value());
    EXPECT_TRUE(validate_snapshot_pattern("backup{seq}").has_value());
}

TEST(StorageClassTest, KnowsColdTiers)
{
    EXPECT_TRUE(is_known_storage_class("DEEP_ARCHIVE"));
    EXPECT_TRUE(is_known_storage_class("GLACIER_IR"));
    EXPECT_FALSE(is_known_storage_class("deep_archive"));
    EXPECT_FALSE(is_known_storage_class("COLD"));
}
