#include <vector>

#include <gtest/gtest.h>

#include "shardsim/erasure/codec.hpp"

using namespace shardsim::erasure;
using shardsim::core::StatusCode;
using shardsim::core::StatusDomain;
using shardsim::storage::view_of;

namespace {

std::vector<u8> make_object(size_t n, u32 seed = 7) {
    std::vector<u8> data(n);
    u32 x = seed;
    for (size_t i = 0; i < n; ++i) {
        x = x * 1103515245u + 12345u;
        data[i] = static_cast<u8>(x >> 16);
    }
    return data;
}

// Reassembles the first object_bytes bytes from the data shards.
std::vector<u8> join_data(const ShardSet& set) {
    std::vector<u8> out;
    for (u32 i = 0; i < set.data_count; ++i) {
        out.insert(out.end(), set.shards[i].begin(), set.shards[i].end());
    }
    out.resize(set.object_bytes);
    return out;
}

} // namespace

TEST(ErasureParams, AcceptsBounds) {
    EXPECT_TRUE(shardsim::core::is_ok(codec_validate_params({1, 0})));
    EXPECT_TRUE(shardsim::core::is_ok(codec_validate_params({4, 2})));
    EXPECT_TRUE(shardsim::core::is_ok(codec_validate_params({256, 0})));
}

TEST(ErasureParams, RejectsOutOfRange) {
    for (const CodecParams p : {CodecParams{0, 2}, CodecParams{-1, 2}, CodecParams{257, 2},
                                CodecParams{300, 2}, CodecParams{4, -1}}) {
        const shardsim::core::Status s = codec_validate_params(p);
        EXPECT_EQ(s.code, StatusCode::Invalid) << p.data << "+" << p.parity;
        EXPECT_EQ(s.domain, StatusDomain::Erasure);
    }
}

TEST(ErasureCodec, InitRejectsInvalidParameters) {
    ErasureCodec codec;
    const shardsim::core::Status s = codec.init({300, 2});
    EXPECT_EQ(s.code, StatusCode::Invalid);
    EXPECT_FALSE(codec.ready());
}

TEST(ErasureCodec, InitFailsWhenNoCodeExists) {
    ErasureCodec codec;
    const shardsim::core::Status s = codec.init({200, 100});
    EXPECT_EQ(s.code, StatusCode::Encode);
    EXPECT_EQ(s.domain, StatusDomain::Erasure);
    EXPECT_FALSE(codec.ready());
}

TEST(ErasureCodec, SplitRequiresInit) {
    ErasureCodec codec;
    const std::vector<u8> data = make_object(10);
    ShardSet set;
    EXPECT_EQ(codec.split(view_of(data), &set).code, StatusCode::Invalid);
}

TEST(ErasureCodec, EmptyObjectIsEncodeFailure) {
    ErasureCodec codec;
    ASSERT_TRUE(shardsim::core::is_ok(codec.init({4, 2})));
    ShardSet set;
    EXPECT_EQ(codec.encode_object({nullptr, 0}, &set).code, StatusCode::Encode);
}

TEST(ErasureCodec, ReferenceObjectFourPlusTwo) {
    const std::vector<u8> object = make_object(525968);

    ErasureCodec codec;
    ASSERT_TRUE(shardsim::core::is_ok(codec.init({4, 2})));
    EXPECT_EQ(codec.total_shards(), 6u);

    ShardSet first;
    ASSERT_TRUE(shardsim::core::is_ok(codec.encode_object(view_of(object), &first)));
    ASSERT_EQ(first.shards.size(), 6u);
    EXPECT_EQ(first.shard_bytes, 131492u);
    for (const auto& shard : first.shards) {
        EXPECT_EQ(shard.size(), first.shard_bytes);
    }
    EXPECT_EQ(join_data(first), object);

    ShardSet second;
    ASSERT_TRUE(shardsim::core::is_ok(codec.encode_object(view_of(object), &second)));
    for (u32 i = 0; i < 6; ++i) {
        EXPECT_EQ(first.shards[i], second.shards[i]) << "shard " << i;
    }
}

TEST(ErasureCodec, ShardSizeInvariantHolds) {
    for (const CodecParams p : {CodecParams{1, 0}, CodecParams{3, 1}, CodecParams{4, 2},
                                CodecParams{10, 4}, CodecParams{16, 16}, CodecParams{256, 0}}) {
        ErasureCodec codec;
        ASSERT_TRUE(shardsim::core::is_ok(codec.init(p)));
        for (size_t n : {size_t{1}, size_t{2}, size_t{17}, size_t{255}, size_t{1000}, size_t{4099}}) {
            const std::vector<u8> object = make_object(n, static_cast<u32>(n));
            ShardSet set;
            ASSERT_TRUE(shardsim::core::is_ok(codec.encode_object(view_of(object), &set)));
            ASSERT_EQ(set.shards.size(), static_cast<size_t>(p.data + p.parity));
            EXPECT_GT(set.shard_bytes, 0u);
            EXPECT_GE(set.shard_bytes * static_cast<u64>(p.data), n);
            EXPECT_LT(set.shard_bytes * static_cast<u64>(p.data) - n, static_cast<u64>(p.data));
            for (const auto& shard : set.shards) {
                EXPECT_EQ(shard.size(), set.shard_bytes);
            }
            EXPECT_EQ(join_data(set), object);
        }
    }
}

TEST(ErasureCodec, PaddingIsZero) {
    ErasureCodec codec;
    ASSERT_TRUE(shardsim::core::is_ok(codec.init({4, 1})));
    const std::vector<u8> object = make_object(13);
    ShardSet set;
    ASSERT_TRUE(shardsim::core::is_ok(codec.split(view_of(object), &set)));
    EXPECT_EQ(set.shard_bytes, 4u);
    // 13 bytes fill shards 0..2 and one byte of shard 3.
    EXPECT_EQ(set.shards[3][0], object[12]);
    EXPECT_EQ(set.shards[3][1], 0);
    EXPECT_EQ(set.shards[3][2], 0);
    EXPECT_EQ(set.shards[3][3], 0);
}

// The first row of the Vandermonde-derived coding matrix is all ones, so the
// first parity shard is the XOR of the data shards.
TEST(ErasureCodec, FirstParityIsXorOfData) {
    ErasureCodec codec;
    ASSERT_TRUE(shardsim::core::is_ok(codec.init({5, 3})));
    const std::vector<u8> object = make_object(1001);
    ShardSet set;
    ASSERT_TRUE(shardsim::core::is_ok(codec.encode_object(view_of(object), &set)));

    std::vector<u8> x(set.shard_bytes, 0);
    for (u32 i = 0; i < set.data_count; ++i) {
        for (size_t j = 0; j < x.size(); ++j) {
            x[j] ^= set.shards[i][j];
        }
    }
    EXPECT_EQ(set.shards[5], x);
}

TEST(ErasureCodec, ParityDependsOnData) {
    ErasureCodec codec;
    ASSERT_TRUE(shardsim::core::is_ok(codec.init({4, 2})));
    std::vector<u8> object = make_object(4096);
    ShardSet a;
    ASSERT_TRUE(shardsim::core::is_ok(codec.encode_object(view_of(object), &a)));

    object[100] ^= 0x5a;
    ShardSet b;
    ASSERT_TRUE(shardsim::core::is_ok(codec.encode_object(view_of(object), &b)));
    EXPECT_NE(a.shards[4], b.shards[4]);
    EXPECT_NE(a.shards[5], b.shards[5]);
    EXPECT_EQ(a.shards[1], b.shards[1]);
}

TEST(ErasureCodec, EncodeRejectsMismatchedShardSet) {
    ErasureCodec codec;
    ASSERT_TRUE(shardsim::core::is_ok(codec.init({4, 2})));
    const std::vector<u8> object = make_object(64);
    ShardSet set;
    ASSERT_TRUE(shardsim::core::is_ok(codec.split(view_of(object), &set)));
    set.shards[2].push_back(0);
    EXPECT_EQ(codec.encode(&set).code, StatusCode::Invalid);
}

TEST(ErasureCodec, ZeroParityLeavesOnlyDataShards) {
    ErasureCodec codec;
    ASSERT_TRUE(shardsim::core::is_ok(codec.init({3, 0})));
    const std::vector<u8> object = make_object(10);
    ShardSet set;
    ASSERT_TRUE(shardsim::core::is_ok(codec.encode_object(view_of(object), &set)));
    EXPECT_EQ(set.shards.size(), 3u);
    EXPECT_EQ(set.shard_bytes, 4u);
}
