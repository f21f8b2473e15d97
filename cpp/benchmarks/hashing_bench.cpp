#include <array>
#include <cstddef>
#include <vector>

#include <benchmark/benchmark.h>

#include "shardsim/erasure/codec.hpp"
#include "shardsim/storage/hashing.hpp"

static void BM_HashCompute(benchmark::State& state){
    const size_t n = static_cast<size_t>(state.range(0));

    std::vector<shardsim::storage::u8> buf(n);
    for (size_t i = 0; i < buf.size(); ++i){
        buf[i] = static_cast<shardsim::storage::u8>(i & 0xffu);
    }

    for (auto _ : state){
        shardsim::core::Hash256 out{};
        shardsim::core::Status s = shardsim::storage::hash_compute(shardsim::storage::view_of(buf), &out);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(out);

    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}

BENCHMARK(BM_HashCompute)->Arg(0)->Arg(64)->Arg(4096)->Arg(131492)->Arg(1 << 20);

// range(0) = 0 for sequential, 1 for one task per shard.
static void BM_HashShards(benchmark::State& state){
    shardsim::erasure::ErasureCodec codec;
    if (!shardsim::core::is_ok(codec.init({4, 2}))){
        state.SkipWithError("codec init failed");
        return;
    }

    std::vector<shardsim::storage::u8> object(525968);
    for (size_t i = 0; i < object.size(); ++i){
        object[i] = static_cast<shardsim::storage::u8>(i * 31);
    }
    shardsim::erasure::ShardSet set;
    if (!shardsim::core::is_ok(codec.encode_object(shardsim::storage::view_of(object), &set))){
        state.SkipWithError("encode failed");
        return;
    }

    const bool parallel = state.range(0) != 0;
    std::vector<shardsim::storage::ShardDigest> digests;
    for (auto _ : state){
        shardsim::core::Status s = shardsim::storage::hash_shards(set, parallel, &digests);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(digests.data());
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(set.shard_bytes * set.total()));
}

BENCHMARK(BM_HashShards)->Arg(0)->Arg(1)->UseRealTime();
