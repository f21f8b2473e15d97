#include "shardsim/erasure/codec.hpp"

#include <climits>
#include <cstdlib>
#include <cstring>
#include <mutex>

extern "C" {
#include <jerasure.h>
#include <reed_sol.h>
#include <galois.h>
}

namespace shardsim::erasure {

using shardsim::core::Status;
using shardsim::core::StatusCode;
using shardsim::core::StatusDomain;
using shardsim::core::make_status;
using shardsim::core::ok_status;

namespace {
    // Region multiply works on whole machine words; shards are padded to this
    // while parity is computed.
    constexpr u64 kRegionAlign = 16;

    std::mutex g_matrix_mutex;
    std::once_flag g_field_once;
    int g_field_rc = 0;

    [[nodiscard]] constexpr u64 align_up(u64 v, u64 a) noexcept {
        return (v + a - 1) / a * a;
    }

    [[nodiscard]] Status invalid() noexcept {
        return make_status(StatusDomain::Erasure, StatusCode::Invalid);
    }

    [[nodiscard]] Status encode_failure(u32 aux = 0) noexcept {
        return make_status(StatusDomain::Erasure, StatusCode::Encode, aux);
    }
} // namespace

Status codec_validate_params(const CodecParams& params) noexcept {
    if (params.data <= 0 || params.data > kMaxDataShards) {
        return make_status(StatusDomain::Erasure, StatusCode::Invalid, static_cast<u32>(params.data));
    }
    if (params.parity < 0) {
        return make_status(StatusDomain::Erasure, StatusCode::Invalid, static_cast<u32>(params.parity));
    }
    return ok_status();
}

ErasureCodec::~ErasureCodec() noexcept {
    reset();
}

void ErasureCodec::reset() noexcept {
    if (matrix_ != nullptr) {
        std::free(matrix_);
        matrix_ = nullptr;
    }
    ready_ = false;
}

Status ErasureCodec::init(const CodecParams& params) noexcept {
    reset();

    Status s = codec_validate_params(params);
    if (!shardsim::core::is_ok(s)) {
        return s;
    }
    if (params.data + params.parity > kMaxTotalShards) {
        return encode_failure(static_cast<u32>(params.data + params.parity));
    }

    if (params.parity > 0) {
        std::call_once(g_field_once, []() { g_field_rc = galois_init_default_field(kGaloisWordBits); });
        if (g_field_rc != 0) {
            return make_status(StatusDomain::Erasure, StatusCode::Unavailable, static_cast<u32>(g_field_rc));
        }

        std::lock_guard<std::mutex> lock(g_matrix_mutex);
        matrix_ = reed_sol_vandermonde_coding_matrix(params.data, params.parity, kGaloisWordBits);
        if (matrix_ == nullptr) {
            return encode_failure();
        }
    }

    params_ = params;
    ready_ = true;
    return ok_status();
}

Status ErasureCodec::split(shardsim::storage::BufferView object, ShardSet* out) const noexcept {
    if (out == nullptr || !ready_) {
        return invalid();
    }
    if (!shardsim::storage::buffer_ok(object)) {
        return invalid();
    }
    if (object.len == 0) {
        // Nothing to shard.
        return encode_failure();
    }

    const u32 k = data_shards();
    const u64 shard_bytes = shard_bytes_for(object.len, k);
    const u64 padded = align_up(shard_bytes, kRegionAlign);
    if (padded > static_cast<u64>(INT_MAX)) {
        return encode_failure();
    }

    out->data_count = k;
    out->parity_count = parity_shards();
    out->shard_bytes = shard_bytes;
    out->object_bytes = object.len;
    out->shards.clear();
    out->shards.resize(total_shards());

    u64 offset = 0;
    for (u32 i = 0; i < total_shards(); ++i) {
        std::vector<u8>& shard = out->shards[i];
        shard.reserve(padded);
        shard.assign(shard_bytes, 0);
        if (i < k && offset < object.len) {
            const u64 n = (object.len - offset < shard_bytes) ? object.len - offset : shard_bytes;
            std::memcpy(shard.data(), object.data + offset, n);
            offset += n;
        }
    }
    return ok_status();
}

Status ErasureCodec::encode(ShardSet* shards) const noexcept {
    if (shards == nullptr || !ready_) {
        return invalid();
    }
    if (shards->data_count != data_shards() || shards->parity_count != parity_shards()) {
        return invalid();
    }
    if (shards->shards.size() != total_shards()) {
        return invalid();
    }
    for (const std::vector<u8>& shard : shards->shards) {
        if (shard.size() != shards->shard_bytes) {
            return invalid();
        }
    }
    if (parity_shards() == 0) {
        return ok_status();
    }

    const u64 shard_bytes = shards->shard_bytes;
    const u64 padded = align_up(shard_bytes, kRegionAlign);
    if (shard_bytes == 0 || padded > static_cast<u64>(INT_MAX)) {
        return encode_failure();
    }

    // The zero tail is inert under GF(2^8) arithmetic, so truncating the
    // padded parity yields the parity of the unpadded shards.
    std::vector<char*> data_ptrs(data_shards());
    std::vector<char*> coding_ptrs(parity_shards());
    for (u32 i = 0; i < total_shards(); ++i) {
        std::vector<u8>& shard = shards->shards[i];
        shard.resize(padded, 0);
        char* p = reinterpret_cast<char*>(shard.data());
        if (i < data_shards()) {
            data_ptrs[i] = p;
        } else {
            coding_ptrs[i - data_shards()] = p;
        }
    }

    jerasure_matrix_encode(params_.data,
                           params_.parity,
                           kGaloisWordBits,
                           matrix_,
                           data_ptrs.data(),
                           coding_ptrs.data(),
                           static_cast<int>(padded));

    for (std::vector<u8>& shard : shards->shards) {
        shard.resize(shard_bytes);
    }
    return ok_status();
}

Status ErasureCodec::encode_object(shardsim::storage::BufferView object, ShardSet* out) const noexcept {
    Status s = split(object, out);
    if (!shardsim::core::is_ok(s)) {
        return s;
    }
    return encode(out);
}

} // namespace shardsim::erasure
