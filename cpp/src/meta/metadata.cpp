#include "shardsim/meta/metadata.hpp"

#include <cstdio>
#include <ctime>

#include <nlohmann/json.hpp>
#include <openssl/evp.h>

namespace shardsim::meta {

using json = nlohmann::json;
using namespace shardsim::core;

namespace {
    // Shard counts and indices never exceed the GF(2^8) field size.
    constexpr u64 kMaxShardField = 256;

    [[nodiscard]] Status meta_invalid(u32 aux = 0) noexcept {
        return make_status(StatusDomain::Meta, StatusCode::Invalid, aux);
    }

    [[nodiscard]] Status meta_corrupt(u32 aux = 0) noexcept {
        return make_status(StatusDomain::Meta, StatusCode::Corrupt, aux);
    }

    json checksum_to_json(const ChecksumEntry& c) {
        return json{
            {"name", c.name},
            {"index", c.index},
            {"algorithm", c.algorithm},
            {"hash", c.hash}
        };
    }

    json part_to_json(const PartEntry& p) {
        return json{
            {"number", p.number},
            {"name", p.name},
            {"etag", p.etag},
            {"size", p.size}
        };
    }
} // namespace

Status compose_metadata(const ComposeParams& params,
                        const std::vector<shardsim::storage::ShardDigest>& digests,
                        ObjectMetadata* out) noexcept {
    if (out == nullptr || params.algorithm == nullptr) {
        return meta_invalid();
    }
    if (params.data == 0) {
        return meta_invalid();
    }

    const u32 total = params.data + params.parity;
    if (digests.size() != total) {
        return meta_invalid(static_cast<u32>(digests.size()));
    }
    if (params.shard_size * params.data < params.object_bytes) {
        return meta_invalid();
    }

    ObjectMetadata record;
    record.version = kMetadataVersion;
    record.format = kMetadataFormat;
    record.size = params.object_bytes;
    record.mod_time = params.mod_time;
    record.md5_sum = params.md5_sum;

    record.erasure.algorithm = params.algorithm;
    record.erasure.data = params.data;
    record.erasure.parity = params.parity;
    record.erasure.block_size = params.block_size;
    record.erasure.shard_size = params.shard_size;
    record.erasure.distribution.reserve(total);
    record.erasure.checksums.reserve(total);

    for (u32 i = 0; i < total; ++i) {
        const shardsim::storage::ShardDigest& d = digests[i];
        if (d.index != i || d.hex.size() != d.hash.b.size() * 2) {
            return meta_invalid(i);
        }
        record.erasure.distribution.push_back(i);
        record.erasure.checksums.push_back(
            ChecksumEntry{kPartName, i, shardsim::storage::kHashAlgorithmName, d.hex});
    }

    record.parts.push_back(PartEntry{1, kPartName, "", params.object_bytes});

    *out = std::move(record);
    return ok_status();
}

Status metadata_to_json(const ObjectMetadata& record, ShardIndex shard_index, std::string* out) noexcept {
    if (out == nullptr) {
        return meta_invalid();
    }
    if (shard_index >= record.erasure.data + record.erasure.parity) {
        return meta_invalid(shard_index);
    }

    try {
        json checksums = json::array();
        for (const ChecksumEntry& c : record.erasure.checksums) {
            checksums.push_back(checksum_to_json(c));
        }
        json parts = json::array();
        for (const PartEntry& p : record.parts) {
            parts.push_back(part_to_json(p));
        }

        json j = {
            {"version", record.version},
            {"format", record.format},
            {"stat", {
                {"size", record.size},
                {"modTime", format_mod_time(record.mod_time)}
            }},
            {"erasure", {
                {"algorithm", record.erasure.algorithm},
                {"data", record.erasure.data},
                {"parity", record.erasure.parity},
                {"blockSize", record.erasure.block_size},
                {"shardSize", record.erasure.shard_size},
                {"index", shard_index},
                {"distribution", record.erasure.distribution},
                {"checksum", std::move(checksums)}
            }},
            {"meta", {
                {"md5Sum", record.md5_sum}
            }},
            {"parts", std::move(parts)}
        };

        *out = j.dump();
    } catch (const json::exception& e) {
        return meta_invalid(static_cast<u32>(e.id));
    }
    return ok_status();
}

Status metadata_from_json(std::string_view doc, ObjectMetadata* out, ShardIndex* shard_index) noexcept {
    if (out == nullptr) {
        return meta_invalid();
    }

    ObjectMetadata record;
    ShardIndex index = 0;
    try {
        const json j = json::parse(doc.begin(), doc.end());

        record.version = j.at("version").get<std::string>();
        record.format = j.at("format").get<std::string>();

        const json& stat = j.at("stat");
        record.size = stat.at("size").get<u64>();
        if (!parse_mod_time(stat.at("modTime").get<std::string>(), &record.mod_time)) {
            return meta_corrupt();
        }

        const json& erasure = j.at("erasure");
        record.erasure.algorithm = erasure.at("algorithm").get<std::string>();
        const json& data = erasure.at("data");
        const json& parity = erasure.at("parity");
        const json& shard = erasure.at("index");
        // Negative or out of range counts would wrap when narrowed to u32.
        for (const json* field : {&data, &parity, &shard}) {
            if (!field->is_number_unsigned() || field->get<u64>() > kMaxShardField) {
                return meta_corrupt();
            }
        }
        record.erasure.data = data.get<u32>();
        record.erasure.parity = parity.get<u32>();
        record.erasure.block_size = erasure.at("blockSize").get<u64>();
        record.erasure.shard_size = erasure.value("shardSize", u64{0});
        index = shard.get<ShardIndex>();
        record.erasure.distribution = erasure.at("distribution").get<std::vector<u32>>();

        for (const json& c : erasure.at("checksum")) {
            ChecksumEntry entry;
            entry.name = c.at("name").get<std::string>();
            entry.index = c.value("index", static_cast<ShardIndex>(record.erasure.checksums.size()));
            entry.algorithm = c.at("algorithm").get<std::string>();
            entry.hash = c.at("hash").get<std::string>();
            record.erasure.checksums.push_back(std::move(entry));
        }

        if (j.contains("meta")) {
            record.md5_sum = j.at("meta").value("md5Sum", std::string());
        }

        for (const json& p : j.at("parts")) {
            PartEntry part;
            part.number = p.at("number").get<u32>();
            part.name = p.at("name").get<std::string>();
            part.etag = p.value("etag", std::string());
            part.size = p.at("size").get<u64>();
            record.parts.push_back(std::move(part));
        }
    } catch (const json::exception& e) {
        return meta_corrupt(static_cast<u32>(e.id));
    }

    const u32 total = record.erasure.data + record.erasure.parity;
    if (record.erasure.data == 0 || index >= total) {
        return meta_corrupt();
    }
    if (record.erasure.distribution.size() != total || record.erasure.checksums.size() != total) {
        return meta_corrupt();
    }

    *out = std::move(record);
    if (shard_index != nullptr) {
        *shard_index = index;
    }
    return ok_status();
}

std::string format_mod_time(Timestamp unix_nanos) {
    Timestamp secs = unix_nanos / 1000000000LL;
    Timestamp frac = unix_nanos % 1000000000LL;
    if (frac < 0) {
        frac += 1000000000LL;
        secs -= 1;
    }

    const std::time_t t = static_cast<std::time_t>(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%09lldZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec,
                  static_cast<long long>(frac));
    return std::string(buf);
}

bool parse_mod_time(std::string_view text, Timestamp* out) noexcept {
    if (out == nullptr || text.size() < 20 || text.size() > 40) {
        return false;
    }
    char buf[48];
    text.copy(buf, text.size());
    buf[text.size()] = '\0';

    std::tm tm{};
    int consumed = 0;
    if (std::sscanf(buf, "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                    &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed) != 6) {
        return false;
    }
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;

    const char* p = buf + consumed;
    Timestamp frac = 0;
    if (*p == '.') {
        ++p;
        int digits = 0;
        while (*p >= '0' && *p <= '9') {
            if (digits < 9) {
                frac = frac * 10 + (*p - '0');
                ++digits;
            }
            ++p;
        }
        if (digits == 0) {
            return false;
        }
        for (; digits < 9; ++digits) {
            frac *= 10;
        }
    }
    if (p[0] != 'Z' || p[1] != '\0') {
        return false;
    }

    const std::time_t secs = timegm(&tm);
    *out = static_cast<Timestamp>(secs) * 1000000000LL + frac;
    return true;
}

Status md5_hex(shardsim::storage::BufferView data, std::string* out) noexcept {
    if (out == nullptr || !shardsim::storage::buffer_ok(data)) {
        return meta_invalid();
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (ctx == nullptr) {
        return make_status(StatusDomain::External, StatusCode::Unavailable);
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    bool ok = EVP_DigestInit_ex(ctx, EVP_md5(), nullptr) == 1;
    if (ok && data.len > 0) {
        ok = EVP_DigestUpdate(ctx, data.data, static_cast<size_t>(data.len)) == 1;
    }
    if (ok) {
        ok = EVP_DigestFinal_ex(ctx, digest, &digest_len) == 1;
    }
    EVP_MD_CTX_free(ctx);
    if (!ok) {
        return make_status(StatusDomain::External, StatusCode::Unknown);
    }

    static const char hex[] = "0123456789abcdef";
    out->resize(static_cast<size_t>(digest_len) * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        (*out)[i * 2] = hex[(digest[i] >> 4) & 0xF];
        (*out)[i * 2 + 1] = hex[digest[i] & 0xF];
    }
    return ok_status();
}

} // namespace shardsim::meta
