#pragma once

#include <string>
#include <vector>

#include "shardsim/core/errors.hpp"
#include "shardsim/core/types.hpp"
#include "shardsim/storage/buffer.hpp"

namespace shardsim::storage {

    struct FileInfo {
        u64 size_bytes{0};
        shardsim::core::Timestamp mod_time{0};
    };

    struct WriteStats {
        u64 files{0};
        u64 bytes{0};

        WriteStats& operator+=(const WriteStats& o) noexcept {
            files += o.files;
            bytes += o.bytes;
            return *this;
        }
    };

    // Reads the whole input object. Failures carry StatusDomain::Input and errno in aux.
    [[nodiscard]] shardsim::core::Status read_object_file(const std::string& path,
                                                          std::vector<u8>* out,
                                                          FileInfo* info) noexcept;

    // mkdir -p; an existing directory is not an error.
    [[nodiscard]] shardsim::core::Status create_directories(const std::string& dir) noexcept;

    // Creates or truncates path and writes data fully. Optionally fsyncs.
    [[nodiscard]] shardsim::core::Status write_file(const std::string& path,
                                                    BufferView data,
                                                    bool sync,
                                                    WriteStats* stats) noexcept;

    [[nodiscard]] shardsim::core::Status read_file(const std::string& path, std::vector<u8>* out) noexcept;

    // Re-reads a written shard and compares its BLAKE3 digest with expected.
    [[nodiscard]] shardsim::core::Status verify_shard_file(const std::string& path,
                                                           const shardsim::core::Hash256& expected,
                                                           u64 expected_bytes,
                                                           bool* valid) noexcept;

} // namespace shardsim::storage
