#include "shardsim/storage/shard_io.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include "shardsim/storage/hashing.hpp"

namespace shardsim::storage {

using namespace shardsim::core;

namespace {
    [[nodiscard]] Status io_error(StatusDomain domain, int err) noexcept {
        if (err == ENOENT || err == ENOTDIR) {
            return make_status(domain, StatusCode::NotFound, static_cast<u32>(err));
        }
        if (err == EACCES || err == EPERM) {
            return make_status(domain, StatusCode::PermissionDenied, static_cast<u32>(err));
        }
        return make_status(domain, StatusCode::Io, static_cast<u32>(err));
    }

    // Reads fd to EOF into out, sized from fstat.
    Status read_fd(int fd, StatusDomain domain, std::vector<u8>* out, FileInfo* info) noexcept {
        struct stat st{};
        if (fstat(fd, &st) != 0) {
            return io_error(domain, errno);
        }
        if (!S_ISREG(st.st_mode)) {
            return make_status(domain, StatusCode::Invalid);
        }

        out->resize(static_cast<size_t>(st.st_size));
        u64 bytes_read = 0;
        while (bytes_read < out->size()) {
            ssize_t n = read(fd, out->data() + bytes_read, out->size() - bytes_read);
            if (n < 0) {
                if (errno == EINTR) continue;
                return io_error(domain, errno);
            }
            if (n == 0) break;  // EOF
            bytes_read += static_cast<u64>(n);
        }
        // File shrank underneath us.
        out->resize(bytes_read);

        if (info != nullptr) {
            info->size_bytes = bytes_read;
            info->mod_time = static_cast<Timestamp>(st.st_mtim.tv_sec) * 1000000000LL +
                             static_cast<Timestamp>(st.st_mtim.tv_nsec);
        }
        return ok_status();
    }
} // namespace

Status read_object_file(const std::string& path, std::vector<u8>* out, FileInfo* info) noexcept {
    if (out == nullptr || path.empty()) {
        return make_status(StatusDomain::Input, StatusCode::Invalid);
    }

    int fd = open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        return io_error(StatusDomain::Input, errno);
    }
    const Status s = read_fd(fd, StatusDomain::Input, out, info);
    close(fd);
    return s;
}

Status read_file(const std::string& path, std::vector<u8>* out) noexcept {
    if (out == nullptr || path.empty()) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    int fd = open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        return io_error(StatusDomain::Storage, errno);
    }
    const Status s = read_fd(fd, StatusDomain::Storage, out, nullptr);
    close(fd);
    return s;
}

Status create_directories(const std::string& dir) noexcept {
    if (dir.empty()) {
        return ok_status();
    }

    if (mkdir(dir.c_str(), 0755) == 0) {
        return ok_status();
    }

    if (errno == EEXIST) {
        // Another worker may have won the race; it must still be a directory.
        struct stat st{};
        if (stat(dir.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) {
            return ok_status();
        }
        return make_status(StatusDomain::Storage, StatusCode::Io, EEXIST);
    }

    if (errno == ENOENT) {
        // Parent doesn't exist, recurse
        const size_t slash = dir.find_last_of('/');
        if (slash != std::string::npos && slash > 0) {
            Status s = create_directories(dir.substr(0, slash));
            if (!is_ok(s)) return s;
        }

        if (mkdir(dir.c_str(), 0755) != 0 && errno != EEXIST) {
            return io_error(StatusDomain::Storage, errno);
        }
        return ok_status();
    }

    return io_error(StatusDomain::Storage, errno);
}

Status write_file(const std::string& path, BufferView data, bool sync, WriteStats* stats) noexcept {
    if (path.empty() || !buffer_ok(data)) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        return io_error(StatusDomain::Storage, errno);
    }

    u64 written = 0;
    while (written < data.len) {
        ssize_t n = write(fd, data.data + written, data.len - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            close(fd);
            unlink(path.c_str());  // Cleanup partial write
            return io_error(StatusDomain::Storage, err);
        }
        written += static_cast<u64>(n);
    }

    if (sync && fsync(fd) != 0) {
        const int err = errno;
        close(fd);
        unlink(path.c_str());
        return io_error(StatusDomain::Storage, err);
    }

    if (close(fd) != 0) {
        return io_error(StatusDomain::Storage, errno);
    }

    if (stats != nullptr) {
        stats->files += 1;
        stats->bytes += written;
    }
    return ok_status();
}

Status verify_shard_file(const std::string& path, const Hash256& expected, u64 expected_bytes, bool* valid) noexcept {
    if (valid == nullptr) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    *valid = false;

    std::vector<u8> buffer;
    Status s = read_file(path, &buffer);
    if (!is_ok(s)) {
        return s;
    }

    if (buffer.size() != expected_bytes) {
        return ok_status();
    }

    Hash256 computed{};
    s = hash_compute(view_of(buffer), &computed);
    if (!is_ok(s)) {
        return s;
    }

    *valid = (computed == expected);
    return ok_status();
}

} // namespace shardsim::storage
