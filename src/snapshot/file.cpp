#include "aob/snapshot/file.hpp"

#include <chrono>
#include <cerrno>
#include <cstring>
// POSIX / Linux
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>

#include "aob/log/logger.hpp"


namespace aob {
namespace snapshot {

namespace {

// Full write, retrying on EINTR and short writes
[[nodiscard]] bool write_all(int fd, const void* data, size_t size) noexcept {
    const auto* p = static_cast<const uint8_t*>(data);
    while (size > 0) {
        ssize_t n = ::write(fd, p, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        p += n;
        size -= static_cast<size_t>(n);
    }
    return true;
}

// Full read; false on error or premature EOF
[[nodiscard]] bool read_all(int fd, void* data, size_t size) noexcept {
    auto* p = static_cast<uint8_t*>(data);
    while (size > 0) {
        ssize_t n = ::read(fd, p, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (n == 0) return false;
        p += n;
        size -= static_cast<size_t>(n);
    }
    return true;
}

[[nodiscard]] uint64_t wall_clock_ns() noexcept {
    using namespace std::chrono;
    return static_cast<uint64_t>(duration_cast<nanoseconds>(system_clock::now().time_since_epoch()).count());
}

} // namespace


Status write_snapshot(const std::string& path, const Account& account, uint32_t callback_info_len) {
    auto borrow = account.try_borrow();
    if (!borrow) {
        AOB_WARN("[!!] Cannot snapshot account: mutably borrowed");
        return Status::BUFFER_BORROWED;
    }
    const auto image = borrow.bytes();

    Header header;
    header.reset();
    header.set_magic(SNAPSHOT_MAGIC);
    header.set_version(SNAPSHOT_VERSION);
    header.set_header_size(sizeof(Header));
    header.set_callback_info_len(callback_info_len);
    header.set_created_ts_ns(wall_clock_ns());
    header.finalize(image.data(), image.size());

    AOB_DEBUG("Writing snapshot: " << path << " (" << image.size() << " bytes)");
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        AOB_ERROR("[!!] Failed to open snapshot for writing: " << path << " (errno: " << errno << ")");
        return Status::OPEN_FAILED;
    }
    if (!write_all(fd, &header, sizeof(Header)) || !write_all(fd, image.data(), image.size())) {
        AOB_ERROR("[!!] Failed to write snapshot: " << path << " (errno: " << errno << ")");
        ::close(fd);
        return Status::WRITE_FAILED;
    }
    if (::close(fd) != 0) {
        AOB_ERROR("[!!] Failed to close snapshot: " << path << " (errno: " << errno << ")");
        return Status::CLOSE_FAILED;
    }
    return Status::OK;
}


Status read_snapshot(const std::string& path, Snapshot& out) {
    AOB_DEBUG("Reading snapshot: " << path);
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        AOB_ERROR("[!!] Failed to open snapshot: " << path << " (errno: " << errno << ")");
        return Status::OPEN_FAILED;
    }
    struct stat st{};
    if (::fstat(fd, &st) != 0 || static_cast<size_t>(st.st_size) < sizeof(Header)) {
        ::close(fd);
        AOB_ERROR("[!!] Snapshot too small to contain a header: " << path);
        return Status::READ_FAILED;
    }
    if (!read_all(fd, &out.header, sizeof(Header))) {
        ::close(fd);
        return Status::READ_FAILED;
    }
    Status status = out.header.verify();
    if (status != Status::OK) {
        ::close(fd);
        AOB_ERROR("[!!] Snapshot header rejected: " << path << " (" << to_string(status) << ")");
        return status;
    }
    const uint64_t image_size = out.header.image_size();
    if (static_cast<uint64_t>(st.st_size) != sizeof(Header) + image_size) {
        ::close(fd);
        AOB_ERROR("[!!] Snapshot size mismatch: file=" << st.st_size << ", expected=" << sizeof(Header) + image_size);
        return Status::CORRUPTED_DATA;
    }
    out.image.resize(static_cast<size_t>(image_size));
    if (!read_all(fd, out.image.data(), out.image.size())) {
        ::close(fd);
        return Status::READ_FAILED;
    }
    if (::close(fd) != 0) {
        return Status::CLOSE_FAILED;
    }
    const uint64_t computed = Header::compute_image_checksum(out.image.data(), out.image.size());
    if (computed != out.header.image_checksum()) {
        AOB_ERROR("[!!] Snapshot image checksum mismatch: expected " << out.header.image_checksum() << ", computed " << computed);
        return Status::IMAGE_CHECKSUM_MISMATCH;
    }
    return Status::OK;
}

} // namespace snapshot
} // namespace aob
