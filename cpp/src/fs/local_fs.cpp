#include "sloup/fs/local_fs.hpp"

#include <cstring>
#include <filesystem>
#include <system_error>
#include <utility>
#include <sys/stat.h>
#include <sys/types.h>
#include <fcntl.h>
#include <unistd.h>
#include <errno.h>

namespace sloup::fs {

using namespace sloup::core;

namespace {

[[nodiscard]] Status io_error(int err) noexcept {
    return make_status(StatusDomain::Fs, StatusCode::Io, static_cast<u32>(err));
}

[[nodiscard]] Status invalid() noexcept {
    return make_status(StatusDomain::Fs, StatusCode::Invalid);
}

// mkdir -p, one component at a time from the right.
Status create_directories(const char* path) {
    if (mkdir(path, 0755) == 0) {
        return ok_status();
    }
    if (errno == EEXIST) {
        struct stat st;
        if (stat(path, &st) == 0 && S_ISDIR(st.st_mode)) {
            return ok_status();
        }
        return make_status(StatusDomain::Fs, StatusCode::Conflict, EEXIST);
    }
    if (errno != ENOENT) {
        return io_error(errno);
    }

    std::string parent(path);
    while (!parent.empty() && parent.back() == '/') {
        parent.pop_back();
    }
    const size_t slash = parent.find_last_of('/');
    if (slash == std::string::npos || slash == 0) {
        return io_error(ENOENT);
    }
    parent.resize(slash);

    Status s = create_directories(parent.c_str());
    if (!is_ok(s)) return s;

    if (mkdir(path, 0755) != 0 && errno != EEXIST) {
        return io_error(errno);
    }
    return ok_status();
}

class PosixTempFile final : public TempFile {
public:
    PosixTempFile(std::string path, int fd) noexcept : path_(std::move(path)), fd_(fd) {}

    ~PosixTempFile() noexcept override {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    const std::string& path() const noexcept override { return path_; }

    Status write(BufferView data) noexcept override {
        if (fd_ < 0) {
            return invalid();
        }
        if (data.len > 0 && data.data == nullptr) {
            return invalid();
        }
        u64 written = 0;
        while (written < data.len) {
            ssize_t n = ::write(fd_, data.data + written, data.len - written);
            if (n < 0) {
                if (errno == EINTR) continue;
                return io_error(errno);
            }
            written += static_cast<u64>(n);
        }
        return ok_status();
    }

    Status close() noexcept override {
        if (fd_ < 0) {
            return invalid();
        }
        const int fd = fd_;
        fd_ = -1;
        if (fsync(fd) != 0) {
            const int err = errno;
            ::close(fd);
            return io_error(err);
        }
        if (::close(fd) != 0) {
            return io_error(errno);
        }
        return ok_status();
    }

private:
    std::string path_;
    int fd_{-1};
};

} // namespace

// ========================================================================
// PosixSourceFile
// ========================================================================

PosixSourceFile::~PosixSourceFile() noexcept {
    if (fd_ >= 0) {
        close(fd_);
    }
}

Status PosixSourceFile::open(const std::string& path) noexcept {
    if (fd_ >= 0 || path.empty()) {
        return invalid();
    }

    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        if (errno == ENOENT) {
            return make_status(StatusDomain::Fs, StatusCode::NotFound, ENOENT);
        }
        return io_error(errno);
    }

    struct stat st;
    if (fstat(fd, &st) != 0) {
        const int err = errno;
        close(fd);
        return io_error(err);
    }
    if (!S_ISREG(st.st_mode)) {
        close(fd);
        return make_status(StatusDomain::Fs, StatusCode::Unsupported);
    }

    fd_ = fd;
    size_ = static_cast<u64>(st.st_size);
    return ok_status();
}

Status PosixSourceFile::read_range(u64 offset, BufferMut out, u64* bytes_read) noexcept {
    if (bytes_read == nullptr || fd_ < 0) {
        return invalid();
    }
    if (out.len > 0 && out.data == nullptr) {
        return invalid();
    }

    u64 total = 0;
    while (total < out.len) {
        ssize_t n = pread(fd_, out.data + total, out.len - total, static_cast<off_t>(offset + total));
        if (n < 0) {
            if (errno == EINTR) continue;
            return io_error(errno);
        }
        if (n == 0) break;  // EOF
        total += static_cast<u64>(n);
    }

    *bytes_read = total;
    return ok_status();
}

// ========================================================================
// PosixFs
// ========================================================================

Status PosixFs::ensure_dir(const std::string& path) noexcept {
    if (path.empty()) {
        return invalid();
    }
    return create_directories(path.c_str());
}

Status PosixFs::remove_dir(const std::string& path) noexcept {
    if (path.empty() || path == "/") {
        return invalid();
    }
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec) {
        return io_error(ec.value());
    }
    return ok_status();
}

Status PosixFs::delete_file(const std::string& path) noexcept {
    if (path.empty()) {
        return invalid();
    }
    if (unlink(path.c_str()) != 0) {
        if (errno == ENOENT) {
            return make_status(StatusDomain::Fs, StatusCode::NotFound, ENOENT);
        }
        return io_error(errno);
    }
    return ok_status();
}

Status PosixFs::open_temp_file(const std::string& dir, const std::string& name,
                               std::unique_ptr<TempFile>* out) noexcept {
    if (out == nullptr || dir.empty() || name.empty()) {
        return invalid();
    }

    std::string path = join_path(dir, name);
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return io_error(errno);
    }

    *out = std::make_unique<PosixTempFile>(std::move(path), fd);
    return ok_status();
}

std::string join_path(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    if (name.empty()) return dir;

    std::string out = dir;
    while (out.size() > 1 && out.back() == '/') {
        out.pop_back();
    }
    size_t start = 0;
    while (start < name.size() && name[start] == '/') {
        ++start;
    }
    if (out.back() != '/') {
        out.push_back('/');
    }
    out.append(name, start, std::string::npos);
    return out;
}

std::string base_name(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/') {
        p.pop_back();
    }
    const size_t slash = p.find_last_of('/');
    return slash == std::string::npos ? p : p.substr(slash + 1);
}

} // namespace sloup::fs
