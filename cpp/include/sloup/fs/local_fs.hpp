#pragma once

#include <memory>
#include <string>

#include "sloup/core/errors.hpp"
#include "sloup/core/types.hpp"
#include "sloup/storage/buffer.hpp"

namespace sloup::fs {

using u64 = sloup::core::u64;
using sloup::storage::BufferMut;
using sloup::storage::BufferView;

// ========================================================================
// Source file
// ========================================================================

// Read-only view of the file being uploaded. read_range may be called from
// several threads at once.
class SourceFile {
public:
    virtual ~SourceFile() = default;

    [[nodiscard]] virtual u64 size() const noexcept = 0;

    // Reads up to out.len bytes at offset; *bytes_read < out.len only at EOF.
    [[nodiscard]] virtual sloup::core::Status read_range(u64 offset, BufferMut out,
                                                          u64* bytes_read) noexcept = 0;
};

class PosixSourceFile final : public SourceFile {
public:
    PosixSourceFile() noexcept = default;
    ~PosixSourceFile() noexcept override;

    PosixSourceFile(const PosixSourceFile&) = delete;
    PosixSourceFile& operator=(const PosixSourceFile&) = delete;

    [[nodiscard]] sloup::core::Status open(const std::string& path) noexcept;

    [[nodiscard]] u64 size() const noexcept override { return size_; }
    [[nodiscard]] sloup::core::Status read_range(u64 offset, BufferMut out,
                                                  u64* bytes_read) noexcept override;

private:
    int fd_{-1};
    u64 size_{0};
};

// ========================================================================
// Local scratch storage
// ========================================================================

// A file being written in the work directory. The owner deletes it through
// LocalFs::delete_file once it is no longer needed.
class TempFile {
public:
    virtual ~TempFile() = default;

    [[nodiscard]] virtual const std::string& path() const noexcept = 0;
    [[nodiscard]] virtual sloup::core::Status write(BufferView data) noexcept = 0;

    // Flushes to disk and closes the descriptor.
    [[nodiscard]] virtual sloup::core::Status close() noexcept = 0;
};

class LocalFs {
public:
    virtual ~LocalFs() = default;

    // Creates `path` and missing parents; existing directories are fine.
    [[nodiscard]] virtual sloup::core::Status ensure_dir(const std::string& path) noexcept = 0;

    // Removes `path` and everything below it.
    [[nodiscard]] virtual sloup::core::Status remove_dir(const std::string& path) noexcept = 0;

    [[nodiscard]] virtual sloup::core::Status delete_file(const std::string& path) noexcept = 0;

    // Creates (or truncates) dir/name for writing.
    [[nodiscard]] virtual sloup::core::Status open_temp_file(const std::string& dir,
                                                              const std::string& name,
                                                              std::unique_ptr<TempFile>* out) noexcept = 0;
};

class PosixFs final : public LocalFs {
public:
    [[nodiscard]] sloup::core::Status ensure_dir(const std::string& path) noexcept override;
    [[nodiscard]] sloup::core::Status remove_dir(const std::string& path) noexcept override;
    [[nodiscard]] sloup::core::Status delete_file(const std::string& path) noexcept override;
    [[nodiscard]] sloup::core::Status open_temp_file(const std::string& dir,
                                                      const std::string& name,
                                                      std::unique_ptr<TempFile>* out) noexcept override;
};

// Joins with exactly one '/' between the parts.
std::string join_path(const std::string& dir, const std::string& name);

// Last path component ("a/b/c.iso" -> "c.iso").
std::string base_name(const std::string& path);

} // namespace sloup::fs
