#pragma once

#include <cstddef>
#include <filesystem>
#include <system_error>

namespace ibshrink::common {

[[nodiscard]] std::error_code last_system_error() noexcept;

// Owns a raw descriptor; close() reports the error the destructor would drop.
class FileDescriptor final {
public:
    FileDescriptor() noexcept = default;
    explicit FileDescriptor(int fd) noexcept
        : fd_{fd}
    {
    }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept
        : fd_{other.fd_}
    {
        other.fd_ = -1;
    }

    FileDescriptor& operator=(FileDescriptor&& other) noexcept;

    ~FileDescriptor();

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

    [[nodiscard]] std::error_code close() noexcept;

    // Gives up ownership without closing.
    [[nodiscard]] int release() noexcept
    {
        const int fd = fd_;
        fd_ = -1;
        return fd;
    }

private:
    int fd_ = -1;
};

[[nodiscard]] std::error_code write_all(int fd, const std::byte* data, std::size_t size) noexcept;
[[nodiscard]] std::error_code sync_directory(const std::filesystem::path& directory) noexcept;

// lstat-based: a dangling symlink counts as present.
[[nodiscard]] bool path_exists(const std::filesystem::path& path) noexcept;

}  // namespace ibshrink::common
