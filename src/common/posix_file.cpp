#include "ibshrink/common/posix_file.hpp"

#include <algorithm>
#include <cerrno>
#include <limits>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace ibshrink::common {

std::error_code last_system_error() noexcept
{
    return std::error_code(errno, std::generic_category());
}

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept
{
    if (this != &other) {
        if (fd_ >= 0) {
            (void)::close(fd_);
        }
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

FileDescriptor::~FileDescriptor()
{
    if (fd_ >= 0) {
        (void)::close(fd_);
    }
}

std::error_code FileDescriptor::close() noexcept
{
    if (fd_ < 0) {
        return {};
    }
    const int fd = fd_;
    fd_ = -1;
    if (::close(fd) != 0) {
        return last_system_error();
    }
    return {};
}

std::error_code write_all(int fd, const std::byte* data, std::size_t size) noexcept
{
    std::size_t written = 0U;
    while (written < size) {
        const auto chunk = std::min<std::size_t>(size - written, static_cast<std::size_t>(std::numeric_limits<ssize_t>::max()));
        const ssize_t count = ::write(fd, data + written, chunk);
        if (count < 0) {
            if (errno == EINTR) {
                continue;
            }
            return last_system_error();
        }
        written += static_cast<std::size_t>(count);
    }
    return {};
}

std::error_code sync_directory(const std::filesystem::path& directory) noexcept
{
    FileDescriptor fd{::open(directory.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC)};
    if (!fd.valid()) {
        return last_system_error();
    }
    if (::fsync(fd.get()) != 0) {
        return last_system_error();
    }
    return fd.close();
}

bool path_exists(const std::filesystem::path& path) noexcept
{
    struct stat info{};
    return ::lstat(path.c_str(), &info) == 0;
}

}  // namespace ibshrink::common
