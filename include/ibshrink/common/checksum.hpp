#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <system_error>

namespace ibshrink::common {

constexpr std::uint32_t kCrc32cInit = 0xFFFFFFFFu;
constexpr std::size_t kChecksumChunkSize = 1U << 20U;

std::uint32_t crc32c_extend(std::uint32_t state, std::span<const std::byte> data);
constexpr std::uint32_t crc32c_finalize(std::uint32_t state)
{
    return state ^ 0xFFFFFFFFu;
}
inline std::uint32_t crc32c(std::span<const std::byte> data)
{
    return crc32c_finalize(crc32c_extend(kCrc32cInit, data));
}

struct FileDigest final {
    std::uint64_t size = 0U;
    std::uint32_t checksum = 0U;

    friend bool operator==(const FileDigest&, const FileDigest&) = default;
};

[[nodiscard]] std::error_code digest_file(const std::filesystem::path& path, FileDigest& out);

}  // namespace ibshrink::common
