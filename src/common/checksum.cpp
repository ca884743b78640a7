#include "ibshrink/common/checksum.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <vector>

#if defined(_MSC_VER) || defined(__SSE4_2__)
#if defined(__x86_64__) || defined(_M_X64) || defined(__i386__) || defined(_M_IX86)
#include <nmmintrin.h>
#define IBSHRINK_COMMON_HAS_SSE42 1
#endif
#endif

namespace ibshrink::common {

namespace {

constexpr std::array<std::uint32_t, 256> make_crc32c_table()
{
    std::array<std::uint32_t, 256> table{};
    // Reflected Castagnoli polynomial, matches the SSE4.2 crc32 instruction.
    constexpr std::uint32_t poly = 0x82F63B78u;
    for (std::uint32_t i = 0; i < table.size(); ++i) {
        std::uint32_t crc = i;
        for (int j = 0; j < 8; ++j) {
            const bool lsb = (crc & 1u) != 0u;
            crc >>= 1;
            if (lsb) {
                crc ^= poly;
            }
        }
        table[i] = crc;
    }
    return table;
}

constexpr auto kCrc32cTable = make_crc32c_table();

std::uint32_t crc32c_sw(std::uint32_t crc, std::span<const std::byte> data)
{
    for (auto byte : data) {
        const auto value = std::to_integer<std::uint8_t>(byte);
        const auto index = static_cast<std::uint8_t>((crc ^ value) & 0xFFu);
        crc = (crc >> 8U) ^ kCrc32cTable[index];
    }
    return crc;
}

#if defined(IBSHRINK_COMMON_HAS_SSE42)
bool has_sse42()
{
#if defined(_MSC_VER)
    int cpuInfo[4]{};
    __cpuid(cpuInfo, 1);
    return (cpuInfo[2] & (1 << 20)) != 0;
#else
    return __builtin_cpu_supports("sse4.2");
#endif
}

std::uint32_t crc32c_hw(std::uint32_t crc, std::span<const std::byte> data)
{
    const auto* bytes = reinterpret_cast<const unsigned char*>(data.data());
    std::size_t remaining = data.size();

#if defined(__x86_64__) || defined(_M_X64)
    while (remaining >= sizeof(std::uint64_t)) {
        std::uint64_t chunk;
        std::memcpy(&chunk, bytes, sizeof(chunk));
        crc = static_cast<std::uint32_t>(_mm_crc32_u64(crc, chunk));
        bytes += sizeof(std::uint64_t);
        remaining -= sizeof(std::uint64_t);
    }
#endif
    while (remaining >= sizeof(std::uint32_t)) {
        std::uint32_t chunk;
        std::memcpy(&chunk, bytes, sizeof(chunk));
        crc = _mm_crc32_u32(crc, chunk);
        bytes += sizeof(std::uint32_t);
        remaining -= sizeof(std::uint32_t);
    }
    while (remaining > 0) {
        crc = _mm_crc32_u8(crc, *bytes++);
        --remaining;
    }

    return crc;
}
#endif

std::uint32_t dispatch_crc32c(std::uint32_t crc, std::span<const std::byte> data)
{
#if defined(IBSHRINK_COMMON_HAS_SSE42)
    if (has_sse42()) {
        return crc32c_hw(crc, data);
    }
#endif
    return crc32c_sw(crc, data);
}

}  // namespace

std::uint32_t crc32c_extend(std::uint32_t state, std::span<const std::byte> data)
{
    return dispatch_crc32c(state, data);
}

std::error_code digest_file(const std::filesystem::path& path, FileDigest& out)
{
    out = FileDigest{};

    std::ifstream stream{path, std::ios::binary};
    if (!stream) {
        const int open_error = errno;
        return std::error_code(open_error != 0 ? open_error : ENOENT, std::generic_category());
    }

    std::vector<std::byte> buffer(kChecksumChunkSize);
    auto state = kCrc32cInit;
    std::uint64_t total = 0U;
    while (stream) {
        stream.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        const auto count = stream.gcount();
        if (count <= 0) {
            break;
        }
        state = crc32c_extend(state, std::span<const std::byte>(buffer.data(), static_cast<std::size_t>(count)));
        total += static_cast<std::uint64_t>(count);
    }

    if (stream.bad()) {
        return std::make_error_code(std::errc::io_error);
    }

    out.size = total;
    out.checksum = crc32c_finalize(state);
    return {};
}

}  // namespace ibshrink::common
