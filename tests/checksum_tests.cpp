#include "ibshrink/common/checksum.hpp"

#include "fake_command_client.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <string_view>
#include <vector>

using ibshrink::common::FileDigest;
using ibshrink::common::crc32c;
using ibshrink::common::crc32c_extend;
using ibshrink::common::crc32c_finalize;
using ibshrink::common::digest_file;
using ibshrink::common::kCrc32cInit;

namespace {

std::span<const std::byte> as_bytes(std::string_view text)
{
    return {reinterpret_cast<const std::byte*>(text.data()), text.size()};
}

}  // namespace

TEST_CASE("crc32c matches the Castagnoli check value")
{
    CHECK(crc32c(as_bytes("123456789")) == 0xE3069283u);
    CHECK(crc32c(as_bytes("")) == 0x00000000u);
}

TEST_CASE("crc32c_extend accumulates across chunks")
{
    const std::string text = "The quick brown fox jumps over the lazy dog";
    auto state = kCrc32cInit;
    state = crc32c_extend(state, as_bytes(std::string_view{text}.substr(0U, 10U)));
    state = crc32c_extend(state, as_bytes(std::string_view{text}.substr(10U)));
    CHECK(crc32c_finalize(state) == crc32c(as_bytes(text)));
}

TEST_CASE("digest_file reports size and checksum")
{
    auto dir = ibshrink::testing::make_temp_directory("ibshrink_digest_");
    const auto path = dir / "t1.ibd";

    std::string contents(3U * 1024U * 1024U + 17U, '\0');
    for (std::size_t i = 0; i < contents.size(); ++i) {
        contents[i] = static_cast<char>(i * 31U);
    }
    ibshrink::testing::write_file(path, contents);

    FileDigest digest{};
    REQUIRE_FALSE(digest_file(path, digest));
    CHECK(digest.size == contents.size());
    CHECK(digest.checksum == crc32c(as_bytes(contents)));

    std::filesystem::remove_all(dir);
}

TEST_CASE("digest_file fails for missing files")
{
    auto dir = ibshrink::testing::make_temp_directory("ibshrink_digest_missing_");
    FileDigest digest{};
    auto ec = digest_file(dir / "absent.ibd", digest);
    CHECK(ec);
    CHECK(digest.size == 0U);
    std::filesystem::remove_all(dir);
}
