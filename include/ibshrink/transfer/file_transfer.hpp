#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace ibshrink::transfer {

enum class TransferStrategy : std::uint8_t {
    Copy = 0,
    Hardlink
};

[[nodiscard]] const char* strategy_name(TransferStrategy strategy) noexcept;
[[nodiscard]] std::optional<TransferStrategy> parse_strategy(std::string_view text) noexcept;

struct TablespaceFile final {
    std::filesystem::path source{};
    std::filesystem::path destination{};
    std::uint64_t size = 0U;
    std::uint32_t checksum = 0U;
};

// The .ibd and its optional .cfg companion move as one unit.
struct TablespaceFileSet final {
    TablespaceFile data{};
    std::optional<TablespaceFile> metadata{};

    [[nodiscard]] std::uint64_t total_bytes() const noexcept
    {
        return data.size + (metadata ? metadata->size : 0U);
    }
};

struct TransferFailure final {
    std::filesystem::path path{};
    std::error_code system_error{};
    std::string detail{};

    [[nodiscard]] std::string describe() const;
};

class FileTransferUnit final {
public:
    struct Config final {
        TransferStrategy strategy = TransferStrategy::Copy;
        bool preserve_ownership = true;
        std::size_t copy_buffer_size = 1U << 20U;
    };

    FileTransferUnit();
    explicit FileTransferUnit(Config config);

    [[nodiscard]] TransferStrategy strategy() const noexcept { return config_.strategy; }

    [[nodiscard]] std::error_code transfer(TablespaceFileSet& files, TransferFailure& failure) const;
    [[nodiscard]] std::error_code transfer_file(TablespaceFile& file, TransferFailure& failure) const;

    [[nodiscard]] static std::error_code same_device(const std::filesystem::path& lhs,
                                                     const std::filesystem::path& rhs,
                                                     bool& out);

private:
    [[nodiscard]] std::error_code copy_file(TablespaceFile& file, TransferFailure& failure) const;
    [[nodiscard]] std::error_code link_file(TablespaceFile& file, TransferFailure& failure) const;

    Config config_{};
};

}  // namespace ibshrink::transfer
