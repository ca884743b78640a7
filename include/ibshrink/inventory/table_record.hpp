#pragma once

#include "ibshrink/common/table_id.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace ibshrink::inventory {

enum class Stage : std::uint8_t {
    One = 1,
    Two = 2
};

enum class TableClass : std::uint8_t {
    Internal = 0,
    Application
};

enum class TableAction : std::uint8_t {
    Convert = 0,
    Export,
    Ignore
};

enum class TableStatus : std::uint8_t {
    Pending = 0,
    Converting,
    Converted,
    Exporting,
    Exported,
    Reverting,
    Completed,
    Importing,
    Imported,
    Skipped,
    Failed
};

struct TableRecord final {
    common::TableId id{};
    TableClass table_class = TableClass::Application;
    TableAction action = TableAction::Ignore;
    std::string engine{};
    bool eligible = true;
    TableStatus status = TableStatus::Pending;
    TableStatus resume_status = TableStatus::Pending;
    std::filesystem::path data_file{};
    std::filesystem::path metadata_file{};
    std::uint64_t data_size = 0U;
    std::optional<std::uint32_t> export_checksum{};
    std::optional<std::uint32_t> import_checksum{};
    std::string last_error{};
};

[[nodiscard]] const char* to_string(TableClass value) noexcept;
[[nodiscard]] const char* to_string(TableAction value) noexcept;
[[nodiscard]] const char* to_string(TableStatus value) noexcept;

[[nodiscard]] std::optional<TableClass> parse_table_class(std::string_view text) noexcept;
[[nodiscard]] std::optional<TableAction> parse_table_action(std::string_view text) noexcept;
[[nodiscard]] std::optional<TableStatus> parse_table_status(std::string_view text) noexcept;

// Status a record must hold before the given stage touches it.
[[nodiscard]] TableStatus entry_status(TableAction action, Stage stage) noexcept;
[[nodiscard]] TableStatus in_flight_status(TableAction action, Stage stage) noexcept;
[[nodiscard]] TableStatus success_status(TableAction action, Stage stage) noexcept;

[[nodiscard]] bool is_stage_terminal(const TableRecord& record, Stage stage) noexcept;
[[nodiscard]] bool is_stage_resumable(const TableRecord& record, Stage stage) noexcept;
[[nodiscard]] bool is_legal_transition(TableAction action, Stage stage, TableStatus from, TableStatus to) noexcept;

}  // namespace ibshrink::inventory
