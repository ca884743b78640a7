#pragma once

#include "ibshrink/common/table_id.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace ibshrink::db {

struct TableInfo final {
    common::TableId id{};
    std::string engine{};
};

struct SchemaFilter final {
    std::vector<std::string> excluded_schemas{};
};

enum class TablespaceLayout : std::uint8_t {
    FilePerTable = 0,
    SystemTablespace,
    GeneralTablespace,
    Partitioned,
    Missing
};

struct PhysicalFiles final {
    TablespaceLayout layout = TablespaceLayout::Missing;
    std::vector<std::filesystem::path> data_files{};
};

struct ServerSettings final {
    std::filesystem::path datadir{};
    bool file_per_table = false;
    std::uint32_t server_version = 0U;
};

enum class DiscardOutcome : std::uint8_t {
    Discarded = 0,
    AlreadyAbsent
};

struct StatementFailure final {
    std::string statement{};
    std::uint32_t driver_code = 0U;
    std::string driver_message{};

    [[nodiscard]] std::string describe() const
    {
        if (statement.empty()) {
            return driver_message;
        }
        return "'" + statement + "' failed: [" + std::to_string(driver_code) + "] " + driver_message;
    }
};

// Administrative surface of the database server. Every call returns
// ShrinkErrc::StatementExecution (or ConnectionError) on failure; the
// offending statement and driver text are then available from last_failure().
class CommandClient {
public:
    virtual ~CommandClient() = default;

    [[nodiscard]] virtual std::error_code read_server_settings(ServerSettings& out) = 0;
    [[nodiscard]] virtual std::error_code prepare_session() = 0;

    [[nodiscard]] virtual std::error_code list_tables(const SchemaFilter& filter, std::vector<TableInfo>& out) = 0;
    [[nodiscard]] virtual std::error_code get_physical_file_paths(const common::TableId& id, PhysicalFiles& out) = 0;
    [[nodiscard]] virtual std::error_code show_create_table(const common::TableId& id, std::string& out) = 0;

    [[nodiscard]] virtual std::error_code execute_engine_conversion(const common::TableId& id,
                                                                    std::string_view target_engine) = 0;
    [[nodiscard]] virtual std::error_code flush_for_export(const common::TableId& id) = 0;
    [[nodiscard]] virtual std::error_code unlock_tables() = 0;
    [[nodiscard]] virtual std::error_code discard_tablespace(const common::TableId& id, DiscardOutcome& out) = 0;
    [[nodiscard]] virtual std::error_code import_tablespace(const common::TableId& id) = 0;

    [[nodiscard]] virtual const StatementFailure& last_failure() const noexcept = 0;
};

}  // namespace ibshrink::db
