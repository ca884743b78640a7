#pragma once

#include "ibshrink/common/table_id.hpp"

#include <string>
#include <string_view>

namespace ibshrink::db {

inline constexpr std::string_view kEngineInnoDb = "InnoDB";
inline constexpr std::string_view kEngineMyIsam = "MyISAM";

[[nodiscard]] std::string quote_identifier(std::string_view identifier);
[[nodiscard]] std::string qualified_identifier(const common::TableId& id);

[[nodiscard]] std::string engine_conversion_statement(const common::TableId& id, std::string_view engine);
[[nodiscard]] std::string flush_for_export_statement(const common::TableId& id);
[[nodiscard]] std::string unlock_tables_statement();
[[nodiscard]] std::string discard_tablespace_statement(const common::TableId& id);
[[nodiscard]] std::string import_tablespace_statement(const common::TableId& id);
[[nodiscard]] std::string show_create_table_statement(const common::TableId& id);
[[nodiscard]] std::string prepare_session_statement();

// Statements other than SELECT/SHOW/SET SESSION change server state.
[[nodiscard]] bool is_mutating_statement(std::string_view statement);

// MySQL on-disk name for an identifier: [0-9A-Za-z_] kept, everything else as @xxxx code points.
[[nodiscard]] std::string tablename_to_filename(std::string_view identifier);

}  // namespace ibshrink::db
