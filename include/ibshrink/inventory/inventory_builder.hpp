#pragma once

#include "ibshrink/common/table_id.hpp"
#include "ibshrink/db/command_client.hpp"
#include "ibshrink/inventory/table_record.hpp"

#include <array>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace ibshrink::inventory {

inline constexpr std::array<std::string_view, 2> kExcludedSchemas{"information_schema", "performance_schema"};
inline constexpr std::array<std::string_view, 2> kInternalSchemas{"mysql", "sys"};

[[nodiscard]] TableClass classify_table(const common::TableId& id) noexcept;
[[nodiscard]] db::SchemaFilter default_schema_filter();

struct Plan final {
    db::ServerSettings server{};
    std::vector<TableRecord> records{};

    [[nodiscard]] std::size_t count(TableAction action) const noexcept;
};

struct InventoryFailure final {
    common::TableId table{};
    std::string detail{};
};

struct IdentityDiff final {
    std::vector<common::TableId> added{};
    std::vector<common::TableId> removed{};

    [[nodiscard]] bool empty() const noexcept { return added.empty() && removed.empty(); }
    [[nodiscard]] std::string describe() const;
};

class InventoryBuilder final {
public:
    explicit InventoryBuilder(db::CommandClient& client) noexcept;

    // Read-only: issues SELECT/SHOW statements only.
    [[nodiscard]] std::error_code build_plan(const db::ServerSettings& server, Plan& out, InventoryFailure& failure);
    [[nodiscard]] std::error_code list_identities(std::vector<common::TableId>& out, InventoryFailure& failure);

private:
    [[nodiscard]] std::error_code check_eligibility(const db::ServerSettings& server,
                                                    TableRecord& record,
                                                    InventoryFailure& failure);

    db::CommandClient* client_ = nullptr;
};

[[nodiscard]] IdentityDiff compare_identities(std::span<const TableRecord> persisted,
                                              std::vector<common::TableId> live);

[[nodiscard]] std::string render_plan(std::span<const TableRecord> records, Stage stage);

}  // namespace ibshrink::inventory
