#include "ibshrink/inventory/inventory_builder.hpp"

#include "ibshrink/common/errors.hpp"
#include "ibshrink/db/statements.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <sstream>

namespace ibshrink::inventory {

namespace {

using common::ShrinkErrc;

bool iequals(std::string_view lhs, std::string_view rhs) noexcept
{
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t index = 0; index < lhs.size(); ++index) {
        if (std::tolower(static_cast<unsigned char>(lhs[index])) != std::tolower(static_cast<unsigned char>(rhs[index]))) {
            return false;
        }
    }
    return true;
}

std::filesystem::path normalize_directory(const std::filesystem::path& directory)
{
    auto normal = directory.lexically_normal();
    if (!normal.has_filename() && normal.has_parent_path() && normal != normal.root_path()) {
        normal = normal.parent_path();
    }
    return normal;
}

void append_identities(std::ostringstream& stream, const char* label, const std::vector<common::TableId>& ids)
{
    stream << label << ": ";
    for (std::size_t index = 0; index < ids.size(); ++index) {
        if (index > 0U) {
            stream << ", ";
        }
        stream << ids[index].qualified_name();
    }
}

void append_section(std::ostringstream& stream,
                    const char* heading,
                    std::span<const TableRecord> records,
                    TableAction action,
                    Stage stage,
                    std::size_t& count)
{
    stream << heading << '\n';
    count = 0U;
    for (const auto& record : records) {
        if (record.action != action || !is_stage_resumable(record, stage)) {
            continue;
        }
        stream << "  " << record.id.qualified_name();
        if (record.status == TableStatus::Failed || record.status == in_flight_status(action, stage)) {
            stream << " (retry)";
        }
        stream << '\n';
        ++count;
    }
    if (count == 0U) {
        stream << "  (none)\n";
    }
}

}  // namespace

TableClass classify_table(const common::TableId& id) noexcept
{
    for (auto schema : kInternalSchemas) {
        if (id.schema == schema) {
            return TableClass::Internal;
        }
    }
    return TableClass::Application;
}

db::SchemaFilter default_schema_filter()
{
    db::SchemaFilter filter{};
    for (auto schema : kExcludedSchemas) {
        filter.excluded_schemas.emplace_back(schema);
    }
    return filter;
}

std::size_t Plan::count(TableAction action) const noexcept
{
    return static_cast<std::size_t>(std::count_if(records.begin(), records.end(), [action](const TableRecord& record) {
        return record.action == action;
    }));
}

std::string IdentityDiff::describe() const
{
    std::ostringstream stream;
    if (!added.empty()) {
        append_identities(stream, "added", added);
    }
    if (!removed.empty()) {
        if (!added.empty()) {
            stream << "; ";
        }
        append_identities(stream, "removed", removed);
    }
    return stream.str();
}

InventoryBuilder::InventoryBuilder(db::CommandClient& client) noexcept
    : client_{&client}
{
}

std::error_code InventoryBuilder::list_identities(std::vector<common::TableId>& out, InventoryFailure& failure)
{
    out.clear();
    failure = InventoryFailure{};

    std::vector<db::TableInfo> tables;
    if (auto ec = client_->list_tables(default_schema_filter(), tables); ec) {
        failure.detail = client_->last_failure().describe();
        return ec;
    }

    out.reserve(tables.size());
    for (auto& table : tables) {
        out.push_back(std::move(table.id));
    }
    std::sort(out.begin(), out.end());
    return {};
}

std::error_code InventoryBuilder::build_plan(const db::ServerSettings& server, Plan& out, InventoryFailure& failure)
{
    out = Plan{};
    out.server = server;
    failure = InventoryFailure{};

    std::vector<db::TableInfo> tables;
    if (auto ec = client_->list_tables(default_schema_filter(), tables); ec) {
        failure.detail = client_->last_failure().describe();
        return ec;
    }

    out.records.reserve(tables.size());
    for (auto& table : tables) {
        TableRecord record{};
        record.id = std::move(table.id);
        record.table_class = classify_table(record.id);
        record.engine = std::move(table.engine);
        if (!iequals(record.engine, db::kEngineInnoDb)) {
            record.action = TableAction::Ignore;
        } else if (record.table_class == TableClass::Internal) {
            record.action = TableAction::Convert;
        } else {
            record.action = TableAction::Export;
        }
        record.status = entry_status(record.action, Stage::One);
        record.resume_status = record.status;
        out.records.push_back(std::move(record));
    }

    std::stable_sort(out.records.begin(), out.records.end(), [](const TableRecord& lhs, const TableRecord& rhs) {
        return lhs.id < rhs.id;
    });

    for (auto& record : out.records) {
        if (record.action != TableAction::Export) {
            continue;
        }
        if (auto ec = check_eligibility(server, record, failure); ec) {
            return ec;
        }
    }

    return {};
}

std::error_code InventoryBuilder::check_eligibility(const db::ServerSettings& server,
                                                    TableRecord& record,
                                                    InventoryFailure& failure)
{
    db::PhysicalFiles files{};
    if (auto ec = client_->get_physical_file_paths(record.id, files); ec) {
        failure.table = record.id;
        failure.detail = client_->last_failure().describe();
        return ec;
    }

    auto reject = [&](const std::string& reason) -> std::error_code {
        record.eligible = false;
        failure.table = record.id;
        failure.detail = "table " + record.id.qualified_name() + " " + reason;
        return ShrinkErrc::UnsupportedLimitation;
    };

    switch (files.layout) {
    case db::TablespaceLayout::FilePerTable:
        break;
    case db::TablespaceLayout::SystemTablespace:
        return reject("lives in the shared system tablespace instead of its own file-per-table tablespace");
    case db::TablespaceLayout::GeneralTablespace:
        return reject("lives in a general (shared) tablespace");
    case db::TablespaceLayout::Partitioned:
        return reject("is partitioned; its partition tablespaces cannot be transported as one table");
    case db::TablespaceLayout::Missing:
    default:
        return reject("has no tablespace file registered with InnoDB");
    }

    if (files.data_files.size() != 1U) {
        return reject("maps to " + std::to_string(files.data_files.size()) + " tablespace files");
    }

    const auto& path = files.data_files.front();
    if (path.extension() != ".ibd") {
        return reject("uses tablespace file " + path.string() + " which is not an .ibd file");
    }

    if (!server.datadir.empty()) {
        const auto schema_directory = normalize_directory(path.parent_path());
        if (normalize_directory(schema_directory.parent_path()) != normalize_directory(server.datadir)) {
            return reject("has its tablespace " + path.string() + " outside the data directory");
        }
    }

    record.eligible = true;
    record.data_file = path;
    return {};
}

IdentityDiff compare_identities(std::span<const TableRecord> persisted, std::vector<common::TableId> live)
{
    std::vector<common::TableId> expected;
    expected.reserve(persisted.size());
    for (const auto& record : persisted) {
        expected.push_back(record.id);
    }
    std::sort(expected.begin(), expected.end());
    expected.erase(std::unique(expected.begin(), expected.end()), expected.end());

    std::sort(live.begin(), live.end());
    live.erase(std::unique(live.begin(), live.end()), live.end());

    IdentityDiff diff{};
    std::set_difference(live.begin(), live.end(), expected.begin(), expected.end(), std::back_inserter(diff.added));
    std::set_difference(expected.begin(), expected.end(), live.begin(), live.end(), std::back_inserter(diff.removed));
    return diff;
}

std::string render_plan(std::span<const TableRecord> records, Stage stage)
{
    std::ostringstream stream;
    std::size_t convert_count = 0U;
    std::size_t export_count = 0U;

    if (stage == Stage::One) {
        append_section(stream, "The following tables will be converted from InnoDB to MyISAM:", records, TableAction::Convert, stage, convert_count);
        stream << '\n';
        append_section(stream, "The following tables will be exported from the database:", records, TableAction::Export, stage, export_count);
    } else {
        append_section(stream, "The following tables will be converted back to InnoDB:", records, TableAction::Convert, stage, convert_count);
        stream << '\n';
        append_section(stream, "The following tables will have their tablespace imported:", records, TableAction::Export, stage, export_count);
    }

    const auto untouched = static_cast<std::size_t>(std::count_if(records.begin(), records.end(), [](const TableRecord& record) {
        return record.action == TableAction::Ignore;
    }));

    stream << '\n'
           << convert_count << " table(s) to convert, " << export_count << " table(s) to "
           << (stage == Stage::One ? "export" : "import") << ", " << untouched << " non-InnoDB table(s) left untouched\n";
    if (stage == Stage::One) {
        stream << "\nMake sure to check the list above and ensure there are no connections to this database during this procedure!\n";
    }
    return stream.str();
}

}  // namespace ibshrink::inventory
