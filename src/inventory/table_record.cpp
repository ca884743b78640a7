#include "ibshrink/inventory/table_record.hpp"

#include <array>
#include <utility>

namespace ibshrink::inventory {

namespace {

constexpr std::array<std::pair<TableStatus, std::string_view>, 11> kStatusNames{{
    {TableStatus::Pending, "pending"},
    {TableStatus::Converting, "converting"},
    {TableStatus::Converted, "converted"},
    {TableStatus::Exporting, "exporting"},
    {TableStatus::Exported, "exported"},
    {TableStatus::Reverting, "reverting"},
    {TableStatus::Completed, "completed"},
    {TableStatus::Importing, "importing"},
    {TableStatus::Imported, "imported"},
    {TableStatus::Skipped, "skipped"},
    {TableStatus::Failed, "failed"},
}};

}  // namespace

const char* to_string(TableClass value) noexcept
{
    switch (value) {
    case TableClass::Internal:
        return "internal";
    case TableClass::Application:
    default:
        return "application";
    }
}

const char* to_string(TableAction value) noexcept
{
    switch (value) {
    case TableAction::Convert:
        return "convert";
    case TableAction::Export:
        return "export";
    case TableAction::Ignore:
    default:
        return "ignore";
    }
}

const char* to_string(TableStatus value) noexcept
{
    for (const auto& [status, name] : kStatusNames) {
        if (status == value) {
            return name.data();
        }
    }
    return "unknown";
}

std::optional<TableClass> parse_table_class(std::string_view text) noexcept
{
    if (text == "internal") {
        return TableClass::Internal;
    }
    if (text == "application") {
        return TableClass::Application;
    }
    return std::nullopt;
}

std::optional<TableAction> parse_table_action(std::string_view text) noexcept
{
    if (text == "convert") {
        return TableAction::Convert;
    }
    if (text == "export") {
        return TableAction::Export;
    }
    if (text == "ignore") {
        return TableAction::Ignore;
    }
    return std::nullopt;
}

std::optional<TableStatus> parse_table_status(std::string_view text) noexcept
{
    for (const auto& [status, name] : kStatusNames) {
        if (name == text) {
            return status;
        }
    }
    return std::nullopt;
}

TableStatus entry_status(TableAction action, Stage stage) noexcept
{
    if (action == TableAction::Ignore) {
        return TableStatus::Skipped;
    }
    if (stage == Stage::One) {
        return TableStatus::Pending;
    }
    return action == TableAction::Convert ? TableStatus::Converted : TableStatus::Exported;
}

TableStatus in_flight_status(TableAction action, Stage stage) noexcept
{
    switch (action) {
    case TableAction::Convert:
        return stage == Stage::One ? TableStatus::Converting : TableStatus::Reverting;
    case TableAction::Export:
        return stage == Stage::One ? TableStatus::Exporting : TableStatus::Importing;
    case TableAction::Ignore:
    default:
        return TableStatus::Skipped;
    }
}

TableStatus success_status(TableAction action, Stage stage) noexcept
{
    switch (action) {
    case TableAction::Convert:
        return stage == Stage::One ? TableStatus::Converted : TableStatus::Completed;
    case TableAction::Export:
        return stage == Stage::One ? TableStatus::Exported : TableStatus::Imported;
    case TableAction::Ignore:
    default:
        return TableStatus::Skipped;
    }
}

bool is_stage_terminal(const TableRecord& record, Stage stage) noexcept
{
    return record.status == success_status(record.action, stage);
}

bool is_stage_resumable(const TableRecord& record, Stage stage) noexcept
{
    if (record.action == TableAction::Ignore || is_stage_terminal(record, stage)) {
        return false;
    }
    const auto entry = entry_status(record.action, stage);
    if (record.status == entry || record.status == in_flight_status(record.action, stage)) {
        return true;
    }
    return record.status == TableStatus::Failed && record.resume_status == entry;
}

bool is_legal_transition(TableAction action, Stage stage, TableStatus from, TableStatus to) noexcept
{
    if (action == TableAction::Ignore) {
        return from == TableStatus::Skipped && to == TableStatus::Skipped;
    }

    const auto entry = entry_status(action, stage);
    const auto in_flight = in_flight_status(action, stage);
    const auto success = success_status(action, stage);

    if (to == in_flight) {
        return from == entry || from == in_flight || from == TableStatus::Failed;
    }
    if (to == success || to == TableStatus::Failed) {
        return from == in_flight;
    }
    return false;
}

}  // namespace ibshrink::inventory
