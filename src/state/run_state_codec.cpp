#include "ibshrink/state/run_state_codec.hpp"

#include "ibshrink/common/checksum.hpp"
#include "ibshrink/common/errors.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdio>
#include <set>
#include <span>
#include <vector>

namespace ibshrink::state {

namespace {

using common::ShrinkErrc;
using inventory::Stage;
using inventory::TableAction;
using inventory::TableRecord;
using inventory::TableStatus;

constexpr std::string_view kTableKey = "table";
constexpr std::string_view kEndKey = "end";
constexpr std::string_view kAbsent = "-";
constexpr std::size_t kRecordFieldCount = 14U;

constexpr std::array<std::string_view, 10> kHeaderKeys{
    "format_version",
    "profile",
    "stage",
    "phase",
    "created_at",
    "updated_at",
    "workdir",
    "datadir",
    "strategy",
    "server_version",
};

std::uint32_t text_checksum(std::string_view text)
{
    return common::crc32c(std::as_bytes(std::span<const char>(text.data(), text.size())));
}

std::vector<std::string_view> split(std::string_view text, char separator)
{
    std::vector<std::string_view> parts;
    std::size_t start = 0U;
    while (true) {
        const auto position = text.find(separator, start);
        if (position == std::string_view::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, position - start));
        start = position + 1U;
    }
    return parts;
}

template <typename T>
bool parse_number(std::string_view text, T& out, int base = 10)
{
    if (text.empty()) {
        return false;
    }
    const auto* begin = text.data();
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, out, base);
    return ec == std::errc{} && ptr == end;
}

std::int64_t to_micros(std::chrono::system_clock::time_point tp)
{
    return std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_micros(std::int64_t micros)
{
    return std::chrono::system_clock::time_point{
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::microseconds{micros})};
}

std::string format_checksum(const std::optional<std::uint32_t>& checksum)
{
    return checksum ? std::to_string(*checksum) : std::string{kAbsent};
}

std::string hex32(std::uint32_t value)
{
    std::array<char, 9> buffer{};
    std::snprintf(buffer.data(), buffer.size(), "%08x", value);
    return std::string{buffer.data(), 8U};
}

void append_field(std::string& line, std::string_view value)
{
    line.push_back('\t');
    line.append(escape_field(value));
}

std::string encode_record(const TableRecord& record)
{
    std::string line{kTableKey};
    append_field(line, record.id.schema);
    append_field(line, record.id.table);
    append_field(line, inventory::to_string(record.table_class));
    append_field(line, inventory::to_string(record.action));
    append_field(line, record.engine);
    append_field(line, record.eligible ? "1" : "0");
    append_field(line, inventory::to_string(record.status));
    append_field(line, inventory::to_string(record.resume_status));
    append_field(line, record.data_file.string());
    append_field(line, record.metadata_file.string());
    append_field(line, std::to_string(record.data_size));
    append_field(line, format_checksum(record.export_checksum));
    append_field(line, format_checksum(record.import_checksum));
    append_field(line, record.last_error);
    line.push_back('\n');
    return line;
}

bool parse_checksum(std::string_view text, std::optional<std::uint32_t>& out)
{
    if (text == kAbsent) {
        out.reset();
        return true;
    }
    std::uint32_t value = 0U;
    if (!parse_number(text, value)) {
        return false;
    }
    out = value;
    return true;
}

bool decode_record(const std::vector<std::string_view>& raw, TableRecord& record, std::string& reason)
{
    if (raw.size() != kRecordFieldCount + 1U) {
        reason = "expected " + std::to_string(kRecordFieldCount) + " fields, found " + std::to_string(raw.size() - 1U);
        return false;
    }

    std::array<std::string, kRecordFieldCount> fields{};
    for (std::size_t index = 0; index < kRecordFieldCount; ++index) {
        if (!unescape_field(raw[index + 1U], fields[index])) {
            reason = "invalid escape sequence in field " + std::to_string(index + 1U);
            return false;
        }
    }

    record.id.schema = fields[0];
    record.id.table = fields[1];
    if (record.id.schema.empty() || record.id.table.empty()) {
        reason = "empty table identity";
        return false;
    }

    const auto table_class = inventory::parse_table_class(fields[2]);
    const auto action = inventory::parse_table_action(fields[3]);
    const auto status = inventory::parse_table_status(fields[6]);
    const auto resume_status = inventory::parse_table_status(fields[7]);
    if (!table_class || !action || !status || !resume_status) {
        reason = "unknown class, action or status";
        return false;
    }
    if (fields[5] != "0" && fields[5] != "1") {
        reason = "invalid eligibility flag '" + fields[5] + "'";
        return false;
    }

    record.table_class = *table_class;
    record.action = *action;
    record.engine = fields[4];
    record.eligible = fields[5] == "1";
    record.status = *status;
    record.resume_status = *resume_status;
    record.data_file = fields[8];
    record.metadata_file = fields[9];
    if (!parse_number(fields[10], record.data_size)) {
        reason = "invalid data size '" + fields[10] + "'";
        return false;
    }
    if (!parse_checksum(fields[11], record.export_checksum) || !parse_checksum(fields[12], record.import_checksum)) {
        reason = "invalid checksum";
        return false;
    }
    record.last_error = fields[13];
    return true;
}

bool status_belongs_to(TableAction action, TableStatus status) noexcept
{
    switch (action) {
    case TableAction::Convert:
        return status == TableStatus::Pending || status == TableStatus::Converting || status == TableStatus::Converted
            || status == TableStatus::Reverting || status == TableStatus::Completed || status == TableStatus::Failed;
    case TableAction::Export:
        return status == TableStatus::Pending || status == TableStatus::Exporting || status == TableStatus::Exported
            || status == TableStatus::Importing || status == TableStatus::Imported || status == TableStatus::Failed;
    case TableAction::Ignore:
    default:
        return status == TableStatus::Skipped;
    }
}

bool is_resume_point(TableAction action, TableStatus status) noexcept
{
    return status == inventory::entry_status(action, Stage::One) || status == inventory::entry_status(action, Stage::Two)
        || status == inventory::success_status(action, Stage::Two);
}

// True once the record has been through stage 1 successfully.
bool passed_stage1(const TableRecord& record) noexcept
{
    if (record.action == TableAction::Ignore) {
        return true;
    }
    const auto effective = record.status == TableStatus::Failed ? record.resume_status : record.status;
    return effective != TableStatus::Pending && effective != inventory::in_flight_status(record.action, Stage::One);
}

bool check_record(const TableRecord& record, std::string& reason)
{
    if (!status_belongs_to(record.action, record.status)) {
        reason = std::string{"status '"} + inventory::to_string(record.status) + "' is not valid for action '"
            + inventory::to_string(record.action) + "'";
        return false;
    }
    if (record.action == TableAction::Ignore) {
        if (record.resume_status != TableStatus::Skipped) {
            reason = "ignored table has a resume status other than skipped";
            return false;
        }
        return true;
    }
    if (!is_resume_point(record.action, record.resume_status)) {
        reason = std::string{"resume status '"} + inventory::to_string(record.resume_status) + "' is not a stable status";
        return false;
    }
    if (record.action != TableAction::Export) {
        return true;
    }

    if (record.data_file.empty()) {
        reason = "export table has no tablespace path";
        return false;
    }
    const auto effective = record.status == TableStatus::Failed ? record.resume_status : record.status;
    const bool exported = effective == TableStatus::Exported || effective == TableStatus::Importing
        || effective == TableStatus::Imported;
    if (exported && !record.export_checksum) {
        reason = "exported table has no export checksum";
        return false;
    }
    if (record.status == TableStatus::Imported
        && (!record.import_checksum || record.import_checksum != record.export_checksum)) {
        reason = "imported table has no matching import checksum";
        return false;
    }
    return true;
}

}  // namespace

std::string escape_field(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (char ch : text) {
        switch (ch) {
        case '\\':
            out.append("\\\\");
            break;
        case '\t':
            out.append("\\t");
            break;
        case '\n':
            out.append("\\n");
            break;
        default:
            out.push_back(ch);
            break;
        }
    }
    return out;
}

bool unescape_field(std::string_view text, std::string& out)
{
    out.clear();
    out.reserve(text.size());
    for (std::size_t index = 0; index < text.size(); ++index) {
        const char ch = text[index];
        if (ch != '\\') {
            out.push_back(ch);
            continue;
        }
        if (index + 1U >= text.size()) {
            return false;
        }
        switch (text[++index]) {
        case '\\':
            out.push_back('\\');
            break;
        case 't':
            out.push_back('\t');
            break;
        case 'n':
            out.push_back('\n');
            break;
        default:
            return false;
        }
    }
    return true;
}

std::string RunStateCodec::encode(const RunState& state)
{
    std::string text;
    text.reserve(256U + state.records.size() * 160U);
    text.append(kMagic);
    text.push_back('\n');

    auto header = [&](std::string_view key, std::string_view value) {
        text.append(key);
        text.push_back('\t');
        text.append(escape_field(value));
        text.push_back('\n');
    };

    header("format_version", std::to_string(kFormatVersion));
    header("profile", state.profile);
    header("stage", std::to_string(static_cast<unsigned>(state.stage)));
    header("phase", to_string(state.phase));
    header("created_at", std::to_string(to_micros(state.created_at)));
    header("updated_at", std::to_string(to_micros(state.updated_at)));
    header("workdir", state.workdir.string());
    header("datadir", state.datadir.string());
    header("strategy", transfer::strategy_name(state.strategy));
    header("server_version", std::to_string(state.server_version));

    for (const auto& record : state.records) {
        text.append(encode_record(record));
    }

    const auto checksum = text_checksum(text);
    text.append(kEndKey);
    text.push_back('\t');
    text.append(std::to_string(state.records.size()));
    text.push_back('\t');
    text.append(hex32(checksum));
    text.push_back('\n');
    return text;
}

std::error_code RunStateCodec::decode(std::string_view text, RunState& out, std::string& detail)
{
    out = RunState{};
    detail.clear();

    auto corrupt = [&](std::string reason) -> std::error_code {
        detail = std::move(reason);
        return ShrinkErrc::CorruptState;
    };

    if (text.size() < 2U || text.back() != '\n') {
        return corrupt("state file is empty or truncated");
    }

    const auto last_break = text.rfind('\n', text.size() - 2U);
    if (last_break == std::string_view::npos) {
        return corrupt("state file has no end marker");
    }
    const auto body = text.substr(0, last_break + 1U);
    const auto trailer = split(text.substr(last_break + 1U, text.size() - last_break - 2U), '\t');
    if (trailer.size() != 3U || trailer[0] != kEndKey) {
        return corrupt("state file has no end marker; it was probably truncated");
    }

    std::size_t expected_records = 0U;
    std::uint32_t expected_checksum = 0U;
    if (!parse_number(trailer[1], expected_records) || !parse_number(trailer[2], expected_checksum, 16)) {
        return corrupt("malformed end marker");
    }
    if (text_checksum(body) != expected_checksum) {
        return corrupt("checksum mismatch");
    }

    auto lines = split(body.substr(0, body.size() - 1U), '\n');
    if (lines.empty() || lines.front() != kMagic) {
        return corrupt("not an ibshrink state file (bad magic)");
    }

    std::set<std::string, std::less<>> seen;
    for (std::size_t line_number = 1; line_number < lines.size(); ++line_number) {
        const auto fields = split(lines[line_number], '\t');
        const auto key = fields.front();
        const auto where = " on line " + std::to_string(line_number + 1U);

        if (key == kTableKey) {
            TableRecord record{};
            std::string reason;
            if (!decode_record(fields, record, reason)) {
                return corrupt("malformed table record" + where + ": " + reason);
            }
            out.records.push_back(std::move(record));
            continue;
        }

        if (std::find(kHeaderKeys.begin(), kHeaderKeys.end(), key) == kHeaderKeys.end()) {
            return corrupt("unknown key '" + std::string{key} + "'" + where);
        }
        if (!out.records.empty()) {
            return corrupt("header key '" + std::string{key} + "' after table records" + where);
        }
        if (fields.size() != 2U) {
            return corrupt("malformed header line" + where);
        }
        if (!seen.emplace(key).second) {
            return corrupt("duplicate key '" + std::string{key} + "'" + where);
        }

        std::string value;
        if (!unescape_field(fields[1], value)) {
            return corrupt("invalid escape sequence" + where);
        }

        if (key == "format_version") {
            std::uint32_t version = 0U;
            if (!parse_number(value, version)) {
                return corrupt("malformed format version" + where);
            }
            if (version != kFormatVersion) {
                return corrupt("unsupported format version " + value);
            }
        } else if (key == "profile") {
            out.profile = std::move(value);
        } else if (key == "stage") {
            if (value == "1") {
                out.stage = Stage::One;
            } else if (value == "2") {
                out.stage = Stage::Two;
            } else {
                return corrupt("invalid stage '" + value + "'");
            }
        } else if (key == "phase") {
            const auto phase = parse_run_phase(value);
            if (!phase) {
                return corrupt("unknown phase '" + value + "'");
            }
            out.phase = *phase;
        } else if (key == "created_at" || key == "updated_at") {
            std::int64_t micros = 0;
            if (!parse_number(value, micros)) {
                return corrupt("malformed timestamp" + where);
            }
            (key == "created_at" ? out.created_at : out.updated_at) = from_micros(micros);
        } else if (key == "workdir") {
            out.workdir = value;
        } else if (key == "datadir") {
            out.datadir = value;
        } else if (key == "strategy") {
            const auto strategy = transfer::parse_strategy(value);
            if (!strategy) {
                return corrupt("unknown transfer strategy '" + value + "'");
            }
            out.strategy = *strategy;
        } else if (key == "server_version") {
            if (!parse_number(value, out.server_version)) {
                return corrupt("malformed server version" + where);
            }
        }
    }

    for (auto key : kHeaderKeys) {
        if (seen.find(key) == seen.end()) {
            return corrupt("missing key '" + std::string{key} + "'");
        }
    }
    if (out.records.size() != expected_records) {
        return corrupt("record count mismatch: end marker says " + std::to_string(expected_records) + ", found "
                       + std::to_string(out.records.size()));
    }

    return validate(out, detail);
}

std::error_code RunStateCodec::validate(const RunState& state, std::string& detail)
{
    auto corrupt = [&](std::string reason) -> std::error_code {
        detail = std::move(reason);
        return ShrinkErrc::CorruptState;
    };

    if (state.profile.empty()) {
        return corrupt("run state has no profile");
    }

    switch (state.phase) {
    case RunPhase::Init:
    case RunPhase::Planned:
    case RunPhase::Stage1Running:
    case RunPhase::Stage1Done:
        if (state.stage != Stage::One) {
            return corrupt(std::string{"phase '"} + to_string(state.phase) + "' recorded for stage 2");
        }
        break;
    case RunPhase::Stage2Running:
    case RunPhase::Stage2Done:
        if (state.stage != Stage::Two) {
            return corrupt(std::string{"phase '"} + to_string(state.phase) + "' recorded for stage 1");
        }
        break;
    case RunPhase::Failed:
    default:
        break;
    }

    std::vector<common::TableId> ids;
    ids.reserve(state.records.size());
    for (const auto& record : state.records) {
        std::string reason;
        if (!check_record(record, reason)) {
            return corrupt("table " + record.id.qualified_name() + ": " + reason);
        }
        ids.push_back(record.id);
    }
    std::sort(ids.begin(), ids.end());
    if (auto duplicate = std::adjacent_find(ids.begin(), ids.end()); duplicate != ids.end()) {
        return corrupt("table " + duplicate->qualified_name() + " is listed twice");
    }

    for (const auto& record : state.records) {
        if (state.phase == RunPhase::Stage1Done && !inventory::is_stage_terminal(record, Stage::One)) {
            return corrupt("phase stage1_done but table " + record.id.qualified_name() + " is "
                           + inventory::to_string(record.status));
        }
        if (state.phase == RunPhase::Stage2Done && !inventory::is_stage_terminal(record, Stage::Two)) {
            return corrupt("phase stage2_done but table " + record.id.qualified_name() + " is "
                           + inventory::to_string(record.status));
        }
        if (state.stage == Stage::Two && !passed_stage1(record)) {
            return corrupt("stage 2 state but table " + record.id.qualified_name() + " never finished stage 1");
        }
    }

    return {};
}

}  // namespace ibshrink::state
