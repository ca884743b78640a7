#include "ibshrink/orchestrator/stage_orchestrator.hpp"

#include "ibshrink/common/checksum.hpp"
#include "ibshrink/common/errors.hpp"
#include "ibshrink/common/posix_file.hpp"
#include "ibshrink/db/statements.hpp"
#include "ibshrink/inventory/inventory_builder.hpp"

#include <fstream>
#include <initializer_list>
#include <stdexcept>
#include <utility>

namespace ibshrink::orchestrator {

namespace {

using common::ShrinkErrc;
using inventory::Stage;
using inventory::TableAction;
using inventory::TableRecord;
using inventory::TableStatus;
using state::RunPhase;

constexpr std::string_view kDefinitionSuffix = ".createtable.sql";
constexpr std::string_view kPartialSuffix = ".partial";

// Issues UNLOCK TABLES on every path out of an export once FLUSH ... FOR EXPORT succeeded.
class ExportLockGuard final {
public:
    explicit ExportLockGuard(db::CommandClient& client) noexcept
        : client_{&client}
    {
    }

    ExportLockGuard(const ExportLockGuard&) = delete;
    ExportLockGuard& operator=(const ExportLockGuard&) = delete;

    ~ExportLockGuard()
    {
        if (client_ != nullptr) {
            (void)client_->unlock_tables();
        }
    }

    [[nodiscard]] std::error_code release()
    {
        auto* client = std::exchange(client_, nullptr);
        if (client == nullptr) {
            return {};
        }
        return client->unlock_tables();
    }

private:
    db::CommandClient* client_ = nullptr;
};

RunStep step_for(TableAction action, Stage stage) noexcept
{
    if (action == TableAction::Convert) {
        return stage == Stage::One ? RunStep::Convert : RunStep::Revert;
    }
    return stage == Stage::One ? RunStep::Export : RunStep::Import;
}

std::string progress_text(const TableRecord& record, Stage stage)
{
    const auto name = record.id.qualified_name();
    switch (step_for(record.action, stage)) {
    case RunStep::Convert:
        return "Converting table " + name + " to MyISAM";
    case RunStep::Revert:
        return "Converting table " + name + " back to InnoDB";
    case RunStep::Export:
        return "Exporting table " + name;
    case RunStep::Import:
    default:
        return "Importing table " + name;
    }
}

std::filesystem::path with_suffix(std::filesystem::path path, std::string_view suffix)
{
    path += suffix;
    return path;
}

std::filesystem::path metadata_path_for(const std::filesystem::path& data_file)
{
    auto path = data_file;
    path.replace_extension(".cfg");
    return path;
}

bool same_directory(const std::filesystem::path& lhs, const std::filesystem::path& rhs)
{
    auto normalize = [](const std::filesystem::path& path) {
        auto normal = path.lexically_normal();
        if (!normal.has_filename() && normal.has_parent_path() && normal != normal.root_path()) {
            normal = normal.parent_path();
        }
        return normal;
    };
    return normalize(lhs) == normalize(rhs);
}

std::error_code remove_stale(std::initializer_list<std::filesystem::path> paths, std::string& detail)
{
    for (const auto& path : paths) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            detail = "unable to remove stale " + path.string() + ": " + ec.message();
            return ShrinkErrc::TransferError;
        }
    }
    return {};
}

std::error_code write_definition(const std::filesystem::path& path, const std::string& ddl, std::string& detail)
{
    std::ofstream stream{path, std::ios::out | std::ios::trunc};
    if (!stream) {
        detail = "unable to create " + path.string();
        return ShrinkErrc::TransferError;
    }
    stream << ddl << ";\n";
    stream.flush();
    if (!stream) {
        detail = "unable to write " + path.string();
        return ShrinkErrc::TransferError;
    }
    return {};
}

std::uint64_t elapsed_ms(std::chrono::steady_clock::time_point start)
{
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count());
}

std::uint64_t elapsed_ns(std::chrono::steady_clock::time_point start)
{
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - start).count());
}

}  // namespace

WorkingCopy working_copy_for(const std::filesystem::path& workdir, const TableRecord& record)
{
    WorkingCopy copy{};
    copy.directory = workdir / record.data_file.parent_path().filename();
    copy.data = copy.directory / record.data_file.filename();
    copy.metadata = metadata_path_for(copy.data);
    copy.definition = copy.directory / (record.data_file.stem().string() + std::string{kDefinitionSuffix});
    return copy;
}

StageOrchestrator::StageOrchestrator(RunContext context)
    : context_{std::move(context)}
{
    if (context_.client == nullptr || context_.transfer == nullptr || context_.store == nullptr
        || context_.confirmation == nullptr || context_.log == nullptr || context_.telemetry == nullptr) {
        throw std::invalid_argument("StageOrchestrator requires a client, transfer unit, store, confirmation, log and telemetry");
    }
}

StageReport StageOrchestrator::run(Stage stage)
{
    return stage == Stage::One ? run_stage1() : run_stage2();
}

std::chrono::system_clock::time_point StageOrchestrator::now() const
{
    return context_.clock ? context_.clock() : std::chrono::system_clock::now();
}

bool StageOrchestrator::cancelled() const
{
    return context_.cancel_requested && context_.cancel_requested();
}

void StageOrchestrator::emit(const state::RunState& state,
                             std::string_view step,
                             const TableRecord* record,
                             std::error_code error,
                             std::string message,
                             std::uint64_t duration_ms,
                             std::uint64_t bytes)
{
    RunEvent event{};
    event.timestamp = now();
    event.profile = context_.profile.name;
    event.stage = static_cast<unsigned>(state.stage);
    event.phase = state::to_string(state.phase);
    if (record != nullptr) {
        event.schema = record->id.schema;
        event.table = record->id.table;
    }
    event.step = std::string{step};
    event.success = !error;
    if (error) {
        event.error = common::error_class_name(common::error_class(error));
    }
    event.message = std::move(message);
    event.duration_ms = duration_ms;
    event.bytes = bytes;
    context_.log->record(event);
}

StageReport& StageOrchestrator::fail(StageReport& report,
                                     const state::RunState& state,
                                     std::error_code error,
                                     std::string message,
                                     std::string_view step,
                                     const TableRecord* record)
{
    report.success = false;
    report.error = error;
    report.message = std::move(message);
    report.step = std::string{step};
    report.phase = state.phase;
    if (record != nullptr) {
        report.table = record->id;
    }
    report.remediation_hints = common::remediation_hints(error);

    if (error == ShrinkErrc::PlanRejected) {
        context_.log->info(report.message);
    } else {
        context_.log->error(report.message);
    }
    emit(state, step, record, error, report.message);
    return report;
}

std::error_code StageOrchestrator::open_run(Stage stage, state::RunState& state, bool& found, std::string& detail)
{
    found = false;
    if (auto ec = context_.store->acquire_lock(detail); ec) {
        return ec;
    }

    if (auto ec = context_.store->exists(found); ec) {
        detail = "unable to inspect " + context_.store->state_path().string() + ": " + ec.message();
        return ShrinkErrc::CorruptState;
    }
    if (!found) {
        if (stage == Stage::Two) {
            detail = "no run state in " + context_.store->workdir().string() + "; run stage 1 first";
            return ShrinkErrc::MissingState;
        }
        return {};
    }

    if (auto ec = context_.store->load(state, detail); ec) {
        return ec;
    }
    if (state.profile != context_.profile.name) {
        detail = "run state in " + context_.store->workdir().string() + " belongs to profile '" + state.profile
            + "', not '" + context_.profile.name + "'";
        return ShrinkErrc::ConflictError;
    }
    return {};
}

std::error_code StageOrchestrator::revalidate(const state::RunState& state, std::string& detail)
{
    inventory::InventoryBuilder builder{*context_.client};
    std::vector<common::TableId> live;
    inventory::InventoryFailure failure{};
    if (auto ec = builder.list_identities(live, failure); ec) {
        detail = "unable to list live tables: " + failure.detail;
        return ec;
    }

    const auto diff = inventory::compare_identities(state.records, std::move(live));
    if (!diff.empty()) {
        detail = "tables changed since the run was planned (" + diff.describe() + ")";
        return ShrinkErrc::ConflictError;
    }
    return {};
}

std::error_code StageOrchestrator::check_transfer_device(const std::filesystem::path& datadir, std::string& detail) const
{
    if (context_.transfer->strategy() != transfer::TransferStrategy::Hardlink) {
        return {};
    }
    bool same = false;
    if (auto ec = transfer::FileTransferUnit::same_device(datadir, context_.store->workdir(), same); ec) {
        detail = "unable to compare devices of " + datadir.string() + " and " + context_.store->workdir().string() + ": "
            + ec.message();
        return ShrinkErrc::TransferError;
    }
    if (!same) {
        detail = "use_hardlink requires " + context_.store->workdir().string() + " to be on the same filesystem as "
            + datadir.string();
        return ShrinkErrc::CrossDevice;
    }
    return {};
}

std::error_code StageOrchestrator::checkpoint(state::RunState& state, std::string& detail)
{
    state.updated_at = now();
    context_.telemetry->record_attempt(RunStep::Checkpoint);
    const auto start = std::chrono::steady_clock::now();
    const auto ec = context_.store->save(state, detail);
    context_.telemetry->record_duration(RunStep::Checkpoint, elapsed_ns(start));
    if (ec) {
        context_.telemetry->record_failure(RunStep::Checkpoint, ec);
        detail = "unable to persist run state: " + detail;
        return ec;
    }
    context_.telemetry->record_success(RunStep::Checkpoint);
    emit(state, to_string(RunStep::Checkpoint), nullptr, {}, std::string{"phase "} + state::to_string(state.phase));
    return {};
}

StageReport StageOrchestrator::run_stage1()
{
    StageReport report{};
    report.stage = Stage::One;

    state::RunState state{};
    state.profile = context_.profile.name;
    state.stage = Stage::One;
    state.phase = RunPhase::Init;

    std::string detail;
    bool found = false;
    if (auto ec = open_run(Stage::One, state, found, detail); ec) {
        return fail(report, state, ec, detail, "open");
    }

    bool resuming = false;
    if (found) {
        const bool stage1_unfinished = state.phase == RunPhase::Stage1Running
            || (state.phase == RunPhase::Failed && state.stage == Stage::One);
        if (!stage1_unfinished) {
            const auto reason = state.phase == RunPhase::Stage2Done
                ? std::string{"the previous run is complete; clear the workdir before starting a new one"}
                : std::string{"stage 1 already completed (phase "} + state::to_string(state.phase) + "); run stage 2";
            return fail(report, state, ShrinkErrc::ConflictError, reason, "open");
        }
        resuming = true;
        context_.log->info("Resuming unfinished stage 1 run from " + context_.store->state_path().string());
    }

    db::ServerSettings server{};
    if (auto ec = context_.client->read_server_settings(server); ec) {
        return fail(report, state, ec, "unable to read server settings: " + context_.client->last_failure().describe(), "preflight");
    }

    if (!resuming) {
        if (auto ec = context_.store->check_workdir_empty(detail); ec) {
            return fail(report, state, ec, detail, "preflight");
        }
        if (!server.file_per_table) {
            return fail(report,
                        state,
                        ShrinkErrc::UnsupportedLimitation,
                        "innodb_file_per_table is disabled; tables cannot be exported as individual tablespaces",
                        "preflight");
        }
        if (auto ec = check_transfer_device(server.datadir, detail); ec) {
            return fail(report, state, ec, detail, "preflight");
        }

        context_.telemetry->record_attempt(RunStep::Plan);
        const auto start = std::chrono::steady_clock::now();
        inventory::InventoryBuilder builder{*context_.client};
        inventory::Plan plan{};
        inventory::InventoryFailure failure{};
        const auto plan_ec = builder.build_plan(server, plan, failure);
        context_.telemetry->record_duration(RunStep::Plan, elapsed_ns(start));
        if (plan_ec) {
            context_.telemetry->record_failure(RunStep::Plan, plan_ec);
            TableRecord offender{};
            offender.id = failure.table;
            return fail(report, state, plan_ec, failure.detail, to_string(RunStep::Plan),
                        failure.table.schema.empty() ? nullptr : &offender);
        }
        context_.telemetry->record_success(RunStep::Plan);

        const auto created = now();
        state.phase = RunPhase::Planned;
        state.created_at = created;
        state.updated_at = created;
        state.workdir = context_.store->workdir();
        state.datadir = server.datadir;
        state.strategy = context_.transfer->strategy();
        state.server_version = server.server_version;
        state.records = std::move(plan.records);
        emit(state, to_string(RunStep::Plan), nullptr, {},
             std::to_string(plan.count(TableAction::Convert)) + " to convert, "
                 + std::to_string(plan.count(TableAction::Export)) + " to export, "
                 + std::to_string(plan.count(TableAction::Ignore)) + " ignored",
             elapsed_ms(start));
    } else {
        if (!same_directory(state.datadir, server.datadir)) {
            return fail(report, state, ShrinkErrc::ConflictError,
                        "server data directory changed from " + state.datadir.string() + " to " + server.datadir.string(),
                        to_string(RunStep::Revalidate));
        }
        context_.telemetry->record_attempt(RunStep::Revalidate);
        if (auto ec = revalidate(state, detail); ec) {
            context_.telemetry->record_failure(RunStep::Revalidate, ec);
            return fail(report, state, ec, detail, to_string(RunStep::Revalidate));
        }
        context_.telemetry->record_success(RunStep::Revalidate);
    }

    for (const auto& record : state.records) {
        if (record.action == TableAction::Ignore) {
            ++report.tables_skipped;
        } else {
            ++report.tables_total;
        }
    }

    if (!context_.confirmation->confirm(inventory::render_plan(state.records, Stage::One))) {
        return fail(report, state, ShrinkErrc::PlanRejected, "plan declined; nothing was changed", "confirm");
    }

    state.stage = Stage::One;
    state.phase = RunPhase::Stage1Running;
    if (auto ec = checkpoint(state, detail); ec) {
        return fail(report, state, ec, detail, to_string(RunStep::Checkpoint));
    }

    if (auto ec = context_.client->prepare_session(); ec) {
        return fail(report, state, ec, "unable to prepare session: " + context_.client->last_failure().describe(), "session");
    }

    if (!execute_records(state, Stage::One, report)) {
        return report;
    }

    state.phase = RunPhase::Stage1Done;
    if (auto ec = checkpoint(state, detail); ec) {
        return fail(report, state, ec, detail, to_string(RunStep::Checkpoint));
    }

    report.success = true;
    report.phase = state.phase;
    report.message = "stage 1 complete";
    context_.log->info("Stage 1 is complete. Next steps:");
    context_.log->info("  1. Stop the MySQL server.");
    context_.log->info("  2. Delete ibdata1 and the ib_logfile* files from " + state.datadir.string() + ".");
    context_.log->info("  3. Start the MySQL server so it creates a fresh ibdata1.");
    context_.log->info("  4. Run stage 2 with the same configuration file and profile.");
    context_.log->info("Do not modify or remove " + context_.store->workdir().string() + " until stage 2 has completed.");
    return report;
}

StageReport StageOrchestrator::run_stage2()
{
    StageReport report{};
    report.stage = Stage::Two;

    state::RunState state{};
    state.profile = context_.profile.name;
    state.stage = Stage::Two;
    state.phase = RunPhase::Init;

    std::string detail;
    bool found = false;
    if (auto ec = open_run(Stage::Two, state, found, detail); ec) {
        return fail(report, state, ec, detail, "open");
    }

    for (const auto& record : state.records) {
        if (record.action == TableAction::Ignore) {
            ++report.tables_skipped;
        } else {
            ++report.tables_total;
        }
    }

    if (state.phase == RunPhase::Stage2Done) {
        report.success = true;
        report.nothing_to_do = true;
        report.phase = state.phase;
        report.message = "stage 2 already completed; nothing to do";
        context_.log->info(report.message);
        return report;
    }

    const bool ready = state.phase == RunPhase::Stage1Done || state.phase == RunPhase::Stage2Running
        || (state.phase == RunPhase::Failed && state.stage == Stage::Two);
    if (!ready) {
        return fail(report, state, ShrinkErrc::MissingState,
                    std::string{"stage 1 has not completed (phase "} + state::to_string(state.phase) + ", stage "
                        + std::to_string(static_cast<unsigned>(state.stage)) + "); finish stage 1 first",
                    "open");
    }

    db::ServerSettings server{};
    if (auto ec = context_.client->read_server_settings(server); ec) {
        return fail(report, state, ec, "unable to read server settings: " + context_.client->last_failure().describe(), "preflight");
    }
    if (!same_directory(state.datadir, server.datadir)) {
        return fail(report, state, ShrinkErrc::ConflictError,
                    "server data directory changed from " + state.datadir.string() + " to " + server.datadir.string(),
                    to_string(RunStep::Revalidate));
    }

    context_.telemetry->record_attempt(RunStep::Revalidate);
    if (auto ec = revalidate(state, detail); ec) {
        context_.telemetry->record_failure(RunStep::Revalidate, ec);
        return fail(report, state, ec, detail, to_string(RunStep::Revalidate));
    }
    context_.telemetry->record_success(RunStep::Revalidate);

    if (context_.transfer->strategy() != state.strategy) {
        context_.log->warning(std::string{"working copies were exported with "} + transfer::strategy_name(state.strategy)
                              + "; restoring them with " + transfer::strategy_name(context_.transfer->strategy()));
    }
    if (auto ec = check_transfer_device(server.datadir, detail); ec) {
        return fail(report, state, ec, detail, "preflight");
    }

    context_.log->info(inventory::render_plan(state.records, Stage::Two));

    state.stage = Stage::Two;
    state.phase = RunPhase::Stage2Running;
    if (auto ec = checkpoint(state, detail); ec) {
        return fail(report, state, ec, detail, to_string(RunStep::Checkpoint));
    }

    if (auto ec = context_.client->prepare_session(); ec) {
        return fail(report, state, ec, "unable to prepare session: " + context_.client->last_failure().describe(), "session");
    }

    if (!execute_records(state, Stage::Two, report)) {
        return report;
    }

    state.phase = RunPhase::Stage2Done;
    if (auto ec = checkpoint(state, detail); ec) {
        return fail(report, state, ec, detail, to_string(RunStep::Checkpoint));
    }

    report.success = true;
    report.phase = state.phase;
    report.message = "stage 2 complete";
    context_.log->info("Stage 2 is complete; every table has been restored.");
    context_.log->info("The working directory " + context_.store->workdir().string() + " may now be removed.");
    return report;
}

bool StageOrchestrator::execute_records(state::RunState& state, Stage stage, StageReport& report)
{
    std::string detail;
    for (auto& record : state.records) {
        if (record.action == TableAction::Ignore || inventory::is_stage_terminal(record, stage)) {
            continue;
        }

        if (cancelled()) {
            fail(report, state, ShrinkErrc::Cancelled,
                 "cancelled before " + record.id.qualified_name() + "; re-run stage "
                     + std::to_string(static_cast<unsigned>(stage)) + " to resume",
                 "cancel", &record);
            return false;
        }

        const auto step = step_for(record.action, stage);
        const auto in_flight = inventory::in_flight_status(record.action, stage);
        if (!inventory::is_stage_resumable(record, stage)
            || !inventory::is_legal_transition(record.action, stage, record.status, in_flight)) {
            fail(report, state, ShrinkErrc::CorruptState,
                 std::string{"cannot "} + to_string(step) + " " + record.id.qualified_name() + " from status "
                     + inventory::to_string(record.status),
                 to_string(step), &record);
            return false;
        }

        if (record.status != TableStatus::Failed && record.status != in_flight) {
            record.resume_status = record.status;
        }
        record.status = in_flight;
        if (auto ec = checkpoint(state, detail); ec) {
            fail(report, state, ec, detail, to_string(RunStep::Checkpoint), &record);
            return false;
        }

        context_.log->begin_progress(progress_text(record, stage));
        context_.telemetry->record_attempt(step);
        const auto start = std::chrono::steady_clock::now();
        StepOutcome outcome{};
        const auto step_ec = run_step(record, stage, outcome);
        const auto duration_ns = elapsed_ns(start);
        context_.telemetry->record_duration(step, duration_ns);
        const auto duration_ms = duration_ns / 1'000'000U;

        if (step_ec) {
            context_.log->end_progress(false);
            context_.telemetry->record_failure(step, step_ec);
            record.status = TableStatus::Failed;
            record.last_error = outcome.detail;
            state.phase = RunPhase::Failed;
            state.stage = stage;

            auto message = "table " + record.id.qualified_name() + ": " + to_string(step) + " failed: " + outcome.detail;
            if (auto ec = checkpoint(state, detail); ec) {
                message += "; " + detail;
            }
            fail(report, state, step_ec, std::move(message), to_string(step), &record);
            return false;
        }

        record.status = inventory::success_status(record.action, stage);
        record.last_error.clear();
        context_.log->end_progress(true);
        if (!outcome.note.empty()) {
            context_.log->warning(record.id.qualified_name() + ": " + outcome.note);
        }
        context_.telemetry->record_success(step, outcome.bytes);
        report.bytes_transferred += outcome.bytes;
        ++report.tables_processed;
        emit(state, to_string(step), &record, {}, outcome.note.empty() ? std::string{"ok"} : outcome.note, duration_ms,
             outcome.bytes);

        if (auto ec = checkpoint(state, detail); ec) {
            fail(report, state, ec, detail, to_string(RunStep::Checkpoint), &record);
            return false;
        }
    }
    return true;
}

std::error_code StageOrchestrator::run_step(TableRecord& record, Stage stage, StepOutcome& outcome)
{
    if (record.action == TableAction::Convert) {
        return convert_table(record, stage, outcome);
    }
    return stage == Stage::One ? export_table(record, outcome) : import_table(record, outcome);
}

std::error_code StageOrchestrator::statement_error(std::error_code error, StepOutcome& outcome) const
{
    outcome.detail = context_.client->last_failure().describe();
    return error;
}

std::error_code StageOrchestrator::convert_table(const TableRecord& record, Stage stage, StepOutcome& outcome)
{
    const auto engine = stage == Stage::One ? db::kEngineMyIsam : db::kEngineInnoDb;
    if (auto ec = context_.client->execute_engine_conversion(record.id, engine); ec) {
        return statement_error(ec, outcome);
    }
    return {};
}

std::error_code StageOrchestrator::export_table(TableRecord& record, StepOutcome& outcome)
{
    const auto copy = working_copy_for(context_.store->workdir(), record);

    std::error_code ec;
    std::filesystem::create_directories(copy.directory, ec);
    if (ec) {
        outcome.detail = "unable to create " + copy.directory.string() + ": " + ec.message();
        return ShrinkErrc::TransferError;
    }
    if (auto stale_ec = remove_stale({copy.data,
                                      copy.metadata,
                                      with_suffix(copy.data, kPartialSuffix),
                                      with_suffix(copy.metadata, kPartialSuffix),
                                      copy.definition},
                                     outcome.detail);
        stale_ec) {
        return stale_ec;
    }

    std::string ddl;
    if (auto show_ec = context_.client->show_create_table(record.id, ddl); show_ec) {
        return statement_error(show_ec, outcome);
    }
    if (auto write_ec = write_definition(copy.definition, ddl, outcome.detail); write_ec) {
        return write_ec;
    }

    if (auto flush_ec = context_.client->flush_for_export(record.id); flush_ec) {
        return statement_error(flush_ec, outcome);
    }

    ExportLockGuard lock{*context_.client};

    transfer::TablespaceFileSet files{};
    files.data.source = record.data_file;
    files.data.destination = copy.data;
    const auto metadata_source = metadata_path_for(record.data_file);
    if (common::path_exists(metadata_source)) {
        files.metadata = transfer::TablespaceFile{metadata_source, copy.metadata, 0U, 0U};
    }

    transfer::TransferFailure failure{};
    const auto transfer_ec = context_.transfer->transfer(files, failure);
    const auto unlock_ec = lock.release();
    if (transfer_ec) {
        outcome.detail = failure.describe();
        if (unlock_ec) {
            outcome.detail += "; UNLOCK TABLES also failed: " + context_.client->last_failure().describe();
        }
        return transfer_ec;
    }
    if (unlock_ec) {
        return statement_error(unlock_ec, outcome);
    }

    record.data_size = files.data.size;
    record.export_checksum = files.data.checksum;
    record.import_checksum.reset();
    record.metadata_file = files.metadata ? metadata_source : std::filesystem::path{};
    outcome.bytes = files.total_bytes();
    return {};
}

std::error_code StageOrchestrator::import_table(TableRecord& record, StepOutcome& outcome)
{
    const auto copy = working_copy_for(context_.store->workdir(), record);

    db::DiscardOutcome discarded = db::DiscardOutcome::Discarded;
    if (auto ec = context_.client->discard_tablespace(record.id, discarded); ec) {
        return statement_error(ec, outcome);
    }
    if (discarded == db::DiscardOutcome::AlreadyAbsent) {
        outcome.note = "tablespace was already absent before import";
    }

    common::FileDigest digest{};
    if (auto ec = common::digest_file(copy.data, digest); ec) {
        outcome.detail = "working copy " + copy.data.string() + " is unreadable: " + ec.message();
        return ShrinkErrc::TransferError;
    }
    if (!record.export_checksum || digest.size != record.data_size || digest.checksum != *record.export_checksum) {
        outcome.detail = "working copy " + copy.data.string() + " no longer matches its export (size "
            + std::to_string(digest.size) + " vs " + std::to_string(record.data_size) + ")";
        return ShrinkErrc::ChecksumMismatch;
    }

    const auto metadata_target = metadata_path_for(record.data_file);
    if (auto ec = remove_stale({record.data_file,
                                metadata_target,
                                with_suffix(record.data_file, kPartialSuffix),
                                with_suffix(metadata_target, kPartialSuffix)},
                               outcome.detail);
        ec) {
        return ec;
    }

    transfer::TablespaceFileSet files{};
    files.data.source = copy.data;
    files.data.destination = record.data_file;
    if (common::path_exists(copy.metadata)) {
        files.metadata = transfer::TablespaceFile{copy.metadata, metadata_target, 0U, 0U};
    }

    transfer::TransferFailure failure{};
    if (auto ec = context_.transfer->transfer(files, failure); ec) {
        outcome.detail = failure.describe();
        return ec;
    }
    if (files.data.checksum != *record.export_checksum) {
        outcome.detail = "restored " + record.data_file.string() + " does not match its export checksum";
        return ShrinkErrc::ChecksumMismatch;
    }

    if (auto ec = context_.client->import_tablespace(record.id); ec) {
        return statement_error(ec, outcome);
    }

    record.import_checksum = files.data.checksum;
    outcome.bytes = files.total_bytes();
    return {};
}

}  // namespace ibshrink::orchestrator
