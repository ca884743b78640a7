#pragma once

#include "ibshrink/common/table_id.hpp"
#include "ibshrink/inventory/table_record.hpp"
#include "ibshrink/orchestrator/run_context.hpp"
#include "ibshrink/state/run_state.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace ibshrink::orchestrator {

struct StageReport final {
    inventory::Stage stage = inventory::Stage::One;
    bool success = false;
    bool nothing_to_do = false;
    std::error_code error{};
    std::string message{};
    std::optional<common::TableId> table{};
    std::string step{};
    state::RunPhase phase = state::RunPhase::Init;
    std::vector<std::string> remediation_hints{};
    std::size_t tables_total = 0U;
    std::size_t tables_processed = 0U;
    std::size_t tables_skipped = 0U;
    std::uint64_t bytes_transferred = 0U;
};

// Where a table's tablespace lives between the stages.
struct WorkingCopy final {
    std::filesystem::path directory{};
    std::filesystem::path data{};
    std::filesystem::path metadata{};
    std::filesystem::path definition{};
};

[[nodiscard]] WorkingCopy working_copy_for(const std::filesystem::path& workdir, const inventory::TableRecord& record);

class StageOrchestrator final {
public:
    // Throws std::invalid_argument when a required collaborator is missing.
    explicit StageOrchestrator(RunContext context);

    [[nodiscard]] StageReport run(inventory::Stage stage);
    [[nodiscard]] StageReport run_stage1();
    [[nodiscard]] StageReport run_stage2();

private:
    struct StepOutcome final {
        std::string detail{};
        std::string note{};
        std::uint64_t bytes = 0U;
    };

    [[nodiscard]] std::chrono::system_clock::time_point now() const;
    [[nodiscard]] bool cancelled() const;

    [[nodiscard]] std::error_code open_run(inventory::Stage stage,
                                           state::RunState& state,
                                           bool& found,
                                           std::string& detail);
    [[nodiscard]] std::error_code revalidate(const state::RunState& state, std::string& detail);
    // With hard links the data directory and the workdir must share a filesystem.
    [[nodiscard]] std::error_code check_transfer_device(const std::filesystem::path& datadir, std::string& detail) const;
    [[nodiscard]] std::error_code checkpoint(state::RunState& state, std::string& detail);
    [[nodiscard]] bool execute_records(state::RunState& state, inventory::Stage stage, StageReport& report);

    [[nodiscard]] std::error_code run_step(inventory::TableRecord& record, inventory::Stage stage, StepOutcome& outcome);
    [[nodiscard]] std::error_code convert_table(const inventory::TableRecord& record,
                                                inventory::Stage stage,
                                                StepOutcome& outcome);
    [[nodiscard]] std::error_code export_table(inventory::TableRecord& record, StepOutcome& outcome);
    [[nodiscard]] std::error_code import_table(inventory::TableRecord& record, StepOutcome& outcome);
    [[nodiscard]] std::error_code statement_error(std::error_code error, StepOutcome& outcome) const;

    void emit(const state::RunState& state,
              std::string_view step,
              const inventory::TableRecord* record,
              std::error_code error,
              std::string message,
              std::uint64_t duration_ms = 0U,
              std::uint64_t bytes = 0U);

    StageReport& fail(StageReport& report,
                      const state::RunState& state,
                      std::error_code error,
                      std::string message,
                      std::string_view step,
                      const inventory::TableRecord* record = nullptr);

    RunContext context_{};
};

}  // namespace ibshrink::orchestrator
