#pragma once

#include "ibshrink/common/table_id.hpp"
#include "ibshrink/inventory/table_record.hpp"
#include "ibshrink/transfer/file_transfer.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ibshrink::state {

enum class RunPhase : std::uint8_t {
    Init = 0,
    Planned,
    Stage1Running,
    Stage1Done,
    Stage2Running,
    Stage2Done,
    Failed
};

[[nodiscard]] const char* to_string(RunPhase phase) noexcept;
[[nodiscard]] std::optional<RunPhase> parse_run_phase(std::string_view text) noexcept;

struct RunState final {
    std::string profile{};
    inventory::Stage stage = inventory::Stage::One;
    RunPhase phase = RunPhase::Init;
    std::chrono::system_clock::time_point created_at{};
    std::chrono::system_clock::time_point updated_at{};
    std::filesystem::path workdir{};
    std::filesystem::path datadir{};
    transfer::TransferStrategy strategy = transfer::TransferStrategy::Copy;
    std::uint32_t server_version = 0U;
    std::vector<inventory::TableRecord> records{};

    [[nodiscard]] inventory::TableRecord* find(const common::TableId& id) noexcept;
    [[nodiscard]] const inventory::TableRecord* find(const common::TableId& id) const noexcept;
};

}  // namespace ibshrink::state
