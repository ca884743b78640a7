#include "ibshrink/state/run_state.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace ibshrink::state {

namespace {

constexpr std::array<std::pair<RunPhase, std::string_view>, 7> kPhaseNames{{
    {RunPhase::Init, "init"},
    {RunPhase::Planned, "planned"},
    {RunPhase::Stage1Running, "stage1_running"},
    {RunPhase::Stage1Done, "stage1_done"},
    {RunPhase::Stage2Running, "stage2_running"},
    {RunPhase::Stage2Done, "stage2_done"},
    {RunPhase::Failed, "failed"},
}};

}  // namespace

const char* to_string(RunPhase phase) noexcept
{
    for (const auto& [value, name] : kPhaseNames) {
        if (value == phase) {
            return name.data();
        }
    }
    return "unknown";
}

std::optional<RunPhase> parse_run_phase(std::string_view text) noexcept
{
    for (const auto& [value, name] : kPhaseNames) {
        if (name == text) {
            return value;
        }
    }
    return std::nullopt;
}

inventory::TableRecord* RunState::find(const common::TableId& id) noexcept
{
    auto it = std::find_if(records.begin(), records.end(), [&](const inventory::TableRecord& record) {
        return record.id == id;
    });
    return it == records.end() ? nullptr : &*it;
}

const inventory::TableRecord* RunState::find(const common::TableId& id) const noexcept
{
    auto it = std::find_if(records.begin(), records.end(), [&](const inventory::TableRecord& record) {
        return record.id == id;
    });
    return it == records.end() ? nullptr : &*it;
}

}  // namespace ibshrink::state
