#pragma once

#include "ibshrink/orchestrator/run_event.hpp"

#include <chrono>
#include <string>

namespace ibshrink::tools {

[[nodiscard]] std::string format_run_event_json(const ibshrink::orchestrator::RunEvent& event);
[[nodiscard]] std::string format_timestamp_iso(std::chrono::system_clock::time_point tp);

}  // namespace ibshrink::tools
