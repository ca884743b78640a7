#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace ibshrink::orchestrator {

// One line of the JSON-lines run log.
struct RunEvent final {
    std::chrono::system_clock::time_point timestamp{};
    std::string profile{};
    unsigned stage = 0U;
    std::string phase{};
    std::string schema{};
    std::string table{};
    std::string step{};
    bool success = true;
    std::string error{};
    std::string message{};
    std::uint64_t duration_ms = 0U;
    std::uint64_t bytes = 0U;
};

}  // namespace ibshrink::orchestrator
