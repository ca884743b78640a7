#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <system_error>

namespace ibshrink::orchestrator {

enum class RunStep : std::uint8_t {
    Plan = 0,
    Revalidate,
    Convert,
    Export,
    Revert,
    Import,
    Checkpoint,
    Count
};

[[nodiscard]] const char* to_string(RunStep step) noexcept;

struct StepTelemetrySnapshot final {
    std::uint64_t attempts = 0U;
    std::uint64_t successes = 0U;
    std::uint64_t failures = 0U;
    std::uint64_t total_duration_ns = 0U;
    std::uint64_t last_duration_ns = 0U;
    std::uint64_t bytes = 0U;
};

struct FailureTelemetrySnapshot final {
    std::uint64_t statement_failures = 0U;
    std::uint64_t transfer_failures = 0U;
    std::uint64_t conflict_failures = 0U;
    std::uint64_t other_failures = 0U;
};

struct OrchestratorTelemetrySnapshot final {
    std::array<StepTelemetrySnapshot, static_cast<std::size_t>(RunStep::Count)> steps{};
    FailureTelemetrySnapshot failures{};

    [[nodiscard]] const StepTelemetrySnapshot& step(RunStep value) const noexcept
    {
        return steps[static_cast<std::size_t>(value)];
    }
};

class OrchestratorTelemetry final {
public:
    void record_attempt(RunStep step) noexcept;
    void record_success(RunStep step, std::uint64_t bytes = 0U) noexcept;
    void record_failure(RunStep step, std::error_code error) noexcept;
    void record_duration(RunStep step, std::uint64_t duration_ns) noexcept;

    [[nodiscard]] OrchestratorTelemetrySnapshot snapshot() const noexcept;
    void reset() noexcept;

private:
    static constexpr std::size_t step_count = static_cast<std::size_t>(RunStep::Count);

    std::array<std::atomic<std::uint64_t>, step_count> attempts_{};
    std::array<std::atomic<std::uint64_t>, step_count> successes_{};
    std::array<std::atomic<std::uint64_t>, step_count> failures_{};
    std::array<std::atomic<std::uint64_t>, step_count> total_duration_ns_{};
    std::array<std::atomic<std::uint64_t>, step_count> last_duration_ns_{};
    std::array<std::atomic<std::uint64_t>, step_count> bytes_{};

    std::atomic<std::uint64_t> statement_failures_{0U};
    std::atomic<std::uint64_t> transfer_failures_{0U};
    std::atomic<std::uint64_t> conflict_failures_{0U};
    std::atomic<std::uint64_t> other_failures_{0U};
};

}  // namespace ibshrink::orchestrator
