#include "ibshrink/orchestrator/orchestrator_telemetry.hpp"

#include "ibshrink/common/errors.hpp"

namespace ibshrink::orchestrator {

namespace {

inline std::size_t to_index(RunStep step) noexcept
{
    return static_cast<std::size_t>(step);
}

}  // namespace

const char* to_string(RunStep step) noexcept
{
    switch (step) {
    case RunStep::Plan:
        return "plan";
    case RunStep::Revalidate:
        return "revalidate";
    case RunStep::Convert:
        return "convert";
    case RunStep::Export:
        return "export";
    case RunStep::Revert:
        return "revert";
    case RunStep::Import:
        return "import";
    case RunStep::Checkpoint:
        return "checkpoint";
    case RunStep::Count:
    default:
        return "unknown";
    }
}

void OrchestratorTelemetry::record_attempt(RunStep step) noexcept
{
    attempts_[to_index(step)].fetch_add(1U, std::memory_order_relaxed);
}

void OrchestratorTelemetry::record_success(RunStep step, std::uint64_t bytes) noexcept
{
    successes_[to_index(step)].fetch_add(1U, std::memory_order_relaxed);
    bytes_[to_index(step)].fetch_add(bytes, std::memory_order_relaxed);
}

void OrchestratorTelemetry::record_failure(RunStep step, std::error_code error) noexcept
{
    failures_[to_index(step)].fetch_add(1U, std::memory_order_relaxed);

    switch (common::error_class(error)) {
    case common::ErrorClass::StatementExecution:
    case common::ErrorClass::Connection:
        statement_failures_.fetch_add(1U, std::memory_order_relaxed);
        break;
    case common::ErrorClass::Transfer:
        transfer_failures_.fetch_add(1U, std::memory_order_relaxed);
        break;
    case common::ErrorClass::Conflict:
        conflict_failures_.fetch_add(1U, std::memory_order_relaxed);
        break;
    default:
        other_failures_.fetch_add(1U, std::memory_order_relaxed);
        break;
    }
}

void OrchestratorTelemetry::record_duration(RunStep step, std::uint64_t duration_ns) noexcept
{
    total_duration_ns_[to_index(step)].fetch_add(duration_ns, std::memory_order_relaxed);
    last_duration_ns_[to_index(step)].store(duration_ns, std::memory_order_relaxed);
}

OrchestratorTelemetrySnapshot OrchestratorTelemetry::snapshot() const noexcept
{
    OrchestratorTelemetrySnapshot snapshot{};
    for (std::size_t i = 0; i < step_count; ++i) {
        snapshot.steps[i].attempts = attempts_[i].load(std::memory_order_relaxed);
        snapshot.steps[i].successes = successes_[i].load(std::memory_order_relaxed);
        snapshot.steps[i].failures = failures_[i].load(std::memory_order_relaxed);
        snapshot.steps[i].total_duration_ns = total_duration_ns_[i].load(std::memory_order_relaxed);
        snapshot.steps[i].last_duration_ns = last_duration_ns_[i].load(std::memory_order_relaxed);
        snapshot.steps[i].bytes = bytes_[i].load(std::memory_order_relaxed);
    }

    snapshot.failures.statement_failures = statement_failures_.load(std::memory_order_relaxed);
    snapshot.failures.transfer_failures = transfer_failures_.load(std::memory_order_relaxed);
    snapshot.failures.conflict_failures = conflict_failures_.load(std::memory_order_relaxed);
    snapshot.failures.other_failures = other_failures_.load(std::memory_order_relaxed);
    return snapshot;
}

void OrchestratorTelemetry::reset() noexcept
{
    for (std::size_t i = 0; i < step_count; ++i) {
        attempts_[i].store(0U, std::memory_order_relaxed);
        successes_[i].store(0U, std::memory_order_relaxed);
        failures_[i].store(0U, std::memory_order_relaxed);
        total_duration_ns_[i].store(0U, std::memory_order_relaxed);
        last_duration_ns_[i].store(0U, std::memory_order_relaxed);
        bytes_[i].store(0U, std::memory_order_relaxed);
    }

    statement_failures_.store(0U, std::memory_order_relaxed);
    transfer_failures_.store(0U, std::memory_order_relaxed);
    conflict_failures_.store(0U, std::memory_order_relaxed);
    other_failures_.store(0U, std::memory_order_relaxed);
}

}  // namespace ibshrink::orchestrator
