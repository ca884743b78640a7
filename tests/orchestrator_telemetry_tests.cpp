#include "ibshrink/common/errors.hpp"
#include "ibshrink/orchestrator/orchestrator_telemetry.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using ibshrink::common::ShrinkErrc;
using ibshrink::orchestrator::OrchestratorTelemetry;
using ibshrink::orchestrator::RunStep;

TEST_CASE("OrchestratorTelemetry accumulates per-step counters")
{
    OrchestratorTelemetry telemetry;
    telemetry.record_attempt(RunStep::Export);
    telemetry.record_duration(RunStep::Export, 1'000U);
    telemetry.record_success(RunStep::Export, 4096U);
    telemetry.record_attempt(RunStep::Export);
    telemetry.record_duration(RunStep::Export, 500U);
    telemetry.record_failure(RunStep::Export, ShrinkErrc::TransferError);

    const auto snapshot = telemetry.snapshot();
    const auto& exports = snapshot.step(RunStep::Export);
    CHECK(exports.attempts == 2U);
    CHECK(exports.successes == 1U);
    CHECK(exports.failures == 1U);
    CHECK(exports.total_duration_ns == 1'500U);
    CHECK(exports.last_duration_ns == 500U);
    CHECK(exports.bytes == 4096U);
    CHECK(snapshot.step(RunStep::Import).attempts == 0U);
}

TEST_CASE("OrchestratorTelemetry classifies failures")
{
    OrchestratorTelemetry telemetry;
    telemetry.record_failure(RunStep::Convert, ShrinkErrc::StatementExecution);
    telemetry.record_failure(RunStep::Import, ShrinkErrc::ChecksumMismatch);
    telemetry.record_failure(RunStep::Revalidate, ShrinkErrc::ConflictError);
    telemetry.record_failure(RunStep::Checkpoint, std::make_error_code(std::errc::no_space_on_device));

    auto snapshot = telemetry.snapshot();
    CHECK(snapshot.failures.statement_failures == 1U);
    CHECK(snapshot.failures.transfer_failures == 1U);
    CHECK(snapshot.failures.conflict_failures == 1U);
    CHECK(snapshot.failures.other_failures == 1U);

    telemetry.reset();
    snapshot = telemetry.snapshot();
    CHECK(snapshot.failures.statement_failures == 0U);
    CHECK(snapshot.step(RunStep::Convert).failures == 0U);
}

TEST_CASE("RunStep names match the run log vocabulary")
{
    CHECK(std::string{ibshrink::orchestrator::to_string(RunStep::Revert)} == "revert");
    CHECK(std::string{ibshrink::orchestrator::to_string(RunStep::Checkpoint)} == "checkpoint");
}
