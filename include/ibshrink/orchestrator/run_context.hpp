#pragma once

#include "ibshrink/config/profile.hpp"
#include "ibshrink/db/command_client.hpp"
#include "ibshrink/orchestrator/confirmation.hpp"
#include "ibshrink/orchestrator/orchestrator_telemetry.hpp"
#include "ibshrink/orchestrator/run_log.hpp"
#include "ibshrink/state/run_state_store.hpp"
#include "ibshrink/transfer/file_transfer.hpp"

#include <chrono>
#include <functional>

namespace ibshrink::orchestrator {

using CancelPredicate = std::function<bool()>;
using Clock = std::function<std::chrono::system_clock::time_point()>;

// Everything one invocation touches. The orchestrator owns none of it.
struct RunContext final {
    config::Profile profile{};
    db::CommandClient* client = nullptr;
    const transfer::FileTransferUnit* transfer = nullptr;
    state::RunStateStore* store = nullptr;
    Confirmation* confirmation = nullptr;
    RunLog* log = nullptr;
    OrchestratorTelemetry* telemetry = nullptr;
    CancelPredicate cancel_requested{};
    Clock clock{};
};

}  // namespace ibshrink::orchestrator
