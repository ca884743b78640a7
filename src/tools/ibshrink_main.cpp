#include "ibshrink/common/errors.hpp"
#include "ibshrink/config/profile.hpp"
#include "ibshrink/db/mysql_command_client.hpp"
#include "ibshrink/orchestrator/confirmation.hpp"
#include "ibshrink/orchestrator/orchestrator_telemetry.hpp"
#include "ibshrink/orchestrator/run_context.hpp"
#include "ibshrink/orchestrator/run_log.hpp"
#include "ibshrink/orchestrator/stage_orchestrator.hpp"
#include "ibshrink/state/run_state_store.hpp"
#include "ibshrink/transfer/file_transfer.hpp"

#include <CLI/CLI.hpp>

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include <termios.h>
#include <unistd.h>

namespace {

using ibshrink::orchestrator::OrchestratorTelemetrySnapshot;
using ibshrink::orchestrator::RunStep;
using ibshrink::orchestrator::StageReport;

std::atomic<bool> g_cancel_requested{false};

extern "C" void handle_termination_signal(int)
{
    g_cancel_requested.store(true, std::memory_order_relaxed);
}

void install_signal_handlers()
{
    struct sigaction action{};
    action.sa_handler = handle_termination_signal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    if (::sigaction(SIGINT, &action, nullptr) != 0 || ::sigaction(SIGTERM, &action, nullptr) != 0) {
        throw std::runtime_error("failed to install SIGINT/SIGTERM handlers");
    }
}

class EchoGuard final {
public:
    EchoGuard()
    {
        if (::isatty(STDIN_FILENO) == 0 || ::tcgetattr(STDIN_FILENO, &saved_) != 0) {
            return;
        }
        termios silent = saved_;
        silent.c_lflag &= static_cast<tcflag_t>(~ECHO);
        active_ = ::tcsetattr(STDIN_FILENO, TCSAFLUSH, &silent) == 0;
    }

    EchoGuard(const EchoGuard&) = delete;
    EchoGuard& operator=(const EchoGuard&) = delete;

    ~EchoGuard()
    {
        if (active_) {
            (void)::tcsetattr(STDIN_FILENO, TCSAFLUSH, &saved_);
        }
    }

private:
    termios saved_{};
    bool active_ = false;
};

std::string prompt_password(const std::string& user)
{
    std::cout << "Password for " << (user.empty() ? std::string{"database user"} : user) << ": " << std::flush;
    std::string password;
    {
        EchoGuard guard;
        if (!std::getline(std::cin, password)) {
            throw std::runtime_error("no password entered");
        }
    }
    std::cout << '\n';
    return password;
}

bool use_color(bool disabled)
{
    if (disabled || std::getenv("NO_COLOR") != nullptr) {
        return false;
    }
    return ::isatty(STDOUT_FILENO) != 0;
}

std::string format_duration_ns(std::uint64_t ns)
{
    if (ns == 0U) {
        return "0 ms";
    }
    constexpr double kNsPerMs = 1'000'000.0;
    const double ms = static_cast<double>(ns) / kNsPerMs;
    std::ostringstream stream;
    const int precision = ms < 1.0 ? 3 : (ms < 10.0 ? 2 : 1);
    stream << std::fixed << std::setprecision(precision) << ms << " ms";
    return stream.str();
}

std::string format_bytes(std::uint64_t bytes)
{
    if (bytes == 0U) {
        return "0 B";
    }
    constexpr double kScale = 1024.0;
    const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    constexpr std::size_t kUnitCount = sizeof(units) / sizeof(units[0]);
    double value = static_cast<double>(bytes);
    std::size_t index = 0U;
    while (value >= kScale && index < kUnitCount - 1U) {
        value /= kScale;
        ++index;
    }
    std::ostringstream stream;
    const int precision = value < 10.0 ? 2 : 1;
    stream << std::fixed << std::setprecision(index == 0U ? 0 : precision) << value << ' ' << units[index];
    return stream.str();
}

void print_summary(const StageReport& report, const OrchestratorTelemetrySnapshot& telemetry, std::ostream& out)
{
    out << "Stage " << static_cast<unsigned>(report.stage) << " summary:" << '\n';
    out << "  tables processed      : " << report.tables_processed << " of " << report.tables_total << '\n';
    out << "  tables left untouched : " << report.tables_skipped << '\n';
    out << "  bytes transferred     : " << format_bytes(report.bytes_transferred) << '\n';

    for (auto step : {RunStep::Convert, RunStep::Export, RunStep::Revert, RunStep::Import}) {
        const auto& counters = telemetry.step(step);
        if (counters.attempts == 0U) {
            continue;
        }
        out << "  " << std::left << std::setw(22) << ibshrink::orchestrator::to_string(step) << ": "
            << counters.successes << " ok, " << counters.failures << " failed, "
            << format_duration_ns(counters.total_duration_ns) << '\n';
    }
    const auto& checkpoints = telemetry.step(RunStep::Checkpoint);
    out << "  checkpoints written   : " << checkpoints.successes << '\n';
    out << std::flush;
}

void print_failure(std::error_code error, const std::string& message)
{
    std::cerr << "error: " << message << " [" << ibshrink::common::error_class_name(ibshrink::common::error_class(error))
              << "]" << '\n';
    for (const auto& hint : ibshrink::common::remediation_hints(error)) {
        std::cerr << "hint: " << hint << '\n';
    }
}

int run(const std::string& config_path, const std::string& profile_name, int stage_number, bool prompt, bool no_color)
{
    namespace common = ibshrink::common;

    ibshrink::config::Profile profile{};
    std::string detail;
    if (auto ec = ibshrink::config::load_profile(config_path, profile_name, profile, detail); ec) {
        print_failure(ec, detail);
        return common::exit_code_for(ec);
    }
    if (prompt) {
        profile.db_password = prompt_password(profile.db_user);
    }

    ibshrink::state::RunStateStore store{profile.workdir};
    ibshrink::orchestrator::RunLog log{{&std::cout, use_color(no_color), store.log_path()}};
    if (auto ec = log.open_journal(detail); ec) {
        print_failure(ec, detail);
        return common::exit_code_for(ec);
    }

    std::unique_ptr<ibshrink::db::MysqlCommandClient> client;
    ibshrink::db::StatementFailure connect_failure{};
    if (auto ec = ibshrink::db::MysqlCommandClient::connect(profile, client, connect_failure); ec) {
        print_failure(ec, connect_failure.describe());
        return common::exit_code_for(ec);
    }

    ibshrink::transfer::FileTransferUnit::Config transfer_config{};
    transfer_config.strategy = profile.use_hardlink ? ibshrink::transfer::TransferStrategy::Hardlink
                                                    : ibshrink::transfer::TransferStrategy::Copy;
    const ibshrink::transfer::FileTransferUnit transfer{transfer_config};

    ibshrink::orchestrator::StreamConfirmation confirmation{std::cin, std::cout};
    ibshrink::orchestrator::OrchestratorTelemetry telemetry;

    install_signal_handlers();

    ibshrink::orchestrator::RunContext context{};
    context.profile = profile;
    context.client = client.get();
    context.transfer = &transfer;
    context.store = &store;
    context.confirmation = &confirmation;
    context.log = &log;
    context.telemetry = &telemetry;
    context.cancel_requested = [] { return g_cancel_requested.load(std::memory_order_relaxed); };

    ibshrink::orchestrator::StageOrchestrator orchestrator{std::move(context)};
    const auto stage = stage_number == 1 ? ibshrink::inventory::Stage::One : ibshrink::inventory::Stage::Two;
    const auto report = orchestrator.run(stage);

    if (!report.nothing_to_do && report.error != common::ShrinkErrc::PlanRejected) {
        print_summary(report, telemetry.snapshot(), std::cout);
    }
    if (!report.success) {
        for (const auto& hint : report.remediation_hints) {
            std::cerr << "hint: " << hint << '\n';
        }
    }
    return common::exit_code_for(report.error);
}

}  // namespace

int main(int argc, char** argv)
{
    CLI::App app{"Shrink the InnoDB system tablespace (ibdata1) in two stages"};

    std::string config_path;
    std::string profile_name{ibshrink::config::kDefaultProfileName};
    int stage_number = 0;
    bool prompt = false;
    bool no_color = false;

    app.add_option("-c,--config", config_path, "Configuration file with one section per profile")->required();
    app.add_option("-p,--profile", profile_name, "Profile section to use")->capture_default_str();
    app.add_option("-s,--stage", stage_number, "Stage to run: 1 detaches tables, 2 restores them")
        ->required()
        ->check(CLI::IsMember({1, 2}));
    app.add_flag("-P,--password", prompt, "Prompt for the database password");
    app.add_flag("--no-color", no_color, "Disable coloured console output");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& error) {
        return app.exit(error);
    }

    try {
        return run(config_path, profile_name, stage_number, prompt, no_color);
    } catch (const std::exception& error) {
        std::cerr << "error: " << error.what() << '\n';
        return EXIT_FAILURE;
    }
}
