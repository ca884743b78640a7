#include "ibshrink/orchestrator/run_log.hpp"

#include "ibshrink/tools/run_log_formatter.hpp"

#include <utility>

namespace ibshrink::orchestrator {

namespace {

constexpr const char* kGreen = "\033[32m";
constexpr const char* kYellow = "\033[33m";
constexpr const char* kRed = "\033[31m";
constexpr const char* kReset = "\033[0m";

}  // namespace

RunLog::RunLog(Config config)
    : config_{std::move(config)}
{
}

std::error_code RunLog::open_journal(std::string& detail)
{
    if (config_.journal_path.empty()) {
        return {};
    }
    journal_.open(config_.journal_path, std::ios::out | std::ios::app);
    if (!journal_.is_open()) {
        detail = "unable to open run log " + config_.journal_path.string();
        return std::make_error_code(std::errc::io_error);
    }
    return {};
}

void RunLog::record(const RunEvent& event)
{
    if (!journal_.is_open() || journal_failed_) {
        return;
    }
    journal_ << tools::format_run_event_json(event) << '\n';
    journal_.flush();
    if (!journal_) {
        journal_failed_ = true;
        warning("run log " + config_.journal_path.string() + " could not be written; continuing without it");
    }
}

void RunLog::begin_progress(std::string_view text)
{
    close_progress();
    if (config_.console == nullptr) {
        return;
    }
    *config_.console << text << "... " << std::flush;
    progress_open_ = true;
}

void RunLog::end_progress(bool ok)
{
    if (config_.console == nullptr || !progress_open_) {
        return;
    }
    progress_open_ = false;
    const char* color = ok ? kGreen : kRed;
    if (config_.color) {
        *config_.console << color;
    }
    *config_.console << (ok ? "OK" : "FAILED");
    if (config_.color) {
        *config_.console << kReset;
    }
    *config_.console << std::endl;
}

void RunLog::info(std::string_view text)
{
    write_line(nullptr, {}, text);
}

void RunLog::warning(std::string_view text)
{
    write_line(kYellow, "warning: ", text);
}

void RunLog::error(std::string_view text)
{
    write_line(kRed, "error: ", text);
}

void RunLog::write_line(const char* color, std::string_view prefix, std::string_view text)
{
    close_progress();
    if (config_.console == nullptr) {
        return;
    }
    const bool colored = config_.color && color != nullptr;
    if (colored) {
        *config_.console << color;
    }
    *config_.console << prefix << text;
    if (colored) {
        *config_.console << kReset;
    }
    *config_.console << std::endl;
}

void RunLog::close_progress()
{
    if (progress_open_ && config_.console != nullptr) {
        *config_.console << '\n';
    }
    progress_open_ = false;
}

}  // namespace ibshrink::orchestrator
