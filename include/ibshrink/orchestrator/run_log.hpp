#pragma once

#include "ibshrink/orchestrator/run_event.hpp"

#include <filesystem>
#include <fstream>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>

namespace ibshrink::orchestrator {

// Operator console plus the append-only JSON-lines journal in the workdir.
class RunLog final {
public:
    struct Config final {
        std::ostream* console = nullptr;
        bool color = false;
        std::filesystem::path journal_path{};
    };

    RunLog() = default;
    explicit RunLog(Config config);

    RunLog(const RunLog&) = delete;
    RunLog& operator=(const RunLog&) = delete;

    [[nodiscard]] std::error_code open_journal(std::string& detail);

    void record(const RunEvent& event);

    // "Converting table a.b to MyISAM... " then OK or FAILED on the same line.
    void begin_progress(std::string_view text);
    void end_progress(bool ok);

    void info(std::string_view text);
    void warning(std::string_view text);
    void error(std::string_view text);

    [[nodiscard]] bool journal_healthy() const noexcept { return !journal_failed_; }

private:
    void write_line(const char* color, std::string_view prefix, std::string_view text);
    void close_progress();

    Config config_{};
    std::ofstream journal_{};
    bool journal_failed_ = false;
    bool progress_open_ = false;
};

}  // namespace ibshrink::orchestrator
