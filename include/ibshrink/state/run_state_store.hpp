#pragma once

#include "ibshrink/state/run_state.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace ibshrink::state {

inline constexpr std::string_view kStateFileName = "ibshrink.state";
inline constexpr std::string_view kStateTempFileName = "ibshrink.state.tmp";
inline constexpr std::string_view kLockFileName = "ibshrink.lock";
inline constexpr std::string_view kLogFileName = "ibshrink.log";

// Exclusive flock(2) on the workdir lock file, released on destruction.
class RunLock final {
public:
    RunLock() noexcept = default;
    ~RunLock();

    RunLock(const RunLock&) = delete;
    RunLock& operator=(const RunLock&) = delete;
    RunLock(RunLock&& other) noexcept;
    RunLock& operator=(RunLock&& other) noexcept;

    [[nodiscard]] static std::error_code acquire(const std::filesystem::path& path, RunLock& out, std::string& detail);

    [[nodiscard]] bool held() const noexcept { return fd_ >= 0; }
    void release() noexcept;

private:
    explicit RunLock(int fd) noexcept
        : fd_{fd}
    {
    }

    int fd_ = -1;
};

class RunStateStore final {
public:
    explicit RunStateStore(std::filesystem::path workdir) noexcept;

    RunStateStore(const RunStateStore&) = delete;
    RunStateStore& operator=(const RunStateStore&) = delete;

    [[nodiscard]] const std::filesystem::path& workdir() const noexcept { return workdir_; }
    [[nodiscard]] std::filesystem::path state_path() const;
    [[nodiscard]] std::filesystem::path temp_path() const;
    [[nodiscard]] std::filesystem::path lock_path() const;
    [[nodiscard]] std::filesystem::path log_path() const;

    [[nodiscard]] std::error_code acquire_lock(std::string& detail);
    void release_lock() noexcept;
    [[nodiscard]] bool holds_lock() const noexcept;

    [[nodiscard]] std::error_code exists(bool& out) const;

    // MissingState when absent; CorruptState for any read or decode failure.
    [[nodiscard]] std::error_code load(RunState& out, std::string& detail) const;

    // Replace-on-write: tmp file, fsync, rename, fsync directory. Requires the run lock.
    [[nodiscard]] std::error_code save(const RunState& state, std::string& detail);

    // WorkdirNotEmpty unless only the lock and log files are present.
    [[nodiscard]] std::error_code check_workdir_empty(std::string& detail) const;

private:
    std::filesystem::path workdir_{};
    RunLock lock_{};
    std::mutex save_mutex_{};
};

}  // namespace ibshrink::state
