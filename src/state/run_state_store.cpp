#include "ibshrink/state/run_state_store.hpp"

#include "ibshrink/common/errors.hpp"
#include "ibshrink/common/posix_file.hpp"
#include "ibshrink/state/run_state_codec.hpp"

#include <cerrno>
#include <fstream>
#include <iterator>
#include <sstream>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace ibshrink::state {

namespace {

using common::ShrinkErrc;

}  // namespace

RunLock::~RunLock()
{
    release();
}

RunLock::RunLock(RunLock&& other) noexcept
    : fd_{other.fd_}
{
    other.fd_ = -1;
}

RunLock& RunLock::operator=(RunLock&& other) noexcept
{
    if (this != &other) {
        release();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

std::error_code RunLock::acquire(const std::filesystem::path& path, RunLock& out, std::string& detail)
{
    out.release();
    common::FileDescriptor fd{::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600)};
    if (!fd.valid()) {
        detail = "unable to open lock file " + path.string() + ": " + common::last_system_error().message();
        return ShrinkErrc::RunLocked;
    }

    while (::flock(fd.get(), LOCK_EX | LOCK_NB) != 0) {
        if (errno == EINTR) {
            continue;
        }
        if (errno == EWOULDBLOCK) {
            detail = "another run holds " + path.string();
        } else {
            detail = "unable to lock " + path.string() + ": " + common::last_system_error().message();
        }
        return ShrinkErrc::RunLocked;
    }

    out = RunLock{fd.release()};
    return {};
}

void RunLock::release() noexcept
{
    if (fd_ < 0) {
        return;
    }
    (void)::flock(fd_, LOCK_UN);
    (void)::close(fd_);
    fd_ = -1;
}

RunStateStore::RunStateStore(std::filesystem::path workdir) noexcept
    : workdir_{std::move(workdir)}
{
}

std::filesystem::path RunStateStore::state_path() const
{
    return workdir_ / kStateFileName;
}

std::filesystem::path RunStateStore::temp_path() const
{
    return workdir_ / kStateTempFileName;
}

std::filesystem::path RunStateStore::lock_path() const
{
    return workdir_ / kLockFileName;
}

std::filesystem::path RunStateStore::log_path() const
{
    return workdir_ / kLogFileName;
}

std::error_code RunStateStore::acquire_lock(std::string& detail)
{
    if (lock_.held()) {
        return {};
    }
    return RunLock::acquire(lock_path(), lock_, detail);
}

void RunStateStore::release_lock() noexcept
{
    lock_.release();
}

bool RunStateStore::holds_lock() const noexcept
{
    return lock_.held();
}

std::error_code RunStateStore::exists(bool& out) const
{
    std::error_code ec;
    out = std::filesystem::exists(state_path(), ec);
    return ec;
}

std::error_code RunStateStore::load(RunState& out, std::string& detail) const
{
    out = RunState{};
    detail.clear();

    bool present = false;
    if (auto ec = exists(present); ec) {
        detail = "unable to inspect " + state_path().string() + ": " + ec.message();
        return ShrinkErrc::CorruptState;
    }
    if (!present) {
        detail = "no run state at " + state_path().string();
        return ShrinkErrc::MissingState;
    }

    std::ifstream stream{state_path(), std::ios::binary};
    if (!stream) {
        detail = "unable to open " + state_path().string();
        return ShrinkErrc::CorruptState;
    }
    std::string text{std::istreambuf_iterator<char>{stream}, std::istreambuf_iterator<char>{}};
    if (stream.bad()) {
        detail = "unable to read " + state_path().string();
        return ShrinkErrc::CorruptState;
    }

    if (auto ec = RunStateCodec::decode(text, out, detail); ec) {
        detail = state_path().string() + ": " + detail;
        return ec;
    }
    return {};
}

std::error_code RunStateStore::save(const RunState& state, std::string& detail)
{
    std::lock_guard guard(save_mutex_);
    detail.clear();

    if (!lock_.held()) {
        detail = "run state can only be written while holding " + lock_path().string();
        return ShrinkErrc::RunLocked;
    }

    const auto text = RunStateCodec::encode(state);
    const auto temp = temp_path();

    auto fail = [&](const char* what, std::error_code ec) {
        detail = std::string{what} + " " + temp.string() + ": " + ec.message();
        (void)::unlink(temp.c_str());
        return ec;
    };

    common::FileDescriptor fd{::open(temp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600)};
    if (!fd.valid()) {
        return fail("unable to create", common::last_system_error());
    }
    if (auto ec = common::write_all(fd.get(), reinterpret_cast<const std::byte*>(text.data()), text.size()); ec) {
        return fail("unable to write", ec);
    }
    if (::fsync(fd.get()) != 0) {
        return fail("unable to fsync", common::last_system_error());
    }
    if (auto ec = fd.close(); ec) {
        return fail("unable to close", ec);
    }
    if (::rename(temp.c_str(), state_path().c_str()) != 0) {
        return fail("unable to rename", common::last_system_error());
    }
    if (auto ec = common::sync_directory(workdir_); ec) {
        detail = "unable to sync " + workdir_.string() + ": " + ec.message();
        return ec;
    }
    return {};
}

std::error_code RunStateStore::check_workdir_empty(std::string& detail) const
{
    std::error_code ec;
    std::filesystem::directory_iterator it{workdir_, ec};
    if (ec) {
        detail = "unable to list " + workdir_.string() + ": " + ec.message();
        return ShrinkErrc::WorkdirNotEmpty;
    }

    std::ostringstream offenders;
    std::size_t count = 0U;
    for (; it != std::filesystem::directory_iterator{}; it.increment(ec)) {
        const auto name = it->path().filename().string();
        if (name == kLockFileName || name == kLogFileName) {
            continue;
        }
        if (count < 5U) {
            offenders << (count == 0U ? "" : ", ") << name;
        }
        ++count;
    }
    if (ec) {
        detail = "unable to list " + workdir_.string() + ": " + ec.message();
        return ShrinkErrc::WorkdirNotEmpty;
    }
    if (count > 0U) {
        detail = workdir_.string() + " contains " + std::to_string(count) + " unexpected entr"
            + (count == 1U ? "y" : "ies") + ": " + offenders.str();
        return ShrinkErrc::WorkdirNotEmpty;
    }
    return {};
}

}  // namespace ibshrink::state
