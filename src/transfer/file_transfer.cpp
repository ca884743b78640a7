#include "ibshrink/transfer/file_transfer.hpp"

#include "ibshrink/common/checksum.hpp"
#include "ibshrink/common/errors.hpp"
#include "ibshrink/common/posix_file.hpp"

#include <cerrno>
#include <span>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace ibshrink::transfer {

namespace {

using common::FileDescriptor;
using common::ShrinkErrc;
using common::last_system_error;
using common::path_exists;
using common::sync_directory;
using common::write_all;

constexpr std::string_view kPartialSuffix = ".partial";

std::error_code fail(TransferFailure& failure,
                     const std::filesystem::path& path,
                     std::error_code system_error,
                     std::string detail,
                     ShrinkErrc code = ShrinkErrc::TransferError)
{
    failure.path = path;
    failure.system_error = system_error;
    failure.detail = std::move(detail);
    return code;
}

std::filesystem::path partial_path(const std::filesystem::path& destination)
{
    auto partial = destination;
    partial += kPartialSuffix;
    return partial;
}

// A placed destination whose directory entry cannot be made durable is taken back out.
std::error_code sync_placed(const TablespaceFile& file, TransferFailure& failure)
{
    const auto directory = file.destination.parent_path();
    if (auto ec = sync_directory(directory); ec) {
        std::string detail = "unable to sync destination directory";
        std::error_code remove_ec;
        std::filesystem::remove(file.destination, remove_ec);
        if (remove_ec) {
            detail += "; " + file.destination.string() + " could not be removed: " + remove_ec.message();
        }
        return fail(failure, directory, ec, std::move(detail));
    }
    return {};
}

}  // namespace

const char* strategy_name(TransferStrategy strategy) noexcept
{
    switch (strategy) {
    case TransferStrategy::Copy:
        return "copy";
    case TransferStrategy::Hardlink:
        return "hardlink";
    default:
        return "unknown";
    }
}

std::optional<TransferStrategy> parse_strategy(std::string_view text) noexcept
{
    if (text == "copy") {
        return TransferStrategy::Copy;
    }
    if (text == "hardlink") {
        return TransferStrategy::Hardlink;
    }
    return std::nullopt;
}

std::string TransferFailure::describe() const
{
    std::string text = detail;
    if (!path.empty()) {
        text += " (" + path.string() + ")";
    }
    if (system_error) {
        text += ": " + system_error.message();
    }
    return text;
}

FileTransferUnit::FileTransferUnit()
    : FileTransferUnit(Config{})
{
}

FileTransferUnit::FileTransferUnit(Config config)
    : config_{config}
{
    if (config_.copy_buffer_size == 0U) {
        config_.copy_buffer_size = 1U << 20U;
    }
}

std::error_code FileTransferUnit::same_device(const std::filesystem::path& lhs,
                                              const std::filesystem::path& rhs,
                                              bool& out)
{
    out = false;
    struct stat lhs_info{};
    if (::stat(lhs.c_str(), &lhs_info) != 0) {
        return last_system_error();
    }
    struct stat rhs_info{};
    if (::stat(rhs.c_str(), &rhs_info) != 0) {
        return last_system_error();
    }
    out = lhs_info.st_dev == rhs_info.st_dev;
    return {};
}

std::error_code FileTransferUnit::transfer(TablespaceFileSet& files, TransferFailure& failure) const
{
    failure = TransferFailure{};

    if (files.metadata) {
        if (auto ec = transfer_file(*files.metadata, failure); ec) {
            return ec;
        }
    }

    if (auto ec = transfer_file(files.data, failure); ec) {
        if (files.metadata) {
            std::error_code remove_ec;
            std::filesystem::remove(files.metadata->destination, remove_ec);
            if (remove_ec) {
                failure.detail += "; companion " + files.metadata->destination.string()
                    + " could not be removed: " + remove_ec.message();
            }
        }
        return ec;
    }

    return {};
}

std::error_code FileTransferUnit::transfer_file(TablespaceFile& file, TransferFailure& failure) const
{
    failure = TransferFailure{};

    if (file.source.empty() || file.destination.empty()) {
        return fail(failure, file.source, {}, "source and destination are required");
    }
    if (path_exists(file.destination)) {
        return fail(failure,
                    file.destination,
                    std::make_error_code(std::errc::file_exists),
                    "destination already exists");
    }

    if (config_.strategy == TransferStrategy::Hardlink) {
        return link_file(file, failure);
    }
    return copy_file(file, failure);
}

std::error_code FileTransferUnit::link_file(TablespaceFile& file, TransferFailure& failure) const
{
    if (::link(file.source.c_str(), file.destination.c_str()) != 0) {
        const auto system_error = last_system_error();
        if (system_error.value() == EXDEV) {
            return fail(failure,
                        file.destination,
                        system_error,
                        "cannot hard link " + file.source.string() + " across filesystems",
                        ShrinkErrc::CrossDevice);
        }
        return fail(failure, file.destination, system_error, "hard link from " + file.source.string() + " failed");
    }

    common::FileDigest digest{};
    if (auto ec = common::digest_file(file.destination, digest); ec) {
        std::error_code remove_ec;
        std::filesystem::remove(file.destination, remove_ec);
        return fail(failure, file.destination, ec, "unable to checksum linked file");
    }

    file.size = digest.size;
    file.checksum = digest.checksum;
    return sync_placed(file, failure);
}

std::error_code FileTransferUnit::copy_file(TablespaceFile& file, TransferFailure& failure) const
{
    FileDescriptor source{::open(file.source.c_str(), O_RDONLY | O_CLOEXEC)};
    if (!source.valid()) {
        return fail(failure, file.source, last_system_error(), "unable to open source");
    }

    struct stat source_info{};
    if (::fstat(source.get(), &source_info) != 0) {
        return fail(failure, file.source, last_system_error(), "unable to stat source");
    }

    const auto partial = partial_path(file.destination);
    (void)::unlink(partial.c_str());

    FileDescriptor destination{::open(partial.c_str(),
                                      O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC,
                                      static_cast<mode_t>(source_info.st_mode & 07777))};
    if (!destination.valid()) {
        return fail(failure, partial, last_system_error(), "unable to create destination");
    }

    auto discard_partial = [&](std::error_code system_error, std::string detail, ShrinkErrc code) {
        (void)destination.close();
        (void)::unlink(partial.c_str());
        return fail(failure, partial, system_error, std::move(detail), code);
    };

    std::vector<std::byte> buffer(config_.copy_buffer_size);
    auto state = common::kCrc32cInit;
    std::uint64_t copied = 0U;
    while (true) {
        const ssize_t count = ::read(source.get(), buffer.data(), buffer.size());
        if (count < 0) {
            if (errno == EINTR) {
                continue;
            }
            return discard_partial(last_system_error(), "read from " + file.source.string() + " failed", ShrinkErrc::TransferError);
        }
        if (count == 0) {
            break;
        }
        const auto chunk = std::span<const std::byte>(buffer.data(), static_cast<std::size_t>(count));
        state = common::crc32c_extend(state, chunk);
        if (auto ec = write_all(destination.get(), chunk.data(), chunk.size()); ec) {
            return discard_partial(ec, "write failed", ShrinkErrc::TransferError);
        }
        copied += static_cast<std::uint64_t>(count);
    }

    if (::fsync(destination.get()) != 0) {
        return discard_partial(last_system_error(), "fsync failed", ShrinkErrc::TransferError);
    }

    const struct timespec times[2] = {source_info.st_atim, source_info.st_mtim};
    if (::futimens(destination.get(), times) != 0) {
        return discard_partial(last_system_error(), "unable to preserve timestamps", ShrinkErrc::TransferError);
    }

    if (config_.preserve_ownership && ::geteuid() == 0) {
        if (::fchown(destination.get(), source_info.st_uid, source_info.st_gid) != 0) {
            return discard_partial(last_system_error(), "unable to preserve ownership", ShrinkErrc::TransferError);
        }
    }

    if (auto ec = destination.close(); ec) {
        return discard_partial(ec, "close failed", ShrinkErrc::TransferError);
    }

    const common::FileDigest expected{copied, common::crc32c_finalize(state)};
    if (expected.size != static_cast<std::uint64_t>(source_info.st_size)) {
        return discard_partial({}, "source changed size during copy", ShrinkErrc::ChecksumMismatch);
    }

    common::FileDigest written{};
    if (auto ec = common::digest_file(partial, written); ec) {
        return discard_partial(ec, "unable to verify copy", ShrinkErrc::TransferError);
    }
    if (written != expected) {
        return discard_partial({}, "copy of " + file.source.string() + " does not match its source", ShrinkErrc::ChecksumMismatch);
    }

    if (path_exists(file.destination)) {
        return discard_partial(std::make_error_code(std::errc::file_exists), "destination appeared during copy", ShrinkErrc::TransferError);
    }
    if (::rename(partial.c_str(), file.destination.c_str()) != 0) {
        return discard_partial(last_system_error(), "rename into place failed", ShrinkErrc::TransferError);
    }

    file.size = written.size;
    file.checksum = written.checksum;
    return sync_placed(file, failure);
}

}  // namespace ibshrink::transfer
