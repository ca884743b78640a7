#include "ibshrink/common/errors.hpp"

namespace ibshrink::common {

namespace {

class ShrinkErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "ibshrink";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<ShrinkErrc>(condition)) {
        case ShrinkErrc::Success:
            return "success";
        case ShrinkErrc::ConfigError:
            return "invalid configuration";
        case ShrinkErrc::ConnectionError:
            return "unable to reach the database";
        case ShrinkErrc::UnsupportedLimitation:
            return "unsupported table or server layout";
        case ShrinkErrc::ConflictError:
            return "live schema conflicts with the persisted run state";
        case ShrinkErrc::TransferError:
            return "tablespace file transfer failed";
        case ShrinkErrc::CrossDevice:
            return "hard link across filesystems";
        case ShrinkErrc::ChecksumMismatch:
            return "tablespace checksum mismatch";
        case ShrinkErrc::StatementExecution:
            return "administrative statement failed";
        case ShrinkErrc::CorruptState:
            return "run state file is unreadable or invalid";
        case ShrinkErrc::MissingState:
            return "no completed stage 1 run state";
        case ShrinkErrc::RunLocked:
            return "working directory is locked by another run";
        case ShrinkErrc::WorkdirNotEmpty:
            return "working directory is not empty";
        case ShrinkErrc::PlanRejected:
            return "plan rejected by operator";
        case ShrinkErrc::Cancelled:
            return "run cancelled";
        default:
            return "unknown ibshrink error";
        }
    }
};

const ShrinkErrorCategory kCategory{};

}  // namespace

const std::error_category& shrink_error_category() noexcept
{
    return kCategory;
}

std::error_code make_error_code(ShrinkErrc value) noexcept
{
    return {static_cast<int>(value), shrink_error_category()};
}

ErrorClass error_class(std::error_code error) noexcept
{
    if (!error) {
        return ErrorClass::None;
    }
    if (error.category() != shrink_error_category()) {
        return ErrorClass::Other;
    }

    switch (static_cast<ShrinkErrc>(error.value())) {
    case ShrinkErrc::Success:
        return ErrorClass::None;
    case ShrinkErrc::ConfigError:
        return ErrorClass::Config;
    case ShrinkErrc::ConnectionError:
        return ErrorClass::Connection;
    case ShrinkErrc::UnsupportedLimitation:
        return ErrorClass::UnsupportedLimitation;
    case ShrinkErrc::ConflictError:
        return ErrorClass::Conflict;
    case ShrinkErrc::TransferError:
    case ShrinkErrc::CrossDevice:
    case ShrinkErrc::ChecksumMismatch:
        return ErrorClass::Transfer;
    case ShrinkErrc::StatementExecution:
        return ErrorClass::StatementExecution;
    case ShrinkErrc::CorruptState:
        return ErrorClass::CorruptState;
    case ShrinkErrc::MissingState:
        return ErrorClass::MissingState;
    case ShrinkErrc::RunLocked:
    case ShrinkErrc::WorkdirNotEmpty:
        return ErrorClass::Workdir;
    case ShrinkErrc::Cancelled:
        return ErrorClass::Cancelled;
    case ShrinkErrc::PlanRejected:
        return ErrorClass::Declined;
    default:
        return ErrorClass::Other;
    }
}

const char* error_class_name(ErrorClass value) noexcept
{
    switch (value) {
    case ErrorClass::None:
        return "none";
    case ErrorClass::Config:
        return "ConfigError";
    case ErrorClass::Connection:
        return "ConnectionError";
    case ErrorClass::UnsupportedLimitation:
        return "UnsupportedLimitation";
    case ErrorClass::Conflict:
        return "ConflictError";
    case ErrorClass::Transfer:
        return "TransferError";
    case ErrorClass::StatementExecution:
        return "StatementExecutionError";
    case ErrorClass::CorruptState:
        return "CorruptStateError";
    case ErrorClass::MissingState:
        return "MissingStateError";
    case ErrorClass::Workdir:
        return "WorkdirError";
    case ErrorClass::Cancelled:
        return "Cancelled";
    case ErrorClass::Declined:
        return "Declined";
    case ErrorClass::Other:
    default:
        return "Error";
    }
}

int exit_code_for(std::error_code error) noexcept
{
    switch (error_class(error)) {
    case ErrorClass::None:
    case ErrorClass::Declined:
        return 0;
    case ErrorClass::Config:
        return 2;
    case ErrorClass::Connection:
        return 3;
    case ErrorClass::UnsupportedLimitation:
        return 4;
    case ErrorClass::Conflict:
        return 5;
    case ErrorClass::Transfer:
        return 6;
    case ErrorClass::StatementExecution:
        return 7;
    case ErrorClass::CorruptState:
        return 8;
    case ErrorClass::MissingState:
        return 9;
    case ErrorClass::Workdir:
        return 10;
    case ErrorClass::Cancelled:
        return 11;
    case ErrorClass::Other:
    default:
        return 1;
    }
}

std::vector<std::string> remediation_hints(std::error_code error)
{
    if (!error) {
        return {};
    }
    if (error.category() != shrink_error_category()) {
        return {"Inspect the run log in the working directory for additional details."};
    }

    switch (static_cast<ShrinkErrc>(error.value())) {
    case ShrinkErrc::Success:
    case ShrinkErrc::PlanRejected:
        return {};
    case ShrinkErrc::ConfigError:
        return {"Check the profile section and its workdir/db_socket keys in the configuration file."};
    case ShrinkErrc::ConnectionError:
        return {"Verify the database is running and db_socket, db_user and db_password are correct."};
    case ShrinkErrc::UnsupportedLimitation:
        return {"Move the named table to a file-per-table tablespace (or remove partitioning) and plan again."};
    case ShrinkErrc::ConflictError:
        return {"Tables were added, removed or renamed since stage 1; restore the original table set before re-running."};
    case ShrinkErrc::TransferError:
        return {"Check free space and permissions on the working and data directories, then re-run the same stage."};
    case ShrinkErrc::CrossDevice:
        return {"Place the workdir on the same filesystem as the data directory or set use_hardlink=no."};
    case ShrinkErrc::ChecksumMismatch:
        return {"The tablespace file changed in transit or in the workdir; do not continue until it is investigated."};
    case ShrinkErrc::StatementExecution:
        return {"Inspect the failing statement and the server error log, then re-run the same stage to resume."};
    case ShrinkErrc::CorruptState:
        return {"Restore ibshrink.state from a backup; the run cannot resume from a damaged state file."};
    case ShrinkErrc::MissingState:
        return {"Run stage 1 for this profile and let it complete before running stage 2."};
    case ShrinkErrc::RunLocked:
        return {"Another ibshrink process is using this workdir; wait for it to finish."};
    case ShrinkErrc::WorkdirNotEmpty:
        return {"Empty the workdir before starting a new stage 1 run."};
    case ShrinkErrc::Cancelled:
        return {"Re-run the same stage to resume from the last checkpoint."};
    default:
        return {"Inspect the run log in the working directory for additional details."};
    }
}

}  // namespace ibshrink::common
