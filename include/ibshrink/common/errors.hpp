#pragma once

#include <string>
#include <system_error>
#include <vector>

namespace ibshrink::common {

enum class ShrinkErrc {
    Success = 0,
    ConfigError,
    ConnectionError,
    UnsupportedLimitation,
    ConflictError,
    TransferError,
    CrossDevice,
    ChecksumMismatch,
    StatementExecution,
    CorruptState,
    MissingState,
    RunLocked,
    WorkdirNotEmpty,
    PlanRejected,
    Cancelled
};

enum class ErrorClass {
    None = 0,
    Config,
    Connection,
    UnsupportedLimitation,
    Conflict,
    Transfer,
    StatementExecution,
    CorruptState,
    MissingState,
    Workdir,
    Cancelled,
    Declined,
    Other
};

const std::error_category& shrink_error_category() noexcept;
std::error_code make_error_code(ShrinkErrc value) noexcept;

[[nodiscard]] ErrorClass error_class(std::error_code error) noexcept;
[[nodiscard]] const char* error_class_name(ErrorClass value) noexcept;
[[nodiscard]] int exit_code_for(std::error_code error) noexcept;
[[nodiscard]] std::vector<std::string> remediation_hints(std::error_code error);

}  // namespace ibshrink::common

namespace std {

template <>
struct is_error_code_enum<ibshrink::common::ShrinkErrc> : true_type {
};

}  // namespace std
