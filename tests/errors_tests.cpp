#include "ibshrink/common/errors.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <system_error>

using ibshrink::common::ErrorClass;
using ibshrink::common::ShrinkErrc;
using ibshrink::common::error_class;
using ibshrink::common::error_class_name;
using ibshrink::common::exit_code_for;
using ibshrink::common::remediation_hints;

TEST_CASE("Shrink error codes carry the ibshrink category")
{
    std::error_code ec = ShrinkErrc::ConflictError;
    CHECK(std::string{ec.category().name()} == "ibshrink");
    CHECK(ec.message() == "live schema conflicts with the persisted run state");
    CHECK(ec == ShrinkErrc::ConflictError);
}

TEST_CASE("Error classes group transfer failures")
{
    CHECK(error_class(ShrinkErrc::TransferError) == ErrorClass::Transfer);
    CHECK(error_class(ShrinkErrc::CrossDevice) == ErrorClass::Transfer);
    CHECK(error_class(ShrinkErrc::ChecksumMismatch) == ErrorClass::Transfer);
    CHECK(error_class(ShrinkErrc::RunLocked) == ErrorClass::Workdir);
    CHECK(error_class(std::error_code{}) == ErrorClass::None);
    CHECK(error_class(std::make_error_code(std::errc::io_error)) == ErrorClass::Other);
    CHECK(std::string{error_class_name(ErrorClass::Conflict)} == "ConflictError");
}

TEST_CASE("Exit codes are distinct per error class")
{
    CHECK(exit_code_for({}) == 0);
    CHECK(exit_code_for(ShrinkErrc::PlanRejected) == 0);
    CHECK(exit_code_for(ShrinkErrc::ConfigError) == 2);
    CHECK(exit_code_for(ShrinkErrc::ConnectionError) == 3);
    CHECK(exit_code_for(ShrinkErrc::UnsupportedLimitation) == 4);
    CHECK(exit_code_for(ShrinkErrc::ConflictError) == 5);
    CHECK(exit_code_for(ShrinkErrc::ChecksumMismatch) == 6);
    CHECK(exit_code_for(ShrinkErrc::StatementExecution) == 7);
    CHECK(exit_code_for(ShrinkErrc::CorruptState) == 8);
    CHECK(exit_code_for(ShrinkErrc::MissingState) == 9);
    CHECK(exit_code_for(ShrinkErrc::WorkdirNotEmpty) == 10);
    CHECK(exit_code_for(ShrinkErrc::Cancelled) == 11);
    CHECK(exit_code_for(std::make_error_code(std::errc::no_space_on_device)) == 1);
}

TEST_CASE("Remediation hints accompany every failure")
{
    CHECK(remediation_hints({}).empty());
    CHECK(remediation_hints(ShrinkErrc::PlanRejected).empty());
    CHECK(remediation_hints(ShrinkErrc::UnsupportedLimitation).size() == 1U);
    CHECK(remediation_hints(ShrinkErrc::CrossDevice).front().find("use_hardlink") != std::string::npos);
    CHECK_FALSE(remediation_hints(std::make_error_code(std::errc::io_error)).empty());
}
