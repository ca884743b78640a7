#include "ibshrink/orchestrator/run_log.hpp"
#include "ibshrink/tools/run_log_formatter.hpp"

#include "fake_command_client.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <chrono>
#include <sstream>
#include <string>

using ibshrink::orchestrator::RunEvent;
using ibshrink::orchestrator::RunLog;
using ibshrink::tools::format_run_event_json;
using ibshrink::tools::format_timestamp_iso;

TEST_CASE("format_timestamp_iso renders UTC with microseconds")
{
    const auto tp = std::chrono::system_clock::time_point{std::chrono::seconds{1'700'000'000} + std::chrono::microseconds{42}};
    CHECK(format_timestamp_iso(tp) == "2023-11-14T22:13:20.000042Z");
    CHECK(format_timestamp_iso({}).empty());
}

TEST_CASE("format_run_event_json writes every field in order")
{
    RunEvent event{};
    event.timestamp = std::chrono::system_clock::time_point{std::chrono::seconds{1'700'000'000}};
    event.profile = "default";
    event.stage = 1U;
    event.phase = "stage1_running";
    event.schema = "shop";
    event.table = "orders";
    event.step = "export";
    event.message = "ok";
    event.duration_ms = 12U;
    event.bytes = 65536U;

    CHECK(format_run_event_json(event)
          == "{\"timestamp\":\"2023-11-14T22:13:20.000000Z\",\"profile\":\"default\",\"stage\":1,"
             "\"phase\":\"stage1_running\",\"schema\":\"shop\",\"table\":\"orders\",\"step\":\"export\","
             "\"success\":true,\"error\":null,\"message\":\"ok\",\"duration_ms\":12,\"bytes\":65536}");
}

TEST_CASE("format_run_event_json escapes text and nulls empty table fields")
{
    RunEvent event{};
    event.profile = "default";
    event.stage = 2U;
    event.phase = "failed";
    event.step = "import";
    event.success = false;
    event.error = "TransferError";
    event.message = "path \"a\\b\"\n\tnext\x01";

    const auto json = format_run_event_json(event);
    CHECK(json.find("\"timestamp\":null") != std::string::npos);
    CHECK(json.find("\"schema\":null,\"table\":null") != std::string::npos);
    CHECK(json.find("\"success\":false,\"error\":\"TransferError\"") != std::string::npos);
    CHECK(json.find("\"message\":\"path \\\"a\\\\b\\\"\\n\\tnext\\u0001\"") != std::string::npos);
}

TEST_CASE("RunLog writes progress lines and appends to the journal")
{
    auto dir = ibshrink::testing::make_temp_directory("ibshrink_run_log_");
    const auto journal = dir / "ibshrink.log";
    std::ostringstream console;

    {
        RunLog log{{&console, false, journal}};
        std::string detail;
        REQUIRE_FALSE(log.open_journal(detail));

        log.begin_progress("Exporting table shop.orders");
        log.end_progress(true);
        log.begin_progress("Importing table shop.orders");
        log.warning("tablespace was already absent");
        log.error("boom");

        RunEvent event{};
        event.profile = "default";
        event.step = "plan";
        log.record(event);
        log.record(event);
        CHECK(log.journal_healthy());
    }

    CHECK(console.str()
          == "Exporting table shop.orders... OK\n"
             "Importing table shop.orders... \n"
             "warning: tablespace was already absent\n"
             "error: boom\n");

    const auto text = ibshrink::testing::read_file(journal);
    CHECK(std::count(text.begin(), text.end(), '\n') == 2);
    CHECK(text.find("\"step\":\"plan\"") != std::string::npos);

    std::filesystem::remove_all(dir);
}

TEST_CASE("RunLog reports an unopenable journal")
{
    auto dir = ibshrink::testing::make_temp_directory("ibshrink_run_log_bad_");
    RunLog log{{nullptr, false, dir / "missing" / "ibshrink.log"}};
    std::string detail;
    CHECK(log.open_journal(detail) == std::errc::io_error);
    CHECK(detail.find("ibshrink.log") != std::string::npos);
    std::filesystem::remove_all(dir);
}
