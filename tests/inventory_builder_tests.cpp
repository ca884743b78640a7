#include "ibshrink/common/errors.hpp"
#include "ibshrink/inventory/inventory_builder.hpp"

#include "fake_command_client.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <string>
#include <vector>

using ibshrink::common::ShrinkErrc;
using ibshrink::common::TableId;
using ibshrink::db::TablespaceLayout;
using ibshrink::inventory::InventoryBuilder;
using ibshrink::inventory::InventoryFailure;
using ibshrink::inventory::Plan;
using ibshrink::inventory::Stage;
using ibshrink::inventory::TableAction;
using ibshrink::inventory::TableClass;
using ibshrink::inventory::TableRecord;
using ibshrink::inventory::TableStatus;
using ibshrink::testing::FakeCommandClient;
using ibshrink::testing::make_temp_directory;

TEST_CASE("classify_table separates internal schemas")
{
    CHECK(ibshrink::inventory::classify_table({"mysql", "user"}) == TableClass::Internal);
    CHECK(ibshrink::inventory::classify_table({"sys", "sys_config"}) == TableClass::Internal);
    CHECK(ibshrink::inventory::classify_table({"shop", "orders"}) == TableClass::Application);
    CHECK(ibshrink::inventory::classify_table({"MySQL_archive", "user"}) == TableClass::Application);
}

TEST_CASE("InventoryBuilder plans conversions, exports and ignored tables in order")
{
    auto datadir = make_temp_directory("ibshrink_inventory_");
    FakeCommandClient client{datadir};
    client.add_table("shop", "orders");
    client.add_table("mysql", "user");
    client.add_table("shop", "audit", "MyISAM");
    client.add_table("app", "events", "innodb");
    client.add_table("information_schema", "TABLES", "MEMORY");

    InventoryBuilder builder{client};
    Plan plan{};
    InventoryFailure failure{};
    REQUIRE_FALSE(builder.build_plan(client.settings(), plan, failure));

    REQUIRE(plan.records.size() == 4U);
    CHECK(plan.records[0].id == TableId{"app", "events"});
    CHECK(plan.records[1].id == TableId{"mysql", "user"});
    CHECK(plan.records[2].id == TableId{"shop", "audit"});
    CHECK(plan.records[3].id == TableId{"shop", "orders"});

    CHECK(plan.records[0].action == TableAction::Export);
    CHECK(plan.records[0].data_file == datadir / "app" / "events.ibd");
    CHECK(plan.records[1].action == TableAction::Convert);
    CHECK(plan.records[1].status == TableStatus::Pending);
    CHECK(plan.records[2].action == TableAction::Ignore);
    CHECK(plan.records[2].status == TableStatus::Skipped);
    CHECK(plan.records[3].action == TableAction::Export);
    CHECK(plan.records[3].eligible);

    CHECK(plan.count(TableAction::Convert) == 1U);
    CHECK(plan.count(TableAction::Export) == 2U);
    CHECK(plan.count(TableAction::Ignore) == 1U);
    CHECK(client.mutating_statements().empty());

    std::filesystem::remove_all(datadir);
}

TEST_CASE("InventoryBuilder rejects tables outside file-per-table tablespaces")
{
    auto datadir = make_temp_directory("ibshrink_inventory_reject_");

    struct Case final {
        TablespaceLayout layout;
        std::string reason;
    };
    const std::vector<Case> cases{
        {TablespaceLayout::SystemTablespace, "shared system tablespace"},
        {TablespaceLayout::GeneralTablespace, "general (shared) tablespace"},
        {TablespaceLayout::Partitioned, "partitioned"},
        {TablespaceLayout::Missing, "no tablespace file"},
    };

    for (const auto& item : cases) {
        FakeCommandClient client{datadir};
        client.add_table("shop", "orders");
        client.add_table("shop", "legacy", "InnoDB", {}, item.layout);

        InventoryBuilder builder{client};
        Plan plan{};
        InventoryFailure failure{};
        auto ec = builder.build_plan(client.settings(), plan, failure);

        CHECK(ec == ShrinkErrc::UnsupportedLimitation);
        CHECK(failure.table == TableId{"shop", "legacy"});
        CHECK(failure.detail.find("shop.legacy") != std::string::npos);
        CHECK(failure.detail.find(item.reason) != std::string::npos);
        CHECK(client.mutating_statements().empty());
    }

    std::filesystem::remove_all(datadir);
}

TEST_CASE("InventoryBuilder rejects tablespaces outside the data directory")
{
    auto datadir = make_temp_directory("ibshrink_inventory_outside_");
    FakeCommandClient client{datadir / "data"};
    client.add_table("shop", "orders");

    ibshrink::db::ServerSettings server = client.settings();
    server.datadir = datadir / "elsewhere";

    InventoryBuilder builder{client};
    Plan plan{};
    InventoryFailure failure{};
    auto ec = builder.build_plan(server, plan, failure);

    CHECK(ec == ShrinkErrc::UnsupportedLimitation);
    CHECK(failure.detail.find("outside the data directory") != std::string::npos);

    std::filesystem::remove_all(datadir);
}

TEST_CASE("InventoryBuilder surfaces catalog query failures")
{
    auto datadir = make_temp_directory("ibshrink_inventory_query_");
    FakeCommandClient client{datadir};
    client.add_table("shop", "orders");
    client.fail_next("list_tables", std::nullopt, 1142U, "SELECT command denied");

    InventoryBuilder builder{client};
    Plan plan{};
    InventoryFailure failure{};
    auto ec = builder.build_plan(client.settings(), plan, failure);

    CHECK(ec == ShrinkErrc::StatementExecution);
    CHECK(failure.detail.find("1142") != std::string::npos);

    std::filesystem::remove_all(datadir);
}

TEST_CASE("compare_identities reports added and removed tables")
{
    std::vector<TableRecord> persisted(3U);
    persisted[0].id = {"shop", "orders"};
    persisted[1].id = {"shop", "items"};
    persisted[2].id = {"mysql", "user"};

    auto same = ibshrink::inventory::compare_identities(persisted, {{"mysql", "user"}, {"shop", "items"}, {"shop", "orders"}});
    CHECK(same.empty());

    auto diff = ibshrink::inventory::compare_identities(persisted, {{"mysql", "user"}, {"shop", "orders"}, {"shop", "refunds"}});
    REQUIRE(diff.added.size() == 1U);
    REQUIRE(diff.removed.size() == 1U);
    CHECK(diff.added.front() == TableId{"shop", "refunds"});
    CHECK(diff.removed.front() == TableId{"shop", "items"});
    CHECK(diff.describe() == "added: shop.refunds; removed: shop.items");
}

TEST_CASE("render_plan lists pending work and marks retries")
{
    std::vector<TableRecord> records(4U);
    records[0].id = {"mysql", "user"};
    records[0].action = TableAction::Convert;
    records[0].status = TableStatus::Converted;
    records[1].id = {"mysql", "db"};
    records[1].action = TableAction::Convert;
    records[1].status = TableStatus::Pending;
    records[2].id = {"shop", "orders"};
    records[2].action = TableAction::Export;
    records[2].status = TableStatus::Failed;
    records[2].resume_status = TableStatus::Pending;
    records[3].id = {"shop", "audit"};
    records[3].action = TableAction::Ignore;
    records[3].status = TableStatus::Skipped;

    const auto text = ibshrink::inventory::render_plan(records, Stage::One);
    CHECK(text.find("The following tables will be converted from InnoDB to MyISAM:\n  mysql.db\n") != std::string::npos);
    CHECK(text.find("mysql.user") == std::string::npos);
    CHECK(text.find("  shop.orders (retry)\n") != std::string::npos);
    CHECK(text.find("1 table(s) to convert, 1 table(s) to export, 1 non-InnoDB table(s) left untouched") != std::string::npos);
    CHECK(text.find("ensure there are no connections to this database during this procedure!\n") != std::string::npos);

    const auto stage2 = ibshrink::inventory::render_plan(records, Stage::Two);
    CHECK(stage2.find("The following tables will be converted back to InnoDB:\n  mysql.user\n") != std::string::npos);
    CHECK(stage2.find("The following tables will have their tablespace imported:\n  (none)\n") != std::string::npos);
    CHECK(stage2.find("no connections to this database") == std::string::npos);
}
