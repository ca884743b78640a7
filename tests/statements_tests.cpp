#include "ibshrink/db/statements.hpp"

#include <catch2/catch_test_macros.hpp>

using ibshrink::common::TableId;
using namespace ibshrink::db;

TEST_CASE("quote_identifier doubles embedded backticks")
{
    CHECK(quote_identifier("orders") == "`orders`");
    CHECK(quote_identifier("we`ird") == "`we``ird`");
    CHECK(qualified_identifier(TableId{"shop", "order lines"}) == "`shop`.`order lines`");
}

TEST_CASE("Statement builders produce administrative statements")
{
    const TableId id{"shop", "orders"};
    CHECK(engine_conversion_statement(id, kEngineMyIsam) == "ALTER TABLE `shop`.`orders` ENGINE=MyISAM");
    CHECK(flush_for_export_statement(id) == "FLUSH TABLES `shop`.`orders` FOR EXPORT");
    CHECK(unlock_tables_statement() == "UNLOCK TABLES");
    CHECK(discard_tablespace_statement(id) == "ALTER TABLE `shop`.`orders` DISCARD TABLESPACE");
    CHECK(import_tablespace_statement(id) == "ALTER TABLE `shop`.`orders` IMPORT TABLESPACE");
    CHECK(show_create_table_statement(id) == "SHOW CREATE TABLE `shop`.`orders`");
}

TEST_CASE("is_mutating_statement separates reads from changes")
{
    CHECK_FALSE(is_mutating_statement("SELECT 1"));
    CHECK_FALSE(is_mutating_statement("  show create table `a`.`b`"));
    CHECK_FALSE(is_mutating_statement(prepare_session_statement()));
    CHECK(is_mutating_statement("SET GLOBAL innodb_file_per_table=1"));
    CHECK(is_mutating_statement(engine_conversion_statement({"a", "b"}, kEngineInnoDb)));
    CHECK(is_mutating_statement(flush_for_export_statement({"a", "b"})));
    CHECK(is_mutating_statement(unlock_tables_statement()));
}

TEST_CASE("tablename_to_filename matches the server's on-disk names")
{
    CHECK(tablename_to_filename("orders_2024") == "orders_2024");
    CHECK(tablename_to_filename("order lines") == "order@0020lines");
    CHECK(tablename_to_filename("a-b") == "a@002db");
    CHECK(tablename_to_filename("caf\xC3\xA9") == "caf@00e9");
}
