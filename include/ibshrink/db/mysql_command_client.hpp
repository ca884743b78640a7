#pragma once

#include "ibshrink/config/profile.hpp"
#include "ibshrink/db/command_client.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace ibshrink::db {

class MysqlCommandClient final : public CommandClient {
public:
    [[nodiscard]] static std::error_code connect(const config::Profile& profile,
                                                 std::unique_ptr<MysqlCommandClient>& out,
                                                 StatementFailure& failure);

    ~MysqlCommandClient() override;

    MysqlCommandClient(const MysqlCommandClient&) = delete;
    MysqlCommandClient& operator=(const MysqlCommandClient&) = delete;
    MysqlCommandClient(MysqlCommandClient&&) = delete;
    MysqlCommandClient& operator=(MysqlCommandClient&&) = delete;

    [[nodiscard]] std::error_code read_server_settings(ServerSettings& out) override;
    [[nodiscard]] std::error_code prepare_session() override;

    [[nodiscard]] std::error_code list_tables(const SchemaFilter& filter, std::vector<TableInfo>& out) override;
    [[nodiscard]] std::error_code get_physical_file_paths(const common::TableId& id, PhysicalFiles& out) override;
    [[nodiscard]] std::error_code show_create_table(const common::TableId& id, std::string& out) override;

    [[nodiscard]] std::error_code execute_engine_conversion(const common::TableId& id,
                                                            std::string_view target_engine) override;
    [[nodiscard]] std::error_code flush_for_export(const common::TableId& id) override;
    [[nodiscard]] std::error_code unlock_tables() override;
    [[nodiscard]] std::error_code discard_tablespace(const common::TableId& id, DiscardOutcome& out) override;
    [[nodiscard]] std::error_code import_tablespace(const common::TableId& id) override;

    [[nodiscard]] const StatementFailure& last_failure() const noexcept override { return last_failure_; }

private:
    struct Connection;
    using Row = std::vector<std::optional<std::string>>;

    explicit MysqlCommandClient(std::unique_ptr<Connection> connection) noexcept;

    [[nodiscard]] std::error_code execute(const std::string& statement, std::vector<Row>* rows);
    [[nodiscard]] std::error_code record_failure(const std::string& statement);
    [[nodiscard]] std::string string_literal(std::string_view text) const;
    [[nodiscard]] std::error_code read_global_variable(std::string_view name, std::string& out);
    [[nodiscard]] std::string tablespace_query(const common::TableId& id) const;

    std::unique_ptr<Connection> connection_{};
    std::filesystem::path datadir_{};
    std::uint32_t server_version_ = 0U;
    StatementFailure last_failure_{};
};

}  // namespace ibshrink::db
