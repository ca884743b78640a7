#include "ibshrink/db/mysql_command_client.hpp"

#include "ibshrink/common/errors.hpp"
#include "ibshrink/db/statements.hpp"

#include <mysql.h>

#include <algorithm>
#include <cctype>
#include <utility>

namespace ibshrink::db {

namespace {

using common::ShrinkErrc;

// Server and client error numbers; spelled out because the MySQL and MariaDB
// headers do not agree on which of these they define.
constexpr unsigned int kErTablespaceMissing = 1812U;
constexpr unsigned int kErTablespaceDiscarded = 1814U;
constexpr unsigned int kCrServerGoneError = 2006U;
constexpr unsigned int kCrServerLost = 2013U;

constexpr std::uint32_t kMysql57 = 50700U;
constexpr std::uint32_t kMysql80 = 80000U;

struct ResultDeleter final {
    void operator()(MYSQL_RES* result) const noexcept
    {
        if (result != nullptr) {
            mysql_free_result(result);
        }
    }
};

using ResultPtr = std::unique_ptr<MYSQL_RES, ResultDeleter>;

std::string like_prefix(std::string_view text)
{
    std::string escaped;
    escaped.reserve(text.size());
    for (char ch : text) {
        if (ch == '%' || ch == '_' || ch == '\\') {
            escaped.push_back('\\');
        }
        escaped.push_back(ch);
    }
    return escaped;
}

bool contains_partition_marker(std::string_view name)
{
    return name.find("#P#") != std::string_view::npos || name.find("#p#") != std::string_view::npos;
}

std::string to_lower(std::string_view text)
{
    std::string lowered{text};
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return lowered;
}

}  // namespace

struct MysqlCommandClient::Connection final {
    explicit Connection(MYSQL* value) noexcept
        : handle{value}
    {
    }

    ~Connection()
    {
        if (handle != nullptr) {
            mysql_close(handle);
        }
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    MYSQL* handle = nullptr;
};

std::error_code MysqlCommandClient::connect(const config::Profile& profile,
                                            std::unique_ptr<MysqlCommandClient>& out,
                                            StatementFailure& failure)
{
    out.reset();
    failure = StatementFailure{};

    auto connection = std::make_unique<Connection>(mysql_init(nullptr));
    if (connection->handle == nullptr) {
        failure.driver_message = "mysql_init failed: out of memory";
        return ShrinkErrc::ConnectionError;
    }

    if (mysql_options(connection->handle, MYSQL_SET_CHARSET_NAME, "utf8mb4") != 0) {
        failure.driver_code = mysql_errno(connection->handle);
        failure.driver_message = "unable to select the utf8mb4 client character set";
        return ShrinkErrc::ConnectionError;
    }

    const char* user = profile.db_user.empty() ? nullptr : profile.db_user.c_str();
    const char* password = profile.db_password.empty() ? nullptr : profile.db_password.c_str();
    const auto socket = profile.db_socket.string();
    if (mysql_real_connect(connection->handle, "localhost", user, password, nullptr, 0U, socket.c_str(), 0U) == nullptr) {
        failure.driver_code = mysql_errno(connection->handle);
        failure.driver_message = mysql_error(connection->handle);
        return ShrinkErrc::ConnectionError;
    }

    out.reset(new MysqlCommandClient(std::move(connection)));
    out->server_version_ = static_cast<std::uint32_t>(mysql_get_server_version(out->connection_->handle));
    return {};
}

MysqlCommandClient::MysqlCommandClient(std::unique_ptr<Connection> connection) noexcept
    : connection_{std::move(connection)}
{
}

MysqlCommandClient::~MysqlCommandClient() = default;

std::error_code MysqlCommandClient::record_failure(const std::string& statement)
{
    last_failure_.statement = statement;
    last_failure_.driver_code = mysql_errno(connection_->handle);
    last_failure_.driver_message = mysql_error(connection_->handle);
    if (last_failure_.driver_code == kCrServerGoneError || last_failure_.driver_code == kCrServerLost) {
        return ShrinkErrc::ConnectionError;
    }
    return ShrinkErrc::StatementExecution;
}

std::error_code MysqlCommandClient::execute(const std::string& statement, std::vector<Row>* rows)
{
    if (rows != nullptr) {
        rows->clear();
    }

    auto* handle = connection_->handle;
    if (mysql_real_query(handle, statement.data(), static_cast<unsigned long>(statement.size())) != 0) {
        return record_failure(statement);
    }

    ResultPtr result{mysql_store_result(handle)};
    if (!result) {
        if (mysql_field_count(handle) != 0U) {
            return record_failure(statement);
        }
        return {};
    }

    if (rows == nullptr) {
        return {};
    }

    const auto field_count = mysql_num_fields(result.get());
    while (MYSQL_ROW row = mysql_fetch_row(result.get())) {
        const auto* lengths = mysql_fetch_lengths(result.get());
        Row values;
        values.reserve(field_count);
        for (unsigned int index = 0; index < field_count; ++index) {
            if (row[index] == nullptr) {
                values.emplace_back(std::nullopt);
            } else {
                values.emplace_back(std::string(row[index], lengths[index]));
            }
        }
        rows->push_back(std::move(values));
    }

    if (mysql_errno(handle) != 0U) {
        return record_failure(statement);
    }
    return {};
}

std::string MysqlCommandClient::string_literal(std::string_view text) const
{
    std::string buffer(text.size() * 2U + 1U, '\0');
    const auto length = mysql_real_escape_string(connection_->handle,
                                                 buffer.data(),
                                                 text.data(),
                                                 static_cast<unsigned long>(text.size()));
    buffer.resize(length);
    return "'" + buffer + "'";
}

std::error_code MysqlCommandClient::read_global_variable(std::string_view name, std::string& out)
{
    const auto statement = "SHOW GLOBAL VARIABLES LIKE " + string_literal(name);
    std::vector<Row> rows;
    if (auto ec = execute(statement, &rows); ec) {
        return ec;
    }
    if (rows.empty() || rows.front().size() < 2U || !rows.front()[1]) {
        last_failure_.statement = statement;
        last_failure_.driver_code = 0U;
        last_failure_.driver_message = "server variable " + std::string{name} + " is not available";
        return ShrinkErrc::StatementExecution;
    }
    out = *rows.front()[1];
    return {};
}

std::error_code MysqlCommandClient::read_server_settings(ServerSettings& out)
{
    out = ServerSettings{};

    std::string datadir;
    if (auto ec = read_global_variable("datadir", datadir); ec) {
        return ec;
    }
    std::string file_per_table;
    if (auto ec = read_global_variable("innodb_file_per_table", file_per_table); ec) {
        return ec;
    }

    datadir_ = std::filesystem::path{datadir}.lexically_normal();
    const auto flag = to_lower(file_per_table);
    out.datadir = datadir_;
    out.file_per_table = flag == "on" || flag == "1" || flag == "yes" || flag == "true";
    out.server_version = server_version_;
    return {};
}

std::error_code MysqlCommandClient::prepare_session()
{
    return execute(prepare_session_statement(), nullptr);
}

std::error_code MysqlCommandClient::list_tables(const SchemaFilter& filter, std::vector<TableInfo>& out)
{
    out.clear();

    std::string statement =
        "SELECT table_schema, table_name, engine FROM information_schema.tables WHERE table_type = 'BASE TABLE'";
    if (!filter.excluded_schemas.empty()) {
        statement += " AND table_schema NOT IN (";
        for (std::size_t index = 0; index < filter.excluded_schemas.size(); ++index) {
            if (index > 0U) {
                statement += ", ";
            }
            statement += string_literal(filter.excluded_schemas[index]);
        }
        statement += ")";
    }
    statement += " ORDER BY table_schema, table_name";

    std::vector<Row> rows;
    if (auto ec = execute(statement, &rows); ec) {
        return ec;
    }

    out.reserve(rows.size());
    for (auto& row : rows) {
        if (row.size() < 3U || !row[0] || !row[1]) {
            continue;
        }
        TableInfo info{};
        info.id.schema = std::move(*row[0]);
        info.id.table = std::move(*row[1]);
        info.engine = row[2].value_or(std::string{});
        out.push_back(std::move(info));
    }
    return {};
}

std::string MysqlCommandClient::tablespace_query(const common::TableId& id) const
{
    const auto encoded = tablename_to_filename(id.schema) + "/" + tablename_to_filename(id.table);
    const auto partitions = like_prefix(encoded) + "#%";

    std::string tables_view = "information_schema.innodb_sys_tables";
    std::string datafiles_view = "information_schema.innodb_sys_datafiles";
    std::string space_type = "NULL";
    if (server_version_ >= kMysql80) {
        tables_view = "information_schema.innodb_tables";
        datafiles_view = "information_schema.innodb_datafiles";
        space_type = "t.space_type";
    } else if (server_version_ >= kMysql57) {
        space_type = "t.space_type";
    }

    return "SELECT t.name, t.space, " + space_type + ", f.path FROM " + tables_view + " t LEFT JOIN "
        + datafiles_view + " f ON f.space = t.space WHERE t.name = " + string_literal(encoded)
        + " OR t.name LIKE " + string_literal(partitions) + " ORDER BY t.name";
}

std::error_code MysqlCommandClient::get_physical_file_paths(const common::TableId& id, PhysicalFiles& out)
{
    out = PhysicalFiles{};

    std::vector<Row> rows;
    if (auto ec = execute(tablespace_query(id), &rows); ec) {
        return ec;
    }

    if (rows.empty()) {
        out.layout = TablespaceLayout::Missing;
        return {};
    }

    bool partitioned = false;
    for (const auto& row : rows) {
        if (row.size() < 4U || !row[0]) {
            continue;
        }
        if (contains_partition_marker(*row[0])) {
            partitioned = true;
        }

        const auto space = row[1].value_or(std::string{"0"});
        const auto type = to_lower(row[2].value_or(std::string{}));
        if (space == "0" || type == "system") {
            out.layout = TablespaceLayout::SystemTablespace;
            return {};
        }
        if (type == "general") {
            out.layout = TablespaceLayout::GeneralTablespace;
            return {};
        }

        if (row[3]) {
            std::filesystem::path path{*row[3]};
            if (path.is_relative()) {
                path = datadir_ / path;
            }
            out.data_files.push_back(path.lexically_normal());
        }
    }

    if (partitioned) {
        out.layout = TablespaceLayout::Partitioned;
    } else if (out.data_files.empty()) {
        out.layout = TablespaceLayout::Missing;
    } else {
        out.layout = TablespaceLayout::FilePerTable;
    }
    return {};
}

std::error_code MysqlCommandClient::show_create_table(const common::TableId& id, std::string& out)
{
    out.clear();
    const auto statement = show_create_table_statement(id);
    std::vector<Row> rows;
    if (auto ec = execute(statement, &rows); ec) {
        return ec;
    }
    if (rows.empty() || rows.front().size() < 2U || !rows.front()[1]) {
        last_failure_.statement = statement;
        last_failure_.driver_code = 0U;
        last_failure_.driver_message = "empty table definition";
        return ShrinkErrc::StatementExecution;
    }
    out = *rows.front()[1];
    return {};
}

std::error_code MysqlCommandClient::execute_engine_conversion(const common::TableId& id, std::string_view target_engine)
{
    return execute(engine_conversion_statement(id, target_engine), nullptr);
}

std::error_code MysqlCommandClient::flush_for_export(const common::TableId& id)
{
    return execute(flush_for_export_statement(id), nullptr);
}

std::error_code MysqlCommandClient::unlock_tables()
{
    return execute(unlock_tables_statement(), nullptr);
}

std::error_code MysqlCommandClient::discard_tablespace(const common::TableId& id, DiscardOutcome& out)
{
    out = DiscardOutcome::Discarded;
    const auto ec = execute(discard_tablespace_statement(id), nullptr);
    if (ec == ShrinkErrc::StatementExecution
        && (last_failure_.driver_code == kErTablespaceMissing || last_failure_.driver_code == kErTablespaceDiscarded)) {
        out = DiscardOutcome::AlreadyAbsent;
        return {};
    }
    return ec;
}

std::error_code MysqlCommandClient::import_tablespace(const common::TableId& id)
{
    return execute(import_tablespace_statement(id), nullptr);
}

}  // namespace ibshrink::db
