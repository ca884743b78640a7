#pragma once

#include "ibshrink/common/errors.hpp"
#include "ibshrink/db/command_client.hpp"
#include "ibshrink/db/statements.hpp"
#include "ibshrink/transfer/file_transfer.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ibshrink::testing {

inline std::filesystem::path make_temp_directory(const std::string& prefix)
{
    auto root = std::filesystem::temp_directory_path();
    auto path = root / (prefix + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    std::filesystem::remove_all(path);
    std::filesystem::create_directories(path);
    return path;
}

// A fresh directory under /dev/shm when that is a different filesystem from the temp directory.
inline std::optional<std::filesystem::path> make_directory_on_other_filesystem(const std::string& prefix)
{
    const std::filesystem::path shm{"/dev/shm"};
    std::error_code ec;
    if (!std::filesystem::is_directory(shm, ec)) {
        return std::nullopt;
    }
    bool same = true;
    if (transfer::FileTransferUnit::same_device(shm, std::filesystem::temp_directory_path(), same) || same) {
        return std::nullopt;
    }
    auto path = shm / (prefix + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    std::filesystem::create_directories(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return path;
}

inline void write_file(const std::filesystem::path& path, const std::string& contents)
{
    std::filesystem::create_directories(path.parent_path());
    std::ofstream stream{path, std::ios::binary | std::ios::trunc};
    stream << contents;
}

inline std::string read_file(const std::filesystem::path& path)
{
    std::ifstream stream{path, std::ios::binary};
    return std::string{std::istreambuf_iterator<char>{stream}, std::istreambuf_iterator<char>{}};
}

// Scripted stand-in for a MySQL server whose tablespace files live in a real directory.
class FakeCommandClient final : public db::CommandClient {
public:
    struct Table final {
        common::TableId id{};
        std::string engine{};
        db::TablespaceLayout layout = db::TablespaceLayout::FilePerTable;
        std::filesystem::path data_file{};
        bool tablespace_attached = true;
    };

    explicit FakeCommandClient(std::filesystem::path datadir)
    {
        settings_.datadir = std::move(datadir);
        settings_.file_per_table = true;
        settings_.server_version = 80036U;
    }

    db::ServerSettings& settings() noexcept { return settings_; }

    // InnoDB file-per-table tables get a real .ibd with the given contents.
    Table& add_table(const std::string& schema,
                     const std::string& table,
                     std::string engine = "InnoDB",
                     std::string contents = {},
                     db::TablespaceLayout layout = db::TablespaceLayout::FilePerTable)
    {
        Table entry{};
        entry.id = {schema, table};
        entry.engine = std::move(engine);
        entry.layout = layout;
        if (is_innodb(entry.engine) && layout == db::TablespaceLayout::FilePerTable) {
            entry.data_file = settings_.datadir / schema / (table + ".ibd");
            write_file(entry.data_file, contents.empty() ? "tablespace:" + schema + "." + table : contents);
        }
        auto [it, inserted] = tables_.insert_or_assign(entry.id, std::move(entry));
        return it->second;
    }

    void drop_table(const common::TableId& id)
    {
        tables_.erase(id);
    }

    [[nodiscard]] const Table* table(const common::TableId& id) const
    {
        auto it = tables_.find(id);
        return it == tables_.end() ? nullptr : &it->second;
    }

    // Stands in for deleting the core files and restarting the server.
    void detach_all_tablespaces()
    {
        for (auto& [id, entry] : tables_) {
            if (!entry.data_file.empty()) {
                std::filesystem::remove(entry.data_file);
                std::filesystem::remove(cfg_path(entry));
                entry.tablespace_attached = false;
            }
        }
    }

    // The next matching call fails with the given driver error.
    void fail_next(std::string operation,
                   std::optional<common::TableId> id = std::nullopt,
                   std::uint32_t driver_code = 1105U,
                   std::string message = "injected failure")
    {
        failures_.push_back({std::move(operation), std::move(id), driver_code, std::move(message)});
    }

    [[nodiscard]] const std::vector<std::string>& statements() const noexcept { return statements_; }

    [[nodiscard]] std::vector<std::string> mutating_statements() const
    {
        std::vector<std::string> out;
        std::copy_if(statements_.begin(), statements_.end(), std::back_inserter(out), [](const std::string& statement) {
            return db::is_mutating_statement(statement);
        });
        return out;
    }

    [[nodiscard]] std::size_t count_statements(std::string_view needle) const
    {
        return static_cast<std::size_t>(std::count_if(statements_.begin(), statements_.end(), [&](const std::string& statement) {
            return statement.find(needle) != std::string::npos;
        }));
    }

    void clear_statements() { statements_.clear(); }

    [[nodiscard]] bool export_locked() const noexcept { return export_locked_; }

    std::error_code read_server_settings(db::ServerSettings& out) override
    {
        if (auto ec = issue("SHOW GLOBAL VARIABLES", "read_server_settings", nullptr); ec) {
            return ec;
        }
        out = settings_;
        return {};
    }

    std::error_code prepare_session() override
    {
        return issue(db::prepare_session_statement(), "prepare_session", nullptr);
    }

    std::error_code list_tables(const db::SchemaFilter& filter, std::vector<db::TableInfo>& out) override
    {
        out.clear();
        if (auto ec = issue("SELECT table_schema, table_name, engine FROM information_schema.tables", "list_tables", nullptr); ec) {
            return ec;
        }
        // Reverse order so callers cannot rely on the server sorting.
        for (auto it = tables_.rbegin(); it != tables_.rend(); ++it) {
            const auto& excluded = filter.excluded_schemas;
            if (std::find(excluded.begin(), excluded.end(), it->first.schema) != excluded.end()) {
                continue;
            }
            out.push_back({it->first, it->second.engine});
        }
        return {};
    }

    std::error_code get_physical_file_paths(const common::TableId& id, db::PhysicalFiles& out) override
    {
        out = db::PhysicalFiles{};
        if (auto ec = issue("SELECT path FROM information_schema.innodb_datafiles", "get_physical_file_paths", &id); ec) {
            return ec;
        }
        const auto* entry = table(id);
        if (entry == nullptr) {
            return {};
        }
        out.layout = entry->layout;
        if (!entry->data_file.empty()) {
            out.data_files.push_back(entry->data_file);
        }
        return {};
    }

    std::error_code show_create_table(const common::TableId& id, std::string& out) override
    {
        if (auto ec = issue(db::show_create_table_statement(id), "show_create_table", &id); ec) {
            return ec;
        }
        out = "CREATE TABLE " + db::quote_identifier(id.table) + " (id int) ENGINE=InnoDB";
        return {};
    }

    std::error_code execute_engine_conversion(const common::TableId& id, std::string_view target_engine) override
    {
        if (auto ec = issue(db::engine_conversion_statement(id, target_engine), "execute_engine_conversion", &id); ec) {
            return ec;
        }
        if (auto it = tables_.find(id); it != tables_.end()) {
            it->second.engine = std::string{target_engine};
        }
        return {};
    }

    std::error_code flush_for_export(const common::TableId& id) override
    {
        if (auto ec = issue(db::flush_for_export_statement(id), "flush_for_export", &id); ec) {
            return ec;
        }
        export_locked_ = true;
        if (auto it = tables_.find(id); it != tables_.end() && !it->second.data_file.empty()) {
            write_file(cfg_path(it->second), "cfg:" + id.qualified_name());
            flushed_ = id;
        }
        return {};
    }

    std::error_code unlock_tables() override
    {
        ++unlock_count_;
        if (auto ec = issue(db::unlock_tables_statement(), "unlock_tables", nullptr); ec) {
            return ec;
        }
        export_locked_ = false;
        if (flushed_) {
            if (auto it = tables_.find(*flushed_); it != tables_.end()) {
                std::filesystem::remove(cfg_path(it->second));
            }
            flushed_.reset();
        }
        return {};
    }

    std::error_code discard_tablespace(const common::TableId& id, db::DiscardOutcome& out) override
    {
        if (auto ec = issue(db::discard_tablespace_statement(id), "discard_tablespace", &id); ec) {
            return ec;
        }
        auto it = tables_.find(id);
        if (it == tables_.end() || !it->second.tablespace_attached) {
            out = db::DiscardOutcome::AlreadyAbsent;
            return {};
        }
        std::filesystem::remove(it->second.data_file);
        it->second.tablespace_attached = false;
        out = db::DiscardOutcome::Discarded;
        return {};
    }

    std::error_code import_tablespace(const common::TableId& id) override
    {
        if (auto ec = issue(db::import_tablespace_statement(id), "import_tablespace", &id); ec) {
            return ec;
        }
        auto it = tables_.find(id);
        if (it == tables_.end() || !std::filesystem::exists(it->second.data_file)) {
            last_failure_ = {db::import_tablespace_statement(id), 1812U, "Tablespace is missing for table"};
            return common::ShrinkErrc::StatementExecution;
        }
        it->second.tablespace_attached = true;
        ++imports_;
        return {};
    }

    const db::StatementFailure& last_failure() const noexcept override { return last_failure_; }

    [[nodiscard]] int unlock_count() const noexcept { return unlock_count_; }
    [[nodiscard]] int import_count() const noexcept { return imports_; }

private:
    struct Failure final {
        std::string operation{};
        std::optional<common::TableId> id{};
        std::uint32_t driver_code = 0U;
        std::string message{};
    };

    static bool is_innodb(std::string_view engine)
    {
        return std::equal(engine.begin(), engine.end(), db::kEngineInnoDb.begin(), db::kEngineInnoDb.end(), [](char lhs, char rhs) {
            return std::tolower(static_cast<unsigned char>(lhs)) == std::tolower(static_cast<unsigned char>(rhs));
        });
    }

    static std::filesystem::path cfg_path(const Table& entry)
    {
        auto path = entry.data_file;
        path.replace_extension(".cfg");
        return path;
    }

    std::error_code issue(const std::string& statement, std::string_view operation, const common::TableId* id)
    {
        statements_.push_back(statement);
        for (auto it = failures_.begin(); it != failures_.end(); ++it) {
            if (it->operation != operation) {
                continue;
            }
            if (it->id && (id == nullptr || *it->id != *id)) {
                continue;
            }
            last_failure_ = {statement, it->driver_code, it->message};
            failures_.erase(it);
            return common::ShrinkErrc::StatementExecution;
        }
        return {};
    }

    db::ServerSettings settings_{};
    std::map<common::TableId, Table> tables_{};
    std::vector<Failure> failures_{};
    std::vector<std::string> statements_{};
    db::StatementFailure last_failure_{};
    std::optional<common::TableId> flushed_{};
    bool export_locked_ = false;
    int unlock_count_ = 0;
    int imports_ = 0;
};

}  // namespace ibshrink::testing
