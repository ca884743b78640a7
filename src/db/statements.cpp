#include "ibshrink/db/statements.hpp"

#include <cctype>
#include <cstdint>
#include <cstdio>

namespace ibshrink::db {

namespace {

std::string leading_keyword(std::string_view statement, std::size_t* end = nullptr)
{
    std::size_t index = 0U;
    while (index < statement.size() && std::isspace(static_cast<unsigned char>(statement[index])) != 0) {
        ++index;
    }
    std::string keyword;
    while (index < statement.size() && std::isalpha(static_cast<unsigned char>(statement[index])) != 0) {
        keyword.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(statement[index]))));
        ++index;
    }
    if (end != nullptr) {
        *end = index;
    }
    return keyword;
}

bool is_safe_filename_char(unsigned char ch) noexcept
{
    return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || ch == '_';
}

// Decodes one UTF-8 sequence; invalid bytes are returned as themselves.
std::uint32_t next_code_point(std::string_view text, std::size_t& index)
{
    const auto lead = static_cast<unsigned char>(text[index]);
    std::size_t length = 1U;
    std::uint32_t value = lead;
    if ((lead & 0xE0U) == 0xC0U) {
        length = 2U;
        value = lead & 0x1FU;
    } else if ((lead & 0xF0U) == 0xE0U) {
        length = 3U;
        value = lead & 0x0FU;
    } else if ((lead & 0xF8U) == 0xF0U) {
        length = 4U;
        value = lead & 0x07U;
    }

    if (length == 1U || index + length > text.size()) {
        ++index;
        return lead;
    }

    for (std::size_t offset = 1U; offset < length; ++offset) {
        const auto continuation = static_cast<unsigned char>(text[index + offset]);
        if ((continuation & 0xC0U) != 0x80U) {
            ++index;
            return lead;
        }
        value = (value << 6U) | (continuation & 0x3FU);
    }
    index += length;
    return value;
}

}  // namespace

std::string quote_identifier(std::string_view identifier)
{
    std::string quoted;
    quoted.reserve(identifier.size() + 2U);
    quoted.push_back('`');
    for (char ch : identifier) {
        if (ch == '`') {
            quoted.push_back('`');
        }
        quoted.push_back(ch);
    }
    quoted.push_back('`');
    return quoted;
}

std::string qualified_identifier(const common::TableId& id)
{
    return quote_identifier(id.schema) + "." + quote_identifier(id.table);
}

std::string engine_conversion_statement(const common::TableId& id, std::string_view engine)
{
    return "ALTER TABLE " + qualified_identifier(id) + " ENGINE=" + std::string{engine};
}

std::string flush_for_export_statement(const common::TableId& id)
{
    return "FLUSH TABLES " + qualified_identifier(id) + " FOR EXPORT";
}

std::string unlock_tables_statement()
{
    return "UNLOCK TABLES";
}

std::string discard_tablespace_statement(const common::TableId& id)
{
    return "ALTER TABLE " + qualified_identifier(id) + " DISCARD TABLESPACE";
}

std::string import_tablespace_statement(const common::TableId& id)
{
    return "ALTER TABLE " + qualified_identifier(id) + " IMPORT TABLESPACE";
}

std::string show_create_table_statement(const common::TableId& id)
{
    return "SHOW CREATE TABLE " + qualified_identifier(id);
}

std::string prepare_session_statement()
{
    return "SET SESSION foreign_key_checks=0";
}

bool is_mutating_statement(std::string_view statement)
{
    std::size_t keyword_end = 0U;
    const auto keyword = leading_keyword(statement, &keyword_end);
    if (keyword == "SELECT" || keyword == "SHOW") {
        return false;
    }
    if (keyword == "SET") {
        return leading_keyword(statement.substr(keyword_end)) != "SESSION";
    }
    return true;
}

std::string tablename_to_filename(std::string_view identifier)
{
    std::string encoded;
    encoded.reserve(identifier.size());
    std::size_t index = 0U;
    while (index < identifier.size()) {
        const auto ch = static_cast<unsigned char>(identifier[index]);
        if (is_safe_filename_char(ch)) {
            encoded.push_back(static_cast<char>(ch));
            ++index;
            continue;
        }
        const auto code_point = next_code_point(identifier, index);
        char buffer[8]{};
        std::snprintf(buffer, sizeof(buffer), "@%04x", static_cast<unsigned>(code_point & 0xFFFFU));
        encoded.append(buffer);
    }
    return encoded;
}

}  // namespace ibshrink::db
