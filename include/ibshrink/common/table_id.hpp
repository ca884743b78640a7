#pragma once

#include <compare>
#include <string>

namespace ibshrink::common {

struct TableId final {
    std::string schema{};
    std::string table{};

    [[nodiscard]] std::string qualified_name() const
    {
        return schema + "." + table;
    }

    friend auto operator<=>(const TableId&, const TableId&) = default;
    friend bool operator==(const TableId&, const TableId&) = default;
};

}  // namespace ibshrink::common
