#pragma once

#include "ibshrink/state/run_state.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace ibshrink::state {

// Line-oriented text image of a RunState:
//
//   ibshrink-run-state
//   <key>\t<value>            one per header field
//   table\t<field>\t...       one per record, in plan order
//   end\t<records>\t<crc32c>  crc covers every byte before this line
//
// Tab, newline and backslash inside values are backslash-escaped.
class RunStateCodec final {
public:
    static constexpr std::string_view kMagic = "ibshrink-run-state";
    static constexpr std::uint32_t kFormatVersion = 1U;

    [[nodiscard]] static std::string encode(const RunState& state);

    // Any failure is ShrinkErrc::CorruptState with the reason in detail.
    [[nodiscard]] static std::error_code decode(std::string_view text, RunState& out, std::string& detail);

    // Structural and phase/record consistency checks applied after decoding.
    [[nodiscard]] static std::error_code validate(const RunState& state, std::string& detail);
};

[[nodiscard]] std::string escape_field(std::string_view text);
[[nodiscard]] bool unescape_field(std::string_view text, std::string& out);

}  // namespace ibshrink::state
