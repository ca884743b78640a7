#pragma once

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace ibshrink::config {

inline constexpr std::string_view kDefaultProfileName = "default";

struct Profile final {
    std::string name{};
    std::filesystem::path workdir{};
    std::filesystem::path db_socket{};
    std::string db_user{};
    std::string db_password{};
    bool use_hardlink = false;
};

[[nodiscard]] std::optional<bool> parse_bool(std::string_view text);

// Reads one profile section from INI text; performs no filesystem checks.
[[nodiscard]] std::error_code parse_profile(std::istream& input,
                                            std::string_view profile_name,
                                            Profile& out,
                                            std::string& detail);

// Workdir must be an existing directory (ConfigError); the socket must exist (ConnectionError).
[[nodiscard]] std::error_code validate_profile_paths(const Profile& profile, std::string& detail);

[[nodiscard]] std::error_code load_profile(const std::filesystem::path& config_path,
                                           std::string_view profile_name,
                                           Profile& out,
                                           std::string& detail);

}  // namespace ibshrink::config
