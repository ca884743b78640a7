#include "ibshrink/config/profile.hpp"

#include "ibshrink/common/errors.hpp"

#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>

namespace ibshrink::config {

namespace {

using common::ShrinkErrc;

constexpr std::array<std::string_view, 5> kRecognizedKeys{
    "workdir", "db_socket", "db_user", "db_password", "use_hardlink"};

std::string trim(std::string_view text)
{
    std::size_t start = 0U;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start])) != 0) {
        ++start;
    }
    std::size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1U])) != 0) {
        --end;
    }
    return std::string{text.substr(start, end - start)};
}

std::string to_lower(std::string_view text)
{
    std::string lowered{text};
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return lowered;
}

const boost::property_tree::ptree* find_section(const boost::property_tree::ptree& tree, std::string_view name)
{
    for (const auto& [key, child] : tree) {
        if (key == name && !child.empty()) {
            return &child;
        }
    }
    return nullptr;
}

}  // namespace

std::optional<bool> parse_bool(std::string_view text)
{
    const auto value = to_lower(trim(text));
    if (value == "yes" || value == "true" || value == "on" || value == "1") {
        return true;
    }
    if (value == "no" || value == "false" || value == "off" || value == "0") {
        return false;
    }
    return std::nullopt;
}

std::error_code parse_profile(std::istream& input,
                              std::string_view profile_name,
                              Profile& out,
                              std::string& detail)
{
    detail.clear();
    out = Profile{};

    boost::property_tree::ptree tree;
    try {
        boost::property_tree::ini_parser::read_ini(input, tree);
    } catch (const boost::property_tree::ini_parser_error& error) {
        detail = "malformed configuration: " + error.message() + " (line " + std::to_string(error.line()) + ")";
        return ShrinkErrc::ConfigError;
    }

    const auto* section = find_section(tree, profile_name);
    if (section == nullptr) {
        detail = "profile [" + std::string{profile_name} + "] not found in configuration";
        return ShrinkErrc::ConfigError;
    }

    bool has_workdir = false;
    bool has_socket = false;
    for (const auto& [key, child] : *section) {
        if (std::find(kRecognizedKeys.begin(), kRecognizedKeys.end(), key) == kRecognizedKeys.end()) {
            detail = "unknown key '" + key + "' in profile [" + std::string{profile_name} + "]";
            return ShrinkErrc::ConfigError;
        }

        const auto value = trim(child.data());
        if (key == "workdir") {
            out.workdir = std::filesystem::path{value};
            has_workdir = !value.empty();
        } else if (key == "db_socket") {
            out.db_socket = std::filesystem::path{value};
            has_socket = !value.empty();
        } else if (key == "db_user") {
            out.db_user = value;
        } else if (key == "db_password") {
            out.db_password = value;
        } else if (key == "use_hardlink") {
            const auto flag = parse_bool(value);
            if (!flag) {
                detail = "use_hardlink must be a boolean (yes/no), got '" + value + "'";
                return ShrinkErrc::ConfigError;
            }
            out.use_hardlink = *flag;
        }
    }

    if (!has_workdir) {
        detail = "mandatory parameter workdir not found in profile [" + std::string{profile_name} + "]";
        return ShrinkErrc::ConfigError;
    }
    if (!has_socket) {
        detail = "mandatory parameter db_socket not found in profile [" + std::string{profile_name} + "]";
        return ShrinkErrc::ConfigError;
    }
    if (!out.workdir.is_absolute()) {
        detail = "workdir must be an absolute path, got '" + out.workdir.string() + "'";
        return ShrinkErrc::ConfigError;
    }

    out.workdir = out.workdir.lexically_normal();
    out.name = std::string{profile_name};
    return {};
}

std::error_code validate_profile_paths(const Profile& profile, std::string& detail)
{
    detail.clear();

    std::error_code ec;
    if (!std::filesystem::is_directory(profile.workdir, ec)) {
        detail = "workdir " + profile.workdir.string() + " does not exist or is not a directory";
        return ShrinkErrc::ConfigError;
    }

    ec.clear();
    if (!std::filesystem::exists(profile.db_socket, ec)) {
        detail = "database socket " + profile.db_socket.string() + " does not exist";
        return ShrinkErrc::ConnectionError;
    }

    return {};
}

std::error_code load_profile(const std::filesystem::path& config_path,
                             std::string_view profile_name,
                             Profile& out,
                             std::string& detail)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(config_path, ec)) {
        detail = "configuration file " + config_path.string() + " not found";
        return ShrinkErrc::ConfigError;
    }

    std::ifstream stream{config_path};
    if (!stream) {
        detail = "unable to open configuration file " + config_path.string();
        return ShrinkErrc::ConfigError;
    }

    if (auto parse_ec = parse_profile(stream, profile_name, out, detail); parse_ec) {
        return parse_ec;
    }
    return validate_profile_paths(out, detail);
}

}  // namespace ibshrink::config
