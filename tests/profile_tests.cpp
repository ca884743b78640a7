#include "ibshrink/common/errors.hpp"
#include "ibshrink/config/profile.hpp"

#include "fake_command_client.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <sstream>
#include <string>

using ibshrink::common::ShrinkErrc;
using ibshrink::config::Profile;
using ibshrink::config::parse_profile;

TEST_CASE("parse_profile reads the requested section")
{
    std::istringstream input{
        "[default]\n"
        "workdir = /var/tmp/shrink\n"
        "db_socket = /run/mysqld/mysqld.sock\n"
        "\n"
        "[replica]\n"
        "workdir = /srv/shrink/\n"
        "db_socket = /run/mysqld/replica.sock\n"
        "db_user = admin\n"
        "db_password = secret\n"
        "use_hardlink = Yes\n"};

    Profile profile{};
    std::string detail;
    REQUIRE_FALSE(parse_profile(input, "replica", profile, detail));

    CHECK(profile.name == "replica");
    CHECK(profile.workdir == std::filesystem::path{"/srv/shrink/"}.lexically_normal());
    CHECK(profile.db_socket == "/run/mysqld/replica.sock");
    CHECK(profile.db_user == "admin");
    CHECK(profile.db_password == "secret");
    CHECK(profile.use_hardlink);
}

TEST_CASE("parse_profile defaults optional keys")
{
    std::istringstream input{"[default]\nworkdir=/tmp/w\ndb_socket=/tmp/s.sock\n"};
    Profile profile{};
    std::string detail;
    REQUIRE_FALSE(parse_profile(input, "default", profile, detail));

    CHECK(profile.db_user.empty());
    CHECK(profile.db_password.empty());
    CHECK_FALSE(profile.use_hardlink);
}

TEST_CASE("parse_profile rejects invalid profiles")
{
    std::string detail;
    Profile profile{};

    SECTION("missing section")
    {
        std::istringstream input{"[default]\nworkdir=/tmp/w\ndb_socket=/tmp/s\n"};
        CHECK(parse_profile(input, "other", profile, detail) == ShrinkErrc::ConfigError);
        CHECK(detail.find("[other]") != std::string::npos);
    }
    SECTION("missing workdir")
    {
        std::istringstream input{"[default]\ndb_socket=/tmp/s\n"};
        CHECK(parse_profile(input, "default", profile, detail) == ShrinkErrc::ConfigError);
        CHECK(detail.find("workdir") != std::string::npos);
    }
    SECTION("missing socket")
    {
        std::istringstream input{"[default]\nworkdir=/tmp/w\n"};
        CHECK(parse_profile(input, "default", profile, detail) == ShrinkErrc::ConfigError);
        CHECK(detail.find("db_socket") != std::string::npos);
    }
    SECTION("unknown key")
    {
        std::istringstream input{"[default]\nworkdir=/tmp/w\ndb_socket=/tmp/s\nworkdri=/tmp/x\n"};
        CHECK(parse_profile(input, "default", profile, detail) == ShrinkErrc::ConfigError);
        CHECK(detail.find("workdri") != std::string::npos);
    }
    SECTION("relative workdir")
    {
        std::istringstream input{"[default]\nworkdir=shrink\ndb_socket=/tmp/s\n"};
        CHECK(parse_profile(input, "default", profile, detail) == ShrinkErrc::ConfigError);
    }
    SECTION("bad boolean")
    {
        std::istringstream input{"[default]\nworkdir=/tmp/w\ndb_socket=/tmp/s\nuse_hardlink=sometimes\n"};
        CHECK(parse_profile(input, "default", profile, detail) == ShrinkErrc::ConfigError);
        CHECK(detail.find("sometimes") != std::string::npos);
    }
    SECTION("malformed text")
    {
        std::istringstream input{"[default\nworkdir=/tmp/w\n"};
        CHECK(parse_profile(input, "default", profile, detail) == ShrinkErrc::ConfigError);
    }
}

TEST_CASE("parse_bool accepts the usual spellings")
{
    CHECK(ibshrink::config::parse_bool("yes") == true);
    CHECK(ibshrink::config::parse_bool(" TRUE ") == true);
    CHECK(ibshrink::config::parse_bool("1") == true);
    CHECK(ibshrink::config::parse_bool("off") == false);
    CHECK_FALSE(ibshrink::config::parse_bool("y").has_value());
}

TEST_CASE("load_profile checks the workdir and socket on disk")
{
    auto dir = ibshrink::testing::make_temp_directory("ibshrink_profile_");
    const auto workdir = dir / "work";
    const auto socket = dir / "mysqld.sock";
    const auto config = dir / "ibshrink.ini";
    std::filesystem::create_directories(workdir);

    ibshrink::testing::write_file(config, "[default]\nworkdir=" + workdir.string() + "\ndb_socket=" + socket.string() + "\n");

    Profile profile{};
    std::string detail;
    CHECK(ibshrink::config::load_profile(config, "default", profile, detail) == ShrinkErrc::ConnectionError);

    ibshrink::testing::write_file(socket, "");
    REQUIRE_FALSE(ibshrink::config::load_profile(config, "default", profile, detail));
    CHECK(profile.workdir == workdir);

    std::filesystem::remove_all(workdir);
    CHECK(ibshrink::config::load_profile(config, "default", profile, detail) == ShrinkErrc::ConfigError);
    CHECK(ibshrink::config::load_profile(dir / "absent.ini", "default", profile, detail) == ShrinkErrc::ConfigError);

    std::filesystem::remove_all(dir);
}
