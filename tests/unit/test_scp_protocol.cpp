// tests/unit/test_scp_protocol.cpp

#include "sshcomm/scp_protocol.hpp"

#include <doctest/doctest.h>

#include <string>

using namespace sshcomm;

TEST_SUITE("scp_protocol")
{
    TEST_CASE("split absolute path")
    {
        auto const target = scp::split_remote_path("/home/u/out.txt");

        REQUIRE(target.has_value());
        CHECK(target->directory == "/home/u");
        CHECK(target->filename == "out.txt");
    }

    TEST_CASE("split relative paths")
    {
        auto const bare = scp::split_remote_path("out.txt");
        REQUIRE(bare.has_value());
        CHECK(bare->directory == ".");
        CHECK(bare->filename == "out.txt");

        auto const nested = scp::split_remote_path("dir/sub/out.txt");
        REQUIRE(nested.has_value());
        CHECK(nested->directory == "dir/sub");
        CHECK(nested->filename == "out.txt");
    }

    TEST_CASE("split file in the root directory")
    {
        auto const target = scp::split_remote_path("/out.txt");
        REQUIRE(target.has_value());
        CHECK(target->directory == "/");
        CHECK(target->filename == "out.txt");

        auto const doubled = scp::split_remote_path("//out.txt");
        REQUIRE(doubled.has_value());
        CHECK(doubled->directory == "/");
    }

    TEST_CASE("repeated separators collapse")
    {
        auto const target = scp::split_remote_path("/tmp//x");
        REQUIRE(target.has_value());
        CHECK(target->directory == "/tmp");
        CHECK(target->filename == "x");
    }

    TEST_CASE("paths without a file name are rejected")
    {
        CHECK(scp::split_remote_path("").error() == error{error_code::invalid_argument});
        CHECK_FALSE(scp::split_remote_path("/").has_value());
        CHECK_FALSE(scp::split_remote_path("/home/u/").has_value());
        CHECK_FALSE(scp::split_remote_path("/home/..").has_value());
        CHECK_FALSE(scp::split_remote_path(".").has_value());
    }

    TEST_CASE("shell quoting")
    {
        CHECK(scp::shell_quote("/home/u") == "'/home/u'");
        CHECK(scp::shell_quote("") == "''");
        CHECK(scp::shell_quote("my dir") == "'my dir'");
        CHECK(scp::shell_quote("it's") == "'it'\\''s'");
        CHECK(scp::shell_quote("$(rm -rf /)") == "'$(rm -rf /)'");
    }

    TEST_CASE("sink command")
    {
        CHECK(scp::sink_command("scp", "/home/u") == "scp -vt '/home/u'");
        CHECK(scp::sink_command("/usr/bin/scp", ".") == "/usr/bin/scp -vt '.'");
    }

    TEST_CASE("control line")
    {
        CHECK(scp::control_line(0644, 5, "out.txt").value() == "C0644 5 out.txt\n");
        CHECK(scp::control_line(0644, 0, "empty").value() == "C0644 0 empty\n");
        CHECK(scp::control_line(0600, 1234567890123ULL, "big.bin").value() == "C0600 1234567890123 big.bin\n");
        CHECK(scp::control_line(07, 1, "x").value() == "C0007 1 x\n");
    }

    TEST_CASE("control line keeps only permission bits")
    {
        CHECK(scp::control_line(0100644, 1, "x").value() == "C0644 1 x\n");
    }

    TEST_CASE("control line rejects names the receiver would misparse")
    {
        CHECK_FALSE(scp::control_line(0644, 1, "").has_value());
        CHECK_FALSE(scp::control_line(0644, 1, "a/b").has_value());
        CHECK_FALSE(scp::control_line(0644, 1, "a\nC0644 1 b").has_value());
        CHECK_FALSE(scp::control_line(0644, 1, "..").has_value());
    }

    TEST_CASE("file names with spaces pass through")
    {
        CHECK(scp::control_line(0644, 3, "my file.txt").value() == "C0644 3 my file.txt\n");
    }

    TEST_CASE("acknowledgment bytes")
    {
        auto const ok = scp::parse_ack(0, "");
        REQUIRE(ok.has_value());
        CHECK(ok->is_ok());

        auto const warning = scp::parse_ack(1, "scp: /x: Permission denied");
        REQUIRE(warning.has_value());
        CHECK(warning->status == scp::ack_status::warning);
        CHECK(warning->message == "scp: /x: Permission denied");
        CHECK_FALSE(warning->is_ok());

        auto const fatal = scp::parse_ack(2, "protocol error");
        REQUIRE(fatal.has_value());
        CHECK(fatal->status == scp::ack_status::fatal);

        CHECK(scp::parse_ack('C', "").error() == error{error_code::remote_rejected});
    }

    TEST_CASE("end of file marker is a single NUL")
    {
        CHECK(scp::end_of_file_marker == 0x00);
    }
}
