// tests/integration/test_ssh_host.cpp - end-to-end against a real sshd
// WARNING: requires SSHCOMM_TEST_HOST (and usually SSHCOMM_TEST_USER plus a key or
// SSHCOMM_TEST_PASSWORD); files are written under /tmp on that host

#include "sshcomm/communicator.hpp"
#include "sshcomm/libssh_transport.hpp"

#include <doctest/doctest.h>

#include <cstdlib>
#include <sstream>
#include <string>

namespace
{

    [[nodiscard]] auto env_or(char const *name, std::string fallback = {}) -> std::string
    {
        char const *value = std::getenv(name);
        return value != nullptr ? std::string{value} : fallback;
    }

    [[nodiscard]] auto test_host_configured() noexcept -> bool
    {
        return std::getenv("SSHCOMM_TEST_HOST") != nullptr;
    }

    [[nodiscard]] auto connect_to_test_host() -> std::shared_ptr<sshcomm::libssh_connection>
    {
        sshcomm::connection_config config;
        config.host = env_or("SSHCOMM_TEST_HOST");
        config.port = std::stoi(env_or("SSHCOMM_TEST_PORT", "22"));
        config.username = env_or("SSHCOMM_TEST_USER");
        config.password = env_or("SSHCOMM_TEST_PASSWORD");
        config.private_key_path = env_or("SSHCOMM_TEST_KEY");

        auto conn = sshcomm::libssh_connection::connect(config);
        REQUIRE(conn.has_value());
        return *conn;
    }

    // run a command and hand back its stdout
    [[nodiscard]] auto run(sshcomm::communicator &comm, std::string const &command) -> std::string
    {
        std::ostringstream out;
        auto running = comm.start(sshcomm::remote_command{command, nullptr, &out, nullptr});
        REQUIRE(running.has_value());
        CHECK(running->wait() == 0);
        return out.str();
    }

    [[nodiscard]] auto trim(std::string text) -> std::string
    {
        while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' '))
        {
            text.pop_back();
        }
        return text;
    }

} // anonymous namespace

TEST_SUITE("ssh_host_integration" * doctest::skip(!test_host_configured()))
{
    TEST_CASE("echo ok exits with 0")
    {
        sshcomm::communicator comm{connect_to_test_host()};

        CHECK(trim(run(comm, "echo ok")) == "ok");
    }

    TEST_CASE("exit 7 is reported")
    {
        sshcomm::communicator comm{connect_to_test_host()};

        auto running = comm.start(sshcomm::remote_command{"exit 7"});
        REQUIRE(running.has_value());
        CHECK(running->wait() == 7);
    }

    TEST_CASE("pty is attached")
    {
        sshcomm::communicator comm{connect_to_test_host()};

        CHECK(trim(run(comm, "test -t 0 && echo tty")) == "tty");
        CHECK(trim(run(comm, "tput cols 2>/dev/null || stty size | cut -d' ' -f2")) == "80");
    }

    TEST_CASE("two commands on one connection")
    {
        sshcomm::communicator comm{connect_to_test_host()};

        auto slow = comm.start(sshcomm::remote_command{"sleep 1; exit 4"});
        auto fast = comm.start(sshcomm::remote_command{"exit 2"});
        REQUIRE(slow.has_value());
        REQUIRE(fast.has_value());

        CHECK(fast->wait() == 2);
        CHECK(slow->wait() == 4);
    }

    TEST_CASE("upload hello and read it back")
    {
        sshcomm::communicator comm{connect_to_test_host()};

        std::istringstream source{"hello"};
        auto const uploaded = comm.upload("/tmp/sshcomm_it_hello.txt", source);
        REQUIRE(uploaded.has_value());

        CHECK(run(comm, "cat /tmp/sshcomm_it_hello.txt") == "hello");
        CHECK(trim(run(comm, "stat -c %a /tmp/sshcomm_it_hello.txt")) == "644");
        static_cast<void>(run(comm, "rm -f /tmp/sshcomm_it_hello.txt"));
    }

    TEST_CASE("upload with NUL bytes keeps its length")
    {
        sshcomm::communicator comm{connect_to_test_host()};

        std::istringstream source{std::string{"a\0b\0\0c", 6}};
        REQUIRE(comm.upload("/tmp/sshcomm_it_nul.bin", source).has_value());

        CHECK(trim(run(comm, "wc -c < /tmp/sshcomm_it_nul.bin")) == "6");
        static_cast<void>(run(comm, "rm -f /tmp/sshcomm_it_nul.bin"));
    }

    TEST_CASE("upload into a missing directory fails")
    {
        sshcomm::communicator comm{connect_to_test_host()};

        std::istringstream source{"hello"};
        auto const uploaded = comm.upload("/nonexistent/sshcomm/out.txt", source);
        CHECK_FALSE(uploaded.has_value());
    }
}
