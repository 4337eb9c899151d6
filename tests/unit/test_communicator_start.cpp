// tests/unit/test_communicator_start.cpp - command start and asynchronous completion

#include "fake_transport.hpp"
#include "sshcomm/communicator.hpp"
#include "test_helpers.hpp"

#include <doctest/doctest.h>

#include <chrono>
#include <sstream>
#include <thread>

using namespace sshcomm;
using namespace sshcomm::testing;

namespace
{

    [[nodiscard]] auto fast_config() -> communicator_config
    {
        communicator_config config;
        config.io.poll_interval = std::chrono::milliseconds{1};
        return config;
    }

    [[nodiscard]] auto held() -> std::shared_ptr<std::atomic<bool>>
    {
        return std::make_shared<std::atomic<bool>>(true);
    }

} // anonymous namespace

TEST_SUITE("communicator_start")
{
    TEST_CASE("successful command exits with status 0")
    {
        auto conn = std::make_shared<fake_connection>();
        communicator comm{conn, fast_config()};

        auto running = comm.start(remote_command{"echo ok"});
        REQUIRE(running.has_value());
        REQUIRE(running->valid());

        CHECK(running->wait() == 0);
        CHECK(running->exited());
        CHECK(running->exit_status() == 0);
    }

    TEST_CASE("exit status is reported")
    {
        auto conn = std::make_shared<fake_connection>();
        channel_script script;
        script.exit_status = 7;
        conn->push_script(script);
        communicator comm{conn, fast_config()};

        auto running = comm.start(remote_command{"exit 7"});
        REQUIRE(running.has_value());

        CHECK(running->wait() == 7);
        // read-stable after it was published
        CHECK(running->exit_status() == 7);
        CHECK(running->wait() == 7);
    }

    TEST_CASE("completion failures without an exit status record 0")
    {
        auto conn = std::make_shared<fake_connection>();
        channel_script script;
        script.exit_status_failure = error_code::exit_status_unavailable;
        conn->push_script(script);
        communicator comm{conn, fast_config()};

        auto running = comm.start(remote_command{"kill -9 $$"});
        REQUIRE(running.has_value());
        CHECK(running->wait() == 0);
    }

    TEST_CASE("pty request and command text")
    {
        auto conn = std::make_shared<fake_connection>();
        communicator comm{conn, fast_config()};

        auto running = comm.start(remote_command{"echo ok"});
        REQUIRE(running.has_value());
        static_cast<void>(running->wait());

        auto record = conn->record(0);
        std::lock_guard lock{record->mutex};
        REQUIRE(record->pty.has_value());
        CHECK(record->pty->term == "xterm");
        CHECK(record->pty->columns == 80);
        CHECK(record->pty->rows == 40);
        CHECK(record->pty->encoded_modes == terminal_modes::defaults().encode());
        REQUIRE(record->commands.size() == 1);
        CHECK(record->commands[0] == "echo ok\n");
    }

    TEST_CASE("session is closed before the exit status is published")
    {
        auto conn = std::make_shared<fake_connection>();
        communicator comm{conn, fast_config()};

        auto running = comm.start(remote_command{"true"});
        REQUIRE(running.has_value());
        static_cast<void>(running->wait());

        CHECK(conn->record(0)->closes() == 1);
        CHECK(comm.active_commands() == 0);
    }

    TEST_CASE("start returns while the command is still running")
    {
        auto conn = std::make_shared<fake_connection>();
        channel_script script;
        script.hold = held();
        conn->push_script(script);
        communicator comm{conn, fast_config()};

        auto running = comm.start(remote_command{"sleep 10"});
        REQUIRE(running.has_value());

        CHECK_FALSE(running->exited());
        CHECK_FALSE(running->exit_status().has_value());
        CHECK_FALSE(running->wait_for(std::chrono::milliseconds{20}).has_value());
        CHECK(comm.active_commands() == 1);

        script.hold->store(false);
        CHECK(running->wait() == 0);
    }

    TEST_CASE("command with closed outputs has not exited until its channel closes")
    {
        auto conn = std::make_shared<fake_connection>();
        channel_script lingering;
        lingering.exit_status = 9;
        lingering.linger = held();
        conn->push_script(lingering);
        communicator comm{conn, fast_config()};

        auto running = comm.start(remote_command{"exec >/dev/null 2>&1; sleep 10; exit 9"});
        REQUIRE(running.has_value());
        release_on_exit const closer{lingering.linger};

        REQUIRE(eventually([&] { return conn->record(0)->status_polls() >= 2; }));
        CHECK_FALSE(running->exited());

        // the pending status poll does not hold up other work on the connection
        auto other = comm.start(remote_command{"true"});
        REQUIRE(other.has_value());
        CHECK(other->wait() == 0);
        CHECK_FALSE(running->exited());

        lingering.linger->store(false);
        CHECK(running->wait() == 9);
    }

    TEST_CASE("streams are wired to the command")
    {
        auto conn = std::make_shared<fake_connection>();
        channel_script script;
        script.stdout_data = "ok\r\n";
        script.stderr_data = "warning\r\n";
        conn->push_script(script);
        communicator comm{conn, fast_config()};

        std::istringstream in{"answer\n"};
        std::ostringstream out;
        std::ostringstream err;

        auto running = comm.start(remote_command{"read x; echo ok", &in, &out, &err});
        REQUIRE(running.has_value());
        CHECK(running->wait() == 0);

        CHECK(out.str() == "ok\r\n");
        CHECK(err.str() == "warning\r\n");
        CHECK(conn->record(0)->snapshot_stdin() == "answer\n");
        CHECK(conn->record(0)->eofs() == 1);
    }

    TEST_CASE("concurrent commands use independent sessions")
    {
        auto conn = std::make_shared<fake_connection>();
        channel_script slow;
        slow.exit_status = 5;
        slow.hold = held();
        channel_script fast;
        fast.exit_status = 3;
        conn->push_script(slow);
        conn->push_script(fast);
        communicator comm{conn, fast_config()};

        auto first = comm.start(remote_command{"sleep 10; exit 5"});
        auto second = comm.start(remote_command{"exit 3"});
        REQUIRE(first.has_value());
        REQUIRE(second.has_value());
        CHECK(conn->channels_opened() == 2);

        CHECK(second->wait() == 3);
        CHECK_FALSE(first->exited());

        slow.hold->store(false);
        CHECK(first->wait() == 5);
        CHECK(second->wait() == 3);
    }

    TEST_CASE("starts from several threads")
    {
        auto conn = std::make_shared<fake_connection>();
        communicator comm{conn, fast_config()};

        constexpr int thread_count = 8;
        std::vector<std::optional<int>> statuses(thread_count);
        {
            std::vector<std::jthread> threads;
            for (int i = 0; i < thread_count; ++i)
            {
                threads.emplace_back([&comm, &statuses, i] {
                    auto running = comm.start(remote_command{fmt::format("echo {}", i)});
                    if (running.has_value())
                    {
                        statuses[static_cast<std::size_t>(i)] = running->wait();
                    }
                });
            }
        }

        CHECK(conn->channels_opened() == thread_count);
        for (auto const &status : statuses)
        {
            CHECK(status == 0);
        }
    }

    TEST_CASE("empty command is rejected without opening a session")
    {
        auto conn = std::make_shared<fake_connection>();
        communicator comm{conn, fast_config()};

        auto running = comm.start(remote_command{""});
        REQUIRE_FALSE(running.has_value());
        CHECK(code_of(running.error()) == error_code::invalid_argument);
        CHECK(conn->channels_opened() == 0);
    }

    TEST_CASE("session open failure is returned synchronously")
    {
        auto conn = std::make_shared<fake_connection>();
        conn->fail_next_open(error_code::session_open_failed);
        communicator comm{conn, fast_config()};

        auto running = comm.start(remote_command{"true"});
        REQUIRE_FALSE(running.has_value());
        CHECK(code_of(running.error()) == error_code::session_open_failed);
        CHECK(comm.active_commands() == 0);
    }

    TEST_CASE("pty failure is returned and nothing is executed")
    {
        auto conn = std::make_shared<fake_connection>();
        channel_script script;
        script.pty_failure = error_code::pty_request_failed;
        conn->push_script(script);
        communicator comm{conn, fast_config()};

        auto running = comm.start(remote_command{"true"});
        REQUIRE_FALSE(running.has_value());
        CHECK(code_of(running.error()) == error_code::pty_request_failed);

        auto record = conn->record(0);
        CHECK(record->commands.empty());
        CHECK(record->closes() == 1);
        CHECK(comm.active_commands() == 0);
    }

    TEST_CASE("exec failure is returned and the session closed")
    {
        auto conn = std::make_shared<fake_connection>();
        channel_script script;
        script.exec_failure = error_code::exec_failed;
        conn->push_script(script);
        communicator comm{conn, fast_config()};

        auto running = comm.start(remote_command{"true"});
        REQUIRE_FALSE(running.has_value());
        CHECK(code_of(running.error()) == error_code::exec_failed);
        CHECK(conn->record(0)->closes() == 1);
    }

    TEST_CASE("missing connection")
    {
        communicator comm{nullptr};
        auto running = comm.start(remote_command{"true"});
        REQUIRE_FALSE(running.has_value());
        CHECK(code_of(running.error()) == error_code::not_connected);
    }

    TEST_CASE("destroying the communicator stops running commands")
    {
        auto conn = std::make_shared<fake_connection>();
        channel_script script;
        script.hold = held();
        conn->push_script(script);

        running_command running;
        {
            communicator comm{conn, fast_config()};
            auto started = comm.start(remote_command{"sleep 1000"});
            REQUIRE(started.has_value());
            running = *started;
        }

        CHECK(running.exited());
        CHECK(running.exit_status() == 0);
        CHECK(conn->record(0)->closes() == 1);
    }
}
