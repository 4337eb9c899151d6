// sshcomm_cli.cpp - run a remote command or upload a file over ssh
// exit code of `run` is the remote exit status

#include "sshcomm/communicator.hpp"
#include "sshcomm/libssh_transport.hpp"
#include "sshcomm/log.hpp"

#include <csignal>
#include <cstdio>
#include <fmt/format.h>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <unistd.h>
#include <vector>

namespace
{

    auto print_usage(char const *program_name) -> void
    {
        fmt::print(stderr, R"(
Usage: {} [options] <mode> ...

Modes:
  run <command...>          - run a shell command in a pty, stdin/stdout/stderr forwarded
  upload <local> <remote>   - copy a local file to a remote path (scp sink, mode 0644)

Options:
  --host <host>        Remote host (required)
  --port <n>           SSH port (default: 22)
  --user <name>        Login user
  --password <pass>    Password, tried after key authentication
  --key <path>         Private key file
  --verify-acks        Check the receiver's status byte during uploads
  -v                   More diagnostics on stderr (repeat for debug)

Examples:
  {} --host build01 --user ci run make -j8
  {} --host 10.0.0.2 --key ~/.ssh/id_ed25519 upload ./app.tar /tmp/app.tar

)",
                   program_name, program_name, program_name);
    }

    struct config
    {
        sshcomm::connection_config connection{};
        bool verify_acks{false};
        int verbosity{0};
        std::string mode{};
        std::vector<std::string> operands{};
    };

    [[nodiscard]] auto parse_args(int argc, char const *argv[]) -> std::optional<config>
    {
        config cfg;

        int i = 1;
        for (; i < argc; ++i)
        {
            std::string_view const arg{argv[i]};

            if (arg == "--host" && i + 1 < argc)
            {
                cfg.connection.host = argv[++i];
            }
            else if (arg == "--port" && i + 1 < argc)
            {
                cfg.connection.port = std::stoi(argv[++i]);
                if (cfg.connection.port <= 0 || cfg.connection.port > 65535)
                {
                    fmt::print(stderr, "Error: port out of range\n");
                    return std::nullopt;
                }
            }
            else if (arg == "--user" && i + 1 < argc)
            {
                cfg.connection.username = argv[++i];
            }
            else if (arg == "--password" && i + 1 < argc)
            {
                cfg.connection.password = argv[++i];
            }
            else if (arg == "--key" && i + 1 < argc)
            {
                cfg.connection.private_key_path = argv[++i];
            }
            else if (arg == "--verify-acks")
            {
                cfg.verify_acks = true;
            }
            else if (arg == "-v")
            {
                ++cfg.verbosity;
            }
            else if (arg == "-vv")
            {
                cfg.verbosity += 2;
            }
            else if (arg.starts_with("-"))
            {
                fmt::print(stderr, "Error: unknown argument '{}'\n", arg);
                return std::nullopt;
            }
            else
            {
                break;
            }
        }

        if (i >= argc)
        {
            return std::nullopt;
        }
        cfg.mode = argv[i++];
        for (; i < argc; ++i)
        {
            cfg.operands.emplace_back(argv[i]);
        }

        if (cfg.connection.host.empty())
        {
            fmt::print(stderr, "Error: --host is required\n");
            return std::nullopt;
        }

        // -vv also turns on the libssh protocol trace
        if (cfg.verbosity >= 2)
        {
            cfg.connection.verbosity = cfg.verbosity - 1;
        }
        return cfg;
    }

    [[nodiscard]] auto join_command(std::vector<std::string> const &words) -> std::string
    {
        std::string command;
        for (auto const &word : words)
        {
            if (!command.empty())
            {
                command += ' ';
            }
            command += word;
        }
        return command;
    }

    // =============================================================================
    // modes
    // =============================================================================

    auto run_command(sshcomm::communicator &comm, config const &cfg) -> int
    {
        if (cfg.operands.empty())
        {
            fmt::print(stderr, "Error: run needs a command\n");
            return 1;
        }

        // stdin is pumped in blocking chunks, so only forward it when it is a pipe or file
        std::istream *input = ::isatty(STDIN_FILENO) != 0 ? nullptr : &std::cin;

        auto running = comm.start(sshcomm::remote_command{join_command(cfg.operands), input, &std::cout, &std::cerr});
        if (!running.has_value())
        {
            fmt::print(stderr, "Error: failed to start command: {}\n", running.error());
            return 1;
        }

        auto const status = running->wait();
        std::cout.flush();
        return status;
    }

    auto run_upload(sshcomm::communicator &comm, config const &cfg) -> int
    {
        if (cfg.operands.size() != 2)
        {
            fmt::print(stderr, "Error: upload needs <local> <remote>\n");
            return 1;
        }

        auto const &local = cfg.operands[0];
        auto const &remote = cfg.operands[1];

        auto const uploaded = comm.upload_file(remote, local);
        if (!uploaded.has_value())
        {
            fmt::print(stderr, "Error: upload {} -> {} failed: {}\n", local, remote, uploaded.error());
            return 1;
        }

        if (cfg.verbosity > 0)
        {
            fmt::print(stderr, "uploaded {} -> {}:{}\n", local, cfg.connection.host, remote);
        }
        return 0;
    }

} // anonymous namespace

auto main(int const argc, char const *argv[]) -> int
{
    auto const cfg_opt = parse_args(argc, argv);
    if (!cfg_opt.has_value())
    {
        print_usage(argv[0]);
        return 1;
    }
    auto const &cfg = *cfg_opt;

    // a remote that stops reading must not kill us on write
    std::signal(SIGPIPE, SIG_IGN);

    if (cfg.verbosity > 0)
    {
        sshcomm::log::set_level(sshcomm::log::level_from_verbosity(cfg.verbosity));
    }

    auto conn = sshcomm::libssh_connection::connect(cfg.connection);
    if (!conn.has_value())
    {
        fmt::print(stderr, "Error: cannot connect to {}@{}:{}: {}\n", cfg.connection.username, cfg.connection.host,
                   cfg.connection.port, conn.error());
        return 1;
    }

    sshcomm::communicator_config comm_config;
    comm_config.verify_acks = cfg.verify_acks;
    sshcomm::communicator comm{*conn, comm_config};

    if (cfg.mode == "run")
    {
        return run_command(comm, cfg);
    }
    if (cfg.mode == "upload")
    {
        return run_upload(comm, cfg);
    }

    fmt::print(stderr, "Error: unknown mode '{}'\n", cfg.mode);
    print_usage(argv[0]);
    return 1;
}
