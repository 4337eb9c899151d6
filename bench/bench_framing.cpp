// bench/bench_framing.cpp - scp control lines, path splitting, terminal mode encoding

#include "sshcomm/scp_protocol.hpp"
#include "sshcomm/terminal_modes.hpp"

#include <nanobench.h>
#include <string>

namespace bench
{

    void run_framing_benchmarks()
    {
        using namespace ankerl::nanobench;

        Bench().minEpochIterations(100000).run("ControlLine_Short",
                                               [&]
                                               {
                                                   auto line = sshcomm::scp::control_line(0644, 5, "hello.txt");
                                                   doNotOptimizeAway(line);
                                               });

        Bench().minEpochIterations(100000).run("ControlLine_LargeFile",
                                               [&]
                                               {
                                                   auto line = sshcomm::scp::control_line(
                                                       0600, 17'179'869'184ULL, "release-artifact-x86_64.tar.zst");
                                                   doNotOptimizeAway(line);
                                               });

        Bench().minEpochIterations(100000).run("SplitRemotePath",
                                               [&]
                                               {
                                                   auto target =
                                                       sshcomm::scp::split_remote_path("/var/lib/builds/42/out.bin");
                                                   doNotOptimizeAway(target);
                                               });

        std::string const awkward_dir{"/home/o'brien/my files"};
        Bench().minEpochIterations(100000).run("SinkCommand_Quoted",
                                               [&]
                                               {
                                                   auto command = sshcomm::scp::sink_command("scp", awkward_dir);
                                                   doNotOptimizeAway(command);
                                               });

        Bench().minEpochIterations(100000).run("TerminalModes_Defaults",
                                               [&]
                                               {
                                                   auto encoded = sshcomm::terminal_modes::defaults().encode();
                                                   doNotOptimizeAway(encoded);
                                               });

        auto const interactive = sshcomm::terminal_modes::defaults()
                                     .set(sshcomm::tty_opcode::icanon, 1)
                                     .set(sshcomm::tty_opcode::isig, 1)
                                     .set(sshcomm::tty_opcode::icrnl, 1)
                                     .set(sshcomm::tty_opcode::onlcr, 1);
        Bench().minEpochIterations(100000).run("TerminalModes_Interactive",
                                               [&]
                                               {
                                                   auto encoded = interactive.encode();
                                                   doNotOptimizeAway(encoded);
                                               });
    }

} // namespace bench
