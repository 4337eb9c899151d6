// bench/bench_upload.cpp - upload and command round trips over the in-memory transport
// measures our framing and session pumping, not the network

#include "fake_transport.hpp"
#include "sshcomm/communicator.hpp"

#include <chrono>
#include <fmt/format.h>
#include <memory>
#include <nanobench.h>
#include <sstream>
#include <string>
#include <vector>

namespace bench
{

    namespace
    {

        [[nodiscard]] auto bench_config() -> sshcomm::communicator_config
        {
            sshcomm::communicator_config config;
            config.io.poll_interval = std::chrono::milliseconds{0};
            return config;
        }

    } // namespace

    void run_upload_benchmarks()
    {
        using namespace ankerl::nanobench;

        std::vector<std::size_t> const payload_sizes{64, 4096, 65536, 1024 * 1024};

        for (auto const size : payload_sizes)
        {
            std::string const payload(size, 'x');

            Bench()
                .batch(size)
                .unit("byte")
                .minEpochIterations(50)
                .run(fmt::format("Upload_{}B", size),
                     [&]
                     {
                         // fresh connection so recorded stdin does not pile up
                         auto conn = std::make_shared<sshcomm::testing::fake_connection>();
                         sshcomm::communicator comm{conn, bench_config()};

                         std::istringstream source{payload};
                         auto uploaded = comm.upload("/tmp/bench.bin", source);
                         doNotOptimizeAway(uploaded);
                     });
        }

        Bench().minEpochIterations(50).run("StartAndWait_Noop",
                                           [&]
                                           {
                                               auto conn = std::make_shared<sshcomm::testing::fake_connection>();
                                               sshcomm::communicator comm{conn, bench_config()};

                                               auto running = comm.start(sshcomm::remote_command{"true"});
                                               if (running.has_value())
                                               {
                                                   doNotOptimizeAway(running->wait());
                                               }
                                           });
    }

} // namespace bench
