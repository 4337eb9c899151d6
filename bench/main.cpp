// bench/main.cpp - benchmark entry point
// nanobench needs its implementation defined in exactly one translation unit

#define ANKERL_NANOBENCH_IMPLEMENT
#include <nanobench.h>

// nanobench has no auto-registration; each file exposes a runner
namespace bench
{
    void run_framing_benchmarks();
    void run_upload_benchmarks();
} // namespace bench

int main()
{
    bench::run_framing_benchmarks();
    bench::run_upload_benchmarks();
    return 0;
}
