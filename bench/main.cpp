// bench/main.cpp - benchmark entry point
// nanobench needs implementation defined in exactly one translation unit

#define ANKERL_NANOBENCH_IMPLEMENT
#include <nanobench.h>

#include "netval/logging.hpp"

// nanobench has no auto-registration, each file exposes a runner called from here

namespace bench
{
    void run_extraction_benchmarks();
    void run_validation_benchmarks();
} // namespace bench

int main()
{
    netval::logging::set_level(netval::log_level::off);

    bench::run_extraction_benchmarks();
    bench::run_validation_benchmarks();
    return 0;
}
