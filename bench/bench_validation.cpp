// bench/bench_validation.cpp - link validation on trunk and routed pairs

#include "netval/link_validator.hpp"
#include "netval/prefix.hpp"

#include <nanobench.h>

namespace bench
{

    void run_validation_benchmarks()
    {
        using namespace ankerl::nanobench;

        netval::interface_facts trunk_a;
        trunk_a.name = "Te1/1/1";
        trunk_a.mode = netval::interface_mode::trunk;
        trunk_a.trunk_allowed_vlans = {10, 20, 30, 40, 50, 60, 70, 80, 90, 100};

        netval::interface_facts trunk_b = trunk_a;
        trunk_b.trunk_allowed_vlans = {100, 200, 300};

        Bench().run("ValidateLink_Trunk",
                    [&]
                    {
                        auto state = netval::validate_link(&trunk_a, &trunk_b);
                        doNotOptimizeAway(state);
                    });

        netval::interface_facts routed_a;
        routed_a.name = "Gi0/0/0";
        routed_a.address = "192.0.2.1";
        routed_a.mask = "255.255.255.252";

        netval::interface_facts routed_b = routed_a;
        routed_b.address = "192.0.2.2";
        routed_b.mask = "/30";

        Bench().run("ValidateLink_Routed",
                    [&]
                    {
                        auto state = netval::validate_link(&routed_a, &routed_b);
                        doNotOptimizeAway(state);
                    });

        Bench().run("NormalizePrefix_V6",
                    [&]
                    {
                        auto net = netval::normalize_prefix("2001:db8:0:1::1", "/64");
                        doNotOptimizeAway(net);
                    });
    }

} // namespace bench
