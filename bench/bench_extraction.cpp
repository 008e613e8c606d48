// bench/bench_extraction.cpp - parsing and extraction on a generated access switch

#include "netval/extractor.hpp"
#include "netval/line_tree.hpp"
#include "netval/vlan.hpp"

#include <fmt/format.h>
#include <nanobench.h>
#include <string>

namespace bench
{

    namespace
    {

        // 48 access ports, 4 trunk uplinks, a handful of SVIs and vlans
        [[nodiscard]] auto generate_switch_config() -> std::string
        {
            std::string text = "! vendor: cisco\n! model: C9300-48P\nhostname bench-sw1\n!\n";

            for (int vlan = 10; vlan <= 100; vlan += 10)
            {
                text += fmt::format("vlan {}\n name VLAN_{}\n!\n", vlan, vlan);
            }

            text += "interface Loopback0\n ip address 10.255.0.1 255.255.255.255\n!\n";

            for (int port = 1; port <= 48; ++port)
            {
                text += fmt::format("interface GigabitEthernet1/0/{}\n"
                                    " description user port {}\n"
                                    " switchport mode access\n"
                                    " switchport access vlan {}\n"
                                    " spanning-tree portfast\n"
                                    "!\n",
                                    port, port, 10 + (port % 10) * 10);
            }

            for (int uplink = 1; uplink <= 4; ++uplink)
            {
                text += fmt::format("interface TenGigabitEthernet1/1/{}\n"
                                    " description uplink {}\n"
                                    " switchport mode trunk\n"
                                    " switchport trunk allowed vlan 10-50,60,70-100\n"
                                    "!\n",
                                    uplink, uplink);
            }

            for (int vlan = 10; vlan <= 50; vlan += 10)
            {
                text += fmt::format("interface Vlan{}\n ip address 10.0.{}.1 255.255.255.0\n!\n", vlan, vlan);
            }

            text += "end\n";
            return text;
        }

    } // namespace

    void run_extraction_benchmarks()
    {
        using namespace ankerl::nanobench;

        auto const config = generate_switch_config();

        Bench().batch(config.size()).unit("byte").run("LineTree_Parse_48Port",
                                                      [&]
                                                      {
                                                          auto tree = netval::line_tree::parse(config);
                                                          doNotOptimizeAway(tree);
                                                      });

        Bench().batch(config.size()).unit("byte").run("Extract_DeviceFacts_48Port",
                                                      [&]
                                                      {
                                                          auto facts = netval::extract_device_facts(config);
                                                          doNotOptimizeAway(facts);
                                                      });

        Bench().run("VlanRange_Expand_Full",
                    [&]
                    {
                        auto ids = netval::expand_vlan_range("1-4094");
                        doNotOptimizeAway(ids);
                    });

        Bench().run("VlanRange_Expand_Mixed",
                    [&]
                    {
                        auto ids = netval::expand_vlan_range("10,20,30-33,100-110,bad,4000-4005");
                        doNotOptimizeAway(ids);
                    });
    }

} // namespace bench
