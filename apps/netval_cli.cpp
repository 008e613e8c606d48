// netval_cli.cpp - command-line front end to the extractor and validator
// point it at captured configs, get facts and link verdicts back

#include "netval/config_source.hpp"
#include "netval/extractor.hpp"
#include "netval/link_validator.hpp"
#include "netval/logging.hpp"
#include "netval/prefix.hpp"
#include "netval/settings.hpp"
#include "netval/vlan.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace
{

    auto print_usage(char const *program_name) -> void
    {
        fmt::print(stderr, R"(
Usage: {} [options] <command> [arguments]

Commands:
  extract <config-file>                          Print the facts found in a configuration
  validate <config-a> <iface-a> <config-b> <iface-b>
                                                 Check a link between two interfaces
  vlans <expression>                             Expand a VLAN list such as 10,20,30-33
  prefix <address> <mask>                        Print the canonical network

Options:
  --log-level <level>   trace, debug, info, warn, error, off (default: info)
  --scan-lines <n>      Lines read by the vendor/platform heuristics (default: 100)

Environment:
  NETVAL_LOG_LEVEL, NETVAL_SCAN_LINES   same as the options, overridden by them

Examples:
  {} extract core-sw1.cfg
  {} validate core-sw1.cfg Gi1/0/48 dist-sw2.cfg Gi1/0/1
  {} vlans 10,20,30-33

)",
                   program_name, program_name, program_name, program_name);
    }

    struct invocation
    {
        netval::settings cfg{};
        std::string command{};
        std::vector<std::string> args{};
    };

    [[nodiscard]] auto parse_args(int argc, char const *argv[]) -> std::optional<invocation>
    {
        auto env = netval::settings::from_environment();
        if (!env.has_value())
        {
            fmt::print(stderr, "Error: bad NETVAL_* environment value ({})\n", env.error());
            return std::nullopt;
        }

        invocation inv{.cfg = *env, .command = {}, .args = {}};

        for (int i = 1; i < argc; ++i)
        {
            std::string_view const arg{argv[i]};

            if (arg == "--log-level" && i + 1 < argc)
            {
                auto const level = netval::parse_log_level(argv[++i]);
                if (!level.has_value())
                {
                    fmt::print(stderr, "Error: invalid log level '{}'\n", argv[i]);
                    return std::nullopt;
                }
                inv.cfg.level = *level;
            }
            else if (arg == "--scan-lines" && i + 1 < argc)
            {
                auto const lines = netval::parse_scan_line_limit(argv[++i]);
                if (!lines.has_value())
                {
                    fmt::print(stderr, "Error: --scan-lines needs a positive number\n");
                    return std::nullopt;
                }
                inv.cfg.scan_line_limit = *lines;
            }
            else if (arg.starts_with("--"))
            {
                fmt::print(stderr, "Error: unknown option '{}'\n", arg);
                return std::nullopt;
            }
            else if (inv.command.empty())
            {
                inv.command = arg;
            }
            else
            {
                inv.args.emplace_back(arg);
            }
        }

        if (inv.command.empty())
        {
            return std::nullopt;
        }
        return inv;
    }

    [[nodiscard]] auto load_facts(std::string const &path, netval::settings const &cfg)
        -> netval::result<netval::device_facts>
    {
        auto const text = netval::read_config_file(path);
        if (!text.has_value())
        {
            return std::unexpected{text.error()};
        }
        netval::logging::debug("cli", "read {} bytes from {}", text->size(), path);
        return netval::extract_device_facts(*text, cfg.extraction());
    }

    auto print_interface(netval::interface_facts const &iface) -> void
    {
        fmt::print("  interface {:<24} {:<6} {:<4}", iface.name, iface.mode, iface.state);
        if (iface.mode == netval::interface_mode::access && iface.access_vlan.has_value())
        {
            fmt::print(" vlan {}", *iface.access_vlan);
        }
        if (iface.mode == netval::interface_mode::trunk)
        {
            fmt::print(" allowed {}", netval::encode_vlan_list(iface.trunk_allowed_vlans));
        }
        if (iface.has_address())
        {
            fmt::print(" ip {} {}", *iface.address, *iface.mask);
        }
        if (!iface.description.empty())
        {
            fmt::print(" \"{}\"", iface.description);
        }
        fmt::print("\n");
    }

    auto run_extract(invocation const &inv) -> int
    {
        if (inv.args.size() != 1)
        {
            fmt::print(stderr, "Error: extract takes exactly one config file\n");
            return 1;
        }

        auto const facts = load_facts(inv.args[0], inv.cfg);
        if (!facts.has_value())
        {
            fmt::print(stderr, "Error: cannot read '{}': {}\n", inv.args[0], facts.error());
            return 1;
        }

        fmt::print("hostname   {}\n", facts->hostname.value_or("-"));
        fmt::print("vendor     {}\n", facts->vendor.value_or("-"));
        fmt::print("platform   {}\n", facts->platform.value_or("-"));
        fmt::print("management {}\n", facts->management_address.value_or("-"));

        fmt::print("interfaces ({})\n", facts->interfaces.size());
        for (auto const &iface : facts->interfaces)
        {
            print_interface(iface);
        }

        fmt::print("vlans ({})\n", facts->vlans.size());
        for (auto const &vlan : facts->vlans)
        {
            fmt::print("  vlan {:<5} {}\n", vlan.id, vlan.name);
        }
        return 0;
    }

    auto run_validate(invocation const &inv) -> int
    {
        if (inv.args.size() != 4)
        {
            fmt::print(stderr, "Error: validate takes <config-a> <iface-a> <config-b> <iface-b>\n");
            return 1;
        }

        auto const a = load_facts(inv.args[0], inv.cfg);
        if (!a.has_value())
        {
            fmt::print(stderr, "Error: cannot read '{}': {}\n", inv.args[0], a.error());
            return 1;
        }
        auto const b = load_facts(inv.args[2], inv.cfg);
        if (!b.has_value())
        {
            fmt::print(stderr, "Error: cannot read '{}': {}\n", inv.args[2], b.error());
            return 1;
        }

        auto const *const source = a->find_interface(inv.args[1]);
        auto const *const target = b->find_interface(inv.args[3]);
        if (source == nullptr)
        {
            netval::logging::warn("cli", "{} has no interface {}", inv.args[0], inv.args[1]);
        }
        if (target == nullptr)
        {
            netval::logging::warn("cli", "{} has no interface {}", inv.args[2], inv.args[3]);
        }

        auto const eval = netval::evaluate_link(source, target);
        fmt::print("endpoints  {}\n", eval.endpoints_resolved ? "resolved" : "unresolved");
        fmt::print("l2         {}\n", eval.l2_checked ? (eval.l2_up ? "up" : "down") : "not checked");
        fmt::print("l3         {}\n", eval.l3_checked ? (eval.l3_up ? "up" : "down") : "not checked");
        fmt::print("state      {}\n", eval.state);

        return eval.state == netval::link_state::up ? 0 : 2;
    }

    auto run_vlans(invocation const &inv) -> int
    {
        if (inv.args.empty())
        {
            fmt::print(stderr, "Error: vlans takes an expression\n");
            return 1;
        }

        // "10, 20" arrives split across arguments by the shell
        auto const ids = netval::expand_vlan_arguments(inv.args);
        fmt::print("{}\n", fmt::join(ids, ","));
        return 0;
    }

    auto run_prefix(invocation const &inv) -> int
    {
        if (inv.args.size() != 2)
        {
            fmt::print(stderr, "Error: prefix takes <address> <mask>\n");
            return 1;
        }

        auto const net = netval::normalize_prefix(inv.args[0], inv.args[1]);
        if (!net.has_value())
        {
            fmt::print(stderr, "Error: {}\n", net.error());
            return 1;
        }
        fmt::print("{}\n", *net);
        return 0;
    }

} // anonymous namespace

auto main(int const argc, char const *argv[]) -> int
{
    auto const inv = parse_args(argc, argv);
    if (!inv.has_value())
    {
        print_usage(argv[0]);
        return 1;
    }

    netval::logging::set_level(inv->cfg.level);

    if (inv->command == "extract")
    {
        return run_extract(*inv);
    }
    if (inv->command == "validate")
    {
        return run_validate(*inv);
    }
    if (inv->command == "vlans")
    {
        return run_vlans(*inv);
    }
    if (inv->command == "prefix")
    {
        return run_prefix(*inv);
    }

    fmt::print(stderr, "Error: unknown command '{}'\n", inv->command);
    print_usage(argv[0]);
    return 1;
}
