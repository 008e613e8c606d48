// extractor.cpp - rule tables over the line tree
// each rule stands alone; later matches overwrite earlier ones

#include "netval/extractor.hpp"
#include "netval/vlan.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <regex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace netval
{

    namespace
    {

        // ------------------------------------------------------------------------
        // keyword matching - plain string work, so line length never matters
        // ------------------------------------------------------------------------

        [[nodiscard]] auto first_token(std::string_view const text) -> std::string_view
        {
            auto const end = std::ranges::find_if(text, text_utils::is_space);
            return text.substr(0, static_cast<std::size_t>(end - text.begin()));
        }

        // remainder after a leading keyword phrase, compared word by word
        [[nodiscard]] auto after_keywords(std::string_view text, std::string_view const phrase)
            -> std::optional<std::string_view>
        {
            text = text_utils::trim(text);
            for (auto const word : text_utils::split_tokens(phrase))
            {
                if (first_token(text) != word)
                {
                    return std::nullopt;
                }
                text = text_utils::trim(text.substr(word.size()));
            }
            return text;
        }

        // ------------------------------------------------------------------------
        // interface child-line rules
        // ------------------------------------------------------------------------

        using interface_setter = void (*)(interface_facts &, std::string_view rest);

        struct interface_rule
        {
            std::string_view keywords;
            interface_setter apply;
        };

        // forms of "ip address" that carry no static address
        constexpr std::array address_keywords = {
            std::string_view{"dhcp"},
            std::string_view{"negotiated"},
            std::string_view{"pool"},
        };

        auto set_description(interface_facts &iface, std::string_view const rest) -> void
        {
            iface.description = std::string{rest};
        }

        auto set_shutdown(interface_facts &iface, std::string_view const rest) -> void
        {
            if (rest.empty())
            {
                iface.state = admin_state::down;
            }
        }

        auto set_address(interface_facts &iface, std::string_view const rest) -> void
        {
            auto const args = text_utils::split_tokens(rest);
            if (args.empty())
            {
                return;
            }
            if (std::ranges::find(address_keywords, args[0]) != address_keywords.end())
            {
                return;
            }

            // "10.0.0.1/24" in a single token
            if (auto const slash = args[0].find('/'); slash != std::string_view::npos)
            {
                iface.address = std::string{args[0].substr(0, slash)};
                iface.mask = std::string{args[0].substr(slash)};
                return;
            }

            // anything after the mask ("secondary") does not change the pair
            if (args.size() >= 2)
            {
                iface.address = std::string{args[0]};
                iface.mask = std::string{args[1]};
            }
        }

        auto set_mode(interface_facts &iface, std::string_view const rest) -> void
        {
            if (auto const mode = parse_interface_mode(first_token(rest)))
            {
                iface.mode = *mode;
            }
        }

        auto set_access_vlan(interface_facts &iface, std::string_view const rest) -> void
        {
            if (auto const id = parse_vlan_id(first_token(rest)); id.has_value())
            {
                iface.access_vlan = *id;
            }
        }

        auto set_trunk_allowed(interface_facts &iface, std::string_view const rest) -> void
        {
            if (!rest.empty())
            {
                parse_vlan_list_change(rest).apply_to(iface.trunk_allowed_vlans);
            }
        }

        constexpr std::array interface_rules = {
            interface_rule{"description", &set_description},
            interface_rule{"shutdown", &set_shutdown},
            interface_rule{"ip address", &set_address},
            interface_rule{"switchport mode", &set_mode},
            interface_rule{"switchport access vlan", &set_access_vlan},
            interface_rule{"switchport trunk allowed vlan", &set_trunk_allowed},
        };

        // ------------------------------------------------------------------------
        // top-level block patterns
        // ------------------------------------------------------------------------

        [[nodiscard]] auto hostname_pattern() -> std::regex const &
        {
            static std::regex const pattern{R"(^hostname\s+\S)"};
            return pattern;
        }

        [[nodiscard]] auto interface_pattern() -> std::regex const &
        {
            static std::regex const pattern{R"(^interface\s+\S)"};
            return pattern;
        }

        [[nodiscard]] auto vlan_pattern() -> std::regex const &
        {
            static std::regex const pattern{R"(^vlan\s+\S)"};
            return pattern;
        }

        // ------------------------------------------------------------------------
        // vendor/platform heuristics
        // ------------------------------------------------------------------------

        enum class hint_field : std::uint8_t
        {
            vendor,
            platform,
        };

        struct banner_rule
        {
            std::string_view needle;
            hint_field field;
            std::string_view value;
        };

        constexpr std::array banner_rules = {
            banner_rule{"Cisco IOS Software", hint_field::vendor, "cisco"},
            banner_rule{"Cisco IOS XE Software", hint_field::vendor, "cisco"},
            banner_rule{"Cisco Nexus Operating System", hint_field::vendor, "cisco"},
            banner_rule{"Arista Networks", hint_field::vendor, "arista"},
            banner_rule{"EOS-", hint_field::vendor, "arista"},
            banner_rule{"JUNOS", hint_field::vendor, "juniper"},
            banner_rule{"C9300", hint_field::platform, "Catalyst 9300"},
            banner_rule{"C9200", hint_field::platform, "Catalyst 9200"},
            banner_rule{"WS-C3850", hint_field::platform, "Catalyst 3850"},
            banner_rule{"WS-C2960", hint_field::platform, "Catalyst 2960"},
            banner_rule{"ISR4331", hint_field::platform, "ISR 4331"},
            banner_rule{"CSR1000V", hint_field::platform, "CSR 1000v"},
            banner_rule{"N9K", hint_field::platform, "Nexus 9000"},
            banner_rule{"vEOS", hint_field::platform, "vEOS"},
        };

        [[nodiscard]] auto is_key_char(char const c) noexcept -> bool
        {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
        }

        struct comment_marker
        {
            std::string key;  // lower case
            std::string_view value;
        };

        // "! vendor: cisco", "# model: C9300-48P"
        [[nodiscard]] auto parse_marker(std::string_view line) -> std::optional<comment_marker>
        {
            line = text_utils::trim(line);
            auto const body = line.find_first_not_of("!#");
            if (body == 0 || body == std::string_view::npos)
            {
                return std::nullopt;
            }
            line = text_utils::trim(line.substr(body));

            std::size_t key_end = 0;
            while (key_end < line.size() && is_key_char(line[key_end]))
            {
                ++key_end;
            }
            if (key_end == 0)
            {
                return std::nullopt;
            }

            auto const rest = text_utils::trim(line.substr(key_end));
            if (!rest.starts_with(':'))
            {
                return std::nullopt;
            }
            auto const value = text_utils::trim(rest.substr(1));
            if (value.empty())
            {
                return std::nullopt;
            }

            std::string key{line.substr(0, key_end)};
            std::ranges::transform(key, key.begin(),
                                   [](unsigned char const c)
                                   { return static_cast<char>(std::tolower(c)); });
            return comment_marker{.key = std::move(key), .value = value};
        }

        auto set_hint(platform_hint &hint, hint_field const field, std::string value) -> void
        {
            switch (field)
            {
            case hint_field::vendor:
                hint.vendor = std::move(value);
                break;
            case hint_field::platform:
                hint.platform = std::move(value);
                break;
            }
        }

    } // anonymous namespace

    auto detect_platform(std::string_view const config_text, std::size_t const scan_line_limit) -> platform_hint
    {
        platform_hint hint;

        std::size_t scanned = 0;
        std::size_t pos = 0;
        while (scanned < scan_line_limit && pos <= config_text.size())
        {
            auto const eol = config_text.find('\n', pos);
            auto const end = eol == std::string_view::npos ? config_text.size() : eol;
            auto const line = config_text.substr(pos, end - pos);
            ++scanned;

            if (auto const marker = parse_marker(line))
            {
                if (marker->key == "vendor")
                {
                    hint.vendor = std::string{marker->value};
                }
                else if (marker->key == "model")
                {
                    hint.platform = std::string{marker->value};
                }
            }

            for (auto const &rule : banner_rules)
            {
                if (line.find(rule.needle) != std::string_view::npos)
                {
                    set_hint(hint, rule.field, std::string{rule.value});
                }
            }

            if (eol == std::string_view::npos)
            {
                break;
            }
            pos = eol + 1;
        }

        return hint;
    }

    auto extract_hostname(line_tree const &tree) -> std::optional<std::string>
    {
        auto const matches = tree.roots_matching(hostname_pattern());
        if (matches.empty())
        {
            return std::nullopt;
        }
        return std::string{matches.front()->token(1)};
    }

    auto extract_interface(line_node const &block) -> interface_facts
    {
        interface_facts iface;
        iface.name = std::string{block.token(1)};

        // child order drives last-write-wins; every rule sees every line
        for (auto const &child : block.children)
        {
            for (auto const &rule : interface_rules)
            {
                if (auto const rest = after_keywords(child.text, rule.keywords))
                {
                    rule.apply(iface, *rest);
                }
            }
        }

        return iface;
    }

    auto extract_vlan(line_node const &block) -> std::optional<vlan_facts>
    {
        auto const id = parse_vlan_id(block.token(1));
        if (!id.has_value())
        {
            return std::nullopt;
        }

        vlan_facts vlan{.id = *id, .name = {}};
        for (auto const &child : block.children)
        {
            if (auto const name = after_keywords(child.text, "name"); name.has_value() && !name->empty())
            {
                vlan.name = std::string{*name};
            }
        }
        return vlan;
    }

    auto select_management_address(std::span<interface_facts const> const interfaces)
        -> std::optional<std::string>
    {
        std::optional<std::string> selected;
        bool locked = false;

        for (auto const &iface : interfaces)
        {
            if (locked)
            {
                break;
            }
            if (!iface.address.has_value() || iface.address->empty())
            {
                continue;
            }

            if (iface.is_loopback())
            {
                selected = iface.address;
                locked = true;
            }
            else if (!selected.has_value())
            {
                selected = iface.address;
            }
        }

        return selected;
    }

    auto extract_device_facts(line_tree const &tree, std::string_view const config_text,
                              extract_options const &options) -> device_facts
    {
        device_facts facts;

        facts.hostname = extract_hostname(tree);

        auto hint = detect_platform(config_text, options.scan_line_limit);
        facts.vendor = std::move(hint.vendor);
        facts.platform = std::move(hint.platform);

        // duplicate names keep their first position and take the last block's fields
        std::unordered_map<std::string, std::size_t> interface_index;
        for (auto const *block : tree.roots_matching(interface_pattern()))
        {
            auto iface = extract_interface(*block);
            if (auto const it = interface_index.find(iface.name); it != interface_index.end())
            {
                facts.interfaces[it->second] = std::move(iface);
                continue;
            }
            interface_index.emplace(iface.name, facts.interfaces.size());
            facts.interfaces.push_back(std::move(iface));
        }

        facts.management_address = select_management_address(facts.interfaces);

        std::unordered_map<vlan_id, std::size_t> vlan_index;
        for (auto const *block : tree.roots_matching(vlan_pattern()))
        {
            auto vlan = extract_vlan(*block);
            if (!vlan.has_value())
            {
                continue;
            }
            if (auto const it = vlan_index.find(vlan->id); it != vlan_index.end())
            {
                facts.vlans[it->second] = std::move(*vlan);
                continue;
            }
            vlan_index.emplace(vlan->id, facts.vlans.size());
            facts.vlans.push_back(std::move(*vlan));
        }

        return facts;
    }

    auto extract_device_facts(std::string_view const config_text, extract_options const &options) -> device_facts
    {
        auto const tree = line_tree::parse(config_text);
        return extract_device_facts(tree, config_text, options);
    }

    // ----------------------------------------------------------------------------
    // device_facts lookups
    // ----------------------------------------------------------------------------

    auto device_facts::find_interface(std::string_view const name) const noexcept -> interface_facts const *
    {
        auto const it = std::ranges::find_if(interfaces, [&](auto const &iface)
                                             { return iface.name == name; });
        return it == interfaces.end() ? nullptr : &*it;
    }

    auto device_facts::find_vlan(vlan_id const id) const noexcept -> vlan_facts const *
    {
        auto const it = std::ranges::find_if(vlans, [&](auto const &vlan)
                                             { return vlan.id == id; });
        return it == vlans.end() ? nullptr : &*it;
    }

} // namespace netval
