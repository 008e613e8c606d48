#pragma once

// extractor.hpp - device facts from raw configuration text
// heuristic by nature: a narrow slice of CLI-style config, nothing more

#include "common.hpp"
#include "device_facts.hpp"
#include "line_tree.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace netval
{

    struct extract_options
    {
        // raw lines read by the vendor/platform heuristics
        std::size_t scan_line_limit{constants::default_scan_line_limit};
    };

    struct platform_hint
    {
        std::optional<std::string> vendor{};
        std::optional<std::string> platform{};

        [[nodiscard]] auto operator==(platform_hint const &) const -> bool = default;
    };

    // ============================================================================
    // extraction entry points - these never fail, missing facts stay unset
    // ============================================================================

    [[nodiscard]] auto extract_device_facts(std::string_view config_text, extract_options const &options = {})
        -> device_facts;

    // for callers that already hold the parsed tree
    [[nodiscard]] auto extract_device_facts(line_tree const &tree, std::string_view config_text,
                                            extract_options const &options = {}) -> device_facts;

    // ============================================================================
    // individual rules, exposed for testing
    // ============================================================================

    // comment markers ("! vendor: arista") and banner substrings in the first lines
    [[nodiscard]] auto detect_platform(std::string_view config_text, std::size_t scan_line_limit) -> platform_hint;

    [[nodiscard]] auto extract_hostname(line_tree const &tree) -> std::optional<std::string>;

    // one "interface <name>" block
    [[nodiscard]] auto extract_interface(line_node const &block) -> interface_facts;

    // one "vlan <id>" block, nothing if the id is not a number
    [[nodiscard]] auto extract_vlan(line_node const &block) -> std::optional<vlan_facts>;

    // first loopback with an address, else first interface with an address
    [[nodiscard]] auto select_management_address(std::span<interface_facts const> interfaces)
        -> std::optional<std::string>;

} // namespace netval
