#pragma once

// vlan.hpp - VLAN id lists as written in switch configs
// "10,20,30-33" in, a set of integers out

#include "common.hpp"

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace netval
{

    // ============================================================================
    // single ids and ranges
    // ============================================================================

    // decimal, surrounding whitespace allowed, nothing else
    [[nodiscard]] auto parse_vlan_id(std::string_view token) noexcept -> result<vlan_id>;

    // one "a" or "a-b" sub-expression; a > b names no ids
    [[nodiscard]] auto parse_vlan_range(std::string_view token) noexcept -> result<vlan_set>;

    // comma-separated list; unparseable sub-expressions are skipped, never fatal
    [[nodiscard]] auto expand_vlan_range(std::string_view expression) -> vlan_set;

    // one expression split across several arguments; each boundary counts as a comma
    [[nodiscard]] auto expand_vlan_arguments(std::span<std::string const> arguments) -> vlan_set;

    // ============================================================================
    // "switchport trunk allowed vlan ..." argument forms
    // ============================================================================

    enum class vlan_list_edit : std::uint8_t
    {
        replace,
        add,
        remove,
        clear,
    };

    struct vlan_list_change
    {
        vlan_list_edit edit{vlan_list_edit::replace};
        vlan_set ids{};

        auto apply_to(vlan_set &target) const -> void;
    };

    [[nodiscard]] auto parse_vlan_list_change(std::string_view argument) -> vlan_list_change;

    // ============================================================================
    // textual encoding used when VLAN lists are handed to a store
    // ============================================================================

    // "[10, 20, 30]"
    [[nodiscard]] auto encode_vlan_list(vlan_set const &ids) -> std::string;

    // anything that is not a well-formed list decodes to the empty list
    [[nodiscard]] auto decode_vlan_list(std::string_view text) -> std::vector<vlan_id>;

} // namespace netval
