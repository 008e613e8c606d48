#pragma once

// link_validator.hpp - is a modeled link consistent with both ends' facts?
// one layer agreeing is enough

#include "common.hpp"
#include "device_facts.hpp"

#include <string_view>

namespace netval
{

    enum class link_state : std::uint8_t
    {
        pending, // never validated
        up,
        down,
    };

    [[nodiscard]] constexpr auto to_string(link_state const state) noexcept -> std::string_view
    {
        switch (state)
        {
        case link_state::pending:
            return "pending";
        case link_state::up:
            return "up";
        case link_state::down:
            return "down";
        }
        return "unknown";
    }

    // ============================================================================
    // per-layer outcome, kept so callers can say why
    // ============================================================================

    struct link_evaluation
    {
        bool endpoints_resolved{false};
        bool l2_checked{false};
        bool l2_up{false};
        bool l3_checked{false};
        bool l3_up{false};
        link_state state{link_state::down};

        [[nodiscard]] auto operator==(link_evaluation const &) const -> bool = default;
    };

    // access/access: same vlan, both set. trunk/trunk: allowed sets intersect.
    // access/trunk pairs are not checked and never count as up.
    [[nodiscard]] auto l2_compatible(interface_facts const &a, interface_facts const &b) noexcept -> bool;

    // both addressed and on the same canonical network; bad input is simply not up
    [[nodiscard]] auto l3_compatible(interface_facts const &a, interface_facts const &b) noexcept -> bool;

    // nullptr marks an endpoint that could not be resolved, which forces down
    [[nodiscard]] auto evaluate_link(interface_facts const *source, interface_facts const *target) noexcept
        -> link_evaluation;

    [[nodiscard]] auto validate_link(interface_facts const *source, interface_facts const *target) noexcept
        -> link_state;

} // namespace netval

template <>
struct fmt::formatter<netval::link_state> : fmt::formatter<std::string_view>
{
    auto format(netval::link_state const state, format_context &ctx) const
    {
        return fmt::formatter<std::string_view>::format(netval::to_string(state), ctx);
    }
};
