#pragma once

// device_facts.hpp - what a device's configuration says it is
// produced fresh on every extraction, never merged

#include "common.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace netval
{

    enum class interface_mode : std::uint8_t
    {
        access,
        trunk,
    };

    enum class admin_state : std::uint8_t
    {
        up,
        down,
    };

    [[nodiscard]] constexpr auto to_string(interface_mode const mode) noexcept -> std::string_view
    {
        switch (mode)
        {
        case interface_mode::access:
            return "access";
        case interface_mode::trunk:
            return "trunk";
        }
        return "unknown";
    }

    [[nodiscard]] constexpr auto to_string(admin_state const state) noexcept -> std::string_view
    {
        switch (state)
        {
        case admin_state::up:
            return "up";
        case admin_state::down:
            return "down";
        }
        return "unknown";
    }

    [[nodiscard]] constexpr auto parse_interface_mode(std::string_view const text) noexcept
        -> std::optional<interface_mode>
    {
        if (text == "access")
        {
            return interface_mode::access;
        }
        if (text == "trunk")
        {
            return interface_mode::trunk;
        }
        return std::nullopt;
    }

    // ============================================================================
    // per-interface facts
    // ============================================================================

    struct interface_facts
    {
        std::string name{};
        std::string description{};
        interface_mode mode{interface_mode::access};
        std::optional<vlan_id> access_vlan{};
        vlan_set trunk_allowed_vlans{};
        std::optional<std::string> address{};
        std::optional<std::string> mask{};
        admin_state state{admin_state::up};

        [[nodiscard]] auto has_address() const noexcept -> bool
        {
            return address.has_value() && !address->empty() && mask.has_value() && !mask->empty();
        }

        [[nodiscard]] auto is_loopback() const noexcept -> bool
        {
            return name.find("Loopback") != std::string::npos;
        }

        [[nodiscard]] auto operator==(interface_facts const &) const -> bool = default;
    };

    struct vlan_facts
    {
        vlan_id id{0};
        std::string name{};

        [[nodiscard]] auto operator==(vlan_facts const &) const -> bool = default;
    };

    // ============================================================================
    // whole-device facts
    // ============================================================================

    struct device_facts
    {
        std::optional<std::string> hostname{};
        std::optional<std::string> vendor{};
        std::optional<std::string> platform{};
        std::optional<std::string> management_address{};
        std::vector<interface_facts> interfaces{};  // document order, unique names
        std::vector<vlan_facts> vlans{};            // document order, unique ids

        [[nodiscard]] auto find_interface(std::string_view name) const noexcept -> interface_facts const *;
        [[nodiscard]] auto find_vlan(vlan_id id) const noexcept -> vlan_facts const *;

        [[nodiscard]] auto operator==(device_facts const &) const -> bool = default;
    };

} // namespace netval

template <>
struct fmt::formatter<netval::interface_mode> : fmt::formatter<std::string_view>
{
    auto format(netval::interface_mode const mode, format_context &ctx) const
    {
        return fmt::formatter<std::string_view>::format(netval::to_string(mode), ctx);
    }
};

template <>
struct fmt::formatter<netval::admin_state> : fmt::formatter<std::string_view>
{
    auto format(netval::admin_state const state, format_context &ctx) const
    {
        return fmt::formatter<std::string_view>::format(netval::to_string(state), ctx);
    }
};
