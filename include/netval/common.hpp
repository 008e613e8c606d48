#pragma once

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wtautological-compare"
#include <fmt/ranges.h>
#pragma GCC diagnostic pop
#include <cstddef>
#include <cstdint>
#include <expected>
#include <fmt/format.h>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace netval
{

    // ============================================================================
    // error handling - sub-rule failures are values, not stack unwinding
    // ============================================================================

    enum class error_code : std::uint8_t
    {
        success = 0,
        invalid_vlan_id,
        invalid_vlan_range,
        invalid_address,
        invalid_netmask,
        invalid_prefix_length,
        address_family_mismatch,
        project_not_found,
        device_not_found,
        link_not_found,
        config_not_found,
        duplicate_id,
        file_open_failed,
        file_read_failed,
        invalid_argument,
    };

    struct error_code_formatter
    {
        [[nodiscard]] static constexpr auto to_string(error_code const ec) noexcept
            -> std::string_view
        {
            switch (ec)
            {
            case error_code::success:
                return "success";
            case error_code::invalid_vlan_id:
                return "invalid_vlan_id";
            case error_code::invalid_vlan_range:
                return "invalid_vlan_range";
            case error_code::invalid_address:
                return "invalid_address";
            case error_code::invalid_netmask:
                return "invalid_netmask";
            case error_code::invalid_prefix_length:
                return "invalid_prefix_length";
            case error_code::address_family_mismatch:
                return "address_family_mismatch";
            case error_code::project_not_found:
                return "project_not_found";
            case error_code::device_not_found:
                return "device_not_found";
            case error_code::link_not_found:
                return "link_not_found";
            case error_code::config_not_found:
                return "config_not_found";
            case error_code::duplicate_id:
                return "duplicate_id";
            case error_code::file_open_failed:
                return "file_open_failed";
            case error_code::file_read_failed:
                return "file_read_failed";
            case error_code::invalid_argument:
                return "invalid_argument";
            }
            return "unknown_error";
        }
    };

    template <typename T>
    using result = std::expected<T, error_code>;

    using void_result = std::expected<void, error_code>;

    // vlan ids travel as plain integers; the set keeps them sorted and unique
    using vlan_id = std::uint16_t;
    using vlan_set = std::set<vlan_id>;

    namespace constants
    {
        // how much of a raw config the vendor/platform heuristics look at
        inline constexpr std::size_t default_scan_line_limit = 100;

        inline constexpr std::uint8_t ipv4_max_prefix = 32;
        inline constexpr std::uint8_t ipv6_max_prefix = 128;

        inline constexpr std::string_view default_vendor = "cisco";
        inline constexpr std::string_view default_platform = "ios-xe";
        inline constexpr std::string_view default_medium = "ethernet";
    }

    namespace text_utils
    {
        [[nodiscard]] constexpr auto is_space(char const c) noexcept -> bool
        {
            return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
        }

        [[nodiscard]] constexpr auto trim(std::string_view str) noexcept -> std::string_view
        {
            while (!str.empty() && is_space(str.front()))
            {
                str.remove_prefix(1);
            }
            while (!str.empty() && is_space(str.back()))
            {
                str.remove_suffix(1);
            }
            return str;
        }

        // runs of whitespace separate tokens, never yields an empty one
        [[nodiscard]] auto split_tokens(std::string_view str) -> std::vector<std::string_view>;
    }

} // namespace netval

template <>
struct fmt::formatter<netval::error_code> : fmt::formatter<std::string_view>
{
    auto format(netval::error_code const ec, format_context &ctx) const
    {
        return fmt::formatter<std::string_view>::format(
            netval::error_code_formatter::to_string(ec), ctx);
    }
};
