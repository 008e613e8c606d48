#pragma once

// prefix.hpp - network prefix normalization for subnet comparison
// "10.0.0.5 255.255.255.0" and "10.0.0.9 /24" are the same wire

#include "common.hpp"

#include <array>
#include <compare>
#include <string>
#include <string_view>

namespace netval
{

    enum class address_family : std::uint8_t
    {
        ipv4,
        ipv6,
    };

    // ============================================================================
    // canonical network - host bits zeroed, comparable by value
    // ============================================================================

    struct canonical_network
    {
        using storage_type = std::array<std::uint8_t, 16>;

        address_family family{address_family::ipv4};
        storage_type bytes{};            // ipv4 uses the first four
        std::uint8_t prefix_length{0};

        [[nodiscard]] constexpr auto address_size() const noexcept -> std::size_t
        {
            return family == address_family::ipv4 ? 4 : 16;
        }

        [[nodiscard]] constexpr auto max_prefix() const noexcept -> std::uint8_t
        {
            return family == address_family::ipv4 ? constants::ipv4_max_prefix : constants::ipv6_max_prefix;
        }

        // "10.0.0.0/24"
        [[nodiscard]] auto to_string() const -> std::string;

        [[nodiscard]] constexpr auto operator<=>(canonical_network const &) const noexcept = default;
    };

    // ============================================================================
    // parsing pieces
    // ============================================================================

    struct parsed_address
    {
        address_family family{address_family::ipv4};
        canonical_network::storage_type bytes{};
    };

    [[nodiscard]] auto parse_address(std::string_view text) noexcept -> result<parsed_address>;

    // contiguous netmask ("255.255.255.0") or host mask ("0.0.0.255") to a prefix length
    [[nodiscard]] auto dotted_mask_to_prefix(std::string_view mask) noexcept -> result<std::uint8_t>;

    // ============================================================================
    // normalizer
    // ============================================================================

    // mask is either "/<len>" or a dotted-decimal mask
    [[nodiscard]] auto normalize_prefix(std::string_view address, std::string_view mask) noexcept
        -> result<canonical_network>;

    // both normalize and land on the same network
    [[nodiscard]] auto same_network(std::string_view address_a, std::string_view mask_a,
                                    std::string_view address_b, std::string_view mask_b) noexcept -> bool;

} // namespace netval

template <>
struct fmt::formatter<netval::canonical_network> : fmt::formatter<std::string_view>
{
    auto format(netval::canonical_network const &net, format_context &ctx) const
    {
        return fmt::formatter<std::string_view>::format(net.to_string(), ctx);
    }
};
