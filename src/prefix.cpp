// prefix.cpp - address + mask to canonical network
// leans on inet_pton so we don't have to hand-roll an ipv6 parser

#include "netval/prefix.hpp"

#include <arpa/inet.h>
#include <bit>
#include <charconv>
#include <cstring>
#include <netinet/in.h>

namespace netval
{

    namespace
    {

        // inet_pton wants a terminated string
        [[nodiscard]] auto to_cstring(std::string_view text, std::array<char, INET6_ADDRSTRLEN + 1> &buffer) noexcept
            -> bool
        {
            if (text.size() >= buffer.size())
            {
                return false;
            }
            std::memcpy(buffer.data(), text.data(), text.size());
            buffer[text.size()] = '\0';
            return true;
        }

        [[nodiscard]] auto parse_ipv4_word(std::string_view text) noexcept -> result<std::uint32_t>
        {
            std::array<char, INET6_ADDRSTRLEN + 1> buffer{};
            if (!to_cstring(text, buffer))
            {
                return std::unexpected{error_code::invalid_address};
            }

            in_addr addr{};
            if (::inet_pton(AF_INET, buffer.data(), &addr) != 1)
            {
                return std::unexpected{error_code::invalid_address};
            }
            return ntohl(addr.s_addr);
        }

        [[nodiscard]] auto parse_prefix_length(std::string_view text, std::uint8_t const max_prefix) noexcept
            -> result<std::uint8_t>
        {
            if (text.empty())
            {
                return std::unexpected{error_code::invalid_prefix_length};
            }

            unsigned value{0};
            auto const *const last = text.data() + text.size();
            auto const [ptr, ec] = std::from_chars(text.data(), last, value);
            if (ec != std::errc{} || ptr != last || value > max_prefix)
            {
                return std::unexpected{error_code::invalid_prefix_length};
            }
            return static_cast<std::uint8_t>(value);
        }

        auto zero_host_bits(canonical_network &net) noexcept -> void
        {
            for (std::size_t i = 0; i < net.address_size(); ++i)
            {
                auto const bit_offset = i * 8;
                if (bit_offset >= net.prefix_length)
                {
                    net.bytes[i] = 0;
                }
                else if (bit_offset + 8 > net.prefix_length)
                {
                    auto const kept = net.prefix_length - bit_offset;
                    net.bytes[i] &= static_cast<std::uint8_t>(0xFF << (8 - kept));
                }
            }
        }

    } // anonymous namespace

    auto canonical_network::to_string() const -> std::string
    {
        std::array<char, INET6_ADDRSTRLEN> buffer{};
        auto const af = family == address_family::ipv4 ? AF_INET : AF_INET6;
        if (::inet_ntop(af, bytes.data(), buffer.data(), static_cast<socklen_t>(buffer.size())) == nullptr)
        {
            return fmt::format("<invalid>/{}", prefix_length);
        }
        return fmt::format("{}/{}", buffer.data(), prefix_length);
    }

    auto parse_address(std::string_view text) noexcept -> result<parsed_address>
    {
        text = text_utils::trim(text);

        std::array<char, INET6_ADDRSTRLEN + 1> buffer{};
        if (text.empty() || !to_cstring(text, buffer))
        {
            return std::unexpected{error_code::invalid_address};
        }

        parsed_address out{};
        if (::inet_pton(AF_INET, buffer.data(), out.bytes.data()) == 1)
        {
            out.family = address_family::ipv4;
            return out;
        }
        if (::inet_pton(AF_INET6, buffer.data(), out.bytes.data()) == 1)
        {
            out.family = address_family::ipv6;
            return out;
        }

        return std::unexpected{error_code::invalid_address};
    }

    auto dotted_mask_to_prefix(std::string_view mask) noexcept -> result<std::uint8_t>
    {
        auto const word = parse_ipv4_word(text_utils::trim(mask));
        if (!word.has_value())
        {
            return std::unexpected{error_code::invalid_netmask};
        }

        auto const bits = *word;

        // netmask: ones then zeros
        auto const inverted = ~bits;
        if ((inverted & (inverted + 1)) == 0)
        {
            return static_cast<std::uint8_t>(std::popcount(bits));
        }

        // host mask: zeros then ones
        if ((bits & (bits + 1)) == 0)
        {
            return static_cast<std::uint8_t>(constants::ipv4_max_prefix - std::popcount(bits));
        }

        return std::unexpected{error_code::invalid_netmask};
    }

    auto normalize_prefix(std::string_view const address, std::string_view mask) noexcept
        -> result<canonical_network>
    {
        auto const parsed = parse_address(address);
        if (!parsed.has_value())
        {
            return std::unexpected{parsed.error()};
        }

        canonical_network net{.family = parsed->family, .bytes = parsed->bytes, .prefix_length = 0};

        mask = text_utils::trim(mask);
        if (mask.starts_with('/'))
        {
            auto const length = parse_prefix_length(mask.substr(1), net.max_prefix());
            if (!length.has_value())
            {
                return std::unexpected{length.error()};
            }
            net.prefix_length = *length;
        }
        else
        {
            if (net.family != address_family::ipv4)
            {
                return std::unexpected{error_code::address_family_mismatch};
            }
            auto const length = dotted_mask_to_prefix(mask);
            if (!length.has_value())
            {
                return std::unexpected{length.error()};
            }
            net.prefix_length = *length;
        }

        zero_host_bits(net);
        return net;
    }

    auto same_network(std::string_view const address_a, std::string_view const mask_a,
                      std::string_view const address_b, std::string_view const mask_b) noexcept -> bool
    {
        auto const a = normalize_prefix(address_a, mask_a);
        auto const b = normalize_prefix(address_b, mask_b);
        return a.has_value() && b.has_value() && *a == *b;
    }

} // namespace netval
