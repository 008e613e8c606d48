// vlan.cpp - VLAN list expansion and encoding
// every malformed piece is dropped on the floor, the rest still counts

#include "netval/vlan.hpp"

#include <algorithm>
#include <charconv>
#include <optional>

namespace netval
{

    auto parse_vlan_id(std::string_view token) noexcept -> result<vlan_id>
    {
        token = text_utils::trim(token);
        if (token.empty())
        {
            return std::unexpected{error_code::invalid_vlan_id};
        }

        vlan_id value{0};
        auto const *const first = token.data();
        auto const *const last = token.data() + token.size();
        auto const [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc{} || ptr != last)
        {
            return std::unexpected{error_code::invalid_vlan_id};
        }

        return value;
    }

    auto parse_vlan_range(std::string_view token) noexcept -> result<vlan_set>
    {
        token = text_utils::trim(token);

        auto const dash = token.find('-');
        if (dash == std::string_view::npos)
        {
            auto const single = parse_vlan_id(token);
            if (!single.has_value())
            {
                return std::unexpected{single.error()};
            }
            return vlan_set{*single};
        }

        // "a-b-c" is not a range
        if (token.find('-', dash + 1) != std::string_view::npos)
        {
            return std::unexpected{error_code::invalid_vlan_range};
        }

        auto const low = parse_vlan_id(token.substr(0, dash));
        auto const high = parse_vlan_id(token.substr(dash + 1));
        if (!low.has_value() || !high.has_value())
        {
            return std::unexpected{error_code::invalid_vlan_range};
        }

        vlan_set ids;
        for (auto id = static_cast<std::uint32_t>(*low); id <= *high; ++id)
        {
            ids.insert(static_cast<vlan_id>(id));
        }
        return ids;
    }

    auto expand_vlan_range(std::string_view const expression) -> vlan_set
    {
        vlan_set ids;

        std::size_t pos = 0;
        while (pos <= expression.size())
        {
            auto const comma = expression.find(',', pos);
            auto const end = comma == std::string_view::npos ? expression.size() : comma;

            auto const part = parse_vlan_range(expression.substr(pos, end - pos));
            if (part.has_value())
            {
                ids.insert(part->begin(), part->end());
            }

            if (comma == std::string_view::npos)
            {
                break;
            }
            pos = comma + 1;
        }

        return ids;
    }

    auto expand_vlan_arguments(std::span<std::string const> const arguments) -> vlan_set
    {
        std::string expression;
        for (auto const &argument : arguments)
        {
            if (!expression.empty())
            {
                expression += ',';
            }
            expression += argument;
        }
        return expand_vlan_range(expression);
    }

    auto vlan_list_change::apply_to(vlan_set &target) const -> void
    {
        switch (edit)
        {
        case vlan_list_edit::replace:
            target = ids;
            break;
        case vlan_list_edit::add:
            target.insert(ids.begin(), ids.end());
            break;
        case vlan_list_edit::remove:
            for (auto const id : ids)
            {
                target.erase(id);
            }
            break;
        case vlan_list_edit::clear:
            target.clear();
            break;
        }
    }

    auto parse_vlan_list_change(std::string_view argument) -> vlan_list_change
    {
        argument = text_utils::trim(argument);

        auto const keyword_arg = [&](std::string_view const keyword) -> std::optional<std::string_view>
        {
            if (!argument.starts_with(keyword))
            {
                return std::nullopt;
            }
            auto const rest = argument.substr(keyword.size());
            if (!rest.empty() && !text_utils::is_space(rest.front()))
            {
                return std::nullopt;
            }
            return text_utils::trim(rest);
        };

        if (argument == "none")
        {
            return vlan_list_change{.edit = vlan_list_edit::clear, .ids = {}};
        }
        if (auto const rest = keyword_arg("add"))
        {
            return vlan_list_change{.edit = vlan_list_edit::add, .ids = expand_vlan_range(*rest)};
        }
        if (auto const rest = keyword_arg("remove"))
        {
            return vlan_list_change{.edit = vlan_list_edit::remove, .ids = expand_vlan_range(*rest)};
        }

        return vlan_list_change{.edit = vlan_list_edit::replace, .ids = expand_vlan_range(argument)};
    }

    auto encode_vlan_list(vlan_set const &ids) -> std::string
    {
        return fmt::format("[{}]", fmt::join(ids, ", "));
    }

    auto decode_vlan_list(std::string_view text) -> std::vector<vlan_id>
    {
        text = text_utils::trim(text);
        if (text.size() < 2 || text.front() != '[' || text.back() != ']')
        {
            return {};
        }

        auto const body = text_utils::trim(text.substr(1, text.size() - 2));
        if (body.empty())
        {
            return {};
        }

        std::vector<vlan_id> ids;
        std::size_t pos = 0;
        while (pos <= body.size())
        {
            auto const comma = body.find(',', pos);
            auto const end = comma == std::string_view::npos ? body.size() : comma;

            auto const id = parse_vlan_id(body.substr(pos, end - pos));
            if (!id.has_value())
            {
                return {};
            }
            ids.push_back(*id);

            if (comma == std::string_view::npos)
            {
                break;
            }
            pos = comma + 1;
        }

        return ids;
    }

} // namespace netval
