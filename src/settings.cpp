// settings.cpp - environment overrides and value parsing

#include "netval/settings.hpp"

#include <charconv>
#include <cstdlib>

namespace netval
{

    auto parse_log_level(std::string_view text) noexcept -> result<log_level>
    {
        text = text_utils::trim(text);
        for (auto const level : {log_level::trace, log_level::debug, log_level::info,
                                 log_level::warn, log_level::error, log_level::off})
        {
            if (text == to_string(level))
            {
                return level;
            }
        }
        if (text == "warning")
        {
            return log_level::warn;
        }
        return std::unexpected{error_code::invalid_argument};
    }

    auto parse_scan_line_limit(std::string_view text) noexcept -> result<std::size_t>
    {
        text = text_utils::trim(text);
        if (text.empty())
        {
            return std::unexpected{error_code::invalid_argument};
        }

        std::size_t value{0};
        auto const *const last = text.data() + text.size();
        auto const [ptr, ec] = std::from_chars(text.data(), last, value);
        if (ec != std::errc{} || ptr != last || value == 0)
        {
            return std::unexpected{error_code::invalid_argument};
        }
        return value;
    }

    auto settings::from_environment() -> result<settings>
    {
        settings cfg;

        if (char const *const level = std::getenv("NETVAL_LOG_LEVEL"); level != nullptr)
        {
            auto const parsed = parse_log_level(level);
            if (!parsed.has_value())
            {
                return std::unexpected{parsed.error()};
            }
            cfg.level = *parsed;
        }

        if (char const *const lines = std::getenv("NETVAL_SCAN_LINES"); lines != nullptr)
        {
            auto const parsed = parse_scan_line_limit(lines);
            if (!parsed.has_value())
            {
                return std::unexpected{parsed.error()};
            }
            cfg.scan_line_limit = *parsed;
        }

        return cfg;
    }

} // namespace netval
