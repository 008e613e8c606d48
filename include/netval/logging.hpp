#pragma once

// logging.hpp - leveled diagnostics on stderr
// fmt does the work, this just decides whether to bother

#include "common.hpp"

#include <atomic>
#include <cstdio>
#include <string_view>
#include <utility>

namespace netval
{

    enum class log_level : std::uint8_t
    {
        trace,
        debug,
        info,
        warn,
        error,
        off,
    };

    [[nodiscard]] constexpr auto to_string(log_level const level) noexcept -> std::string_view
    {
        switch (level)
        {
        case log_level::trace:
            return "trace";
        case log_level::debug:
            return "debug";
        case log_level::info:
            return "info";
        case log_level::warn:
            return "warn";
        case log_level::error:
            return "error";
        case log_level::off:
            return "off";
        }
        return "unknown";
    }

    [[nodiscard]] auto parse_log_level(std::string_view text) noexcept -> result<log_level>;

    namespace logging
    {

        namespace detail
        {
            inline std::atomic<log_level> threshold{log_level::info};
        }

        inline auto set_level(log_level const level) noexcept -> void
        {
            detail::threshold.store(level, std::memory_order_relaxed);
        }

        [[nodiscard]] inline auto level() noexcept -> log_level
        {
            return detail::threshold.load(std::memory_order_relaxed);
        }

        [[nodiscard]] inline auto enabled(log_level const level) noexcept -> bool
        {
            auto const current = logging::level();
            return current != log_level::off && level >= current;
        }

        template <typename... Args>
        auto write(log_level const level, std::string_view const component,
                   fmt::format_string<Args...> format, Args &&...args) -> void
        {
            if (!enabled(level))
            {
                return;
            }
            fmt::print(stderr, "[{}] {}: {}\n", to_string(level), component,
                       fmt::format(format, std::forward<Args>(args)...));
        }

        template <typename... Args>
        auto trace(std::string_view const component, fmt::format_string<Args...> format, Args &&...args) -> void
        {
            write(log_level::trace, component, format, std::forward<Args>(args)...);
        }

        template <typename... Args>
        auto debug(std::string_view const component, fmt::format_string<Args...> format, Args &&...args) -> void
        {
            write(log_level::debug, component, format, std::forward<Args>(args)...);
        }

        template <typename... Args>
        auto info(std::string_view const component, fmt::format_string<Args...> format, Args &&...args) -> void
        {
            write(log_level::info, component, format, std::forward<Args>(args)...);
        }

        template <typename... Args>
        auto warn(std::string_view const component, fmt::format_string<Args...> format, Args &&...args) -> void
        {
            write(log_level::warn, component, format, std::forward<Args>(args)...);
        }

        template <typename... Args>
        auto error(std::string_view const component, fmt::format_string<Args...> format, Args &&...args) -> void
        {
            write(log_level::error, component, format, std::forward<Args>(args)...);
        }

    } // namespace logging

} // namespace netval

template <>
struct fmt::formatter<netval::log_level> : fmt::formatter<std::string_view>
{
    auto format(netval::log_level const level, format_context &ctx) const
    {
        return fmt::formatter<std::string_view>::format(netval::to_string(level), ctx);
    }
};
