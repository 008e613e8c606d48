#pragma once

// settings.hpp - knobs for the tool and the service
// defaults, then environment, then command line

#include "common.hpp"
#include "extractor.hpp"
#include "logging.hpp"

#include <string>
#include <string_view>

namespace netval
{

    struct settings
    {
        log_level level{log_level::info};
        std::size_t scan_line_limit{constants::default_scan_line_limit};
        std::string default_vendor{constants::default_vendor};
        std::string default_platform{constants::default_platform};

        // NETVAL_LOG_LEVEL, NETVAL_SCAN_LINES over the defaults
        [[nodiscard]] static auto from_environment() -> result<settings>;

        [[nodiscard]] auto extraction() const noexcept -> extract_options
        {
            return extract_options{.scan_line_limit = scan_line_limit};
        }
    };

    // positive decimal line count
    [[nodiscard]] auto parse_scan_line_limit(std::string_view text) noexcept -> result<std::size_t>;

} // namespace netval
