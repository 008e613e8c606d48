#pragma once

// config_source.hpp - loading captured configuration text from disk

#include "common.hpp"

#include <filesystem>
#include <string>

namespace netval
{

    [[nodiscard]] auto read_config_file(std::filesystem::path const &path) -> result<std::string>;

} // namespace netval
