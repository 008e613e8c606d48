// config_source.cpp - whole-file reads, nothing clever

#include "netval/config_source.hpp"

#include <fstream>
#include <iterator>

namespace netval
{

    auto read_config_file(std::filesystem::path const &path) -> result<std::string>
    {
        std::ifstream file{path, std::ios::binary};
        if (!file)
        {
            return std::unexpected{error_code::file_open_failed};
        }

        std::string content{std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
        if (file.bad())
        {
            return std::unexpected{error_code::file_read_failed};
        }
        return content;
    }

} // namespace netval
