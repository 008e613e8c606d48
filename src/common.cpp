// common.cpp - shared text helpers

#include "netval/common.hpp"

namespace netval
{

    auto text_utils::split_tokens(std::string_view str) -> std::vector<std::string_view>
    {
        std::vector<std::string_view> tokens;
        std::size_t pos = 0;
        while (pos < str.size())
        {
            while (pos < str.size() && is_space(str[pos]))
            {
                ++pos;
            }
            auto const start = pos;
            while (pos < str.size() && !is_space(str[pos]))
            {
                ++pos;
            }
            if (pos > start)
            {
                tokens.push_back(str.substr(start, pos - start));
            }
        }
        return tokens;
    }

} // namespace netval
