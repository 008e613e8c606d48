#pragma once

// line_tree.hpp - indentation-derived hierarchy over configuration text
// a command line owns every deeper-indented line that follows it

#include "common.hpp"

#include <regex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace netval
{

    // ============================================================================
    // one configuration line and the lines it configures
    // ============================================================================

    struct line_node
    {
        std::string text{};          // indentation and trailing whitespace removed
        std::size_t indent{0};       // count of leading whitespace characters
        std::size_t line_number{0};  // 1-based position in the source text
        std::vector<line_node> children{};

        [[nodiscard]] auto is_leaf() const noexcept -> bool { return children.empty(); }

        // nth whitespace-delimited token of the text, empty if there are fewer
        [[nodiscard]] auto token(std::size_t index) const -> std::string_view;
    };

    using line_match = std::vector<line_node const *>;

    // ============================================================================
    // line tree - a forest, since a config dump has no single root
    // ============================================================================

    class line_tree
    {
    private:
        std::vector<line_node> roots_{};
        std::size_t node_count_{0};

    public:
        line_tree() = default;

        // never fails: bad indentation degrades to more top-level nodes
        [[nodiscard]] static auto parse(std::string_view config_text) -> line_tree;

        [[nodiscard]] auto roots() const noexcept -> std::span<line_node const> { return roots_; }
        [[nodiscard]] auto node_count() const noexcept -> std::size_t { return node_count_; }
        [[nodiscard]] auto empty() const noexcept -> bool { return roots_.empty(); }

        // top-level nodes whose text matches, in document order
        [[nodiscard]] auto roots_matching(std::regex const &pattern) const -> line_match;

        // nodes at any depth whose text matches, in document order
        [[nodiscard]] auto find_all(std::regex const &pattern) const -> line_match;
    };

    // direct children of a node whose text matches, in order
    [[nodiscard]] auto children_matching(line_node const &node, std::regex const &pattern) -> line_match;

    // leading whitespace width of a raw line
    [[nodiscard]] constexpr auto indentation_of(std::string_view line) noexcept -> std::size_t
    {
        std::size_t depth = 0;
        while (depth < line.size() && text_utils::is_space(line[depth]))
        {
            ++depth;
        }
        return depth;
    }

} // namespace netval
