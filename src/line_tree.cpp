// line_tree.cpp - block structure recovery for CLI-style config dumps
// one pass, one stack, no opinions about malformed indentation

#include "netval/line_tree.hpp"

#include <utility>

namespace netval
{

    namespace
    {

        struct open_block
        {
            std::size_t indent;
            line_node *node;
        };

        auto collect_matches(line_node const &node, std::regex const &pattern, line_match &out) -> void
        {
            if (std::regex_search(node.text, pattern))
            {
                out.push_back(&node);
            }
            for (auto const &child : node.children)
            {
                collect_matches(child, pattern, out);
            }
        }

    } // anonymous namespace

    auto line_node::token(std::size_t const index) const -> std::string_view
    {
        auto const tokens = text_utils::split_tokens(text);
        return index < tokens.size() ? tokens[index] : std::string_view{};
    }

    auto line_tree::parse(std::string_view const config_text) -> line_tree
    {
        line_tree tree;

        // every node on the stack is the last child of the node below it, so
        // appending to a parent never moves a node that is still open
        std::vector<open_block> stack;

        std::size_t line_number = 0;
        std::size_t pos = 0;
        while (pos <= config_text.size())
        {
            auto const eol = config_text.find('\n', pos);
            auto const end = eol == std::string_view::npos ? config_text.size() : eol;
            auto const raw = config_text.substr(pos, end - pos);
            ++line_number;
            pos = end + 1;

            auto const text = text_utils::trim(raw);
            if (!text.empty())
            {
                auto const depth = indentation_of(raw);

                while (!stack.empty() && stack.back().indent >= depth)
                {
                    stack.pop_back();
                }

                line_node node{
                    .text = std::string{text},
                    .indent = depth,
                    .line_number = line_number,
                    .children = {}};

                auto &siblings = stack.empty() ? tree.roots_ : stack.back().node->children;
                siblings.push_back(std::move(node));
                stack.push_back(open_block{depth, &siblings.back()});
                ++tree.node_count_;
            }

            if (eol == std::string_view::npos)
            {
                break;
            }
        }

        return tree;
    }

    auto line_tree::roots_matching(std::regex const &pattern) const -> line_match
    {
        line_match out;
        for (auto const &root : roots_)
        {
            if (std::regex_search(root.text, pattern))
            {
                out.push_back(&root);
            }
        }
        return out;
    }

    auto line_tree::find_all(std::regex const &pattern) const -> line_match
    {
        line_match out;
        for (auto const &root : roots_)
        {
            collect_matches(root, pattern, out);
        }
        return out;
    }

    auto children_matching(line_node const &node, std::regex const &pattern) -> line_match
    {
        line_match out;
        for (auto const &child : node.children)
        {
            if (std::regex_search(child.text, pattern))
            {
                out.push_back(&child);
            }
        }
        return out;
    }

} // namespace netval
