// tests/unit/test_line_tree.cpp - indentation hierarchy tests

#include "netval/line_tree.hpp"

#include <doctest/doctest.h>

#include <regex>

using namespace netval;

TEST_SUITE("line_tree")
{
    TEST_CASE("empty and blank input produce an empty forest")
    {
        CHECK(line_tree::parse("").empty());
        CHECK(line_tree::parse("\n\n   \n\t\n").empty());
        CHECK(line_tree::parse("   ").node_count() == 0);
    }

    TEST_CASE("flat lines are all top-level")
    {
        auto const tree = line_tree::parse("hostname r1\nip routing\nend\n");
        REQUIRE(tree.roots().size() == 3);
        CHECK(tree.roots()[0].text == "hostname r1");
        CHECK(tree.roots()[1].text == "ip routing");
        CHECK(tree.roots()[2].text == "end");
        CHECK(tree.node_count() == 3);
    }

    TEST_CASE("indented lines become children of the line above")
    {
        auto const tree = line_tree::parse(
            "interface Gi0/1\n"
            " description uplink\n"
            " shutdown\n"
            "interface Gi0/2\n"
            " switchport mode access\n");

        REQUIRE(tree.roots().size() == 2);
        auto const &first = tree.roots()[0];
        REQUIRE(first.children.size() == 2);
        CHECK(first.children[0].text == "description uplink");
        CHECK(first.children[0].indent == 1);
        CHECK(first.children[1].text == "shutdown");
        CHECK(tree.roots()[1].children.size() == 1);
    }

    TEST_CASE("deeper nesting")
    {
        auto const tree = line_tree::parse(
            "router bgp 65000\n"
            "  address-family ipv4\n"
            "    network 10.0.0.0 mask 255.0.0.0\n"
            "  exit-address-family\n");

        REQUIRE(tree.roots().size() == 1);
        auto const &bgp = tree.roots()[0];
        REQUIRE(bgp.children.size() == 2);
        REQUIRE(bgp.children[0].children.size() == 1);
        CHECK(bgp.children[0].children[0].text == "network 10.0.0.0 mask 255.0.0.0");
        CHECK(bgp.children[1].is_leaf());
        CHECK(tree.node_count() == 4);
    }

    TEST_CASE("line numbers count blank lines too")
    {
        auto const tree = line_tree::parse("a\n\nb\n c\n");
        REQUIRE(tree.roots().size() == 2);
        CHECK(tree.roots()[0].line_number == 1);
        CHECK(tree.roots()[1].line_number == 3);
        CHECK(tree.roots()[1].children[0].line_number == 4);
    }

    TEST_CASE("crlf endings and trailing whitespace are stripped")
    {
        auto const tree = line_tree::parse("interface Gi0/1  \r\n description x\r\n");
        REQUIRE(tree.roots().size() == 1);
        CHECK(tree.roots()[0].text == "interface Gi0/1");
        REQUIRE(tree.roots()[0].children.size() == 1);
        CHECK(tree.roots()[0].children[0].text == "description x");
    }

    TEST_CASE("tabs count as one indentation character each")
    {
        auto const tree = line_tree::parse("vlan 10\n\tname USERS\n");
        REQUIRE(tree.roots().size() == 1);
        REQUIRE(tree.roots()[0].children.size() == 1);
        CHECK(tree.roots()[0].children[0].indent == 1);
    }

    TEST_CASE("ragged indentation attaches to the nearest shallower line")
    {
        // the third line is shallower than its sibling but deeper than the parent
        auto const tree = line_tree::parse(
            "interface Gi0/1\n"
            "    description deep\n"
            "  shutdown\n");

        REQUIRE(tree.roots().size() == 1);
        REQUIRE(tree.roots()[0].children.size() == 2);
        CHECK(tree.roots()[0].children[1].text == "shutdown");
    }

    TEST_CASE("leading indentation on the first line degrades to top-level")
    {
        auto const tree = line_tree::parse("  description orphan\nhostname r1\n");
        REQUIRE(tree.roots().size() == 2);
        CHECK(tree.roots()[0].text == "description orphan");
        CHECK(tree.roots()[1].text == "hostname r1");
    }

    TEST_CASE("missing final newline keeps the last line")
    {
        auto const tree = line_tree::parse("hostname r1\nend");
        REQUIRE(tree.roots().size() == 2);
        CHECK(tree.roots()[1].text == "end");
    }

    TEST_CASE("token access")
    {
        auto const tree = line_tree::parse("ip address   10.0.0.1\t255.0.0.0");
        auto const &node = tree.roots()[0];
        CHECK(node.token(0) == "ip");
        CHECK(node.token(2) == "10.0.0.1");
        CHECK(node.token(3) == "255.0.0.0");
        CHECK(node.token(4).empty());
    }
}

TEST_SUITE("line_tree_queries")
{
    constexpr std::string_view config =
        "interface Gi0/1\n"
        " description one\n"
        " service-policy input X\n"
        "  description nested\n"
        "interface Gi0/2\n"
        " description two\n"
        "description top\n";

    TEST_CASE("roots_matching only looks at top-level lines")
    {
        auto const tree = line_tree::parse(config);
        auto const matches = tree.roots_matching(std::regex{"^interface "});
        REQUIRE(matches.size() == 2);
        CHECK(matches[0]->text == "interface Gi0/1");
        CHECK(matches[1]->text == "interface Gi0/2");
    }

    TEST_CASE("children_matching returns direct children in order")
    {
        auto const tree = line_tree::parse(config);
        auto const matches = children_matching(tree.roots()[0], std::regex{"^description"});
        REQUIRE(matches.size() == 1);
        CHECK(matches[0]->text == "description one");
    }

    TEST_CASE("find_all walks every depth in document order")
    {
        auto const tree = line_tree::parse(config);
        auto const matches = tree.find_all(std::regex{"^description"});
        REQUIRE(matches.size() == 4);
        CHECK(matches[0]->text == "description one");
        CHECK(matches[1]->text == "description nested");
        CHECK(matches[2]->text == "description two");
        CHECK(matches[3]->text == "description top");
    }

    TEST_CASE("no match yields an empty result")
    {
        auto const tree = line_tree::parse(config);
        CHECK(tree.find_all(std::regex{"^router"}).empty());
        CHECK(children_matching(tree.roots()[2], std::regex{"."}).empty());
    }
}
