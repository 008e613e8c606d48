// tests/unit/test_vlan.cpp - VLAN list expansion tests
// the comma-and-dash grammar every switch vendor agrees on, mostly

#include "netval/vlan.hpp"

#include <doctest/doctest.h>

#include <string>
#include <vector>

using namespace netval;

TEST_SUITE("parse_vlan_id")
{
    TEST_CASE("plain numbers")
    {
        CHECK(parse_vlan_id("1").value() == 1);
        CHECK(parse_vlan_id("4094").value() == 4094);
        CHECK(parse_vlan_id(" 10 ").value() == 10);
    }

    TEST_CASE("non-numeric is rejected")
    {
        CHECK(parse_vlan_id("").error() == error_code::invalid_vlan_id);
        CHECK(parse_vlan_id("ten").error() == error_code::invalid_vlan_id);
        CHECK(parse_vlan_id("10a").error() == error_code::invalid_vlan_id);
        CHECK(parse_vlan_id("-5").error() == error_code::invalid_vlan_id);
        CHECK(parse_vlan_id("1 0").error() == error_code::invalid_vlan_id);
    }

    TEST_CASE("values beyond 16 bits are rejected")
    {
        CHECK_FALSE(parse_vlan_id("70000").has_value());
    }
}

TEST_SUITE("expand_vlan_range")
{
    TEST_CASE("singletons, ranges and duplicates collapse into one set")
    {
        CHECK(expand_vlan_range("5,10-12,10") == vlan_set{5, 10, 11, 12});
    }

    TEST_CASE("order does not matter")
    {
        CHECK(expand_vlan_range("30-33,20,10") == expand_vlan_range("10,20,30-33"));
        CHECK(expand_vlan_range("10,20,30-33") == vlan_set{10, 20, 30, 31, 32, 33});
    }

    TEST_CASE("inclusive bounds")
    {
        CHECK(expand_vlan_range("100-100") == vlan_set{100});
        CHECK(expand_vlan_range("1-4094").size() == 4094);
    }

    TEST_CASE("whitespace around pieces is tolerated")
    {
        CHECK(expand_vlan_range(" 10 , 20 - 22 ") == vlan_set{10, 20, 21, 22});
    }

    TEST_CASE("empty or unparseable input yields nothing")
    {
        CHECK(expand_vlan_range("").empty());
        CHECK(expand_vlan_range(",,,").empty());
        CHECK(expand_vlan_range("all").empty());
        CHECK(expand_vlan_range("a-b,x").empty());
    }

    TEST_CASE("bad pieces are skipped, good ones kept")
    {
        CHECK(expand_vlan_range("10,abc,20") == vlan_set{10, 20});
        CHECK(expand_vlan_range("10-x,30") == vlan_set{30});
        CHECK(expand_vlan_range("1-2-3,40") == vlan_set{40});
        CHECK(expand_vlan_range("-5,50") == vlan_set{50});
    }

    TEST_CASE("reversed range names nothing")
    {
        CHECK(expand_vlan_range("20-10").empty());
        CHECK(expand_vlan_range("20-10,5") == vlan_set{5});
    }

    TEST_CASE("range reaching the top of the id space terminates")
    {
        auto const ids = expand_vlan_range("65534-65535");
        CHECK(ids == vlan_set{65534, 65535});
    }
}

TEST_SUITE("expand_vlan_arguments")
{
    TEST_CASE("separate arguments never run together")
    {
        std::vector<std::string> const args{"10", "20"};
        CHECK(expand_vlan_arguments(args) == vlan_set{10, 20});
    }

    TEST_CASE("shell-split lists with their own commas")
    {
        std::vector<std::string> const args{"10,", "20-22", ",30"};
        CHECK(expand_vlan_arguments(args) == vlan_set{10, 20, 21, 22, 30});
    }

    TEST_CASE("a range is not glued to the next argument")
    {
        std::vector<std::string> const args{"1-2", "3"};
        CHECK(expand_vlan_arguments(args) == vlan_set{1, 2, 3});
    }

    TEST_CASE("no arguments")
    {
        CHECK(expand_vlan_arguments({}).empty());
    }
}

TEST_SUITE("vlan_list_change")
{
    TEST_CASE("plain expression replaces")
    {
        vlan_set current{1, 2, 3};
        parse_vlan_list_change("10,20").apply_to(current);
        CHECK(current == vlan_set{10, 20});
    }

    TEST_CASE("add merges")
    {
        auto const change = parse_vlan_list_change("add 30-31");
        CHECK(change.edit == vlan_list_edit::add);

        vlan_set current{10};
        change.apply_to(current);
        CHECK(current == vlan_set{10, 30, 31});
    }

    TEST_CASE("remove subtracts")
    {
        vlan_set current{10, 20, 30};
        parse_vlan_list_change("remove 20,99").apply_to(current);
        CHECK(current == vlan_set{10, 30});
    }

    TEST_CASE("none clears")
    {
        vlan_set current{10, 20};
        parse_vlan_list_change("none").apply_to(current);
        CHECK(current.empty());
    }

    TEST_CASE("keywords need a word boundary")
    {
        // "address" is not "add"; it is just an unparseable list
        auto const change = parse_vlan_list_change("address");
        CHECK(change.edit == vlan_list_edit::replace);
        CHECK(change.ids.empty());
    }
}

TEST_SUITE("vlan_list_codec")
{
    TEST_CASE("encode produces a bracketed sorted list")
    {
        CHECK(encode_vlan_list(vlan_set{30, 10, 20}) == "[10, 20, 30]");
        CHECK(encode_vlan_list(vlan_set{}) == "[]");
    }

    TEST_CASE("decode reverses encode")
    {
        vlan_set const ids{1, 100, 4094};
        auto const decoded = decode_vlan_list(encode_vlan_list(ids));
        CHECK(decoded == std::vector<vlan_id>{1, 100, 4094});
    }

    TEST_CASE("decode tolerates compact spacing")
    {
        CHECK(decode_vlan_list("[10,20]") == std::vector<vlan_id>{10, 20});
        CHECK(decode_vlan_list("  [ 5 ]  ") == std::vector<vlan_id>{5});
    }

    TEST_CASE("malformed text decodes to the empty list")
    {
        CHECK(decode_vlan_list("").empty());
        CHECK(decode_vlan_list("[]").empty());
        CHECK(decode_vlan_list("10,20").empty());
        CHECK(decode_vlan_list("[10, x]").empty());
        CHECK(decode_vlan_list("[10,]").empty());
        CHECK(decode_vlan_list("{\"a\": 1}").empty());
    }
}
