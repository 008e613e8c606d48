// tests/unit/test_prefix.cpp - network prefix normalization tests

#include "netval/prefix.hpp"

#include <doctest/doctest.h>
#include <fmt/format.h>

using namespace netval;

TEST_SUITE("dotted_mask_to_prefix")
{
    TEST_CASE("contiguous netmasks")
    {
        CHECK(dotted_mask_to_prefix("255.255.255.0").value() == 24);
        CHECK(dotted_mask_to_prefix("255.255.255.252").value() == 30);
        CHECK(dotted_mask_to_prefix("255.255.255.255").value() == 32);
        CHECK(dotted_mask_to_prefix("255.0.0.0").value() == 8);
        CHECK(dotted_mask_to_prefix("0.0.0.0").value() == 0);
    }

    TEST_CASE("host masks are accepted too")
    {
        CHECK(dotted_mask_to_prefix("0.0.0.255").value() == 24);
        CHECK(dotted_mask_to_prefix("0.0.0.3").value() == 30);
        CHECK(dotted_mask_to_prefix("0.255.255.255").value() == 8);
    }

    TEST_CASE("non-contiguous or malformed masks are rejected")
    {
        CHECK(dotted_mask_to_prefix("255.0.255.0").error() == error_code::invalid_netmask);
        CHECK(dotted_mask_to_prefix("255.255.255").error() == error_code::invalid_netmask);
        CHECK(dotted_mask_to_prefix("255.255.255.256").error() == error_code::invalid_netmask);
        CHECK(dotted_mask_to_prefix("").error() == error_code::invalid_netmask);
        CHECK(dotted_mask_to_prefix("mask").error() == error_code::invalid_netmask);
    }
}

TEST_SUITE("normalize_prefix")
{
    TEST_CASE("dotted and prefix-length forms agree")
    {
        auto const dotted = normalize_prefix("10.0.0.5", "255.255.255.0");
        auto const slash = normalize_prefix("10.0.0.9", "/24");
        REQUIRE(dotted.has_value());
        REQUIRE(slash.has_value());
        CHECK(*dotted == *slash);
        CHECK(dotted->to_string() == "10.0.0.0/24");
        CHECK(slash->prefix_length == 24);
    }

    TEST_CASE("host bits are zeroed at odd boundaries")
    {
        CHECK(normalize_prefix("192.168.37.200", "/19")->to_string() == "192.168.32.0/19");
        CHECK(normalize_prefix("192.0.2.6", "255.255.255.252")->to_string() == "192.0.2.4/30");
        CHECK(normalize_prefix("10.1.2.3", "/32")->to_string() == "10.1.2.3/32");
        CHECK(normalize_prefix("10.1.2.3", "/0")->to_string() == "0.0.0.0/0");
    }

    TEST_CASE("ipv6 with prefix length")
    {
        auto const a = normalize_prefix("2001:db8:0:1::1", "/64");
        auto const b = normalize_prefix("2001:db8:0:1::ffff", "/64");
        REQUIRE(a.has_value());
        REQUIRE(b.has_value());
        CHECK(*a == *b);
        CHECK(a->family == address_family::ipv6);
        CHECK(a->to_string() == "2001:db8:0:1::/64");
    }

    TEST_CASE("ipv6 with a dotted mask is a family mismatch")
    {
        CHECK(normalize_prefix("2001:db8::1", "255.255.255.0").error() == error_code::address_family_mismatch);
    }

    TEST_CASE("same bits in different families are different networks")
    {
        auto const v4 = normalize_prefix("0.0.0.0", "/0");
        auto const v6 = normalize_prefix("::", "/0");
        REQUIRE(v4.has_value());
        REQUIRE(v6.has_value());
        CHECK(*v4 != *v6);
    }

    TEST_CASE("bad addresses")
    {
        CHECK(normalize_prefix("", "/24").error() == error_code::invalid_address);
        CHECK(normalize_prefix("10.0.0", "/24").error() == error_code::invalid_address);
        CHECK(normalize_prefix("10.0.0.256", "/24").error() == error_code::invalid_address);
        CHECK(normalize_prefix("dhcp", "/24").error() == error_code::invalid_address);
        CHECK(normalize_prefix("010.0.0.1", "/24").error() == error_code::invalid_address);
    }

    TEST_CASE("bad prefix lengths")
    {
        CHECK(normalize_prefix("10.0.0.1", "/33").error() == error_code::invalid_prefix_length);
        CHECK(normalize_prefix("10.0.0.1", "/").error() == error_code::invalid_prefix_length);
        CHECK(normalize_prefix("10.0.0.1", "/2x").error() == error_code::invalid_prefix_length);
        CHECK(normalize_prefix("2001:db8::1", "/129").error() == error_code::invalid_prefix_length);
        CHECK(normalize_prefix("2001:db8::1", "/128").has_value());
    }

    TEST_CASE("bad dotted masks")
    {
        CHECK(normalize_prefix("10.0.0.1", "255.0.255.0").error() == error_code::invalid_netmask);
        CHECK(normalize_prefix("10.0.0.1", "").error() == error_code::invalid_netmask);
    }

    TEST_CASE("formats through fmt")
    {
        auto const net = normalize_prefix("172.16.5.4", "/12");
        REQUIRE(net.has_value());
        CHECK(fmt::format("{}", *net) == "172.16.0.0/12");
    }
}

TEST_SUITE("same_network")
{
    TEST_CASE("same subnet")
    {
        CHECK(same_network("10.0.0.1", "/24", "10.0.0.2", "/24"));
        CHECK(same_network("10.0.0.1", "255.255.255.0", "10.0.0.200", "/24"));
    }

    TEST_CASE("different subnet")
    {
        CHECK_FALSE(same_network("10.0.0.1", "/24", "10.0.1.1", "/24"));
    }

    TEST_CASE("same address, different prefix length")
    {
        CHECK_FALSE(same_network("10.0.0.1", "/24", "10.0.0.2", "/25"));
    }

    TEST_CASE("either side malformed is simply false")
    {
        CHECK_FALSE(same_network("10.0.0.1", "/24", "garbage", "/24"));
        CHECK_FALSE(same_network("10.0.0.1", "bogus", "10.0.0.2", "/24"));
    }
}
