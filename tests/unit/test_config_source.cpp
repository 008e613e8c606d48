// tests/unit/test_config_source.cpp - reading captured configs from disk

#include "netval/config_source.hpp"
#include "netval/extractor.hpp"
#include "test_helpers.hpp"

#include <doctest/doctest.h>

#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace netval;

namespace
{

    // unique per process so parallel test runs don't trip over each other
    [[nodiscard]] auto temp_config_path(std::string_view const stem) -> std::filesystem::path
    {
        return std::filesystem::temp_directory_path() / fmt::format("netval_{}_{}.cfg", stem, ::getpid());
    }

} // anonymous namespace

TEST_SUITE("read_config_file")
{
    TEST_CASE("reads the whole file byte for byte")
    {
        auto const path = temp_config_path("core");
        {
            std::ofstream out{path, std::ios::binary};
            out << netval::testing::CORE_SWITCH_CONFIG;
        }

        auto const text = read_config_file(path);
        std::filesystem::remove(path);

        REQUIRE(text.has_value());
        CHECK(*text == netval::testing::CORE_SWITCH_CONFIG);
        CHECK(extract_device_facts(*text).hostname == "core-sw1");
    }

    TEST_CASE("empty file is empty text, not an error")
    {
        auto const path = temp_config_path("empty");
        {
            std::ofstream out{path};
        }

        auto const text = read_config_file(path);
        std::filesystem::remove(path);

        REQUIRE(text.has_value());
        CHECK(text->empty());
    }

    TEST_CASE("missing file")
    {
        auto const text = read_config_file("/nonexistent/netval/device.cfg");
        REQUIRE_FALSE(text.has_value());
        CHECK(text.error() == error_code::file_open_failed);
    }
}
