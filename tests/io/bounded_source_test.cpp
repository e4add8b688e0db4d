/**
 * @file bounded_source_test.cpp
 * @brief Unit tests for leased value windows
 */

#include <catch2/catch_test_macros.hpp>

#include <dcmstream/io/bounded_source.hpp>
#include <dcmstream/io/memory_source.hpp>

#include <array>
#include <numeric>

using namespace dcmstream;
using namespace dcmstream::io;

namespace {

auto make_bytes(std::size_t count) -> std::vector<uint8_t> {
    std::vector<uint8_t> bytes(count);
    std::iota(bytes.begin(), bytes.end(), uint8_t{0});
    return bytes;
}

}  // namespace

TEST_CASE("bounded_source restricts reads to the window", "[io][bounded_source]") {
    memory_source parent(make_bytes(32));

    auto window = bounded_source::create(parent, 10, 4);
    REQUIRE(window.is_ok());
    auto& view = *window.value();

    CHECK(view.start() == 10);
    CHECK(view.length() == 4);
    CHECK(view.size().value() == 4);
    CHECK(view.position().value() == 0);

    std::array<uint8_t, 8> buf{};
    auto count = view.read(buf);
    REQUIRE(count.is_ok());
    CHECK(count.value() == 4);
    CHECK(buf[0] == 10);
    CHECK(buf[3] == 13);

    count = view.read(buf);
    REQUIRE(count.is_ok());
    CHECK(count.value() == 0);
    CHECK(view.at_end().value());
}

TEST_CASE("bounded_source seeks relative to the window", "[io][bounded_source]") {
    memory_source parent(make_bytes(32));

    auto window = bounded_source::create(parent, 8, 8);
    REQUIRE(window.is_ok());
    auto& view = *window.value();

    REQUIRE(view.seek(6).is_ok());
    std::array<uint8_t, 2> buf{};
    REQUIRE(view.read_exact(buf).is_ok());
    CHECK(buf == std::array<uint8_t, 2>{14, 15});

    auto beyond = view.seek(9);
    REQUIRE(beyond.is_err());
    CHECK(beyond.error().code == error_codes::seek_error);

    REQUIRE(view.seek(0).is_ok());
    auto all = view.read_all();
    REQUIRE(all.is_ok());
    CHECK(all.value() == std::vector<uint8_t>{8, 9, 10, 11, 12, 13, 14, 15});
}

TEST_CASE("bounded_source leases its parent", "[io][bounded_source][lease]") {
    memory_source parent(make_bytes(16));

    {
        auto window = bounded_source::create(parent, 0, 4);
        REQUIRE(window.is_ok());
        CHECK(parent.is_leased());

        std::array<uint8_t, 1> buf{};
        auto read = parent.read(buf);
        REQUIRE(read.is_err());
        CHECK(read.error().code == error_codes::source_leased);

        auto seek = parent.seek(0);
        REQUIRE(seek.is_err());
        CHECK(seek.error().code == error_codes::source_leased);

        auto skip = parent.skip(1);
        REQUIRE(skip.is_err());
        CHECK(skip.error().code == error_codes::source_leased);

        auto second = bounded_source::create(parent, 4, 4);
        REQUIRE(second.is_err());
        CHECK(second.error().code == error_codes::source_leased);

        REQUIRE(window.value()->skip(2).is_ok());
    }

    CHECK_FALSE(parent.is_leased());
    // The parent stays where the window left it
    CHECK(parent.position().value() == 2);
    REQUIRE(parent.seek(0).is_ok());
}

TEST_CASE("bounded_source rejects ranges outside the parent", "[io][bounded_source]") {
    memory_source parent(make_bytes(16));

    SECTION("length past the end") {
        auto window = bounded_source::create(parent, 12, 8);
        REQUIRE(window.is_err());
        CHECK(window.error().code == error_codes::invalid_argument);
    }

    SECTION("start past the end") {
        auto window = bounded_source::create(parent, 17, 0);
        REQUIRE(window.is_err());
    }

    SECTION("empty window at the end is valid") {
        auto window = bounded_source::create(parent, 16, 0);
        REQUIRE(window.is_ok());
        CHECK(window.value()->at_end().value());
    }

    CHECK_FALSE(parent.is_leased());
}
