/**
 * @file test_header.cpp
 * @brief Unit tests for header parsing.
 */

#include <catch2/catch_test_macros.hpp>
#include <nlzss/header.hpp>

#include <cstring>

using namespace nlzss;

TEST_CASE("Header LZSS10 short form", "[header]") {
    std::uint8_t data[] = {0x10, 0x14, 0x00, 0x00, 0x08};
    ByteReader reader(data, sizeof(data));
    Header header;

    REQUIRE(parse_header(reader, header) == Error::Ok);
    REQUIRE(header.variant == Variant::Lzss10);
    REQUIRE(header.target_len == 20);
    REQUIRE_FALSE(header.extended);
    REQUIRE(header.size() == HEADER_SIZE);
    REQUIRE(reader.position() == 4); // body untouched
}

TEST_CASE("Header LZSS11 short form", "[header]") {
    std::uint8_t data[] = {0x11, 0x56, 0x34, 0x12};
    ByteReader reader(data, sizeof(data));
    Header header;

    REQUIRE(parse_header(reader, header) == Error::Ok);
    REQUIRE(header.variant == Variant::Lzss11);
    REQUIRE(header.target_len == 0x123456);
}

TEST_CASE("Header extended length form", "[header]") {
    SECTION("zero 24-bit field selects 32-bit length") {
        std::uint8_t data[] = {0x10, 0x00, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00};
        ByteReader reader(data, sizeof(data));
        Header header;

        REQUIRE(parse_header(reader, header) == Error::Ok);
        REQUIRE(header.target_len == 256);
        REQUIRE(header.extended);
        REQUIRE(header.size() == EXTENDED_HEADER_SIZE);
        REQUIRE(reader.position() == 8);
    }

    SECTION("length beyond 24 bits") {
        std::uint8_t data[] = {0x11, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x01};
        ByteReader reader(data, sizeof(data));
        Header header;

        REQUIRE(parse_header(reader, header) == Error::Ok);
        REQUIRE(header.variant == Variant::Lzss11);
        REQUIRE(header.target_len == 0x01000000U);
    }

    SECTION("extended zero length") {
        std::uint8_t data[] = {0x10, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
        ByteReader reader(data, sizeof(data));
        Header header;

        REQUIRE(parse_header(reader, header) == Error::Ok);
        REQUIRE(header.target_len == 0);
    }
}

TEST_CASE("Header invalid tag", "[header]") {
    std::uint8_t tags[] = {0x00, 0x0F, 0x12, 0x24, 0x30, 0x40, 0xFF};

    for (std::uint8_t tag : tags) {
        std::uint8_t data[] = {tag, 0x14, 0x00, 0x00};
        ByteReader reader(data, sizeof(data));
        Header header;

        REQUIRE(parse_header(reader, header) == Error::InvalidHeader);
        REQUIRE(reader.position() == 1);
    }
}

TEST_CASE("Header invalid tag wins over truncation", "[header]") {
    std::uint8_t data[] = {0x13};
    ByteReader reader(data, sizeof(data));
    Header header;

    REQUIRE(parse_header(reader, header) == Error::InvalidHeader);
}

TEST_CASE("Header truncated", "[header]") {
    std::uint8_t data[] = {0x10, 0x00, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00};
    Header header;

    SECTION("empty input") {
        ByteReader reader(data, 0);
        REQUIRE(parse_header(reader, header) == Error::UnexpectedEof);
    }

    SECTION("every short prefix fails") {
        for (std::size_t len = 1; len < sizeof(data); ++len) {
            ByteReader reader(data, len);
            REQUIRE(parse_header(reader, header) == Error::UnexpectedEof);
        }
    }
}

TEST_CASE("Variant helpers", "[header]") {
    REQUIRE(is_valid_tag(0x10));
    REQUIRE(is_valid_tag(0x11));
    REQUIRE_FALSE(is_valid_tag(0x40));
    REQUIRE(std::strcmp(variant_name(Variant::Lzss10), "LZSS10") == 0);
    REQUIRE(std::strcmp(variant_name(Variant::Lzss11), "LZSS11") == 0);
}
