/**
 * @file test_nlzss.cpp
 * @brief Tests for the high-level API and error reporting.
 */

#include <catch2/catch_test_macros.hpp>
#include <nlzss/nlzss.hpp>

#include <cstring>
#include <sstream>
#include <string>

#include "stream_builder.hpp"

using namespace nlzss;
using nlzss::test::repeat;
using nlzss::test::StreamBuilder;

namespace {

const std::uint8_t kAbcd10[] = {0x10, 0x14, 0x00, 0x00, 0x08, 0x61,
                                0x62, 0x63, 0x64, 0xD0, 0x03};

std::string as_string(const std::vector<std::uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

} // namespace

TEST_CASE("decompress memory buffer", "[api]") {
    std::vector<std::uint8_t> out;
    REQUIRE(decompress(kAbcd10, sizeof(kAbcd10), out) == Error::Ok);
    REQUIRE(as_string(out) == "abcdabcdabcdabcdabcd");
}

TEST_CASE("decompress std::istream", "[api]") {
    std::string bytes(reinterpret_cast<const char*>(kAbcd10), sizeof(kAbcd10));

    SECTION("error-code form") {
        std::istringstream in(bytes, std::ios::binary);
        std::vector<std::uint8_t> out;
        REQUIRE(decompress(in, out) == Error::Ok);
        REQUIRE(out == repeat("abcd", 20));
    }

    SECTION("stream is left after the last needed byte") {
        std::istringstream in(bytes + "tail", std::ios::binary);
        std::vector<std::uint8_t> out;
        REQUIRE(decompress(in, out) == Error::Ok);

        std::string rest;
        in >> rest;
        REQUIRE(rest == "tail");
    }

    SECTION("back-to-back streams") {
        auto second = StreamBuilder(Variant::Lzss11, 3).literals("end").bytes();
        std::istringstream in(bytes + as_string(second), std::ios::binary);
        std::vector<std::uint8_t> out;

        REQUIRE(decompress(in, out) == Error::Ok);
        REQUIRE(out.size() == 20);
        REQUIRE(decompress(in, out) == Error::Ok);
        REQUIRE(as_string(out) == "end");
        REQUIRE(decompress(in, out) == Error::UnexpectedEof);
    }
}

TEST_CASE("read_header", "[api]") {
    Header header;

    REQUIRE(read_header(kAbcd10, sizeof(kAbcd10), header) == Error::Ok);
    REQUIRE(header.variant == Variant::Lzss10);
    REQUIRE(header.target_len == 20);

    // Only the header needs to be present
    REQUIRE(read_header(kAbcd10, 4, header) == Error::Ok);
    REQUIRE(read_header(kAbcd10, 3, header) == Error::UnexpectedEof);
}

TEST_CASE("error_string", "[api][error]") {
    REQUIRE(std::strcmp(error_string(Error::Ok), "Success") == 0);
    REQUIRE(std::strlen(error_string(Error::InvalidHeader)) > 0);
    REQUIRE(std::strlen(error_string(Error::UnexpectedEof)) > 0);
    REQUIRE(std::strlen(error_string(Error::InvalidBackReference)) > 0);
    REQUIRE(std::strcmp(error_string(static_cast<Error>(42)), "Unknown error") == 0);
}

#if !NLZSS_NO_EXCEPTIONS

TEST_CASE("Throwing decompress", "[api][exceptions]") {
    SECTION("success") {
        auto out = decompress(kAbcd10, sizeof(kAbcd10));
        REQUIRE(out == repeat("abcd", 20));
    }

    SECTION("invalid header") {
        const std::uint8_t data[] = {0x40, 0x01, 0x00, 0x00};
        REQUIRE_THROWS_AS(decompress(data, sizeof(data)), InvalidHeaderException);
    }

    SECTION("truncated input") {
        REQUIRE_THROWS_AS(decompress(kAbcd10, sizeof(kAbcd10) - 1), UnexpectedEofException);
    }

    SECTION("bad back-reference") {
        const std::uint8_t data[] = {0x10, 0x03, 0x00, 0x00, 0x80, 0x00, 0x00};
        REQUIRE_THROWS_AS(decompress(data, sizeof(data)), InvalidBackReferenceException);
    }

    SECTION("from stream") {
        std::istringstream in(std::string("\x11\x02\x00\x00\x00", 5), std::ios::binary);
        REQUIRE_THROWS_AS(decompress(in), UnexpectedEofException);
    }
}

TEST_CASE("Exceptions carry code and context", "[api][exceptions]") {
    const std::uint8_t data[] = {0x10, 0x03, 0x00, 0x00, 0x80, 0x00, 0x00};

    try {
        decompress(data, sizeof(data));
        FAIL("expected an exception");
    } catch (const LzssException& e) {
        REQUIRE(e.code() == Error::InvalidBackReference);
        std::string message = e.what();
        REQUIRE(message.find("offset 7") != std::string::npos);
        REQUIRE(message.find(error_string(Error::InvalidBackReference)) != std::string::npos);
    }
}

TEST_CASE("throw_on_error", "[api][exceptions]") {
    REQUIRE_NOTHROW(throw_on_error(Error::Ok));
    REQUIRE_THROWS_AS(throw_on_error(Error::InvalidHeader), InvalidHeaderException);
    REQUIRE_THROWS_AS(throw_on_error(Error::UnexpectedEof), UnexpectedEofException);
    REQUIRE_THROWS_AS(throw_on_error(Error::InvalidBackReference, "ctx"),
                      InvalidBackReferenceException);
    REQUIRE_THROWS_AS(throw_on_error(Error::UnexpectedEof), LzssException);
    REQUIRE_THROWS_AS(throw_on_error(Error::UnexpectedEof), std::runtime_error);
}

#endif // !NLZSS_NO_EXCEPTIONS

TEST_CASE("version", "[api]") {
    REQUIRE(std::strcmp(version(), "1.0.0") == 0);
    REQUIRE(VERSION_MAJOR == 1);
}
