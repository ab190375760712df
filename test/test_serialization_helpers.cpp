/**
 * @file test_serialization_helpers.cpp
 * @brief Unit tests for ByteHelper, BitHelper and NameHelper
 * @version 1.0
 * @date 2025-11-18
 */

#include <catch2/catch_test_macros.hpp>

#include "../include/interface/serialization_helpers.hpp"
#include "../include/exception/protoframe_exception.hpp"

using namespace protoframe;

TEST_CASE("ByteHelper::resize - Padding and truncation", "[helpers][bytes]") {
    Bytes value = {0x04, 0xD2};

    SECTION("Big endian keeps the rightmost bytes") {
        REQUIRE(ByteHelper::resize(value, 1) == Bytes{0xD2});
        REQUIRE(ByteHelper::resize(value, 4) == Bytes{0x00, 0x00, 0x04, 0xD2});
    }

    SECTION("Little endian keeps the leftmost bytes") {
        REQUIRE(ByteHelper::resize(value, 1, ByteOrder::LITTLE) == Bytes{0x04});
        REQUIRE(ByteHelper::resize(value, 4, ByteOrder::LITTLE) ==
            Bytes{0x04, 0xD2, 0x00, 0x00});
    }

    SECTION("Same size is unchanged") {
        REQUIRE(ByteHelper::resize(value, 2) == value);
    }
}

TEST_CASE("ByteHelper - Integer conversions", "[helpers][bytes]") {
    SECTION("Minimal size") {
        REQUIRE(ByteHelper::from_int(65980) == Bytes{0x01, 0x01, 0xBC});
        REQUIRE(ByteHelper::from_int(0) == Bytes{0x00});
    }

    SECTION("Requested size and byte order") {
        REQUIRE(ByteHelper::from_int(6, 2) == Bytes{0x00, 0x06});
        REQUIRE(ByteHelper::from_int(6, 2, ByteOrder::LITTLE) == Bytes{0x06, 0x00});
        REQUIRE(ByteHelper::from_int(0x1234, 4, ByteOrder::LITTLE) ==
            Bytes{0x34, 0x12, 0x00, 0x00});
    }

    SECTION("Negative values are two's complement") {
        REQUIRE(ByteHelper::from_signed(-1, 2) == Bytes{0xFF, 0xFF});
        REQUIRE(ByteHelper::from_signed(-2, 1) == Bytes{0xFE});
    }

    SECTION("Decoding") {
        REQUIRE(ByteHelper::to_int(Bytes{0x00, 0x0e}) == 14);
        REQUIRE(ByteHelper::to_int(Bytes{0x0e, 0x00}, ByteOrder::LITTLE) == 14);
        REQUIRE(ByteHelper::to_int(Bytes{0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x01, 0x02}) ==
            0x0102);
    }

    SECTION("More than 64 significant bits throws") {
        Bytes wide(9, 0x01);
        REQUIRE_THROWS_AS(ByteHelper::to_int(wide), ProgrammingException);
    }
}

TEST_CASE("ByteHelper - IPv4 addresses", "[helpers][bytes]") {
    REQUIRE(ByteHelper::is_ipv4("192.168.1.1"));
    REQUIRE_FALSE(ByteHelper::is_ipv4("192.168.1"));
    REQUIRE_FALSE(ByteHelper::is_ipv4("1.2.3.4.5"));
    REQUIRE_FALSE(ByteHelper::is_ipv4("256.1.1.1"));
    REQUIRE_FALSE(ByteHelper::is_ipv4("a.b.c.d"));

    REQUIRE(ByteHelper::from_ipv4("224.0.23.12") == Bytes{0xE0, 0x00, 0x17, 0x0C});
    REQUIRE(ByteHelper::to_ipv4(Bytes{0xC0, 0xA8, 0x01, 0x0A}) == "192.168.1.10");
    REQUIRE_THROWS_AS(ByteHelper::from_ipv4("localhost"), ProgrammingException);
    REQUIRE_THROWS_AS(ByteHelper::to_ipv4(Bytes(2, 0x01)), ProgrammingException);
}

TEST_CASE("ByteHelper - Hex and text", "[helpers][bytes]") {
    SECTION("Hex decoding") {
        REQUIRE(ByteHelper::parse_hex("0203") == Bytes{0x02, 0x03});
        REQUIRE(ByteHelper::parse_hex("0xFC") == Bytes{0xFC});
        REQUIRE_FALSE(ByteHelper::parse_hex("123").has_value());
        REQUIRE_FALSE(ByteHelper::parse_hex("zz").has_value());
        REQUIRE_THROWS_AS(ByteHelper::from_hex("HEL"), ProgrammingException);
    }

    SECTION("Text conversion rules") {
        REQUIRE(ByteHelper::from_text("192.168.1.1") == Bytes{0xC0, 0xA8, 0x01, 0x01});
        REQUIRE(ByteHelper::from_text("0203") == Bytes{0x02, 0x03});
        REQUIRE(ByteHelper::from_text("0x1001") == Bytes{0x10, 0x01});
        REQUIRE(ByteHelper::from_text("HEL") == Bytes{'H', 'E', 'L'});
        // Odd number of digits cannot be hex, falls back to UTF-8
        REQUIRE(ByteHelper::from_text("123") == Bytes{'1', '2', '3'});
    }

    SECTION("Code table keys") {
        REQUIRE(ByteHelper::from_code("020A") == Bytes{0x02, 0x0A});
        REQUIRE(ByteHelper::from_code("ACK") == Bytes{'A', 'C', 'K'});
    }

    SECTION("Hex representation") {
        REQUIRE(ByteHelper::to_hex(Bytes{0x06, 0x10, 0x0e}) == "06 10 0e");
        REQUIRE(ByteHelper::to_hex(Bytes{0x02, 0x03}, "") == "0203");
    }
}

TEST_CASE("BitHelper - MSB first bit vectors", "[helpers][bits]") {
    std::vector<bool> bits = BitHelper::to_bits(Bytes{0x10, 0x01});
    REQUIRE(bits.size() == 16);
    REQUIRE(bits[3] == true);
    REQUIRE(bits[15] == true);
    REQUIRE(BitHelper::from_bits(bits) == Bytes{0x10, 0x01});

    // Left padded to a byte boundary
    REQUIRE(BitHelper::from_bits({true, false, true}) == Bytes{0x05});

    REQUIRE(BitHelper::from_uint(1, 4) == std::vector<bool>{false, false, false, true});
    REQUIRE(BitHelper::to_uint({false, true, false, true}) == 5);
    REQUIRE(BitHelper::fits(15, 4));
    REQUIRE_FALSE(BitHelper::fits(16, 4));
}

TEST_CASE("NameHelper - Name normalization", "[helpers][names]") {
    REQUIRE(NameHelper::to_property("Service Identifier") == "service_identifier");
    REQUIRE(NameHelper::to_property("L_Data.req") == "l_data_req");
    REQUIRE(NameHelper::to_property("  total  length ") == "total_length");
    REQUIRE(NameHelper::to_property("number of elements, start index") ==
        "number_of_elements_start_index");

    REQUIRE(NameHelper::split("number of elements, start index") ==
        std::vector<std::string>{"number of elements", "start index"});
    REQUIRE(NameHelper::split("ip address") == std::vector<std::string>{"ip address"});

    REQUIRE(NameHelper::depends_target("depends:service identifier") == "service_identifier");
    REQUIRE_FALSE(NameHelper::depends_target("HPAI").has_value());
}
