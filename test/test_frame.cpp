/**
 * @file test_frame.cpp
 * @brief Frame construction and parsing tests on the shipped specifications
 * @version 1.0
 * @date 2025-11-18
 */

#include <catch2/catch_test_macros.hpp>
#include <algorithm>

#include "test_utils.hpp"

using namespace protoframe;
using protoframe::test::hex;
using protoframe::test::knx_registry;
using protoframe::test::opcua_config;
using protoframe::test::opcua_registry;
using protoframe::test::status_of;

namespace {
    // KNXnet/IP DESCRIPTION RESPONSE announcing four service families
    Bytes description_response() {
        Bytes raw = hex("06 10 02 04 00 46");
        Bytes device = hex("36 01 02 00 11 05 00 00 00 01 02 03 04 05 e0 00 17 0c 00 24 6d 00 00 01");
        Bytes name(30, 0x00);
        const std::string friendly = "KNX IP Router";
        std::copy(friendly.begin(), friendly.end(), name.begin());
        Bytes families = hex("0a 02 02 01 03 01 04 01 05 01");

        raw.insert(raw.end(), device.begin(), device.end());
        raw.insert(raw.end(), name.begin(), name.end());
        raw.insert(raw.end(), families.begin(), families.end());
        return raw;
    }

    void require_same_fields(Frame& built, Frame& parsed) {
        std::vector<Field*> expected = built.fields();
        std::vector<Field*> actual = parsed.fields();
        REQUIRE(actual.size() == expected.size());
        for (std::size_t i = 0; i < expected.size(); ++i) {
            INFO("field " << expected[i]->name());
            REQUIRE(actual[i]->name() == expected[i]->name());
            REQUIRE(actual[i]->value() == expected[i]->value());
        }
    }

    // OPC UA HEL with endpoint "opc.tcp://plc"
    Bytes opcua_hello() {
        return hex("48 45 4c 46 2d 00 00 00"
                   "00 00 00 00 00 00 01 00 00 00 01 00 00 00 00 00 00 00 00 00"
                   "0d 00 00 00 6f 70 63 2e 74 63 70 3a 2f 2f 70 6c 63");
    }
}

TEST_CASE("Frame - Empty frame", "[frame]") {
    Frame frame(knx_registry());

    REQUIRE(frame.serialize() == hex("06 10 00 00 00 06"));
    REQUIRE(frame.attributes() == std::vector<std::string>{
        "header_length", "protocol_version", "service_identifier", "total_length"});
    REQUIRE(frame.body().child_count() == 0);
    REQUIRE(frame.header().type() == "HEADER");
    REQUIRE(frame.type_name() == "0000");
    REQUIRE_FALSE(frame.source().has_value());
}

TEST_CASE("Frame::from_type - KNXnet/IP", "[frame][build]") {
    const SpecRegistry& knx = knx_registry();

    SECTION("By name") {
        Frame frame = Frame::from_type(knx, "DESCRIPTION REQUEST");
        REQUIRE(frame.serialize() == hex("06 10 02 03 00 0e 08 01 00 00 00 00 00 00"));
        REQUIRE(frame.type_name() == "DESCRIPTION REQUEST");
        REQUIRE(frame.body().type() == "DESCRIPTION REQUEST");
        REQUIRE(frame.fields().size() == 8);
        REQUIRE(frame.attributes() == std::vector<std::string>{
            "header_length", "protocol_version", "service_identifier", "total_length",
            "control_endpoint"});
    }

    SECTION("By wire code") {
        Frame by_code = Frame::from_type(knx, Bytes{0x02, 0x03});
        Frame by_key = Frame::from_type(knx, "0203");
        REQUIRE(by_code.serialize() == hex("06 10 02 03 00 0e 08 01 00 00 00 00 00 00"));
        REQUIRE(by_key.serialize() == by_code.serialize());
    }

    SECTION("Empty type builds an empty frame") {
        Frame frame = Frame::from_type(knx, "");
        REQUIRE(frame.serialized_size() == 6);
    }

    SECTION("Overrides") {
        UserValues overrides;
        overrides["IP address"] = std::string("192.168.1.10");
        overrides["port"] = std::int64_t{3671};
        Frame frame = Frame::from_type(knx, "DESCRIPTION REQUEST", overrides);
        REQUIRE(frame.serialize() == hex("06 10 02 03 00 0e 08 01 c0 a8 01 0a 0e 57"));
    }

    SECTION("Alias translated through its code table") {
        UserValues overrides;
        overrides["cemi"] = std::string("L_Data.req");
        Frame frame = Frame::from_type(knx, "CONFIGURATION REQUEST", overrides);
        REQUIRE(frame.find_field("message code")->value() == Bytes{0x11});
        REQUIRE(frame.serialize() ==
            hex("06 10 03 10 00 15 04 00 00 00 11 00 bc e0 00 00 00 00 00 00 00"));
    }

    SECTION("Default nested type") {
        Frame frame = Frame::from_type(knx, "CONFIGURATION REQUEST");
        REQUIRE(frame.body().find_block("cemi data")->type() == "M_PropRead.req");
        REQUIRE(frame.serialized_size() == 17);
    }
}

TEST_CASE("Frame::from_type - Errors", "[frame][errors]") {
    const SpecRegistry& knx = knx_registry();

    SECTION("Unknown type") {
        REQUIRE(status_of([&knx]() { Frame::from_type(knx, "ROUTING INDICATION"); }) ==
            Status::PNOT_FOUND);
    }

    SECTION("Unknown aliased value") {
        UserValues overrides;
        overrides["cemi"] = std::string("M_Reset.req");
        REQUIRE(status_of([&]() { Frame::from_type(knx, "CONFIGURATION REQUEST", overrides); }) ==
            Status::PNOT_FOUND);
    }

    SECTION("Non-throwing variant") {
        auto failed = Frame::try_from_type(knx, "ROUTING INDICATION");
        REQUIRE(failed.fail());
        REQUIRE(failed.error() == Status::PNOT_FOUND);

        auto built = Frame::try_from_type(knx, "SEARCH REQUEST");
        REQUIRE(built.ok());
        REQUIRE(built.value().type_name() == "SEARCH REQUEST");
    }
}

TEST_CASE("Frame::from_bytes - KNXnet/IP", "[frame][parse]") {
    const SpecRegistry& knx = knx_registry();

    SECTION("Round trip") {
        Bytes raw = hex("06 10 02 03 00 0e 08 01 c0 a8 01 0a 0e 57");
        Frame frame = Frame::from_bytes(knx, raw, Source{"192.168.1.10", 3671});
        REQUIRE(frame.type_name() == "DESCRIPTION REQUEST");
        REQUIRE(frame.find_field("port")->to_uint() == 3671);
        REQUIRE(frame.serialize() == raw);

        REQUIRE(frame.source().has_value());
        REQUIRE(frame.source()->address == "192.168.1.10");
        REQUIRE(frame.source()->port == 3671);
    }

    SECTION("Extra service families are kept byte-exact") {
        Bytes raw = description_response();
        REQUIRE(raw.size() == 0x46);

        Frame frame = Frame::from_bytes(knx, raw);
        REQUIRE(frame.type_name() == "DESCRIPTION RESPONSE");
        REQUIRE(frame.serialize() == raw);
        REQUIRE(frame.find_field("device routing multicast address")->to_ipv4() == "224.0.23.12");
        REQUIRE(frame.body().find_block("manufacturer data") == nullptr);

        Block* families = frame.body().find_block("supported service families");
        REQUIRE(families != nullptr);
        REQUIRE(families->serialized_size() == 10);
        REQUIRE(families->get(keys::TRAILING)->field().value() == hex("03 01 04 01 05 01"));
    }

    SECTION("Bytes after the body are kept") {
        Bytes raw = hex("06 10 02 03 00 0e 08 01 c0 a8 01 0a 0e 57 ff ff");
        Frame frame = Frame::from_bytes(knx, raw);
        REQUIRE(frame.serialized_size() == raw.size());
        REQUIRE(frame.body().get(keys::TRAILING) != nullptr);
        REQUIRE(frame.find_field("total length")->to_uint() == raw.size());
    }

    SECTION("Header length out of range") {
        Bytes raw = hex("ff 10 02 03 00 0e 08 01 c0 a8 01 0a 0e 57");
        Frame frame = Frame::from_bytes(knx, raw);
        REQUIRE(frame.type_name() == "DESCRIPTION REQUEST");
        REQUIRE(frame.header().serialized_size() == 6);
        REQUIRE(frame.header().get(keys::TRAILING) == nullptr);
        REQUIRE(frame.body().get(keys::TRAILING) == nullptr);
        REQUIRE(frame.find_field("port")->to_uint() == 3671);
    }

    SECTION("Header only") {
        Bytes raw = hex("06 10 05 30 00 06");
        Frame frame = Frame::from_bytes(knx, raw);
        REQUIRE(frame.type_name() == "0530");
        REQUIRE(frame.body().child_count() == 0);
    }

    SECTION("Unknown service with a body") {
        Bytes raw = hex("06 10 05 30 00 08 aa bb");
        REQUIRE(status_of([&]() { Frame::from_bytes(knx, raw); }) ==
            Status::PUNRESOLVED_DEPENDENCY);

        auto failed = Frame::try_from_bytes(knx, raw);
        REQUIRE(failed.fail());
        REQUIRE(failed.error() == Status::PUNRESOLVED_DEPENDENCY);
    }
}

TEST_CASE("Frame - OPC UA little endian", "[frame][opcua]") {
    const SpecRegistry& opcua = opcua_registry();

    SECTION("Parse HEL with a dependent endpoint url") {
        Bytes raw = opcua_hello();
        Frame frame = Frame::from_bytes(opcua, raw, std::nullopt, opcua_config());
        REQUIRE(frame.type_name() == "HELLO");
        REQUIRE(frame.find_field("message size")->to_uint() == 45);
        REQUIRE(frame.find_field("receive buffer size")->to_uint() == 65536);
        REQUIRE(frame.find_field("endpoint url")->value() ==
            Bytes{'o', 'p', 'c', '.', 't', 'c', 'p', ':', '/', '/', 'p', 'l', 'c'});
        REQUIRE(frame.serialize() == raw);
    }

    SECTION("Bytes after the message are kept in the body") {
        Bytes raw = opcua_hello();
        raw.push_back(0xee);
        Frame frame = Frame::from_bytes(opcua, raw, std::nullopt, opcua_config());
        REQUIRE(frame.header().serialized_size() == 8);
        REQUIRE(frame.header().get(keys::TRAILING) == nullptr);
        REQUIRE(frame.body().get(keys::TRAILING)->field().value() == Bytes{0xee});
        REQUIRE(frame.serialize() == hex("48 45 4c 46 2e 00 00 00"
            "00 00 00 00 00 00 01 00 00 00 01 00 00 00 00 00 00 00 00 00"
            "0d 00 00 00 6f 70 63 2e 74 63 70 3a 2f 2f 70 6c 63 ee"));
    }

    SECTION("Build HEL") {
        UserValues overrides;
        overrides["receive buffer size"] = std::int64_t{65536};
        overrides["send buffer size"] = std::int64_t{65536};
        overrides["endpoint url length"] = std::int64_t{13};
        overrides["endpoint url"] = std::string("opc.tcp://plc");
        Frame frame = Frame::from_type(opcua, "HELLO", overrides, opcua_config());
        REQUIRE(frame.serialize() == opcua_hello());
    }
}

TEST_CASE("Frame - Editing", "[frame]") {
    Frame frame = Frame::from_type(knx_registry(), "DESCRIPTION REQUEST");

    SECTION("Remove a block") {
        frame.remove("control endpoint");
        REQUIRE(frame.serialize() == hex("06 10 02 03 00 06"));
        REQUIRE(status_of([&frame]() { frame.remove("control endpoint"); }) == Status::PNOT_FOUND);
        REQUIRE_FALSE(frame.erase("checksum"));
    }

    SECTION("Explicit total length is kept") {
        frame.find_field("total length")->set_value(std::int64_t{0x20});
        REQUIRE(frame.serialize() == hex("06 10 02 03 00 20 08 01 00 00 00 00 00 00"));
    }

    SECTION("Appended blocks count in the total length") {
        Block extra("extra");
        extra.append(Field("padding", 2));
        frame.append(std::move(extra));
        REQUIRE(frame.find_field("total length")->to_uint() == 16);
        REQUIRE(frame.block("extra") != nullptr);
    }

    SECTION("Field edits are serialized") {
        frame.find_field("ip address")->set_value("10.0.0.1");
        REQUIRE(frame.serialize() == hex("06 10 02 03 00 0e 08 01 0a 00 00 01 00 00"));
    }
}

TEST_CASE("Frame - Every type parses back to the same fields", "[frame][roundtrip]") {
    SECTION("KNXnet/IP services") {
        const SpecRegistry& knx = knx_registry();
        const std::vector<std::string> services = {
            "SEARCH REQUEST", "SEARCH RESPONSE", "DESCRIPTION REQUEST", "DESCRIPTION RESPONSE",
            "CONNECT REQUEST", "CONNECT RESPONSE", "CONNECTIONSTATE REQUEST",
            "CONNECTIONSTATE RESPONSE", "DISCONNECT REQUEST", "DISCONNECT RESPONSE",
            "CONFIGURATION REQUEST", "CONFIGURATION ACK", "TUNNELING REQUEST", "TUNNELING ACK"};

        for (const auto& service : services) {
            INFO(service);
            Frame built = Frame::from_type(knx, service);
            Bytes raw = built.serialize();
            Frame parsed = Frame::from_bytes(knx, raw);
            REQUIRE(parsed.type_name() == service);
            REQUIRE(parsed.serialize() == raw);
            require_same_fields(built, parsed);
        }
    }

    SECTION("OPC UA messages") {
        const SpecRegistry& opcua = opcua_registry();
        for (const std::string message : {"HELLO", "ACKNOWLEDGE", "ERROR"}) {
            INFO(message);
            Frame built = Frame::from_type(opcua, message, {}, opcua_config());
            Bytes raw = built.serialize();
            Frame parsed = Frame::from_bytes(opcua, raw, std::nullopt, opcua_config());
            REQUIRE(parsed.type_name() == message);
            REQUIRE(parsed.serialize() == raw);
            require_same_fields(built, parsed);
        }
    }

    SECTION("CONNECT RESPONSE keeps the empty individual address") {
        Frame built = Frame::from_type(knx_registry(), "CONNECT RESPONSE");
        Bytes raw = built.serialize();
        Frame parsed = Frame::from_bytes(knx_registry(), raw);
        REQUIRE(built.fields().size() == 13);
        REQUIRE(parsed.fields().size() == 13);
        REQUIRE(parsed.find_field("individual address")->byte_size() == 0);
    }
}

TEST_CASE("Frame - Update is idempotent", "[frame]") {
    Frame frame = Frame::from_type(knx_registry(), "CONFIGURATION REQUEST");
    frame.update();
    Bytes first = frame.serialize();
    frame.update();
    REQUIRE(frame.serialize() == first);
    REQUIRE(frame.find_field("total length")->to_uint() == first.size());

    Frame parsed = Frame::from_bytes(opcua_registry(), opcua_hello(), std::nullopt, opcua_config());
    parsed.update();
    parsed.update();
    REQUIRE(parsed.serialize() == opcua_hello());
}
