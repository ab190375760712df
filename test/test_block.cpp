/**
 * @file test_block.cpp
 * @brief Unit tests for Block and Item
 * @version 1.0
 * @date 2025-11-18
 */

#include <catch2/catch_test_macros.hpp>

#include "test_utils.hpp"

using namespace protoframe;
using protoframe::test::hex;
using protoframe::test::knx_registry;
using protoframe::test::opcua_config;
using protoframe::test::opcua_registry;
using protoframe::test::status_of;

namespace {
    ItemTemplate block_item(const std::string& name, const std::string& type,
        bool optional = false) {
        ItemTemplate tmpl;
        tmpl.name = name;
        tmpl.type = type;
        tmpl.optional = optional;
        return tmpl;
    }
}

TEST_CASE("Block - Build from template", "[block]") {
    BuildContext context(knx_registry(), EngineConfig::create_default());

    SECTION("Defaults and length") {
        Block hpai(block_item("control endpoint", "HPAI"), context);
        REQUIRE(hpai.name() == "control endpoint");
        REQUIRE(hpai.type() == "HPAI");
        REQUIRE(hpai.child_count() == 4);
        REQUIRE(hpai.serialize() == hex("08 01 00 00 00 00 00 00"));
    }

    SECTION("User values") {
        UserValues values;
        values["IP Address"] = std::string("192.168.1.10");
        values["port"] = std::int64_t{3671};
        BuildContext with_values(knx_registry(), EngineConfig::create_default(), values);

        Block hpai(block_item("control endpoint", "HPAI"), with_values);
        REQUIRE(hpai.serialize() == hex("08 01 c0 a8 01 0a 0e 57"));
        REQUIRE(hpai.find_field("ip address")->to_ipv4() == "192.168.1.10");
        REQUIRE(hpai.find_field("ip address")->fixed_value() == false);
    }

    SECTION("Empty and generic types build an empty block") {
        Block extra(block_item("extra", ""), context);
        REQUIRE(extra.child_count() == 0);
        REQUIRE(extra.serialize().empty());

        Block generic(block_item("generic", "block"), context);
        REQUIRE(generic.child_count() == 0);
    }

    SECTION("Empty template") {
        Block management(block_item("connection data", "DEVICE MANAGEMENT CONNECTION"), context);
        REQUIRE(management.child_count() == 0);
        REQUIRE(management.type() == "DEVICE MANAGEMENT CONNECTION");
    }
}

TEST_CASE("Block - Template errors", "[block][errors]") {
    BuildContext context(knx_registry(), EngineConfig::create_default());

    SECTION("Unknown block type") {
        REQUIRE(status_of([&]() { Block block(block_item("body", "ROUTING INDICATION"), context); }) ==
            Status::PUNKNOWN_TYPE);
    }

    SECTION("Field template") {
        REQUIRE(status_of([&]() { Block block(block_item("status", keys::FIELD), context); }) ==
            Status::PBAD_TEMPLATE);
    }

    SECTION("Dependency without field or user value") {
        REQUIRE(status_of([&]() {
                Block block(block_item("body", "depends:service identifier"), context);
            }) == Status::PUNRESOLVED_DEPENDENCY);
    }

    SECTION("Dependency on a code without association") {
        Field type_field("service identifier", Bytes{0x05, 0x30});
        Scope scope{&type_field};
        REQUIRE(status_of([&]() {
                Block block(block_item("body", "depends:service identifier"), context, {}, scope);
            }) == Status::PUNRESOLVED_DEPENDENCY);
    }
}

TEST_CASE("Block - Dependent types and sizes", "[block][depends]") {
    SECTION("Type from a user value") {
        UserValues values;
        values["message type"] = std::string("HEL");
        BuildContext context(opcua_registry(), opcua_config(), values);

        Block body(block_item("body", "depends:message type"), context);
        REQUIRE(body.type() == "HELLO");
        REQUIRE(body.child_count() == 7);
        REQUIRE(body.find_field("endpoint url")->byte_size() == 0);
        REQUIRE(body.serialized_size() == 24);
    }

    SECTION("Type from a field in scope") {
        BuildContext context(opcua_registry(), opcua_config());
        Field type_field("message type", std::string("ACK"));
        Scope scope{&type_field};

        Block body(block_item("body", "depends:message type"), context, {}, scope);
        REQUIRE(body.type() == "ACKNOWLEDGE");
        REQUIRE(body.child_count() == 5);
    }

    SECTION("Dependent size from a user value") {
        UserValues values;
        values["message type"] = std::string("HEL");
        values["endpoint url length"] = std::int64_t{13};
        values["endpoint url"] = std::string("opc.tcp://plc");
        BuildContext context(opcua_registry(), opcua_config(), values);

        Block body(block_item("body", "depends:message type"), context);
        REQUIRE(body.find_field("endpoint url length")->value() == hex("0d 00 00 00"));
        REQUIRE(body.find_field("endpoint url")->byte_size() == 13);
        REQUIRE(body.serialized_size() == 37);
    }

    SECTION("An empty dependent size keeps the user value") {
        UserValues values;
        values["message type"] = std::string("HEL");
        values["endpoint url"] = std::string("opc.tcp://plc");
        BuildContext context(opcua_registry(), opcua_config(), values);

        Block body(block_item("body", "depends:message type"), context);
        REQUIRE(body.find_field("endpoint url")->value() == Bytes{
            'o', 'p', 'c', '.', 't', 'c', 'p', ':', '/', '/', 'p', 'l', 'c'});
    }

    SECTION("Nested dependency on a field of the same block") {
        BuildContext context(knx_registry(), EngineConfig::create_default());
        Block request(block_item("body", "CONFIGURATION REQUEST"), context);

        const Block* cemi_data = request.find_block("cemi data");
        REQUIRE(cemi_data != nullptr);
        REQUIRE(cemi_data->type() == "M_PropRead.req");
        REQUIRE(request.serialize() == hex("04 00 00 00 fc 00 00 01 00 10 01"));
    }

    SECTION("Nested dependency from user bytes") {
        UserValues values;
        values["message code"] = Bytes{0x11};
        BuildContext context(knx_registry(), EngineConfig::create_default(), values);
        Block request(block_item("body", "CONFIGURATION REQUEST"), context);

        REQUIRE(request.find_block("cemi data")->type() == "L_Data.req");
        REQUIRE(request.find_block("ldata") != nullptr);
        REQUIRE(request.find_field("message code")->value() == Bytes{0x11});
        REQUIRE(request.serialized_size() == 15);
    }
}

TEST_CASE("Block - Length fields", "[block][length]") {
    BuildContext context(knx_registry(), EngineConfig::create_default());
    Block hpai(block_item("control endpoint", "HPAI"), context);

    SECTION("Update is idempotent") {
        hpai.update();
        Bytes first = hpai.serialize();
        hpai.update();
        REQUIRE(hpai.serialize() == first);
        REQUIRE(hpai.find_field("structure length")->to_uint() == 8);
    }

    SECTION("Appending and removing items") {
        hpai.append(Field("extra", 2));
        REQUIRE(hpai.find_field("structure length")->to_uint() == 10);

        hpai.remove("extra");
        REQUIRE(hpai.find_field("structure length")->to_uint() == 8);
        REQUIRE(hpai.get("extra") == nullptr);
    }

    SECTION("Explicit length is kept") {
        hpai.find_field("structure length")->set_value(std::int64_t{0x20});
        hpai.append(Field("extra", 2));
        REQUIRE(hpai.find_field("structure length")->to_uint() == 0x20);
    }
}

TEST_CASE("Block - Accessors", "[block][accessors]") {
    BuildContext context(knx_registry(), EngineConfig::create_default());
    Block ldata(block_item("ldata", "LDATA"), context);

    SECTION("Bit-packed fields are reachable by each name") {
        Item* tpci = ldata.get("tpci");
        Item* apci = ldata.get("APCI");
        Item* both = ldata.get("tpci, apci");
        REQUIRE(tpci != nullptr);
        REQUIRE(tpci == apci);
        REQUIRE(tpci == both);
        REQUIRE(tpci->is_field());
        REQUIRE(ldata.find_bitfield("apci")->width() == 10);
    }

    SECTION("Attribute names in order") {
        auto names = ldata.attributes();
        REQUIRE(names == std::vector<std::string>{
            "additional_info_length", "control_field_1", "control_field_2", "source_address",
            "destination_address", "data_length", "tpci", "apci", "tpci_apci", "data"});
    }

    SECTION("Optional sizeless field is empty") {
        REQUIRE(ldata.find_field("data")->byte_size() == 0);
        REQUIRE(ldata.serialize() == hex("00 bc e0 00 00 00 00 00 00 00"));
    }

    SECTION("Item kinds") {
        Item* control = ldata.get("control field 1");
        REQUIRE(control != nullptr);
        REQUIRE(control->field().value() == Bytes{0xBC});
        REQUIRE(control->as_block() == nullptr);
        REQUIRE(status_of([control]() { control->block(); }) == Status::PBAD_ARGUMENT);
    }

    SECTION("Unknown names") {
        REQUIRE(ldata.get("checksum") == nullptr);
        REQUIRE(ldata.find_field("checksum") == nullptr);
        REQUIRE_FALSE(ldata.erase("checksum"));
        REQUIRE(status_of([&ldata]() { ldata.remove("checksum"); }) == Status::PNOT_FOUND);
    }

    SECTION("Later registrations win") {
        ldata.append(Field("data", Bytes{0xAA}));
        REQUIRE(ldata.get("data")->field().value() == Bytes{0xAA});
        REQUIRE(ldata.attributes().size() == 10);
    }
}

TEST_CASE("Block - Optional blocks", "[block][optional]") {
    SECTION("Skipped by default") {
        BuildContext context(knx_registry(), EngineConfig::create_default());
        Block response(block_item("body", "DESCRIPTION RESPONSE"), context);
        REQUIRE(response.child_count() == 2);
        REQUIRE(response.serialized_size() == 58);
        REQUIRE(response.find_block("manufacturer data") == nullptr);
    }

    SECTION("Built when requested") {
        EngineConfig config = EngineConfig::create_default();
        config.include_optional = true;
        BuildContext context(knx_registry(), config);
        Block response(block_item("body", "DESCRIPTION RESPONSE"), context);
        REQUIRE(response.child_count() == 3);
        REQUIRE(response.serialized_size() == 62);

        const Block* manufacturer = response.find_block("manufacturer data");
        REQUIRE(manufacturer != nullptr);
        REQUIRE(manufacturer->value() == hex("04 fe 00 00"));
    }
}

TEST_CASE("Block - Parsing", "[block][parse]") {
    BuildContext context(knx_registry(), EngineConfig::create_default(), {}, true);

    SECTION("Fields take their bytes") {
        Bytes raw = hex("08 01 c0 a8 01 0a 0e 57");
        Block hpai(block_item("control endpoint", "HPAI"), context, raw);
        REQUIRE(hpai.find_field("ip address")->to_ipv4() == "192.168.1.10");
        REQUIRE(hpai.find_field("port")->to_uint() == 3671);
        REQUIRE(hpai.find_field("port")->fixed_value() == false);
        REQUIRE(hpai.serialize() == raw);
    }

    SECTION("Length prefix bounds the structure") {
        Bytes raw = hex("08 01 c0 a8 01 0a 0e 57 ff ff");
        Block hpai(block_item("control endpoint", "HPAI"), context, raw);
        REQUIRE(hpai.serialized_size() == 8);
        REQUIRE(hpai.get(keys::TRAILING) == nullptr);
    }

    SECTION("Bytes the template does not describe are kept") {
        Bytes raw = hex("0a 01 c0 a8 01 0a 0e 57 aa bb");
        Block hpai(block_item("control endpoint", "HPAI"), context, raw);
        REQUIRE(hpai.get(keys::TRAILING) != nullptr);
        REQUIRE(hpai.get(keys::TRAILING)->field().value() == hex("aa bb"));
        REQUIRE(hpai.serialize() == raw);
    }

    SECTION("Without a length prefix the rest is left to the caller") {
        BuildContext opcua_context(opcua_registry(), opcua_config(), {}, true);
        Bytes raw = hex("48 45 4c 46 20 00 00 00 00 00 00 00");
        Block header(block_item("header", "HEADER"), opcua_context, raw);
        REQUIRE(header.child_count() == 3);
        REQUIRE(header.serialized_size() == 8);
        REQUIRE(header.get(keys::TRAILING) == nullptr);
        REQUIRE(header.find_field("message size")->to_uint() == 32);
    }

    SECTION("Optional fields past the end are empty placeholders") {
        Bytes raw = hex("02 03");
        Block crd(block_item("connection response data block", "CRD"), context, raw);
        REQUIRE(crd.child_count() == 3);
        REQUIRE(crd.find_field("individual address") != nullptr);
        REQUIRE(crd.find_field("individual address")->byte_size() == 0);
        REQUIRE(crd.serialize() == raw);
    }

    SECTION("Short input stops the build") {
        Bytes raw = hex("08 01 c0");
        Block hpai(block_item("control endpoint", "HPAI"), context, raw);
        REQUIRE(hpai.child_count() == 3);
        REQUIRE(hpai.find_field("ip address")->byte_size() == 1);
        REQUIRE(hpai.find_field("port") == nullptr);
    }
}

TEST_CASE("Block - Manual construction", "[block]") {
    Block block("custom");
    block.append(Field("a", 1));
    block.append(Field("b", Bytes{0x01, 0x02}));

    std::vector<Item> items;
    items.emplace_back(Field("c", Bytes{0x03}));
    items.emplace_back(Block("nested"));
    block.append(std::move(items));

    REQUIRE(block.child_count() == 4);
    REQUIRE(block.type().empty());
    REQUIRE(block.serialize() == hex("00 01 02 03"));
    REQUIRE(block.attributes() == std::vector<std::string>{"a", "b", "c", "nested"});
    REQUIRE(block.get("nested")->is_block());
    REQUIRE(block.fields().size() == 3);

    block.get("nested")->block().append(Field("d", Bytes{0x04}));
    REQUIRE(block.serialize() == hex("00 01 02 03 04"));

    block.remove("d");
    REQUIRE(block.serialized_size() == 4);
    REQUIRE(block.find_block("nested")->child_count() == 0);
}
