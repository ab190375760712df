/**
 * @file spec_registry.cpp
 * @author effibot (andrea.efficace1@gmail.com)
 * @brief Implementation of the protocol specification registry
 * @version 0.2
 * @date 2025-11-18
 *
 * @copyright Copyright (c) 2025
 *
 */

#include "../include/pattern/spec_registry.hpp"
#include "../include/exception/protoframe_exception.hpp"
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace protoframe {

    // === Item Templates ===

    ItemTemplate ItemTemplate::from_json(const json& j, const std::string& context) {
        if (!j.is_object()) {
            throw ProgrammingException(Status::PBAD_TEMPLATE, context + " (item is not an object)");
        }
        if (!j.contains(keys::NAME) || !j[keys::NAME].is_string()) {
            throw ProgrammingException(Status::PMISSING_KEY, context + " (item without name)");
        }

        ItemTemplate item;
        item.name = j[keys::NAME].get<std::string>();
        std::string where = context + "." + item.name;

        if (j.contains(keys::TYPE)) {
            if (!j[keys::TYPE].is_string()) {
                throw ProgrammingException(Status::PBAD_TEMPLATE, where + " (type must be a string)");
            }
            item.type = j[keys::TYPE].get<std::string>();
        }

        // Size is either a byte count or "depends:<length field>"
        if (j.contains(keys::SIZE)) {
            const auto& size = j[keys::SIZE];
            if (size.is_number_unsigned()) {
                item.size = size.get<std::size_t>();
            } else if (size.is_string()) {
                auto target = NameHelper::depends_target(size.get<std::string>());
                if (!target) {
                    throw ProgrammingException(Status::PBAD_TEMPLATE,
                        where + " (size must be a number or depends:<field>)");
                }
                item.size_depends = *target;
            } else {
                throw ProgrammingException(Status::PBAD_TEMPLATE,
                    where + " (size must be a number or depends:<field>)");
            }
        }

        if (j.contains(keys::DEFAULT)) {
            item.default_value = field_value_from_json(j[keys::DEFAULT], where);
        }
        if (j.contains(keys::VALUE)) {
            item.value = field_value_from_json(j[keys::VALUE], where);
        }

        try {
            item.is_length = j.value(keys::IS_LENGTH, false);
            item.fixed_size = j.value(keys::FIXED_SIZE, false);
            item.fixed_value = j.value(keys::FIXED_VALUE, false);
            item.optional = j.value(keys::OPTIONAL, false);

            if (j.contains(keys::BITSIZES)) {
                item.bitsizes = j[keys::BITSIZES].get<std::vector<std::size_t> >();
            }
        } catch (const json::exception& e) {
            throw ProgrammingException(Status::PBAD_TEMPLATE, where + " (" + e.what() + ")");
        }

        return item;
    }

    FrameSchema FrameSchema::from_json(const json& j) {
        FrameSchema schema;
        if (!j.is_object()) {
            throw ProgrammingException(Status::PBAD_TEMPLATE, "schema (not an object)");
        }
        try {
            schema.header = j.value("header", schema.header);
            schema.body = j.value("body", schema.body);
            schema.type_field = j.value("type_field", schema.type_field);
            schema.total_length_field = j.value("total_length_field", schema.total_length_field);
            schema.length_prefixed = j.value("length_prefixed", schema.length_prefixed);

            if (j.contains("aliases")) {
                for (auto& [alias, target] : j["aliases"].items()) {
                    schema.aliases[NameHelper::to_property(alias)] =
                        NameHelper::to_property(target.get<std::string>());
                }
            }
        } catch (const json::exception& e) {
            throw ProgrammingException(Status::PBAD_TEMPLATE,
                std::string("schema (") + e.what() + ")");
        }
        return schema;
    }

    // === Loading ===

    SpecRegistry::SpecRegistry(const std::string& json_path) {
        load(json_path);
    }

    SpecRegistry SpecRegistry::from_config(const EngineConfig& config) {
        if (config.spec_path.empty()) {
            throw LibraryException(Status::LFILE_NOT_FOUND,
                "SpecRegistry::from_config (spec_path is empty)");
        }
        SpecRegistry registry(config.spec_path);
        if (config.verbose) {
            std::cout << "[REGISTRY] Loaded " << registry.blocks_.size() << " block templates from "
                      << config.spec_path << std::endl;
        }
        return registry;
    }

    Result<SpecRegistry> SpecRegistry::try_load(const std::string& json_path) {
        try {
            return Result<SpecRegistry>::success(SpecRegistry(json_path));
        } catch (const ProtoframeException& e) {
            return Result<SpecRegistry>::from_exception(e, "SpecRegistry::try_load");
        }
    }

    void SpecRegistry::load(const std::string& json_path) {
        std::ifstream file(json_path);
        if (!file.is_open()) {
            throw LibraryException(Status::LFILE_NOT_FOUND, "SpecRegistry::load (" + json_path + ")");
        }

        json j;
        try {
            file >> j;
        } catch (const json::exception& e) {
            throw LibraryException(Status::LPARSE_ERROR,
                "SpecRegistry::load (" + json_path + ": " + e.what() + ")");
        }
        load_json(j);
    }

    void SpecRegistry::load_json(const json& j) {
        if (!j.is_object()) {
            throw LibraryException(Status::LPARSE_ERROR, "SpecRegistry::load_json (not an object)");
        }

        // Parse everything first, the registry is only touched once all content is valid
        std::optional<std::vector<ItemTemplate> > frame;
        std::map<std::string, BlockTemplate> blocks;
        std::map<std::string, CodeTable> codes;
        std::optional<FrameSchema> schema;

        if (j.contains(keys::SCHEMA)) {
            schema = FrameSchema::from_json(j[keys::SCHEMA]);
        }

        if (j.contains(keys::FRAME)) {
            frame = parse_items(j[keys::FRAME], keys::FRAME);
        }

        if (j.contains(keys::BLOCKS)) {
            if (!j[keys::BLOCKS].is_object()) {
                throw ProgrammingException(Status::PBAD_TEMPLATE, "blocks (not an object)");
            }
            for (auto& [name, items] : j[keys::BLOCKS].items()) {
                blocks[NameHelper::to_property(name)] = parse_items(items, name);
            }
        }

        if (j.contains(keys::CODES)) {
            if (!j[keys::CODES].is_object()) {
                throw ProgrammingException(Status::PBAD_TEMPLATE, "codes (not an object)");
            }
            for (auto& [table, entries] : j[keys::CODES].items()) {
                if (!entries.is_object()) {
                    throw ProgrammingException(Status::PBAD_TEMPLATE,
                        "codes." + table + " (not an object)");
                }
                CodeTable code_table;
                for (auto& [key, value] : entries.items()) {
                    if (!value.is_string()) {
                        throw ProgrammingException(Status::PBAD_TEMPLATE,
                            "codes." + table + "." + key + " (value must be a string)");
                    }
                    code_table.emplace_back(key, value.get<std::string>());
                }
                codes[NameHelper::to_property(table)] = std::move(code_table);
            }
        }

        // Commit
        if (schema) {
            schema_ = std::move(*schema);
        }
        if (frame) {
            frame_ = std::move(*frame);
        }
        for (auto& [name, block] : blocks) {
            blocks_[name] = std::move(block);
        }
        for (auto& [table, code_table] : codes) {
            codes_[table] = std::move(code_table);
        }
    }

    void SpecRegistry::clear() {
        frame_.clear();
        blocks_.clear();
        codes_.clear();
        schema_ = FrameSchema{};
    }

    BlockTemplate SpecRegistry::parse_items(const json& j, const std::string& context) {
        BlockTemplate items;
        if (j.is_object()) {
            items.push_back(ItemTemplate::from_json(j, context));
        } else if (j.is_array()) {
            for (const auto& item : j) {
                items.push_back(ItemTemplate::from_json(item, context));
            }
        } else {
            throw ProgrammingException(Status::PBAD_TEMPLATE,
                context + " (expected a list of items)");
        }
        return items;
    }

    // === Lookups ===

    const BlockTemplate* SpecRegistry::get_block_template(const std::string& name) const {
        auto it = blocks_.find(NameHelper::to_property(name));
        if (it == blocks_.end()) {
            return nullptr;
        }
        return &it->second;
    }

    const ItemTemplate* SpecRegistry::get_item_template(const std::string& block_name,
        const std::string& item_name) const {
        const BlockTemplate* block = get_block_template(block_name);
        if (block == nullptr) {
            return nullptr;
        }
        std::string property = NameHelper::to_property(item_name);
        for (const auto& item : *block) {
            if (NameHelper::to_property(item.name) == property) {
                return &item;
            }
        }
        return nullptr;
    }

    const SpecRegistry::CodeTable* SpecRegistry::find_table(const std::string& table) const {
        auto it = codes_.find(NameHelper::to_property(table));
        if (it == codes_.end()) {
            return nullptr;
        }
        return &it->second;
    }

    std::optional<std::string> SpecRegistry::code_value(const std::string& table,
        const std::string& identifier) const {
        const CodeTable* codes = find_table(table);
        if (codes == nullptr) {
            return std::nullopt;
        }

        // Keys first: "0203", "0x0203" and "0203" all name the same code
        auto wire = ByteHelper::parse_hex(identifier);
        for (const auto& [key, value] : *codes) {
            if (key == identifier || (wire && ByteHelper::from_code(key) == *wire)) {
                return value;
            }
        }

        std::string property = NameHelper::to_property(identifier);
        for (const auto& [key, value] : *codes) {
            if (NameHelper::to_property(value) == property) {
                return value;
            }
        }
        return std::nullopt;
    }

    std::optional<std::string> SpecRegistry::code_value(const std::string& table,
        const Bytes& identifier) const {
        const CodeTable* codes = find_table(table);
        if (codes == nullptr) {
            return std::nullopt;
        }
        for (const auto& [key, value] : *codes) {
            if (ByteHelper::from_code(key) == identifier) {
                return value;
            }
        }
        return std::nullopt;
    }

    std::optional<Bytes> SpecRegistry::code_key(const std::string& table,
        const std::string& name) const {
        const CodeTable* codes = find_table(table);
        if (codes == nullptr) {
            return std::nullopt;
        }

        std::string property = NameHelper::to_property(name);
        for (const auto& [key, value] : *codes) {
            if (NameHelper::to_property(value) == property) {
                return ByteHelper::from_code(key);
            }
        }

        auto wire = ByteHelper::parse_hex(name);
        for (const auto& [key, value] : *codes) {
            if (key == name || (wire && ByteHelper::from_code(key) == *wire)) {
                return ByteHelper::from_code(key);
            }
        }
        return std::nullopt;
    }

    bool SpecRegistry::has_block(const std::string& name) const {
        return get_block_template(name) != nullptr;
    }

    bool SpecRegistry::has_code_table(const std::string& table) const {
        return find_table(table) != nullptr;
    }

    std::vector<std::string> SpecRegistry::block_names() const {
        std::vector<std::string> names;
        names.reserve(blocks_.size());
        for (const auto& [name, block] : blocks_) {
            names.push_back(name);
        }
        return names;
    }

} // namespace protoframe
