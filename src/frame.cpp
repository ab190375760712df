/**
 * @file frame.cpp
 * @author effibot (andrea.efficace1@gmail.com)
 * @brief Frame implementation
 * @version 1.0
 * @date 2025-11-18
 *
 * @copyright Copyright (c) 2025
 *
 */

#include <algorithm>
#include <iostream>

#include "../include/frame/frame.hpp"
#include "../include/exception/protoframe_exception.hpp"

namespace protoframe {

    // === Construction ===

    Frame::Frame(const SpecRegistry* registry, const EngineConfig& config)
        : CoreInterface<Frame>("frame"), registry_(registry), config_(config) {}

    Frame::Frame(const SpecRegistry& registry, const EngineConfig& config)
        : Frame(&registry, config) {
        BuildContext context(registry, config);
        for (const auto& item : registry.frame_template()) {
            if (item.depends_on()) {
                blocks_.emplace_back(item.name);
                continue;
            }
            Scope scope;
            for (const auto& block : blocks_) {
                Scope fields = block.flatten_fields();
                scope.insert(scope.end(), fields.begin(), fields.end());
            }
            blocks_.emplace_back(item, context, span<const std::uint8_t>{}, scope);
        }
        update();
    }

    void Frame::build(const BuildContext& context, span<const std::uint8_t> raw) {
        std::size_t offset = 0;
        for (const auto& item : registry_->frame_template()) {
            if (item.is_field()) {
                throw ProgrammingException(Status::PBAD_TEMPLATE,
                    "Frame (" + item.name + " must be a block)");
            }
            std::size_t remaining = raw.size() - offset;
            if (context.parsing && remaining == 0) {
                blocks_.emplace_back(item.name);
                continue;
            }

            // Rebuilt on each iteration, blocks_ may have reallocated
            Scope scope;
            for (const auto& block : blocks_) {
                Scope fields = block.flatten_fields();
                scope.insert(scope.end(), fields.begin(), fields.end());
            }

            Block block(item, context,
                context.parsing ? raw.subspan(offset) : span<const std::uint8_t>{}, scope);
            offset += std::min(block.serialized_size(), remaining);
            blocks_.push_back(std::move(block));
        }

        if (context.parsing && offset < raw.size() && !blocks_.empty()) {
            Bytes trailing(raw.begin() + offset, raw.end());
            if (config_.verbose) {
                std::cerr << "[FRAME] " << trailing.size() << " trailing byte(s) "
                          << ByteHelper::to_hex(trailing) << std::endl;
            }
            blocks_.back().append(Field(keys::TRAILING, FieldValue{trailing}, trailing.size(),
                config_));
        }

        update();

        if (config_.verbose) {
            std::cout << "[FRAME] " << (context.parsing ? "Parsed " : "Built ") << type_name()
                      << " (" << serialized_size() << " bytes)" << std::endl;
        }
    }

    // === Factories ===

    Frame Frame::from_type(const SpecRegistry& registry, const std::string& type,
        const UserValues& overrides, const EngineConfig& config) {
        if (type.empty()) {
            return Frame(registry, config);
        }
        auto code = registry.code_key(registry.schema().type_field, type);
        if (!code) {
            throw ProgrammingException(Status::PNOT_FOUND, "Frame::from_type (" + type + ")");
        }
        return from_type(registry, *code, overrides, config);
    }

    Frame Frame::from_type(const SpecRegistry& registry, const Bytes& type,
        const UserValues& overrides, const EngineConfig& config) {
        const FrameSchema& schema = registry.schema();

        UserValues values;
        for (const auto& [key, value] : overrides) {
            std::string property = NameHelper::to_property(key);
            auto alias = schema.aliases.find(property);
            if (alias == schema.aliases.end()) {
                values[property] = value;
                continue;
            }
            // Aliased names are translated through the code table of their field
            if (auto text = std::get_if<std::string>(&value)) {
                auto code = registry.code_key(alias->second, *text);
                if (!code) {
                    throw ProgrammingException(Status::PNOT_FOUND,
                        "Frame::from_type (" + key + " = " + *text + ")");
                }
                values[alias->second] = *code;
            } else {
                values[alias->second] = value;
            }
        }
        values[NameHelper::to_property(schema.type_field)] = type;

        Frame frame(&registry, config);
        frame.build(BuildContext(registry, config, values, false), {});
        return frame;
    }

    Frame Frame::from_bytes(const SpecRegistry& registry, span<const std::uint8_t> raw,
        const std::optional<Source>& source, const EngineConfig& config) {
        Frame frame(&registry, config);
        frame.source_ = source;
        frame.build(BuildContext(registry, config, {}, true), raw);
        return frame;
    }

    Result<Frame> Frame::try_from_type(const SpecRegistry& registry, const std::string& type,
        const UserValues& overrides, const EngineConfig& config) {
        try {
            return Result<Frame>::success(from_type(registry, type, overrides, config));
        } catch (const ProtoframeException& e) {
            return Result<Frame>::from_exception(e, "Frame::try_from_type");
        }
    }

    Result<Frame> Frame::try_from_bytes(const SpecRegistry& registry,
        span<const std::uint8_t> raw, const std::optional<Source>& source,
        const EngineConfig& config) {
        try {
            return Result<Frame>::success(from_bytes(registry, raw, source, config));
        } catch (const ProtoframeException& e) {
            return Result<Frame>::from_exception(e, "Frame::try_from_bytes");
        }
    }

    // === Blocks ===

    Block& Frame::require_block(const std::string& name, const std::string& context) {
        if (Block* found = block(name)) {
            return *found;
        }
        throw ProgrammingException(Status::PNOT_FOUND, context + " (" + name + ")");
    }

    Block& Frame::header() {
        return require_block(registry_->schema().header, "Frame::header");
    }

    Block& Frame::body() {
        return require_block(registry_->schema().body, "Frame::body");
    }

    Block* Frame::block(const std::string& name) {
        std::string property = NameHelper::to_property(name);
        for (auto& block : blocks_) {
            if (block.property_name() == property) {
                return &block;
            }
        }
        return nullptr;
    }

    const Block* Frame::block(const std::string& name) const {
        return const_cast<Frame*>(this)->block(name);
    }

    void Frame::append(Block block) {
        blocks_.push_back(std::move(block));
        update();
    }

    void Frame::remove(const std::string& name) {
        if (!erase(name)) {
            throw ProgrammingException(Status::PNOT_FOUND, "Frame::remove (" + name + ")");
        }
    }

    bool Frame::erase(const std::string& name) {
        std::string property = NameHelper::to_property(name);
        for (auto it = blocks_.begin(); it != blocks_.end(); ++it) {
            if (it->property_name() == property) {
                blocks_.erase(it);
                update();
                return true;
            }
            if (it->erase(name)) {
                update();
                return true;
            }
        }
        return false;
    }

    // === Fields ===

    std::vector<Field*> Frame::fields() {
        update();
        std::vector<Field*> out;
        for (auto& block : blocks_) {
            std::vector<Field*> fields = block.leaf_fields();
            out.insert(out.end(), fields.begin(), fields.end());
        }
        return out;
    }

    Field* Frame::find_field(const std::string& name) {
        for (auto& block : blocks_) {
            if (Field* field = block.find_field(name)) {
                return field;
            }
        }
        return nullptr;
    }

    const Field* Frame::find_field(const std::string& name) const {
        return const_cast<Frame*>(this)->find_field(name);
    }

    std::vector<std::string> Frame::attributes() {
        update();
        std::vector<std::string> names;
        for (const auto& block : blocks_) {
            std::vector<std::string> accessors = block.attributes();
            names.insert(names.end(), accessors.begin(), accessors.end());
        }
        return names;
    }

    std::string Frame::type_name() const {
        const std::string& type_field = registry_->schema().type_field;
        const Field* field = find_field(type_field);
        if (field == nullptr) {
            return "";
        }
        Bytes code = field->value();
        if (auto name = registry_->code_value(type_field, code)) {
            return *name;
        }
        return ByteHelper::to_hex(code, "");
    }

    Bytes Frame::value() const {
        Bytes bytes;
        for (const auto& block : blocks_) {
            Bytes part = block.value();
            bytes.insert(bytes.end(), part.begin(), part.end());
        }
        return bytes;
    }

    // === CRTP Implementation ===

    void Frame::impl_update() {
        for (auto it = blocks_.rbegin(); it != blocks_.rend(); ++it) {
            it->update();
        }
        Field* total = find_field(registry_->schema().total_length_field);
        if (total != nullptr && total->byte_size() > 0) {
            total->auto_update(ByteHelper::from_int(impl_serialized_size(), total->byte_size(),
                total->byte_order()));
        }
    }

    std::size_t Frame::impl_serialized_size() const {
        std::size_t size = 0;
        for (const auto& block : blocks_) {
            size += block.serialized_size();
        }
        return size;
    }

} // namespace protoframe
