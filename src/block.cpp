/**
 * @file block.cpp
 * @author effibot (andrea.efficace1@gmail.com)
 * @brief Block and Item implementation
 * @version 1.0
 * @date 2025-11-18
 *
 * @copyright Copyright (c) 2025
 *
 */

#include <algorithm>
#include <iostream>

#include "../include/frame/block.hpp"
#include "../include/exception/protoframe_exception.hpp"

namespace protoframe {

    // === Build Context ===

    BuildContext::BuildContext(const SpecRegistry& registry, const EngineConfig& config,
        const UserValues& values, bool parsing)
        : registry(registry), config(config), parsing(parsing) {
        for (const auto& [key, value] : values) {
            user_values[NameHelper::to_property(key)] = value;
        }
    }

    // === Construction ===

    Block::Block(std::string name) : CoreInterface<Block>(std::move(name)) {}

    Block::Block(const ItemTemplate& tmpl, const BuildContext& context,
        span<const std::uint8_t> raw, const Scope& scope)
        : CoreInterface<Block>(tmpl.name), verbose_(context.config.verbose) {
        if (tmpl.is_field()) {
            throw ProgrammingException(Status::PBAD_TEMPLATE,
                "Block (" + tmpl.name + " is a field template)");
        }

        type_ = resolve_type(tmpl, context, scope);
        if (type_.empty() || type_ == keys::BLOCK) {
            return;
        }

        const BlockTemplate* items = context.registry.get_block_template(type_);
        if (items == nullptr) {
            throw ProgrammingException(Status::PUNKNOWN_TYPE,
                "Block (" + tmpl.name + ": " + type_ + ")");
        }
        if (verbose_) {
            std::cout << "[BLOCK] Building " << tmpl.name << " as " << type_ << std::endl;
        }
        build(*items, context, raw, scope);
    }

    Block::Block(const Block& other) = default;
    Block::Block(Block&& other) noexcept = default;
    Block& Block::operator=(const Block& other) = default;
    Block& Block::operator=(Block&& other) noexcept = default;
    Block::~Block() = default;

    std::string Block::resolve_type(const ItemTemplate& tmpl, const BuildContext& context,
        const Scope& scope) const {
        auto target = tmpl.depends_on();
        if (!target) {
            return tmpl.type;
        }
        const SpecRegistry& registry = context.registry;

        // * User values first
        auto user = context.user_values.find(*target);
        if (user != context.user_values.end()) {
            std::optional<std::string> association;
            if (auto text = std::get_if<std::string>(&user->second)) {
                association = registry.code_value(*target, *text);
                if (!association && registry.has_block(*text)) {
                    association = *text;
                }
            } else if (auto bytes = std::get_if<Bytes>(&user->second)) {
                association = registry.code_value(*target, *bytes);
            } else {
                association = registry.code_value(*target,
                    ByteHelper::from_signed(std::get<std::int64_t>(user->second)));
            }
            if (association) {
                return *association;
            }
        }

        // * Then the fields already built, latest first
        for (auto it = scope.rbegin(); it != scope.rend(); ++it) {
            if (!(*it)->matches(*target)) {
                continue;
            }
            Bytes code = (*it)->value();
            if (auto association = registry.code_value(*target, code)) {
                return *association;
            }
            throw ProgrammingException(Status::PUNRESOLVED_DEPENDENCY,
                "Block (" + tmpl.name + ": " + *target + " = " + ByteHelper::to_hex(code) + ")");
        }

        throw ProgrammingException(Status::PUNRESOLVED_DEPENDENCY,
            "Block (" + tmpl.name + ": no field " + *target + ")");
    }

    std::optional<std::size_t> Block::resolve_size(const std::string& target,
        const BuildContext& context, const Scope& scope) const {
        auto user = context.user_values.find(target);
        if (user != context.user_values.end()) {
            if (auto number = std::get_if<std::int64_t>(&user->second)) {
                return static_cast<std::size_t>(*number);
            }
            if (auto bytes = std::get_if<Bytes>(&user->second)) {
                return static_cast<std::size_t>(ByteHelper::to_int(*bytes,
                    context.config.byte_order));
            }
            return static_cast<std::size_t>(ByteHelper::to_int(
                ByteHelper::from_text(std::get<std::string>(user->second)),
                context.config.byte_order));
        }
        for (auto it = scope.rbegin(); it != scope.rend(); ++it) {
            if ((*it)->matches(target)) {
                return static_cast<std::size_t>((*it)->to_uint());
            }
        }
        return std::nullopt;
    }

    void Block::build(const BlockTemplate& items, const BuildContext& context,
        span<const std::uint8_t> raw, const Scope& scope) {
        const bool parsing = context.parsing;

        // A structure starting with a one-byte length only owns that many bytes
        bool bounded = false;
        if (parsing && context.registry.schema().length_prefixed && !items.empty() &&
            !raw.empty()) {
            const ItemTemplate& first = items.front();
            if (first.is_field() && first.is_length && first.size && *first.size == 1 &&
                raw[0] >= 1 && raw[0] <= raw.size()) {
                raw = raw.first(raw[0]);
                bounded = true;
            }
        }

        std::size_t offset = 0;
        for (const auto& item : items) {
            std::size_t remaining = raw.size() - offset;
            span<const std::uint8_t> rest = raw.subspan(offset);

            Scope child_scope = scope;
            collect_fields(child_scope);

            if (item.is_field()) {
                std::optional<std::size_t> size;
                if (item.size_depends) {
                    size = resolve_size(*item.size_depends, context, child_scope);
                    if (!size) {
                        throw ProgrammingException(Status::PUNRESOLVED_DEPENDENCY,
                            "Block (" + name() + "." + item.name + " size: no field " +
                            *item.size_depends + ")");
                    }
                }

                std::optional<FieldValue> initial;
                if (parsing) {
                    std::size_t expected = size ? *size :
                        Field::template_size(item, context.config.byte_order).value_or(remaining);
                    if (remaining == 0) {
                        // Out of input: only empty optional or zero sized fields remain
                        if (!item.optional && expected > 0) {
                            break;
                        }
                        size = 0;
                    } else {
                        std::size_t taken = std::min(expected, remaining);
                        initial = Bytes(rest.begin(), rest.begin() + taken);
                        size = taken;
                    }
                } else {
                    auto user = context.user_values.find(NameHelper::to_property(item.name));
                    if (user != context.user_values.end()) {
                        initial = user->second;
                        // An empty dependent size does not truncate a user value
                        if (size && *size == 0) {
                            size.reset();
                        }
                    }
                }

                Field field(item, context.config, initial, size);
                offset += std::min(field.serialized_size(), remaining);
                children_.emplace_back(std::move(field));
            } else {
                if (item.optional && (parsing ? remaining == 0 : !context.config.include_optional)) {
                    if (verbose_) {
                        std::cout << "[BLOCK] Skipping optional " << item.name << std::endl;
                    }
                    continue;
                }
                if (parsing && remaining == 0) {
                    break;
                }
                Block block(item, context, parsing ? rest : span<const std::uint8_t>{},
                    child_scope);
                offset += std::min(block.serialized_size(), remaining);
                children_.emplace_back(std::move(block));
            }
            register_accessors(children_.size() - 1);
        }

        // Bytes left inside a length prefix belong to this structure, others go back to the parent
        if (bounded && offset < raw.size()) {
            Bytes trailing(raw.begin() + offset, raw.end());
            if (verbose_) {
                std::cerr << "[BLOCK] " << name() << ": " << trailing.size()
                          << " trailing byte(s) " << ByteHelper::to_hex(trailing) << std::endl;
            }
            children_.emplace_back(Field(keys::TRAILING, FieldValue{trailing}, trailing.size(),
                context.config));
            register_accessors(children_.size() - 1);
        }

        update();
    }

    // === Structure ===

    std::size_t Block::child_count() const {
        return children_.size();
    }

    void Block::register_accessors(std::size_t index) {
        const Item& child = children_[index];
        std::string property = child.property_name();
        if (const Field* field = child.as_field(); field != nullptr && field->has_bitfields()) {
            for (const auto& bitfield : field->bitfields()) {
                accessors_.emplace_back(NameHelper::to_property(bitfield.name()), index);
            }
        }
        if (!property.empty()) {
            accessors_.emplace_back(property, index);
        }
    }

    void Block::rebuild_accessors() {
        accessors_.clear();
        for (std::size_t i = 0; i < children_.size(); ++i) {
            register_accessors(i);
        }
    }

    void Block::append(Field field) {
        append(Item(std::move(field)));
    }

    void Block::append(Block block) {
        append(Item(std::move(block)));
    }

    void Block::append(Item item) {
        children_.push_back(std::move(item));
        register_accessors(children_.size() - 1);
        update();
    }

    void Block::append(std::vector<Item> items) {
        for (auto& item : items) {
            children_.push_back(std::move(item));
            register_accessors(children_.size() - 1);
        }
        update();
    }

    void Block::remove(const std::string& name) {
        if (!erase(name)) {
            throw ProgrammingException(Status::PNOT_FOUND,
                "Block::remove (" + this->name() + "." + name + ")");
        }
    }

    bool Block::erase(const std::string& name) {
        for (std::size_t i = 0; i < children_.size(); ++i) {
            if (children_[i].matches(name)) {
                children_.erase(children_.begin() + static_cast<std::ptrdiff_t>(i));
                rebuild_accessors();
                update();
                return true;
            }
            if (Block* block = children_[i].as_block(); block != nullptr && block->erase(name)) {
                update();
                return true;
            }
        }
        return false;
    }

    // === Lookup ===

    Item* Block::get(const std::string& name) {
        std::string property = NameHelper::to_property(name);
        for (auto it = accessors_.rbegin(); it != accessors_.rend(); ++it) {
            if (it->first == property) {
                return &children_[it->second];
            }
        }
        return nullptr;
    }

    const Item* Block::get(const std::string& name) const {
        return const_cast<Block*>(this)->get(name);
    }

    std::vector<std::string> Block::attributes() const {
        std::vector<std::string> names;
        for (const auto& [name, index] : accessors_) {
            if (std::find(names.begin(), names.end(), name) == names.end()) {
                names.push_back(name);
            }
        }
        return names;
    }

    Field* Block::find_field(const std::string& name) {
        for (auto& child : children_) {
            if (Field* field = child.as_field()) {
                if (field->matches(name)) {
                    return field;
                }
            } else if (Field* nested = child.block().find_field(name)) {
                return nested;
            }
        }
        return nullptr;
    }

    const Field* Block::find_field(const std::string& name) const {
        return const_cast<Block*>(this)->find_field(name);
    }

    Block* Block::find_block(const std::string& name) {
        std::string property = NameHelper::to_property(name);
        for (auto& child : children_) {
            Block* block = child.as_block();
            if (block == nullptr) {
                continue;
            }
            if (block->property_name() == property) {
                return block;
            }
            if (Block* nested = block->find_block(name)) {
                return nested;
            }
        }
        return nullptr;
    }

    const Block* Block::find_block(const std::string& name) const {
        return const_cast<Block*>(this)->find_block(name);
    }

    const BitField* Block::find_bitfield(const std::string& name) const {
        for (const Field* field : flatten_fields()) {
            if (const BitField* bitfield = field->find_bitfield(name)) {
                return bitfield;
            }
        }
        return nullptr;
    }

    void Block::collect_fields(std::vector<Field*>& out) {
        for (auto& child : children_) {
            if (Field* field = child.as_field()) {
                out.push_back(field);
            } else {
                child.block().collect_fields(out);
            }
        }
    }

    void Block::collect_fields(Scope& out) const {
        for (const auto& child : children_) {
            if (const Field* field = child.as_field()) {
                out.push_back(field);
            } else {
                child.block().collect_fields(out);
            }
        }
    }

    std::vector<Field*> Block::fields() {
        update();
        return leaf_fields();
    }

    std::vector<Field*> Block::leaf_fields() {
        std::vector<Field*> out;
        collect_fields(out);
        return out;
    }

    Scope Block::flatten_fields() const {
        Scope out;
        collect_fields(out);
        return out;
    }

    Bytes Block::value() const {
        Bytes bytes;
        for (const auto& child : children_) {
            Bytes part = child.value();
            bytes.insert(bytes.end(), part.begin(), part.end());
        }
        return bytes;
    }

    // === CRTP Implementation ===

    void Block::impl_update() {
        for (auto& child : children_) {
            if (Block* block = child.as_block()) {
                block->update();
            }
        }
        std::size_t size = impl_serialized_size();
        for (auto& child : children_) {
            Field* field = child.as_field();
            if (field != nullptr && field->is_length() && field->byte_size() > 0) {
                field->auto_update(ByteHelper::from_int(size, field->byte_size(),
                    field->byte_order()));
            }
        }
    }

    Bytes Block::impl_serialize() const {
        return value();
    }

    std::size_t Block::impl_serialized_size() const {
        std::size_t size = 0;
        for (const auto& child : children_) {
            size += child.serialized_size();
        }
        return size;
    }

    // === Item ===

    Item::Item(Field field) : node_(std::move(field)) {}

    Item::Item(Block block) : node_(std::move(block)) {}

    Field& Item::field() {
        if (Field* field = as_field()) {
            return *field;
        }
        throw ProgrammingException(Status::PBAD_ARGUMENT, "Item::field (" + name() + " is a block)");
    }

    const Field& Item::field() const {
        return const_cast<Item*>(this)->field();
    }

    Block& Item::block() {
        if (Block* block = as_block()) {
            return *block;
        }
        throw ProgrammingException(Status::PBAD_ARGUMENT, "Item::block (" + name() + " is a field)");
    }

    const Block& Item::block() const {
        return const_cast<Item*>(this)->block();
    }

    const std::string& Item::name() const {
        return std::visit([](const auto& node) -> const std::string& {
                return node.name();
            }, node_);
    }

    std::string Item::property_name() const {
        return NameHelper::to_property(name());
    }

    bool Item::matches(const std::string& key) const {
        if (const Field* field = as_field()) {
            return field->matches(key);
        }
        return property_name() == NameHelper::to_property(key);
    }

    std::size_t Item::serialized_size() const {
        return std::visit([](const auto& node) { return node.serialized_size(); }, node_);
    }

    Bytes Item::value() const {
        return std::visit([](const auto& node) { return node.value(); }, node_);
    }

} // namespace protoframe
