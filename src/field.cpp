/**
 * @file field.cpp
 * @author effibot (andrea.efficace1@gmail.com)
 * @brief Field implementation
 * @version 1.0
 * @date 2025-11-18
 *
 * @copyright Copyright (c) 2025
 *
 */

#include <algorithm>
#include <iostream>
#include <numeric>
#include <utility>

#include "../include/frame/field.hpp"
#include "../include/exception/protoframe_exception.hpp"

namespace protoframe {

    namespace {
        std::size_t natural_size(const FieldValue& value, ByteOrder order) {
            return std::max<std::size_t>(1, to_bytes(value, 0, order).size());
        }

        Bytes fit(const FieldValue& value, std::size_t size, ByteOrder order) {
            if (size == 0) {
                return {};
            }
            return to_bytes(value, size, order);
        }
    }

    // === Construction ===

    Field::Field(std::string name, std::size_t size, const EngineConfig& config)
        : CoreInterface<Field>(std::move(name)) {
        apply_config(config);
        names_ = {this->name()};
        check_size(size, "Field (" + this->name() + ")");
        byte_size_ = size;
        value_.assign(size, 0x00);
    }

    Field::Field(std::string name, const FieldValue& value, std::size_t size,
        const EngineConfig& config)
        : CoreInterface<Field>(std::move(name)) {
        apply_config(config);
        names_ = {this->name()};
        if (size == 0) {
            size = natural_size(value, byte_order_);
        }
        check_size(size, "Field (" + this->name() + ")");
        value_ = to_bytes(value, size, byte_order_);
        byte_size_ = size;
    }

    Field::Field(const ItemTemplate& tmpl, const EngineConfig& config,
        const std::optional<FieldValue>& initial, std::optional<std::size_t> size_override)
        : CoreInterface<Field>(tmpl.name) {
        apply_config(config);
        names_ = NameHelper::split(tmpl.name);
        if (names_.empty()) {
            names_ = {tmpl.name};
        }
        is_length_ = tmpl.is_length;
        fixed_size_ = tmpl.fixed_size;
        optional_ = tmpl.optional;

        // * Content precedence: raw bytes or user value, template value, template default
        std::optional<FieldValue> content;
        bool pinned = false;
        if (initial) {
            content = initial;
        } else if (tmpl.value) {
            content = tmpl.value;
            pinned = true;
        } else if (tmpl.default_value) {
            content = tmpl.default_value;
            pinned = tmpl.fixed_value;
        }

        std::size_t size = 1;
        if (size_override) {
            size = *size_override;
        } else if (optional_ && !content) {
            size = 0;
        } else if (auto from_template = template_size(tmpl, byte_order_)) {
            size = *from_template;
            if (content && !tmpl.size && tmpl.bitsizes.empty()) {
                size = natural_size(*content, byte_order_);
            }
        } else if (content) {
            size = natural_size(*content, byte_order_);
        }
        check_size(size, "Field (" + tmpl.name + ")");

        byte_size_ = size;
        value_ = content ? fit(*content, size, byte_order_) : Bytes(size, 0x00);
        fixed_value_ = pinned;

        if (names_.size() > 1 || !tmpl.bitsizes.empty()) {
            build_bitfields(tmpl.bitsizes);
        }
    }

    std::optional<std::size_t> Field::template_size(const ItemTemplate& tmpl, ByteOrder order) {
        if (tmpl.size) {
            return *tmpl.size;
        }
        if (!tmpl.bitsizes.empty()) {
            std::size_t bits = std::accumulate(tmpl.bitsizes.begin(), tmpl.bitsizes.end(),
                std::size_t{0});
            return (bits + 7) / 8;
        }
        if (tmpl.size_depends) {
            return std::nullopt;
        }
        if (tmpl.value) {
            return natural_size(*tmpl.value, order);
        }
        if (tmpl.default_value) {
            return natural_size(*tmpl.default_value, order);
        }
        if (tmpl.optional) {
            return std::nullopt;
        }
        return 1;
    }

    void Field::apply_config(const EngineConfig& config) {
        byte_order_ = config.byte_order;
        bitfield_mode_ = config.bitfield_mode;
        max_size_ = config.max_field_size;
        verbose_ = config.verbose;
    }

    void Field::check_size(std::size_t size, const std::string& context) const {
        if (size > max_size_) {
            throw ProgrammingException(Status::PBAD_SIZE,
                context + " (" + std::to_string(size) + " bytes, max " +
                std::to_string(max_size_) + ")");
        }
    }

    void Field::build_bitfields(const std::vector<std::size_t>& bitsizes) {
        std::string context = "Field (" + name() + ")";
        if (bitsizes.empty()) {
            throw ProgrammingException(Status::PBAD_BITSIZES, context + " (no bitsizes)");
        }
        if (bitsizes.size() != names_.size()) {
            throw ProgrammingException(Status::PBAD_BITSIZES,
                context + " (" + std::to_string(names_.size()) + " names, " +
                std::to_string(bitsizes.size()) + " bitsizes)");
        }
        std::size_t bits = std::accumulate(bitsizes.begin(), bitsizes.end(), std::size_t{0});
        if (bits != byte_size_ * 8) {
            throw ProgrammingException(Status::PBAD_BITSIZES,
                context + " (" + std::to_string(bits) + " bits on " +
                std::to_string(byte_size_) + " bytes)");
        }

        std::vector<bool> all = BitHelper::to_bits(value_);
        std::size_t offset = 0;
        for (std::size_t i = 0; i < names_.size(); ++i) {
            std::vector<bool> slice(all.begin() + offset, all.begin() + offset + bitsizes[i]);
            bitfields_.emplace_back(names_[i], bitsizes[i], slice, bitfield_mode_);
            offset += bitsizes[i];
        }
    }

    // === Value ===

    Bytes Field::value() const {
        return value_;
    }

    Bytes Field::convert(const FieldValue& value) const {
        // A zero sized field (optional placeholder) takes the size of its first content
        if (byte_size_ == 0 && !fixed_size_) {
            Bytes bytes = to_bytes(value, 0, byte_order_);
            check_size(bytes.size(), "Field::set_value (" + name() + ")");
            return bytes;
        }
        return fit(value, byte_size_, byte_order_);
    }

    void Field::store(const Bytes& value) {
        byte_size_ = value.size();
        value_ = value;
        if (bitfields_.empty()) {
            return;
        }
        std::vector<bool> all = BitHelper::to_bits(value_);
        std::size_t offset = 0;
        for (auto& bitfield : bitfields_) {
            std::vector<bool> slice(all.begin() + offset, all.begin() + offset + bitfield.width());
            bitfield.set_value(slice);
            offset += bitfield.width();
        }
    }

    void Field::set_value(const FieldValue& value) {
        store(convert(value));
        fixed_value_ = true;
    }

    void Field::set_value(const Bytes& value) {
        set_value(FieldValue{value});
    }

    void Field::set_value(std::int64_t value) {
        set_value(FieldValue{value});
    }

    void Field::set_value(const std::string& value) {
        set_value(FieldValue{value});
    }

    void Field::set_value(const char* value) {
        set_value(FieldValue{std::string(value)});
    }

    void Field::set_json_value(const nlohmann::json& value) {
        set_value(field_value_from_json(value, "Field::set_json_value (" + name() + ")"));
    }

    bool Field::auto_update(const Bytes& value) {
        if (fixed_value_) {
            if (verbose_) {
                std::cout << "[FIELD] " << name() << " has a fixed value, update to "
                          << ByteHelper::to_hex(value) << " ignored" << std::endl;
            }
            return false;
        }
        store(convert(FieldValue{value}));
        return true;
    }

    std::uint64_t Field::to_uint() const {
        return ByteHelper::to_int(value_, byte_order_);
    }

    std::string Field::to_ipv4() const {
        return ByteHelper::to_ipv4(value_);
    }

    // === Size ===

    void Field::set_size(std::size_t size) {
        if (size == byte_size_) {
            return;
        }
        std::string context = "Field::set_size (" + name() + ")";
        if (fixed_size_) {
            throw ProgrammingException(Status::PFIXED_SIZE, context);
        }
        check_size(size, context);
        if (!bitfields_.empty()) {
            throw ProgrammingException(Status::PBAD_BITSIZES,
                context + " (" + std::to_string(size) + " bytes breaks the bit fields)");
        }
        value_ = ByteHelper::resize(value_, size, byte_order_);
        byte_size_ = size;
    }

    void Field::set_size(const Bytes& size) {
        set_size(static_cast<std::size_t>(ByteHelper::to_int(size, byte_order_)));
    }

    // === Bit fields ===

    const BitField* Field::find_bitfield(const std::string& name) const {
        std::string property = NameHelper::to_property(name);
        for (const auto& bitfield : bitfields_) {
            if (NameHelper::to_property(bitfield.name()) == property) {
                return &bitfield;
            }
        }
        return nullptr;
    }

    void Field::set_bitfield(const std::string& name, std::uint64_t value) {
        std::string property = NameHelper::to_property(name);
        auto it = std::find_if(bitfields_.begin(), bitfields_.end(),
                [&property](const BitField& bitfield) {
                    return NameHelper::to_property(bitfield.name()) == property;
                });
        if (it == bitfields_.end()) {
            throw ProgrammingException(Status::PNOT_FOUND,
                "Field::set_bitfield (" + this->name() + "." + name + ")");
        }
        it->set_value(value);

        std::vector<bool> all;
        for (const auto& bitfield : bitfields_) {
            all.insert(all.end(), bitfield.value().begin(), bitfield.value().end());
        }
        value_ = BitHelper::from_bits(all);
        fixed_value_ = true;
    }

    // === Names ===

    bool Field::matches(const std::string& key) const {
        std::string property = NameHelper::to_property(key);
        if (property == property_name()) {
            return true;
        }
        return std::any_of(names_.begin(), names_.end(), [&property](const std::string& name) {
                return NameHelper::to_property(name) == property;
            });
    }

} // namespace protoframe
