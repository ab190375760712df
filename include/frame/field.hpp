/**
 * @file field.hpp
 * @author effibot (andrea.efficace1@gmail.com)
 * @brief Leaf node of a frame: a named, sized byte value
 * @version 1.0
 * @date 2025-11-18
 *
 * A Field owns its bytes. When its template declares several comma
 * separated names with matching bitsizes, the bytes are stored as
 * BitFields and packed on demand.
 *
 * @copyright Copyright (c) 2025
 *
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../interface/core.hpp"
#include "../pattern/engine_config.hpp"
#include "../pattern/spec_registry.hpp"
#include "bitfield.hpp"
#include "field_value.hpp"

namespace protoframe {

    /**
     * @brief Named byte value with size and behavior flags
     *
     * Invariants:
     * - value().size() == byte_size()
     * - with bitfields, the widths sum to byte_size() * 8
     * - a field whose value was set explicitly (fixed_value) is never
     *   overwritten by auto_update()
     *
     * @code
     * Field total("total length", 2);
     * total.set_value(std::int64_t{14});   // 00 0e
     * total.auto_update({0x00, 0x20});     // ignored, value was set by hand
     * @endcode
     */
    class Field : public CoreInterface<Field> {
        friend class CoreInterface<Field>;

        private:
            std::vector<std::string> names_;
            std::size_t byte_size_ = 0;
            Bytes value_;
            std::vector<BitField> bitfields_;

            // * Behavior flags
            bool is_length_ = false;
            bool fixed_size_ = false;
            bool fixed_value_ = false;
            bool optional_ = false;

            // * Settings copied from the engine configuration
            ByteOrder byte_order_ = ByteOrder::BIG;
            BitFieldMode bitfield_mode_ = BitFieldMode::PERMISSIVE;
            std::size_t max_size_ = 65536;
            bool verbose_ = false;

            void apply_config(const EngineConfig& config);
            void check_size(std::size_t size, const std::string& context) const;
            void build_bitfields(const std::vector<std::size_t>& bitsizes);
            void store(const Bytes& value);
            Bytes convert(const FieldValue& value) const;

        public:
            /**
             * @brief Construct a zero filled field
             * @throws ProgrammingException if size exceeds the configured maximum
             */
            Field(std::string name, std::size_t size,
                const EngineConfig& config = EngineConfig::create_default());

            /**
             * @brief Construct a field holding a value
             * @param size Field size, 0 for the natural size of the value
             * @throws ProgrammingException on a size error
             */
            Field(std::string name, const FieldValue& value, std::size_t size = 0,
                const EngineConfig& config = EngineConfig::create_default());

            /**
             * @brief Construct a field from its template
             *
             * Initial content, by precedence: @p initial (parsed bytes or a
             * user value), the template "value" (pinned), the template
             * "default" (pinned only if the template says fixed_value).
             *
             * @param tmpl Field template
             * @param config Engine configuration
             * @param initial Content overriding the template values
             * @param size_override Size resolved from a length field
             * @throws ProgrammingException on size or bitsizes errors
             */
            Field(const ItemTemplate& tmpl, const EngineConfig& config,
                const std::optional<FieldValue>& initial = std::nullopt,
                std::optional<std::size_t> size_override = std::nullopt);

            // === Value ===

            /**
             * @brief Current bytes (packed from the bitfields if any)
             */
            Bytes value() const;

            /**
             * @brief Set the value explicitly
             *
             * The value is converted, then padded or truncated to the field
             * size according to the byte order. The field is marked as
             * fixed_value so length updates no longer overwrite it. A zero
             * sized optional field adopts the size of the value.
             *
             * @throws ProgrammingException if the value cannot be converted
             */
            void set_value(const FieldValue& value);
            void set_value(const Bytes& value);
            void set_value(std::int64_t value);
            void set_value(const std::string& value);
            void set_value(const char* value);

            /**
             * @brief Set the value from a JSON integer, string or byte array
             * @throws ProgrammingException for any other JSON type
             */
            void set_json_value(const nlohmann::json& value);

            /**
             * @brief Write a computed value unless the field was set explicitly
             * @return true if the value was written
             */
            bool auto_update(const Bytes& value);

            /**
             * @brief Value as an unsigned integer in the field byte order
             * @throws ProgrammingException if the value exceeds 64 bits
             */
            std::uint64_t to_uint() const;

            /**
             * @brief Value as a dotted IPv4 address
             * @throws ProgrammingException if the field is not 4 bytes long
             */
            std::string to_ipv4() const;

            // === Size ===

            std::size_t byte_size() const { return byte_size_; }

            /**
             * @brief Change the field size, keeping the value aligned on the byte order
             * @throws ProgrammingException if the size is fixed, too large, or breaks the bitfields
             */
            void set_size(std::size_t size);

            /**
             * @brief Change the field size to the integer encoded in @p size
             */
            void set_size(const Bytes& size);

            // === Bit fields ===

            bool has_bitfields() const { return !bitfields_.empty(); }
            const std::vector<BitField>& bitfields() const { return bitfields_; }

            /**
             * @brief Find a bitfield by name (any spelling of the name)
             * @return Pointer to the bitfield, nullptr if not found
             */
            const BitField* find_bitfield(const std::string& name) const;

            /**
             * @brief Set a single bitfield
             * @throws ProgrammingException if no bitfield has this name, or on a strict width error
             */
            void set_bitfield(const std::string& name, std::uint64_t value);

            // === Names ===

            /**
             * @brief Names declared by the template, one per bitfield
             */
            const std::vector<std::string>& names() const { return names_; }

            /**
             * @brief Whether @p key names this field or one of its bitfields
             */
            bool matches(const std::string& key) const;

            // === Flags ===

            bool is_length() const { return is_length_; }
            bool fixed_size() const { return fixed_size_; }
            bool fixed_value() const { return fixed_value_; }
            bool is_optional() const { return optional_; }
            ByteOrder byte_order() const { return byte_order_; }

            void set_is_length(bool is_length) { is_length_ = is_length; }
            void set_fixed_size(bool fixed_size) { fixed_size_ = fixed_size; }
            void set_fixed_value(bool fixed_value) { fixed_value_ = fixed_value; }
            void set_optional(bool optional) { optional_ = optional; }

            bool operator==(const Field& other) const {
                return name() == other.name() && byte_size_ == other.byte_size_ &&
                       value() == other.value();
            }

            bool operator!=(const Field& other) const {
                return !(*this == other);
            }

            /**
             * @brief Size a template gives to a field before any content is known
             * @return Size in bytes, nullopt for a dependent size or a sizeless optional field
             */
            static std::optional<std::size_t> template_size(const ItemTemplate& tmpl,
                ByteOrder order);

        protected:
            // === CRTP Implementation ===

            void impl_update() {}

            Bytes impl_serialize() const {
                return value();
            }

            std::size_t impl_serialized_size() const {
                return byte_size_;
            }
    };

} // namespace protoframe
