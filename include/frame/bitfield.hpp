/**
 * @file bitfield.hpp
 * @brief Sub-byte value packed inside a Field
 * @version 1.0
 * @date 2025-11-18
 *
 * A BitField has no wire presence of its own: the owning Field packs all of
 * its BitFields, in declaration order, into its byte value.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "../enums/protocol.hpp"

namespace protoframe {

    /**
     * @brief Fixed-width bit sequence, most significant bit first
     *
     * Invariant: value().size() == width().
     *
     * In PERMISSIVE mode a value longer than the width keeps its low-order
     * bits and a shorter one is left padded with zeros. In STRICT mode such
     * values are rejected.
     *
     * @code
     * BitField start_index("start index", 12, 1);
     * start_index.value();   // 0000 0000 0001
     * @endcode
     */
    class BitField {
        private:
            std::string name_;
            std::size_t width_;
            std::vector<bool> bits_;
            BitFieldMode mode_;

        public:
            /**
             * @brief Construct from an integer value
             * @throws ProgrammingException if width is 0, or in strict mode if value does not fit
             */
            BitField(std::string name, std::size_t width, std::uint64_t value = 0,
                BitFieldMode mode = BitFieldMode::PERMISSIVE);

            /**
             * @brief Construct from an explicit bit sequence (MSB first)
             * @throws ProgrammingException if width is 0, or in strict mode if bits.size() != width
             */
            BitField(std::string name, std::size_t width, const std::vector<bool>& bits,
                BitFieldMode mode = BitFieldMode::PERMISSIVE);

            const std::string& name() const { return name_; }
            std::size_t width() const { return width_; }
            BitFieldMode mode() const { return mode_; }

            /**
             * @brief Bits of the value, MSB first, always width() long
             */
            const std::vector<bool>& value() const { return bits_; }

            void set_value(std::uint64_t value);
            void set_value(const std::vector<bool>& bits);

            /**
             * @brief Integer value of the bits (last 64 bits for wider fields)
             */
            std::uint64_t to_uint() const;

            bool operator==(const BitField& other) const {
                return name_ == other.name_ && bits_ == other.bits_;
            }
    };

} // namespace protoframe
