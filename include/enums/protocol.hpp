/**
 * @file protocol.hpp
 * @author Andrea Efficace (andrea.efficace1@gmail.com)
 * @brief Protocol-independent definitions and helper functions for the frame engine.
 * @version 4.0
 * @date 2025-11-18
 *
 * Byte order and bit field modes, specification file keywords and
 * fixed-width integer/byte conversions.
 *
 * @copyright Copyright (c) 2025
 *
 */


#pragma once

#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <string>
#include <array>
#include <vector>
#include <boost/core/span.hpp>
using namespace boost;

/**
 * @namespace protoframe
 * @brief Namespace containing all frame engine related functionality.
 */
namespace protoframe {

    // * Raw byte sequence used for every field value and serialized node
    using Bytes = std::vector<std::uint8_t>;

    // === Specification File Keywords ===

    namespace keys {
        constexpr const char* SEPARATOR = ",";
        constexpr const char* DEPENDS = "depends:";
        constexpr const char* NAME = "name";
        constexpr const char* TYPE = "type";
        constexpr const char* VALUE = "value";
        constexpr const char* DEFAULT = "default";
        constexpr const char* SIZE = "size";
        constexpr const char* OPTIONAL = "optional";
        constexpr const char* FIELD = "field";
        constexpr const char* BLOCK = "block";
        constexpr const char* IS_LENGTH = "is_length";
        constexpr const char* FIXED_SIZE = "fixed_size";
        constexpr const char* FIXED_VALUE = "fixed_value";
        constexpr const char* BITSIZES = "bitsizes";
        constexpr const char* FRAME = "frame";
        constexpr const char* BLOCKS = "blocks";
        constexpr const char* CODES = "codes";
        constexpr const char* SCHEMA = "schema";
        constexpr const char* TRAILING = "trailing data";
    } // namespace keys

    // === Engine Modes ===

    /**
     * @brief Byte order used by int/bytes conversion and resize operations.
     *
     * BIG pads and truncates on the left (most significant side first),
     * LITTLE on the right.
     */
    enum class ByteOrder : std::uint8_t {
        BIG = 0,
        LITTLE = 1
    };

    /**
     * @brief Behavior of a BitField when a value does not match its width.
     *
     * PERMISSIVE truncates or pads silently (lets callers build malformed
     * frames on purpose), STRICT rejects the value.
     */
    enum class BitFieldMode : std::uint8_t {
        PERMISSIVE = 0,
        STRICT = 1
    };

    /**
     * @brief Get the ByteOrder from its name.
     * @param name "big" or "little" (lowercase)
     * @param use_default Set to true if the name is not recognized
     * @return ByteOrder The matching order, BIG if not recognized
     */
    inline ByteOrder byteorder_from_string(const std::string& name, bool& use_default) {
        use_default = false;
        if (name == "big") return ByteOrder::BIG;
        if (name == "little") return ByteOrder::LITTLE;
        use_default = true;
        return ByteOrder::BIG;
    }

    /**
     * @brief Get the BitFieldMode from its name.
     * @param name "permissive" or "strict" (lowercase)
     * @param use_default Set to true if the name is not recognized
     * @return BitFieldMode The matching mode, PERMISSIVE if not recognized
     */
    inline BitFieldMode bitfieldmode_from_string(const std::string& name, bool& use_default) {
        use_default = false;
        if (name == "permissive") return BitFieldMode::PERMISSIVE;
        if (name == "strict") return BitFieldMode::STRICT;
        use_default = true;
        return BitFieldMode::PERMISSIVE;
    }

    inline std::string to_string(ByteOrder order) {
        return order == ByteOrder::BIG ? "big" : "little";
    }

    inline std::string to_string(BitFieldMode mode) {
        return mode == BitFieldMode::STRICT ? "strict" : "permissive";
    }

    // === Byte Manipulation Helpers ===

    /**
     * @brief Converts an unsigned integer to a big-endian byte array.
     * @param T The unsigned integer type to convert from
     * @param value The unsigned integer value to convert
     * @return std::array<std::uint8_t, sizeof(T)> Most significant byte at index 0
     * @example
     * @code
     * auto bytes = int_to_bytes_be<uint16_t>(0x1234); // bytes = {0x12, 0x34}
     * @endcode
     */
    template<typename T>
    constexpr std::array<std::uint8_t, sizeof(T)> int_to_bytes_be(T value) {
        static_assert(std::is_unsigned<T>::value, "T must be an unsigned integer type");
        std::array<std::uint8_t, sizeof(T)> bytes = {};
        for (std::size_t i = 0; i < sizeof(T); ++i) {
            bytes[sizeof(T) - 1 - i] = static_cast<std::uint8_t>(value & 0xFF);
            value >>= 8;
        }
        return bytes;
    }

    /**
     * @brief Converts a big-endian byte sequence to an unsigned integer.
     * @param T The unsigned integer type to convert to
     * @param bytes The big-endian bytes (only the first sizeof(T) are used)
     * @return T The unsigned integer value represented by the bytes
     */
    template<typename T>
    constexpr T bytes_to_int_be(span<const std::uint8_t> bytes) {
        static_assert(std::is_unsigned<T>::value, "T must be an unsigned integer type");
        T value = 0;
        for (std::size_t i = 0; i < bytes.size() && i < sizeof(T); ++i) {
            value = (value << 8) | (static_cast<T>(bytes[i]) & 0xFF);
        }
        return value;
    }

    /**
     * @brief Converts a little-endian byte sequence to an unsigned integer.
     * @param T The unsigned integer type to convert to
     * @param bytes The little-endian bytes (only the first sizeof(T) are used)
     * @return T The unsigned integer value represented by the bytes
     */
    template<typename T>
    constexpr T bytes_to_int_le(span<const std::uint8_t> bytes) {
        static_assert(std::is_unsigned<T>::value, "T must be an unsigned integer type");
        T value = 0;
        for (std::size_t i = 0; i < bytes.size() && i < sizeof(T); ++i) {
            value |= (static_cast<T>(bytes[i]) & 0xFF) << (8 * i);
        }
        return value;
    }

}     // namespace protoframe
