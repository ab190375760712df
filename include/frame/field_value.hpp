/**
 * @file field_value.hpp
 * @brief Value accepted by field setters, templates and user overrides
 * @version 1.0
 * @date 2025-11-18
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

#include "../enums/protocol.hpp"
#include "../exception/protoframe_exception.hpp"
#include "../interface/serialization_helpers.hpp"

namespace protoframe {

    /**
     * @brief A field value before conversion: raw bytes, an integer or text
     */
    using FieldValue = std::variant<Bytes, std::int64_t, std::string>;

    /**
     * @brief Caller supplied values, keyed by field name
     *
     * Used to resolve dependencies and to fill fields with matching names
     * while a block is built.
     */
    using UserValues = std::map<std::string, FieldValue>;

    /**
     * @brief Convert a value to bytes
     *
     * @param value Value to convert
     * @param size Output size, 0 to keep the natural size of the value
     * @param order Byte order for integers and padding/truncation
     * @return Bytes The converted value
     * @see ByteHelper::from_text for the text rules
     */
    inline Bytes to_bytes(const FieldValue& value, std::size_t size, ByteOrder order) {
        if (auto bytes = std::get_if<Bytes>(&value)) {
            return size ? ByteHelper::resize(*bytes, size, order) : *bytes;
        }
        if (auto number = std::get_if<std::int64_t>(&value)) {
            return ByteHelper::from_signed(*number, size, order);
        }
        Bytes text = ByteHelper::from_text(std::get<std::string>(value));
        return size ? ByteHelper::resize(text, size, order) : text;
    }

    /**
     * @brief Read a field value from a specification or configuration file
     *
     * Integers, strings and arrays of byte values are accepted.
     *
     * @param j JSON value
     * @param context Where the value comes from, for error messages
     * @throws ProgrammingException for any other JSON type
     */
    inline FieldValue field_value_from_json(const nlohmann::json& j, const std::string& context) {
        if (j.is_number_integer()) {
            if (j.is_number_unsigned()) {
                return static_cast<std::int64_t>(j.get<std::uint64_t>());
            }
            return j.get<std::int64_t>();
        }
        if (j.is_string()) {
            return j.get<std::string>();
        }
        if (j.is_array()) {
            Bytes bytes;
            for (const auto& item : j) {
                if (!item.is_number_integer() || item.get<std::int64_t>() < 0 ||
                    item.get<std::int64_t>() > 0xFF) {
                    throw ProgrammingException(Status::PBAD_VALUE_TYPE, context);
                }
                bytes.push_back(static_cast<std::uint8_t>(item.get<std::int64_t>()));
            }
            return bytes;
        }
        throw ProgrammingException(Status::PBAD_VALUE_TYPE, context);
    }

} // namespace protoframe
