/**
 * @file serialization_helpers.hpp
 * @brief Pure static helper classes for field serialization
 * @version 4.0
 * @date 2025-11-18
 *
 * Helpers:
 * - ByteHelper: resize, int/bytes, IPv4, hex and string conversions
 * - BitHelper: MSB-first bit vectors to/from bytes and integers
 * - NameHelper: name normalization and template name parsing
 *
 * These are pure static classes (no CRTP, no state) that work on
 * raw byte buffers. The byte order is always passed explicitly.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <cctype>
#include <optional>
#include <sstream>
#include <iomanip>
#include <string>
#include <vector>
#include <boost/core/span.hpp>
#include "../enums/protocol.hpp"
#include "../exception/protoframe_exception.hpp"

using namespace boost;

namespace protoframe {

    /**
     * @brief Static helper for byte sequence conversions
     *
     * Every operation that pads or truncates honors the given ByteOrder:
     * big order keeps the rightmost (least significant) bytes and pads on
     * the left, little order keeps the leftmost bytes and pads on the right.
     */
    class ByteHelper {
        public:
            /**
             * @brief Resize a byte sequence to the expected size
             *
             * @param array Bytes to resize
             * @param size Expected size after padding/truncation
             * @param order Side on which padding/truncation happens
             * @param fill Padding byte
             * @return Bytes The resized sequence
             *
             * @example
             * @code
             * ByteHelper::resize({0x04, 0xD2}, 1);  // {0xD2}
             * ByteHelper::resize({0xD2}, 4);        // {0x00, 0x00, 0x00, 0xD2}
             * @endcode
             */
            static Bytes resize(span<const std::uint8_t> array, std::size_t size,
                ByteOrder order = ByteOrder::BIG, std::uint8_t fill = 0x00) {
                if (size < array.size()) {
                    if (order == ByteOrder::BIG) {
                        return Bytes(array.end() - size, array.end());
                    }
                    return Bytes(array.begin(), array.begin() + size);
                }
                Bytes result;
                result.reserve(size);
                std::size_t padding = size - array.size();
                if (order == ByteOrder::BIG) {
                    result.insert(result.end(), padding, fill);
                    result.insert(result.end(), array.begin(), array.end());
                } else {
                    result.insert(result.end(), array.begin(), array.end());
                    result.insert(result.end(), padding, fill);
                }
                return result;
            }

            /**
             * @brief Number of bytes an integer fits into (0 for 0)
             */
            static std::size_t get_size(std::uint64_t value) {
                std::size_t size = 0;
                while (value != 0) {
                    ++size;
                    value >>= 8;
                }
                return size;
            }

            /**
             * @brief Convert an unsigned integer to bytes
             *
             * @param value Integer to convert
             * @param size Output size, 0 for the minimal size (at least 1 byte)
             * @param order Byte order of the output
             * @return Bytes The encoded integer
             *
             * @example
             * @code
             * ByteHelper::from_int(65980);  // {0x01, 0x01, 0xBC}
             * ByteHelper::from_int(6, 2);   // {0x00, 0x06}
             * @endcode
             */
            static Bytes from_int(std::uint64_t value, std::size_t size = 0,
                ByteOrder order = ByteOrder::BIG) {
                auto full = int_to_bytes_be<std::uint64_t>(value);
                std::size_t minimal = get_size(value);
                if (minimal == 0) {
                    minimal = 1;
                }
                Bytes encoded(full.end() - minimal, full.end());
                if (order == ByteOrder::LITTLE) {
                    encoded.assign(encoded.rbegin(), encoded.rend());
                }
                return resize(encoded, size ? size : encoded.size(), order);
            }

            /**
             * @brief Convert a signed integer to bytes
             *
             * Negative values are encoded as two's complement and sign
             * extended when the requested size exceeds 8 bytes.
             */
            static Bytes from_signed(std::int64_t value, std::size_t size = 0,
                ByteOrder order = ByteOrder::BIG) {
                if (value >= 0) {
                    return from_int(static_cast<std::uint64_t>(value), size, order);
                }
                Bytes encoded = from_int(static_cast<std::uint64_t>(value), 8, order);
                return resize(encoded, size ? size : encoded.size(), order, 0xFF);
            }

            /**
             * @brief Convert bytes to an unsigned integer
             *
             * @param array Bytes to convert
             * @param order Byte order of the input
             * @return std::uint64_t The decoded value
             * @throws ProgrammingException if significant bytes exceed 64 bits
             */
            static std::uint64_t to_int(span<const std::uint8_t> array,
                ByteOrder order = ByteOrder::BIG) {
                if (array.size() > sizeof(std::uint64_t)) {
                    std::size_t extra = array.size() - sizeof(std::uint64_t);
                    auto high = order == ByteOrder::BIG ?
                        array.first(extra) : array.last(extra);
                    for (auto b : high) {
                        if (b != 0) {
                            throw ProgrammingException(Status::PBAD_SIZE,
                                "ByteHelper::to_int (value exceeds 64 bits)");
                        }
                    }
                    array = order == ByteOrder::BIG ?
                        array.last(sizeof(std::uint64_t)) : array.first(sizeof(std::uint64_t));
                }
                return order == ByteOrder::BIG ?
                       bytes_to_int_be<std::uint64_t>(array) :
                       bytes_to_int_le<std::uint64_t>(array);
            }

            /**
             * @brief Check for a dotted IPv4 address "A.B.C.D"
             */
            static bool is_ipv4(const std::string& text) {
                return parse_ipv4(text).has_value();
            }

            /**
             * @brief Convert a dotted IPv4 string to 4 bytes
             * @throws ProgrammingException if text is not an IPv4 address
             */
            static Bytes from_ipv4(const std::string& text) {
                auto ip = parse_ipv4(text);
                if (!ip) {
                    throw ProgrammingException(Status::PBAD_ARGUMENT,
                        "ByteHelper::from_ipv4 (" + text + ")");
                }
                return *ip;
            }

            /**
             * @brief Convert 4 bytes to a dotted IPv4 string
             * @throws ProgrammingException if array is not 4 bytes long
             */
            static std::string to_ipv4(span<const std::uint8_t> array) {
                if (array.size() != 4) {
                    throw ProgrammingException(Status::PBAD_ARGUMENT,
                        "ByteHelper::to_ipv4 (expected 4 bytes)");
                }
                return std::to_string(array[0]) + "." + std::to_string(array[1]) + "." +
                       std::to_string(array[2]) + "." + std::to_string(array[3]);
            }

            /**
             * @brief Decode a string of hex digit pairs, optional "0x" prefix
             * @return Decoded bytes, or nullopt if the text is not valid hex
             */
            static std::optional<Bytes> parse_hex(const std::string& text) {
                std::string digits = text;
                if (digits.size() >= 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
                    digits = digits.substr(2);
                }
                if (digits.empty() || digits.size() % 2 != 0) {
                    return std::nullopt;
                }
                Bytes result;
                result.reserve(digits.size() / 2);
                for (std::size_t i = 0; i < digits.size(); i += 2) {
                    int high = hex_digit(digits[i]);
                    int low = hex_digit(digits[i + 1]);
                    if (high < 0 || low < 0) {
                        return std::nullopt;
                    }
                    result.push_back(static_cast<std::uint8_t>((high << 4) | low));
                }
                return result;
            }

            /**
             * @brief Decode a hex string
             * @throws ProgrammingException if the text is not valid hex
             */
            static Bytes from_hex(const std::string& text) {
                auto result = parse_hex(text);
                if (!result) {
                    throw ProgrammingException(Status::PBAD_ARGUMENT,
                        "ByteHelper::from_hex (" + text + ")");
                }
                return *result;
            }

            /**
             * @brief Convert a field value given as text to bytes
             *
             * - dotted IPv4 address: 4 bytes
             * - numeric text (decimal digits, or "0x" and hex digits):
             *   hex digit pairs, UTF-8 if it cannot be decoded
             * - anything else: UTF-8
             *
             * @example
             * @code
             * ByteHelper::from_text("192.168.1.1"); // {0xC0, 0xA8, 0x01, 0x01}
             * ByteHelper::from_text("0203");        // {0x02, 0x03}
             * ByteHelper::from_text("HEL");         // {'H', 'E', 'L'}
             * @endcode
             */
            static Bytes from_text(const std::string& text) {
                if (auto ip = parse_ipv4(text)) {
                    return *ip;
                }
                if (is_numeric(text)) {
                    if (auto hex = parse_hex(text)) {
                        return *hex;
                    }
                }
                return Bytes(text.begin(), text.end());
            }

            /**
             * @brief Interpret a code table key as wire bytes (hex if possible, else UTF-8)
             */
            static Bytes from_code(const std::string& text) {
                if (auto hex = parse_hex(text)) {
                    return *hex;
                }
                return Bytes(text.begin(), text.end());
            }

            /**
             * @brief Hex representation, two lowercase digits per byte
             */
            static std::string to_hex(span<const std::uint8_t> array, const std::string& sep = " ") {
                std::ostringstream oss;
                oss << std::hex << std::setfill('0');
                for (std::size_t i = 0; i < array.size(); ++i) {
                    if (i > 0) oss << sep;
                    oss << std::setw(2) << static_cast<int>(array[i]);
                }
                return oss.str();
            }

        private:
            static int hex_digit(char c) {
                if (c >= '0' && c <= '9') return c - '0';
                if (c >= 'a' && c <= 'f') return c - 'a' + 10;
                if (c >= 'A' && c <= 'F') return c - 'A' + 10;
                return -1;
            }

            static bool is_numeric(const std::string& text) {
                if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
                    return true;
                }
                if (text.empty()) {
                    return false;
                }
                for (char c : text) {
                    if (!std::isdigit(static_cast<unsigned char>(c))) {
                        return false;
                    }
                }
                return true;
            }

            static std::optional<Bytes> parse_ipv4(const std::string& text) {
                Bytes result;
                std::size_t start = 0;
                while (true) {
                    std::size_t end = text.find('.', start);
                    std::string part = text.substr(start,
                        end == std::string::npos ? std::string::npos : end - start);
                    if (part.empty() || part.size() > 3 || result.size() == 4) {
                        return std::nullopt;
                    }
                    int octet = 0;
                    for (char c : part) {
                        if (!std::isdigit(static_cast<unsigned char>(c))) {
                            return std::nullopt;
                        }
                        octet = octet * 10 + (c - '0');
                    }
                    if (octet > 255) {
                        return std::nullopt;
                    }
                    result.push_back(static_cast<std::uint8_t>(octet));
                    if (end == std::string::npos) {
                        break;
                    }
                    start = end + 1;
                }
                if (result.size() != 4) {
                    return std::nullopt;
                }
                return result;
            }
    };

    /**
     * @brief Static helper for MSB-first bit vectors
     *
     * Bit vectors are ordered most significant bit first, so
     * {0x10, 0x01} unpacks to 0001 0000 0000 0001 read left to right.
     */
    class BitHelper {
        public:
            static std::vector<bool> to_bits(span<const std::uint8_t> array) {
                std::vector<bool> bits;
                bits.reserve(array.size() * 8);
                for (auto byte : array) {
                    for (int i = 7; i >= 0; --i) {
                        bits.push_back(((byte >> i) & 0x01) != 0);
                    }
                }
                return bits;
            }

            /**
             * @brief Pack bits into bytes, left padding to a multiple of 8
             */
            static Bytes from_bits(const std::vector<bool>& bits) {
                std::size_t padding = (8 - bits.size() % 8) % 8;
                Bytes result((bits.size() + padding) / 8, 0x00);
                for (std::size_t i = 0; i < bits.size(); ++i) {
                    if (bits[i]) {
                        std::size_t pos = i + padding;
                        result[pos / 8] |= static_cast<std::uint8_t>(0x80 >> (pos % 8));
                    }
                }
                return result;
            }

            /**
             * @brief Low `width` bits of an integer, MSB first
             */
            static std::vector<bool> from_uint(std::uint64_t value, std::size_t width) {
                std::vector<bool> bits(width, false);
                for (std::size_t i = 0; i < width && i < 64; ++i) {
                    bits[width - 1 - i] = ((value >> i) & 0x01) != 0;
                }
                return bits;
            }

            /**
             * @brief Integer value of the last (up to 64) bits
             */
            static std::uint64_t to_uint(const std::vector<bool>& bits) {
                std::uint64_t value = 0;
                std::size_t start = bits.size() > 64 ? bits.size() - 64 : 0;
                for (std::size_t i = start; i < bits.size(); ++i) {
                    value = (value << 1) | (bits[i] ? 1u : 0u);
                }
                return value;
            }

            /**
             * @brief Whether an integer fits in `width` bits
             */
            static bool fits(std::uint64_t value, std::size_t width) {
                return width >= 64 || (value >> width) == 0;
            }
    };

    /**
     * @brief Static helper for item names found in specification files
     */
    class NameHelper {
        public:
            /**
             * @brief Normalize a name to its property form
             *
             * Lowercase, runs of non-alphanumeric characters become a single
             * underscore, no leading or trailing underscore.
             *
             * @example
             * @code
             * NameHelper::to_property("Service Identifier"); // "service_identifier"
             * NameHelper::to_property("L_Data.req");         // "l_data_req"
             * @endcode
             */
            static std::string to_property(const std::string& name) {
                std::string result;
                result.reserve(name.size());
                bool pending_separator = false;
                for (char c : name) {
                    unsigned char uc = static_cast<unsigned char>(c);
                    if (std::isalnum(uc)) {
                        if (pending_separator && !result.empty()) {
                            result.push_back('_');
                        }
                        pending_separator = false;
                        result.push_back(static_cast<char>(std::tolower(uc)));
                    } else {
                        pending_separator = true;
                    }
                }
                return result;
            }

            /**
             * @brief Split a comma separated name list, trimming each name
             */
            static std::vector<std::string> split(const std::string& names,
                char separator = keys::SEPARATOR[0]) {
                std::vector<std::string> result;
                std::size_t start = 0;
                while (start <= names.size()) {
                    std::size_t end = names.find(separator, start);
                    if (end == std::string::npos) {
                        end = names.size();
                    }
                    std::string part = trim(names.substr(start, end - start));
                    if (!part.empty()) {
                        result.push_back(part);
                    }
                    start = end + 1;
                }
                return result;
            }

            /**
             * @brief Target of a "depends:<name>" value, normalized
             * @return The dependency name, or nullopt if text is not a dependency
             */
            static std::optional<std::string> depends_target(const std::string& text) {
                const std::string prefix = keys::DEPENDS;
                if (text.compare(0, prefix.size(), prefix) != 0) {
                    return std::nullopt;
                }
                return to_property(text.substr(prefix.size()));
            }

            static std::string trim(const std::string& text) {
                std::size_t first = text.find_first_not_of(" \t\r\n");
                if (first == std::string::npos) {
                    return "";
                }
                std::size_t last = text.find_last_not_of(" \t\r\n");
                return text.substr(first, last - first + 1);
            }
    };

} // namespace protoframe
