/**
 * @file bitfield.cpp
 * @brief BitField implementation
 * @version 1.0
 * @date 2025-11-18
 *
 * @copyright Copyright (c) 2025
 */

#include <utility>

#include "../include/frame/bitfield.hpp"
#include "../include/interface/serialization_helpers.hpp"
#include "../include/exception/protoframe_exception.hpp"

namespace protoframe {

    BitField::BitField(std::string name, std::size_t width, std::uint64_t value,
        BitFieldMode mode)
        : name_(std::move(name)), width_(width), bits_(width, false), mode_(mode) {
        if (width_ == 0) {
            throw ProgrammingException(Status::PBAD_BITSIZES,
                "BitField '" + name_ + "' (width must be > 0)");
        }
        set_value(value);
    }

    BitField::BitField(std::string name, std::size_t width, const std::vector<bool>& bits,
        BitFieldMode mode)
        : name_(std::move(name)), width_(width), bits_(width, false), mode_(mode) {
        if (width_ == 0) {
            throw ProgrammingException(Status::PBAD_BITSIZES,
                "BitField '" + name_ + "' (width must be > 0)");
        }
        set_value(bits);
    }

    void BitField::set_value(std::uint64_t value) {
        if (mode_ == BitFieldMode::STRICT && !BitHelper::fits(value, width_)) {
            throw ProgrammingException(Status::PBAD_BITFIELD_VALUE,
                "BitField::set_value ('" + name_ + "', " + std::to_string(value) +
                " on " + std::to_string(width_) + " bits)");
        }
        bits_ = BitHelper::from_uint(value, width_);
    }

    void BitField::set_value(const std::vector<bool>& bits) {
        if (bits.size() == width_) {
            bits_ = bits;
            return;
        }
        if (mode_ == BitFieldMode::STRICT) {
            throw ProgrammingException(Status::PBAD_BITFIELD_VALUE,
                "BitField::set_value ('" + name_ + "', " + std::to_string(bits.size()) +
                " bits on " + std::to_string(width_) + " bits)");
        }
        if (bits.size() > width_) {
            // Keep the low-order bits
            bits_.assign(bits.end() - width_, bits.end());
        } else {
            std::vector<bool> padded(width_ - bits.size(), false);
            padded.insert(padded.end(), bits.begin(), bits.end());
            bits_ = std::move(padded);
        }
    }

    std::uint64_t BitField::to_uint() const {
        return BitHelper::to_uint(bits_);
    }

} // namespace protoframe
