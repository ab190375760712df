/**
 * @file error.hpp
 * @author Andrea Efficace (andrea.efficace1@gmail.com)
 * @brief Error codes for the protoframe engine.
 * @version 0.2
 * @date 2025-11-18
 */

#pragma once
#include <string>
#include <system_error>
#include <type_traits>

namespace protoframe {

/**
 * @enum Status
 * @brief Enumeration of error codes for frame engine operations.
 * These codes can be converted to std::error_code for integration with
 * standard error handling mechanisms.
 * @note SUCCESS (0) indicates no error.
 * Other values indicate specific error conditions.
 * If starts with 'P' it is a programming (usage) error.
 * If starts with 'L' it is a library error (specification file).
 * @see std::error_code
 */
    enum class Status : int {
        SUCCESS = 0,    /**< No error */
        PBAD_TEMPLATE = 1, /**< Malformed template */
        PMISSING_KEY = 2, /**< Missing template key */
        PUNKNOWN_TYPE = 3, /**< Unknown block type */
        PUNRESOLVED_DEPENDENCY = 4, /**< Dependency association not found */
        PBAD_VALUE_TYPE = 5, /**< Field value must be bytes, int, or string */
        PBAD_SIZE = 6,  /**< Bad field size */
        PFIXED_SIZE = 7, /**< Field size is fixed */
        PBAD_BITSIZES = 8, /**< Bit sizes do not match field names */
        PBAD_BITFIELD_VALUE = 9, /**< Bit field value does not fit its width */
        PNOT_FOUND = 10, /**< Item not found */
        PBAD_ARGUMENT = 11, /**< Bad argument */
        LFILE_NOT_FOUND = 20, /**< Specification file cannot be opened */
        LPARSE_ERROR = 21, /**< Specification file cannot be parsed */
        UNKNOWN = 255   /**< Unknown error */
    };

/**
 * @class ProtoframeErrorCategory
 * @brief Custom error category for protoframe errors.
 */
    class ProtoframeErrorCategory : public std::error_category {
        public:
            const char*name() const noexcept override {
                return "protoframe::Status";
            }

            std::string message(int ev) const override {
                switch (static_cast<Status>(ev)) {
                case Status::SUCCESS:
                    return "Success";
                case Status::PBAD_TEMPLATE:
                    return "Malformed template";
                case Status::PMISSING_KEY:
                    return "Missing template key";
                case Status::PUNKNOWN_TYPE:
                    return "Unknown block type";
                case Status::PUNRESOLVED_DEPENDENCY:
                    return "Association not found";
                case Status::PBAD_VALUE_TYPE:
                    return "Field value must be bytes, int, or string";
                case Status::PBAD_SIZE:
                    return "Bad field size";
                case Status::PFIXED_SIZE:
                    return "Field size is fixed";
                case Status::PBAD_BITSIZES:
                    return "Bit sizes do not match field names";
                case Status::PBAD_BITFIELD_VALUE:
                    return "Bit field value does not fit its width";
                case Status::PNOT_FOUND:
                    return "Item not found";
                case Status::PBAD_ARGUMENT:
                    return "Bad argument";
                case Status::LFILE_NOT_FOUND:
                    return "Specification file cannot be opened";
                case Status::LPARSE_ERROR:
                    return "Specification file cannot be parsed";
                case Status::UNKNOWN:
                    return "Unknown error";
                default:
                    return "Unrecognized error";
                }
            }
    };

// Get the error category instance
    inline const std::error_category &protoframe_category() {
        static ProtoframeErrorCategory instance;
        return instance;
    }

// Make error_code from Status
    inline std::error_code make_error_code(Status e) {
        return {static_cast<int>(e), protoframe_category()};
    }

}; // namespace protoframe

// Register the enum for use with std::error_code
namespace std {
    template<> struct is_error_code_enum<protoframe::Status> : true_type {};
}; // namespace std

/**
 * Usage example:
 * #include "protoframe/enums/error.hpp"
 *
 * std::error_code ec = protoframe::Status::PUNKNOWN_TYPE;
 * if (ec) {
 *     std::cerr << "Error: " << ec.message() << std::endl;
 * }
 */
