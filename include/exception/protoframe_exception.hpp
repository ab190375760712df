/**
 * @file protoframe_exception.hpp
 * @author Andrea Efficace (andrea.efficace1@gmail.com)
 * @brief Exception hierarchy for the protoframe engine
 * @version 0.2
 * @date 2025-11-18
 *
 * @copyright Copyright (c) 2025
 *
 */

#pragma once

#include <stdexcept>
#include <string>
#include "../enums/error.hpp"

namespace protoframe {

    /**
     * @class ProtoframeException
     * @brief Base exception class for all frame engine errors
     *
     * This exception stores the original Status code for programmatic error handling
     * while providing a descriptive error message via what().
     */
    class ProtoframeException : public std::runtime_error {
        protected:
            Status status_;     ///< Original error status code
            std::string context_; ///< Operation context (function name, offending item, etc.)

        public:
            /**
             * @brief Construct exception with status code and context
             * @param status The error status code
             * @param context Description of where the error occurred
             */
            ProtoframeException(Status status, const std::string& context)
                : std::runtime_error(format_message(status, context)),
                status_(status),
                context_(context) {}

            /**
             * @brief Get the status code
             * @return Status code associated with this exception
             */
            Status status() const noexcept { return status_; }

            /**
             * @brief Get the operation context
             * @return Context string describing where error occurred
             */
            const std::string& context() const noexcept { return context_; }

        private:
            static std::string format_message(Status status, const std::string& context) {
                ProtoframeErrorCategory category;
                return "[" + category.message(static_cast<int>(status)) + "] in " + context;
            }
    };

    // === Derived Exception Classes ===

    /**
     * @class ProgrammingException
     * @brief Exception for usage errors
     *
     * Malformed templates, unknown types, unresolved dependencies,
     * setter type mismatches. Corresponds to P* status codes.
     */
    class ProgrammingException : public ProtoframeException {
        public:
            using ProtoframeException::ProtoframeException;
    };

    /**
     * @class LibraryException
     * @brief Exception for specification file errors
     *
     * Raised once at load time when a file is missing or cannot be parsed.
     * Corresponds to L* status codes.
     */
    class LibraryException : public ProtoframeException {
        public:
            using ProtoframeException::ProtoframeException;
    };

    // === Exception Factory Helpers ===

    /**
     * @brief Throw appropriate exception based on status code
     * @param status The error status code
     * @param context Description of where the error occurred
     * @throws ProgrammingException for P* codes
     * @throws LibraryException for L* codes
     * @throws ProtoframeException for other codes
     */
    inline void throw_error(Status status, const std::string& context) {
        switch (status) {
        case Status::PBAD_TEMPLATE:
        case Status::PMISSING_KEY:
        case Status::PUNKNOWN_TYPE:
        case Status::PUNRESOLVED_DEPENDENCY:
        case Status::PBAD_VALUE_TYPE:
        case Status::PBAD_SIZE:
        case Status::PFIXED_SIZE:
        case Status::PBAD_BITSIZES:
        case Status::PBAD_BITFIELD_VALUE:
        case Status::PNOT_FOUND:
        case Status::PBAD_ARGUMENT:
            throw ProgrammingException(status, context);

        case Status::LFILE_NOT_FOUND:
        case Status::LPARSE_ERROR:
            throw LibraryException(status, context);

        default:
            throw ProtoframeException(status, context);
        }
    }

    /**
     * @brief Throw if status indicates an error (not SUCCESS)
     * @param status The status code to check
     * @param context Description of where the error occurred
     */
    inline void throw_if_error(Status status, const std::string& context) {
        if (status != Status::SUCCESS) {
            throw_error(status, context);
        }
    }

} // namespace protoframe
