/**
 * @file result.hpp
 * @brief Value-or-status return type for the non-throwing entry points.
 * @version 1.0
 * @date 2025-11-18
 * @copyright Copyright (c) 2025
 */

#pragma once
#include "../enums/error.hpp"
#include "../exception/protoframe_exception.hpp"
#include <string>
#include <variant>
#include <vector>

namespace protoframe {

/**
 * @brief Holds either a built object or the status that stopped it.
 *
 * A failed result keeps the contexts it went through, innermost first,
 * so describe() reads like the exception it was converted from.
 *
 * @tparam T Type of the wrapped object.
 */
    template<typename T>
    class Result {
        private:
            std::variant<T, Status> outcome_;
            std::vector<std::string> contexts_;

            explicit Result(Status status) : outcome_(status) {}

            explicit Result(T value) : outcome_(std::move(value)) {}

        public:
            bool ok() const {
                return std::holds_alternative<T>(outcome_);
            }

            bool fail() const {
                return !ok();
            }

            // Throws std::bad_variant_access on a failed result
            const T& value() const {
                return std::get<T>(outcome_);
            }

            T& value() {
                return std::get<T>(outcome_);
            }

            Status error() const {
                return fail() ? std::get<Status>(outcome_) : Status::SUCCESS;
            }

            const std::vector<std::string>& contexts() const {
                return contexts_;
            }

            std::string describe() const {
                if (ok()) {
                    return "Success";
                }
                std::string text = "Error: " + make_error_code(error()).message();
                if (!contexts_.empty()) {
                    text += " [";
                    for (std::size_t i = 0; i < contexts_.size(); ++i) {
                        text += (i > 0 ? " -> " : "") + contexts_[i];
                    }
                    text += "]";
                }
                return text;
            }

            // === Factories ===

            static Result success(T value) {
                return Result(std::move(value));
            }

            static Result error(Status status, const std::string& context = "") {
                Result r(status);
                if (!context.empty()) {
                    r.contexts_.push_back(context);
                }
                return r;
            }

            static Result from_exception(const ProtoframeException& e, const std::string& context = "") {
                Result r = error(e.status(), e.context());
                if (!context.empty()) {
                    r.contexts_.push_back(context);
                }
                return r;
            }
    };

}// namespace protoframe
