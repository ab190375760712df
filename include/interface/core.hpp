/**
 * @file core.hpp
 * @author Andrea Efficace (andrea.efficace@)
 * @brief Core interface shared by fields, blocks and frames
 * @version 5.0
 * @date 2025-11-18
 *
 * State-First Architecture:
 * - CoreState holds the node name
 * - No persistent buffer storage
 * - Serialization on-demand via serialize(), always after update()
 *
 * @copyright Copyright (c) 2025
 *
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "../enums/protocol.hpp"
#include "serialization_helpers.hpp"

namespace protoframe {

    /**
     * @brief Core state for all nodes
     */
    struct CoreState {
        std::string name;   // Name as declared in the template (may be a comma separated list)
    };

    /**
     * @brief Core interface for all node types (state-first design)
     *
     * This class provides:
     * - CoreState holding the node name
     * - update-then-serialize
     * - Size and hex representation helpers
     * - CRTP access to derived implementations
     *
     * Derived classes implement impl_update(), impl_serialize() and
     * impl_serialized_size().
     *
     * @tparam Node The node type to interface with (Field, Block, Frame)
     */
    template<typename Node>
    class CoreInterface {

        protected:
            // * Core state (single source of truth)
            CoreState core_state_;

            // * CRTP helper to access derived class methods
            Node& derived() {
                return static_cast<Node&>(*this);
            }

            // * CRTP helper to access derived class methods (const version)
            const Node& derived() const {
                return static_cast<const Node&>(*this);
            }

            CoreInterface() {
                static_assert(!std::is_same_v<Node, CoreInterface>,
                    "CoreInterface cannot be instantiated directly");
            }

            explicit CoreInterface(std::string name) : CoreInterface() {
                core_state_.name = std::move(name);
            }

        public:

            // === Name Access ===

            /**
             * @brief Get the name as declared in the template
             */
            const std::string& name() const {
                return core_state_.name;
            }

            /**
             * @brief Get the normalized name used for lookups
             * @see NameHelper::to_property
             */
            std::string property_name() const {
                return NameHelper::to_property(core_state_.name);
            }

            // === Serialization Methods ===

            /**
             * @brief Recompute automatic values (length fields) of the subtree
             * @note Calls derived().impl_update()
             */
            void update() {
                derived().impl_update();
            }

            /**
             * @brief Serialize the node to its wire form
             *
             * Length fields are updated first so the output always reflects
             * the current tree state.
             *
             * @return Bytes Serialized node
             * @note Calls derived().impl_serialize() after update()
             */
            Bytes serialize() {
                update();
                return derived().impl_serialize();
            }

            /**
             * @brief Get the serialized size of this node
             *
             * Sizes do not depend on length field values, so no update is needed.
             *
             * @return std::size_t Size in bytes
             */
            std::size_t serialized_size() const {
                return derived().impl_serialized_size();
            }

            // === Utility Methods ===

            /**
             * @brief Print the node as hex bytes
             * @return std::string e.g. "06 10 02 03 00 0e"
             */
            std::string to_string() {
                return ByteHelper::to_hex(serialize());
            }

            /**
             * @brief Get the size of the node in bytes
             * Alias for serialized_size()
             */
            std::size_t size() const {
                return serialized_size();
            }
    };
}
