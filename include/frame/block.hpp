/**
 * @file block.hpp
 * @author effibot (andrea.efficace1@gmail.com)
 * @brief Ordered container of fields and nested blocks
 * @version 1.0
 * @date 2025-11-18
 *
 * A Block is built either by hand (append) or from a block template of
 * the SpecRegistry. Nested blocks whose type depends on the value of a
 * previous field ("depends:<field>") are resolved while building, using
 * the fields already built as scope. No parent pointer is kept.
 *
 * @copyright Copyright (c) 2025
 *
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <boost/core/span.hpp>

#include "../interface/core.hpp"
#include "../pattern/engine_config.hpp"
#include "../pattern/spec_registry.hpp"
#include "field.hpp"
#include "field_value.hpp"

using namespace boost;

namespace protoframe {

    /**
     * @brief Everything a block needs while it is built from a template
     */
    struct BuildContext {
        const SpecRegistry& registry;
        EngineConfig config;
        // * Caller values keyed by normalized field name
        UserValues user_values;
        // * true when reading bytes received from the network
        bool parsing = false;

        BuildContext(const SpecRegistry& registry, const EngineConfig& config,
            const UserValues& values = {}, bool parsing = false);
    };

    /**
     * @brief Fields visible to a block under construction, oldest first
     *
     * Pointers are only valid during the construction that received them.
     */
    using Scope = std::vector<const Field*>;

    class Item;

    /**
     * @brief Named, ordered sequence of items (fields or blocks)
     *
     * Serialization is the concatenation of the children. Children are
     * reachable by normalized name through get(); for a bit-packed field
     * each sub-name is registered as well as the joined name, and later
     * registrations win.
     *
     * @code
     * BuildContext context(registry, config);
     * Block hpai(ItemTemplate{"control endpoint", "HPAI"}, context);
     * hpai.get("ip address")->field().set_value("192.168.1.10");
     * hpai.serialize();   // 08 01 c0 a8 01 0a 00 00
     * @endcode
     */
    class Block : public CoreInterface<Block> {
        friend class CoreInterface<Block>;

        private:
            std::vector<Item> children_;
            // * Accessor table: normalized name -> child index, in registration order
            std::vector<std::pair<std::string, std::size_t> > accessors_;
            std::string type_;
            bool verbose_ = false;

            void build(const BlockTemplate& items, const BuildContext& context,
                span<const std::uint8_t> raw, const Scope& scope);

            std::string resolve_type(const ItemTemplate& tmpl, const BuildContext& context,
                const Scope& scope) const;

            std::optional<std::size_t> resolve_size(const std::string& target,
                const BuildContext& context, const Scope& scope) const;

            void register_accessors(std::size_t index);
            void rebuild_accessors();
            void collect_fields(std::vector<Field*>& out);
            void collect_fields(Scope& out) const;

        public:
            /**
             * @brief Construct an empty block
             */
            explicit Block(std::string name = "");

            /**
             * @brief Construct a block from its template
             *
             * @param tmpl Item template of the block (its type selects the block template)
             * @param context Registry, configuration, user values and mode
             * @param raw Bytes to parse (only used when context.parsing)
             * @param scope Fields built before this block, for dependencies
             * @throws ProgrammingException PBAD_TEMPLATE if tmpl describes a field
             * @throws ProgrammingException PUNRESOLVED_DEPENDENCY if a dependency has no association
             * @throws ProgrammingException PUNKNOWN_TYPE if the type has no template
             */
            Block(const ItemTemplate& tmpl, const BuildContext& context,
                span<const std::uint8_t> raw = {}, const Scope& scope = {});

            Block(const Block& other);
            Block(Block&& other) noexcept;
            Block& operator=(const Block& other);
            Block& operator=(Block&& other) noexcept;
            ~Block();

            /**
             * @brief Block template name this block was built from (empty for manual blocks)
             */
            const std::string& type() const { return type_; }

            const std::vector<Item>& children() const { return children_; }

            std::size_t child_count() const;

            // === Structure ===

            /**
             * @brief Append an item, register its accessors and update lengths
             */
            void append(Field field);
            void append(Block block);
            void append(Item item);
            void append(std::vector<Item> items);

            /**
             * @brief Remove the first item matching name (depth-first)
             * @throws ProgrammingException PNOT_FOUND if nothing matches
             */
            void remove(const std::string& name);

            /**
             * @brief Remove the first item matching name (depth-first)
             * @return true if an item was removed
             */
            bool erase(const std::string& name);

            // === Lookup ===

            /**
             * @brief Direct child registered under name
             * @return Pointer to the child, nullptr if not registered
             */
            Item* get(const std::string& name);
            const Item* get(const std::string& name) const;

            /**
             * @brief Registered accessor names, in registration order
             */
            std::vector<std::string> attributes() const;

            Field* find_field(const std::string& name);
            const Field* find_field(const std::string& name) const;
            Block* find_block(const std::string& name);
            const Block* find_block(const std::string& name) const;
            const BitField* find_bitfield(const std::string& name) const;

            /**
             * @brief All leaf fields, depth-first, after an update
             */
            std::vector<Field*> fields();

            /**
             * @brief All leaf fields, depth-first, without updating
             */
            std::vector<Field*> leaf_fields();

            /**
             * @brief All leaf fields, depth-first (read-only)
             */
            Scope flatten_fields() const;

            /**
             * @brief Current bytes of the children, without updating lengths
             */
            Bytes value() const;

        protected:
            // === CRTP Implementation ===

            /**
             * @brief Update child blocks, then length fields with the block size
             */
            void impl_update();

            Bytes impl_serialize() const;

            std::size_t impl_serialized_size() const;
    };

    /**
     * @brief A child of a block: either a Field or a nested Block
     */
    class Item {
        private:
            std::variant<Field, Block> node_;

        public:
            Item(Field field);
            Item(Block block);

            bool is_field() const { return std::holds_alternative<Field>(node_); }
            bool is_block() const { return std::holds_alternative<Block>(node_); }

            /**
             * @throws ProgrammingException PBAD_ARGUMENT if the item is not of that kind
             */
            Field& field();
            const Field& field() const;
            Block& block();
            const Block& block() const;

            Field* as_field() { return std::get_if<Field>(&node_); }
            const Field* as_field() const { return std::get_if<Field>(&node_); }
            Block* as_block() { return std::get_if<Block>(&node_); }
            const Block* as_block() const { return std::get_if<Block>(&node_); }

            const std::string& name() const;
            std::string property_name() const;

            /**
             * @brief Whether key names this item (or a bitfield of this field)
             */
            bool matches(const std::string& key) const;

            std::size_t serialized_size() const;

            /**
             * @brief Current bytes, without updating lengths
             */
            Bytes value() const;
    };

} // namespace protoframe
