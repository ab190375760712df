/**
 * @file spec_registry.hpp
 * @author effibot (andrea.efficace1@gmail.com)
 * @brief Protocol specification parser and template store
 * @version 0.2
 * @date 2025-11-18
 *
 * @copyright Copyright (c) 2025
 *
 */

#pragma once

#include <nlohmann/json.hpp>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "../enums/protocol.hpp"
#include "../frame/field_value.hpp"
#include "../template/result.hpp"
#include "engine_config.hpp"

namespace protoframe {

    /**
     * @brief Template of a single item (field or block) of a block
     *
     * Specification file form:
     * @code
     * {"name": "total length", "type": "field", "size": 2, "is_length": true}
     * {"name": "number of elements, start index", "type": "field", "size": 2, "bitsizes": [4, 12]}
     * {"name": "endpoint url", "type": "field", "size": "depends:endpoint url length"}
     * {"name": "control endpoint", "type": "HPAI"}
     * {"name": "body", "type": "depends:service identifier"}
     * @endcode
     */
    struct ItemTemplate {
        std::string name;
        std::string type;   // "field", a block type, "depends:<field>", or empty for a generic block
        std::optional<std::size_t> size;
        std::optional<std::string> size_depends;    // normalized field name
        std::optional<FieldValue> default_value;
        std::optional<FieldValue> value;
        bool is_length = false;
        bool fixed_size = false;
        bool fixed_value = false;
        bool optional = false;
        std::vector<std::size_t> bitsizes;

        bool is_field() const {
            return type == keys::FIELD;
        }

        bool is_block() const {
            return !is_field();
        }

        /**
         * @brief Normalized field name this block type depends on, if any
         */
        std::optional<std::string> depends_on() const {
            return NameHelper::depends_target(type);
        }

        /**
         * @brief Parse an item template
         * @param j JSON object
         * @param context Owning block name, for error messages
         * @throws ProgrammingException if the item is malformed
         */
        static ItemTemplate from_json(const nlohmann::json& j, const std::string& context);
    };

    using BlockTemplate = std::vector<ItemTemplate>;

    /**
     * @brief Frame level conventions of a protocol
     *
     * Specification file form:
     * @code
     * "schema": {
     *     "type_field": "service identifier",
     *     "total_length_field": "total length",
     *     "length_prefixed": true,
     *     "aliases": {"type": "service identifier", "cemi": "message code"}
     * }
     * @endcode
     */
    struct FrameSchema {
        std::string header = "header";
        std::string body = "body";
        std::string type_field = "service identifier";
        std::string total_length_field = "total length";
        // * Structures starting with a one-byte length field only own that many bytes
        bool length_prefixed = false;
        // * Friendly argument name -> field name, both normalized
        std::map<std::string, std::string> aliases;

        static FrameSchema from_json(const nlohmann::json& j);
    };

    /**
     * @brief Protocol specification registry
     *
     * Holds the templates and code tables read from one or more JSON
     * specification files:
     * @code
     * {
     *     "schema": {...},
     *     "frame": [{"name": "header", "type": "HEADER"}, ...],
     *     "blocks": {"HEADER": [...], "HPAI": [...]},
     *     "codes": {"service identifier": {"0203": "DESCRIPTION REQUEST"}}
     * }
     * @endcode
     *
     * The registry is read-only once loaded and is passed by const
     * reference to every frame and block built from it. It must outlive
     * the frames built from it. Lookups are insensitive to case, spaces
     * and punctuation (see NameHelper::to_property).
     *
     * @note No control on the correctness of the protocol itself is done.
     */
    class SpecRegistry {
        public:
            // * Code table entries in file order: (wire key, symbolic name)
            using CodeTable = std::vector<std::pair<std::string, std::string> >;

            /**
             * @brief Construct an empty registry
             */
            SpecRegistry() = default;

            /**
             * @brief Construct a registry from a specification file
             * @param json_path Path to the JSON specification file
             * @throws LibraryException if the file cannot be opened or parsed
             * @throws ProgrammingException if a template is malformed
             */
            explicit SpecRegistry(const std::string& json_path);

            /**
             * @brief Construct a registry from the file named by a configuration
             * @throws LibraryException if config.spec_path is empty or unusable
             */
            static SpecRegistry from_config(const EngineConfig& config);

            /**
             * @brief Non-throwing load
             * @return Result holding the registry, or the failure status and context
             */
            static Result<SpecRegistry> try_load(const std::string& json_path);

            /**
             * @brief Load a specification file, adding to the current content
             *
             * On failure the registry is left unchanged.
             *
             * @throws LibraryException if the file cannot be opened or parsed
             * @throws ProgrammingException if a template is malformed
             */
            void load(const std::string& json_path);

            /**
             * @brief Load an already parsed specification, adding to the current content
             * @throws LibraryException if the document is not a JSON object
             * @throws ProgrammingException if a template is malformed
             */
            void load_json(const nlohmann::json& j);

            /**
             * @brief Remove all loaded content
             */
            void clear();

            // === Lookups ===

            const std::vector<ItemTemplate>& frame_template() const { return frame_; }

            const FrameSchema& schema() const { return schema_; }

            /**
             * @brief Get a block template by type name
             * @return Template, or nullptr if unknown
             */
            const BlockTemplate* get_block_template(const std::string& name) const;

            /**
             * @brief Get an item template from a block type and an item name
             * @return Template, or nullptr if unknown
             */
            const ItemTemplate* get_item_template(const std::string& block_name,
                const std::string& item_name) const;

            /**
             * @brief Get the symbolic name associated to an identifier given as text
             *
             * Matches table keys first, then symbolic names.
             *
             * @param table Code table name (e.g. "service identifier")
             * @param identifier Key or symbolic name
             * @return Symbolic name, or nullopt
             */
            std::optional<std::string> code_value(const std::string& table,
                const std::string& identifier) const;

            /**
             * @brief Get the symbolic name associated to a wire code
             *
             * Keys are compared as hex digits when they are valid hex, as
             * UTF-8 text otherwise.
             *
             * @param table Code table name
             * @param identifier Wire bytes (e.g. {0x02, 0x03})
             * @return Symbolic name, or nullopt
             */
            std::optional<std::string> code_value(const std::string& table,
                const Bytes& identifier) const;

            /**
             * @brief Get the wire code of a symbolic name (or of a key given as text)
             * @return Wire bytes, or nullopt
             */
            std::optional<Bytes> code_key(const std::string& table, const std::string& name) const;

            bool has_block(const std::string& name) const;

            bool has_code_table(const std::string& table) const;

            /**
             * @brief Normalized names of all block templates
             */
            std::vector<std::string> block_names() const;

        private:
            std::vector<ItemTemplate> frame_;
            std::map<std::string, BlockTemplate> blocks_;   // keyed by normalized name
            std::map<std::string, CodeTable> codes_;        // keyed by normalized table name
            FrameSchema schema_;

            const CodeTable* find_table(const std::string& table) const;

            /**
             * @brief Parse a list of item templates (or a single item)
             * @throws ProgrammingException if an item is malformed
             */
            static BlockTemplate parse_items(const nlohmann::json& j, const std::string& context);
    };

} // namespace protoframe
