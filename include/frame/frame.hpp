/**
 * @file frame.hpp
 * @author effibot (andrea.efficace1@gmail.com)
 * @brief Top-level protocol message: an ordered list of blocks
 * @version 1.0
 * @date 2025-11-18
 *
 * A Frame is built from the "frame" template of a SpecRegistry, usually a
 * header block followed by a body block whose type depends on a header
 * field. It is created empty, from a message type name, or by parsing
 * received bytes.
 *
 * @copyright Copyright (c) 2025
 *
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <boost/core/span.hpp>

#include "../interface/core.hpp"
#include "../pattern/engine_config.hpp"
#include "../pattern/spec_registry.hpp"
#include "../template/result.hpp"
#include "block.hpp"
#include "field.hpp"

using namespace boost;

namespace protoframe {

    /**
     * @brief Where a parsed frame came from
     */
    struct Source {
        std::string address;
        std::uint16_t port = 0;
    };

    /**
     * @brief Ordered blocks with a total length maintained on update
     *
     * The registry is referenced, not owned: it must outlive the frame.
     *
     * @code
     * SpecRegistry knx("specs/knxnet.json");
     * auto frame = Frame::from_type(knx, "DESCRIPTION REQUEST");
     * frame.serialize();  // 06 10 02 03 00 0e 08 01 00 00 00 00 00 00
     *
     * auto received = Frame::from_bytes(knx, datagram, Source{"192.168.1.10", 3671});
     * received.type_name();  // "DESCRIPTION RESPONSE"
     * @endcode
     */
    class Frame : public CoreInterface<Frame> {
        friend class CoreInterface<Frame>;

        private:
            const SpecRegistry* registry_;
            EngineConfig config_;
            std::vector<Block> blocks_;
            std::optional<Source> source_;

            // * Unbuilt frame, filled by build()
            Frame(const SpecRegistry* registry, const EngineConfig& config);

            void build(const BuildContext& context, span<const std::uint8_t> raw);

            Block& require_block(const std::string& name, const std::string& context);

        public:
            /**
             * @brief Construct an empty frame: template header, empty body
             */
            explicit Frame(const SpecRegistry& registry,
                const EngineConfig& config = EngineConfig::create_default());

            // === Factories ===

            /**
             * @brief Build a frame from a message type name
             *
             * @param registry Protocol specification
             * @param type Name (or key) in the code table of the schema type field,
             *             empty for an empty frame
             * @param overrides Field values by name; schema aliases map a short
             *                  name to a field and translate names through its code table
             * @param config Engine configuration
             * @throws ProgrammingException PNOT_FOUND if the type or an aliased value is unknown
             * @throws ProgrammingException on any template or dependency error
             */
            static Frame from_type(const SpecRegistry& registry, const std::string& type,
                const UserValues& overrides = {},
                const EngineConfig& config = EngineConfig::create_default());

            /**
             * @brief Build a frame from the wire code of a message type
             */
            static Frame from_type(const SpecRegistry& registry, const Bytes& type,
                const UserValues& overrides = {},
                const EngineConfig& config = EngineConfig::create_default());

            /**
             * @brief Parse received bytes
             *
             * Bytes left after the last template item are kept in a trailing
             * field of the last block.
             *
             * @throws ProgrammingException if a dependency cannot be resolved
             */
            static Frame from_bytes(const SpecRegistry& registry, span<const std::uint8_t> raw,
                const std::optional<Source>& source = std::nullopt,
                const EngineConfig& config = EngineConfig::create_default());

            static Result<Frame> try_from_type(const SpecRegistry& registry,
                const std::string& type, const UserValues& overrides = {},
                const EngineConfig& config = EngineConfig::create_default());

            static Result<Frame> try_from_bytes(const SpecRegistry& registry,
                span<const std::uint8_t> raw, const std::optional<Source>& source = std::nullopt,
                const EngineConfig& config = EngineConfig::create_default());

            // === Blocks ===

            const std::vector<Block>& blocks() const { return blocks_; }

            /**
             * @throws ProgrammingException PNOT_FOUND if the frame has no such block
             */
            Block& header();
            Block& body();

            Block* block(const std::string& name);
            const Block* block(const std::string& name) const;

            void append(Block block);

            /**
             * @brief Remove a block, or the first matching item of any block
             * @throws ProgrammingException PNOT_FOUND if nothing matches
             */
            void remove(const std::string& name);
            bool erase(const std::string& name);

            // === Fields ===

            /**
             * @brief All leaf fields in wire order, after an update
             */
            std::vector<Field*> fields();

            Field* find_field(const std::string& name);
            const Field* find_field(const std::string& name) const;

            /**
             * @brief Accessor names of every block, header first, after an update
             */
            std::vector<std::string> attributes();

            /**
             * @brief Name of the message type (code table value), hex if unknown
             */
            std::string type_name() const;

            Bytes value() const;

            // === Context ===

            const std::optional<Source>& source() const { return source_; }
            void set_source(const Source& source) { source_ = source; }
            const EngineConfig& config() const { return config_; }
            const SpecRegistry& registry() const { return *registry_; }

        protected:
            // === CRTP Implementation ===

            /**
             * @brief Update blocks last to first, then the total length field
             */
            void impl_update();

            Bytes impl_serialize() const {
                return value();
            }

            std::size_t impl_serialized_size() const;
    };

} // namespace protoframe
