/**
 * @file engine_config.hpp
 * @brief Configuration structure for the frame engine
 * @version 3.0
 * @date 2025-11-18
 *
 * Supports multiple configuration sources:
 * 1. JSON file parsing (config/engine_config.json) - Recommended
 * 2. Environment variables (PROTOFRAME_*)
 * 3. Programmatic defaults
 * 4. Direct construction
 *
 * Priority: Environment variables > JSON file > Defaults
 *
 * The configuration is passed explicitly to every frame, block and field
 * built by the engine. There is no process-wide state.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <string>
#include <cstdint>
#include <cstddef>
#include <optional>
#include <map>

#include <nlohmann/json.hpp>

#include "../enums/protocol.hpp"

namespace protoframe {

    /**
     * @brief Configuration for frame construction and parsing
     *
     * Environment Variables:
     *
     * - PROTOFRAME_BYTE_ORDER: Byte order for int/bytes conversions (big/little, default: big)
     *
     * - PROTOFRAME_BITFIELD_MODE: Bit field width checks (permissive/strict, default: permissive)
     *
     * - PROTOFRAME_INCLUDE_OPTIONAL: Build optional blocks from templates (true/false, default: false)
     *
     * - PROTOFRAME_VERBOSE: Log engine decisions to the console (true/false, default: false)
     *
     * - PROTOFRAME_SPEC_PATH: Specification file loaded by SpecRegistry::from_config (default: "")
     *
     * - PROTOFRAME_MAX_FIELD_SIZE: Largest field size in bytes (default: 65536)
     */
    struct EngineConfig {
        // === Encoding ===
        ByteOrder byte_order = ByteOrder::BIG;
        BitFieldMode bitfield_mode = BitFieldMode::PERMISSIVE;

        // === Construction ===
        bool include_optional = false;
        std::size_t max_field_size = 65536;

        // === Sources and Diagnostics ===
        std::string spec_path;
        bool verbose = false;

        /**
         * @brief Validate configuration
         * @throws std::invalid_argument if config is invalid
         */
        void validate() const;

        /**
         * @brief Create default configuration
         * @return EngineConfig with big endian, permissive bit fields
         */
        static EngineConfig create_default();

        /**
         * @brief Load configuration from JSON file
         * @param filepath Path to JSON file (e.g., engine_config.json)
         * @param use_defaults If true, merge with defaults; if false, only use JSON values
         * @return EngineConfig loaded from JSON file
         * @throws std::runtime_error if file cannot be read or parsed
         */
        static EngineConfig from_file(const std::string& filepath, bool use_defaults = true);

        /**
         * @brief Load configuration from JSON object
         * @param j JSON object containing engine_config
         * @return EngineConfig loaded from JSON
         * @throws std::invalid_argument if a value is not recognized
         */
        static EngineConfig from_json(const nlohmann::json& j);

        /**
         * @brief Load configuration with priority: env vars > JSON file > defaults
         * @param config_file_path Optional path to JSON config file
         * @return EngineConfig with merged settings
         */
        static EngineConfig load(const std::optional<std::string>& config_file_path = std::nullopt);

        private:
            /**
             * @brief Apply configuration from key-value map
             * @param config Configuration to update
             * @param vars Key-value pairs (PROTOFRAME_* keys)
             */
            static void apply_config_map(EngineConfig& config,
                const std::map<std::string, std::string>& vars);

            /**
             * @brief Get environment variable with optional default
             * @param name Variable name
             * @param default_val Default value if not set
             * @return Variable value or default
             */
            static std::string get_env(const std::string& name,
                const std::string& default_val = "");
    };

} // namespace protoframe
