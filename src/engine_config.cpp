/**
 * @file engine_config.cpp
 * @brief Engine configuration implementation
 * @version 1.0
 * @date 2025-11-18
 */

#include <cstdlib>
#include <fstream>
#include <algorithm>
#include <cctype>
#include <array>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "../include/pattern/engine_config.hpp"

using json = nlohmann::json;

namespace protoframe {

    namespace {
        constexpr std::size_t MAX_FIELD_SIZE_LIMIT = 16 * 1024 * 1024;

        const std::array<const char*, 6> ENV_KEYS = {
            "PROTOFRAME_BYTE_ORDER",
            "PROTOFRAME_BITFIELD_MODE",
            "PROTOFRAME_INCLUDE_OPTIONAL",
            "PROTOFRAME_VERBOSE",
            "PROTOFRAME_SPEC_PATH",
            "PROTOFRAME_MAX_FIELD_SIZE",
        };

        std::string lowercase(std::string text) {
            std::transform(text.begin(), text.end(), text.begin(), ::tolower);
            return text;
        }

        bool parse_flag(const std::string& text) {
            std::string flag = lowercase(text);
            return flag == "true" || flag == "1" || flag == "yes";
        }
    }

    // === Configuration Validation ===

    void EngineConfig::validate() const {
        if (byte_order != ByteOrder::BIG && byte_order != ByteOrder::LITTLE) {
            throw std::invalid_argument("Byte order is either 'big' or 'little'");
        }
        if (bitfield_mode != BitFieldMode::PERMISSIVE && bitfield_mode != BitFieldMode::STRICT) {
            throw std::invalid_argument("Bit field mode is either 'permissive' or 'strict'");
        }

        // Existence of spec_path is checked when the registry loads it.

        if (max_field_size == 0) {
            throw std::invalid_argument("Max field size must be > 0");
        }
        if (max_field_size > MAX_FIELD_SIZE_LIMIT) {
            throw std::invalid_argument("Max field size too large (max 16 MiB)");
        }
    }

    // === Factory Methods ===

    EngineConfig EngineConfig::create_default() {
        EngineConfig config;
        config.byte_order = ByteOrder::BIG;
        config.bitfield_mode = BitFieldMode::PERMISSIVE;
        config.include_optional = false;
        config.max_field_size = 65536;
        config.spec_path = "";
        config.verbose = false;
        return config;
    }

    // === Environment Variable Helpers ===

    std::string EngineConfig::get_env(const std::string& name, const std::string& default_val) {
        const char* val = std::getenv(name.c_str());
        return val ? std::string(val) : default_val;
    }

    // === JSON File Parsing ===

    EngineConfig EngineConfig::from_json(const json& j) {
        EngineConfig config = create_default();

        // Convert JSON to string map to reuse apply_config_map logic
        std::map<std::string, std::string> config_map;

        if (j.contains("engine_config")) {
            const auto& ec = j["engine_config"];

            if (ec.contains("byte_order")) {
                config_map["PROTOFRAME_BYTE_ORDER"] = ec["byte_order"].get<std::string>();
            }
            if (ec.contains("bitfield_mode")) {
                config_map["PROTOFRAME_BITFIELD_MODE"] = ec["bitfield_mode"].get<std::string>();
            }
            if (ec.contains("include_optional")) {
                config_map["PROTOFRAME_INCLUDE_OPTIONAL"] =
                    ec["include_optional"].get<bool>() ? "true" : "false";
            }
            if (ec.contains("verbose")) {
                config_map["PROTOFRAME_VERBOSE"] = ec["verbose"].get<bool>() ? "true" : "false";
            }
            if (ec.contains("spec_path")) {
                config_map["PROTOFRAME_SPEC_PATH"] = ec["spec_path"].get<std::string>();
            }
            if (ec.contains("max_field_size")) {
                config_map["PROTOFRAME_MAX_FIELD_SIZE"] =
                    std::to_string(ec["max_field_size"].get<std::size_t>());
            }
        }

        apply_config_map(config, config_map);

        return config;
    }

    // === Configuration Application ===

    void EngineConfig::apply_config_map(EngineConfig& config,
        const std::map<std::string, std::string>& vars) {
        auto get_val = [&vars](const std::string& key) -> std::optional<std::string> {
                auto it = vars.find(key);
                if (it != vars.end()) {
                    return it->second;
                }
                return std::nullopt;
            };

        if (auto val = get_val("PROTOFRAME_BYTE_ORDER")) {
            bool use_default = false;
            config.byte_order = byteorder_from_string(lowercase(*val), use_default);
            if (use_default) {
                throw std::invalid_argument("Invalid byte order: " + *val);
            }
        }

        if (auto val = get_val("PROTOFRAME_BITFIELD_MODE")) {
            bool use_default = false;
            config.bitfield_mode = bitfieldmode_from_string(lowercase(*val), use_default);
            if (use_default) {
                throw std::invalid_argument("Invalid bit field mode: " + *val);
            }
        }

        if (auto val = get_val("PROTOFRAME_INCLUDE_OPTIONAL")) {
            config.include_optional = parse_flag(*val);
        }
        if (auto val = get_val("PROTOFRAME_VERBOSE")) {
            config.verbose = parse_flag(*val);
        }
        if (auto val = get_val("PROTOFRAME_SPEC_PATH")) {
            config.spec_path = *val;
        }

        if (auto val = get_val("PROTOFRAME_MAX_FIELD_SIZE")) {
            try {
                config.max_field_size = std::stoul(*val, nullptr, 0);  // Support hex (0x...)
            } catch (const std::logic_error&) {
                throw std::invalid_argument("Invalid max field size: " + *val);
            }
        }
    }

    // === Load Methods ===

    EngineConfig EngineConfig::from_file(const std::string& filepath, bool use_defaults) {
        EngineConfig config = use_defaults ? create_default() : EngineConfig{};

        std::ifstream file(filepath);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open JSON config file: " + filepath);
        }

        try {
            json j;
            file >> j;
            config = from_json(j);
        } catch (const json::exception& e) {
            throw std::runtime_error("JSON parse error in " + filepath + ": " + e.what());
        }

        return config;
    }

    EngineConfig EngineConfig::load(const std::optional<std::string>& config_file_path) {
        EngineConfig config = create_default();

        // A missing file is not an error here, defaults apply
        if (config_file_path.has_value()) {
            std::ifstream file(*config_file_path);
            if (file.is_open()) {
                try {
                    json j;
                    file >> j;
                    config = from_json(j);
                } catch (const json::exception& e) {
                    throw std::runtime_error("JSON parse error in " + *config_file_path + ": " +
                        e.what());
                }
            }
        }

        // Environment variables have the highest priority
        std::map<std::string, std::string> env_vars;
        for (const char* key : ENV_KEYS) {
            std::string val = get_env(key);
            if (!val.empty()) {
                env_vars[key] = val;
            }
        }

        if (!env_vars.empty()) {
            apply_config_map(config, env_vars);
        }

        return config;
    }

} // namespace protoframe
