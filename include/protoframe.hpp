/**
 * @file protoframe.hpp
 * @author effibot (andrea.efficace1@gmail.com)
 * @brief Header file to facilitate the inclusion of the protoframe library
 * @version 1.0
 * @date 2025-11-18
 *
 * @copyright Copyright (c) 2025
 *
 */

#pragma once

// Include the protocol enums and status codes
#include "enums/protocol.hpp"
#include "enums/error.hpp"
// Include exception hierarchy
#include "exception/protoframe_exception.hpp"
// Include the result type
#include "template/result.hpp"
// Include the node interfaces
#include "interface/core.hpp"
#include "interface/serialization_helpers.hpp"
// Include the configuration and the specification registry
#include "pattern/engine_config.hpp"
#include "pattern/spec_registry.hpp"
// Include the frame nodes
#include "frame/field_value.hpp"
#include "frame/bitfield.hpp"
#include "frame/field.hpp"
#include "frame/block.hpp"
#include "frame/frame.hpp"
