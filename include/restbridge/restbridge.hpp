// This is the single entry point for the RestBridge library.
// Include this file to get access to the core public API.

#pragma once

// Core application
#include "restbridge/core/app.hpp"

// Core data types
#include "restbridge/core/types.hpp"
#include "restbridge/core/http/http_message.hpp"
#include "restbridge/core/util/error_types.hpp"
#include "restbridge/core/util/logger.hpp"

// Service description and handlers
#include "restbridge/core/service/type_descriptor.hpp"
#include "restbridge/core/service/service_descriptor.hpp"
#include "restbridge/core/rpc/handler_registry.hpp"
#include "restbridge/core/rpc/argument_binder.hpp"

// Public interfaces for extension
#include "restbridge/core/interfaces/icodec.hpp"
#include "restbridge/core/interfaces/itransport.hpp"
#include "restbridge/core/codec/json_codec.hpp"
