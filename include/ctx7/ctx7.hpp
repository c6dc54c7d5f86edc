#pragma once

/// Umbrella header for the ctx7 documentation tool server.

#include "version.hpp"
#include "error.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "router.hpp"
#include "server.hpp"
#include "config.hpp"
#include "environment.hpp"
#include "validation.hpp"
#include "docs_client.hpp"
#include "event_logger.hpp"
#include "tool_handlers.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
#include "transport/http_transport.hpp"
#include "transport_manager.hpp"
#include "supervisor.hpp"
