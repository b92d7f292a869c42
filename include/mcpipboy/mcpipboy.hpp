#pragma once

/// Umbrella header for the mcpipboy tool server library.

#include "version.hpp"
#include "error.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "schema.hpp"
#include "clock.hpp"
#include "tool.hpp"
#include "registry.hpp"
#include "dispatcher.hpp"
#include "session.hpp"
#include "router.hpp"
#include "server.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "cli.hpp"
#include "tools/builtin_tools.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
