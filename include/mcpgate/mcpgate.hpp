#pragma once

/// Umbrella header for the mcpgate session library.

#include "version.hpp"
#include "error.hpp"
#include "log.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "methods.hpp"
#include "uri_template.hpp"
#include "handlers.hpp"
#include "registry.hpp"
#include "dispatcher.hpp"
#include "notifier.hpp"
#include "session.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
