#pragma once

/// Umbrella header for the toolwire server library.
#include "version.hpp"
#include "error.hpp"
#include "json_rpc.hpp"
#include "types.hpp"
#include "codec.hpp"
#include "framer.hpp"
#include "schema.hpp"
#include "request_context.hpp"
#include "registry.hpp"
#include "router.hpp"
#include "session.hpp"
#include "outbound_writer.hpp"
#include "dispatcher.hpp"
#include "server.hpp"
#include "settings.hpp"
#include "logging.hpp"
#include "transport/transport.hpp"
#include "transport/stream_transport.hpp"
