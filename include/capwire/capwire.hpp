#pragma once

/// Umbrella header for the capwire capability-RPC library.

#include "version.hpp"
#include "error.hpp"
#include "log.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "correlator.hpp"
#include "schema.hpp"
#include "registry.hpp"
#include "authorization.hpp"
#include "middleware.hpp"
#include "monitoring.hpp"
#include "dispatcher.hpp"
#include "worker_pool.hpp"
#include "session.hpp"
#include "server.hpp"
#include "client.hpp"
#include "transport/transport.hpp"
#include "transport/stream_transport.hpp"
#include "transport/http_transport.hpp"
#include "transport/websocket_transport.hpp"
