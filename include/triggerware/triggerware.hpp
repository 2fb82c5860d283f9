#pragma once

/// Umbrella header for the triggerware client library.

#include "version.hpp"
#include "error.hpp"
#include "log.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "frame_parser.hpp"
#include "correlation_table.hpp"
#include "dispatch_table.hpp"
#include "name_allocator.hpp"
#include "connection.hpp"
#include "client.hpp"
#include "result_set.hpp"
#include "queries.hpp"
#include "polled_query.hpp"
#include "subscription.hpp"
#include "transport/transport.hpp"
#include "transport/socket_transport.hpp"
