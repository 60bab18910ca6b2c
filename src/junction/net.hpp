#pragma once

/**
 * @defgroup junction-net Networking
 * @ingroup junction
 *
 * Request/response messaging over a single websocket connection:
 * + `Envelope` the message, encoded as json (text frames) or bson (binary frames)
 * + `RouteTrie` handlers for inbound requests, addressed by dot-separated keys
 * + `RpcDispatcher` routes inbound envelopes, and matches replies to outstanding requests
 * + `RpcClient` a dispatcher wired to a websocket connection
 */

#include "junction/net/buffer.hpp"
#include "junction/net/transport.hpp"

#include "junction/net/rpc/envelope-codec.hpp"
#include "junction/net/rpc/envelope.hpp"
#include "junction/net/rpc/route-trie.hpp"
#include "junction/net/rpc/rpc-client.hpp"
#include "junction/net/rpc/rpc-dispatcher.hpp"
#include "junction/net/rpc/rpc-handler.hpp"
#include "junction/net/rpc/status.hpp"

#include "junction/net/websockets/connection-url.hpp"
#include "junction/net/websockets/websocket-transport.hpp"
