#pragma once

#include "networking/WebSocketServer.h"
#include "room/Room.h"

#include <string_view>

namespace nexus::networking {

// GET /health and GET /room; everything else is 404 (405 for other methods
// on a known path).
HttpReply route_http(std::string_view method, std::string_view target, const room::Room& room);

} // namespace nexus::networking
