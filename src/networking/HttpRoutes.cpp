#include "networking/HttpRoutes.h"

#include "protocol/Messages.h"

namespace nexus::networking {

HttpReply route_http(std::string_view method, std::string_view target, const room::Room& room) {
    const std::string_view path = target.substr(0, target.find('?'));

    if (path != "/health" && path != "/room") return {404, R"({"error":"not found"})"};
    if (method != "GET") return {405, R"({"error":"method not allowed"})"};

    if (path == "/health") return {200, protocol::health_body(protocol::wall_clock_ms())};
    return {200, protocol::room_body(room)};
}

} // namespace nexus::networking
