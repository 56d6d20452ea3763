#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "fd.hpp"

namespace xgear {
struct OpenSocketResult {
    FileDescriptor fd;
    const char*    message = nullptr;
    int            error   = 0;
};
// name may start with '\0' for the abstract namespace
auto open_local_client_socket(std::string_view name) -> OpenSocketResult;
auto open_tcp_client_socket(const char* host, uint16_t port) -> OpenSocketResult;

struct ServerAddress {
    std::string host;
    uint16_t    port;
};
// "host", "host:port" or "@name" for a local socket, port defaults to 4730
auto parse_server_address(std::string_view str) -> std::optional<ServerAddress>;
auto open_server_connection(const ServerAddress& address) -> OpenSocketResult;
auto search_server_address() -> std::string;
} // namespace xgear
