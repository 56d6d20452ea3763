#include <cerrno>
#include <charconv>
#include <cstddef>
#include <cstdlib>
#include <cstring>

#include <netdb.h>
#include <sys/socket.h>
#include <sys/un.h>

#include "protocol.hpp"
#include "socket.hpp"

namespace xgear {
namespace {
auto create_local_socket() -> OpenSocketResult {
    const auto fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if(fd < 0) {
        return {-1, "socket() failed", errno};
    } else {
        return {fd};
    }
}
auto create_sockaddr_un(const std::string_view path) -> std::optional<sockaddr_un> {
    auto addr = sockaddr_un();
    memset(&addr, 0, sizeof(sockaddr_un));
    addr.sun_family = AF_UNIX;

    // path[0] may be '\0'
    if(path.size() >= sizeof(addr.sun_path)) {
        return std::nullopt;
    }
    memcpy(addr.sun_path, path.data(), path.size());

    return addr;
}
} // namespace
auto open_local_client_socket(const std::string_view name) -> OpenSocketResult {
    auto result = create_local_socket();
    if(result.message != nullptr) {
        return result;
    }

    const auto addr = create_sockaddr_un(name);
    if(!addr.has_value()) {
        return {-1, "socket path too long", ENAMETOOLONG};
    }
    const auto len = static_cast<socklen_t>(offsetof(sockaddr_un, sun_path) + name.size());
    if(connect(result.fd, (const sockaddr*)&*addr, len) < 0) {
        return {-1, "connect() failed", errno};
    } else {
        return result;
    }
}
auto open_tcp_client_socket(const char* const host, const uint16_t port) -> OpenSocketResult {
    auto hints        = addrinfo();
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    const auto service = std::to_string(port);
    auto       list    = (addrinfo*)nullptr;
    if(getaddrinfo(host, service.data(), &hints, &list) != 0) {
        return {-1, "getaddrinfo() failed", errno};
    }

    auto result = OpenSocketResult{-1, "connect() failed", 0};
    for(auto ai = list; ai != nullptr; ai = ai->ai_next) {
        auto fd = FileDescriptor(socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol));
        if(!fd.is_valid()) {
            result.error = errno;
            continue;
        }
        if(connect(fd, ai->ai_addr, ai->ai_addrlen) < 0) {
            result.error = errno;
            continue;
        }
        result = {std::move(fd)};
        break;
    }
    freeaddrinfo(list);
    return result;
}
auto parse_server_address(const std::string_view str) -> std::optional<ServerAddress> {
    if(str.empty()) {
        return std::nullopt;
    }
    if(str[0] == '@') {
        return ServerAddress{std::string(str), 0};
    }
    const auto p = str.rfind(':');
    if(p == std::string_view::npos) {
        return ServerAddress{std::string(str), DEFAULT_PORT};
    }
    const auto host = str.substr(0, p);
    const auto port = str.substr(p + 1);
    auto       n    = uint16_t();
    if(const auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), n); ec != std::errc() || ptr != port.data() + port.size() || host.empty()) {
        return std::nullopt;
    }
    return ServerAddress{std::string(host), n};
}
auto open_server_connection(const ServerAddress& address) -> OpenSocketResult {
    if(!address.host.empty() && address.host[0] == '@') {
        // abstract namespace
        auto name = address.host;
        name[0]   = '\0';
        return open_local_client_socket(name);
    }
    return open_tcp_client_socket(address.host.data(), address.port);
}
auto search_server_address() -> std::string {
    const auto env = getenv("XGEAR_SERVER");
    return env != NULL ? std::string(env) : std::string("127.0.0.1");
}
} // namespace xgear
