#include <cstddef>
#include <cstring>
#include <string>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include "../src/protocol.hpp"
#include "../src/socket.hpp"

namespace xgear {
namespace {
auto is_close_on_exec(const int fd) -> bool {
    const auto flags = fcntl(fd, F_GETFD);
    return flags >= 0 && (flags & FD_CLOEXEC) != 0;
}
} // namespace

TEST(ServerAddress, HostOnlyUsesDefaultPort) {
    const auto a = parse_server_address("example.org");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->host, "example.org");
    EXPECT_EQ(a->port, DEFAULT_PORT);
}

TEST(ServerAddress, HostAndPort) {
    const auto a = parse_server_address("10.0.0.1:4731");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->host, "10.0.0.1");
    EXPECT_EQ(a->port, 4731);
}

TEST(ServerAddress, AbstractSocketName) {
    const auto a = parse_server_address("@gearman");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->host, "@gearman");
}

TEST(ServerAddress, RejectsBadInput) {
    EXPECT_FALSE(parse_server_address("").has_value());
    EXPECT_FALSE(parse_server_address(":4730").has_value());
    EXPECT_FALSE(parse_server_address("host:port").has_value());
    EXPECT_FALSE(parse_server_address("host:99999").has_value());
}

TEST(ServerConnection, LocalSocketIsCloseOnExec) {
    const auto name     = "xgear-socket-test-" + std::to_string(getpid());
    const auto path     = std::string(1, '\0') + name;
    const auto listener = FileDescriptor(socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
    ASSERT_TRUE(listener.is_valid());
    auto addr       = sockaddr_un();
    addr.sun_family = AF_UNIX;
    memcpy(addr.sun_path, path.data(), path.size());
    const auto len = static_cast<socklen_t>(offsetof(sockaddr_un, sun_path) + path.size());
    ASSERT_EQ(bind(listener, (const sockaddr*)&addr, len), 0);
    ASSERT_EQ(listen(listener, 1), 0);

    const auto address = parse_server_address("@" + name);
    ASSERT_TRUE(address.has_value());
    const auto opened = open_server_connection(*address);
    ASSERT_EQ(opened.message, nullptr);
    EXPECT_TRUE(is_close_on_exec(opened.fd));
}

TEST(ServerConnection, TcpSocketIsCloseOnExec) {
    const auto listener = FileDescriptor(socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
    ASSERT_TRUE(listener.is_valid());
    auto addr            = sockaddr_in();
    addr.sin_family      = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port        = 0;
    ASSERT_EQ(bind(listener, (const sockaddr*)&addr, sizeof(addr)), 0);
    ASSERT_EQ(listen(listener, 1), 0);
    auto len = socklen_t(sizeof(addr));
    ASSERT_EQ(getsockname(listener, (sockaddr*)&addr, &len), 0);

    const auto opened = open_tcp_client_socket("127.0.0.1", ntohs(addr.sin_port));
    ASSERT_EQ(opened.message, nullptr);
    EXPECT_TRUE(is_close_on_exec(opened.fd));
}
} // namespace xgear
