#include <filesystem>
#include <string>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/socket.h>

#include <gtest/gtest.h>

#include "../src/session.hpp"

namespace xgear {
namespace {
auto make_socket_pair() -> std::pair<FileDescriptor, FileDescriptor> {
    int fds[2];
    if(socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) < 0) {
        return {};
    }
    return {FileDescriptor(fds[0]), FileDescriptor(fds[1])};
}
} // namespace

TEST(Session, EchoOverSocket) {
    auto [local, peer] = make_socket_pair();
    ASSERT_TRUE(local.is_valid());
    auto transport  = SocketTransport(std::move(local));
    auto connection = Connection(transport);
    const auto reply = connection.echo();

    auto request = Bytes(HEADER_LEN + 5);
    ASSERT_TRUE(peer.read(request.data(), request.size()));
    auto       decoder = FrameDecoder();
    const auto frames  = decoder.feed(request).frames;
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].command, Command::ECHO_REQ);

    const auto answer = encode_frame(Command::ECHO_RES, to_bytes("hello"), Magic::RESPONSE);
    ASSERT_TRUE(peer.write(answer.data(), answer.size()));
    EXPECT_TRUE(run_session(transport, connection, [&reply]() { return reply.is_settled(); }));
    ASSERT_TRUE(reply.is_resolved());
    EXPECT_EQ(to_string(reply.get_value()->payload), "hello");
}

TEST(Session, PeerCloseEndsSession) {
    auto [local, peer] = make_socket_pair();
    ASSERT_TRUE(local.is_valid());
    auto transport   = SocketTransport(std::move(local));
    auto connection  = Connection(transport);
    const auto reply = connection.send(Command::GRAB_JOB);

    peer.close();
    EXPECT_FALSE(run_session(transport, connection, []() { return false; }));
    EXPECT_FALSE(connection.is_connected());
    ASSERT_TRUE(reply.is_rejected());
    EXPECT_EQ(reply.get_error()->kind, ErrorKind::ConnectionLost);
}

TEST(Session, EpollDescriptorIsCloseOnExec) {
    auto [local, peer] = make_socket_pair();
    ASSERT_TRUE(local.is_valid());
    auto transport  = SocketTransport(std::move(local));
    auto connection = Connection(transport);

    auto checked = 0;
    auto inherit = 0;
    run_session(transport, connection, [&checked, &inherit]() {
        auto ec = std::error_code();
        for(const auto& entry : std::filesystem::directory_iterator("/proc/self/fd", ec)) {
            const auto target = std::filesystem::read_symlink(entry.path(), ec);
            if(ec || target != "anon_inode:[eventpoll]") {
                continue;
            }
            const auto fd    = std::stoi(entry.path().filename().string());
            const auto flags = fcntl(fd, F_GETFD);
            checked += 1;
            if(flags < 0 || (flags & FD_CLOEXEC) == 0) {
                inherit += 1;
            }
        }
        return true;
    });
    EXPECT_GT(checked, 0);
    EXPECT_EQ(inherit, 0);
}
} // namespace xgear
