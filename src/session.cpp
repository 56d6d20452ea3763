#include <cerrno>
#include <cstring>

#include <sys/epoll.h>
#include <sys/socket.h>

#include "error.hpp"
#include "session.hpp"

namespace xgear {
auto SocketTransport::write(const uint8_t* const data, const size_t size) -> bool {
    if(!fd.is_valid()) {
        return false;
    }
    auto len = size_t(0);
    while(len < size) {
        const auto n = send(fd, data + len, size - len, MSG_NOSIGNAL);
        if(n == -1) {
            if(errno == EINTR) {
                continue;
            }
            warn("send() failed: ", strerror(errno));
            return false;
        }
        len += n;
    }
    return true;
}
auto SocketTransport::lose_connection() -> void {
    if(fd.is_valid()) {
        shutdown(fd, SHUT_RDWR);
    }
}
auto SocketTransport::get_fd() const -> const FileDescriptor& {
    return fd;
}
SocketTransport::SocketTransport(FileDescriptor fd) : fd(std::move(fd)) {}

auto run_session(SocketTransport& transport, Connection& connection, const std::function<bool()>& done) -> bool {
    const auto epfd = FileDescriptor(epoll_create1(EPOLL_CLOEXEC));
    if(!epfd.is_valid()) {
        warn("epoll_create1() failed: ", strerror(errno));
        connection.on_connection_lost("epoll_create1() failed");
        return false;
    }
    auto evset = epoll_event{.events = EPOLLIN | EPOLLRDHUP};
    evset.data.fd = transport.get_fd();
    if(epoll_ctl(epfd, EPOLL_CTL_ADD, transport.get_fd(), &evset) < 0) {
        warn("epoll_ctl() failed: ", strerror(errno));
        connection.on_connection_lost("epoll_ctl() failed");
        return false;
    }

    // main loop
    auto ev = epoll_event();
    while(true) {
        if(done()) {
            return true;
        }
        if(!connection.is_connected()) {
            return false;
        }
        if(const auto n = epoll_wait(epfd, &ev, 1, -1); n < 0) {
            if(errno == EINTR) {
                continue;
            }
            warn("epoll_wait() failed: ", strerror(errno));
            connection.on_connection_lost("epoll_wait() failed");
            return false;
        }
        if(ev.events & EPOLLIN) {
            uint8_t    buf[4096];
            const auto n = transport.get_fd().read_some(buf, sizeof(buf));
            if(n > 0) {
                connection.on_data_received(buf, static_cast<size_t>(n));
                continue;
            }
            connection.on_connection_lost(n == 0 ? "closed by server" : strerror(errno));
            return done();
        }
        if(ev.events & (EPOLLHUP | EPOLLERR | EPOLLRDHUP)) {
            connection.on_connection_lost("connection closed");
            return done();
        }
    }
}
} // namespace xgear
