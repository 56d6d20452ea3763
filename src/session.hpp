#pragma once
#include <functional>

#include "connection.hpp"
#include "fd.hpp"
#include "transport.hpp"

namespace xgear {
class SocketTransport : public Transport {
  private:
    FileDescriptor fd;

  public:
    auto write(const uint8_t* data, size_t size) -> bool override;
    auto lose_connection() -> void override;
    auto get_fd() const -> const FileDescriptor&;

    SocketTransport(FileDescriptor fd);
};

// feeds the socket into the connection until `done` returns true or the connection is lost
// `done` is polled before every wait, returns false when the connection ended first
auto run_session(SocketTransport& transport, Connection& connection, const std::function<bool()>& done) -> bool;
} // namespace xgear
