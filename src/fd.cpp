#include <cerrno>
#include <utility>

#include <unistd.h>

#include "fd.hpp"

namespace xgear {
auto FileDescriptor::write(const void* const data, const size_t size) const -> bool {
    auto len = size_t(0);
    while(len < size) {
        const auto n = ::write(fd, static_cast<const char*>(data) + len, size - len);
        if(n == -1) {
            if(errno == EINTR) {
                continue;
            }
            return false;
        }
        len += n;
    }
    return true;
}
auto FileDescriptor::read(void* const data, const size_t size) const -> bool {
    auto len = size_t(0);
    while(len < size) {
        const auto n = ::read(fd, static_cast<char*>(data) + len, size - len);
        if(n == -1 && errno == EINTR) {
            continue;
        }
        if(n <= 0) {
            return false;
        }
        len += n;
    }
    return true;
}
auto FileDescriptor::read_some(void* const data, const size_t size) const -> ssize_t {
    while(true) {
        const auto n = ::read(fd, data, size);
        if(n == -1 && errno == EINTR) {
            continue;
        }
        return n;
    }
}
auto FileDescriptor::close() -> void {
    if(fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}
auto FileDescriptor::operator=(FileDescriptor&& o) -> FileDescriptor& {
    if(this != &o) {
        close();
        fd = std::exchange(o.fd, -1);
    }
    return *this;
}
FileDescriptor::FileDescriptor(FileDescriptor&& o) : fd(std::exchange(o.fd, -1)) {}
FileDescriptor::FileDescriptor(const int fd) : fd(fd) {}
FileDescriptor::~FileDescriptor() {
    close();
}
} // namespace xgear
