#pragma once
#include <cstddef>
#include <optional>

#include <sys/types.h>

namespace xgear {
class FileDescriptor {
  private:
    int fd = -1;

  public:
    auto write(const void* data, size_t size) const -> bool;
    auto read(void* data, size_t size) const -> bool;
    // one read(2), 0 on end of stream, -1 on error
    auto read_some(void* data, size_t size) const -> ssize_t;
    auto close() -> void;
    auto as_handle() const -> int {
        return fd;
    }
    auto is_valid() const -> bool {
        return fd >= 0;
    }
    operator int() const {
        return fd;
    }

    template <class T>
    auto write(const T& data) const -> bool {
        return write(&data, sizeof(T));
    }
    template <class T>
    auto read() const -> std::optional<T> {
        auto r = T();
        return read(&r, sizeof(T)) ? std::optional<T>(r) : std::nullopt;
    }

    auto operator=(FileDescriptor&& o) -> FileDescriptor&;
    FileDescriptor(FileDescriptor&& o);
    FileDescriptor(const FileDescriptor&) = delete;
    auto operator=(const FileDescriptor&) -> FileDescriptor& = delete;
    FileDescriptor(int fd = -1);
    ~FileDescriptor();
};
} // namespace xgear
