#pragma once
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <arpa/inet.h>

namespace xgear {
using Bytes = std::vector<uint8_t>;

inline auto append_bytes(Bytes& data, const void* const copy, const size_t len) -> void {
    if(len == 0) {
        return;
    }
    const auto prev_size = data.size();
    data.resize(prev_size + len);
    std::memcpy(&data[prev_size], copy, len);
}
inline auto append_bytes(Bytes& data, const std::string_view str) -> void {
    append_bytes(data, str.data(), str.size());
}
inline auto append_u32(Bytes& data, const uint32_t value) -> void {
    const auto be = htonl(value);
    append_bytes(data, &be, sizeof(be));
}
inline auto append_nul(Bytes& data) -> void {
    data.push_back('\0');
}

inline auto to_bytes(const std::string_view str) -> Bytes {
    return Bytes(str.begin(), str.end());
}
inline auto to_string(const Bytes& data) -> std::string {
    return std::string(data.begin(), data.end());
}

inline auto read_u32(const uint8_t* const ptr) -> uint32_t {
    auto be = uint32_t();
    std::memcpy(&be, ptr, sizeof(be));
    return ntohl(be);
}

// splits '\0' separated fields
class ByteReader {
  private:
    const uint8_t* data;
    size_t         pos = 0;
    size_t         lim;

  public:
    auto read_until(const char c) -> std::optional<std::string> {
        for(auto p = pos; p < lim; p += 1) {
            if(data[p] == static_cast<uint8_t>(c)) {
                auto r = std::string(reinterpret_cast<const char*>(data + pos), p - pos);
                pos    = p + 1;
                return r;
            }
        }
        return std::nullopt;
    }
    auto read_rest() -> std::string {
        auto r = std::string(reinterpret_cast<const char*>(data + pos), lim - pos);
        pos    = lim;
        return r;
    }
    auto is_end() const -> bool {
        return pos >= lim;
    }
    ByteReader(const Bytes& data) : data(data.data()), lim(data.size()){};
    ByteReader(const uint8_t* data, const size_t limit) : data(data), lim(limit) {}
};
} // namespace xgear
