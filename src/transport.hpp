#pragma once
#include <cstddef>
#include <cstdint>

namespace xgear {
// duplex byte channel under a Connection
// received bytes and closure are reported by whoever drives the transport
class Transport {
  public:
    virtual auto write(const uint8_t* data, size_t size) -> bool = 0;
    virtual auto lose_connection() -> void                       = 0;

    virtual ~Transport() = default;
};
} // namespace xgear
