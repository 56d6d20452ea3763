#pragma once
#include <vector>

#include "byte.hpp"
#include "protocol.hpp"

namespace xgear {
struct Frame {
    Magic   magic = Magic::RESPONSE;
    Command command;
    Bytes   payload;

    auto is_response() const -> bool {
        return magic == Magic::RESPONSE;
    }
};

auto encode_frame(Command command, const Bytes& payload, Magic magic = Magic::REQUEST) -> Bytes;

struct FeedResult {
    std::vector<Frame> frames;
    const char*        message = nullptr;
};

// incremental decoder, partial frames are kept until the rest arrives
class FrameDecoder {
  private:
    enum class State {
        AwaitingHeader,
        AwaitingBody,
        Broken,
    };

    Bytes  buffer;
    State  state = State::AwaitingHeader;
    Frame  current;
    size_t body_len = 0;

  public:
    // returns every frame completed by this chunk in arrival order
    // message is set on a framing error, the decoder refuses further input after that
    auto feed(const uint8_t* data, size_t size) -> FeedResult;
    auto feed(const Bytes& data) -> FeedResult;
    auto get_buffered() const -> size_t;
    auto reset() -> void;
};
} // namespace xgear
