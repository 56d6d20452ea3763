#include <algorithm>

#include "frame.hpp"

namespace xgear {
namespace {
auto parse_magic(const uint8_t* const ptr) -> std::optional<Magic> {
    if(std::equal(REQUEST_MAGIC.begin(), REQUEST_MAGIC.end(), ptr)) {
        return Magic::REQUEST;
    }
    if(std::equal(RESPONSE_MAGIC.begin(), RESPONSE_MAGIC.end(), ptr)) {
        return Magic::RESPONSE;
    }
    return std::nullopt;
}
} // namespace
auto encode_frame(const Command command, const Bytes& payload, const Magic magic) -> Bytes {
    auto r = Bytes();
    r.reserve(HEADER_LEN + payload.size());

    const auto& m = magic == Magic::REQUEST ? REQUEST_MAGIC : RESPONSE_MAGIC;
    append_bytes(r, m.data(), m.size());
    append_u32(r, static_cast<uint32_t>(command));
    append_u32(r, static_cast<uint32_t>(payload.size()));
    append_bytes(r, payload.data(), payload.size());

    return r;
}
auto FrameDecoder::feed(const uint8_t* const data, const size_t size) -> FeedResult {
    auto r = FeedResult();
    if(state == State::Broken) {
        r.message = "decoder is broken by a previous framing error";
        return r;
    }
    append_bytes(buffer, data, size);

    auto pos = size_t(0);
    while(true) {
        const auto avail = buffer.size() - pos;
        if(state == State::AwaitingHeader) {
            if(avail < HEADER_LEN) {
                break;
            }
            const auto header = &buffer[pos];
            const auto magic  = parse_magic(header);
            if(!magic.has_value()) {
                state     = State::Broken;
                r.message = "bad magic in frame header";
                buffer.clear();
                return r;
            }
            current  = Frame{.magic = *magic, .command = static_cast<Command>(read_u32(header + 4))};
            body_len = read_u32(header + 8);
            pos += HEADER_LEN;
            state = State::AwaitingBody;
        } else {
            if(avail < body_len) {
                break;
            }
            current.payload.assign(buffer.begin() + pos, buffer.begin() + pos + body_len);
            pos += body_len;
            r.frames.emplace_back(std::move(current));
            current = Frame();
            state   = State::AwaitingHeader;
        }
    }
    buffer.erase(buffer.begin(), buffer.begin() + pos);
    return r;
}
auto FrameDecoder::feed(const Bytes& data) -> FeedResult {
    return feed(data.data(), data.size());
}
auto FrameDecoder::get_buffered() const -> size_t {
    return buffer.size();
}
auto FrameDecoder::reset() -> void {
    buffer.clear();
    state    = State::AwaitingHeader;
    current  = Frame();
    body_len = 0;
}
} // namespace xgear
