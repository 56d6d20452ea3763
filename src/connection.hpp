#pragma once
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "eventual.hpp"
#include "frame.hpp"
#include "transport.hpp"

namespace xgear {
// returns true if the frame was meaningful to the handler
using UnsolicitedHandler = std::function<bool(const Frame&)>;
using Subscription       = std::shared_ptr<const UnsolicitedHandler>;

inline auto make_subscription(UnsolicitedHandler handler) -> Subscription {
    return std::make_shared<const UnsolicitedHandler>(std::move(handler));
}

// called once when the connection goes down
using LossHandler      = std::function<void(const Error&)>;
using LossSubscription = std::shared_ptr<const LossHandler>;

inline auto make_loss_subscription(LossHandler handler) -> LossSubscription {
    return std::make_shared<const LossHandler>(std::move(handler));
}

class Connection {
  private:
    Transport&                    transport;
    FrameDecoder                  decoder;
    std::deque<Eventual<Frame>>   pending;
    std::vector<Subscription>     subscribers;
    std::vector<LossSubscription> loss_handlers;
    bool                          connected = true;

    auto write_frame(Command command, const Bytes& payload) -> std::optional<Error>;
    auto dispatch(Frame frame) -> void;

  public:
    auto send_raw(Command command, const Bytes& payload = {}) -> std::optional<Error>;
    // replies carry no request id, the n-th reply resolves the n-th pending send
    auto send(Command command, const Bytes& payload = {}) -> Eventual<Frame>;

    auto register_unsolicited(Subscription subscription) -> void;
    auto unregister_unsolicited(const Subscription& subscription) -> void;
    auto register_loss_handler(LossSubscription subscription) -> void;
    auto unregister_loss_handler(const LossSubscription& subscription) -> void;

    auto on_data_received(const uint8_t* data, size_t size) -> void;
    auto on_data_received(const Bytes& data) -> void;
    auto on_connection_lost(std::string_view reason) -> void;

    auto pre_sleep() -> std::optional<Error>;
    auto echo(const Bytes& payload = to_bytes("hello")) -> Eventual<Frame>;

    auto is_connected() const -> bool;
    auto get_pending_count() const -> size_t;
    auto get_subscriber_count() const -> size_t;
    auto get_loss_handler_count() const -> size_t;

    Connection(Transport& transport);
    Connection(const Connection&) = delete;
    auto operator=(const Connection&) -> Connection& = delete;
};
} // namespace xgear
