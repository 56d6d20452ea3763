#include <algorithm>
#include <exception>
#include <string>
#include <utility>

#include "connection.hpp"

namespace xgear {
auto Connection::write_frame(const Command command, const Bytes& payload) -> std::optional<Error> {
    if(!connected) {
        return Error{ErrorKind::NotConnected, command_name(command)};
    }
    const auto packet = encode_frame(command, payload);
    if(!transport.write(packet.data(), packet.size())) {
        on_connection_lost("write failed");
        return Error{ErrorKind::ConnectionLost, "write failed"};
    }
    return std::nullopt;
}
auto Connection::dispatch(Frame frame) -> void {
    if(!pending.empty()) {
        const auto request = std::move(pending.front());
        pending.pop_front();
        request.resolve(std::move(frame));
        return;
    }

    // handlers may (un)register while being called
    const auto snapshot = subscribers;
    auto       handled  = false;
    for(const auto& s : snapshot) {
        handled = (*s)(frame) || handled;
    }
    if(!handled) {
        warn("Unhandled unsolicited frame ", command_name(frame.command), " (", frame.payload.size(), " bytes)");
    }
}
auto Connection::send_raw(const Command command, const Bytes& payload) -> std::optional<Error> {
    return write_frame(command, payload);
}
auto Connection::send(const Command command, const Bytes& payload) -> Eventual<Frame> {
    if(auto e = write_frame(command, payload); e.has_value()) {
        return Eventual<Frame>::rejected(std::move(*e));
    }
    auto r = Eventual<Frame>();
    pending.push_back(r);
    return r;
}
auto Connection::register_unsolicited(Subscription subscription) -> void {
    if(std::find(subscribers.begin(), subscribers.end(), subscription) != subscribers.end()) {
        return;
    }
    subscribers.emplace_back(std::move(subscription));
}
auto Connection::unregister_unsolicited(const Subscription& subscription) -> void {
    if(const auto p = std::find(subscribers.begin(), subscribers.end(), subscription); p != subscribers.end()) {
        subscribers.erase(p);
    }
}
auto Connection::register_loss_handler(LossSubscription subscription) -> void {
    if(std::find(loss_handlers.begin(), loss_handlers.end(), subscription) != loss_handlers.end()) {
        return;
    }
    loss_handlers.emplace_back(std::move(subscription));
}
auto Connection::unregister_loss_handler(const LossSubscription& subscription) -> void {
    if(const auto p = std::find(loss_handlers.begin(), loss_handlers.end(), subscription); p != loss_handlers.end()) {
        loss_handlers.erase(p);
    }
}
auto Connection::on_data_received(const uint8_t* const data, const size_t size) -> void {
    if(!connected) {
        return;
    }
    auto result = decoder.feed(data, size);
    for(auto& frame : result.frames) {
        if(!connected) {
            return;
        }
        // frames behind a throwing handler are still dispatched
        const auto command = frame.command;
        try {
            dispatch(std::move(frame));
        } catch(const std::exception& e) {
            warn("Handler for ", command_name(command), " threw: ", e.what());
        }
    }
    if(result.message != nullptr && connected) {
        warn("Dropping connection: ", result.message);
        transport.lose_connection();
        on_connection_lost(result.message);
    }
}
auto Connection::on_data_received(const Bytes& data) -> void {
    on_data_received(data.data(), data.size());
}
auto Connection::on_connection_lost(const std::string_view reason) -> void {
    const auto was_connected = std::exchange(connected, false);
    const auto error         = Error{ErrorKind::ConnectionLost, std::string(reason)};
    auto       requests      = std::exchange(pending, {});
    for(const auto& r : requests) {
        r.reject(error);
    }
    if(!was_connected) {
        return;
    }
    const auto snapshot = loss_handlers;
    for(const auto& h : snapshot) {
        (*h)(error);
    }
}
auto Connection::pre_sleep() -> std::optional<Error> {
    return send_raw(Command::PRE_SLEEP);
}
auto Connection::echo(const Bytes& payload) -> Eventual<Frame> {
    return send(Command::ECHO_REQ, payload);
}
auto Connection::is_connected() const -> bool {
    return connected;
}
auto Connection::get_pending_count() const -> size_t {
    return pending.size();
}
auto Connection::get_subscriber_count() const -> size_t {
    return subscribers.size();
}
auto Connection::get_loss_handler_count() const -> size_t {
    return loss_handlers.size();
}
Connection::Connection(Transport& transport) : transport(transport) {}
} // namespace xgear
