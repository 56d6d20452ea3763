#include <exception>
#include <string>

#include "worker.hpp"

namespace xgear {
namespace {
auto server_error(const Frame& reply) -> Error {
    auto reader = ByteReader(reply.payload);
    auto code   = reader.read_until('\0');
    if(!code.has_value()) {
        return Error{ErrorKind::ServerError, to_string(reply.payload)};
    }
    return Error{ErrorKind::ServerError, *code + ": " + reader.read_rest()};
}
} // namespace
auto Worker::grab(const Eventual<Job> result) -> void {
    connection.send(Command::GRAB_JOB).then(
        [this, result](const Frame& reply) {
            switch(reply.command) {
            case Command::NO_JOB:
                sleep_until_woken().then(
                    [this, result](const std::monostate&) { grab(result); },
                    [result](const Error& e) { result.reject(e); });
                break;
            case Command::JOB_ASSIGN:
                if(auto job = Job::parse(reply.payload); job.has_value()) {
                    result.resolve(std::move(*job));
                } else {
                    result.reject(Error{ErrorKind::MalformedAssignment, "missing separator in \"" + to_string(reply.payload) + "\""});
                }
                break;
            case Command::ERROR:
                result.reject(server_error(reply));
                break;
            default:
                result.reject(Error{ErrorKind::UnexpectedReply, std::string(command_name(reply.command)) + " for GRAB_JOB"});
                break;
            }
        },
        [result](const Error& e) { result.reject(e); });
}
auto Worker::on_wake() -> void {
    connection.unregister_unsolicited(wake_subscription);
    wake_subscription.reset();
    if(!pending_wake.has_value()) {
        return;
    }
    const auto wake = std::move(*pending_wake);
    pending_wake.reset();
    wake.resolve({});
}
// no NOOP can arrive after this
auto Worker::on_connection_lost(const Error& error) -> void {
    if(wake_subscription) {
        connection.unregister_unsolicited(wake_subscription);
        wake_subscription.reset();
    }
    if(!pending_wake.has_value()) {
        return;
    }
    const auto wake = std::move(*pending_wake);
    pending_wake.reset();
    wake.reject(error);
}
auto Worker::set_id(const std::string_view id) -> std::optional<Error> {
    return connection.send_raw(Command::SET_CLIENT_ID, to_bytes(id));
}
auto Worker::register_function(std::string name, Function function) -> std::optional<Error> {
    const auto packet = to_bytes(name);
    functions[std::move(name)] = std::move(function);
    return connection.send_raw(Command::CAN_DO, packet);
}
auto Worker::unregister_function(const std::string& name) -> std::optional<Error> {
    if(functions.erase(name) == 0) {
        return std::nullopt;
    }
    return connection.send_raw(Command::CANT_DO, to_bytes(name));
}
auto Worker::has_function(const std::string& name) const -> bool {
    return functions.find(name) != functions.end();
}
auto Worker::sleep_until_woken() -> Trigger {
    if(pending_wake.has_value()) {
        return *pending_wake;
    }
    auto wake = Trigger();
    if(auto e = connection.pre_sleep(); e.has_value()) {
        wake.reject(std::move(*e));
        return wake;
    }
    pending_wake      = wake;
    wake_subscription = make_subscription([this](const Frame& frame) -> bool {
        if(frame.command != Command::NOOP) {
            return false;
        }
        on_wake();
        return true;
    });
    connection.register_unsolicited(wake_subscription);
    return wake;
}
auto Worker::is_sleeping() const -> bool {
    return pending_wake.has_value();
}
auto Worker::get_job() -> Eventual<Job> {
    auto result = Eventual<Job>();
    if(pending_wake.has_value()) {
        // a GRAB_JOB now would race the pending wake
        pending_wake->then(
            [this, result](const std::monostate&) { grab(result); },
            [result](const Error& e) { result.reject(e); });
    } else {
        grab(result);
    }
    return result;
}
auto Worker::do_job() -> Trigger {
    auto done = Trigger();
    get_job().then(
        [this, done](const Job& job) {
            if(auto e = report_result(job); e.has_value()) {
                done.reject(std::move(*e));
            } else {
                done.resolve({});
            }
        },
        [done](const Error& e) { done.reject(e); });
    return done;
}
auto Worker::report_result(const Job& job) -> std::optional<Error> {
    auto failure = std::string();
    if(const auto p = functions.find(job.get_function()); p == functions.end()) {
        failure = "no function registered for " + job.get_function();
    } else {
        const auto function = p->second;
        try {
            const auto result = function(job);
            return send_job_response(Command::WORK_COMPLETE, job, result.has_value() ? std::string_view(*result) : std::string_view());
        } catch(const std::exception& e) {
            failure = e.what();
        } catch(...) {
            failure = "unknown exception";
        }
    }
    warn("Job ", job.get_handle(), " failed: ", failure);
    if(auto e = send_job_response(Command::WORK_EXCEPTION, job, failure); e.has_value()) {
        return e;
    }
    return send_job_response(Command::WORK_FAIL, job);
}
auto Worker::send_job_response(const Command command, const Job& job, const std::string_view data) -> std::optional<Error> {
    auto packet = Bytes();
    packet.reserve(job.get_handle().size() + 1 + data.size());
    append_bytes(packet, job.get_handle());
    append_nul(packet);
    append_bytes(packet, data);
    return connection.send_raw(command, packet);
}
auto Worker::send_work_data(const Job& job, const std::string_view data) -> std::optional<Error> {
    return send_job_response(Command::WORK_DATA, job, data);
}
auto Worker::send_work_warning(const Job& job, const std::string_view data) -> std::optional<Error> {
    return send_job_response(Command::WORK_WARNING, job, data);
}
auto Worker::send_work_status(const Job& job, const uint32_t numerator, const uint32_t denominator) -> std::optional<Error> {
    auto data = std::to_string(numerator);
    data += '\0';
    data += std::to_string(denominator);
    return send_job_response(Command::WORK_STATUS, job, data);
}
Worker::Worker(Connection& connection)
    : connection(connection),
      loss_subscription(make_loss_subscription([this](const Error& error) { on_connection_lost(error); })) {
    connection.register_loss_handler(loss_subscription);
}
Worker::~Worker() {
    if(wake_subscription) {
        connection.unregister_unsolicited(wake_subscription);
    }
    connection.unregister_loss_handler(loss_subscription);
}
} // namespace xgear
