#include <charconv>
#include <utility>

#include "client.hpp"

namespace xgear {
namespace {
auto submit_command(const Priority priority, const bool background) -> Command {
    switch(priority) {
    case Priority::High:
        return background ? Command::SUBMIT_JOB_HIGH_BG : Command::SUBMIT_JOB_HIGH;
    case Priority::Low:
        return background ? Command::SUBMIT_JOB_LOW_BG : Command::SUBMIT_JOB_LOW;
    case Priority::Normal:
        break;
    }
    return background ? Command::SUBMIT_JOB_BG : Command::SUBMIT_JOB;
}
auto build_submit_packet(const std::string_view function, const std::string_view unique, const std::string_view data) -> Bytes {
    auto r = Bytes();
    r.reserve(function.size() + 1 + unique.size() + 1 + data.size());
    append_bytes(r, function);
    append_nul(r);
    append_bytes(r, unique);
    append_nul(r);
    append_bytes(r, data);
    return r;
}
auto parse_u32(const std::string& str) -> std::optional<uint32_t> {
    auto       value = uint32_t();
    const auto end   = str.data() + str.size();
    if(const auto [ptr, ec] = std::from_chars(str.data(), end, value); ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return value;
}
auto check_reply(const Frame& reply, const Command expected) -> std::optional<Error> {
    if(reply.command == expected) {
        return std::nullopt;
    }
    if(reply.command == Command::ERROR) {
        auto reader = ByteReader(reply.payload);
        if(auto code = reader.read_until('\0'); code.has_value()) {
            return Error{ErrorKind::ServerError, *code + ": " + reader.read_rest()};
        }
        return Error{ErrorKind::ServerError, to_string(reply.payload)};
    }
    return Error{ErrorKind::UnexpectedReply, std::string(command_name(reply.command)) + ", expected " + command_name(expected)};
}
auto parse_status(const Bytes& payload) -> std::optional<JobStatus> {
    auto reader  = ByteReader(payload);
    auto handle  = reader.read_until('\0');
    auto known   = reader.read_until('\0');
    auto running = reader.read_until('\0');
    auto num     = reader.read_until('\0');
    if(!handle || !known || !running || !num) {
        return std::nullopt;
    }
    const auto numerator   = parse_u32(*num);
    const auto denominator = parse_u32(reader.read_rest());
    if(!numerator || !denominator) {
        return std::nullopt;
    }
    return JobStatus{
        .handle      = std::move(*handle),
        .known       = *known == "1",
        .running     = *running == "1",
        .numerator   = *numerator,
        .denominator = *denominator,
    };
}
} // namespace
auto Client::on_unsolicited(const Frame& frame) -> bool {
    switch(frame.command) {
    case Command::WORK_DATA:
    case Command::WORK_WARNING:
    case Command::WORK_STATUS:
    case Command::WORK_EXCEPTION:
    case Command::WORK_COMPLETE:
    case Command::WORK_FAIL:
        break;
    default:
        return false;
    }

    // WORK_FAIL carries only the handle, without a separator
    auto       reader = ByteReader(frame.payload);
    auto       handle = reader.read_until('\0');
    const auto data   = handle.has_value() ? reader.read_rest() : std::string();
    if(!handle.has_value()) {
        handle = to_string(frame.payload);
    }
    const auto p = jobs.find(*handle);
    if(p == jobs.end()) {
        return false;
    }
    const auto job = p->second;

    switch(frame.command) {
    case Command::WORK_DATA:
        job->append_work_data(data);
        break;
    case Command::WORK_WARNING:
        job->append_work_warning(data);
        break;
    case Command::WORK_STATUS: {
        const auto rest        = to_bytes(data);
        auto       fields      = ByteReader(rest);
        const auto num         = fields.read_until('\0');
        const auto numerator   = num.has_value() ? parse_u32(*num) : std::nullopt;
        const auto denominator = parse_u32(fields.read_rest());
        if(!numerator || !denominator) {
            warn("Malformed WORK_STATUS for ", *handle);
            return false;
        }
        job->set_status({*numerator, *denominator});
    } break;
    case Command::WORK_EXCEPTION:
        job->set_exception(data);
        break;
    case Command::WORK_COMPLETE:
        jobs.erase(p);
        job->get_result().resolve(data);
        break;
    case Command::WORK_FAIL:
        jobs.erase(p);
        job->get_result().reject(Error{ErrorKind::JobFailed, job->get_exception().value_or("")});
        break;
    default:
        break;
    }
    return true;
}
auto Client::on_connection_lost(const Error& error) -> void {
    const auto lost = std::exchange(jobs, {});
    for(const auto& [handle, job] : lost) {
        job->get_result().reject(error);
    }
}
auto Client::submit(const std::string_view function, const std::string_view data, const SubmitOptions& options) -> Eventual<std::shared_ptr<JobHandle>> {
    auto r = Eventual<std::shared_ptr<JobHandle>>();
    connection.send(submit_command(options.priority, false), build_submit_packet(function, options.unique, data))
        .then(
            [this, r](const Frame& reply) {
                if(auto e = check_reply(reply, Command::JOB_CREATED); e.has_value()) {
                    r.reject(std::move(*e));
                    return;
                }
                auto handle = std::make_shared<JobHandle>(to_string(reply.payload));
                jobs[handle->get_handle()] = handle;
                r.resolve(std::move(handle));
            },
            [r](const Error& e) { r.reject(e); });
    return r;
}
auto Client::submit_background(const std::string_view function, const std::string_view data, const SubmitOptions& options) -> Eventual<std::string> {
    auto r = Eventual<std::string>();
    connection.send(submit_command(options.priority, true), build_submit_packet(function, options.unique, data))
        .then(
            [r](const Frame& reply) {
                if(auto e = check_reply(reply, Command::JOB_CREATED); e.has_value()) {
                    r.reject(std::move(*e));
                } else {
                    r.resolve(to_string(reply.payload));
                }
            },
            [r](const Error& e) { r.reject(e); });
    return r;
}
auto Client::get_status(const std::string_view handle) -> Eventual<JobStatus> {
    auto r = Eventual<JobStatus>();
    connection.send(Command::GET_STATUS, to_bytes(handle))
        .then(
            [r](const Frame& reply) {
                if(auto e = check_reply(reply, Command::STATUS_RES); e.has_value()) {
                    r.reject(std::move(*e));
                } else if(auto status = parse_status(reply.payload); status.has_value()) {
                    r.resolve(std::move(*status));
                } else {
                    r.reject(Error{ErrorKind::UnexpectedReply, "malformed STATUS_RES"});
                }
            },
            [r](const Error& e) { r.reject(e); });
    return r;
}
auto Client::get_job_count() const -> size_t {
    return jobs.size();
}
Client::Client(Connection& connection)
    : connection(connection),
      subscription(make_subscription([this](const Frame& frame) { return on_unsolicited(frame); })),
      loss_subscription(make_loss_subscription([this](const Error& error) { on_connection_lost(error); })) {
    connection.register_unsolicited(subscription);
    connection.register_loss_handler(loss_subscription);
}
Client::~Client() {
    connection.unregister_unsolicited(subscription);
    connection.unregister_loss_handler(loss_subscription);
}
} // namespace xgear
