#include <cstring>
#include <stdexcept>

#include "../error.hpp"
#include "../session.hpp"
#include "../socket.hpp"
#include "process.hpp"
#include "serve.hpp"

namespace xgear {
namespace {
auto trim_newline(std::string str) -> std::string {
    while(!str.empty() && (str.back() == '\n' || str.back() == '\r')) {
        str.pop_back();
    }
    return str;
}
auto is_fatal(const Error& error) -> bool {
    switch(error.kind) {
    case ErrorKind::MalformedAssignment:
    case ErrorKind::UnexpectedReply:
    case ErrorKind::ServerError:
        return false;
    default:
        return true;
    }
}
} // namespace
auto make_shell_function(std::string shell, std::string command) -> Function {
    return [shell = std::move(shell), command = std::move(command)](const Job& job) -> std::optional<std::string> {
        print(job.describe());

        auto       proc        = process::Process();
        const auto env         = process::Environment{{"XGEAR_JOB_HANDLE", job.get_handle()}, {"XGEAR_FUNCTION", job.get_function()}};
        const auto open_result = proc.open(shell.data(), command.data(), env);
        if(open_result.message != nullptr) {
            throw std::runtime_error(std::string(open_result.message) + ": " + strerror(open_result.error_num));
        }

        auto close_result = proc.communicate(job.get_data());
        if(close_result.message != nullptr) {
            throw std::runtime_error(close_result.message);
        }
        switch(close_result.status.reason) {
        case process::ExitReason::Exit:
            if(close_result.status.code != 0) {
                auto message = "Command \"" + command + "\" returned exit code " + std::to_string(close_result.status.code);
                if(const auto err = trim_newline(std::move(close_result.err)); !err.empty()) {
                    message += ": " + err;
                }
                throw std::runtime_error(message);
            }
            break;
        case process::ExitReason::Signal:
            throw std::runtime_error("Command \"" + command + "\" terminated by signal " + std::to_string(close_result.status.code));
        }
        if(!close_result.err.empty()) {
            warn("=== stderr ===\n", close_result.err);
        }
        if(close_result.out.empty()) {
            return std::nullopt;
        }
        return std::move(close_result.out);
    };
}
auto serve(const Args& args) -> int {
    const auto address = parse_server_address(args.server);
    if(!address.has_value()) {
        panic("Invalid server address ", args.server);
    }
    auto opened = open_server_connection(*address);
    if(opened.message != nullptr) {
        panic("Failed to connect to ", args.server, ": ", opened.message, "(", strerror(opened.error), ")");
    }
    print("Connected to ", args.server);

    auto transport  = SocketTransport(std::move(opened.fd));
    auto connection = Connection(transport);
    auto worker     = Worker(connection);
    if(args.id.has_value()) {
        if(const auto e = worker.set_id(*args.id); e.has_value()) {
            panic("Failed to set worker id: ", describe(*e));
        }
    }
    for(const auto& f : args.functions) {
        if(const auto e = worker.register_function(f.name, make_shell_function(args.shell, f.command)); e.has_value()) {
            panic("Failed to register ", f.name, ": ", describe(*e));
        }
        print("Serving ", f.name, " with \"", f.command, '"');
    }

    // one do_job() at a time, the next one starts when the previous settles
    auto served   = size_t(0);
    auto busy     = false;
    auto failure  = std::optional<Error>();
    const auto ok = run_session(transport, connection, [&]() -> bool {
        if(failure.has_value() || (args.count.has_value() && served >= *args.count)) {
            return true;
        }
        if(busy) {
            return false;
        }
        busy = true;
        worker.do_job().then(
            [&](const std::monostate&) {
                busy = false;
                served += 1;
            },
            [&](const Error& e) {
                busy = false;
                if(is_fatal(e)) {
                    failure = e;
                } else {
                    warn("Skipping job: ", describe(e));
                }
            });
        return failure.has_value();
    });

    if(failure.has_value()) {
        warn("Worker stopped: ", describe(*failure));
        return 1;
    }
    if(!ok) {
        warn("Connection closed");
        return 1;
    }
    print("Served ", served, " jobs");
    return 0;
}
} // namespace xgear
