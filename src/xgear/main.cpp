#include <csignal>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <iterator>

#include "../error.hpp"
#include "../session.hpp"
#include "../socket.hpp"
#include "arg.hpp"

const static auto HELP =
    R"(Usage: xgear [Options] FUNCTION [DATA]
Submit a job and print its result, DATA is read from stdin when omitted
Options:
    -s --server HOST[:PORT]   Job server (default: $XGEAR_SERVER or 127.0.0.1:4730)
    -b --background           Do not wait for the result, print the job handle
    -p --priority PRIORITY    high, normal or low
    -u --unique ID            Unique id of the job
    -S --status HANDLE        Print the status of a job instead of submitting
    -h --help                 Print this help
)";

namespace xgear {
namespace {
auto read_stdin() -> std::string {
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
}
template <class T>
auto wait(SocketTransport& transport, Connection& connection, const Eventual<T>& eventual) -> bool {
    run_session(transport, connection, [&eventual]() { return eventual.is_settled(); });
    if(const auto e = eventual.get_error(); e != nullptr) {
        warn(describe(*e));
        return false;
    }
    if(!eventual.is_settled()) {
        warn("Connection closed");
        return false;
    }
    return true;
}
auto print_status(const JobStatus& status) -> void {
    print("handle:   ", status.handle);
    print("known:    ", status.known ? "yes" : "no");
    print("running:  ", status.running ? "yes" : "no");
    print("progress: ", status.numerator, "/", status.denominator);
}
} // namespace
auto run(const Args& args) -> int {
    if(!args.status.has_value() && !args.function.has_value()) {
        panic("Too few arguments");
    }
    const auto address = parse_server_address(args.server);
    if(!address.has_value()) {
        panic("Invalid server address ", args.server);
    }
    auto opened = open_server_connection(*address);
    if(opened.message != nullptr) {
        panic("Failed to connect to ", args.server, ": ", opened.message, "(", strerror(opened.error), ")");
    }
    auto transport  = SocketTransport(std::move(opened.fd));
    auto connection = Connection(transport);
    auto client     = Client(connection);

    if(args.status.has_value()) {
        const auto status = client.get_status(*args.status);
        if(!wait(transport, connection, status)) {
            return 1;
        }
        print_status(*status.get_value());
        return 0;
    }

    const auto data    = args.data.has_value() ? *args.data : read_stdin();
    const auto options = SubmitOptions{.priority = args.priority, .unique = args.unique};
    if(args.background) {
        const auto handle = client.submit_background(*args.function, data, options);
        if(!wait(transport, connection, handle)) {
            return 1;
        }
        print(*handle.get_value());
        return 0;
    }

    const auto submitted = client.submit(*args.function, data, options);
    if(!wait(transport, connection, submitted)) {
        return 1;
    }
    const auto& job = **submitted.get_value();
    const auto  ok  = wait(transport, connection, job.get_result());
    if(const auto warning = job.get_work_warning(); !warning.empty()) {
        warn(warning);
    }
    if(const auto work_data = job.get_work_data(); !work_data.empty()) {
        std::cout << work_data;
    }
    if(!ok) {
        return 1;
    }
    std::cout << *job.get_result().get_value();
    std::cout.flush();
    return 0;
}
} // namespace xgear

auto main(const int argc, const char* const argv[]) -> int {
    const auto args = xgear::parse_args(argc, argv);
    if(args.help) {
        printf("%s\n", HELP);
        return 0;
    }
    signal(SIGPIPE, SIG_IGN);
    return xgear::run(args);
}
