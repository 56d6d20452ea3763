#include <csignal>
#include <cstdio>

#include "../error.hpp"
#include "serve.hpp"

const static auto HELP =
    R"(Usage: xgear-worker [Options]
Options:
    -s --server HOST[:PORT]     Job server (default: $XGEAR_SERVER or 127.0.0.1:4730)
                                Use @NAME for a socket in the abstract namespace
    -i --id ID                  Worker id reported to the job server
    -f --function NAME=COMMAND  Serve NAME by running COMMAND in the shell
                                Job data is passed on stdin, stdout is the result
                                You can serve multiple functions by repeating this option
    -n --count N                Exit after serving N jobs
    -S --shell PATH             Shell to run commands with (default: /bin/sh)
    -h --help                   Print this help
)";

int main(const int argc, const char* const argv[]) {
    const auto args = xgear::parse_args(argc, argv);
    if(args.help) {
        printf("%s\n", HELP);
        return 0;
    }
    if(args.functions.empty()) {
        xgear::panic("No function to serve, see --help");
    }
    signal(SIGPIPE, SIG_IGN);
    return xgear::serve(args);
}
