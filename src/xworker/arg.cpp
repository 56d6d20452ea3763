#include <cstring>
#include <stdexcept>

#include <getopt.h>

#include "../error.hpp"
#include "../socket.hpp"
#include "arg.hpp"

namespace xgear {
namespace {
auto parse_function(const char* const arg) -> FunctionSpec {
    const auto p = std::strchr(arg, '=');
    if(p == NULL || p == arg || *(p + 1) == '\0') {
        panic("Invalid function \"", arg, "\", expected NAME=COMMAND");
    }
    return FunctionSpec{.name = std::string(arg, p - arg), .command = std::string(p + 1)};
}
auto parse_count(const char* const arg) -> size_t {
    try {
        return std::stoul(arg);
    } catch(const std::exception&) {
        panic("Invalid count \"", arg, "\"");
    }
}
} // namespace
auto parse_args(const int argc, const char* const argv[]) -> Args {
    int  help   = 0;
    auto result = Args();
    result.server = search_server_address();

    const auto   optstring  = "s:i:f:n:S:h";
    const option longopts[] = {
        {"server", required_argument, 0, 's'},
        {"id", required_argument, 0, 'i'},
        {"function", required_argument, 0, 'f'},
        {"count", required_argument, 0, 'n'},
        {"shell", required_argument, 0, 'S'},
        {"help", no_argument, &help, 1},
        {0, 0, 0, 0},
    };

    int longindex = 0;
    int c;
    while((c = getopt_long(argc, const_cast<char* const*>(argv), optstring, longopts, &longindex)) != -1) {
        switch(c) {
        case 's':
            result.server = optarg;
            break;
        case 'i':
            result.id = optarg;
            break;
        case 'f':
            result.functions.emplace_back(parse_function(optarg));
            break;
        case 'n':
            result.count = parse_count(optarg);
            break;
        case 'S':
            result.shell = optarg;
            break;
        case 'h':
            help = 1;
            break;
        case '?':
            help = 1;
            break;
        }
    }

    result.help = help != 0;

    return result;
}
} // namespace xgear
