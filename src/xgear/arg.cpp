#include <cstring>

#include <getopt.h>

#include "../error.hpp"
#include "../socket.hpp"
#include "arg.hpp"

namespace xgear {
namespace {
auto parse_priority(const char* const arg) -> Priority {
    if(std::strcmp(arg, "high") == 0) {
        return Priority::High;
    } else if(std::strcmp(arg, "low") == 0) {
        return Priority::Low;
    } else if(std::strcmp(arg, "normal") == 0) {
        return Priority::Normal;
    }
    panic("Unknown priority \"", arg, "\"");
}
} // namespace
auto parse_args(const int argc, const char* const argv[]) -> Args {
    int  background = 0, help = 0;
    auto result     = Args();
    result.server   = search_server_address();

    const auto   optstring  = "+s:bp:u:S:h";
    const option longopts[] = {
        {"server", required_argument, 0, 's'},
        {"background", no_argument, &background, 1},
        {"priority", required_argument, 0, 'p'},
        {"unique", required_argument, 0, 'u'},
        {"status", required_argument, 0, 'S'},
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
        case 'b':
            background = 1;
            break;
        case 'p':
            result.priority = parse_priority(optarg);
            break;
        case 'u':
            result.unique = optarg;
            break;
        case 'S':
            result.status = optarg;
            break;
        case 'h':
        case '?':
            help = 1;
            break;
        }
    }
    if(optind < argc) {
        result.function = argv[optind];
    }
    if(optind + 1 < argc) {
        result.data = argv[optind + 1];
    }

    result.background = background != 0;
    result.help       = help != 0;

    return result;
}
} // namespace xgear
