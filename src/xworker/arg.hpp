#pragma once
#include <optional>
#include <string>
#include <vector>

namespace xgear {
struct FunctionSpec {
    std::string name;
    std::string command;
};

struct Args {
    std::string                server;
    std::optional<std::string> id;
    std::vector<FunctionSpec>  functions;
    std::optional<size_t>      count;
    std::string                shell = "/bin/sh";
    bool                       help  = false;
};

auto parse_args(int argc, const char* const argv[]) -> Args;
} // namespace xgear
