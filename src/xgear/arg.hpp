#pragma once
#include <optional>
#include <string>

#include "../client.hpp"

namespace xgear {
struct Args {
    std::string                server;
    bool                       background = false;
    Priority                   priority   = Priority::Normal;
    std::string                unique;
    std::optional<std::string> status;
    std::optional<std::string> function;
    std::optional<std::string> data;
    bool                       help = false;
};

auto parse_args(int argc, const char* const argv[]) -> Args;
} // namespace xgear
