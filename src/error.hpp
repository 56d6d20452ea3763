#pragma once
#include <cstdlib>
#include <iostream>
#include <string>

namespace xgear {
template <class... Args>
[[noreturn]] void panic(Args... args) {
    (std::cerr << ... << args) << std::endl;
    exit(1);
}

template <class... Args>
void warn(Args... args) {
    (std::cerr << ... << args) << std::endl;
}

template <class... Args>
void print(Args... args) {
    (std::cout << ... << args) << std::endl;
}

enum class ErrorKind {
    Framing,
    MalformedAssignment,
    ConnectionLost,
    NotConnected,
    UnexpectedReply,
    ServerError,
    JobFailed,
};

struct Error {
    ErrorKind   kind;
    std::string message;
};

auto error_kind_name(ErrorKind kind) -> const char*;
auto describe(const Error& error) -> std::string;
} // namespace xgear
