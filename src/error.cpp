#include "error.hpp"

namespace xgear {
auto error_kind_name(const ErrorKind kind) -> const char* {
    switch(kind) {
    case ErrorKind::Framing:
        return "framing error";
    case ErrorKind::MalformedAssignment:
        return "malformed job assignment";
    case ErrorKind::ConnectionLost:
        return "connection lost";
    case ErrorKind::NotConnected:
        return "not connected";
    case ErrorKind::UnexpectedReply:
        return "unexpected reply";
    case ErrorKind::ServerError:
        return "server error";
    case ErrorKind::JobFailed:
        return "job failed";
    }
    return "unknown error";
}
auto describe(const Error& error) -> std::string {
    auto r = std::string(error_kind_name(error.kind));
    if(!error.message.empty()) {
        r += ": ";
        r += error.message;
    }
    return r;
}
} // namespace xgear
