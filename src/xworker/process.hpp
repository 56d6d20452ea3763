#pragma once
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <unistd.h>

#include "../fd.hpp"

namespace xgear::process {
struct OpenResult {
    const char* message   = nullptr;
    int         error_num = 0;
};

enum class ExitReason {
    Exit,
    Signal,
};

struct ExitStatus {
    ExitReason reason;
    int        code;
};

struct CloseResult {
    ExitStatus  status;
    std::string out;
    std::string err;
    const char* message = nullptr;
};

using Environment = std::vector<std::pair<std::string, std::string>>;

// child process with stdin, stdout and stderr connected to pipes
class Process {
  private:
    pid_t          pid = -1;
    FileDescriptor pipes[3];

  public:
    auto open(const char* shell, const char* command, const Environment& env = {}) -> OpenResult;
    // writes input to stdin, closes it and collects outputs until the process exits
    auto communicate(std::string_view input) -> CloseResult;
    auto get_pid() const -> pid_t;

    Process() = default;
};
} // namespace xgear::process
