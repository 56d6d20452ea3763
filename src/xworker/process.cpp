#include <cerrno>
#include <cstdlib>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>

#include "process.hpp"

namespace xgear::process {
auto Process::open(const char* const shell, const char* const command, const Environment& env) -> OpenResult {
    int fds[3][2];
    for(auto i = 0; i < 3; i += 1) {
        if(pipe2(fds[i], O_CLOEXEC) < 0) {
            const auto error = errno;
            for(auto j = 0; j < i; j += 1) {
                ::close(fds[j][0]);
                ::close(fds[j][1]);
            }
            return {.message = "Failed to create pipe", .error_num = error};
        }
    }
    const auto pid = fork();
    if(pid < 0) {
        const auto error = errno;
        for(auto i = 0; i < 3; i += 1) {
            ::close(fds[i][0]);
            ::close(fds[i][1]);
        }
        return {.message = "Failed to fork process", .error_num = error};
    } else if(pid != 0) {
        this->pid = pid;
        for(auto i = 0; i < 3; i += 1) {
            // parent keeps the write end of stdin and the read ends of stdout and stderr
            pipes[i] = FileDescriptor(fds[i][i == 0 ? 1 : 0]);
            ::close(fds[i][i == 0 ? 0 : 1]);
        }
        fcntl(pipes[0], F_SETFL, fcntl(pipes[0], F_GETFL) | O_NONBLOCK);
        return {};
    } else {
        for(auto i = 0; i < 3; i += 1) {
            dup2(fds[i][i == 0 ? 0 : 1], i);
        }
        for(const auto& [key, value] : env) {
            setenv(key.data(), value.data(), 1);
        }
        execl(shell, shell, "-c", command, NULL);
        _exit(127);
    }
}
auto Process::communicate(const std::string_view input) -> CloseResult {
    auto r       = CloseResult();
    auto written = size_t(0);
    if(input.empty()) {
        pipes[0].close();
    }

    while(pipes[0].is_valid() || pipes[1].is_valid() || pipes[2].is_valid()) {
        auto fds = std::vector<pollfd>();
        if(pipes[0].is_valid()) {
            fds.emplace_back(pollfd{.fd = pipes[0], .events = POLLOUT});
        }
        for(auto i = 1; i < 3; i += 1) {
            if(pipes[i].is_valid()) {
                fds.emplace_back(pollfd{.fd = pipes[i], .events = POLLIN});
            }
        }
        if(poll(fds.data(), fds.size(), -1) == -1) {
            if(errno == EINTR) {
                continue;
            }
            r.message = "poll() failed";
            break;
        }
        for(const auto& fd : fds) {
            if(fd.revents == 0) {
                continue;
            }
            if(fd.fd == pipes[0]) {
                if(fd.revents & (POLLERR | POLLHUP)) {
                    // the child does not read stdin
                    pipes[0].close();
                    continue;
                }
                const auto n = ::write(pipes[0], input.data() + written, input.size() - written);
                if(n < 0 && errno != EAGAIN && errno != EINTR) {
                    pipes[0].close();
                    continue;
                }
                if(n > 0) {
                    written += n;
                }
                if(written == input.size()) {
                    pipes[0].close();
                }
                continue;
            }
            const auto  index = fd.fd == pipes[1] ? 1 : 2;
            auto&       out   = index == 1 ? r.out : r.err;
            char        buf[4096];
            const auto  n = pipes[index].read_some(buf, sizeof(buf));
            if(n <= 0) {
                pipes[index].close();
            } else {
                out.append(buf, n);
            }
        }
    }

    auto status = 0;
    while(waitpid(pid, &status, 0) < 0) {
        if(errno != EINTR) {
            r.message = "waitpid() failed";
            r.status  = {ExitReason::Exit, -1};
            return r;
        }
    }
    const bool exitted = WIFEXITED(status);
    r.status           = {exitted ? ExitReason::Exit : ExitReason::Signal, exitted ? WEXITSTATUS(status) : WTERMSIG(status)};
    return r;
}
auto Process::get_pid() const -> pid_t {
    return pid;
}
} // namespace xgear::process
