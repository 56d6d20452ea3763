#pragma once
#include <string>

#include "../worker.hpp"
#include "arg.hpp"

namespace xgear {
// runs command in the shell, job data on stdin, stdout as result
// non-zero exit status is reported as a job exception
auto make_shell_function(std::string shell, std::string command) -> Function;

auto serve(const Args& args) -> int;
} // namespace xgear
