#pragma once
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "byte.hpp"
#include "eventual.hpp"

namespace xgear {
// an assignment received from the job server
class Job {
  private:
    std::string handle;
    std::string function;
    std::string data;

    Job(std::string handle, std::string function, std::string data);

  public:
    auto get_handle() const -> const std::string& {
        return handle;
    }
    auto get_function() const -> const std::string& {
        return function;
    }
    auto get_data() const -> const std::string& {
        return data;
    }
    auto describe() const -> std::string;

    // payload is "handle\0function\0data", nullopt if a separator is missing
    static auto parse(const Bytes& payload) -> std::optional<Job>;
};

auto operator<<(std::ostream& os, const Job& job) -> std::ostream&;

struct WorkStatus {
    uint32_t numerator   = 0;
    uint32_t denominator = 0;
};

// state of a submitted job until WORK_COMPLETE or WORK_FAIL
class JobHandle {
  private:
    std::string                handle;
    std::vector<std::string>   work_data;
    std::vector<std::string>   work_warning;
    std::optional<WorkStatus>  status;
    std::optional<std::string> exception;
    Eventual<std::string>      result;

  public:
    auto get_handle() const -> const std::string&;
    auto append_work_data(std::string chunk) -> void;
    auto append_work_warning(std::string chunk) -> void;
    auto get_work_data() const -> std::string;
    auto get_work_warning() const -> std::string;
    auto set_status(WorkStatus status) -> void;
    auto get_status() const -> const std::optional<WorkStatus>&;
    auto set_exception(std::string text) -> void;
    auto get_exception() const -> const std::optional<std::string>&;
    // resolved with the WORK_COMPLETE data, rejected on WORK_FAIL
    auto get_result() const -> const Eventual<std::string>&;

    JobHandle(std::string handle);
};
} // namespace xgear
