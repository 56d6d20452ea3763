#pragma once
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "connection.hpp"
#include "job.hpp"

namespace xgear {
// returns the result sent with WORK_COMPLETE, throws to report WORK_EXCEPTION and WORK_FAIL
using Function = std::function<std::optional<std::string>(const Job&)>;

/*
    grab/sleep/wake cycle

    IDLE --GRAB_JOB--> AWAITING_GRAB_REPLY --NO_JOB--> SLEEPING --NOOP--> IDLE
                                           --JOB_ASSIGN--> EXECUTING --> REPORTING --> IDLE
 */
class Worker {
  private:
    Connection&                     connection;
    std::map<std::string, Function> functions;
    std::optional<Trigger>          pending_wake;
    Subscription                    wake_subscription;
    LossSubscription                loss_subscription;

    auto grab(Eventual<Job> result) -> void;
    auto on_wake() -> void;
    auto on_connection_lost(const Error& error) -> void;

  public:
    auto set_id(std::string_view id) -> std::optional<Error>;
    auto register_function(std::string name, Function function) -> std::optional<Error>;
    auto unregister_function(const std::string& name) -> std::optional<Error>;
    auto has_function(const std::string& name) const -> bool;

    // at most one PRE_SLEEP is outstanding, later callers share the pending wake
    auto sleep_until_woken() -> Trigger;
    auto is_sleeping() const -> bool;
    auto get_job() -> Eventual<Job>;
    auto do_job() -> Trigger;

    auto report_result(const Job& job) -> std::optional<Error>;
    auto send_job_response(Command command, const Job& job, std::string_view data = {}) -> std::optional<Error>;
    auto send_work_data(const Job& job, std::string_view data) -> std::optional<Error>;
    auto send_work_warning(const Job& job, std::string_view data) -> std::optional<Error>;
    auto send_work_status(const Job& job, uint32_t numerator, uint32_t denominator) -> std::optional<Error>;

    Worker(Connection& connection);
    Worker(const Worker&) = delete;
    auto operator=(const Worker&) -> Worker& = delete;
    ~Worker();
};
} // namespace xgear
