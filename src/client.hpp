#pragma once
#include <map>
#include <memory>
#include <string>
#include <string_view>

#include "connection.hpp"
#include "job.hpp"

namespace xgear {
enum class Priority {
    Normal,
    High,
    Low,
};

struct SubmitOptions {
    Priority    priority = Priority::Normal;
    std::string unique;
};

struct JobStatus {
    std::string handle;
    bool        known       = false;
    bool        running     = false;
    uint32_t    numerator   = 0;
    uint32_t    denominator = 0;
};

class Client {
  private:
    Connection&                                       connection;
    std::map<std::string, std::shared_ptr<JobHandle>> jobs;
    Subscription                                      subscription;
    LossSubscription                                  loss_subscription;

    auto on_unsolicited(const Frame& frame) -> bool;
    auto on_connection_lost(const Error& error) -> void;

  public:
    // resolved on JOB_CREATED, the handle then collects WORK_* frames until the job ends
    auto submit(std::string_view function, std::string_view data, const SubmitOptions& options = {}) -> Eventual<std::shared_ptr<JobHandle>>;
    // resolved with the job handle assigned by the server
    auto submit_background(std::string_view function, std::string_view data, const SubmitOptions& options = {}) -> Eventual<std::string>;
    auto get_status(std::string_view handle) -> Eventual<JobStatus>;
    auto get_job_count() const -> size_t;

    Client(Connection& connection);
    Client(const Client&) = delete;
    auto operator=(const Client&) -> Client& = delete;
    ~Client();
};
} // namespace xgear
