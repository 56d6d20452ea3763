#include <sstream>

#include "job.hpp"

namespace xgear {
namespace {
auto concat(const std::vector<std::string>& chunks) -> std::string {
    auto size = size_t(0);
    for(const auto& c : chunks) {
        size += c.size();
    }
    auto r = std::string();
    r.reserve(size);
    for(const auto& c : chunks) {
        r += c;
    }
    return r;
}
} // namespace
Job::Job(std::string handle, std::string function, std::string data) : handle(std::move(handle)), function(std::move(function)), data(std::move(data)) {}
auto Job::describe() const -> std::string {
    auto ss = std::stringstream();
    ss << "<Job " << handle << " func=" << function << " with " << data.size() << " bytes of data>";
    return ss.str();
}
auto Job::parse(const Bytes& payload) -> std::optional<Job> {
    auto reader   = ByteReader(payload);
    auto handle   = reader.read_until('\0');
    auto function = reader.read_until('\0');
    if(!handle.has_value() || !function.has_value()) {
        return std::nullopt;
    }
    return Job(std::move(*handle), std::move(*function), reader.read_rest());
}
auto operator<<(std::ostream& os, const Job& job) -> std::ostream& {
    return os << job.describe();
}

auto JobHandle::get_handle() const -> const std::string& {
    return handle;
}
auto JobHandle::append_work_data(std::string chunk) -> void {
    work_data.emplace_back(std::move(chunk));
}
auto JobHandle::append_work_warning(std::string chunk) -> void {
    work_warning.emplace_back(std::move(chunk));
}
auto JobHandle::get_work_data() const -> std::string {
    return concat(work_data);
}
auto JobHandle::get_work_warning() const -> std::string {
    return concat(work_warning);
}
auto JobHandle::set_status(const WorkStatus status) -> void {
    this->status = status;
}
auto JobHandle::get_status() const -> const std::optional<WorkStatus>& {
    return status;
}
auto JobHandle::set_exception(std::string text) -> void {
    exception = std::move(text);
}
auto JobHandle::get_exception() const -> const std::optional<std::string>& {
    return exception;
}
auto JobHandle::get_result() const -> const Eventual<std::string>& {
    return result;
}
JobHandle::JobHandle(std::string handle) : handle(std::move(handle)) {}
} // namespace xgear
