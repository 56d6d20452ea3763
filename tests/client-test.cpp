#include <string>

#include <gtest/gtest.h>

#include "../src/client.hpp"
#include "fake-transport.hpp"

using namespace std::string_literals;

namespace xgear::test {
class ClientTest : public ::testing::Test, public ProtocolTest {
  protected:
    Client client{connection};

    auto submit_and_create(const std::string& handle) -> std::shared_ptr<JobHandle> {
        const auto submitted = client.submit("reverse", "abc");
        write_response(Command::JOB_CREATED, handle);
        if(!submitted.is_resolved()) {
            return nullptr;
        }
        return *submitted.get_value();
    }
};

TEST_F(ClientTest, SubmitSendsFunctionUniqueAndData) {
    client.submit("reverse", "abc", {.unique = "u-1"});
    const auto f = next_sent();
    EXPECT_EQ(f.command, Command::SUBMIT_JOB);
    EXPECT_EQ(to_string(f.payload), "reverse\0u-1\0abc"s);
    EXPECT_EQ(connection.get_pending_count(), 1u);
}

TEST_F(ClientTest, PriorityPicksCommand) {
    client.submit("f", "", {.priority = Priority::High});
    client.submit("f", "", {.priority = Priority::Low});
    client.submit_background("f", "");
    client.submit_background("f", "", {.priority = Priority::High});
    client.submit_background("f", "", {.priority = Priority::Low});
    EXPECT_EQ(next_sent().command, Command::SUBMIT_JOB_HIGH);
    EXPECT_EQ(next_sent().command, Command::SUBMIT_JOB_LOW);
    EXPECT_EQ(next_sent().command, Command::SUBMIT_JOB_BG);
    EXPECT_EQ(next_sent().command, Command::SUBMIT_JOB_HIGH_BG);
    EXPECT_EQ(next_sent().command, Command::SUBMIT_JOB_LOW_BG);
}

TEST_F(ClientTest, SubmitCollectsWorkUntilComplete) {
    const auto job = submit_and_create("H:lap:1");
    ASSERT_NE(job, nullptr);
    EXPECT_EQ(job->get_handle(), "H:lap:1");
    EXPECT_EQ(client.get_job_count(), 1u);

    write_response(Command::WORK_DATA, "H:lap:1\0cb"s);
    write_response(Command::WORK_DATA, "H:lap:1\0a"s);
    write_response(Command::WORK_WARNING, "H:lap:1\0slow"s);
    write_response(Command::WORK_STATUS, "H:lap:1\0" "1\0" "2"s);
    EXPECT_EQ(job->get_work_data(), "cba");
    EXPECT_EQ(job->get_work_warning(), "slow");
    ASSERT_TRUE(job->get_status().has_value());
    EXPECT_EQ(job->get_status()->numerator, 1u);
    EXPECT_EQ(job->get_status()->denominator, 2u);
    EXPECT_FALSE(job->get_result().is_settled());

    write_response(Command::WORK_COMPLETE, "H:lap:1\0cba"s);
    ASSERT_TRUE(job->get_result().is_resolved());
    EXPECT_EQ(*job->get_result().get_value(), "cba");
    EXPECT_EQ(client.get_job_count(), 0u);
}

TEST_F(ClientTest, WorkFailRejectsWithExceptionText) {
    const auto job = submit_and_create("H:lap:2");
    ASSERT_NE(job, nullptr);
    write_response(Command::WORK_EXCEPTION, "H:lap:2\0division by zero"s);
    write_response(Command::WORK_FAIL, "H:lap:2");
    ASSERT_TRUE(job->get_result().is_rejected());
    EXPECT_EQ(job->get_result().get_error()->kind, ErrorKind::JobFailed);
    EXPECT_EQ(job->get_result().get_error()->message, "division by zero");
    EXPECT_EQ(client.get_job_count(), 0u);
}

TEST_F(ClientTest, WorkForUnknownHandleIsIgnored) {
    const auto job = submit_and_create("H:lap:3");
    ASSERT_NE(job, nullptr);
    write_response(Command::WORK_COMPLETE, "H:other\0x"s);
    EXPECT_FALSE(job->get_result().is_settled());
    EXPECT_EQ(client.get_job_count(), 1u);
    EXPECT_TRUE(connection.is_connected());
}

TEST_F(ClientTest, SubmitBackground) {
    const auto handle = client.submit_background("reverse", "abc");
    write_response(Command::JOB_CREATED, "H:lap:4");
    ASSERT_TRUE(handle.is_resolved());
    EXPECT_EQ(*handle.get_value(), "H:lap:4");
    EXPECT_EQ(client.get_job_count(), 0u);
}

TEST_F(ClientTest, ErrorReplyRejectsSubmit) {
    const auto submitted = client.submit("reverse", "abc");
    write_response(Command::ERROR, "ERR_QUEUE_FULL\0queue is full"s);
    ASSERT_TRUE(submitted.is_rejected());
    EXPECT_EQ(submitted.get_error()->kind, ErrorKind::ServerError);
    EXPECT_EQ(submitted.get_error()->message, "ERR_QUEUE_FULL: queue is full");
}

TEST_F(ClientTest, GetStatus) {
    const auto status = client.get_status("H:lap:5");
    const auto f      = next_sent();
    EXPECT_EQ(f.command, Command::GET_STATUS);
    EXPECT_EQ(to_string(f.payload), "H:lap:5");

    write_response(Command::STATUS_RES, "H:lap:5\0" "1\0" "1\0" "42\0" "100"s);
    ASSERT_TRUE(status.is_resolved());
    const auto& s = *status.get_value();
    EXPECT_EQ(s.handle, "H:lap:5");
    EXPECT_TRUE(s.known);
    EXPECT_TRUE(s.running);
    EXPECT_EQ(s.numerator, 42u);
    EXPECT_EQ(s.denominator, 100u);
}

TEST_F(ClientTest, MalformedStatusIsRejected) {
    const auto status = client.get_status("H:lap:5");
    write_response(Command::STATUS_RES, "H:lap:5\0" "1"s);
    ASSERT_TRUE(status.is_rejected());
    EXPECT_EQ(status.get_error()->kind, ErrorKind::UnexpectedReply);
}

TEST_F(ClientTest, ConnectionLossRejectsSubmit) {
    const auto submitted = client.submit("reverse", "abc");
    connection.on_connection_lost("peer closed");
    ASSERT_TRUE(submitted.is_rejected());
    EXPECT_EQ(submitted.get_error()->kind, ErrorKind::ConnectionLost);
}

TEST_F(ClientTest, ConnectionLossRejectsOutstandingJobs) {
    const auto job = submit_and_create("H:lap:6");
    ASSERT_NE(job, nullptr);
    connection.on_connection_lost("peer closed");
    ASSERT_TRUE(job->get_result().is_rejected());
    EXPECT_EQ(job->get_result().get_error()->kind, ErrorKind::ConnectionLost);
    EXPECT_EQ(client.get_job_count(), 0u);
}
} // namespace xgear::test
