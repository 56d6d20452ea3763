#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "../src/eventual.hpp"

namespace xgear {
TEST(Eventual, ResolveRunsContinuations) {
    auto e      = Eventual<int>();
    auto values = std::vector<int>();
    e.then([&values](const int v) { values.push_back(v); });
    e.then([&values](const int v) { values.push_back(v * 2); });
    EXPECT_FALSE(e.is_settled());
    EXPECT_TRUE(e.resolve(21));
    EXPECT_EQ(values, (std::vector<int>{21, 42}));
    EXPECT_TRUE(e.is_resolved());
    ASSERT_NE(e.get_value(), nullptr);
    EXPECT_EQ(*e.get_value(), 21);
}

TEST(Eventual, SettlesOnlyOnce) {
    auto e     = Eventual<int>();
    auto calls = 0;
    e.then([&calls](int) { calls += 1; }, [&calls](const Error&) { calls += 100; });
    EXPECT_TRUE(e.resolve(1));
    EXPECT_FALSE(e.resolve(2));
    EXPECT_FALSE(e.reject(Error{ErrorKind::ConnectionLost, "late"}));
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(*e.get_value(), 1);
    EXPECT_EQ(e.get_error(), nullptr);
}

TEST(Eventual, RejectCarriesError) {
    auto e    = Eventual<std::string>();
    auto seen = std::string();
    e.then(nullptr, [&seen](const Error& err) { seen = describe(err); });
    EXPECT_TRUE(e.reject(Error{ErrorKind::ServerError, "1: boom"}));
    EXPECT_TRUE(e.is_rejected());
    EXPECT_EQ(e.get_error()->kind, ErrorKind::ServerError);
    EXPECT_EQ(seen, "server error: 1: boom");
}

TEST(Eventual, ThenAfterSettleRunsImmediately) {
    const auto e = Eventual<int>();
    e.resolve(5);
    auto got = 0;
    e.then([&got](const int v) { got = v; });
    EXPECT_EQ(got, 5);

    const auto r      = Eventual<int>::rejected(Error{ErrorKind::NotConnected, "ECHO_REQ"});
    auto       failed = false;
    r.then([](int) {}, [&failed](const Error&) { failed = true; });
    EXPECT_TRUE(failed);
}

TEST(Eventual, CopiesShareState) {
    const auto a = Trigger();
    const auto b = a;
    EXPECT_TRUE(a.shares_state(b));
    EXPECT_FALSE(a.shares_state(Trigger()));
    b.resolve({});
    EXPECT_TRUE(a.is_resolved());
}

TEST(Eventual, ContinuationMayChainAnotherEventual) {
    const auto first  = Eventual<int>();
    const auto second = Eventual<std::string>();
    first.then([second](const int v) { second.resolve(std::to_string(v)); });
    auto out = std::string();
    second.then([&out](const std::string& s) { out = s; });
    first.resolve(7);
    EXPECT_EQ(out, "7");
}
} // namespace xgear
