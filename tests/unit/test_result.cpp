/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E> and Error context chaining.
 */

#include "core/result.hpp"

#include <gtest/gtest.h>

using namespace fleet_usage;

TEST(ResultTest, SuccessValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 42);
}

TEST(ResultTest, ErrorValue) {
    Result<int> r = Error{ErrorKind::Connection, "host unreachable"};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::Connection);
    EXPECT_EQ(r.error().message, "host unreachable");
}

TEST(ResultTest, PlainErrorIsGeneric) {
    Error e{"oops"};
    EXPECT_EQ(e.kind, ErrorKind::Generic);
    EXPECT_EQ(e.root_cause(), "oops");
}

TEST(ResultTest, ValueOr) {
    Result<int> success = 42;
    Result<int> failure = Error{"fail"};
    EXPECT_EQ(success.value_or(0), 42);
    EXPECT_EQ(failure.value_or(0), 0);
}

TEST(ResultTest, MapAndThen) {
    Result<int> r = 21;
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_TRUE(doubled.has_value());
    EXPECT_EQ(*doubled, 42);

    auto failed = doubled.and_then([](int) -> Result<int> { return Error{"nope"}; });
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().message, "nope");
}

TEST(ResultTest, VoidResult) {
    Result<void> ok;
    Result<void> bad = Error{ErrorKind::Persistence, "disk full"};
    EXPECT_TRUE(ok.has_value());
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().kind, ErrorKind::Persistence);
}

TEST(ErrorTest, ContextKeepsRootCause) {
    Error inner{ErrorKind::Connection, "connection refused"};
    auto wrapped = inner.context("sampler on m2 failed").context("gather");

    EXPECT_EQ(wrapped.kind, ErrorKind::Connection);
    EXPECT_EQ(wrapped.message, "gather: sampler on m2 failed: connection refused");
    EXPECT_EQ(wrapped.root_cause(), "connection refused");
}

TEST(ErrorTest, KindNames) {
    EXPECT_EQ(to_string(ErrorKind::Config), "config");
    EXPECT_EQ(to_string(ErrorKind::Deserialization), "deserialization");
    EXPECT_EQ(to_string(ErrorKind::ViewerRead), "viewer_read");
}

TEST(ErrorTest, MakeError) {
    auto r = make_error<std::string>(ErrorKind::Config, "bad line");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::Config);
}
