#include <gtest/gtest.h>
#include "inkwell/core/types.hpp"
#include "inkwell/core/string.hpp"

using namespace inkwell;

// ============================================================================
// Result Tests
// ============================================================================

TEST(ResultTest, OkResult) {
    Result<f64, String> result = 12.5;

    EXPECT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_err());
    EXPECT_TRUE(static_cast<bool>(result));
    EXPECT_DOUBLE_EQ(result.value(), 12.5);
}

TEST(ResultTest, ErrorResult) {
    Result<f64, String> result = make_error(String("not a number"));

    EXPECT_FALSE(result.is_ok());
    EXPECT_TRUE(result.is_err());
    EXPECT_FALSE(static_cast<bool>(result));
    EXPECT_EQ(result.error(), "not a number");
}

TEST(ResultTest, ValueOr) {
    Result<int, String> ok_result = 42;
    Result<int, String> err_result = make_error(String("error"));

    EXPECT_EQ(ok_result.value_or(0), 42);
    EXPECT_EQ(err_result.value_or(0), 0);
}

TEST(ResultTest, MapKeepsError) {
    Result<int, String> ok_result = 21;
    Result<int, String> err_result = make_error(String("bad"));

    auto doubled = ok_result.map([](int x) { return x * 2; });
    auto untouched = err_result.map([](int x) { return x * 2; });

    ASSERT_TRUE(doubled.is_ok());
    EXPECT_EQ(doubled.value(), 42);
    ASSERT_TRUE(untouched.is_err());
    EXPECT_EQ(untouched.error(), "bad");
}

TEST(ResultTest, StringValueAndStringError) {
    // Same payload type on both sides must stay distinguishable
    Result<String, String> ok_result = String("value");
    Result<String, String> err_result = make_error(String("failure"));

    ASSERT_TRUE(ok_result.is_ok());
    EXPECT_EQ(ok_result.value(), "value");
    ASSERT_TRUE(err_result.is_err());
    EXPECT_EQ(err_result.error(), "failure");
}

TEST(ResultTest, VoidResult) {
    Result<void, String> ok_result;
    Result<void, String> err_result = make_error(String("error"));

    EXPECT_TRUE(ok_result.is_ok());
    EXPECT_TRUE(err_result.is_err());
    EXPECT_EQ(err_result.error(), "error");
}
