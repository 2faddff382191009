#include "offload/core/error.hpp"

#include <cerrno>
#include <gtest/gtest.h>
#include <system_error>

namespace {

TEST(error_test, maps_errno_values_into_system_category) {
    const auto interrupted = offload::make_error_from_errno(EINTR);
    const auto missing = offload::make_error_from_errno(ENOENT);

    EXPECT_EQ(interrupted.value(), EINTR);
    EXPECT_EQ(missing.value(), ENOENT);
    EXPECT_EQ(missing.code().category(), std::system_category());
}

TEST(error_test, uses_current_errno_by_default) {
    errno = ETIMEDOUT;
    const auto value = offload::error::from_errno();

    EXPECT_EQ(value.value(), ETIMEDOUT);
    EXPECT_FALSE(value.message().empty());
}

TEST(error_test, explicit_message_wins_over_category_message) {
    const auto failure = offload::make_error("boom");

    EXPECT_EQ(failure.message(), "boom");
    EXPECT_EQ(failure.code(), offload::work_errc::failed);
    EXPECT_FALSE(failure.is_cancellation());
}

TEST(error_test, cancellation_code_is_recognised) {
    const auto cancelled = offload::make_error(offload::work_errc::cancelled);

    EXPECT_TRUE(cancelled.is_cancellation());
    EXPECT_EQ(cancelled.message(), "operation cancelled");
    EXPECT_STREQ(cancelled.code().category().name(), "offload");
}

TEST(error_test, errno_ecanceled_is_not_the_cancellation_signal) {
    const auto system_cancel = offload::make_error_from_errno(ECANCELED);
    EXPECT_FALSE(system_cancel.is_cancellation());
}

TEST(error_test, work_errc_converts_to_error_code) {
    const std::error_code code = offload::work_errc::pool_closed;
    EXPECT_EQ(code.category(), offload::work_category());
    EXPECT_EQ(code.message(), "worker pool is shut down");
}

} // namespace
