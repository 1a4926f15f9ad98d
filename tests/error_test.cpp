// ============================================================================
// Error Code Tests
// ============================================================================

#include "coalesce/core/error.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace coalesce;

TEST(ErrorTest, MakeErrorCode) {
    std::error_code ec = make_error_code(Errc::Cancelled);
    EXPECT_TRUE(static_cast<bool>(ec));
    EXPECT_EQ(ec.value(), static_cast<int>(Errc::Cancelled));
    EXPECT_EQ(std::string(ec.category().name()), "coalesce");
}

TEST(ErrorTest, ErrorMessages) {
    EXPECT_EQ(make_error_code(Errc::JobFailed).message(), "Network job failed");
    EXPECT_EQ(make_error_code(Errc::Cancelled).message(), "Callback cancelled");
    EXPECT_EQ(make_error_code(Errc::InvalidKey).message(), "Invalid resource key");
    EXPECT_EQ(make_error_code(Errc::JobCreationFailed).message(), "Failed to create network job");
    EXPECT_EQ(make_error_code(Errc::InvalidResponse).message(), "Response rejected by validator");
    EXPECT_EQ(make_error_code(Errc::NoResponse).message(), "Job finished without a response");
    EXPECT_EQ(make_error_code(Errc::Shutdown).message(), "Downloader is shutting down");
}

TEST(ErrorTest, CategorySingleton) {
    EXPECT_EQ(&CoalesceCategory(), &CoalesceCategory());
}

TEST(ErrorTest, ImplicitConversionFromErrc) {
    Error ec = Errc::InvalidKey;
    EXPECT_TRUE(static_cast<bool>(ec));
    EXPECT_EQ(ec, Errc::InvalidKey);
    EXPECT_NE(ec, Errc::Cancelled);
}

TEST(ErrorTest, ForeignErrorsStayDistinct) {
    // Job errors from other categories are carried as-is
    Error job_error = std::make_error_code(std::errc::connection_reset);
    EXPECT_NE(job_error, Errc::JobFailed);
    EXPECT_EQ(job_error.category(), std::generic_category());
}

TEST(ErrorTest, UnknownErrorCodeMessage) {
    std::error_code ec = make_error_code(static_cast<Errc>(9999));
    EXPECT_EQ(ec.message(), "Unknown coalesce error");
}
