#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "refundError.h"

TEST(RefundErrorTest, CodesMapToCategories) {
    EXPECT_EQ(CategoryOf(RefundErrorCode::EmptyRoot), ErrorCategory::InvalidInput);
    EXPECT_EQ(CategoryOf(RefundErrorCode::DuplicateAddress), ErrorCategory::InvalidInput);
    EXPECT_EQ(CategoryOf(RefundErrorCode::Unauthorized), ErrorCategory::Unauthorized);
    EXPECT_EQ(CategoryOf(RefundErrorCode::PeriodNotOver), ErrorCategory::TemporalViolation);
    EXPECT_EQ(CategoryOf(RefundErrorCode::ReentrantCall), ErrorCategory::StateConflict);
    EXPECT_EQ(CategoryOf(RefundErrorCode::LeafNotFound), ErrorCategory::ProofMismatch);
    EXPECT_EQ(CategoryOf(RefundErrorCode::InsufficientFunds), ErrorCategory::ResourceExhausted);
    EXPECT_EQ(CategoryOf(RefundErrorCode::TransferFailed), ErrorCategory::TransferFailure);
}

TEST(RefundErrorTest, DefaultMessageIsTheRevertString) {
    RefundError error(RefundErrorCode::PeriodOver);
    EXPECT_STREQ(error.what(), "Refund period over");
    EXPECT_EQ(error.GetCategory(), ErrorCategory::TemporalViolation);
}

TEST(RefundErrorTest, ReportNamesTheCategoryOfRefundErrors) {
    RefundError error(RefundErrorCode::Unauthorized);
    EXPECT_EQ(ErrorReport(error), "Error [Unauthorized]: Ownable: caller is not the owner");

    RefundError custom(RefundErrorCode::InvalidAddress, "Invalid address: 0x12");
    EXPECT_EQ(ErrorReport(custom), "Error [InvalidInput]: Invalid address: 0x12");
}

TEST(RefundErrorTest, ReportOfOtherExceptionsHasNoCategory) {
    std::runtime_error io("No refund ledger found at data/ledger");
    EXPECT_EQ(ErrorReport(io), "Error: No refund ledger found at data/ledger");

    std::invalid_argument usage("claim requires -proof flag");
    EXPECT_EQ(ErrorReport(usage), "Error: claim requires -proof flag");
}
