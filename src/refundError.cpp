#include "refundError.h"

RefundError::RefundError(RefundErrorCode code, const std::string& message)
    : std::runtime_error(message), code(code) {}

RefundError::RefundError(RefundErrorCode code) : RefundError(code, DefaultMessage(code)) {}

ErrorCategory RefundError::GetCategory() const { return CategoryOf(code); }

ErrorCategory CategoryOf(RefundErrorCode code) {
    switch (code) {
        case RefundErrorCode::EmptyRoot:
        case RefundErrorCode::InvalidAmountFormat:
        case RefundErrorCode::AmountOverflow:
        case RefundErrorCode::InvalidAddress:
        case RefundErrorCode::InvalidHash:
        case RefundErrorCode::EmptyCommitmentSet:
        case RefundErrorCode::DuplicateAddress:
            return ErrorCategory::InvalidInput;
        case RefundErrorCode::Unauthorized:
            return ErrorCategory::Unauthorized;
        case RefundErrorCode::PeriodOver:
        case RefundErrorCode::PeriodNotOver:
            return ErrorCategory::TemporalViolation;
        case RefundErrorCode::AlreadyClaimed:
        case RefundErrorCode::ReentrantCall:
            return ErrorCategory::StateConflict;
        case RefundErrorCode::InvalidProof:
        case RefundErrorCode::LeafNotFound:
            return ErrorCategory::ProofMismatch;
        case RefundErrorCode::InsufficientFunds:
            return ErrorCategory::ResourceExhausted;
        case RefundErrorCode::TransferFailed:
            return ErrorCategory::TransferFailure;
    }
    return ErrorCategory::InvalidInput;
}

const char* DefaultMessage(RefundErrorCode code) {
    switch (code) {
        case RefundErrorCode::EmptyRoot:
            return "Merkle root cannot be empty";
        case RefundErrorCode::InvalidAmountFormat:
            return "Invalid amount format";
        case RefundErrorCode::AmountOverflow:
            return "Amount does not fit in 256 bits";
        case RefundErrorCode::InvalidAddress:
            return "Invalid address";
        case RefundErrorCode::InvalidHash:
            return "Invalid hash";
        case RefundErrorCode::EmptyCommitmentSet:
            return "Cannot build Merkle tree from an empty commitment set";
        case RefundErrorCode::DuplicateAddress:
            return "Duplicate address in commitment set";
        case RefundErrorCode::Unauthorized:
            return "Ownable: caller is not the owner";
        case RefundErrorCode::PeriodOver:
            return "Refund period over";
        case RefundErrorCode::PeriodNotOver:
            return "Refund period not over";
        case RefundErrorCode::AlreadyClaimed:
            return "Already claimed";
        case RefundErrorCode::ReentrantCall:
            return "ReentrancyGuard: reentrant call";
        case RefundErrorCode::InvalidProof:
            return "Invalid proof";
        case RefundErrorCode::LeafNotFound:
            return "Leaf not found in commitment set";
        case RefundErrorCode::InsufficientFunds:
            return "Insufficient funds";
        case RefundErrorCode::TransferFailed:
            return "Transfer failed";
    }
    return "Unknown refund error";
}

const char* CategoryName(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::InvalidInput:
            return "InvalidInput";
        case ErrorCategory::Unauthorized:
            return "Unauthorized";
        case ErrorCategory::TemporalViolation:
            return "TemporalViolation";
        case ErrorCategory::StateConflict:
            return "StateConflict";
        case ErrorCategory::ProofMismatch:
            return "ProofMismatch";
        case ErrorCategory::ResourceExhausted:
            return "ResourceExhausted";
        case ErrorCategory::TransferFailure:
            return "TransferFailure";
    }
    return "Unknown";
}

std::string ErrorReport(const std::exception& e) {
    if (const auto* refundError = dynamic_cast<const RefundError*>(&e)) {
        return std::string("Error [") + CategoryName(refundError->GetCategory()) + "]: " +
               e.what();
    }
    return std::string("Error: ") + e.what();
}
