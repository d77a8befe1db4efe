#ifndef REFUNDERROR_H
#define REFUNDERROR_H

#include <exception>
#include <stdexcept>
#include <string>

enum class ErrorCategory {
    InvalidInput,
    Unauthorized,
    TemporalViolation,
    StateConflict,
    ProofMismatch,
    ResourceExhausted,
    TransferFailure,
};

enum class RefundErrorCode {
    // input validation
    EmptyRoot,
    InvalidAmountFormat,
    AmountOverflow,
    InvalidAddress,
    InvalidHash,
    EmptyCommitmentSet,
    DuplicateAddress,

    // ledger rules
    Unauthorized,
    PeriodOver,
    PeriodNotOver,
    AlreadyClaimed,
    ReentrantCall,
    InvalidProof,
    LeafNotFound,
    InsufficientFunds,
    TransferFailed,
};

// every rejection raised by the builder or the refund ledger
class RefundError : public std::runtime_error {
    private:
        RefundErrorCode code;

    public:
        RefundError(RefundErrorCode code, const std::string& message);
        explicit RefundError(RefundErrorCode code);

        RefundErrorCode GetCode() const { return code; }
        ErrorCategory GetCategory() const;
};

ErrorCategory CategoryOf(RefundErrorCode code);

// default message, matches the ledger revert strings
const char* DefaultMessage(RefundErrorCode code);

const char* CategoryName(ErrorCategory category);

// one line for the command line: "Error [Category]: what" for a RefundError,
// "Error: what" for anything else
std::string ErrorReport(const std::exception& e);

#endif
