#include "refundContract.h"

#include <iostream>
#include <limits>
#include <stdexcept>
#include <utility>

#include "merkleProof.h"
#include "refundError.h"

// checked-then-set flag around a whole operation
class RefundContract::EntryGuard {
    private:
        bool& entered;

    public:
        explicit EntryGuard(bool& entered) : entered(entered) {
            if (entered) {
                throw RefundError(RefundErrorCode::ReentrantCall);
            }
            entered = true;
        }
        ~EntryGuard() { entered = false; }

        EntryGuard(const EntryGuard&) = delete;
        EntryGuard& operator=(const EntryGuard&) = delete;
};

RefundContract::RefundContract(RefundState restored) : state(std::move(restored)) {
    if (IsZeroHash(state.merkleRoot)) {
        throw RefundError(RefundErrorCode::EmptyRoot);
    }
    if (state.digest.empty()) {
        throw std::invalid_argument("Ledger digest is not set");
    }
    state.entered = false;
}

RefundContract RefundContract::Create(const LedgerEnvironment& env, const Address& creator,
                                      const Hash& merkleRoot, const RefundParams& params) {
    if (IsZeroHash(merkleRoot)) {
        throw RefundError(RefundErrorCode::EmptyRoot);
    }

    uint64_t now = env.Now();
    if (params.refundPeriod > std::numeric_limits<uint64_t>::max() - now) {
        throw std::invalid_argument("Refund period overflows the deadline");
    }

    // fails early for a name OpenSSL does not know or a digest that is not 32 bytes
    HashBytes(params.digest, {});

    RefundState state;
    state.merkleRoot = merkleRoot;
    state.owner = creator;
    state.refundDeadline = now + params.refundPeriod;
    state.digest = params.digest;
    state.rollbackClaimOnTransferFailure = params.rollbackClaimOnTransferFailure;

    return RefundContract(std::move(state));
}

void RefundContract::Receive(const Address& from, const Amount& amount) {
    state.balance += amount;
    std::cout << "[ledger] Received " << amount.ToString() << " from " << AddressToString(from)
              << std::endl;
}

bool RefundContract::payOut(LedgerEnvironment& env, const Address& to, const Amount& amount) {
    if (state.balance < amount) {
        return false;
    }

    // the recipient observes the debited balance if it calls back in
    state.balance -= amount;

    bool sent = false;
    try {
        sent = env.Transfer(to, amount);
    } catch (const std::exception& e) {
        // a throwing recipient counts as a refused payment
        std::cerr << "[ledger] Transfer to " << AddressToString(to) << " raised: " << e.what()
                  << std::endl;
        sent = false;
    }

    if (!sent) {
        state.balance += amount;
    }
    return sent;
}

void RefundContract::ClaimRefund(LedgerEnvironment& env, const Address& caller,
                                 const std::vector<Hash>& proof, const Amount& amount) {
    EntryGuard guard(state.entered);

    if (env.Now() > state.refundDeadline) {
        throw RefundError(RefundErrorCode::PeriodOver);
    }

    if (IsClaimed(caller)) {
        throw RefundError(RefundErrorCode::AlreadyClaimed);
    }

    Hash leaf = EncodeLeaf(state.digest, caller, amount);
    if (!VerifyMerkleProof(state.digest, proof, state.merkleRoot, leaf)) {
        throw RefundError(RefundErrorCode::InvalidProof);
    }

    // must be recorded before the payout, the recipient can call back in
    state.claimed.insert(caller);

    if (!payOut(env, caller, amount)) {
        if (state.rollbackClaimOnTransferFailure) {
            state.claimed.erase(caller);
        } else {
            std::cerr << "[ledger] Refund of " << amount.ToString() << " to "
                      << AddressToString(caller)
                      << " failed, claim stays recorded and cannot be retried" << std::endl;
        }
        throw RefundError(RefundErrorCode::TransferFailed);
    }

    state.events.push_back({RefundEventType::Refunded, caller, amount});
}

void RefundContract::Withdraw(LedgerEnvironment& env, const Address& caller,
                              const Amount& amount) {
    EntryGuard guard(state.entered);

    if (caller != state.owner) {
        throw RefundError(RefundErrorCode::Unauthorized);
    }

    if (env.Now() <= state.refundDeadline) {
        throw RefundError(RefundErrorCode::PeriodNotOver);
    }

    if (state.balance < amount) {
        throw RefundError(RefundErrorCode::InsufficientFunds);
    }

    if (!payOut(env, state.owner, amount)) {
        throw RefundError(RefundErrorCode::TransferFailed);
    }

    state.events.push_back({RefundEventType::Withdrawn, state.owner, amount});
}

bool RefundContract::IsClaimed(const Address& account) const {
    return state.claimed.count(account) > 0;
}

bool RefundContract::IsActive(const LedgerEnvironment& env) const {
    return env.Now() <= state.refundDeadline;
}
