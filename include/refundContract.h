#ifndef REFUND_CONTRACT_H
#define REFUND_CONTRACT_H

#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include "address.h"
#include "amount.h"
#include "config.h"
#include "crypto.h"
#include "ledgerEnvironment.h"

enum class RefundEventType : uint8_t {
    Refunded = 1,
    Withdrawn = 2,
};

struct RefundEvent {
        RefundEventType type;
        Address account;  // claimant or owner
        Amount amount;

        bool operator==(const RefundEvent& other) const {
            return type == other.type && account == other.account && amount == other.amount;
        }
};

struct RefundParams {
        uint64_t refundPeriod = Refund::REFUND_PERIOD;

        // leaf and node digest the root was built with, fixed for the ledger's lifetime
        std::string digest = Config::GetDigestName();

        // false keeps the claim recorded when the payout fails (the claimant cannot retry)
        bool rollbackClaimOnTransferFailure = false;
};

// everything the ledger keeps for one refund
struct RefundState {
        Hash merkleRoot{};
        Address owner{};
        uint64_t refundDeadline{0};
        Amount balance;
        std::string digest{Refund::DEFAULT_DIGEST};
        bool rollbackClaimOnTransferFailure{false};
        std::set<Address> claimed;
        std::vector<RefundEvent> events;

        // single-entry guard, only set while an operation is running
        bool entered{false};
};

// claim/withdraw state machine over a committed Merkle root.
// Active while Now() <= deadline, Expired after; evaluated on every call.
class RefundContract {
    private:
        RefundState state;

        class EntryGuard;

        // debits the balance and pays out; restores the debit on failure
        bool payOut(LedgerEnvironment& env, const Address& to, const Amount& amount);

    public:
        explicit RefundContract(RefundState state);
        ~RefundContract() = default;

        // prevent copying
        RefundContract(const RefundContract&) = delete;
        RefundContract& operator=(const RefundContract&) = delete;

        RefundContract(RefundContract&&) = default;
        RefundContract& operator=(RefundContract&&) = default;

        // throws RefundError(EmptyRoot) for the zero root, the creator becomes the owner.
        // An unusable digest throws std::runtime_error.
        static RefundContract Create(const LedgerEnvironment& env, const Address& creator,
                                     const Hash& merkleRoot, const RefundParams& params = {});

        // incoming funding, accepted at any time
        void Receive(const Address& from, const Amount& amount);

        void ClaimRefund(LedgerEnvironment& env, const Address& caller,
                         const std::vector<Hash>& proof, const Amount& amount);

        // owner only, once the refund period is over
        void Withdraw(LedgerEnvironment& env, const Address& caller, const Amount& amount);

        const Hash& GetMerkleRoot() const { return state.merkleRoot; }
        const Address& GetOwner() const { return state.owner; }
        uint64_t GetRefundDeadline() const { return state.refundDeadline; }
        const std::string& GetDigest() const { return state.digest; }
        const Amount& GetBalance() const { return state.balance; }
        const std::vector<RefundEvent>& GetEvents() const { return state.events; }
        const RefundState& GetState() const { return state; }

        bool IsClaimed(const Address& account) const;
        bool IsActive(const LedgerEnvironment& env) const;
};

#endif
