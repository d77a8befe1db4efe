#ifndef LEDGER_STORE_H
#define LEDGER_STORE_H

#include <leveldb/db.h>

#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include "address.h"
#include "amount.h"
#include "ledgerEnvironment.h"
#include "refundContract.h"

// leveldb persistence of one refund ledger
//   'r' -> merkle root             'o' -> owner
//   'd' -> deadline (u64 BE)       'p' -> flags
//   'b' -> balance (32 bytes)      'n' -> event count (u64 BE)
//   'g' -> digest name
//   'c' + address -> claimed       'a' + address -> total paid to that account
//   'e' + seq (u64 BE) -> type | address | amount
class LedgerStore {
    private:
        std::unique_ptr<leveldb::DB> db;

        explicit LedgerStore(std::unique_ptr<leveldb::DB> db);

        std::string get(const std::string& key) const;

    public:
        ~LedgerStore() = default;

        // prevent copying
        LedgerStore(const LedgerStore&) = delete;
        LedgerStore& operator=(const LedgerStore&) = delete;

        static bool Exists(const std::string& path);

        // fails if a ledger already lives at path
        static std::unique_ptr<LedgerStore> Create(const std::string& path,
                                                   const RefundState& state);
        static std::unique_ptr<LedgerStore> Open(const std::string& path);

        RefundState Load() const;

        // writes the state and adds the payouts to the account totals, in one batch
        void Save(const RefundState& state, const std::map<Address, Amount>& payouts = {});

        Amount GetPayouts(const Address& account) const;
};

// environment for ledger calls made from the command line: a fixed timestamp and
// transfers that always succeed, collected until they are saved
class StoreEnvironment : public LedgerEnvironment {
    private:
        uint64_t now;
        std::map<Address, Amount> pendingPayouts;

    public:
        explicit StoreEnvironment(uint64_t now);

        static uint64_t WallClock();

        uint64_t Now() const override { return now; }
        bool Transfer(const Address& to, const Amount& amount) override;

        const std::map<Address, Amount>& GetPendingPayouts() const { return pendingPayouts; }
};

#endif
