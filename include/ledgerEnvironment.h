#ifndef LEDGER_ENVIRONMENT_H
#define LEDGER_ENVIRONMENT_H

#include <cstdint>

#include "address.h"
#include "amount.h"

// what the refund ledger needs from the chain it runs on
class LedgerEnvironment {
    public:
        virtual ~LedgerEnvironment() = default;

        // current block timestamp in seconds
        virtual uint64_t Now() const = 0;

        // pays amount of native currency to the recipient, false when the payment is refused.
        // the recipient may call back into the ledger before this returns
        virtual bool Transfer(const Address& to, const Amount& amount) = 0;
};

#endif
