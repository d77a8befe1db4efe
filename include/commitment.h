#ifndef COMMITMENT_H
#define COMMITMENT_H

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "address.h"
#include "amount.h"
#include "crypto.h"
#include "merkleTree.h"

using json = nlohmann::json;

struct CommitmentEntry {
        Address address;
        Amount amount;  // scaled to the smallest unit
        Hash leaf;
};

// off-chain side: investor table -> Merkle root + one proof per investor
class Commitment {
    private:
        uint32_t decimals;
        std::map<Address, CommitmentEntry> entries;
        MerkleTree tree;

        Commitment(uint32_t decimals, std::map<Address, CommitmentEntry> entries, MerkleTree tree);

    public:
        // address string -> decimal amount string, e.g. {"0xF525...": "1.25"}
        static Commitment Build(const std::map<std::string, std::string>& investors,
                                uint32_t decimals = Refund::DEFAULT_DECIMALS);

        // amounts already in smallest units
        static Commitment Build(const std::map<Address, Amount>& amounts,
                                uint32_t decimals = Refund::DEFAULT_DECIMALS);

        // JSON object file mapping address -> decimal amount string
        static std::map<std::string, std::string> LoadInvestorTable(const std::string& path);
        static std::map<std::string, std::string> ParseInvestorTable(const json& table);

        const Hash& GetRoot() const { return tree.GetRootHash(); }
        std::string GetHexRoot() const;

        uint32_t GetDecimals() const { return decimals; }
        size_t Size() const { return entries.size(); }
        const MerkleTree& GetTree() const { return tree; }

        // sum of every committed amount, what the ledger must be funded with
        Amount GetTotal() const;

        // throws RefundError(LeafNotFound) for an address outside the set
        const CommitmentEntry& GetEntry(const Address& address) const;

        std::vector<Hash> GetProof(const Address& address, const Amount& amount) const;
        std::vector<std::string> GetHexProof(const std::string& address) const;

        json ToJson() const;
        void SaveToFile(const std::string& path) const;
};

#endif
