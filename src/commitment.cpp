#include "commitment.h"

#include <fstream>
#include <stdexcept>
#include <utility>

#include "merkleProof.h"
#include "refundError.h"
#include "serialization.h"

static MerkleTree buildTree(const std::map<Address, CommitmentEntry>& entries) {
    std::vector<Hash> leaves;
    leaves.reserve(entries.size());
    for (const auto& [address, entry] : entries) {
        leaves.push_back(entry.leaf);
    }
    return MerkleTree(std::move(leaves));
}

Commitment::Commitment(uint32_t decimals, std::map<Address, CommitmentEntry> entries,
                       MerkleTree tree)
    : decimals(decimals), entries(std::move(entries)), tree(std::move(tree)) {}

Commitment Commitment::Build(const std::map<std::string, std::string>& investors,
                             uint32_t decimals) {
    std::map<Address, Amount> amounts;

    for (const auto& [addressText, decimalAmount] : investors) {
        Address address = ParseAddress(addressText);
        Amount amount;
        try {
            amount = Amount::ParseUnits(decimalAmount, decimals);
        } catch (const RefundError& e) {
            throw RefundError(e.GetCode(), std::string(e.what()) + " for " + addressText);
        }

        // the same account spelled in two different cases
        if (!amounts.emplace(address, amount).second) {
            throw RefundError(RefundErrorCode::DuplicateAddress,
                              "Duplicate address in commitment set: " + addressText);
        }
    }

    return Build(amounts, decimals);
}

Commitment Commitment::Build(const std::map<Address, Amount>& amounts, uint32_t decimals) {
    std::map<Address, CommitmentEntry> entries;
    for (const auto& [address, amount] : amounts) {
        entries.emplace(address, CommitmentEntry{address, amount, EncodeLeaf(address, amount)});
    }

    MerkleTree tree = buildTree(entries);
    return Commitment(decimals, std::move(entries), std::move(tree));
}

std::map<std::string, std::string> Commitment::ParseInvestorTable(const json& table) {
    if (!table.is_object()) {
        throw std::invalid_argument("Investor table must be a JSON object of address -> amount");
    }

    std::map<std::string, std::string> investors;
    for (const auto& [address, amount] : table.items()) {
        // numbers would go through a double and lose precision
        if (!amount.is_string()) {
            throw RefundError(RefundErrorCode::InvalidAmountFormat,
                              "Amount for " + address + " must be a decimal string");
        }
        investors[address] = amount.get<std::string>();
    }
    return investors;
}

std::map<std::string, std::string> Commitment::LoadInvestorTable(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open investor table: " + path);
    }

    json table;
    try {
        file >> table;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Malformed investor table " + path + ": " + e.what());
    }

    return ParseInvestorTable(table);
}

std::string Commitment::GetHexRoot() const { return HashToHex(GetRoot()); }

Amount Commitment::GetTotal() const {
    Amount total;
    for (const auto& [address, entry] : entries) {
        total += entry.amount;
    }
    return total;
}

const CommitmentEntry& Commitment::GetEntry(const Address& address) const {
    auto it = entries.find(address);
    if (it == entries.end()) {
        throw RefundError(RefundErrorCode::LeafNotFound,
                          "Address not in commitment set: " + AddressToString(address));
    }
    return it->second;
}

std::vector<Hash> Commitment::GetProof(const Address& address, const Amount& amount) const {
    return tree.GenerateProof(address, amount).path;
}

std::vector<std::string> Commitment::GetHexProof(const std::string& address) const {
    const CommitmentEntry& entry = GetEntry(ParseAddress(address));
    return HashesToHex(GetProof(entry.address, entry.amount));
}

json Commitment::ToJson() const {
    json claims = json::object();
    for (const auto& [address, entry] : entries) {
        claims[AddressToString(address)] = {
            {"amount", entry.amount.ToString()},
            {"leaf", HashToHex(entry.leaf)},
            {"proof", HashesToHex(GetProof(entry.address, entry.amount))},
        };
    }

    return {
        {"merkleRoot", GetHexRoot()},
        {"decimals", decimals},
        {"digest", Config::GetDigestName()},
        {"total", GetTotal().ToString()},
        {"claims", claims},
    };
}

void Commitment::SaveToFile(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write commitment file: " + path);
    }
    file << ToJson().dump(4) << std::endl;
    if (!file) {
        throw std::runtime_error("Error writing commitment file: " + path);
    }
}
