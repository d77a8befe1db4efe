#ifndef MERKLE_PROOF_H
#define MERKLE_PROOF_H

#include <string>
#include <vector>

#include "address.h"
#include "amount.h"
#include "crypto.h"

struct MerkleProof {
        Hash leaf;               // the commitment we want to verify
        std::vector<Hash> path;  // sibling hashes from the leaf up to the root
        Hash merkleRoot;         // the expected destination
};

// digest of address(20) | amount(32, big-endian), in that order
Hash EncodeLeaf(const std::string& algorithm, const Address& address, const Amount& amount);
Hash EncodeLeaf(const Address& address, const Amount& amount);

// folds the path into the leaf with sorted pair hashing
Hash ProcessProof(const std::string& algorithm, const std::vector<Hash>& path, const Hash& leaf);

// the overloads without an algorithm use Config::GetDigestName()
bool VerifyMerkleProof(const std::string& algorithm, const std::vector<Hash>& path,
                       const Hash& root, const Hash& leaf);
bool VerifyMerkleProof(const std::vector<Hash>& path, const Hash& root, const Hash& leaf);
bool VerifyMerkleProof(const MerkleProof& proof);

#endif
