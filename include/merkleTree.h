#ifndef MERKLETREE_H
#define MERKLETREE_H

#include <cstddef>
#include <optional>
#include <vector>

#include "address.h"
#include "amount.h"
#include "crypto.h"
#include "merkleProof.h"

// the tree is stored as a flat list of levels:
// levels[0] = leaf hashes, de-duplicated and sorted ascending
// levels[1] = sorted pair hashes of levels[0], an odd last node is promoted as is
// levels[N] = [ root hash ]
class MerkleTree {
    private:
        std::vector<std::vector<Hash>> levels;

    public:
        // throws RefundError(EmptyCommitmentSet) on an empty input
        explicit MerkleTree(std::vector<Hash> leaves);

        ~MerkleTree() = default;

        // prevent copying
        MerkleTree(const MerkleTree&) = delete;
        MerkleTree& operator=(const MerkleTree&) = delete;

        MerkleTree(MerkleTree&&) = default;
        MerkleTree& operator=(MerkleTree&&) = default;

        const Hash& GetRootHash() const { return levels.back()[0]; }
        const std::vector<Hash>& GetLeaves() const { return levels.front(); }
        size_t GetLeafCount() const { return levels.front().size(); }

        // number of hashing rounds between a leaf and the root
        size_t GetDepth() const { return levels.size() - 1; }

        std::optional<size_t> FindLeaf(const Hash& leaf) const;

        MerkleProof GenerateProof(size_t leafIndex) const;

        // throws RefundError(LeafNotFound) if the leaf is not committed
        MerkleProof GenerateProof(const Hash& leaf) const;
        MerkleProof GenerateProof(const Address& address, const Amount& amount) const;

        static bool VerifyProof(const MerkleProof& proof);
};

#endif
