#include "merkleTree.h"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "refundError.h"
#include "serialization.h"

MerkleTree::MerkleTree(std::vector<Hash> leaves) {
    if (leaves.empty()) {
        throw RefundError(RefundErrorCode::EmptyCommitmentSet);
    }

    // sorting the leaves makes the root independent of input order
    std::sort(leaves.begin(), leaves.end());
    leaves.erase(std::unique(leaves.begin(), leaves.end()), leaves.end());

    levels.push_back(std::move(leaves));

    // reduce level by level until we reach the single root
    while (levels.back().size() > 1) {
        const std::vector<Hash>& currentLevel = levels.back();

        std::vector<Hash> nextLevel;
        nextLevel.reserve((currentLevel.size() + 1) / 2);
        for (size_t i = 0; i + 1 < currentLevel.size(); i += 2) {
            nextLevel.push_back(HashSortedPair(currentLevel[i], currentLevel[i + 1]));
        }

        // odd node out moves up unpaired
        if (currentLevel.size() % 2 != 0) {
            nextLevel.push_back(currentLevel.back());
        }

        levels.push_back(std::move(nextLevel));
    }
}

std::optional<size_t> MerkleTree::FindLeaf(const Hash& leaf) const {
    const std::vector<Hash>& leaves = levels.front();
    auto it = std::lower_bound(leaves.begin(), leaves.end(), leaf);
    if (it == leaves.end() || *it != leaf) {
        return std::nullopt;
    }
    return static_cast<size_t>(it - leaves.begin());
}

MerkleProof MerkleTree::GenerateProof(size_t leafIndex) const {
    if (leafIndex >= levels[0].size()) {
        throw std::out_of_range("leafIndex " + std::to_string(leafIndex) +
                                " out of range (leaf level has " +
                                std::to_string(levels[0].size()) + " entries)");
    }

    MerkleProof proof;
    proof.leaf = levels[0][leafIndex];
    proof.merkleRoot = GetRootHash();

    size_t idx = leafIndex;

    // walk from the leaf level up, collecting the sibling at each level
    for (size_t level = 0; level + 1 < levels.size(); level++) {
        const auto& currentLevel = levels[level];
        size_t siblingIdx = idx ^ 1;

        // a promoted node has no sibling at this level
        if (siblingIdx < currentLevel.size()) {
            proof.path.push_back(currentLevel[siblingIdx]);
        }

        idx /= 2;
    }

    return proof;
}

MerkleProof MerkleTree::GenerateProof(const Hash& leaf) const {
    std::optional<size_t> index = FindLeaf(leaf);
    if (!index) {
        throw RefundError(RefundErrorCode::LeafNotFound,
                          "Leaf " + HashToHex(leaf) + " is not part of the commitment set");
    }
    return GenerateProof(*index);
}

MerkleProof MerkleTree::GenerateProof(const Address& address, const Amount& amount) const {
    Hash leaf = EncodeLeaf(address, amount);
    std::optional<size_t> index = FindLeaf(leaf);
    if (!index) {
        throw RefundError(RefundErrorCode::LeafNotFound,
                          "No leaf for " + AddressToString(address) + " with amount " +
                              amount.ToString());
    }
    return GenerateProof(*index);
}

bool MerkleTree::VerifyProof(const MerkleProof& proof) { return VerifyMerkleProof(proof); }
