#include "merkleProof.h"

Hash EncodeLeaf(const std::string& algorithm, const Address& address, const Amount& amount) {
    std::vector<uint8_t> encoded;
    encoded.reserve(Refund::ADDRESS_SIZE + Refund::AMOUNT_SIZE);
    encoded.insert(encoded.end(), address.begin(), address.end());

    std::vector<uint8_t> amountBytes = amount.ToBytes();
    encoded.insert(encoded.end(), amountBytes.begin(), amountBytes.end());

    return HashBytes(algorithm, encoded);
}

Hash EncodeLeaf(const Address& address, const Amount& amount) {
    return EncodeLeaf(Config::GetDigestName(), address, amount);
}

Hash ProcessProof(const std::string& algorithm, const std::vector<Hash>& path, const Hash& leaf) {
    Hash current = leaf;

    // no left/right flag needed, each pair is ordered by value
    for (const Hash& sibling : path) {
        current = HashSortedPair(algorithm, current, sibling);
    }

    return current;
}

bool VerifyMerkleProof(const std::string& algorithm, const std::vector<Hash>& path,
                       const Hash& root, const Hash& leaf) {
    return ProcessProof(algorithm, path, leaf) == root;
}

bool VerifyMerkleProof(const std::vector<Hash>& path, const Hash& root, const Hash& leaf) {
    return VerifyMerkleProof(Config::GetDigestName(), path, root, leaf);
}

bool VerifyMerkleProof(const MerkleProof& proof) {
    return VerifyMerkleProof(proof.path, proof.merkleRoot, proof.leaf);
}
