#ifndef SHARDAVAIL_MERKLE_MERKLE_TREE_HPP
#define SHARDAVAIL_MERKLE_MERKLE_TREE_HPP

#include <cstdint>
#include <stdexcept>
#include <vector>
#include "util/hashing.hpp"

namespace shardavail {
namespace merkle {

/*
  Merkle commitments over erasure-coded parts
  --------------------------------
  The chunk producer hashes every part (leaf = SHA-256(part bytes)), builds a
  binary Merkle tree over the leaves in part-index order and publishes the root
  in the chunk header. Each part travels with the sibling hashes on its path,
  so any node can check a single part against the header without holding the
  others.

  Tree shape:
   - level 0 is the leaves
   - a parent is SHA-256(left || right)
   - when a level has an odd count, the last node is promoted unchanged to the
     next level (it contributes no sibling to proofs at that level)
   - the single node of the last level is the root

  Proof format:
   - ordered sibling hashes, bottom-up; promoted levels contribute nothing
   - the verifier needs the leaf index and the leaf count to know, per level,
     whether the node was a left child, a right child or promoted

  THREAD-SAFETY:
   - Free functions over caller-owned data, no shared state.
*/

using util::hashing::Hash;

struct MerkleTree
{
    Hash root{};
    std::vector<std::vector<Hash>> levels;   ///< levels[0] = leaves, back() = {root}

    size_t leafCount() const { return levels.empty() ? 0 : levels.front().size(); }

    /*
      proofFor:
      - Collects the sibling hashes from leaf 'leafIndex' up to the root.
      - i ^ 1 is the sibling at each level; a missing sibling means the node was
        promoted and nothing is recorded for that level.
    */
    std::vector<Hash> proofFor(size_t leafIndex) const
    {
        if (leafIndex >= leafCount()) {
            throw std::out_of_range("MerkleTree::proofFor: leaf index " +
                                    std::to_string(leafIndex) + " out of range");
        }
        std::vector<Hash> path;
        size_t idx = leafIndex;
        for (size_t level = 0; level + 1 < levels.size(); ++level) {
            size_t sibling = (idx % 2 == 0) ? (idx + 1) : (idx - 1);
            if (sibling < levels[level].size()) {
                path.push_back(levels[level][sibling]);
            }
            idx >>= 1;
        }
        return path;
    }
};

inline Hash leafHash(const std::vector<uint8_t> &partBytes)
{
    return util::hashing::sha256(partBytes);
}

/*
  buildMerkleTree:
  - Builds every level from the given leaf hashes.
  - An empty leaf list is rejected; a chunk always has at least one part.
*/
inline MerkleTree buildMerkleTree(const std::vector<Hash> &leaves)
{
    if (leaves.empty()) {
        throw std::invalid_argument("buildMerkleTree: no leaves");
    }

    MerkleTree tree;
    tree.levels.push_back(leaves);
    while (tree.levels.back().size() > 1) {
        const auto &current = tree.levels.back();
        std::vector<Hash> parent;
        parent.reserve((current.size() + 1) / 2);
        for (size_t i = 0; i < current.size(); i += 2) {
            if (i + 1 < current.size()) {
                parent.push_back(util::hashing::hashPair(current[i], current[i + 1]));
            } else {
                // odd one out, promoted as-is
                parent.push_back(current[i]);
            }
        }
        tree.levels.push_back(std::move(parent));
    }
    tree.root = tree.levels.back()[0];
    return tree;
}

/*
  verifyMerklePath:
  - Climbs from 'leaf' at 'leafIndex' using 'path', tracking the size of each
    level so promoted levels consume no sibling.
  - Fails on an out-of-range index, a path that is too short or too long, or a
    final hash that differs from 'root'.
*/
inline bool verifyMerklePath(const Hash &root, const Hash &leaf, size_t leafIndex,
                             size_t leafCount, const std::vector<Hash> &path)
{
    if (leafCount == 0 || leafIndex >= leafCount) {
        return false;
    }

    Hash current = leaf;
    size_t idx = leafIndex;
    size_t levelSize = leafCount;
    size_t used = 0;

    while (levelSize > 1) {
        size_t sibling = (idx % 2 == 0) ? (idx + 1) : (idx - 1);
        if (sibling < levelSize) {
            if (used >= path.size()) {
                return false;
            }
            const Hash &sib = path[used++];
            current = (idx % 2 == 0) ? util::hashing::hashPair(current, sib)
                                     : util::hashing::hashPair(sib, current);
        }
        idx >>= 1;
        levelSize = (levelSize + 1) / 2;
    }

    return used == path.size() && current == root;
}

} // namespace merkle
} // namespace shardavail

#endif // SHARDAVAIL_MERKLE_MERKLE_TREE_HPP
