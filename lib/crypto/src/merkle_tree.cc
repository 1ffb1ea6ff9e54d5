#include "crypto/merkle_tree.hpp"
#include "crypto/error.hpp"
#include "crypto/log.hpp"
#include "crypto/utils.hpp"
#include <algorithm>
#include <utility>

namespace Ledger::Crypto::MerkleTree {

// --- Tree 成员函数实现 ---

std::optional<Digest> Tree::node(std::size_t level, std::size_t position) const
{
    if (level >= levels_.size() || position >= levels_[level].size()) {
        return std::nullopt;
    }
    return levels_[level][position];
}

std::expected<Proof, std::error_code> Tree::prove(std::size_t leaf_index) const
{
    if (leaf_index >= leaf_count()) {
        Log::logger().warn("merkle proof rejected: index {} >= leaf count {}", leaf_index, leaf_count());
        return std::unexpected(make_error_code(Error::IndexOutOfRange));
    }

    Proof siblings;
    siblings.reserve(height());

    // 从叶子层往上走, 每层的 t 是当前节点在本层的位置
    // 单叶子树 height() == 0, 不进入循环, 得到空证明
    std::size_t t = leaf_index;
    for (std::size_t level = 0; level < height(); ++level) {
        const auto& row = levels_[level];
        // t^1 是兄弟节点; 奇数层最后一个节点的兄弟是它自己
        std::size_t sibling = t ^ 1;
        if (sibling >= row.size()) {
            sibling = t;
        }
        siblings.push_back(row[sibling]);
        t >>= 1;
    }

    // verify 从后往前消费, 所以根所在层放在最前面
    std::ranges::reverse(siblings);
    return siblings;
}

std::expected<PathProof, std::error_code> Tree::prove_path(std::size_t leaf_index) const
{
    auto siblings = prove(leaf_index);
    if (!siblings) {
        return std::unexpected(siblings.error());
    }
    return PathProof {
        .leaf_index = leaf_index,
        .total_leaves = leaf_count(),
        .siblings = std::move(*siblings)
    };
}

// --- 非成员函数 / 友元函数实现 ---

std::expected<Tree, std::error_code> build(std::span<const Digest> leaf_digests)
{
    if (leaf_digests.empty()) {
        Log::logger().warn("merkle build rejected: no leaves");
        return std::unexpected(make_error_code(Error::EmptyInput));
    }

    Tree tree;
    tree.levels_.emplace_back(leaf_digests.begin(), leaf_digests.end());

    // 逐层向上, 直到只剩一个节点
    while (tree.levels_.back().size() > 1) {
        const auto& row = tree.levels_.back();
        std::size_t parents = (row.size() + 1) / 2;

        std::vector<Digest> next;
        next.reserve(parents);
        for (std::size_t p = 0; p < parents; ++p) {
            const Digest& left = row[2 * p];
            const Digest& right = (2 * p + 1 < row.size()) ? row[2 * p + 1] : left;
            next.push_back(Utils::hash_pair(left, right));
        }
        tree.levels_.push_back(std::move(next));
    }

    tree.root_ = tree.levels_.back().front();
    Log::logger().debug("merkle tree built: {} leaves, height {}", tree.leaf_count(), tree.height());
    return tree;
}

bool verify(const Digest& root,
    const Digest& leaf_digest,
    std::span<const Digest> proof,
    std::size_t index,
    std::size_t leaf_size)
{
    if (leaf_size == 0 || index >= leaf_size) {
        Log::logger().debug("merkle verify: index {} outside {} leaves", index, leaf_size);
        return false;
    }

    const std::size_t m = proof.size();
    Digest current = leaf_digest;
    std::size_t n = leaf_size;
    std::size_t i = index;
    std::size_t j = 1;

    // proof 从后往前: proof[m - 1] 是叶子层的兄弟
    while (n > 1 && j <= m) {
        const Digest& sib = proof[m - j];
        if (i % 2 == 0) {
            // 当前节点是左孩子, Hash(acc || sib)
            current = Utils::hash_pair(current, sib);
        } else {
            // 当前节点是右孩子, Hash(sib || acc)
            current = Utils::hash_pair(sib, current);
        }
        // 和 build 一样, 奇数层向上取整
        n = n / 2 + n % 2;
        i /= 2;
        ++j;
    }

    if (n == 1 && j == m + 1 && current == root) {
        return true;
    }
    Log::logger().debug("merkle verify failed for index {} of {} ({} siblings)", index, leaf_size, m);
    return false;
}

bool verify(const Digest& root, const Digest& leaf_digest, const PathProof& proof)
{
    return verify(root, leaf_digest, proof.siblings, proof.leaf_index, proof.total_leaves);
}

} // namespace Ledger::Crypto::MerkleTree
