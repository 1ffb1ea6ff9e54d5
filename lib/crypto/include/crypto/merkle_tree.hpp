#pragma once

#include <cstddef>
#include <expected>
#include <optional>
#include <ranges>
#include <span>
#include <system_error>
#include <vector>

#include "crypto/common.hpp"
#include "crypto/digest.hpp"

namespace Ledger::Crypto::MerkleTree {

// 兄弟节点哈希, 顺序: 根所在层在前, 叶子层在后
using Proof = std::vector<Digest>;

// Proof 本身不足以验证, 需要带上叶子索引和叶子总数
struct PathProof {
    std::size_t leaf_index;
    std::size_t total_leaves;
    Proof siblings;
};

class Tree {
public:
    [[nodiscard]] const Digest& root() const { return root_; }

    // 被 move 走之后 levels_ 为空: leaf_count() == 0, prove 全部越界
    [[nodiscard]] std::size_t leaf_count() const { return levels_.empty() ? 0 : levels_.front().size(); }

    // 从叶子层到根需要的折半次数 (奇数向上取整)
    [[nodiscard]] std::size_t height() const { return levels_.empty() ? 0 : levels_.size() - 1; }

    // levels()[0] 是叶子层, levels().back() 只有根
    [[nodiscard]] const std::vector<std::vector<Digest>>& levels() const { return levels_; }

    [[nodiscard]] std::optional<Digest> node(std::size_t level, std::size_t position) const;

    // 生成证明
    [[nodiscard]] std::expected<Proof, std::error_code> prove(std::size_t leaf_index) const;

    [[nodiscard]] std::expected<PathProof, std::error_code> prove_path(std::size_t leaf_index) const;

private:
    Tree() = default;

    friend std::expected<Tree, std::error_code> build(std::span<const Digest> leaf_digests);

    Digest root_ {};
    std::vector<std::vector<Digest>> levels_;
};

// 构建函数. 空输入返回 Error::EmptyInput
// 奇数层把最后一个节点和自己配对
[[nodiscard]]
std::expected<Tree, std::error_code> build(std::span<const Digest> leaf_digests);

template <std::ranges::input_range R>
    requires Hashable<std::ranges::range_value_t<R>>
[[nodiscard]] std::expected<Tree, std::error_code> build_from_items(R&& items)
{
    std::vector<Digest> leaves;
    if constexpr (std::ranges::sized_range<R>) {
        leaves.reserve(std::ranges::size(items));
    }
    for (const auto& item : items) {
        leaves.push_back(digest_of(item));
    }
    return build(leaves);
}

// 验证函数, 不需要 Tree 对象, 只需要 Root
// 任何不一致都返回 false, 不抛异常
[[nodiscard]]
bool verify(const Digest& root,
    const Digest& leaf_digest,
    std::span<const Digest> proof,
    std::size_t index,
    std::size_t leaf_size);

[[nodiscard]]
bool verify(const Digest& root, const Digest& leaf_digest, const PathProof& proof);

} // namespace Ledger::Crypto::MerkleTree
