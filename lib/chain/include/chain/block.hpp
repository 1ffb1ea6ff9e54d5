#pragma once

#include <cstddef>
#include <expected>
#include <span>
#include <system_error>
#include <vector>

#include "chain/header.hpp"
#include "crypto/merkle_tree.hpp"

namespace Ledger::Chain {

struct Content {
    std::vector<Digest> items; ///< leaf digests of the block's transactions
    Digest merkle_root {};
};

struct Block {
    Header header;
    Content content;

    [[nodiscard]] Digest digest() const { return header.digest(); }
    [[nodiscard]] const Digest& parent() const { return header.parent; }
    [[nodiscard]] const Digest& difficulty() const { return header.difficulty; }
};

// Commits item_digests under a fresh Merkle root, random nonce and current time.
// Error::EmptyInput if item_digests is empty.
[[nodiscard]]
std::expected<Block, std::error_code> make_block(const Digest& parent,
    const Digest& difficulty,
    std::span<const Digest> item_digests);

// Recomputes the root from content.items.
[[nodiscard]] bool has_valid_merkle_root(const Block& block);

[[nodiscard]]
std::expected<Crypto::MerkleTree::PathProof, std::error_code> prove_item(const Block& block, std::size_t index);

} // namespace Ledger::Chain
