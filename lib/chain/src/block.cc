#include "chain/block.hpp"
#include "crypto/log.hpp"
#include "crypto/utils.hpp"
#include <array>
#include <cstdint>

namespace Ledger::Chain {

namespace MerkleTree = Crypto::MerkleTree;

namespace {

    std::expected<std::uint32_t, std::error_code> random_nonce()
    {
        std::array<Byte, sizeof(std::uint32_t)> buf;
        if (auto r = Crypto::Utils::random_bytes(buf); !r) {
            return std::unexpected(r.error());
        }
        std::uint32_t nonce = 0;
        for (std::size_t k = 0; k < buf.size(); ++k) {
            nonce |= static_cast<std::uint32_t>(buf[k]) << (8 * k);
        }
        return nonce;
    }

} // namespace

std::expected<Block, std::error_code> make_block(const Digest& parent,
    const Digest& difficulty,
    std::span<const Digest> item_digests)
{
    auto tree = MerkleTree::build(item_digests);
    if (!tree) {
        return std::unexpected(tree.error());
    }

    auto nonce = random_nonce();
    if (!nonce) {
        Log::logger().error("block assembly failed: {}", nonce.error().message());
        return std::unexpected(nonce.error());
    }

    Block block {
        .header = Header {
            .parent = parent,
            .nonce = *nonce,
            .difficulty = difficulty,
            .timestamp = Timestamp::now() },
        .content = Content {
            .items = std::vector<Digest>(item_digests.begin(), item_digests.end()),
            .merkle_root = tree->root() }
    };

    Log::logger().debug("block assembled: {} items, root {}", block.content.items.size(),
        Crypto::to_hex(block.content.merkle_root));
    return block;
}

bool has_valid_merkle_root(const Block& block)
{
    auto tree = MerkleTree::build(block.content.items);
    return tree && tree->root() == block.content.merkle_root;
}

std::expected<MerkleTree::PathProof, std::error_code> prove_item(const Block& block, std::size_t index)
{
    auto tree = MerkleTree::build(block.content.items);
    if (!tree) {
        return std::unexpected(tree.error());
    }
    return tree->prove_path(index);
}

} // namespace Ledger::Chain
