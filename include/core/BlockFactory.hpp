#pragma once

#include "Types.hpp"
#include "Block.hpp"
#include "BlockIdGenerator.hpp"
#include "ShapeCatalog.hpp"
#include <cstdint>
#include <memory>
#include <random>

namespace blockblast::core {

class BlockFactory {
public:
    // Seeded from std::random_device, sequential ids
    BlockFactory();

    // Deterministic generation for a fixed seed. A null id generator
    // falls back to SequentialBlockIdGenerator.
    explicit BlockFactory(std::uint32_t seed,
                          std::unique_ptr<IBlockIdGenerator> ids = nullptr);

    // Weighted pick from the difficulty pool of `score`, random color
    Block generateRandomBlock(std::uint64_t score);

    // Three blocks generated at the given score
    Inventory generateInventory(std::uint64_t score);

    // Three blocks generated at score 0
    Inventory generateInitialInventory() { return generateInventory(0); }

private:
    std::mt19937 rng_;
    std::unique_ptr<IBlockIdGenerator> ids_;

    const CatalogEntry& pickWeighted(const std::vector<const CatalogEntry*>& pool);
    BlockColor pickColor();
};

} // namespace blockblast::core
