#include "core/BlockFactory.hpp"
#include <random>
#include <utility>

namespace blockblast::core {

BlockFactory::BlockFactory()
    : rng_{std::random_device{}()}
    , ids_{std::make_unique<SequentialBlockIdGenerator>()}
{
}

BlockFactory::BlockFactory(std::uint32_t seed, std::unique_ptr<IBlockIdGenerator> ids)
    : rng_{seed}
    , ids_{ids ? std::move(ids) : std::make_unique<SequentialBlockIdGenerator>()}
{
}

Block BlockFactory::generateRandomBlock(std::uint64_t score) {
    const CatalogEntry& entry = pickWeighted(shapePoolForScore(score));
    return Block{ids_->next(), entry.shape, pickColor()};
}

Inventory BlockFactory::generateInventory(std::uint64_t score) {
    Inventory inventory;
    for (auto& slot : inventory) {
        slot = generateRandomBlock(score);
    }
    return inventory;
}

const CatalogEntry& BlockFactory::pickWeighted(const std::vector<const CatalogEntry*>& pool) {
    double totalWeight = 0.0;
    for (const auto* entry : pool) {
        totalWeight += entry->weight;
    }

    std::uniform_real_distribution<double> dist(0.0, totalWeight);
    double remaining = dist(rng_);

    for (const auto* entry : pool) {
        remaining -= entry->weight;
        if (remaining <= 0.0) {
            return *entry;
        }
    }
    // Rounding left a sliver of weight unconsumed
    return *pool.back();
}

BlockColor BlockFactory::pickColor() {
    std::uniform_int_distribution<int> dist(0, BlockColorCount - 1);
    return AllBlockColors[static_cast<std::size_t>(dist(rng_))];
}

} // namespace blockblast::core
