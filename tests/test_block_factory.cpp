#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <set>
#include <string>

#include "core/BlockFactory.hpp"
#include "core/BlockIdGenerator.hpp"
#include "core/ShapeCatalog.hpp"

using namespace blockblast::core;

namespace {

class PrefixedIds final : public IBlockIdGenerator {
public:
    BlockId next() override { return "piece-" + std::to_string(n_++); }

private:
    int n_{0};
};

bool inPool(const Shape& shape, std::uint64_t score)
{
    for (const auto* entry : shapePoolForScore(score)) {
        if (entry->shape == shape) return true;
    }
    return false;
}

} // namespace

TEST_CASE("BlockFactory: same seed yields the same blocks", "[factory]")
{
    BlockFactory a{1234};
    BlockFactory b{1234};

    for (int i = 0; i < 50; ++i) {
        const Block x = a.generateRandomBlock(2000);
        const Block y = b.generateRandomBlock(2000);
        REQUIRE(x.id == y.id);
        REQUIRE(x.shape == y.shape);
        REQUIRE(x.color == y.color);
    }
}

TEST_CASE("BlockFactory: ids are unique and sequential by default", "[factory]")
{
    BlockFactory factory{7};

    std::set<BlockId> ids;
    for (int i = 0; i < 30; ++i) {
        const Block block = factory.generateRandomBlock(0);
        REQUIRE(block.id == "block_" + std::to_string(i));
        ids.insert(block.id);
    }
    REQUIRE(ids.size() == 30);
}

TEST_CASE("BlockFactory: uses an injected id generator", "[factory]")
{
    BlockFactory factory{7, std::make_unique<PrefixedIds>()};

    const auto inventory = factory.generateInitialInventory();
    REQUIRE(inventory[0]->id == "piece-0");
    REQUIRE(inventory[1]->id == "piece-1");
    REQUIRE(inventory[2]->id == "piece-2");
}

TEST_CASE("SequentialBlockIdGenerator counts what it issued", "[factory]")
{
    SequentialBlockIdGenerator ids{"b"};
    REQUIRE(ids.next() == "b0");
    REQUIRE(ids.next() == "b1");
    REQUIRE(ids.issued() == 2);
}

TEST_CASE("BlockFactory: inventories are always full", "[factory]")
{
    BlockFactory factory{99};

    const auto initial = factory.generateInitialInventory();
    for (const auto& slot : initial) {
        REQUIRE(slot.has_value());
    }
    REQUIRE_FALSE(isInventoryEmpty(initial));

    const auto later = factory.generateInventory(5000);
    for (const auto& slot : later) {
        REQUIRE(slot.has_value());
    }
}

TEST_CASE("BlockFactory: shapes come from the pool of the current score", "[factory][difficulty]")
{
    BlockFactory factory{2024};

    for (std::uint64_t score : {0ull, 800ull, 2000ull, 4000ull}) {
        for (int i = 0; i < 200; ++i) {
            const Block block = factory.generateRandomBlock(score);
            REQUIRE(inPool(block.shape, score));
        }
    }
}

TEST_CASE("BlockFactory: every palette color shows up", "[factory]")
{
    BlockFactory factory{5};

    std::set<BlockColor> seen;
    for (int i = 0; i < 600; ++i) {
        seen.insert(factory.generateRandomBlock(0).color);
    }
    REQUIRE(seen.size() == static_cast<std::size_t>(BlockColorCount));
}
