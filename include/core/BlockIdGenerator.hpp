#pragma once

#include "Block.hpp"
#include <cstdint>
#include <string>
#include <utility>

namespace blockblast::core {

/// Source of unique block ids, injected into BlockFactory.
class IBlockIdGenerator {
public:
    virtual ~IBlockIdGenerator() = default;

    /// Returns an id never returned before by this generator.
    virtual BlockId next() = 0;
};

/// Monotonic counter: "block_0", "block_1", ...
class SequentialBlockIdGenerator final : public IBlockIdGenerator {
public:
    explicit SequentialBlockIdGenerator(std::string prefix = "block_")
        : prefix_{std::move(prefix)}
    {
    }

    BlockId next() override {
        return prefix_ + std::to_string(counter_++);
    }

    std::uint64_t issued() const noexcept { return counter_; }

private:
    std::string prefix_;
    std::uint64_t counter_{0};
};

} // namespace blockblast::core
