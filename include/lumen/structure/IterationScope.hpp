#pragma once

#include <cstddef>

namespace lumen::structure {

/**
 * @brief Marks a fixture tree as being iterated for as long as the scope lives.
 *
 * While any scope is open on a node or on one of its containers, structural
 * mutators on that node (add/remove child, regenerate, dispose, packet
 * rebuilds) fail with errc::reentrant_mutation. Scopes nest.
 */
class IterationScope {
public:
    explicit IterationScope(std::size_t& depth) : depth_(&depth) { ++*depth_; }
    ~IterationScope() { if (depth_) --*depth_; }

    IterationScope(const IterationScope&) = delete;
    IterationScope& operator=(const IterationScope&) = delete;

    IterationScope(IterationScope&& other) noexcept : depth_(other.depth_) { other.depth_ = nullptr; }
    IterationScope& operator=(IterationScope&&) = delete;

private:
    std::size_t* depth_;
};

} // namespace lumen::structure
