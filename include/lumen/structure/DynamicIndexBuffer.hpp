#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>

#include "lumen/core/Expected.hpp"
#include "lumen/model/Point.hpp"

namespace lumen::structure {

class FixtureNode;

/**
 * @brief Live view of a strided range of a fixture's points, as global indices.
 *
 * The buffer stores the range (start, count, stride) relative to its owning
 * fixture and re-resolves it every time the structure reindexes, so a packet
 * that reads it keeps addressing the same physical points when fixtures are
 * inserted or removed elsewhere.
 *
 * Threading model:
 * - refresh()/invalidate() run on the mutation thread only (called by the
 *   owning fixture).
 * - indices(), isValid() and version() may be called from any thread. Each
 *   refresh publishes a fresh immutable array through an atomic pointer swap,
 *   so readers see either the previous or the new array, never a mix.
 * - After invalidation the owner is cleared, isValid() turns false and the
 *   last published array stays readable.
 */
class DynamicIndexBuffer {
public:
    using Ptr = std::shared_ptr<DynamicIndexBuffer>;

    std::size_t start() const { return start_; }
    std::size_t count() const { return count_; }
    std::size_t stride() const { return stride_; }

    bool isValid() const { return valid_.load(std::memory_order_acquire); }

    /// Incremented by every successful refresh.
    std::uint64_t version() const { return version_.load(std::memory_order_acquire); }

    std::shared_ptr<const model::IndexBuffer> indices() const;

private:
    friend class FixtureNode;

    DynamicIndexBuffer(const FixtureNode& owner,
                       std::size_t start,
                       std::size_t count,
                       std::size_t stride,
                       std::uint64_t layoutGeneration,
                       bool packetScoped);

    /// Re-resolves the range against @p subtree, the owner's current
    /// toIndexBuffer(). Invalidates the buffer on failure.
    expected<void> refresh(const model::IndexBuffer& subtree);
    void invalidate();

    bool isPacketScoped() const { return packetScoped_; }

    const FixtureNode* owner_ = nullptr;
    std::size_t start_ = 0;
    std::size_t count_ = 0;
    std::size_t stride_ = 1;
    std::uint64_t layoutGeneration_ = 0;
    bool packetScoped_ = false;

    std::shared_ptr<const model::IndexBuffer> published_;
    std::atomic<std::uint64_t> version_{0};
    std::atomic<bool> valid_{true};
};

} // namespace lumen::structure
