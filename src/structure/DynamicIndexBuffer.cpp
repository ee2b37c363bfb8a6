#include "lumen/structure/DynamicIndexBuffer.hpp"

#include <utility>

#include "lumen/structure/FixtureNode.hpp"

namespace lumen::structure {

DynamicIndexBuffer::DynamicIndexBuffer(const FixtureNode& owner,
                                       std::size_t start,
                                       std::size_t count,
                                       std::size_t stride,
                                       std::uint64_t layoutGeneration,
                                       bool packetScoped)
: owner_(&owner)
, start_(start)
, count_(count)
, stride_(stride)
, layoutGeneration_(layoutGeneration)
, packetScoped_(packetScoped)
, published_(std::make_shared<const model::IndexBuffer>()) {}

std::shared_ptr<const model::IndexBuffer> DynamicIndexBuffer::indices() const {
    return std::atomic_load(&published_);
}

expected<void> DynamicIndexBuffer::refresh(const model::IndexBuffer& subtree) {
    if (!owner_ || !isValid()) {
        return unexpected(errc::index_out_of_range);
    }
    if (owner_->layoutGeneration() != layoutGeneration_) {
        invalidate();
        return unexpected(errc::index_out_of_range);
    }

    if (count_ > 0 && start_ + (count_ - 1) * stride_ >= subtree.size()) {
        invalidate();
        return unexpected(errc::index_out_of_range);
    }

    auto resolved = std::make_shared<model::IndexBuffer>();
    resolved->reserve(count_);
    for (std::size_t i = 0; i < count_; ++i) {
        resolved->push_back(subtree[start_ + i * stride_]);
    }

    std::atomic_store(&published_, std::shared_ptr<const model::IndexBuffer>(std::move(resolved)));
    version_.fetch_add(1, std::memory_order_acq_rel);
    return {};
}

void DynamicIndexBuffer::invalidate() {
    owner_ = nullptr;
    valid_.store(false, std::memory_order_release);
}

} // namespace lumen::structure
