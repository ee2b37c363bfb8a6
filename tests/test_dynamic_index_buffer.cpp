#include "lumen/core/Error.hpp"
#include "lumen/log/Log.hpp"
#include "lumen/structure/GroupFixture.hpp"
#include "lumen/structure/StripFixture.hpp"
#include "lumen/structure/Structure.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

using namespace lumen;
using namespace lumen::structure;

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { lumen::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { lumen::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", +_va, " != ", +_vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

static std::unique_ptr<StripFixture> makeStrip(const std::string& label, int points) {
    auto strip = std::make_unique<StripFixture>(label);
    ASSERT_TRUE(strip->setParameter("numPoints", points).has_value(), "numPoints accepted");
    return strip;
}

static bool indicesAre(const DynamicIndexBuffer& buffer, const std::vector<std::int32_t>& expected) {
    const auto indices = buffer.indices();
    return indices && *indices == expected;
}

static std::vector<std::int32_t> range(std::int32_t first, std::int32_t count) {
    std::vector<std::int32_t> out;
    for (std::int32_t i = 0; i < count; ++i) out.push_back(first + i);
    return out;
}

static void testFollowsSiblingInsertion() {
    Structure structure;
    ASSERT_TRUE(structure.addFixture(makeStrip("A", 10)).has_value(), "add A");
    auto b = makeStrip("B", 10);
    StripFixture* bRaw = b.get();
    ASSERT_TRUE(structure.addFixture(std::move(b)).has_value(), "add B");

    auto created = bRaw->toDynamicIndexBuffer();
    ASSERT_TRUE(created.has_value(), "whole-fixture buffer");
    if (!created) return;
    auto buffer = *created;

    ASSERT_TRUE(buffer->isValid(), "fresh buffer is valid");
    ASSERT_EQ(buffer->version(), static_cast<std::uint64_t>(1), "version 1 after creation");
    ASSERT_TRUE(indicesAre(*buffer, range(10, 10)), "B covers 10..19");

    ASSERT_TRUE(structure.addFixture(makeStrip("Front", 5), 0).has_value(), "insert in front");
    ASSERT_TRUE(buffer->isValid(), "still valid after a sibling insert");
    ASSERT_EQ(buffer->version(), static_cast<std::uint64_t>(2), "one refresh for one reindex");
    ASSERT_TRUE(indicesAre(*buffer, range(15, 10)), "B shifted by the inserted size");

    // A change behind B leaves its indices alone.
    ASSERT_TRUE(structure.addFixture(makeStrip("Back", 3)).has_value(), "append");
    ASSERT_EQ(buffer->version(), static_cast<std::uint64_t>(2), "no refresh when nothing moved");

    auto removed = structure.removeFixture(*structure.fixtures()[0]);
    ASSERT_TRUE(removed.has_value(), "remove Front");
    ASSERT_TRUE(indicesAre(*buffer, range(10, 10)), "B shifted back");
    ASSERT_EQ(buffer->version(), static_cast<std::uint64_t>(3), "refreshed on removal");
}

static void testStridedRanges() {
    Structure structure;
    ASSERT_TRUE(structure.addFixture(makeStrip("A", 4)).has_value(), "add A");
    auto b = makeStrip("B", 10);
    StripFixture* bRaw = b.get();
    ASSERT_TRUE(structure.addFixture(std::move(b)).has_value(), "add B");

    auto strided = bRaw->toDynamicIndexBuffer(1, 3, 2);
    ASSERT_TRUE(strided.has_value(), "strided buffer");
    if (strided) {
        ASSERT_TRUE(indicesAre(**strided, {5, 7, 9}), "every second point from offset 1");
        ASSERT_EQ((*strided)->start(), static_cast<std::size_t>(1), "start kept");
        ASSERT_EQ((*strided)->stride(), static_cast<std::size_t>(2), "stride kept");
    }

    auto empty = bRaw->toDynamicIndexBuffer(3, 0, 1);
    ASSERT_TRUE(empty && (*empty)->indices()->empty(), "empty range is allowed");

    auto tooLong = bRaw->toDynamicIndexBuffer(8, 3, 1);
    ASSERT_TRUE(!tooLong && tooLong.error() == errc::index_out_of_range, "range past the fixture");
    ASSERT_TRUE(tooLong.error() == error_class::addressing_error, "addressing error class");

    auto zeroStride = bRaw->toDynamicIndexBuffer(0, 2, 0);
    ASSERT_TRUE(!zeroStride && zeroStride.error() == errc::invalid_argument, "zero stride");
}

static void testInvalidatedByRegenerate() {
    Structure structure;
    auto a = makeStrip("A", 6);
    StripFixture* aRaw = a.get();
    ASSERT_TRUE(structure.addFixture(std::move(a)).has_value(), "add A");

    auto created = aRaw->toDynamicIndexBuffer(0, 6);
    ASSERT_TRUE(created.has_value(), "buffer over A");
    if (!created) return;
    auto buffer = *created;

    ASSERT_TRUE(aRaw->setParameter("spacing", 2.0).has_value(), "geometry change");
    ASSERT_TRUE(buffer->isValid(), "geometry change keeps the buffer");

    ASSERT_TRUE(aRaw->setParameter("numPoints", 12).has_value(), "metrics change");
    ASSERT_TRUE(!buffer->isValid(), "regenerate invalidates");
    ASSERT_EQ(buffer->version(), static_cast<std::uint64_t>(1), "no refresh after invalidation");
    ASSERT_TRUE(indicesAre(*buffer, range(0, 6)), "last published array stays readable");

    auto again = aRaw->toDynamicIndexBuffer();
    ASSERT_TRUE(again && (*again)->count() == 12, "new buffer sees the new size");

    ASSERT_TRUE(structure.removeAllFixtures().has_value(), "dispose");
    ASSERT_TRUE(again && !(*again)->isValid(), "dispose invalidates");
}

static void testInvalidatedWhenRangeNoLongerResolves() {
    Structure structure;
    auto group = std::make_unique<GroupFixture>("G");
    ASSERT_TRUE(group->addChild(makeStrip("B", 2)).has_value(), "B into group");
    ASSERT_TRUE(group->addChild(makeStrip("C", 2)).has_value(), "C into group");
    GroupFixture* gRaw = group.get();
    ASSERT_TRUE(structure.addFixture(std::move(group)).has_value(), "add group");

    auto created = gRaw->toDynamicIndexBuffer(0, 4);
    ASSERT_TRUE(created.has_value(), "buffer over the group");
    if (!created) return;
    auto buffer = *created;

    ASSERT_TRUE(gRaw->addChild(makeStrip("Head", 1), 0).has_value(), "grow the group at the front");
    ASSERT_TRUE(buffer->isValid(), "range still resolves");
    ASSERT_TRUE(indicesAre(*buffer, range(0, 4)), "range is relative to the group");
    ASSERT_EQ(gRaw->children()[1]->firstPointIndex(), 1u, "B moved behind Head");

    auto removed = gRaw->removeChild(*gRaw->children()[2]);
    ASSERT_TRUE(removed.has_value(), "remove C");
    auto removedHead = gRaw->removeChild(*gRaw->children()[0]);
    ASSERT_TRUE(removedHead.has_value(), "remove Head");
    ASSERT_TRUE(!buffer->isValid(), "range past the shrunken group invalidates the buffer");
}

static void testPacketScopedBuffers() {
    Structure structure;
    auto b = makeStrip("B", 4);
    ASSERT_TRUE(b->setParameter("protocol", std::string("ddp")).has_value(), "ddp output");
    StripFixture* bRaw = b.get();
    ASSERT_TRUE(structure.addFixture(std::move(b)).has_value(), "add B");

    ASSERT_EQ(bRaw->packetSpecs().size(), static_cast<std::size_t>(1), "one DDP packet");
    auto spec = bRaw->packetSpecs()[0];
    ASSERT_TRUE(spec->indices().isDynamic(), "packet reads a dynamic buffer");
    auto packetBuffer = spec->indices().dynamicBuffer();

    auto user = bRaw->toDynamicIndexBuffer();
    ASSERT_TRUE(user.has_value(), "user buffer");

    ASSERT_TRUE(structure.addFixture(makeStrip("Front", 3), 0).has_value(), "insert in front");
    ASSERT_TRUE(bRaw->packetSpecs()[0] == spec, "packet survives a reindex");
    ASSERT_TRUE(indicesAre(*packetBuffer, range(3, 4)), "packet indices follow the fixture");

    ASSERT_TRUE(bRaw->setParameter("host", std::string("10.0.0.9")).has_value(), "new destination");
    ASSERT_TRUE(spec->isReleased(), "old packet released on rebuild");
    ASSERT_TRUE(!packetBuffer->isValid(), "old packet buffer invalidated");
    ASSERT_TRUE(user && (*user)->isValid(), "user buffer survives a packet rebuild");
    ASSERT_TRUE(bRaw->packetSpecs()[0]->destination().host == "10.0.0.9", "new packet addressed");
}

static void testSeveralBuffersOnOneFixture() {
    Structure structure;
    auto group = std::make_unique<GroupFixture>("Bay");
    auto head = makeStrip("Head", 4);
    StripFixture* headRaw = head.get();
    GroupFixture* gRaw = group.get();
    ASSERT_TRUE(group->addChild(std::move(head)).has_value(), "Head into group");
    ASSERT_TRUE(group->addChild(makeStrip("Tail", 6)).has_value(), "Tail into group");
    ASSERT_TRUE(structure.addFixture(std::move(group)).has_value(), "add group");

    auto whole = gRaw->toDynamicIndexBuffer();
    auto middle = gRaw->toDynamicIndexBuffer(3, 4);
    auto odd = gRaw->toDynamicIndexBuffer(1, 5, 2);
    ASSERT_TRUE(whole && middle && odd, "three buffers on the group");
    if (!whole || !middle || !odd) return;

    ASSERT_TRUE(indicesAre(**whole, range(0, 10)), "whole group");
    ASSERT_TRUE(indicesAre(**middle, {3, 4, 5, 6}), "range across both children");
    ASSERT_TRUE(indicesAre(**odd, {1, 3, 5, 7, 9}), "strided range");

    ASSERT_TRUE(structure.addFixture(makeStrip("Front", 5), 0).has_value(), "insert in front");
    ASSERT_TRUE(indicesAre(**whole, range(5, 10)), "whole group shifted");
    ASSERT_TRUE(indicesAre(**middle, {8, 9, 10, 11}), "middle shifted");
    ASSERT_TRUE(indicesAre(**odd, {6, 8, 10, 12, 14}), "strided shifted");

    ASSERT_TRUE(headRaw->setParameter("numPoints", 5).has_value(), "grow Head");
    ASSERT_TRUE(indicesAre(**whole, range(5, 10)), "whole range keeps its first ten offsets");
    ASSERT_TRUE(indicesAre(**middle, {8, 9, 10, 11}), "offsets 3..6 now span Head and Tail");
    ASSERT_TRUE(indicesAre(**odd, {6, 8, 10, 12, 14}), "strided offsets unchanged");
    for (const auto* buffer : {whole->get(), middle->get(), odd->get()}) {
        ASSERT_TRUE(buffer->isValid(), "buffers survive a child regenerate");
        ASSERT_EQ(buffer->version(), static_cast<std::uint64_t>(3), "one refresh per reindex");
    }
    ASSERT_EQ(gRaw->totalSize(), static_cast<std::size_t>(11), "group grew");
}

int main() {
    testFollowsSiblingInsertion();
    testStridedRanges();
    testInvalidatedByRegenerate();
    testInvalidatedWhenRangeNoLongerResolves();
    testPacketScopedBuffers();
    testSeveralBuffersOnOneFixture();

    if (g_failures) {
        lumen::logError("Tests failed: ", g_failures, "\n");
        return 1;
    }
    lumen::logInfo("All dynamic index buffer tests passed.\n");
    return 0;
}
