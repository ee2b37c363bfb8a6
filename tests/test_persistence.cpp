#include "lumen/core/Error.hpp"
#include "lumen/log/Log.hpp"
#include "lumen/structure/FixtureFactory.hpp"
#include "lumen/structure/GridFixture.hpp"
#include "lumen/structure/GroupFixture.hpp"
#include "lumen/structure/StripFixture.hpp"
#include "lumen/structure/Structure.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <cstdio>
#include <fstream>
#include <map>
#include <memory>
#include <string>

using namespace lumen;
using namespace lumen::structure;
using nlohmann::json;

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { lumen::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { lumen::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", +_va, " != ", +_vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

namespace {

std::map<std::string, int> g_regenerates;

class CountingStrip : public StripFixture {
public:
    CountingStrip() : StripFixture("Counting") {}
    std::string typeKey() const override { return "counting"; }

protected:
    void onRegenerate() override { ++g_regenerates[label()]; }
};

} // namespace

static void buildRig(Structure& structure) {
    auto group = std::make_unique<GroupFixture>("Facade");
    ASSERT_TRUE(group->setParameter("x", 50.0).has_value(), "group x");

    auto strip = std::make_unique<StripFixture>("Cornice");
    ASSERT_TRUE(strip->setParameter("numPoints", 20).has_value(), "strip size");
    ASSERT_TRUE(strip->setParameter("protocol", std::string("sacn")).has_value(), "strip protocol");
    ASSERT_TRUE(strip->setParameter("universe", 7).has_value(), "strip universe");
    ASSERT_TRUE(group->addChild(std::move(strip)).has_value(), "strip into group");

    auto grid = std::make_unique<GridFixture>("Window");
    ASSERT_TRUE(grid->setParameter("numRows", 2).has_value(), "grid rows");
    ASSERT_TRUE(grid->setParameter("numColumns", 3).has_value(), "grid columns");
    ASSERT_TRUE(grid->setParameter("brightness", 0.25).has_value(), "grid brightness");

    ASSERT_TRUE(structure.addFixture(std::move(group)).has_value(), "add group");
    ASSERT_TRUE(structure.addFixture(std::move(grid)).has_value(), "add grid");
}

static void testRoundTrip() {
    Structure original;
    buildRig(original);
    const json document = original.save();

    ASSERT_EQ(document["version"].get<int>(), Structure::FILE_VERSION, "file version written");
    ASSERT_EQ(document["fixtures"].size(), static_cast<std::size_t>(2), "two top-level fixtures");
    ASSERT_TRUE(document["fixtures"][0]["type"] == "group", "type key written");
    ASSERT_TRUE(document["fixtures"][0]["children"][0]["parameters"]["protocol"] == "sacn", "nested parameters written");

    Structure restored;
    auto loaded = restored.load(document);
    ASSERT_TRUE(loaded.has_value(), "document loads");

    ASSERT_EQ(restored.totalSize(), original.totalSize(), "same point count");
    ASSERT_EQ(restored.fixtures().size(), static_cast<std::size_t>(2), "same fixtures");
    if (restored.fixtures().size() == 2) {
        const FixtureNode& group = *restored.fixtures()[0];
        ASSERT_TRUE(group.label() == "Facade", "label restored");
        ASSERT_EQ(group.children().size(), static_cast<std::size_t>(1), "child restored");
        ASSERT_EQ(restored.fixtures()[1]->firstPointIndex(), 20u, "grid indexed after the strip");
        ASSERT_EQ(restored.fixtures()[1]->brightnessLevel(), 0.25f, "output state restored");
    }

    const auto model = restored.model();
    ASSERT_EQ(model->size(), static_cast<std::size_t>(26), "restored model");
    ASSERT_EQ(model->point(0).position.x, 50.0f, "parent transform applied to children");

    const auto frame = restored.outputFrame();
    ASSERT_EQ(frame->entries.size(), static_cast<std::size_t>(1), "sACN packet rebuilt");
    if (!frame->entries.empty()) {
        ASSERT_EQ(frame->entries[0].spec->address().universe, 7u, "universe restored");
        ASSERT_TRUE(frame->entries[0].spec->destination().host == "239.255.0.7", "multicast destination");
    }

    ASSERT_TRUE(restored.save() == document, "save after load is stable");
}

static void testLoadReplacesTree() {
    Structure structure;
    buildRig(structure);
    const auto oldFrame = structure.outputFrame();

    json document = {
        {"version", 1},
        {"fixtures", json::array({
            {{"type", "point"}, {"label", "Beacon"}, {"parameters", {{"protocol", "OPC"}, {"channel", 4}}}}
        })}
    };
    ASSERT_TRUE(structure.load(document).has_value(), "load replaces");
    ASSERT_EQ(structure.totalSize(), static_cast<std::size_t>(1), "one point left");
    ASSERT_TRUE(oldFrame->entries[0].spec->isReleased(), "old packets released");

    const auto frame = structure.outputFrame();
    ASSERT_EQ(frame->entries.size(), static_cast<std::size_t>(1), "opc packet");
    if (!frame->entries.empty()) {
        ASSERT_EQ(frame->entries[0].spec->address().channel, 4, "channel restored");
    }
}

static void testMalformedDocuments() {
    Structure structure;
    buildRig(structure);
    const std::size_t before = structure.totalSize();

    auto expectFailure = [&](const json& document, errc code, const char* what) {
        auto result = structure.load(document);
        ASSERT_TRUE(!result, what);
        ASSERT_TRUE(!result && result.error() == code, what);
        ASSERT_EQ(structure.totalSize(), before, "failed load leaves the tree untouched");
    };

    expectFailure(json::array(), errc::malformed_config, "document must be an object");
    expectFailure({{"version", 2}, {"fixtures", json::array()}}, errc::malformed_config, "unknown version");
    expectFailure({{"version", 1}}, errc::malformed_config, "missing fixture list");
    expectFailure({{"version", 1}, {"fixtures", json::array({{{"label", "x"}}})}},
                  errc::malformed_config, "missing type");
    expectFailure({{"version", 1}, {"fixtures", json::array({{{"type", "laser"}}})}},
                  errc::unknown_fixture_type, "unknown fixture type");
    expectFailure({{"version", 1}, {"fixtures", json::array({
                      {{"type", "strip"}, {"parameters", {{"colour", "red"}}}}})}},
                  errc::unknown_parameter, "unknown parameter");
    expectFailure({{"version", 1}, {"fixtures", json::array({
                      {{"type", "strip"}, {"parameters", {{"numPoints", "ten"}}}}})}},
                  errc::invalid_parameter, "wrong parameter type");
    expectFailure({{"version", 1}, {"fixtures", json::array({
                      {{"type", "strip"}, {"parameters", {{"numPoints", 5000000000LL}}}}})}},
                  errc::invalid_parameter, "integer out of range");
    expectFailure({{"version", 1}, {"fixtures", json::array({
                      {{"type", "group"}, {"children", json::array({{{"type", "nope"}}})}}})}},
                  errc::unknown_fixture_type, "bad nested child");

    ASSERT_TRUE(make_error_code(errc::unknown_fixture_type) == error_class::configuration_error, "configuration class");
}

static void testFiles() {
    const std::string path = "lumen_test_structure.json";

    Structure original;
    buildRig(original);
    ASSERT_TRUE(original.saveFile(path).has_value(), "save to disk");

    Structure restored;
    ASSERT_TRUE(restored.loadFile(path).has_value(), "load from disk");
    ASSERT_EQ(restored.totalSize(), original.totalSize(), "file round trip");

    {
        std::ofstream out(path);
        out << "{ \"version\": 1, \"fixtures\": [ ";
    }
    auto truncated = restored.loadFile(path);
    ASSERT_TRUE(!truncated && truncated.error() == errc::malformed_config, "truncated JSON");
    std::remove(path.c_str());

    auto missing = restored.loadFile("does/not/exist.json");
    ASSERT_TRUE(!missing && missing.error() == std::errc::no_such_file_or_directory, "missing file");
    ASSERT_EQ(restored.totalSize(), original.totalSize(), "failed loads keep the current tree");
}

static void testCustomFixtureTypes() {
    FixtureFactory factory;
    ASSERT_TRUE(!factory.hasType("strip"), "empty factory");
    factory.registerType("bar", [] { return std::make_unique<StripFixture>("Bar"); });
    ASSERT_TRUE(factory.hasType("bar"), "registered type");

    auto created = factory.create("bar");
    ASSERT_TRUE(created && (*created)->label() == "Bar", "factory constructs");
    auto unknown = factory.create("strip");
    ASSERT_TRUE(!unknown && unknown.error() == errc::unknown_fixture_type, "unregistered type");

    const auto& builtin = FixtureFactory::builtin();
    for (const char* key : {"point", "strip", "arc", "grid", "group"}) {
        ASSERT_TRUE(builtin.hasType(key), key);
    }
}

static void testLoadRegeneratesEachFixtureOnce() {
    FixtureFactory factory = FixtureFactory::builtin();
    factory.registerType("counting", [] { return std::make_unique<CountingStrip>(); });

    const json document = {
        {"version", 1},
        {"fixtures", json::array({
            {{"type", "group"}, {"label", "Bay"}, {"parameters", {{"x", 5.0}, {"yaw", 15.0}}},
             {"children", json::array({
                 {{"type", "counting"}, {"label", "Upper"},
                  {"parameters", {{"numPoints", 12}, {"spacing", 2.0}, {"x", 1.0}, {"protocol", "ddp"}}}},
                 {{"type", "counting"}, {"label", "Lower"},
                  {"parameters", {{"numPoints", 3}, {"brightness", 0.5}, {"universe", 4}}}}
             })}},
            {{"type", "counting"}, {"label", "Edge"},
             {"parameters", {{"numPoints", 7}, {"pitch", 10.0}, {"kinetPort", 2}, {"protocol", "kinet"}}}}
        })}
    };

    Structure structure(factory);
    g_regenerates.clear();
    ASSERT_TRUE(structure.load(document).has_value(), "counting document loads");
    ASSERT_EQ(structure.totalSize(), static_cast<std::size_t>(22), "all points allocated");
    for (const char* label : {"Upper", "Lower", "Edge"}) {
        ASSERT_EQ(g_regenerates[label], 1, label);
    }
    ASSERT_EQ(g_regenerates.size(), static_cast<std::size_t>(3), "no other fixture counted");

    g_regenerates.clear();
    ASSERT_TRUE(structure.load(document).has_value(), "reload");
    for (const char* label : {"Upper", "Lower", "Edge"}) {
        ASSERT_EQ(g_regenerates[label], 1, "reload regenerates once as well");
    }
}

int main() {
    testRoundTrip();
    testLoadReplacesTree();
    testMalformedDocuments();
    testFiles();
    testCustomFixtureTypes();
    testLoadRegeneratesEachFixtureOnce();

    if (g_failures) {
        lumen::logError("Tests failed: ", g_failures, "\n");
        return 1;
    }
    lumen::logInfo("All persistence tests passed.\n");
    return 0;
}
