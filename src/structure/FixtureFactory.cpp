#include "lumen/structure/FixtureFactory.hpp"

#include <utility>

#include "lumen/structure/ArcFixture.hpp"
#include "lumen/structure/GridFixture.hpp"
#include "lumen/structure/GroupFixture.hpp"
#include "lumen/structure/PointFixture.hpp"
#include "lumen/structure/StripFixture.hpp"

namespace lumen::structure {

namespace {

FixtureFactory makeBuiltin() {
    FixtureFactory factory;
    factory.registerType("point", [] { return std::make_unique<PointFixture>(); });
    factory.registerType("strip", [] { return std::make_unique<StripFixture>(); });
    factory.registerType("arc", [] { return std::make_unique<ArcFixture>(); });
    factory.registerType("grid", [] { return std::make_unique<GridFixture>(); });
    factory.registerType("group", [] { return std::make_unique<GroupFixture>(); });
    return factory;
}

} // namespace

const FixtureFactory& FixtureFactory::builtin() {
    static const FixtureFactory factory = makeBuiltin();
    return factory;
}

void FixtureFactory::registerType(std::string key, Constructor constructor) {
    constructors[std::move(key)] = std::move(constructor);
}

bool FixtureFactory::hasType(std::string_view key) const {
    return constructors.find(key) != constructors.end();
}

std::vector<std::string> FixtureFactory::typeKeys() const {
    std::vector<std::string> keys;
    keys.reserve(constructors.size());
    for (const auto& entry : constructors) {
        keys.push_back(entry.first);
    }
    return keys;
}

expected<std::unique_ptr<FixtureNode>> FixtureFactory::create(std::string_view key) const {
    auto it = constructors.find(key);
    if (it == constructors.end()) {
        return unexpected(errc::unknown_fixture_type);
    }
    auto fixture = it->second();
    if (!fixture) {
        return unexpected(errc::unknown_fixture_type);
    }
    return fixture;
}

} // namespace lumen::structure
